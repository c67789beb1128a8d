#include "pdf/PopplerPageRasterizer.h"

#include <QDebug>

PopplerPageRasterizer::PopplerPageRasterizer(const QString& pdfPath)
    : m_path(pdfPath)
{
    m_document = Poppler::Document::load(pdfPath);
    if (!m_document) {
        qWarning() << "PopplerPageRasterizer: Failed to open" << pdfPath;
        return;
    }
    if (m_document->isLocked()) {
        qWarning() << "PopplerPageRasterizer: Document is password protected" << pdfPath;
        return;
    }

    m_document->setRenderHint(Poppler::Document::Antialiasing, true);
    m_document->setRenderHint(Poppler::Document::TextAntialiasing, true);
    m_document->setRenderHint(Poppler::Document::TextHinting, true);
    qDebug() << "PopplerPageRasterizer: Loaded" << pdfPath << "pages:" << m_document->numPages();
}

PopplerPageRasterizer::~PopplerPageRasterizer() = default;

bool PopplerPageRasterizer::isValid() const
{
    return m_document != nullptr && !m_document->isLocked();
}

bool PopplerPageRasterizer::isLocked() const
{
    return m_document != nullptr && m_document->isLocked();
}

int PopplerPageRasterizer::pageCount() const
{
    return isValid() ? m_document->numPages() : 0;
}

QSizeF PopplerPageRasterizer::pageSize(int page) const
{
    auto popplerPage = loadPage(page);
    if (!popplerPage) {
        return QSizeF();
    }
    return popplerPage->pageSizeF();
}

QImage PopplerPageRasterizer::renderPage(int page, qreal magnification) const
{
    if (magnification <= 0.0) {
        qWarning() << "PopplerPageRasterizer: Invalid magnification" << magnification;
        return QImage();
    }

    auto popplerPage = loadPage(page);
    if (!popplerPage) {
        return QImage();
    }

    const qreal dpi = kPointsPerInch * magnification;
    QImage image = popplerPage->renderToImage(dpi, dpi);
    if (image.isNull()) {
        qWarning() << "PopplerPageRasterizer: Render failed for page" << page << "at dpi" << dpi;
    }
    return image;
}

std::unique_ptr<Poppler::Page> PopplerPageRasterizer::loadPage(int page) const
{
    if (!isValid() || !isPageValid(page)) {
        return nullptr;
    }
    return m_document->page(page);
}

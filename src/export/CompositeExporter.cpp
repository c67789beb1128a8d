#include "export/CompositeExporter.h"
#include "annotations/AnnotationStore.h"
#include "pdf/PageRasterizer.h"
#include "Constants.h"

#include <QDebug>
#include <QFileInfo>
#include <QImageWriter>
#include <QPageLayout>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QSaveFile>
#include <QSet>
#include <QStringList>

namespace {

QByteArray normalizeFormat(QByteArray format)
{
    format = format.trimmed().toLower();
    while (!format.isEmpty() && format.startsWith('.')) {
        format.remove(0, 1);
    }
    if (format == "jpg") {
        return "jpeg";
    }
    if (format == "tif") {
        return "tiff";
    }
    return format;
}

bool isSupportedFormat(const QByteArray& format)
{
    static const QSet<QByteArray> supported = []() {
        QSet<QByteArray> values;
        const QList<QByteArray> formats = QImageWriter::supportedImageFormats();
        for (const QByteArray& f : formats) {
            values.insert(normalizeFormat(f));
        }
        return values;
    }();

    return supported.contains(format);
}

// QPageSize is portrait by definition; wide pages go through the orientation
void applyPageSize(QPdfWriter& writer, const QSizeF& points)
{
    const bool landscape = points.width() > points.height();
    const QSizeF portrait = landscape ? points.transposed() : points;
    writer.setPageSize(QPageSize(portrait, QPageSize::Point, QString(), QPageSize::ExactMatch));
    writer.setPageOrientation(landscape ? QPageLayout::Landscape : QPageLayout::Portrait);
}

QString saveFileError(const QSaveFile& file, const QString& fallback)
{
    const QString message = file.errorString().trimmed();
    return message.isEmpty() ? fallback : message;
}

} // namespace

CompositeExporter::CompositeExporter(const PageRasterizer& rasterizer, const AnnotationStore& store)
    : m_rasterizer(rasterizer)
    , m_store(store)
    , m_magnification(NodeMark::Zoom::kDefaultMagnification)
{
}

void CompositeExporter::setMagnification(qreal magnification)
{
    if (magnification <= 0.0) {
        qWarning() << "CompositeExporter: Ignoring invalid magnification" << magnification;
        return;
    }
    m_magnification = magnification;
}

QImage CompositeExporter::renderPage(int page) const
{
    const QImage raster = m_rasterizer.renderPage(page, m_magnification);
    if (raster.isNull()) {
        return QImage();
    }

    const QImage overlay = m_renderer.renderOverlay(raster.size(), m_magnification,
                                                    m_store.listForPage(page));
    return OverlayRenderer::composite(raster, overlay);
}

bool CompositeExporter::exportPageImage(int page, const QString& filePath,
                                        const QByteArray& explicitFormat, Error* error) const
{
    const QImage image = renderPage(page);
    if (image.isNull()) {
        setError(error, QStringLiteral("render"),
                 QStringLiteral("Failed to render page %1").arg(page + 1));
        return false;
    }
    return saveImageAtomically(image, filePath, explicitFormat, error);
}

bool CompositeExporter::exportPdf(const QString& filePath, Error* error) const
{
    const int pageCount = m_rasterizer.pageCount();
    if (pageCount <= 0) {
        setError(error, QStringLiteral("render"), QStringLiteral("Document has no pages"));
        return false;
    }

    QSaveFile saveFile(filePath);
    saveFile.setDirectWriteFallback(true);
    if (!saveFile.open(QIODevice::WriteOnly)) {
        setError(error, QStringLiteral("open"),
                 saveFileError(saveFile, QStringLiteral("Failed to open output file")));
        return false;
    }

    QPdfWriter writer(&saveFile);
    writer.setCreator(QStringLiteral("NodeMark"));
    writer.setResolution(qRound(PageRasterizer::kPointsPerInch * m_magnification));
    writer.setPageMargins(QMarginsF(0, 0, 0, 0));
    applyPageSize(writer, m_rasterizer.pageSize(0));

    QPainter painter;
    for (int page = 0; page < pageCount; ++page) {
        const QImage image = renderPage(page);
        if (image.isNull()) {
            if (painter.isActive()) {
                painter.end();
            }
            saveFile.cancelWriting();
            setError(error, QStringLiteral("render"),
                     QStringLiteral("Failed to render page %1").arg(page + 1));
            return false;
        }

        if (page == 0) {
            if (!painter.begin(&writer)) {
                saveFile.cancelWriting();
                setError(error, QStringLiteral("write"), QStringLiteral("Failed to start PDF output"));
                return false;
            }
        } else {
            applyPageSize(writer, m_rasterizer.pageSize(page));
            writer.newPage();
        }

        const QRect target(0, 0, painter.device()->width(), painter.device()->height());
        painter.drawImage(target, image);
    }
    painter.end();

    if (!saveFile.commit()) {
        setError(error, QStringLiteral("commit"),
                 saveFileError(saveFile, QStringLiteral("Failed to commit output file")));
        return false;
    }

    qDebug() << "CompositeExporter: Wrote" << pageCount << "pages to" << filePath;
    return true;
}

bool CompositeExporter::saveImageAtomically(const QImage& image, const QString& filePath,
                                            const QByteArray& explicitFormat, Error* error)
{
    if (image.isNull()) {
        setError(error, QStringLiteral("write"), QStringLiteral("Image is null"));
        return false;
    }

    const QByteArray format = resolveFormat(filePath, explicitFormat, error);
    if (format.isEmpty()) {
        return false;
    }

    QSaveFile saveFile(filePath);
    // Overwrite in place where the directory refuses a temp sibling
    saveFile.setDirectWriteFallback(true);
    if (!saveFile.open(QIODevice::WriteOnly)) {
        setError(error, QStringLiteral("open"),
                 saveFileError(saveFile, QStringLiteral("Failed to open output file")));
        return false;
    }

    QImageWriter writer(&saveFile, format);
    if (!writer.write(image)) {
        saveFile.cancelWriting();
        const QString writeError = writer.errorString().trimmed();
        setError(error, QStringLiteral("write"),
                 writeError.isEmpty() ? QStringLiteral("Failed to encode image") : writeError);
        return false;
    }

    if (!saveFile.commit()) {
        setError(error, QStringLiteral("commit"),
                 saveFileError(saveFile, QStringLiteral("Failed to commit output file")));
        return false;
    }

    return true;
}

QByteArray CompositeExporter::resolveFormat(const QString& filePath, const QByteArray& explicitFormat,
                                            Error* error)
{
    QByteArray format = normalizeFormat(explicitFormat);
    if (format.isEmpty()) {
        format = normalizeFormat(QFileInfo(filePath).suffix().toLatin1());
    }
    if (format.isEmpty()) {
        format = QByteArrayLiteral("png");
    }

    if (!isSupportedFormat(format)) {
        QStringList list;
        const QList<QByteArray> formats = QImageWriter::supportedImageFormats();
        for (const QByteArray& f : formats) {
            list.push_back(QString::fromLatin1(f));
        }
        list.sort();
        setError(error, QStringLiteral("format"),
                 QStringLiteral("Unsupported image format '%1' (supported: %2)")
                     .arg(QString::fromLatin1(format), list.join(", ")));
        return QByteArray();
    }

    return format;
}

void CompositeExporter::setError(Error* error, const QString& stage, const QString& message)
{
    if (!error) {
        qWarning() << "CompositeExporter:" << stage << "failed:" << message;
        return;
    }
    error->stage = stage;
    error->message = message;
}

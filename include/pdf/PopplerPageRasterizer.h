#ifndef POPPLERPAGERASTERIZER_H
#define POPPLERPAGERASTERIZER_H

#include "pdf/PageRasterizer.h"

#include <poppler/qt6/poppler-qt6.h>
#include <memory>

/**
 * @brief PageRasterizer backed by poppler-qt6.
 *
 * Renders at 72 dpi times the requested magnification so one PDF point maps
 * to exactly `magnification` pixels.
 */
class PopplerPageRasterizer : public PageRasterizer
{
public:
    explicit PopplerPageRasterizer(const QString& pdfPath);
    ~PopplerPageRasterizer() override;

    bool isValid() const override;
    bool isLocked() const;
    int pageCount() const override;
    QString filePath() const override { return m_path; }
    QSizeF pageSize(int page) const override;
    QImage renderPage(int page, qreal magnification) const override;

private:
    std::unique_ptr<Poppler::Page> loadPage(int page) const;

    QString m_path;
    std::unique_ptr<Poppler::Document> m_document;
};

#endif // POPPLERPAGERASTERIZER_H

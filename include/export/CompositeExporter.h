#ifndef COMPOSITEEXPORTER_H
#define COMPOSITEEXPORTER_H

#include <QByteArray>
#include <QImage>
#include <QString>

#include "render/OverlayRenderer.h"

class AnnotationStore;
class PageRasterizer;

/**
 * @brief Writes pages with their nodes burned in.
 *
 * Nodes are drawn in their idle style (no selection or editing decoration).
 * Image export goes through QImageWriter; PDF export writes one raster image
 * per page. Both commit atomically through QSaveFile.
 */
class CompositeExporter
{
public:
    struct Error {
        QString message;
        QString stage; // render / open / format / write / commit
    };

    CompositeExporter(const PageRasterizer& rasterizer, const AnnotationStore& store);

    void setMagnification(qreal magnification);
    qreal magnification() const { return m_magnification; }

    OverlayRenderer& renderer() { return m_renderer; }

    // Page raster with the page's nodes composited; null on a bad page
    QImage renderPage(int page) const;

    // Format from explicitFormat, else the file suffix, else PNG
    bool exportPageImage(int page, const QString& filePath,
                         const QByteArray& explicitFormat = QByteArray(),
                         Error* error = nullptr) const;

    bool exportPdf(const QString& filePath, Error* error = nullptr) const;

    static bool saveImageAtomically(const QImage& image, const QString& filePath,
                                    const QByteArray& explicitFormat = QByteArray(),
                                    Error* error = nullptr);

private:
    static QByteArray resolveFormat(const QString& filePath, const QByteArray& explicitFormat,
                                    Error* error);
    static void setError(Error* error, const QString& stage, const QString& message);

    const PageRasterizer& m_rasterizer;
    const AnnotationStore& m_store;
    OverlayRenderer m_renderer;
    qreal m_magnification;
};

#endif // COMPOSITEEXPORTER_H

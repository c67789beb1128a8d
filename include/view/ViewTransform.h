#ifndef VIEWTRANSFORM_H
#define VIEWTRANSFORM_H

#include <QPointF>
#include <QSize>
#include <QSizeF>

/**
 * @brief Document <-> viewport mapping for a single page.
 *
 * screen = document * effectiveScale + pan, where
 * effectiveScale = renderScale * zoomLevel * fitScale.
 *
 * renderScale is the magnification the rasterizer used for the page image.
 * fitScale is 1.0 except in fit-to-window mode, where it resizes the page
 * raster to the viewport. Leaving fit mode folds fitScale into the zoom level
 * so the visible scale is continuous.
 */
class ViewTransform
{
public:
    ViewTransform();

    // Mapping
    QPointF toDocument(const QPointF& screenPoint) const;
    QPointF toScreen(const QPointF& documentPoint) const;
    qreal effectiveScale() const;

    // Pixels per document unit of the page raster (and the overlay layer)
    qreal rasterScale() const { return m_renderScale * m_zoomLevel; }

    // Size of the composite on screen, before pan
    QSizeF displaySize() const;

    // Zoom / pan
    void zoomAt(const QPointF& screenAnchor, qreal factor);
    void zoomIn(const QPointF& screenAnchor);
    void zoomOut(const QPointF& screenAnchor);
    void resetToFit(const QSize& viewportSize, const QSizeF& pageSize);
    void resetToFit();
    void panBy(qreal dx, qreal dy);

    // Layout inputs
    void setViewportSize(const QSize& size);
    QSize viewportSize() const { return m_viewportSize; }
    bool hasValidViewport() const;

    void setRenderScale(qreal scale);
    qreal renderScale() const { return m_renderScale; }

    // Page change: pan -> 0, page size -> unknown. Zoom persists.
    void setCurrentPage(int page);
    int currentPage() const { return m_currentPage; }

    void setPageSize(const QSizeF& pageSize);
    QSizeF pageSize() const { return m_pageSize; }
    bool hasPageSize() const { return m_pageSize.width() > 0 && m_pageSize.height() > 0; }

    // State queries
    qreal zoomLevel() const { return m_zoomLevel; }
    QPointF panOffset() const { return m_pan; }
    bool isFitToWindow() const { return m_fitToWindow; }
    qreal fitScale() const { return m_fitScale; }

private:
    void updateFitScale();
    static qreal clampZoom(qreal zoom);

    qreal m_zoomLevel = 1.0;
    QPointF m_pan;
    bool m_fitToWindow = true;
    qreal m_renderScale = 1.0;
    qreal m_fitScale = 1.0;
    int m_currentPage = 0;
    QSizeF m_pageSize;
    QSize m_viewportSize;
};

#endif // VIEWTRANSFORM_H

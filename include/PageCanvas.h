#ifndef PAGECANVAS_H
#define PAGECANVAS_H

#include <QImage>
#include <QPoint>
#include <QPointF>
#include <QWidget>
#include <memory>

#include "edit/EditSession.h"
#include "render/OverlayRenderer.h"
#include "view/ViewTransform.h"

class AnnotationStore;
class PageRasterizer;

/**
 * @brief Single-page view that routes pointer and keyboard input to an
 * EditSession and displays the page raster with its node overlay.
 *
 * The page raster is rendered at the view's raster scale and drawn at the
 * pan offset, stretched by the fit scale. Mid-drag repaints redraw only the
 * overlay layer; every kFullRepaintInterval-th move and the release rebuild
 * the composite.
 */
class PageCanvas : public QWidget
{
    Q_OBJECT

public:
    explicit PageCanvas(AnnotationStore* store, QWidget* parent = nullptr);
    ~PageCanvas() override;

    // Takes ownership; resets to page 0 in fit mode
    void setRasterizer(std::unique_ptr<PageRasterizer> rasterizer);
    const PageRasterizer* rasterizer() const { return m_rasterizer.get(); }
    bool hasDocument() const;

    // Pages
    int pageCount() const;
    int currentPage() const { return m_view.currentPage(); }
    bool setCurrentPage(int page);
    bool nextPage();
    bool previousPage();

    // Zoom
    void setBaseMagnification(qreal magnification);
    void setKeyboardZoomStep(qreal step);
    void setWheelZoomStep(qreal step);
    // Keyboard zoom anchors under the pointer when it is over the canvas
    void zoomIn();
    void zoomOut();
    void resetZoom();

    void startLineCreation();

    EditSession* session() const { return m_session; }
    const ViewTransform& view() const { return m_view; }
    OverlayRenderer& renderer() { return m_renderer; }

    // Last full composite (page raster plus overlay, raster pixels)
    QImage compositeImage() const { return m_composite; }
    int fullRepaintCount() const { return m_fullRepaintCount; }
    int overlayRepaintCount() const { return m_overlayRepaintCount; }

signals:
    void currentPageChanged(int page);
    void zoomChanged(qreal zoomLevel);
    void annotationContextMenuRequested(int id, const QPoint& globalPos);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private slots:
    void onRepaintRequested(EditSession::RepaintScope scope);
    void onAnnotationChanged(int id);
    void onContextMenuRequested(int id, const QPointF& screenPoint);

private:
    void loadPageGeometry();
    bool ensurePageRaster();
    void recompose();
    void refreshOverlay();
    void zoomAtAnchor(const QPointF& anchor, qreal factor);
    QPointF viewportCenter() const;
    QPointF keyboardZoomAnchor() const;

    AnnotationStore* m_store;
    std::unique_ptr<PageRasterizer> m_rasterizer;
    ViewTransform m_view;
    EditSession* m_session;
    OverlayRenderer m_renderer;

    qreal m_keyboardZoomStep;
    qreal m_wheelZoomStep;

    // Cached page raster, keyed by page and raster scale
    QImage m_pageRaster;
    int m_rasterPage = -1;
    qreal m_rasterScale = 0.0;

    QImage m_overlay;
    QImage m_composite;
    bool m_overlayOnly = false;

    int m_dragMoveCount = 0;
    int m_fullRepaintCount = 0;
    int m_overlayRepaintCount = 0;

    // Pointer tracking
    QPointF m_lastDragPos;
    bool m_isPanning = false;
    QPointF m_lastPanPos;
};

#endif // PAGECANVAS_H

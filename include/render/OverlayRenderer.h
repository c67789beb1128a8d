#ifndef OVERLAYRENDERER_H
#define OVERLAYRENDERER_H

#include <QFont>
#include <QImage>
#include <QLineF>
#include <QPen>
#include <QPointF>
#include <QRectF>
#include <QSize>
#include <QVector>

#include "annotations/LineStyle.h"

class EditSession;
class NodeAnnotation;
class QPainter;

/**
 * @brief Draws nodes onto a transparent layer matching the page raster.
 *
 * All geometry is computed in raster pixels: document coordinates times the
 * raster scale (render magnification x zoom). The stroke pattern and vertex
 * decoration follow the edit session; the polyline itself never changes
 * between states.
 */
class OverlayRenderer
{
public:
    struct LabelPlacement {
        QPointF center;
        bool rotated = false;  // Near-vertical segment: text turned 90 degrees
        bool valid = false;
    };

    OverlayRenderer();

    void setLabelFont(const QFont& font) { m_labelFont = font; }
    QFont labelFont() const { return m_labelFont; }

    // Transparent layer of rasterSize; null image for a degenerate size.
    // A null session draws every node in its idle style.
    QImage renderOverlay(const QSize& rasterSize, qreal scale,
                         const QVector<NodeAnnotation*>& annotations,
                         const EditSession* session = nullptr) const;

    void drawAnnotation(QPainter& painter, const NodeAnnotation& annotation, qreal scale,
                        LineStyle style, bool highlighted) const;

    // Page raster with the overlay composited on top (SourceOver)
    static QImage composite(const QImage& pageRaster, const QImage& overlay);

    // Geometry helpers (raster pixels)
    static qreal strokeWidth(qreal documentWidth, qreal scale, bool highlighted);
    static QVector<qreal> dashPattern(LineStyle style, qreal penWidth);
    static QPen strokePen(const NodeAnnotation& annotation, qreal scale,
                         LineStyle style, bool highlighted);
    static QVector<QPointF> toRasterPoints(const QVector<QPointF>& documentPoints, qreal scale);
    static QVector<QLineF> arrowheadStrokes(const QPointF& from, const QPointF& to, qreal penWidth);
    static LabelPlacement labelPlacement(const QVector<QPointF>& rasterPoints);
    static QVector<QPointF> indicatorCenters(const QVector<QPointF>& rasterPoints, int count, qreal radius);
    static qreal indicatorRadius(qreal scale);
    static qreal vertexMarkerSize(qreal scale);

private:
    void drawStroke(QPainter& painter, const QVector<QPointF>& points, const QPen& pen) const;
    void drawVertexMarkers(QPainter& painter, const QVector<QPointF>& points,
                           const QColor& color, qreal scale) const;
    void drawArrowhead(QPainter& painter, const QVector<QPointF>& points,
                       const QColor& color, qreal penWidth) const;
    void drawLabel(QPainter& painter, const NodeAnnotation& annotation,
                   const QVector<QPointF>& points, qreal scale) const;
    void drawIndicators(QPainter& painter, const NodeAnnotation& annotation,
                        const QVector<QPointF>& points, qreal scale) const;

    QFont m_labelFont;
};

#endif // OVERLAYRENDERER_H

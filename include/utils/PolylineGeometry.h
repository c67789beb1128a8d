#ifndef POLYLINEGEOMETRY_H
#define POLYLINEGEOMETRY_H

#include <QLineF>
#include <QPointF>
#include <QVector>

/**
 * PolylineGeometry - Stateless polyline math in document space
 *
 * Distances, arc-length walking and segment queries shared by hit testing
 * and overlay placement. No function here knows about zoom or pixels.
 */
class PolylineGeometry {
public:
    PolylineGeometry() = delete;

    struct ArcPoint {
        QPointF point;
        QPointF tangent;  // Unit vector, or (0,0) on a degenerate path
    };

    static qreal distance(const QPointF& a, const QPointF& b);

    // Projection-clamped distance; falls back to |p - a| when a == b
    static qreal distancePointToSegment(const QPointF& p, const QPointF& a, const QPointF& b);

    static qreal polylineArcLength(const QVector<QPointF>& points);

    // Point and unit tangent at arc-length offset t (clamped to the path).
    // A zero-length located segment borrows the first segment's direction.
    static ArcPoint pointAtArcLength(const QVector<QPointF>& points, qreal t);

    // 90 degree rotation: (x, y) -> (-y, x)
    static QPointF perpendicular(const QPointF& unitTangent);

    // First segment of maximum length in path order; null line for < 2 points
    static QLineF longestSegment(const QVector<QPointF>& points);

    // Unit vector from a to b, (0,0) if they coincide
    static QPointF unitDirection(const QPointF& a, const QPointF& b);

    // atan2 angle of the line in degrees, y axis pointing down
    static qreal angleDegrees(const QLineF& line);
};

#endif // POLYLINEGEOMETRY_H

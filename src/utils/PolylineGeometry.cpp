#include "utils/PolylineGeometry.h"

#include <QtMath>
#include <algorithm>

qreal PolylineGeometry::distance(const QPointF& a, const QPointF& b)
{
    const QPointF d = b - a;
    return qSqrt(d.x() * d.x() + d.y() * d.y());
}

qreal PolylineGeometry::distancePointToSegment(const QPointF& p, const QPointF& a, const QPointF& b)
{
    const qreal dx = b.x() - a.x();
    const qreal dy = b.y() - a.y();
    const qreal lengthSquared = dx * dx + dy * dy;

    if (qFuzzyIsNull(lengthSquared)) {
        return distance(p, a);
    }

    qreal t = ((p.x() - a.x()) * dx + (p.y() - a.y()) * dy) / lengthSquared;
    t = std::clamp(t, 0.0, 1.0);

    const QPointF closest(a.x() + t * dx, a.y() + t * dy);
    return distance(p, closest);
}

qreal PolylineGeometry::polylineArcLength(const QVector<QPointF>& points)
{
    qreal total = 0.0;
    for (int i = 1; i < points.size(); ++i) {
        total += distance(points[i - 1], points[i]);
    }
    return total;
}

PolylineGeometry::ArcPoint PolylineGeometry::pointAtArcLength(const QVector<QPointF>& points, qreal t)
{
    ArcPoint result;
    if (points.isEmpty()) {
        return result;
    }

    result.point = points.first();
    const qreal total = polylineArcLength(points);
    if (points.size() < 2 || qFuzzyIsNull(total)) {
        return result;
    }

    const qreal target = std::clamp(t, 0.0, total);
    qreal walked = 0.0;

    for (int i = 0; i < points.size() - 1; ++i) {
        const QPointF& p1 = points[i];
        const QPointF& p2 = points[i + 1];
        const qreal segmentLength = distance(p1, p2);

        if (walked + segmentLength >= target) {
            if (segmentLength > 0.0) {
                const qreal u = (target - walked) / segmentLength;
                result.point = p1 + (p2 - p1) * u;
            } else {
                result.point = p1;
            }
            result.tangent = unitDirection(p1, p2);
            break;
        }
        walked += segmentLength;
    }

    // Degenerate located segment: use the first segment's direction
    if (result.tangent.isNull()) {
        result.tangent = unitDirection(points[0], points[1]);
    }

    return result;
}

QPointF PolylineGeometry::perpendicular(const QPointF& unitTangent)
{
    return QPointF(-unitTangent.y(), unitTangent.x());
}

QLineF PolylineGeometry::longestSegment(const QVector<QPointF>& points)
{
    if (points.size() < 2) {
        return QLineF();
    }

    int longestIndex = 0;
    qreal maxLength = -1.0;
    for (int i = 0; i < points.size() - 1; ++i) {
        const qreal length = distance(points[i], points[i + 1]);
        if (length > maxLength) {
            maxLength = length;
            longestIndex = i;
        }
    }

    return QLineF(points[longestIndex], points[longestIndex + 1]);
}

QPointF PolylineGeometry::unitDirection(const QPointF& a, const QPointF& b)
{
    const qreal length = distance(a, b);
    if (qFuzzyIsNull(length)) {
        return QPointF(0.0, 0.0);
    }
    return (b - a) / length;
}

qreal PolylineGeometry::angleDegrees(const QLineF& line)
{
    return qRadiansToDegrees(qAtan2(line.dy(), line.dx()));
}

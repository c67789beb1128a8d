#include "edit/HitTester.h"
#include "annotations/NodeAnnotation.h"
#include "utils/PolylineGeometry.h"
#include "view/ViewTransform.h"

#include <limits>

HitTester::HitTester(const ViewTransform& view)
    : m_view(view)
{
}

qreal HitTester::toDocumentTolerance(qreal tolerancePx) const
{
    return tolerancePx / m_view.effectiveScale();
}

int HitTester::findAnnotationNear(const QPointF& screenPoint, qreal tolerancePx,
                                  const QVector<NodeAnnotation*>& pageAnnotations) const
{
    const QPointF target = m_view.toDocument(screenPoint);
    const qreal tolerance = toDocumentTolerance(tolerancePx);

    const NodeAnnotation* closest = nullptr;
    qreal closestDistance = std::numeric_limits<qreal>::infinity();

    for (const NodeAnnotation* annotation : pageAnnotations) {
        if (!annotation) {
            continue;
        }
        const QVector<QPointF>& points = annotation->points();

        for (int i = 0; i + 1 < points.size(); ++i) {
            const qreal d = PolylineGeometry::distancePointToSegment(target, points[i], points[i + 1]);
            if (d < closestDistance) {
                closestDistance = d;
                closest = annotation;
            }
        }

        // Vertices are checked on their own so single-point nodes are hittable
        for (const QPointF& point : points) {
            const qreal d = PolylineGeometry::distance(target, point);
            if (d < closestDistance) {
                closestDistance = d;
                closest = annotation;
            }
        }
    }

    if (closest && closestDistance <= tolerance) {
        return closest->id();
    }
    return -1;
}

int HitTester::findPointNear(const QPointF& documentPoint, const NodeAnnotation& annotation,
                             qreal tolerancePx) const
{
    const qreal tolerance = toDocumentTolerance(tolerancePx);
    const QVector<QPointF>& points = annotation.points();

    int closestIndex = -1;
    qreal closestDistance = std::numeric_limits<qreal>::infinity();

    for (int i = 0; i < points.size(); ++i) {
        const qreal d = PolylineGeometry::distance(documentPoint, points[i]);
        if (d < closestDistance) {
            closestDistance = d;
            closestIndex = i;
        }
    }

    if (closestIndex >= 0 && closestDistance <= tolerance) {
        return closestIndex;
    }
    return -1;
}

int HitTester::findInsertionIndex(const QPointF& documentPoint, const NodeAnnotation& annotation,
                                  qreal tolerancePx) const
{
    const QVector<QPointF>& points = annotation.points();
    if (points.size() < 2) {
        return -1;
    }

    const qreal tolerance = toDocumentTolerance(tolerancePx);
    qreal closestDistance = std::numeric_limits<qreal>::infinity();
    int insertIndex = -1;

    for (int i = 0; i + 1 < points.size(); ++i) {
        const QPointF& p1 = points[i];
        const QPointF& p2 = points[i + 1];
        const qreal d = PolylineGeometry::distancePointToSegment(documentPoint, p1, p2);

        if (d < closestDistance) {
            closestDistance = d;
            // Splice on the side of whichever endpoint is nearer the click
            const qreal toFirst = PolylineGeometry::distance(documentPoint, p1);
            const qreal toSecond = PolylineGeometry::distance(documentPoint, p2);
            insertIndex = (toSecond < toFirst) ? i + 1 : i;
        }
    }

    if (insertIndex >= 0 && closestDistance <= tolerance) {
        return insertIndex;
    }
    return -1;
}

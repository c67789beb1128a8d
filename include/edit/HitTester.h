#ifndef HITTESTER_H
#define HITTESTER_H

#include <QPointF>
#include <QVector>

class NodeAnnotation;
class ViewTransform;

/**
 * @brief Proximity queries against nodes on the current page.
 *
 * Tolerances are given in screen pixels and converted to document units
 * with the transform's current effective scale, so they feel the same at
 * every zoom level. All queries return -1 on a miss.
 */
class HitTester
{
public:
    explicit HitTester(const ViewTransform& view);

    // Closest node across all candidates (segments and raw vertices).
    // Returns its id if the global minimum is within tolerance.
    int findAnnotationNear(const QPointF& screenPoint, qreal tolerancePx,
                           const QVector<NodeAnnotation*>& pageAnnotations) const;

    // Nearest vertex index of a single node
    int findPointNear(const QPointF& documentPoint, const NodeAnnotation& annotation,
                      qreal tolerancePx) const;

    // Index before which a point clicked near a segment should be spliced
    int findInsertionIndex(const QPointF& documentPoint, const NodeAnnotation& annotation,
                           qreal tolerancePx) const;

    qreal toDocumentTolerance(qreal tolerancePx) const;

private:
    const ViewTransform& m_view;
};

#endif // HITTESTER_H

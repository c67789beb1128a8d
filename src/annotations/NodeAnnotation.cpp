#include "annotations/NodeAnnotation.h"
#include "Constants.h"

#include <QDebug>
#include <algorithm>

NodeAnnotation::NodeAnnotation(int page, const NodeStyle& style)
    : m_page(page)
{
    setStyle(style);
}

NodeAnnotation::NodeAnnotation(const QString& name, const QVector<QPointF>& points, int page,
                               const NodeStyle& style)
    : m_name(name)
    , m_points(points)
    , m_page(page)
{
    setStyle(style);
}

void NodeAnnotation::setStyle(const NodeStyle& style)
{
    m_style = style;
    setWidth(style.width);
    setOpacity(style.opacity);
    setFontSize(style.fontSize);
}

void NodeAnnotation::setWidth(qreal width)
{
    m_style.width = std::max(0.0, width);
}

void NodeAnnotation::setOpacity(qreal opacity)
{
    m_style.opacity = std::clamp(opacity, NodeMark::Bounds::kMinOpacity, NodeMark::Bounds::kMaxOpacity);
}

void NodeAnnotation::setFontSize(qreal size)
{
    m_style.fontSize = std::max(0.0, size);
}

// ============================================================================
// Point Management
// ============================================================================

void NodeAnnotation::addPoint(const QPointF& point)
{
    m_points.append(point);
}

bool NodeAnnotation::setPoint(int index, const QPointF& point)
{
    if (index < 0 || index >= m_points.size()) {
        return false;
    }
    m_points[index] = point;
    return true;
}

bool NodeAnnotation::insertPoint(int index, const QPointF& point)
{
    if (index < 0 || index > m_points.size()) {
        return false;
    }
    m_points.insert(index, point);
    return true;
}

bool NodeAnnotation::removePoint(int index)
{
    if (index < 0 || index >= m_points.size()) {
        return false;
    }
    if (m_points.size() <= kMinCompletePoints) {
        qDebug() << "NodeAnnotation: Refusing to remove point" << index
                 << "from" << m_name << "- a line needs at least 2 points";
        return false;
    }
    m_points.removeAt(index);
    return true;
}

// ============================================================================
// Notes
// ============================================================================

bool NodeAnnotation::updateNote(int index, const DeviationNote& note)
{
    if (index < 0 || index >= m_notes.size()) {
        return false;
    }
    m_notes[index] = note;
    return true;
}

bool NodeAnnotation::removeNote(int index)
{
    if (index < 0 || index >= m_notes.size()) {
        return false;
    }
    m_notes.removeAt(index);
    return true;
}

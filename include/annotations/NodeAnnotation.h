#ifndef NODEANNOTATION_H
#define NODEANNOTATION_H

#include "DeviationNote.h"

#include <QColor>
#include <QPointF>
#include <QString>
#include <QVector>

/**
 * @brief Visual style of a node polyline. Sizes are in document units.
 */
struct NodeStyle {
    QColor color = Qt::red;
    qreal width = 2.0;
    qreal opacity = 0.7;
    bool hasArrow = true;
    qreal fontSize = 12.0;
};

/**
 * @brief A named, styled polyline scoped to one page ("node").
 *
 * Points are document-space and ordered in stroke path order. A node with
 * fewer than two points is incomplete and only exists while it is being
 * created. The id is assigned by AnnotationStore.
 */
class NodeAnnotation
{
public:
    static constexpr int kInvalidId = -1;
    static constexpr int kMinCompletePoints = 2;

    explicit NodeAnnotation(int page = 0, const NodeStyle& style = NodeStyle());
    NodeAnnotation(const QString& name, const QVector<QPointF>& points, int page,
                   const NodeStyle& style = NodeStyle());

    int id() const { return m_id; }

    // Identity / placement
    QString name() const { return m_name; }
    void setName(const QString& name) { m_name = name; }
    int page() const { return m_page; }
    void setPage(int page) { m_page = page; }

    // Style
    const NodeStyle& style() const { return m_style; }
    void setStyle(const NodeStyle& style);
    QColor color() const { return m_style.color; }
    void setColor(const QColor& color) { m_style.color = color; }
    qreal width() const { return m_style.width; }
    void setWidth(qreal width);
    qreal opacity() const { return m_style.opacity; }
    void setOpacity(qreal opacity);
    bool hasArrow() const { return m_style.hasArrow; }
    void setHasArrow(bool hasArrow) { m_style.hasArrow = hasArrow; }
    qreal fontSize() const { return m_style.fontSize; }
    void setFontSize(qreal size);

    // Point management
    const QVector<QPointF>& points() const { return m_points; }
    int pointCount() const { return m_points.size(); }
    QPointF pointAt(int index) const { return m_points.value(index); }
    bool isComplete() const { return m_points.size() >= kMinCompletePoints; }
    void addPoint(const QPointF& point);
    bool setPoint(int index, const QPointF& point);
    bool insertPoint(int index, const QPointF& point);
    // Refused when the node would drop below two points
    bool removePoint(int index);
    void setPoints(const QVector<QPointF>& points) { m_points = points; }

    // Attached notes
    const QVector<DeviationNote>& notes() const { return m_notes; }
    int noteCount() const { return m_notes.size(); }
    void addNote(const DeviationNote& note) { m_notes.append(note); }
    bool updateNote(int index, const DeviationNote& note);
    bool removeNote(int index);
    void setNotes(const QVector<DeviationNote>& notes) { m_notes = notes; }

private:
    friend class AnnotationStore;

    int m_id = kInvalidId;
    QString m_name;
    NodeStyle m_style;
    QVector<QPointF> m_points;
    int m_page = 0;
    QVector<DeviationNote> m_notes;
};

#endif // NODEANNOTATION_H

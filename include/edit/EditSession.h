#ifndef EDITSESSION_H
#define EDITSESSION_H

#include <QObject>
#include <QPointF>

#include "annotations/LineStyle.h"
#include "annotations/NodeAnnotation.h"
#include "edit/HitTester.h"

class AnnotationStore;
class ViewTransform;

/**
 * @brief Interaction state machine for node creation and editing
 *
 * Responsible for:
 * - Line creation (click to add points, finish/escape to end)
 * - Selection by proximity
 * - Point editing: vertex drag, removal and insertion
 *
 * Pointer positions are viewport pixels. Node references are ids into the
 * AnnotationStore; removing a node from the store clears them.
 */
class EditSession : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,           // Nothing selected
        Creating,       // Clicks append points to a new node
        Selected,       // One node selected
        PointEditing,   // Vertices of the selected node are editable
        Dragging        // A vertex follows the pointer
    };
    Q_ENUM(State)

    enum class RepaintScope {
        OverlayOnly,    // Model moved mid-drag; page raster unchanged
        Full            // Recompose everything
    };
    Q_ENUM(RepaintScope)

    EditSession(AnnotationStore& store, const ViewTransform& view, QObject* parent = nullptr);

    // State queries
    State state() const { return m_state; }
    bool isIdle() const { return m_state == State::Idle; }
    bool isCreating() const { return m_state == State::Creating; }
    bool isPointEditing() const { return m_state == State::PointEditing || m_state == State::Dragging; }
    bool isDragging() const { return m_state == State::Dragging; }

    int selectedId() const { return m_selectedId; }
    int editingId() const { return m_editingId; }
    int creatingId() const { return m_creatingId; }
    int dragPointIndex() const { return m_dragIndex; }
    QPointF dragOriginalPoint() const { return m_dragOriginalPoint; }

    // Stroke pattern the overlay should use for a node
    LineStyle lineStyleFor(int id) const;
    bool isHighlighted(int id) const { return id != NodeAnnotation::kInvalidId && id == m_selectedId; }

    // Style for newly created nodes
    void setDefaultStyle(const NodeStyle& style) { m_defaultStyle = style; }
    NodeStyle defaultStyle() const { return m_defaultStyle; }

    // Creation
    void startCreate();
    // Returns true if the created node was kept (>= 2 points)
    bool finishCreate();

    // Pointer input
    void click(const QPointF& screenPoint);
    void doubleClick(const QPointF& screenPoint);
    bool drag(const QPointF& screenDelta);
    void release();
    void rightClick(const QPointF& screenPoint);

    // Keyboard / commands
    void escape();
    bool deleteSelected();

    const HitTester& hitTester() const { return m_hitTester; }

signals:
    void stateChanged(EditSession::State newState);
    void annotationSelected(int id);
    void annotationDeselected();
    void lineCreationStarted();
    void lineCreationEnded();
    void contextMenuRequested(int id, const QPointF& screenPoint);
    void repaintRequested(EditSession::RepaintScope scope);

private slots:
    void onAnnotationRemoved(int id);
    void onStoreCleared();

private:
    void setState(State state);
    void select(int id);
    void deselect();
    void startEditing(int id);
    void endEditing();
    void handleEditingClick(const QPointF& screenPoint);
    void handleEditingRightClick(const QPointF& screenPoint);
    NodeAnnotation* editingAnnotation();
    int annotationAt(const QPointF& screenPoint) const;

    AnnotationStore& m_store;
    const ViewTransform& m_view;
    HitTester m_hitTester;
    NodeStyle m_defaultStyle;

    State m_state = State::Idle;
    int m_selectedId = NodeAnnotation::kInvalidId;
    int m_editingId = NodeAnnotation::kInvalidId;
    int m_creatingId = NodeAnnotation::kInvalidId;

    // Drag temporaries
    int m_dragIndex = -1;
    QPointF m_dragOriginalPoint;  // For restoration on escape
};

#endif // EDITSESSION_H

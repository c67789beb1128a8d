#include "edit/EditSession.h"
#include "annotations/AnnotationStore.h"
#include "view/ViewTransform.h"
#include "Constants.h"

#include <QDebug>

EditSession::EditSession(AnnotationStore& store, const ViewTransform& view, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_view(view)
    , m_hitTester(view)
{
    connect(&m_store, &AnnotationStore::annotationRemoved, this, &EditSession::onAnnotationRemoved);
    connect(&m_store, &AnnotationStore::cleared, this, &EditSession::onStoreCleared);
}

void EditSession::setState(State state)
{
    if (m_state != state) {
        m_state = state;
        emit stateChanged(m_state);
    }
}

LineStyle EditSession::lineStyleFor(int id) const
{
    if (id == NodeAnnotation::kInvalidId) {
        return LineStyle::Solid;
    }
    if (isPointEditing() && id == m_editingId) {
        return LineStyle::DotDash;
    }
    if (id == m_selectedId) {
        return LineStyle::Dashed;
    }
    return LineStyle::Solid;
}

// ============================================================================
// Creation
// ============================================================================

void EditSession::startCreate()
{
    if (m_state == State::Creating) {
        finishCreate();
    }
    if (m_state == State::Dragging) {
        escape();
    }
    if (m_selectedId != NodeAnnotation::kInvalidId) {
        deselect();
    }

    m_creatingId = NodeAnnotation::kInvalidId;
    setState(State::Creating);
    qDebug() << "EditSession: Line creation started on page" << m_view.currentPage();
    emit lineCreationStarted();
    emit repaintRequested(RepaintScope::Full);
}

bool EditSession::finishCreate()
{
    if (m_state != State::Creating) {
        return false;
    }

    bool kept = false;
    const int id = m_creatingId;
    m_creatingId = NodeAnnotation::kInvalidId;

    if (const NodeAnnotation* node = m_store.find(id)) {
        if (node->isComplete()) {
            kept = true;
            qDebug() << "EditSession: Created" << node->name() << "with" << node->pointCount() << "points";
        } else {
            // An aborted creation must leave no trace
            qDebug() << "EditSession: Discarding incomplete line" << node->name();
            m_store.remove(id);
        }
    }

    setState(State::Idle);
    emit lineCreationEnded();
    emit repaintRequested(RepaintScope::Full);
    return kept;
}

// ============================================================================
// Pointer Input
// ============================================================================

void EditSession::click(const QPointF& screenPoint)
{
    switch (m_state) {
    case State::Creating: {
        const QPointF documentPoint = m_view.toDocument(screenPoint);
        NodeAnnotation* node = m_store.find(m_creatingId);
        if (!node) {
            node = m_store.create(m_view.currentPage(), m_defaultStyle);
            m_creatingId = node->id();
        }
        node->addPoint(documentPoint);
        m_store.notifyChanged(node->id());
        emit repaintRequested(RepaintScope::Full);
        break;
    }
    case State::PointEditing:
        handleEditingClick(screenPoint);
        break;
    case State::Dragging:
        break;
    case State::Idle:
    case State::Selected: {
        const int id = annotationAt(screenPoint);
        if (id != NodeAnnotation::kInvalidId) {
            select(id);
        } else {
            deselect();
        }
        break;
    }
    }
}

void EditSession::doubleClick(const QPointF& screenPoint)
{
    if (m_state != State::Idle && m_state != State::Selected) {
        return;
    }

    const int id = annotationAt(screenPoint);
    const NodeAnnotation* node = m_store.find(id);
    if (node && node->isComplete()) {
        startEditing(id);
    }
}

bool EditSession::drag(const QPointF& screenDelta)
{
    if (m_state != State::Dragging) {
        return false;
    }

    NodeAnnotation* node = editingAnnotation();
    if (!node || m_dragIndex < 0 || m_dragIndex >= node->pointCount()) {
        endEditing();
        return false;
    }

    // Converted at the scale in effect now, not the one at drag start
    const QPointF documentDelta = screenDelta / m_view.effectiveScale();
    node->setPoint(m_dragIndex, node->pointAt(m_dragIndex) + documentDelta);
    m_store.notifyChanged(node->id());
    emit repaintRequested(RepaintScope::OverlayOnly);
    return true;
}

void EditSession::release()
{
    if (m_state != State::Dragging) {
        return;
    }

    m_dragIndex = -1;
    setState(State::PointEditing);
    emit repaintRequested(RepaintScope::Full);
}

void EditSession::rightClick(const QPointF& screenPoint)
{
    switch (m_state) {
    case State::Creating:
        finishCreate();
        break;
    case State::PointEditing:
        handleEditingRightClick(screenPoint);
        break;
    case State::Dragging:
        break;
    case State::Idle:
    case State::Selected: {
        const int id = annotationAt(screenPoint);
        if (id != NodeAnnotation::kInvalidId) {
            emit contextMenuRequested(id, screenPoint);
        }
        break;
    }
    }
}

// ============================================================================
// Keyboard / Commands
// ============================================================================

void EditSession::escape()
{
    switch (m_state) {
    case State::Creating:
        finishCreate();
        break;
    case State::Dragging:
        if (NodeAnnotation* node = editingAnnotation()) {
            node->setPoint(m_dragIndex, m_dragOriginalPoint);
            m_store.notifyChanged(node->id());
        }
        endEditing();
        break;
    case State::PointEditing:
        endEditing();
        break;
    case State::Selected:
        deselect();
        break;
    case State::Idle:
        break;
    }
}

bool EditSession::deleteSelected()
{
    if (m_selectedId == NodeAnnotation::kInvalidId || m_state == State::Dragging) {
        return false;
    }
    // onAnnotationRemoved() resets the session
    return m_store.remove(m_selectedId);
}

// ============================================================================
// Store Observation
// ============================================================================

void EditSession::onAnnotationRemoved(int id)
{
    if (id == m_creatingId) {
        m_creatingId = NodeAnnotation::kInvalidId;
    }

    if (id != m_selectedId && id != m_editingId) {
        return;
    }

    m_selectedId = NodeAnnotation::kInvalidId;
    m_editingId = NodeAnnotation::kInvalidId;
    m_dragIndex = -1;
    if (m_state != State::Creating) {
        setState(State::Idle);
    }
    emit annotationDeselected();
    emit repaintRequested(RepaintScope::Full);
}

void EditSession::onStoreCleared()
{
    const bool hadSelection = m_selectedId != NodeAnnotation::kInvalidId;
    m_creatingId = NodeAnnotation::kInvalidId;
    m_selectedId = NodeAnnotation::kInvalidId;
    m_editingId = NodeAnnotation::kInvalidId;
    m_dragIndex = -1;
    if (m_state != State::Creating) {
        setState(State::Idle);
    }
    if (hadSelection) {
        emit annotationDeselected();
    }
    emit repaintRequested(RepaintScope::Full);
}

// ============================================================================
// Private
// ============================================================================

void EditSession::select(int id)
{
    m_selectedId = id;
    m_editingId = NodeAnnotation::kInvalidId;
    setState(State::Selected);
    emit annotationSelected(id);
    emit repaintRequested(RepaintScope::Full);
}

void EditSession::deselect()
{
    const bool hadSelection = m_selectedId != NodeAnnotation::kInvalidId;
    m_selectedId = NodeAnnotation::kInvalidId;
    m_editingId = NodeAnnotation::kInvalidId;
    m_dragIndex = -1;
    setState(State::Idle);
    if (hadSelection) {
        emit annotationDeselected();
        emit repaintRequested(RepaintScope::Full);
    }
}

void EditSession::startEditing(int id)
{
    m_selectedId = id;
    m_editingId = id;
    m_dragIndex = -1;
    setState(State::PointEditing);
    qDebug() << "EditSession: Point editing node" << id;
    emit annotationSelected(id);
    emit repaintRequested(RepaintScope::Full);
}

void EditSession::endEditing()
{
    // Leaving edit mode returns to Idle, selection included
    deselect();
}

void EditSession::handleEditingClick(const QPointF& screenPoint)
{
    NodeAnnotation* node = editingAnnotation();
    if (!node) {
        endEditing();
        return;
    }

    const QPointF documentPoint = m_view.toDocument(screenPoint);
    const int index = m_hitTester.findPointNear(documentPoint, *node, NodeMark::HitTolerance::kPointGrab);
    if (index < 0) {
        endEditing();
        return;
    }

    m_dragIndex = index;
    m_dragOriginalPoint = node->pointAt(index);
    setState(State::Dragging);
}

void EditSession::handleEditingRightClick(const QPointF& screenPoint)
{
    NodeAnnotation* node = editingAnnotation();
    if (!node) {
        endEditing();
        return;
    }

    const QPointF documentPoint = m_view.toDocument(screenPoint);
    const int vertex = m_hitTester.findPointNear(documentPoint, *node, NodeMark::HitTolerance::kPointGrab);
    if (vertex >= 0) {
        if (node->removePoint(vertex)) {
            m_store.notifyChanged(node->id());
            emit repaintRequested(RepaintScope::Full);
        }
        return;
    }

    const int insertIndex = m_hitTester.findInsertionIndex(documentPoint, *node, NodeMark::HitTolerance::kInsertion);
    if (insertIndex >= 0 && node->insertPoint(insertIndex, documentPoint)) {
        m_store.notifyChanged(node->id());
        emit repaintRequested(RepaintScope::Full);
    }
}

NodeAnnotation* EditSession::editingAnnotation()
{
    return m_store.find(m_editingId);
}

int EditSession::annotationAt(const QPointF& screenPoint) const
{
    return m_hitTester.findAnnotationNear(screenPoint, NodeMark::HitTolerance::kSelection,
                                          m_store.listForPage(m_view.currentPage()));
}

#include "PageCanvas.h"
#include "annotations/AnnotationStore.h"
#include "pdf/PageRasterizer.h"
#include "Constants.h"

#include <QCursor>
#include <QDebug>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QResizeEvent>
#include <QWheelEvent>
#include <QtMath>

using namespace NodeMark;

PageCanvas::PageCanvas(AnnotationStore* store, QWidget* parent)
    : QWidget(parent)
    , m_store(store)
    , m_session(nullptr)
    , m_keyboardZoomStep(Zoom::kKeyboardStep)
    , m_wheelZoomStep(Zoom::kWheelStep)
{
    Q_ASSERT(m_store);

    setFocusPolicy(Qt::StrongFocus);
    setAttribute(Qt::WA_OpaquePaintEvent);
    setMinimumSize(200, 150);

    m_view.setRenderScale(Zoom::kDefaultMagnification);
    m_session = new EditSession(*m_store, m_view, this);

    connect(m_session, &EditSession::repaintRequested, this, &PageCanvas::onRepaintRequested);
    connect(m_session, &EditSession::contextMenuRequested, this, &PageCanvas::onContextMenuRequested);

    connect(m_store, &AnnotationStore::annotationAdded, this, [this](int) { recompose(); });
    connect(m_store, &AnnotationStore::annotationRemoved, this, [this](int) { recompose(); });
    connect(m_store, &AnnotationStore::cleared, this, &PageCanvas::recompose);
    connect(m_store, &AnnotationStore::annotationChanged, this, &PageCanvas::onAnnotationChanged);
}

PageCanvas::~PageCanvas() = default;

// ============================================================================
// Document / Pages
// ============================================================================

void PageCanvas::setRasterizer(std::unique_ptr<PageRasterizer> rasterizer)
{
    m_session->escape();
    m_rasterizer = std::move(rasterizer);
    m_pageRaster = QImage();
    m_rasterPage = -1;

    m_view.setCurrentPage(0);
    m_view.resetToFit();
    loadPageGeometry();
    recompose();

    if (hasDocument()) {
        qDebug() << "PageCanvas: Document loaded," << pageCount() << "pages";
    }
    emit currentPageChanged(0);
    emit zoomChanged(m_view.zoomLevel());
}

bool PageCanvas::hasDocument() const
{
    return m_rasterizer && m_rasterizer->isValid() && m_rasterizer->pageCount() > 0;
}

int PageCanvas::pageCount() const
{
    return hasDocument() ? m_rasterizer->pageCount() : 0;
}

bool PageCanvas::setCurrentPage(int page)
{
    if (!hasDocument() || !m_rasterizer->isPageValid(page)) {
        return false;
    }
    if (page == m_view.currentPage()) {
        return true;
    }

    // Page change is an implicit escape
    m_session->escape();
    m_view.setCurrentPage(page);
    loadPageGeometry();
    recompose();

    qDebug() << "PageCanvas: Showing page" << page + 1 << "of" << pageCount();
    emit currentPageChanged(page);
    return true;
}

bool PageCanvas::nextPage()
{
    return setCurrentPage(currentPage() + 1);
}

bool PageCanvas::previousPage()
{
    return setCurrentPage(currentPage() - 1);
}

void PageCanvas::loadPageGeometry()
{
    m_view.setViewportSize(size());
    if (hasDocument()) {
        m_view.setPageSize(m_rasterizer->pageSize(m_view.currentPage()));
    }
}

// ============================================================================
// Zoom
// ============================================================================

void PageCanvas::setBaseMagnification(qreal magnification)
{
    m_view.setRenderScale(magnification);
    if (hasDocument()) {
        recompose();
    }
}

void PageCanvas::setKeyboardZoomStep(qreal step)
{
    if (step > 1.0) {
        m_keyboardZoomStep = step;
    }
}

void PageCanvas::setWheelZoomStep(qreal step)
{
    if (step > 1.0) {
        m_wheelZoomStep = step;
    }
}

void PageCanvas::zoomIn()
{
    zoomAtAnchor(keyboardZoomAnchor(), m_keyboardZoomStep);
}

void PageCanvas::zoomOut()
{
    zoomAtAnchor(keyboardZoomAnchor(), 1.0 / m_keyboardZoomStep);
}

void PageCanvas::resetZoom()
{
    m_view.resetToFit();
    recompose();
    emit zoomChanged(m_view.zoomLevel());
}

void PageCanvas::zoomAtAnchor(const QPointF& anchor, qreal factor)
{
    if (!hasDocument()) {
        return;
    }
    m_view.zoomAt(anchor, factor);
    recompose();
    emit zoomChanged(m_view.zoomLevel());
}

QPointF PageCanvas::viewportCenter() const
{
    return QPointF(width() / 2.0, height() / 2.0);
}

QPointF PageCanvas::keyboardZoomAnchor() const
{
    // Zoom under the pointer when it is over the canvas, else around the center
    const QPoint cursor = mapFromGlobal(QCursor::pos());
    if (rect().contains(cursor)) {
        return QPointF(cursor);
    }
    return viewportCenter();
}

void PageCanvas::startLineCreation()
{
    if (!hasDocument()) {
        qDebug() << "PageCanvas: Line creation ignored, no document";
        return;
    }
    m_session->startCreate();
    setFocus(Qt::OtherFocusReason);
}

// ============================================================================
// Composition
// ============================================================================

bool PageCanvas::ensurePageRaster()
{
    if (!hasDocument()) {
        return false;
    }

    const int page = m_view.currentPage();
    const qreal scale = m_view.rasterScale();
    if (!m_pageRaster.isNull() && m_rasterPage == page && qFuzzyCompare(m_rasterScale, scale)) {
        return true;
    }

    m_pageRaster = m_rasterizer->renderPage(page, scale);
    if (m_pageRaster.isNull()) {
        qWarning() << "PageCanvas: Failed to render page" << page << "at scale" << scale;
        m_rasterPage = -1;
        return false;
    }
    m_rasterPage = page;
    m_rasterScale = scale;
    return true;
}

void PageCanvas::recompose()
{
    if (!ensurePageRaster()) {
        m_overlay = QImage();
        m_composite = QImage();
        update();
        return;
    }

    m_overlay = m_renderer.renderOverlay(m_pageRaster.size(), m_view.rasterScale(),
                                         m_store->listForPage(m_view.currentPage()), m_session);
    m_composite = OverlayRenderer::composite(m_pageRaster, m_overlay);
    m_overlayOnly = false;
    ++m_fullRepaintCount;
    update();
}

void PageCanvas::refreshOverlay()
{
    if (m_pageRaster.isNull() || m_rasterPage != m_view.currentPage()) {
        recompose();
        return;
    }

    m_overlay = m_renderer.renderOverlay(m_pageRaster.size(), m_view.rasterScale(),
                                         m_store->listForPage(m_view.currentPage()), m_session);
    m_overlayOnly = true;
    ++m_overlayRepaintCount;
    update();
}

void PageCanvas::onRepaintRequested(EditSession::RepaintScope scope)
{
    if (scope == EditSession::RepaintScope::Full) {
        m_dragMoveCount = 0;
        recompose();
        return;
    }

    ++m_dragMoveCount;
    if (m_dragMoveCount % Drag::kFullRepaintInterval == 0) {
        recompose();
    } else {
        refreshOverlay();
    }
}

void PageCanvas::onAnnotationChanged(int id)
{
    // Drag moves arrive through repaintRequested with their own scope
    if (m_session->isDragging()) {
        return;
    }
    const NodeAnnotation* annotation = m_store->find(id);
    if (annotation && annotation->page() != m_view.currentPage()) {
        return;
    }
    recompose();
}

void PageCanvas::onContextMenuRequested(int id, const QPointF& screenPoint)
{
    emit annotationContextMenuRequested(id, mapToGlobal(screenPoint.toPoint()));
}

// ============================================================================
// Events
// ============================================================================

void PageCanvas::paintEvent(QPaintEvent*)
{
    QPainter painter(this);
    painter.fillRect(rect(), palette().color(QPalette::Dark));

    if (m_composite.isNull() || !m_view.hasPageSize()) {
        painter.setPen(palette().color(QPalette::BrightText));
        painter.drawText(rect(), Qt::AlignCenter,
                         hasDocument() ? tr("Page unavailable") : tr("No document loaded"));
        return;
    }

    const QRectF target(m_view.panOffset(), m_view.displaySize());
    if (!qFuzzyCompare(m_view.fitScale(), 1.0)) {
        painter.setRenderHint(QPainter::SmoothPixmapTransform);
    }

    if (m_overlayOnly) {
        painter.drawImage(target, m_pageRaster);
        painter.drawImage(target, m_overlay);
    } else {
        painter.drawImage(target, m_composite);
    }
}

void PageCanvas::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    // Fit mode only changes the display factor; the raster is reused
    m_view.setViewportSize(event->size());
    update();
}

void PageCanvas::mousePressEvent(QMouseEvent* event)
{
    const QPointF pos = event->position();

    switch (event->button()) {
    case Qt::LeftButton:
        m_lastDragPos = pos;
        m_session->click(pos);
        break;
    case Qt::RightButton:
        m_session->rightClick(pos);
        break;
    case Qt::MiddleButton:
        m_isPanning = true;
        m_lastPanPos = pos;
        setCursor(Qt::ClosedHandCursor);
        break;
    default:
        QWidget::mousePressEvent(event);
        return;
    }
    event->accept();
}

void PageCanvas::mouseDoubleClickEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        QWidget::mouseDoubleClickEvent(event);
        return;
    }
    m_session->doubleClick(event->position());
    event->accept();
}

void PageCanvas::mouseMoveEvent(QMouseEvent* event)
{
    const QPointF pos = event->position();

    if (m_isPanning) {
        const QPointF delta = pos - m_lastPanPos;
        m_lastPanPos = pos;
        m_view.panBy(delta.x(), delta.y());
        update();
        event->accept();
        return;
    }

    if (m_session->isDragging() && (event->buttons() & Qt::LeftButton)) {
        const QPointF delta = pos - m_lastDragPos;
        m_lastDragPos = pos;
        m_session->drag(delta);
        event->accept();
        return;
    }

    QWidget::mouseMoveEvent(event);
}

void PageCanvas::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::MiddleButton && m_isPanning) {
        m_isPanning = false;
        unsetCursor();
        event->accept();
        return;
    }

    if (event->button() == Qt::LeftButton && m_session->isDragging()) {
        m_session->release();
        event->accept();
        return;
    }

    QWidget::mouseReleaseEvent(event);
}

void PageCanvas::wheelEvent(QWheelEvent* event)
{
    if (!hasDocument()) {
        event->ignore();
        return;
    }

    const QPoint angle = event->angleDelta();
    if (event->modifiers() & Qt::ControlModifier) {
        const qreal notches = angle.y() / static_cast<qreal>(Zoom::kWheelNotchDelta);
        if (!qFuzzyIsNull(notches)) {
            zoomAtAnchor(event->position(), qPow(m_wheelZoomStep, notches));
        }
    } else {
        const qreal scroll = Zoom::kWheelScrollPixels / Zoom::kWheelNotchDelta;
        m_view.panBy(angle.x() * scroll, angle.y() * scroll);
        update();
    }
    event->accept();
}

void PageCanvas::keyPressEvent(QKeyEvent* event)
{
    const bool ctrl = event->modifiers() & Qt::ControlModifier;

    switch (event->key()) {
    case Qt::Key_Escape:
        m_session->escape();
        break;
    case Qt::Key_PageUp:
        previousPage();
        break;
    case Qt::Key_PageDown:
        nextPage();
        break;
    case Qt::Key_Delete:
    case Qt::Key_Backspace:
        m_session->deleteSelected();
        break;
    case Qt::Key_Return:
    case Qt::Key_Enter:
        if (!m_session->isCreating()) {
            QWidget::keyPressEvent(event);
            return;
        }
        m_session->finishCreate();
        break;
    case Qt::Key_L:
        if (!ctrl) {
            QWidget::keyPressEvent(event);
            return;
        }
        startLineCreation();
        break;
    case Qt::Key_0:
        if (!ctrl) {
            QWidget::keyPressEvent(event);
            return;
        }
        resetZoom();
        break;
    case Qt::Key_Equal:
    case Qt::Key_Plus:
        if (!ctrl) {
            QWidget::keyPressEvent(event);
            return;
        }
        zoomIn();
        break;
    case Qt::Key_Minus:
        if (!ctrl) {
            QWidget::keyPressEvent(event);
            return;
        }
        zoomOut();
        break;
    default:
        QWidget::keyPressEvent(event);
        return;
    }
    event->accept();
}

#include "view/ViewTransform.h"
#include "Constants.h"

#include <QDebug>
#include <QtMath>
#include <algorithm>

ViewTransform::ViewTransform()
{
}

// ============================================================================
// Mapping
// ============================================================================

qreal ViewTransform::effectiveScale() const
{
    const qreal scale = m_renderScale * m_zoomLevel * m_fitScale;
    if (scale <= 0.0 || !qIsFinite(scale)) {
        return 1.0;
    }
    return scale;
}

QPointF ViewTransform::toDocument(const QPointF& screenPoint) const
{
    return (screenPoint - m_pan) / effectiveScale();
}

QPointF ViewTransform::toScreen(const QPointF& documentPoint) const
{
    return documentPoint * effectiveScale() + m_pan;
}

QSizeF ViewTransform::displaySize() const
{
    if (!hasPageSize()) {
        return QSizeF();
    }
    return m_pageSize * effectiveScale();
}

// ============================================================================
// Zoom / Pan
// ============================================================================

void ViewTransform::zoomAt(const QPointF& screenAnchor, qreal factor)
{
    if (factor <= 0.0 || !qIsFinite(factor)) {
        qWarning() << "ViewTransform: Ignoring invalid zoom factor" << factor;
        return;
    }

    const QPointF anchorDocument = toDocument(screenAnchor);

    qreal baseZoom = m_zoomLevel;
    if (m_fitToWindow) {
        baseZoom *= m_fitScale;
        m_fitScale = 1.0;
        m_fitToWindow = false;
    }

    m_zoomLevel = clampZoom(baseZoom * factor);

    // Keep the anchored document point under the cursor
    m_pan = screenAnchor - anchorDocument * effectiveScale();
}

void ViewTransform::zoomIn(const QPointF& screenAnchor)
{
    zoomAt(screenAnchor, NodeMark::Zoom::kKeyboardStep);
}

void ViewTransform::zoomOut(const QPointF& screenAnchor)
{
    zoomAt(screenAnchor, 1.0 / NodeMark::Zoom::kKeyboardStep);
}

void ViewTransform::resetToFit(const QSize& viewportSize, const QSizeF& pageSize)
{
    m_viewportSize = viewportSize;
    m_pageSize = pageSize;
    resetToFit();
}

void ViewTransform::resetToFit()
{
    m_fitToWindow = true;
    m_zoomLevel = 1.0;
    m_pan = QPointF();
    updateFitScale();
}

void ViewTransform::panBy(qreal dx, qreal dy)
{
    m_pan += QPointF(dx, dy);
}

// ============================================================================
// Layout Inputs
// ============================================================================

void ViewTransform::setViewportSize(const QSize& size)
{
    m_viewportSize = size;
    if (m_fitToWindow) {
        m_pan = QPointF();
        updateFitScale();
    }
}

bool ViewTransform::hasValidViewport() const
{
    return m_viewportSize.width() > 1 && m_viewportSize.height() > 1;
}

void ViewTransform::setRenderScale(qreal scale)
{
    if (scale <= 0.0 || !qIsFinite(scale)) {
        qWarning() << "ViewTransform: Ignoring invalid render scale" << scale;
        return;
    }
    m_renderScale = scale;
    updateFitScale();
}

void ViewTransform::setCurrentPage(int page)
{
    m_currentPage = page;
    m_pan = QPointF();
    m_pageSize = QSizeF();
    updateFitScale();
}

void ViewTransform::setPageSize(const QSizeF& pageSize)
{
    m_pageSize = pageSize;
    updateFitScale();
}

// ============================================================================
// Private
// ============================================================================

void ViewTransform::updateFitScale()
{
    if (!m_fitToWindow) {
        m_fitScale = 1.0;
        return;
    }

    // Transient layouts report 0x0 or 1x1 viewports; stay at 1.0 until valid
    if (!hasValidViewport() || !hasPageSize()) {
        m_fitScale = 1.0;
        return;
    }

    const qreal rasterWidth = m_pageSize.width() * rasterScale();
    const qreal rasterHeight = m_pageSize.height() * rasterScale();
    if (rasterWidth <= 0.0 || rasterHeight <= 0.0) {
        m_fitScale = 1.0;
        return;
    }

    m_fitScale = std::min(m_viewportSize.width() / rasterWidth,
                          m_viewportSize.height() / rasterHeight);
}

qreal ViewTransform::clampZoom(qreal zoom)
{
    return std::clamp(zoom, NodeMark::Bounds::kMinZoom, NodeMark::Bounds::kMaxZoom);
}

#include "render/OverlayRenderer.h"
#include "annotations/NodeAnnotation.h"
#include "edit/EditSession.h"
#include "utils/PolylineGeometry.h"
#include "Constants.h"

#include <QDebug>
#include <QFontMetricsF>
#include <QPainter>
#include <QPainterPath>
#include <QtMath>
#include <algorithm>

using namespace NodeMark;

OverlayRenderer::OverlayRenderer()
{
    m_labelFont.setStyleHint(QFont::SansSerif);
}

// ============================================================================
// Layer Rendering
// ============================================================================

QImage OverlayRenderer::renderOverlay(const QSize& rasterSize, qreal scale,
                                      const QVector<NodeAnnotation*>& annotations,
                                      const EditSession* session) const
{
    if (rasterSize.width() <= 0 || rasterSize.height() <= 0 || scale <= 0.0) {
        qDebug() << "OverlayRenderer: Skipping render for degenerate raster" << rasterSize << "scale" << scale;
        return QImage();
    }

    QImage overlay(rasterSize, QImage::Format_ARGB32_Premultiplied);
    overlay.fill(Qt::transparent);

    QPainter painter(&overlay);
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);

    for (const NodeAnnotation* annotation : annotations) {
        if (!annotation) {
            continue;
        }
        const LineStyle style = session ? session->lineStyleFor(annotation->id()) : LineStyle::Solid;
        const bool highlighted = session && session->isHighlighted(annotation->id());
        drawAnnotation(painter, *annotation, scale, style, highlighted);
    }

    painter.end();
    return overlay;
}

void OverlayRenderer::drawAnnotation(QPainter& painter, const NodeAnnotation& annotation, qreal scale,
                                     LineStyle style, bool highlighted) const
{
    if (!annotation.isComplete()) {
        return;
    }

    const QVector<QPointF> points = toRasterPoints(annotation.points(), scale);
    const QPen pen = strokePen(annotation, scale, style, highlighted);

    painter.save();

    drawStroke(painter, points, pen);

    if (style == LineStyle::DotDash) {
        drawVertexMarkers(painter, points, annotation.color(), scale);
    }

    if (annotation.hasArrow()) {
        drawArrowhead(painter, points, pen.color(), pen.widthF());
    }

    if (!annotation.name().isEmpty()) {
        drawLabel(painter, annotation, points, scale);
    }

    if (annotation.noteCount() > 0) {
        drawIndicators(painter, annotation, points, scale);
    }

    painter.restore();
}

QImage OverlayRenderer::composite(const QImage& pageRaster, const QImage& overlay)
{
    if (pageRaster.isNull()) {
        return QImage();
    }

    QImage result = pageRaster.convertToFormat(QImage::Format_ARGB32_Premultiplied);
    if (overlay.isNull()) {
        return result;
    }

    QPainter painter(&result);
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);
    if (overlay.size() == result.size()) {
        painter.drawImage(0, 0, overlay);
    } else {
        painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
        painter.drawImage(result.rect(), overlay);
    }
    painter.end();
    return result;
}

// ============================================================================
// Geometry Helpers
// ============================================================================

qreal OverlayRenderer::strokeWidth(qreal documentWidth, qreal scale, bool highlighted)
{
    const qreal width = documentWidth * scale;
    if (!highlighted) {
        return width;
    }
    // Thicken rather than recolor so thin lines still read as selected
    return std::max((documentWidth + Overlay::kSelectedWidthPadding) * scale,
                    documentWidth * Overlay::kSelectedWidthFactor * scale);
}

QVector<qreal> OverlayRenderer::dashPattern(LineStyle style, qreal penWidth)
{
    // QPen measures dash patterns in pen widths; lengths here are pixels,
    // never shorter than the pen is wide so gaps stay visible on thick lines
    const qreal unit = std::max(1.0, penWidth);
    auto toUnits = [unit](qreal pixels) { return std::max(pixels, unit) / unit; };

    switch (style) {
    case LineStyle::Solid:
        break;
    case LineStyle::Dashed:
        return {toUnits(Overlay::kDashLength), toUnits(Overlay::kDashGap)};
    case LineStyle::DotDash:
        return {toUnits(Overlay::kDotLength), toUnits(Overlay::kDotDashGap),
                toUnits(Overlay::kDotDashLength), toUnits(Overlay::kDotDashGap)};
    }
    return {};
}

QPen OverlayRenderer::strokePen(const NodeAnnotation& annotation, qreal scale,
                                LineStyle style, bool highlighted)
{
    QColor color = annotation.color();
    color.setAlphaF(annotation.opacity());

    const qreal width = std::max(1.0, strokeWidth(annotation.width(), scale, highlighted));

    QPen pen(color, width, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);
    if (style != LineStyle::Solid) {
        pen.setCapStyle(Qt::FlatCap);
        pen.setDashPattern(dashPattern(style, width));
    }
    return pen;
}

QVector<QPointF> OverlayRenderer::toRasterPoints(const QVector<QPointF>& documentPoints, qreal scale)
{
    QVector<QPointF> result;
    result.reserve(documentPoints.size());
    for (const QPointF& p : documentPoints) {
        result.append(p * scale);
    }
    return result;
}

QVector<QLineF> OverlayRenderer::arrowheadStrokes(const QPointF& from, const QPointF& to, qreal penWidth)
{
    if (qFuzzyIsNull(PolylineGeometry::distance(from, to))) {
        return {};
    }

    const qreal angle = qAtan2(to.y() - from.y(), to.x() - from.x());
    const qreal spread = qDegreesToRadians(Overlay::kArrowAngleDegrees);
    const qreal length = std::max(Overlay::kMinArrowLength, penWidth * Overlay::kArrowLengthFactor);

    const QPointF wing1(to.x() - length * qCos(angle - spread),
                        to.y() - length * qSin(angle - spread));
    const QPointF wing2(to.x() - length * qCos(angle + spread),
                        to.y() - length * qSin(angle + spread));

    return {QLineF(to, wing1), QLineF(to, wing2)};
}

OverlayRenderer::LabelPlacement OverlayRenderer::labelPlacement(const QVector<QPointF>& rasterPoints)
{
    LabelPlacement placement;
    const QLineF segment = PolylineGeometry::longestSegment(rasterPoints);
    if (rasterPoints.size() < 2) {
        return placement;
    }

    placement.center = segment.center();
    const qreal angle = qAbs(PolylineGeometry::angleDegrees(segment));
    placement.rotated = angle > Overlay::kLabelRotateMinDegrees && angle < Overlay::kLabelRotateMaxDegrees;
    placement.valid = true;
    return placement;
}

QVector<QPointF> OverlayRenderer::indicatorCenters(const QVector<QPointF>& rasterPoints, int count, qreal radius)
{
    QVector<QPointF> centers;
    if (count <= 0 || rasterPoints.size() < 2) {
        return centers;
    }

    const qreal total = PolylineGeometry::polylineArcLength(rasterPoints);
    if (qFuzzyIsNull(total)) {
        return centers;
    }

    const PolylineGeometry::ArcPoint mid = PolylineGeometry::pointAtArcLength(rasterPoints, total / 2.0);
    const QPointF normal = PolylineGeometry::perpendicular(mid.tangent);
    const qreal spacing = radius * Overlay::kIndicatorSpacingFactor;
    const qreal start = -(count - 1) * spacing / 2.0;
    const qreal lift = radius + Overlay::kIndicatorPerpendicularGap;

    centers.reserve(count);
    for (int i = 0; i < count; ++i) {
        const qreal along = start + i * spacing;
        centers.append(mid.point + mid.tangent * along + normal * lift);
    }
    return centers;
}

qreal OverlayRenderer::indicatorRadius(qreal scale)
{
    return Overlay::kIndicatorRadius * scale;
}

qreal OverlayRenderer::vertexMarkerSize(qreal scale)
{
    return std::max(Overlay::kVertexMarkerSize, Overlay::kVertexMarkerSize * scale);
}

// ============================================================================
// Drawing
// ============================================================================

void OverlayRenderer::drawStroke(QPainter& painter, const QVector<QPointF>& points, const QPen& pen) const
{
    QPainterPath path;
    path.moveTo(points.first());
    for (int i = 1; i < points.size(); ++i) {
        path.lineTo(points[i]);
    }

    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);
    painter.drawPath(path);
}

void OverlayRenderer::drawVertexMarkers(QPainter& painter, const QVector<QPointF>& points,
                                        const QColor& color, qreal scale) const
{
    const qreal size = vertexMarkerSize(scale);
    QColor fill = color;
    fill.setAlpha(255);

    painter.setPen(QPen(Overlay::kMarkerOutline, Overlay::kOutlineWidth));
    painter.setBrush(fill);
    for (const QPointF& p : points) {
        painter.drawRect(QRectF(p.x() - size / 2.0, p.y() - size / 2.0, size, size));
    }
}

void OverlayRenderer::drawArrowhead(QPainter& painter, const QVector<QPointF>& points,
                                    const QColor& color, qreal penWidth) const
{
    const int last = points.size() - 1;
    const QVector<QLineF> strokes = arrowheadStrokes(points[last - 1], points[last], penWidth);

    // Always solid, whatever the line pattern
    painter.setPen(QPen(color, penWidth, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
    for (const QLineF& stroke : strokes) {
        painter.drawLine(stroke);
    }
}

void OverlayRenderer::drawLabel(QPainter& painter, const NodeAnnotation& annotation,
                                const QVector<QPointF>& points, qreal scale) const
{
    const LabelPlacement placement = labelPlacement(points);
    if (!placement.valid) {
        return;
    }

    QFont font = m_labelFont;
    font.setPixelSize(std::max(1, qRound(annotation.fontSize() * scale)));
    const QFontMetricsF metrics(font);
    const qreal pad = Overlay::kLabelPadding;
    const QSizeF chipSize(metrics.horizontalAdvance(annotation.name()) + 2 * pad,
                          metrics.height() + 2 * pad);
    const QRectF chip(-chipSize.width() / 2.0, -chipSize.height() / 2.0,
                      chipSize.width(), chipSize.height());

    QColor textColor = annotation.color();
    textColor.setAlpha(255);

    painter.save();
    painter.translate(placement.center);
    if (placement.rotated) {
        painter.rotate(-90.0);
    }
    painter.setPen(Qt::NoPen);
    painter.setBrush(Overlay::kLabelChip);
    painter.drawRect(chip);
    painter.setFont(font);
    painter.setPen(textColor);
    painter.drawText(chip, Qt::AlignCenter, annotation.name());
    painter.restore();
}

void OverlayRenderer::drawIndicators(QPainter& painter, const NodeAnnotation& annotation,
                                     const QVector<QPointF>& points, qreal scale) const
{
    const qreal radius = indicatorRadius(scale);
    const QVector<QPointF> centers = indicatorCenters(points, annotation.noteCount(), radius);

    QColor fill = annotation.color();
    fill.setAlpha(255);

    painter.setPen(QPen(Overlay::kMarkerOutline, Overlay::kOutlineWidth));
    painter.setBrush(fill);
    for (const QPointF& center : centers) {
        painter.drawEllipse(center, radius, radius);
    }
}

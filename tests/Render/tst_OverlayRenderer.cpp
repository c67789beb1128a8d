#include <QtTest>
#include <QPainter>
#include "render/OverlayRenderer.h"
#include "annotations/AnnotationStore.h"
#include "annotations/NodeAnnotation.h"
#include "edit/EditSession.h"
#include "view/ViewTransform.h"

#include <QFontMetricsF>

/**
 * @brief Tests for OverlayRenderer geometry helpers and layer output.
 */
class tst_OverlayRenderer : public QObject
{
    Q_OBJECT

private slots:
    // Stroke
    void testStrokeWidth_Idle();
    void testStrokeWidth_Highlighted();
    void testDashPattern_PerStyle();
    void testDashPattern_ThickPen();
    void testStrokePen_OpacityAndCap();

    // Decorations
    void testArrowheadStrokes_Horizontal();
    void testArrowheadStrokes_Degenerate();
    void testLabelPlacement_LongestSegment();
    void testLabelPlacement_Invalid();
    void testIndicatorCenters_ThreeNotes();
    void testIndicatorCenters_SingleNote();
    void testIndicatorCenters_ZeroLength();
    void testMarkerSizes();

    // Layer output
    void testRenderOverlay_DegenerateSize();
    void testRenderOverlay_DrawsStroke();
    void testRenderOverlay_IncompleteNodeNotDrawn();
    void testDrawAnnotation_HighlightThickens();
    void testRenderOverlay_VertexMarkersOnlyWhilePointEditing();
    void testDrawAnnotation_DashedLeavesGaps();
    void testDrawAnnotation_DotDashLeavesGaps();
    void testRenderOverlay_ThreeIndicatorCircles();
    void testRenderOverlay_LabelChipAtLongestSegment();
    void testRenderOverlay_LabelChipRotatedOnVerticalSegment();
    void testComposite_SourceOver();
    void testComposite_ScalesOverlay();
    void testComposite_NullPage();

private:
    static NodeAnnotation horizontalNode(qreal width = 2.0);
    static QImage drawWithStyle(const OverlayRenderer& renderer, const NodeAnnotation& node,
                                LineStyle style);
    static QSizeF labelChipSize(const OverlayRenderer& renderer, const QString& name, qreal fontSize);
};

NodeAnnotation tst_OverlayRenderer::horizontalNode(qreal width)
{
    NodeStyle style;
    style.color = Qt::blue;
    style.width = width;
    style.opacity = 1.0;
    style.hasArrow = false;
    return NodeAnnotation(QString(), {QPointF(10, 20), QPointF(110, 20)}, 0, style);
}

QImage tst_OverlayRenderer::drawWithStyle(const OverlayRenderer& renderer, const NodeAnnotation& node,
                                          LineStyle style)
{
    QImage image(QSize(120, 40), QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);
    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing, true);
    renderer.drawAnnotation(painter, node, 1.0, style, false);
    painter.end();
    return image;
}

QSizeF tst_OverlayRenderer::labelChipSize(const OverlayRenderer& renderer, const QString& name,
                                          qreal fontSize)
{
    QFont font = renderer.labelFont();
    font.setPixelSize(qRound(fontSize));
    const QFontMetricsF metrics(font);
    return QSizeF(metrics.horizontalAdvance(name) + 4.0, metrics.height() + 4.0);
}

// ============================================================================
// Stroke
// ============================================================================

void tst_OverlayRenderer::testStrokeWidth_Idle()
{
    QCOMPARE(OverlayRenderer::strokeWidth(2.0, 1.5, false), 3.0);
    QCOMPARE(OverlayRenderer::strokeWidth(4.0, 1.0, false), 4.0);
}

void tst_OverlayRenderer::testStrokeWidth_Highlighted()
{
    // Thin line: padding wins
    QCOMPARE(OverlayRenderer::strokeWidth(2.0, 1.5, true), 7.5);
    // Thick line: doubling wins
    QCOMPARE(OverlayRenderer::strokeWidth(10.0, 1.0, true), 20.0);
}

void tst_OverlayRenderer::testDashPattern_PerStyle()
{
    QVERIFY(OverlayRenderer::dashPattern(LineStyle::Solid, 1.0).isEmpty());
    QCOMPARE(OverlayRenderer::dashPattern(LineStyle::Dashed, 1.0), QVector<qreal>({10.0, 5.0}));
    QCOMPARE(OverlayRenderer::dashPattern(LineStyle::DotDash, 1.0), QVector<qreal>({3.0, 4.0, 8.0, 4.0}));
}

void tst_OverlayRenderer::testDashPattern_ThickPen()
{
    // Pattern entries are in pen widths and never shorter than the pen
    QCOMPARE(OverlayRenderer::dashPattern(LineStyle::Dashed, 2.0), QVector<qreal>({5.0, 2.5}));

    const QVector<qreal> dotDash = OverlayRenderer::dashPattern(LineStyle::DotDash, 6.0);
    QCOMPARE(dotDash.size(), 4);
    QCOMPARE(dotDash.at(0), 1.0);
    QCOMPARE(dotDash.at(1), 1.0);
    QVERIFY(qFuzzyCompare(dotDash.at(2), 8.0 / 6.0));
    QCOMPARE(dotDash.at(3), 1.0);
}

void tst_OverlayRenderer::testStrokePen_OpacityAndCap()
{
    NodeAnnotation node = horizontalNode();
    node.setOpacity(0.5);

    const QPen solid = OverlayRenderer::strokePen(node, 1.0, LineStyle::Solid, false);
    QCOMPARE(solid.widthF(), 2.0);
    QCOMPARE(solid.capStyle(), Qt::RoundCap);
    QVERIFY(qAbs(solid.color().alphaF() - 0.5) < 0.01);

    const QPen dashed = OverlayRenderer::strokePen(node, 1.0, LineStyle::Dashed, false);
    QCOMPARE(dashed.capStyle(), Qt::FlatCap);
    QCOMPARE(dashed.style(), Qt::CustomDashLine);

    // Sub-pixel strokes are clamped to one pixel
    const QPen thin = OverlayRenderer::strokePen(node, 0.1, LineStyle::Solid, false);
    QCOMPARE(thin.widthF(), 1.0);
}

// ============================================================================
// Decorations
// ============================================================================

void tst_OverlayRenderer::testArrowheadStrokes_Horizontal()
{
    const QVector<QLineF> strokes = OverlayRenderer::arrowheadStrokes(QPointF(0, 0), QPointF(100, 0), 1.0);
    QCOMPARE(strokes.size(), 2);

    const qreal back = 100.0 - 10.0 * qCos(qDegreesToRadians(30.0));
    for (const QLineF& stroke : strokes) {
        QCOMPARE(stroke.p1(), QPointF(100, 0));
        QVERIFY(qAbs(stroke.p2().x() - back) < 1e-6);
        QVERIFY(qAbs(qAbs(stroke.p2().y()) - 5.0) < 1e-6);
    }
    QVERIFY(strokes.at(0).p2().y() * strokes.at(1).p2().y() < 0);

    // Thick pens lengthen the wings
    const QVector<QLineF> thick = OverlayRenderer::arrowheadStrokes(QPointF(0, 0), QPointF(100, 0), 6.0);
    QVERIFY(qAbs(thick.at(0).length() - 18.0) < 1e-6);
}

void tst_OverlayRenderer::testArrowheadStrokes_Degenerate()
{
    QVERIFY(OverlayRenderer::arrowheadStrokes(QPointF(5, 5), QPointF(5, 5), 2.0).isEmpty());
}

void tst_OverlayRenderer::testLabelPlacement_LongestSegment()
{
    const OverlayRenderer::LabelPlacement vertical =
        OverlayRenderer::labelPlacement({QPointF(0, 0), QPointF(10, 0), QPointF(10, 100)});
    QVERIFY(vertical.valid);
    QCOMPARE(vertical.center, QPointF(10, 50));
    QVERIFY(vertical.rotated);

    const OverlayRenderer::LabelPlacement horizontal =
        OverlayRenderer::labelPlacement({QPointF(0, 0), QPointF(100, 10)});
    QVERIFY(horizontal.valid);
    QCOMPARE(horizontal.center, QPointF(50, 5));
    QVERIFY(!horizontal.rotated);
}

void tst_OverlayRenderer::testLabelPlacement_Invalid()
{
    QVERIFY(!OverlayRenderer::labelPlacement({QPointF(3, 3)}).valid);
    QVERIFY(!OverlayRenderer::labelPlacement({}).valid);
}

void tst_OverlayRenderer::testIndicatorCenters_ThreeNotes()
{
    const QVector<QPointF> centers =
        OverlayRenderer::indicatorCenters({QPointF(0, 0), QPointF(100, 0)}, 3, 8.0);

    const QVector<QPointF> expected{QPointF(30, 10), QPointF(50, 10), QPointF(70, 10)};
    QCOMPARE(centers.size(), expected.size());
    for (int i = 0; i < expected.size(); ++i) {
        QVERIFY2(qAbs(centers[i].x() - expected[i].x()) < 1e-9 &&
                 qAbs(centers[i].y() - expected[i].y()) < 1e-9,
                 qPrintable(QStringLiteral("center %1").arg(i)));
    }
}

void tst_OverlayRenderer::testIndicatorCenters_SingleNote()
{
    // Midpoint of an L-shaped path lies on its second segment, heading down
    const QVector<QPointF> centers =
        OverlayRenderer::indicatorCenters({QPointF(0, 0), QPointF(40, 0), QPointF(40, 60)}, 1, 4.0);

    QCOMPARE(centers.size(), 1);
    QVERIFY(qAbs(centers[0].x() - 34.0) < 1e-9);
    QVERIFY(qAbs(centers[0].y() - 10.0) < 1e-9);
}

void tst_OverlayRenderer::testIndicatorCenters_ZeroLength()
{
    QVERIFY(OverlayRenderer::indicatorCenters({QPointF(5, 5), QPointF(5, 5)}, 2, 8.0).isEmpty());
    QVERIFY(OverlayRenderer::indicatorCenters({QPointF(0, 0), QPointF(10, 0)}, 0, 8.0).isEmpty());
}

void tst_OverlayRenderer::testMarkerSizes()
{
    QCOMPARE(OverlayRenderer::indicatorRadius(1.5), 12.0);
    QCOMPARE(OverlayRenderer::vertexMarkerSize(0.5), 8.0);
    QCOMPARE(OverlayRenderer::vertexMarkerSize(2.0), 16.0);
}

// ============================================================================
// Layer Output
// ============================================================================

void tst_OverlayRenderer::testRenderOverlay_DegenerateSize()
{
    OverlayRenderer renderer;
    QVERIFY(renderer.renderOverlay(QSize(0, 10), 1.0, {}).isNull());
    QVERIFY(renderer.renderOverlay(QSize(10, 10), 0.0, {}).isNull());
}

void tst_OverlayRenderer::testRenderOverlay_DrawsStroke()
{
    OverlayRenderer renderer;
    NodeAnnotation node = horizontalNode();

    const QImage overlay = renderer.renderOverlay(QSize(120, 40), 1.0, {&node});

    QCOMPARE(overlay.size(), QSize(120, 40));
    QCOMPARE(overlay.format(), QImage::Format_ARGB32_Premultiplied);
    QVERIFY(qAlpha(overlay.pixel(60, 20)) > 200);
    QCOMPARE(qAlpha(overlay.pixel(60, 35)), 0);
    QCOMPARE(qAlpha(overlay.pixel(2, 2)), 0);
}

void tst_OverlayRenderer::testRenderOverlay_IncompleteNodeNotDrawn()
{
    OverlayRenderer renderer;
    NodeAnnotation node(QStringLiteral("Pending"), {QPointF(20, 20)}, 0);

    const QImage overlay = renderer.renderOverlay(QSize(40, 40), 1.0, {&node});

    for (int y = 0; y < overlay.height(); ++y) {
        for (int x = 0; x < overlay.width(); ++x) {
            QCOMPARE(qAlpha(overlay.pixel(x, y)), 0);
        }
    }
}

void tst_OverlayRenderer::testDrawAnnotation_HighlightThickens()
{
    OverlayRenderer renderer;
    const NodeAnnotation node = horizontalNode();

    auto draw = [&](bool highlighted) {
        QImage image(QSize(120, 40), QImage::Format_ARGB32_Premultiplied);
        image.fill(Qt::transparent);
        QPainter painter(&image);
        renderer.drawAnnotation(painter, node, 1.0, LineStyle::Solid, highlighted);
        painter.end();
        return image;
    };

    // Idle width 2 covers rows 19-20; highlighted width 5 reaches row 22
    QVERIFY(qAlpha(draw(false).pixel(60, 21)) < 50);
    QVERIFY(qAlpha(draw(true).pixel(60, 21)) > 200);
}

void tst_OverlayRenderer::testRenderOverlay_VertexMarkersOnlyWhilePointEditing()
{
    AnnotationStore store;
    ViewTransform view;
    EditSession session(store, view);
    OverlayRenderer renderer;

    NodeStyle style;
    style.color = Qt::blue;
    style.opacity = 1.0;
    style.hasArrow = false;
    const NodeAnnotation* node = store.add(std::make_unique<NodeAnnotation>(
        QString(), QVector<QPointF>{QPointF(20, 30), QPointF(120, 30)}, 0, style));

    // Just outside both line ends, inside the 8 px vertex squares
    const QPoint nearFirst(18, 32);
    const QPoint nearLast(122, 32);
    auto render = [&]() {
        return renderer.renderOverlay(QSize(140, 60), 1.0, store.listForPage(0), &session);
    };

    QImage overlay = render();
    QCOMPARE(qAlpha(overlay.pixel(nearFirst)), 0);
    QCOMPARE(qAlpha(overlay.pixel(nearLast)), 0);

    session.click(QPointF(70, 30));
    QCOMPARE(session.selectedId(), node->id());
    overlay = render();
    QCOMPARE(qAlpha(overlay.pixel(nearFirst)), 0);
    QCOMPARE(qAlpha(overlay.pixel(nearLast)), 0);

    session.doubleClick(QPointF(70, 30));
    QVERIFY(session.isPointEditing());
    overlay = render();
    QCOMPARE(qAlpha(overlay.pixel(nearFirst)), 255);
    QCOMPARE(qAlpha(overlay.pixel(nearLast)), 255);
    QCOMPARE(QColor(overlay.pixel(nearFirst)), QColor(Qt::blue));

    session.escape();
    overlay = render();
    QCOMPARE(qAlpha(overlay.pixel(nearFirst)), 0);
}

void tst_OverlayRenderer::testDrawAnnotation_DashedLeavesGaps()
{
    OverlayRenderer renderer;
    const NodeAnnotation node = horizontalNode();

    const QImage solid = drawWithStyle(renderer, node, LineStyle::Solid);
    const QImage dashed = drawWithStyle(renderer, node, LineStyle::Dashed);

    // 10 px dash from x=10, then a 5 px gap from x=20
    QVERIFY(qAlpha(dashed.pixel(15, 20)) > 200);
    QVERIFY(qAlpha(solid.pixel(22, 20)) > 200);
    QCOMPARE(qAlpha(dashed.pixel(22, 20)), 0);
    QVERIFY(qAlpha(dashed.pixel(30, 20)) > 200);
}

void tst_OverlayRenderer::testDrawAnnotation_DotDashLeavesGaps()
{
    OverlayRenderer renderer;
    const NodeAnnotation node = horizontalNode();

    const QImage solid = drawWithStyle(renderer, node, LineStyle::Solid);
    const QImage dotDash = drawWithStyle(renderer, node, LineStyle::DotDash);

    // 3 px dot, 4 px gap, 8 px dash, 4 px gap
    QVERIFY(qAlpha(dotDash.pixel(11, 20)) > 200);
    QVERIFY(qAlpha(solid.pixel(14, 20)) > 200);
    QCOMPARE(qAlpha(dotDash.pixel(14, 20)), 0);
    QVERIFY(qAlpha(dotDash.pixel(20, 20)) > 200);
    QCOMPARE(qAlpha(dotDash.pixel(26, 20)), 0);
}

void tst_OverlayRenderer::testRenderOverlay_ThreeIndicatorCircles()
{
    OverlayRenderer renderer;
    NodeStyle style;
    style.color = Qt::blue;
    style.opacity = 1.0;
    style.hasArrow = false;
    NodeAnnotation node(QString(), {QPointF(20, 60), QPointF(220, 60)}, 0, style);
    for (int i = 0; i < 3; ++i) {
        node.addNote(DeviationNote());
    }

    // Radius 8, centers 20 px apart, 10 px off the line
    const QImage overlay = renderer.renderOverlay(QSize(240, 100), 1.0, {&node});

    for (int x : {100, 120, 140}) {
        QCOMPARE(qAlpha(overlay.pixel(x, 70)), 255);
        QCOMPARE(QColor(overlay.pixel(x, 70)), QColor(Qt::blue));
    }
    // Separate blobs, symmetric about the path midpoint
    QCOMPARE(qAlpha(overlay.pixel(110, 70)), 0);
    QCOMPARE(qAlpha(overlay.pixel(130, 70)), 0);
    QCOMPARE(qAlpha(overlay.pixel(89, 70)), 0);
    QCOMPARE(qAlpha(overlay.pixel(150, 70)), 0);
    // Only one side of the line
    QCOMPARE(qAlpha(overlay.pixel(120, 50)), 0);
}

void tst_OverlayRenderer::testRenderOverlay_LabelChipAtLongestSegment()
{
    OverlayRenderer renderer;
    NodeStyle style;
    style.hasArrow = false;
    const QString name = QStringLiteral("Line 1");
    NodeAnnotation named(name, {QPointF(20, 40), QPointF(60, 40), QPointF(220, 40)}, 0, style);
    NodeAnnotation unnamed(QString(), named.points(), 0, style);

    const QSizeF chip = labelChipSize(renderer, name, style.fontSize);
    const qreal halfHeight = chip.height() / 2.0;
    if (halfHeight < 5) {
        QSKIP("Label font has no usable glyph metrics");
    }
    // Midpoint of the longest segment (60,40)-(220,40)
    const QPoint insideChip(140, qFloor(40 - halfHeight + 1));
    const QPoint aboveChip(140, qFloor(40 - halfHeight - 2));

    const QImage withLabel = renderer.renderOverlay(QSize(240, 80), 1.0, {&named});
    const QImage withoutLabel = renderer.renderOverlay(QSize(240, 80), 1.0, {&unnamed});

    QCOMPARE(qAlpha(withoutLabel.pixel(insideChip)), 0);
    QVERIFY(qAlpha(withLabel.pixel(insideChip)) > 150);
    QCOMPARE(qAlpha(withLabel.pixel(aboveChip)), 0);
    // The shorter segment carries no chip
    QCOMPARE(qAlpha(withLabel.pixel(40, qFloor(40 - halfHeight + 1))), 0);
}

void tst_OverlayRenderer::testRenderOverlay_LabelChipRotatedOnVerticalSegment()
{
    OverlayRenderer renderer;
    NodeStyle style;
    style.hasArrow = false;
    const QString name = QStringLiteral("Transfer Line 101");
    NodeAnnotation node(name, {QPointF(60, 20), QPointF(60, 220)}, 0, style);

    const QSizeF chip = labelChipSize(renderer, name, style.fontSize);
    const qreal halfWidth = chip.width() / 2.0;
    const qreal halfHeight = chip.height() / 2.0;
    if (halfWidth < halfHeight + 4) {
        QSKIP("Label font has no usable glyph metrics");
    }

    const QImage overlay = renderer.renderOverlay(QSize(120, 240), 1.0, {&node});

    // Turned 90 degrees: the long side runs along the segment
    QVERIFY(qAlpha(overlay.pixel(qFloor(60 - halfHeight + 1), qFloor(120 - halfWidth + 2))) > 150);
    QCOMPARE(qAlpha(overlay.pixel(qFloor(60 - halfHeight - 2), 120)), 0);
    QCOMPARE(qAlpha(overlay.pixel(qFloor(60 - halfWidth + 1), 120)), 0);
}

void tst_OverlayRenderer::testComposite_SourceOver()
{
    QImage page(10, 10, QImage::Format_RGB32);
    page.fill(Qt::white);
    QImage overlay(10, 10, QImage::Format_ARGB32_Premultiplied);
    overlay.fill(Qt::transparent);
    overlay.setPixel(5, 5, qRgba(255, 0, 0, 255));

    const QImage result = OverlayRenderer::composite(page, overlay);

    QCOMPARE(result.size(), page.size());
    QCOMPARE(QColor(result.pixel(5, 5)), QColor(Qt::red));
    QCOMPARE(QColor(result.pixel(0, 0)), QColor(Qt::white));
}

void tst_OverlayRenderer::testComposite_ScalesOverlay()
{
    QImage page(10, 10, QImage::Format_RGB32);
    page.fill(Qt::white);
    QImage overlay(20, 20, QImage::Format_ARGB32_Premultiplied);
    overlay.fill(Qt::red);

    const QImage result = OverlayRenderer::composite(page, overlay);

    QCOMPARE(result.size(), QSize(10, 10));
    QCOMPARE(QColor(result.pixel(5, 5)), QColor(Qt::red));
}

void tst_OverlayRenderer::testComposite_NullPage()
{
    QImage overlay(4, 4, QImage::Format_ARGB32_Premultiplied);
    overlay.fill(Qt::red);
    QVERIFY(OverlayRenderer::composite(QImage(), overlay).isNull());

    QImage page(4, 4, QImage::Format_RGB32);
    page.fill(Qt::white);
    QCOMPARE(QColor(OverlayRenderer::composite(page, QImage()).pixel(1, 1)), QColor(Qt::white));
}

QTEST_MAIN(tst_OverlayRenderer)
#include "tst_OverlayRenderer.moc"

#include <QtTest>
#include "view/ViewTransform.h"

/**
 * @brief Tests for the document <-> viewport mapping.
 *
 * Covers fit-to-window scaling, anchored zoom, zoom bounds, pan and the
 * degenerate viewport/page guards.
 */
class tst_ViewTransform : public QObject
{
    Q_OBJECT

private slots:
    void init();

    // Defaults
    void testInitialState();

    // Mapping
    void testRoundTrip_data();
    void testRoundTrip();
    void testToScreen_UsesEffectiveScale();

    // Fit to window
    void testFitScale_LimitedByWidth();
    void testFitScale_LimitedByHeight();
    void testFitScale_DegenerateViewport();
    void testFitScale_UnknownPageSize();
    void testResetToFit_RestoresState();
    void testViewportResize_RefitsInFitMode();

    // Zoom
    void testZoomAt_AnchorInvariance_data();
    void testZoomAt_AnchorInvariance();
    void testZoomAt_ExitsFitModeContinuously();
    void testZoomAt_ClampedToBounds();
    void testZoomAt_IgnoresInvalidFactor();
    void testZoomInOut_KeyboardStep();

    // Pan
    void testPanBy_KeepsFitMode();
    void testViewportResize_KeepsPanOutsideFitMode();

    // Page change
    void testSetCurrentPage_ResetsPanAndPageSize();
    void testSetRenderScale_IgnoresInvalid();

private:
    ViewTransform m_view;
};

void tst_ViewTransform::init()
{
    m_view = ViewTransform();
}

void tst_ViewTransform::testInitialState()
{
    QCOMPARE(m_view.zoomLevel(), 1.0);
    QCOMPARE(m_view.panOffset(), QPointF(0, 0));
    QVERIFY(m_view.isFitToWindow());
    QCOMPARE(m_view.fitScale(), 1.0);
    QCOMPARE(m_view.effectiveScale(), 1.0);
    QVERIFY(!m_view.hasPageSize());
}

void tst_ViewTransform::testRoundTrip_data()
{
    QTest::addColumn<qreal>("zoomFactor");
    QTest::addColumn<QPointF>("pan");
    QTest::addColumn<QPointF>("point");

    QTest::newRow("fit") << 1.0 << QPointF(0, 0) << QPointF(12.5, 40.25);
    QTest::newRow("zoomed") << 1.7 << QPointF(0, 0) << QPointF(199, 1);
    QTest::newRow("zoomed and panned") << 0.6 << QPointF(-35, 80) << QPointF(-20, 300);
}

void tst_ViewTransform::testRoundTrip()
{
    QFETCH(qreal, zoomFactor);
    QFETCH(QPointF, pan);
    QFETCH(QPointF, point);

    m_view.setRenderScale(1.5);
    m_view.resetToFit(QSize(800, 600), QSizeF(200, 100));
    if (!qFuzzyCompare(zoomFactor, 1.0)) {
        m_view.zoomAt(QPointF(400, 300), zoomFactor);
    }
    m_view.panBy(pan.x(), pan.y());

    QCOMPARE(m_view.toDocument(m_view.toScreen(point)), point);
}

void tst_ViewTransform::testToScreen_UsesEffectiveScale()
{
    m_view.setRenderScale(2.0);
    m_view.resetToFit(QSize(800, 600), QSizeF(200, 100));
    m_view.panBy(10, 20);

    // Raster 400x200 fits 800x600 at 2.0 -> effective 4.0
    QCOMPARE(m_view.effectiveScale(), 4.0);
    QCOMPARE(m_view.toScreen(QPointF(5, 5)), QPointF(30, 40));
    QCOMPARE(m_view.toDocument(QPointF(30, 40)), QPointF(5, 5));
}

void tst_ViewTransform::testFitScale_LimitedByWidth()
{
    m_view.setRenderScale(2.0);
    m_view.resetToFit(QSize(800, 600), QSizeF(200, 100));

    QCOMPARE(m_view.fitScale(), 2.0);
    QCOMPARE(m_view.rasterScale(), 2.0);
    QCOMPARE(m_view.displaySize(), QSizeF(800, 400));
}

void tst_ViewTransform::testFitScale_LimitedByHeight()
{
    m_view.setRenderScale(1.0);
    m_view.resetToFit(QSize(1000, 300), QSizeF(100, 200));

    QCOMPARE(m_view.fitScale(), 1.5);
    QCOMPARE(m_view.displaySize(), QSizeF(150, 300));
}

void tst_ViewTransform::testFitScale_DegenerateViewport()
{
    m_view.resetToFit(QSize(1, 1), QSizeF(200, 100));
    QCOMPARE(m_view.fitScale(), 1.0);
    QVERIFY(!m_view.hasValidViewport());

    m_view.setViewportSize(QSize(0, 500));
    QCOMPARE(m_view.fitScale(), 1.0);
    QVERIFY(qIsFinite(m_view.effectiveScale()));
}

void tst_ViewTransform::testFitScale_UnknownPageSize()
{
    m_view.resetToFit(QSize(800, 600), QSizeF());
    QCOMPARE(m_view.fitScale(), 1.0);

    m_view.setPageSize(QSizeF(0, 100));
    QCOMPARE(m_view.fitScale(), 1.0);
    QCOMPARE(m_view.effectiveScale(), 1.0);
}

void tst_ViewTransform::testResetToFit_RestoresState()
{
    m_view.resetToFit(QSize(800, 600), QSizeF(200, 100));
    m_view.zoomAt(QPointF(100, 100), 2.0);
    m_view.panBy(50, -25);
    QVERIFY(!m_view.isFitToWindow());

    m_view.resetToFit();

    QVERIFY(m_view.isFitToWindow());
    QCOMPARE(m_view.zoomLevel(), 1.0);
    QCOMPARE(m_view.panOffset(), QPointF(0, 0));
    QCOMPARE(m_view.fitScale(), 4.0);
}

void tst_ViewTransform::testViewportResize_RefitsInFitMode()
{
    m_view.resetToFit(QSize(800, 600), QSizeF(200, 100));
    QCOMPARE(m_view.fitScale(), 4.0);

    m_view.setViewportSize(QSize(400, 600));
    QCOMPARE(m_view.fitScale(), 2.0);
}

void tst_ViewTransform::testZoomAt_AnchorInvariance_data()
{
    QTest::addColumn<QPointF>("anchor");
    QTest::addColumn<qreal>("factor");

    QTest::newRow("zoom in at origin") << QPointF(0, 0) << 1.2;
    QTest::newRow("zoom in off center") << QPointF(123, 77) << 1.25;
    QTest::newRow("zoom out") << QPointF(640, 20) << 0.5;
    QTest::newRow("clamped") << QPointF(300, 300) << 1000.0;
}

void tst_ViewTransform::testZoomAt_AnchorInvariance()
{
    QFETCH(QPointF, anchor);
    QFETCH(qreal, factor);

    m_view.setRenderScale(1.5);
    m_view.resetToFit(QSize(800, 600), QSizeF(200, 100));
    m_view.panBy(15, -40);

    const QPointF documentBefore = m_view.toDocument(anchor);
    m_view.zoomAt(anchor, factor);

    QCOMPARE(m_view.toScreen(documentBefore), anchor);
}

void tst_ViewTransform::testZoomAt_ExitsFitModeContinuously()
{
    m_view.setRenderScale(2.0);
    m_view.resetToFit(QSize(800, 600), QSizeF(200, 100));
    const qreal before = m_view.effectiveScale();

    m_view.zoomAt(QPointF(400, 300), 1.2);

    QVERIFY(!m_view.isFitToWindow());
    QCOMPARE(m_view.fitScale(), 1.0);
    QCOMPARE(m_view.zoomLevel(), 2.4);
    QCOMPARE(m_view.effectiveScale(), before * 1.2);
}

void tst_ViewTransform::testZoomAt_ClampedToBounds()
{
    m_view.zoomAt(QPointF(0, 0), 100.0);
    QCOMPARE(m_view.zoomLevel(), 5.0);

    m_view.zoomAt(QPointF(0, 0), 0.0001);
    QCOMPARE(m_view.zoomLevel(), 0.1);
}

void tst_ViewTransform::testZoomAt_IgnoresInvalidFactor()
{
    m_view.resetToFit(QSize(800, 600), QSizeF(200, 100));

    m_view.zoomAt(QPointF(10, 10), 0.0);
    m_view.zoomAt(QPointF(10, 10), -2.0);

    QVERIFY(m_view.isFitToWindow());
    QCOMPARE(m_view.zoomLevel(), 1.0);
}

void tst_ViewTransform::testZoomInOut_KeyboardStep()
{
    m_view.zoomIn(QPointF(0, 0));
    QCOMPARE(m_view.zoomLevel(), 1.2);

    m_view.zoomOut(QPointF(0, 0));
    QCOMPARE(m_view.zoomLevel(), 1.0);
}

void tst_ViewTransform::testPanBy_KeepsFitMode()
{
    m_view.resetToFit(QSize(800, 600), QSizeF(200, 100));
    m_view.panBy(30, 40);

    QVERIFY(m_view.isFitToWindow());
    QCOMPARE(m_view.panOffset(), QPointF(30, 40));
    QCOMPARE(m_view.fitScale(), 4.0);
}

void tst_ViewTransform::testViewportResize_KeepsPanOutsideFitMode()
{
    m_view.resetToFit(QSize(800, 600), QSizeF(200, 100));
    m_view.zoomAt(QPointF(0, 0), 2.0);
    m_view.panBy(30, 40);

    m_view.setViewportSize(QSize(1024, 768));

    QCOMPARE(m_view.panOffset(), QPointF(30, 40));
    QCOMPARE(m_view.fitScale(), 1.0);
}

void tst_ViewTransform::testSetCurrentPage_ResetsPanAndPageSize()
{
    m_view.resetToFit(QSize(800, 600), QSizeF(200, 100));
    m_view.zoomAt(QPointF(0, 0), 2.0);
    m_view.panBy(30, 40);
    const qreal zoom = m_view.zoomLevel();

    m_view.setCurrentPage(3);

    QCOMPARE(m_view.currentPage(), 3);
    QCOMPARE(m_view.panOffset(), QPointF(0, 0));
    QVERIFY(!m_view.hasPageSize());
    QCOMPARE(m_view.zoomLevel(), zoom);
}

void tst_ViewTransform::testSetRenderScale_IgnoresInvalid()
{
    m_view.setRenderScale(1.5);
    m_view.setRenderScale(0.0);
    m_view.setRenderScale(-1.0);

    QCOMPARE(m_view.renderScale(), 1.5);
}

QTEST_MAIN(tst_ViewTransform)
#include "tst_ViewTransform.moc"

#include <QtTest>
#include <QSignalSpy>
#include "annotations/AnnotationStore.h"

/**
 * @brief Tests for node ownership, id assignment, page queries and the
 * change notifications the edit session and canvas observe.
 */
class tst_AnnotationStore : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testAdd_AssignsUniqueIds();
    void testAdd_NullIgnored();
    void testCreate_DefaultNames();
    void testRemove();
    void testRemove_IdsNeverReused();
    void testListForPage_InsertionOrder();
    void testClear();
    void testClear_EmptyIsSilent();
    void testNotifyChanged();
    void testNoteCount();
    void testDuplicateNamesAllowed();

private:
    AnnotationStore* m_store;
};

void tst_AnnotationStore::init()
{
    m_store = new AnnotationStore();
}

void tst_AnnotationStore::cleanup()
{
    delete m_store;
    m_store = nullptr;
}

void tst_AnnotationStore::testAdd_AssignsUniqueIds()
{
    QSignalSpy addedSpy(m_store, &AnnotationStore::annotationAdded);

    NodeAnnotation* a = m_store->add(std::make_unique<NodeAnnotation>());
    NodeAnnotation* b = m_store->add(std::make_unique<NodeAnnotation>());

    QVERIFY(a && b);
    QVERIFY(a->id() != NodeAnnotation::kInvalidId);
    QVERIFY(a->id() != b->id());
    QCOMPARE(m_store->count(), 2);
    QCOMPARE(addedSpy.count(), 2);
    QCOMPARE(addedSpy.at(1).at(0).toInt(), b->id());
    QCOMPARE(m_store->find(a->id()), a);
}

void tst_AnnotationStore::testAdd_NullIgnored()
{
    QSignalSpy addedSpy(m_store, &AnnotationStore::annotationAdded);

    QVERIFY(!m_store->add(nullptr));
    QCOMPARE(m_store->count(), 0);
    QCOMPARE(addedSpy.count(), 0);
}

void tst_AnnotationStore::testCreate_DefaultNames()
{
    QCOMPARE(m_store->nextDefaultName(), QStringLiteral("Line 1"));

    NodeAnnotation* first = m_store->create(0);
    NodeAnnotation* second = m_store->create(1);

    QCOMPARE(first->name(), QStringLiteral("Line 1"));
    QCOMPARE(second->name(), QStringLiteral("Line 2"));
    QCOMPARE(second->page(), 1);
}

void tst_AnnotationStore::testRemove()
{
    NodeAnnotation* node = m_store->create(0);
    const int id = node->id();
    QSignalSpy removedSpy(m_store, &AnnotationStore::annotationRemoved);

    QVERIFY(m_store->remove(id));
    QVERIFY(!m_store->contains(id));
    QCOMPARE(removedSpy.count(), 1);
    QCOMPARE(removedSpy.at(0).at(0).toInt(), id);

    QVERIFY(!m_store->remove(id));
    QCOMPARE(removedSpy.count(), 1);
}

void tst_AnnotationStore::testRemove_IdsNeverReused()
{
    const int first = m_store->create(0)->id();
    m_store->remove(first);
    const int second = m_store->create(0)->id();

    QVERIFY(second != first);
}

void tst_AnnotationStore::testListForPage_InsertionOrder()
{
    NodeAnnotation* a = m_store->create(0);
    NodeAnnotation* b = m_store->create(1);
    NodeAnnotation* c = m_store->create(0);

    const QVector<NodeAnnotation*> page0 = m_store->listForPage(0);
    QCOMPARE(page0.size(), 2);
    QCOMPARE(page0.at(0), a);
    QCOMPARE(page0.at(1), c);

    const QVector<NodeAnnotation*> page1 = m_store->listForPage(1);
    QCOMPARE(page1.size(), 1);
    QCOMPARE(page1.at(0), b);
    QVERIFY(m_store->listForPage(7).isEmpty());
    QCOMPARE(m_store->all().size(), 3);
}

void tst_AnnotationStore::testClear()
{
    m_store->create(0);
    m_store->create(0);
    QSignalSpy clearedSpy(m_store, &AnnotationStore::cleared);

    m_store->clear();

    QVERIFY(m_store->isEmpty());
    QCOMPARE(clearedSpy.count(), 1);
}

void tst_AnnotationStore::testClear_EmptyIsSilent()
{
    QSignalSpy clearedSpy(m_store, &AnnotationStore::cleared);
    m_store->clear();
    QCOMPARE(clearedSpy.count(), 0);
}

void tst_AnnotationStore::testNotifyChanged()
{
    NodeAnnotation* node = m_store->create(0);
    QSignalSpy changedSpy(m_store, &AnnotationStore::annotationChanged);

    m_store->notifyChanged(node->id());
    m_store->notifyChanged(9999);

    QCOMPARE(changedSpy.count(), 1);
    QCOMPARE(changedSpy.at(0).at(0).toInt(), node->id());
}

void tst_AnnotationStore::testNoteCount()
{
    NodeAnnotation* a = m_store->create(0);
    NodeAnnotation* b = m_store->create(1);
    a->addNote(DeviationNote());
    b->addNote(DeviationNote());
    b->addNote(DeviationNote());

    QCOMPARE(m_store->noteCount(), 3);
}

void tst_AnnotationStore::testDuplicateNamesAllowed()
{
    NodeAnnotation* a = m_store->create(0);
    NodeAnnotation* b = m_store->create(0);
    b->setName(a->name());

    QCOMPARE(m_store->count(), 2);
    QCOMPARE(a->name(), b->name());
}

QTEST_MAIN(tst_AnnotationStore)
#include "tst_AnnotationStore.moc"

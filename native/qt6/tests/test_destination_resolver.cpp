#include <QtTest>
#include <QWidget>
#include "../src/destination_resolver.h"
#include "../src/dnd_attributes.h"

class TestDestinationResolver : public QObject {
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testDirectHitOnDocumentRow();
    void testDirectHitFallsBackToLocationRoot();
    void testScanPriority();
    void testScanAreaAndOrderTieBreak();
    void testNearestRowFallback();
    void testNothingBeyondThreshold();
    void testUnparseableIdIsSkipped();
    void testHiddenRowIsSkipped();

private:
    // Rows under the pointer are made transparent so childAt misses them and the
    // exhaustive scan decides.
    QWidget* addRow(QWidget* parent, const QRect& geometry, bool transparent = false);

    QWidget* m_root = nullptr;
};

void TestDestinationResolver::init()
{
    m_root = new QWidget();
    m_root->resize(400, 600);
}

void TestDestinationResolver::cleanup()
{
    delete m_root;
    m_root = nullptr;
}

QWidget* TestDestinationResolver::addRow(QWidget* parent, const QRect& geometry, bool transparent)
{
    auto* w = new QWidget(parent);
    w->setGeometry(geometry);
    if (transparent) w->setAttribute(Qt::WA_TransparentForMouseEvents);
    return w;
}

void TestDestinationResolver::testDirectHitOnDocumentRow()
{
    QWidget* location = addRow(m_root, QRect(0, 200, 400, 100));
    DndAttributes::markLocationRoot(location, 3);
    QWidget* folder = addRow(location, QRect(0, 0, 400, 20));
    DndAttributes::markFolderRow(folder, 3, "notes");
    QWidget* doc = addRow(location, QRect(0, 20, 400, 40));
    DndAttributes::markDocumentRow(doc, 3, "notes/a.md");
    m_root->show();

    DestinationResolver resolver(m_root);

    auto hit = resolver.resolve(QPointF(120, 240));
    QVERIFY(hit.has_value());
    QCOMPARE(hit->element.data(), doc);
    QVERIFY(hit->destination.targetType == DestinationData::TargetType::Document);
    QCOMPARE(hit->destination.relPath, QString("notes/a.md"));

    hit = resolver.resolve(QPointF(120, 210));
    QVERIFY(hit.has_value());
    QCOMPARE(hit->destination.folderPath, QString("notes"));
    QVERIFY(hit->destination.targetType == DestinationData::TargetType::Folder);
}

void TestDestinationResolver::testDirectHitFallsBackToLocationRoot()
{
    QWidget* location = addRow(m_root, QRect(0, 200, 400, 100));
    DndAttributes::markLocationRoot(location, 3);
    // A plain label-like child without properties inherits its ancestor's destination
    addRow(location, QRect(0, 60, 400, 20));
    m_root->show();

    const auto hit = DestinationResolver(m_root).resolve(QPointF(10, 270));
    QVERIFY(hit.has_value());
    QCOMPARE(hit->element.data(), location);
    QCOMPARE(hit->destination.locationId, 3);
    QVERIFY(hit->destination.targetType == DestinationData::TargetType::Location);
}

void TestDestinationResolver::testScanPriority()
{
    QWidget* location = addRow(m_root, QRect(0, 0, 400, 300), true);
    DndAttributes::markLocationRoot(location, 5);
    QWidget* folder = addRow(m_root, QRect(0, 0, 400, 100), true);
    DndAttributes::markFolderRow(folder, 5, "f");
    QWidget* doc = addRow(m_root, QRect(0, 50, 400, 20), true);
    DndAttributes::markDocumentRow(doc, 5, "f/x.md");
    m_root->show();

    DestinationResolver resolver(m_root);
    QCOMPARE(resolver.resolve(QPointF(10, 60))->element.data(), doc);
    QCOMPARE(resolver.resolve(QPointF(10, 10))->element.data(), folder);
    QCOMPARE(resolver.resolve(QPointF(10, 200))->element.data(), location);
}

void TestDestinationResolver::testScanAreaAndOrderTieBreak()
{
    QWidget* big = addRow(m_root, QRect(0, 0, 400, 300), true);
    DndAttributes::markLocationRoot(big, 7);
    QWidget* small = addRow(m_root, QRect(0, 0, 100, 100), true);
    DndAttributes::markLocationRoot(small, 8);
    QWidget* first = addRow(m_root, QRect(0, 400, 400, 50), true);
    DndAttributes::markLocationRoot(first, 9);
    QWidget* second = addRow(m_root, QRect(0, 400, 400, 50), true);
    DndAttributes::markLocationRoot(second, 10);
    m_root->show();

    DestinationResolver resolver(m_root);
    QCOMPARE(resolver.resolve(QPointF(10, 10))->destination.locationId, 8);
    QCOMPARE(resolver.resolve(QPointF(10, 420))->destination.locationId, 9);
}

void TestDestinationResolver::testNearestRowFallback()
{
    QWidget* doc = addRow(m_root, QRect(0, 220, 400, 40));
    DndAttributes::markDocumentRow(doc, 3, "notes/a.md");
    m_root->show();

    DestinationResolver resolver(m_root);
    auto hit = resolver.resolve(QPointF(120, 270));
    QVERIFY(hit.has_value());
    QCOMPARE(hit->destination.locationId, 3);
    QVERIFY(hit->destination.targetType == DestinationData::TargetType::Location);
    QVERIFY(hit->destination.relPath.isEmpty());

    hit = resolver.resolve(QPointF(120, 323));
    QVERIFY(hit.has_value());
    QCOMPARE(hit->destination.locationId, 3);

    // Above the row works the same way
    QVERIFY(resolver.resolve(QPointF(120, 170)).has_value());
}

void TestDestinationResolver::testNothingBeyondThreshold()
{
    QWidget* doc = addRow(m_root, QRect(0, 220, 400, 40));
    DndAttributes::markDocumentRow(doc, 3, "notes/a.md");
    QWidget* narrow = addRow(m_root, QRect(0, 0, 50, 20));
    DndAttributes::markDocumentRow(narrow, 3, "b.md");
    m_root->show();

    DestinationResolver resolver(m_root);
    QVERIFY(!resolver.resolve(QPointF(120, 324)).has_value());
    QVERIFY(!resolver.resolve(QPointF(120, 500)).has_value());
    // Level with the narrow row, but outside its horizontal span
    QVERIFY(!resolver.resolve(QPointF(120, 10)).has_value());
    QVERIFY(!DestinationResolver(nullptr).resolve(QPointF(0, 0)).has_value());
}

void TestDestinationResolver::testUnparseableIdIsSkipped()
{
    QWidget* location = addRow(m_root, QRect(0, 0, 400, 300));
    DndAttributes::markLocationRoot(location, 4);
    QWidget* bad = addRow(location, QRect(0, 0, 400, 40));
    bad->setProperty(DndAttributes::LocationId, "abc");
    bad->setProperty(DndAttributes::DocumentPath, "bad.md");
    bad->setProperty(DndAttributes::DropDocumentRow, true);
    m_root->show();

    const auto hit = DestinationResolver(m_root).resolve(QPointF(10, 10));
    QVERIFY(hit.has_value());
    QCOMPARE(hit->element.data(), location);
    QCOMPARE(hit->destination.locationId, 4);

    QWidget* numeric = addRow(m_root, QRect(0, 500, 400, 40));
    numeric->setProperty(DndAttributes::LocationId, "12");
    QCOMPARE(DestinationResolver::destinationFromWidget(numeric)->locationId, 12);
    QVERIFY(!DestinationResolver::destinationFromWidget(bad).has_value());
}

void TestDestinationResolver::testHiddenRowIsSkipped()
{
    QWidget* location = addRow(m_root, QRect(0, 0, 400, 300), true);
    DndAttributes::markLocationRoot(location, 6);
    QWidget* doc = addRow(m_root, QRect(0, 0, 400, 40), true);
    DndAttributes::markDocumentRow(doc, 6, "gone.md");
    m_root->show();
    doc->hide();

    const auto hit = DestinationResolver(m_root).resolve(QPointF(10, 10));
    QVERIFY(hit.has_value());
    QCOMPARE(hit->element.data(), location);
}

QTEST_MAIN(TestDestinationResolver)
#include "test_destination_resolver.moc"

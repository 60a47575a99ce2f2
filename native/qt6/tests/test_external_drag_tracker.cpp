#include <QtTest>
#include <QDragEnterEvent>
#include <QDragLeaveEvent>
#include <QDropEvent>
#include <QMimeData>
#include <QSignalSpy>
#include <QUrl>
#include <QWidget>

#include "../src/dnd_attributes.h"
#include "../src/drag_coordinator.h"
#include "../src/external_drag_tracker.h"

class TestExternalDragTracker : public QObject {
    Q_OBJECT
private slots:
    void init();
    void cleanup();

    void testTargetChangesAreDeduplicated();
    void testSelectedLocationFallback();
    void testDropReportsLastTarget();
    void testDropWithoutTargetIsIgnored();
    void testQtDragEventsOfFiles();
    void testInternalDragsAreLeftAlone();

private:
    static ExternalDragEvent over(qreal x, qreal y);

    QWidget* m_window = nullptr;
    DragCoordinator* m_dnd = nullptr;
    ExternalDragTracker* m_tracker = nullptr;
};

ExternalDragEvent TestExternalDragTracker::over(qreal x, qreal y)
{
    ExternalDragEvent ev;
    ev.type = ExternalDragEvent::Type::Over;
    ev.position = QPointF(x, y);
    return ev;
}

void TestExternalDragTracker::init()
{
    m_window = new QWidget();
    m_window->resize(400, 600);

    auto* location = new QWidget(m_window);
    location->setGeometry(0, 0, 400, 200);
    DndAttributes::markLocationRoot(location, 1);

    auto* folder = new QWidget(location);
    folder->setGeometry(0, 0, 400, 30);
    DndAttributes::markFolderRow(folder, 1, "drafts");

    auto* doc = new QWidget(location);
    doc->setGeometry(0, 30, 400, 30);
    DndAttributes::markDocumentRow(doc, 1, "drafts/x.md");

    m_window->show();
    QVERIFY(QTest::qWaitForWindowExposed(m_window));

    m_dnd = new DragCoordinator(m_window);
    m_dnd->normalizer().setDevicePixelRatioOverride(1.0);
    m_tracker = new ExternalDragTracker(m_dnd);
}

void TestExternalDragTracker::cleanup()
{
    delete m_tracker;
    m_tracker = nullptr;
    delete m_dnd;
    m_dnd = nullptr;
    delete m_window;
    m_window = nullptr;
}

void TestExternalDragTracker::testTargetChangesAreDeduplicated()
{
    QSignalSpy changed(m_tracker, &ExternalDragTracker::targetChanged);

    m_tracker->handleEvent(over(10, 10));
    m_tracker->handleEvent(over(12, 12));
    QCOMPARE(changed.count(), 1);
    QCOMPARE(changed.at(0).at(0).toInt(), 1);
    QCOMPARE(changed.at(0).at(1).toString(), QString("drafts"));

    // A document row resolves to its parent folder: same key, no signal
    m_tracker->handleEvent(over(10, 40));
    QCOMPARE(changed.count(), 1);

    m_tracker->handleEvent(over(10, 150));
    QCOMPARE(changed.count(), 2);
    QCOMPARE(changed.at(1).at(1).toString(), QString());
    QCOMPARE(m_tracker->currentTarget()->key(), QString("1:"));

    m_tracker->handleEvent(ExternalDragEvent{});
    QCOMPARE(changed.count(), 3);
    QCOMPARE(changed.at(2).at(0).toInt(), -1);
    QVERIFY(!m_tracker->currentTarget().has_value());
}

void TestExternalDragTracker::testSelectedLocationFallback()
{
    QSignalSpy changed(m_tracker, &ExternalDragTracker::targetChanged);

    // Far below every row: nothing resolves
    m_tracker->handleEvent(over(10, 500));
    QCOMPARE(changed.count(), 0);
    QVERIFY(!m_tracker->currentTarget().has_value());

    m_tracker->setSelectedLocationId(7);
    m_tracker->handleEvent(over(10, 500));
    QCOMPARE(changed.count(), 1);
    QCOMPARE(changed.at(0).at(0).toInt(), 7);
}

void TestExternalDragTracker::testDropReportsLastTarget()
{
    QSignalSpy dropped(m_tracker, &ExternalDragTracker::dropped);
    QSignalSpy changed(m_tracker, &ExternalDragTracker::targetChanged);

    m_tracker->handleEvent(over(10, 10));
    ExternalDragEvent drop;
    drop.type = ExternalDragEvent::Type::Drop;
    drop.paths = QStringList{ "/tmp/a.md", "/tmp/b.md" };
    drop.position = QPointF(10, 500);
    m_tracker->handleEvent(drop);

    QCOMPARE(dropped.count(), 1);
    QCOMPARE(dropped.first().at(0).toInt(), 1);
    QCOMPARE(dropped.first().at(1).toString(), QString("drafts"));
    QCOMPARE(dropped.first().at(2).toStringList(), drop.paths);
    QCOMPARE(changed.last().at(0).toInt(), -1);
    QVERIFY(!m_tracker->currentTarget().has_value());
}

void TestExternalDragTracker::testDropWithoutTargetIsIgnored()
{
    QSignalSpy dropped(m_tracker, &ExternalDragTracker::dropped);
    QSignalSpy ignored(m_tracker, &ExternalDragTracker::dropIgnored);

    ExternalDragEvent drop;
    drop.type = ExternalDragEvent::Type::Drop;
    drop.paths = QStringList{ "/tmp/a.md" };
    m_tracker->handleEvent(drop);
    QCOMPARE(dropped.count(), 0);
    QCOMPARE(ignored.count(), 1);

    m_tracker->setSelectedLocationId(3);
    m_tracker->handleEvent(drop);
    QCOMPARE(dropped.count(), 1);
    QCOMPARE(dropped.first().at(0).toInt(), 3);
}

void TestExternalDragTracker::testQtDragEventsOfFiles()
{
    m_tracker->attachTo(m_window);
    QSignalSpy changed(m_tracker, &ExternalDragTracker::targetChanged);
    QSignalSpy dropped(m_tracker, &ExternalDragTracker::dropped);

    QMimeData mime;
    mime.setUrls({ QUrl::fromLocalFile("/tmp/notes/today.md") });

    // Rows do not accept drops here, so the enter climbs to the window
    QWidget* folder = m_window->childAt(10, 10);
    QVERIFY(folder);
    QDragEnterEvent enter(QPoint(10, 10), Qt::CopyAction, &mime, Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(folder, &enter);
    QVERIFY(enter.isAccepted());
    QCOMPARE(changed.count(), 1);
    QCOMPARE(changed.first().at(1).toString(), QString("drafts"));

    QDropEvent drop(QPointF(10, 10), Qt::CopyAction, &mime, Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(m_window, &drop);
    QVERIFY(drop.isAccepted());
    QCOMPARE(dropped.count(), 1);
    QCOMPARE(dropped.first().at(2).toStringList(), QStringList{ "/tmp/notes/today.md" });

    // Leaving the window clears the highlight once the event loop runs
    QDragEnterEvent again(QPoint(10, 150), Qt::CopyAction, &mime, Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(m_window, &again);
    const int before = changed.count();
    QDragLeaveEvent leave;
    QCoreApplication::sendEvent(m_window, &leave);
    QTRY_COMPARE(changed.count(), before + 1);
    QCOMPARE(changed.last().at(0).toInt(), -1);
}

void TestExternalDragTracker::testInternalDragsAreLeftAlone()
{
    m_tracker->attachTo(m_window);
    QSignalSpy changed(m_tracker, &ExternalDragTracker::targetChanged);

    QMimeData mime;
    mime.setUrls({ QUrl::fromLocalFile("/tmp/a.md") });
    mime.setData(QString::fromLatin1(DndKeys::InternalMime), QByteArrayLiteral("1"));

    QDragEnterEvent enter(QPoint(10, 10), Qt::MoveAction, &mime, Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(m_window, &enter);
    QVERIFY(!enter.isAccepted());
    QCOMPARE(changed.count(), 0);

    m_tracker->detach();
    QMimeData files;
    files.setUrls({ QUrl::fromLocalFile("/tmp/b.md") });
    QDragEnterEvent detached(QPoint(10, 10), Qt::CopyAction, &files, Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(m_window, &detached);
    QCOMPARE(changed.count(), 0);
}

QTEST_MAIN(TestExternalDragTracker)
#include "test_external_drag_tracker.moc"

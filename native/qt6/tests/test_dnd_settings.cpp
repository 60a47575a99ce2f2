#include <QtTest>
#include <QRegularExpression>
#include <QSettings>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QWidget>
#include "../src/dnd_settings.h"
#include "../src/drag_coordinator.h"

class TestDndSettings : public QObject {
    Q_OBJECT
private slots:
    void testDefaults();
    void testRoundTrip();
    void testUnknownValuesFallBack();
    void testApplyToCoordinator();
};

void TestDndSettings::testDefaults()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings store(dir.filePath("dnd.ini"), QSettings::IniFormat);
    DndSettings settings(&store);

    QVERIFY(settings.pointerNormalization() == PointerNormalizer::Mode::Heuristic);
    QCOMPARE(settings.devicePixelRatioOverride(), 0.0);
    QVERIFY(!settings.verboseLogging());
}

void TestDndSettings::testRoundTrip()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("dnd.ini");

    {
        QSettings store(path, QSettings::IniFormat);
        DndSettings settings(&store);
        QSignalSpy changed(&settings, &DndSettings::settingsChanged);

        settings.setPointerNormalization(PointerNormalizer::Mode::Scaled);
        settings.setDevicePixelRatioOverride(2.0);
        settings.setVerboseLogging(true);
        settings.sync();
        QCOMPARE(changed.count(), 3);
    }

    QSettings reopened(path, QSettings::IniFormat);
    QCOMPARE(reopened.value("Dnd/PointerNormalization").toString(), QString("scaled"));

    DndSettings settings(&reopened);
    QVERIFY(settings.pointerNormalization() == PointerNormalizer::Mode::Scaled);
    QCOMPARE(settings.devicePixelRatioOverride(), 2.0);
    QVERIFY(settings.verboseLogging());
}

void TestDndSettings::testUnknownValuesFallBack()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings store(dir.filePath("dnd.ini"), QSettings::IniFormat);
    store.setValue("Dnd/PointerNormalization", "sideways");
    store.setValue("Dnd/DevicePixelRatioOverride", -3.0);
    DndSettings settings(&store);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Unknown pointer normalization"));
    QVERIFY(settings.pointerNormalization() == PointerNormalizer::Mode::Heuristic);
    QCOMPARE(settings.devicePixelRatioOverride(), 0.0);

    settings.setDevicePixelRatioOverride(-1.0);
    QCOMPARE(store.value("Dnd/DevicePixelRatioOverride").toDouble(), 0.0);
}

void TestDndSettings::testApplyToCoordinator()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QSettings store(dir.filePath("dnd.ini"), QSettings::IniFormat);
    DndSettings settings(&store);
    settings.setPointerNormalization(PointerNormalizer::Mode::Direct);
    settings.setDevicePixelRatioOverride(1.5);
    settings.setVerboseLogging(true);

    QWidget viewport;
    viewport.resize(300, 200);
    DragCoordinator dnd(&viewport);
    dnd.applySettings(settings);

    QVERIFY(dnd.normalizer().mode() == PointerNormalizer::Mode::Direct);
    QCOMPARE(dnd.normalizer().devicePixelRatio(), 1.5);
    QVERIFY(dnd.verboseLogging());
    QCOMPARE(dnd.normalizePointerCoordinates(450, 300), QPointF(300, 200));
}

QTEST_MAIN(TestDndSettings)
#include "test_dnd_settings.moc"

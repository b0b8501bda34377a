#include <QtTest/QtTest>
#include "../src/simulator/SyntheticEvent.h"

#include <linux/input-event-codes.h>
#include <X11/XF86keysym.h>

class TestSyntheticEvent : public QObject
{
    Q_OBJECT
private slots:
    /**
     * @brief 特殊键按下：data1 = (键码 << 16) | 0x0a00，data2 = -1
     */
    void test_specialKeyDownLayout();

    void test_specialKeyUpLayout();

    void test_decodesSpecialKey();

    void test_rejectsForeignEvents();

    /**
     * @brief 默认行为表：除 F3/F4 外都是特殊键族
     */
    void test_defaultTableFamilies_data();

    void test_defaultTableFamilies();

    /**
     * @brief 每个键的默认事件都是按下紧跟抬起
     */
    void test_eventsAreDownThenUp();

    void test_exposeUsesVirtualKey();

    void test_invalidKeysProduceNothing();
};

void TestSyntheticEvent::test_specialKeyDownLayout()
{
    const SyntheticEvent down = SyntheticEventEncoder::specialKeyEvent(KEY_VOLUMEUP, true);
    QCOMPARE(down.family, EventFamily::SpecialKey);
    QCOMPARE(down.subtype, 8);
    QCOMPARE(down.data1, (KEY_VOLUMEUP << 16) | 0x0a00);
    QCOMPARE(down.data2, -1);
    QVERIFY(down.keyDown);
}

void TestSyntheticEvent::test_specialKeyUpLayout()
{
    const SyntheticEvent up = SyntheticEventEncoder::specialKeyEvent(KEY_MUTE, false);
    QCOMPARE(up.data1, (KEY_MUTE << 16) | 0x0b00);
    QCOMPARE(up.data2, -1);
    QVERIFY(!up.keyDown);
}

void TestSyntheticEvent::test_decodesSpecialKey()
{
    int code = 0;
    bool keyDown = false;
    QVERIFY(SyntheticEventEncoder::decodeSpecialKey(
        SyntheticEventEncoder::specialKeyEvent(KEY_BRIGHTNESSDOWN, true), &code, &keyDown));
    QCOMPARE(code, KEY_BRIGHTNESSDOWN);
    QVERIFY(keyDown);

    QVERIFY(SyntheticEventEncoder::decodeSpecialKey(
        SyntheticEventEncoder::specialKeyEvent(KEY_PLAYPAUSE, false), &code, &keyDown));
    QCOMPARE(code, KEY_PLAYPAUSE);
    QVERIFY(!keyDown);
}

void TestSyntheticEvent::test_rejectsForeignEvents()
{
    SyntheticEvent bogus = SyntheticEventEncoder::specialKeyEvent(KEY_MUTE, true);
    bogus.subtype = 7;
    QVERIFY(!SyntheticEventEncoder::decodeSpecialKey(bogus, nullptr, nullptr));

    bogus = SyntheticEventEncoder::specialKeyEvent(KEY_MUTE, true);
    bogus.data1 = (KEY_MUTE << 16) | 0x0c00;
    QVERIFY(!SyntheticEventEncoder::decodeSpecialKey(bogus, nullptr, nullptr));

    QVERIFY(!SyntheticEventEncoder::decodeSpecialKey(
        SyntheticEventEncoder::virtualKeyEvent(XF86XK_LaunchA, true), nullptr, nullptr));
}

void TestSyntheticEvent::test_defaultTableFamilies_data()
{
    QTest::addColumn<int>("key");
    QTest::addColumn<int>("family");
    QTest::addColumn<uint>("code");

    const int special = static_cast<int>(EventFamily::SpecialKey);
    const int virt = static_cast<int>(EventFamily::VirtualKey);
    QTest::newRow("F1") << 1 << special << uint(KEY_BRIGHTNESSDOWN);
    QTest::newRow("F2") << 2 << special << uint(KEY_BRIGHTNESSUP);
    QTest::newRow("F3") << 3 << virt << uint(XF86XK_LaunchA);
    QTest::newRow("F4") << 4 << virt << uint(XF86XK_LaunchB);
    QTest::newRow("F5") << 5 << special << uint(KEY_KBDILLUMDOWN);
    QTest::newRow("F6") << 6 << special << uint(KEY_KBDILLUMUP);
    QTest::newRow("F7") << 7 << special << uint(KEY_PREVIOUSSONG);
    QTest::newRow("F8") << 8 << special << uint(KEY_PLAYPAUSE);
    QTest::newRow("F9") << 9 << special << uint(KEY_NEXTSONG);
    QTest::newRow("F10") << 10 << special << uint(KEY_MUTE);
    QTest::newRow("F11") << 11 << special << uint(KEY_VOLUMEDOWN);
    QTest::newRow("F12") << 12 << special << uint(KEY_VOLUMEUP);
}

void TestSyntheticEvent::test_defaultTableFamilies()
{
    QFETCH(int, key);
    QFETCH(int, family);
    QFETCH(uint, code);

    const SystemKeyBinding* binding = SyntheticEventEncoder::bindingFor(key);
    QVERIFY(binding);
    QCOMPARE(binding->logicalKey, key);
    QCOMPARE(static_cast<int>(binding->family), family);
    QCOMPARE(uint(binding->code), code);
}

void TestSyntheticEvent::test_eventsAreDownThenUp()
{
    for ( int key = 1; key <= 12; ++key ) {
        const QVector<SyntheticEvent> events = SyntheticEventEncoder::eventsForKey(key);
        QCOMPARE(events.size(), 2);
        QVERIFY(events.at(0).keyDown);
        QVERIFY(!events.at(1).keyDown);
        QCOMPARE(events.at(0).family, events.at(1).family);
    }
}

void TestSyntheticEvent::test_exposeUsesVirtualKey()
{
    const QVector<SyntheticEvent> events = SyntheticEventEncoder::eventsForKey(3);
    QCOMPARE(events.size(), 2);
    QCOMPARE(events.at(0), SyntheticEventEncoder::virtualKeyEvent(XF86XK_LaunchA, true));
    QCOMPARE(events.at(1), SyntheticEventEncoder::virtualKeyEvent(XF86XK_LaunchA, false));
}

void TestSyntheticEvent::test_invalidKeysProduceNothing()
{
    QVERIFY(SyntheticEventEncoder::eventsForKey(0).isEmpty());
    QVERIFY(SyntheticEventEncoder::eventsForKey(13).isEmpty());
    QVERIFY(SyntheticEventEncoder::bindingFor(-3) == nullptr);
}

QTEST_APPLESS_MAIN(TestSyntheticEvent)
#include "test_syntheticevent.moc"

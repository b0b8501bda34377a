#include <QtTest/QtTest>
#include <QSignalSpy>
#include "FakeBackends.h"
#include "../src/monitor/KeyPressMonitor.h"

#include <linux/input-event-codes.h>

class TestKeyPressMonitor : public QObject
{
    Q_OBJECT

private:
    std::shared_ptr<FakeTapState> m_tapState;
    FakeEventTap* m_tap = nullptr;
    std::unique_ptr<KeyPressMonitor> m_monitor;

    // 在测试线程上直接投递一个原始事件，然后让排队的修改生效
    void deliver(RawKeyEventType type, int rawCode);

private slots:
    void init();

    void cleanup();

    /**
     * @brief Stopped -> Installing -> Active，重复 start 幂等
     */
    void test_startTransitionsToActive();

    /**
     * @brief 停止顺序：停用钩子，再注销投递
     */
    void test_stopDisablesBeforeUnregister();

    /**
     * @brief 安装失败回到 Stopped，只警告一次
     */
    void test_installFailureWarnsOnce();

    void test_downAndUpUpdatePressedSet();

    /**
     * @brief 自动重复不重复发出 keyPressed，多余的抬起是空操作
     */
    void test_repeatAndSpuriousUpAreNoops();

    /**
     * @brief 未映射的原始键码 9999 不改变集合，只计数
     */
    void test_unmappedRawCodeIsDropped();

    /**
     * @brief 投递线程上的事件按顺序排到监视器线程
     */
    void test_deliveryThreadEventsAreMarshaled();

    void test_stopClearsPressedSet();

    /**
     * @brief stop() 返回后再注入延迟的在途回调：不崩溃，集合不变
     */
    void test_lateCallbackAfterStopIsNoop();

    /**
     * @brief 在投递线程持续回调时 stop()：排队中的旧事件不再修改集合
     */
    void test_stopDuringFloodIsSafe();

    /**
     * @brief 重新启动后旧会话排队的事件被丢弃，新事件正常生效
     */
    void test_restartIgnoresPreviousSession();

    void test_destroyingActiveMonitorIsSafe();
};

void TestKeyPressMonitor::deliver(RawKeyEventType type, int rawCode)
{
    m_tapState->invokeStale(type, rawCode);
    QCoreApplication::processEvents();
}

void TestKeyPressMonitor::init()
{
    m_tapState = std::make_shared<FakeTapState>();
    auto tap = std::make_unique<FakeEventTap>(m_tapState);
    m_tap = tap.get();
    m_monitor = std::make_unique<KeyPressMonitor>(std::move(tap));
}

void TestKeyPressMonitor::cleanup()
{
    m_monitor.reset();
    m_tap = nullptr;
    // 让推迟释放的桥上下文被删除
    QCoreApplication::processEvents();
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
}

void TestKeyPressMonitor::test_startTransitionsToActive()
{
    QSignalSpy stateSpy(m_monitor.get(), &KeyPressMonitor::stateChanged);

    QVERIFY(m_monitor->start());
    QCOMPARE(m_monitor->state(), KeyPressMonitor::State::Active);
    QCOMPARE(stateSpy.count(), 2);
    QCOMPARE(stateSpy.at(0).at(0).value<KeyPressMonitor::State>(), KeyPressMonitor::State::Installing);
    QCOMPARE(stateSpy.at(1).at(0).value<KeyPressMonitor::State>(), KeyPressMonitor::State::Active);

    QVERIFY(m_monitor->start());
    QCOMPARE(m_tapState->installCount, 1);
}

void TestKeyPressMonitor::test_stopDisablesBeforeUnregister()
{
    QVERIFY(m_monitor->start());
    m_monitor->stop();

    QCOMPARE(m_monitor->state(), KeyPressMonitor::State::Stopped);
    QCOMPARE(m_tapState->calls, QStringList() << "install" << "disable" << "unregister");

    // 幂等
    m_monitor->stop();
    QCOMPARE(m_tapState->calls.size(), 3);
}

void TestKeyPressMonitor::test_installFailureWarnsOnce()
{
    m_tapState->failInstall = true;
    QSignalSpy deniedSpy(m_monitor.get(), &KeyPressMonitor::permissionDenied);

    QTest::ignoreMessage(QtWarningMsg, QRegularExpression("Key monitoring disabled"));
    QVERIFY(!m_monitor->start());
    QCOMPARE(m_monitor->state(), KeyPressMonitor::State::Stopped);
    QCOMPARE(deniedSpy.count(), 1);
    QCOMPARE(m_monitor->lastError(), QString("Permission denied"));

    QVERIFY(!m_monitor->start());
    QCOMPARE(deniedSpy.count(), 1);
    QCOMPARE(m_tapState->installCount, 2);
}

void TestKeyPressMonitor::test_downAndUpUpdatePressedSet()
{
    QVERIFY(m_monitor->start());
    QSignalSpy pressedSpy(m_monitor.get(), &KeyPressMonitor::keyPressed);
    QSignalSpy releasedSpy(m_monitor.get(), &KeyPressMonitor::keyReleased);

    deliver(RawKeyEventType::KeyDown, KEY_F5);
    QVERIFY(m_monitor->isPressed(5));
    QCOMPARE(m_monitor->pressedKeys(), QSet<int>({5}));

    deliver(RawKeyEventType::KeyDown, KEY_F12);
    QCOMPARE(m_monitor->pressedKeys(), QSet<int>({5, 12}));

    deliver(RawKeyEventType::KeyUp, KEY_F5);
    QCOMPARE(m_monitor->pressedKeys(), QSet<int>({12}));

    QCOMPARE(pressedSpy.count(), 2);
    QCOMPARE(releasedSpy.count(), 1);
    QCOMPARE(releasedSpy.at(0).at(0).toInt(), 5);
}

void TestKeyPressMonitor::test_repeatAndSpuriousUpAreNoops()
{
    QVERIFY(m_monitor->start());
    QSignalSpy changedSpy(m_monitor.get(), &KeyPressMonitor::pressedKeysChanged);
    QSignalSpy pressedSpy(m_monitor.get(), &KeyPressMonitor::keyPressed);

    deliver(RawKeyEventType::KeyDown, KEY_F1);
    deliver(RawKeyEventType::KeyDown, KEY_F1);
    deliver(RawKeyEventType::KeyDown, KEY_F1);
    QCOMPARE(pressedSpy.count(), 1);

    deliver(RawKeyEventType::KeyUp, KEY_F1);
    deliver(RawKeyEventType::KeyUp, KEY_F1);
    QVERIFY(!m_monitor->isPressed(1));
    QCOMPARE(changedSpy.count(), 2);
}

void TestKeyPressMonitor::test_unmappedRawCodeIsDropped()
{
    QVERIFY(m_monitor->start());
    QSignalSpy changedSpy(m_monitor.get(), &KeyPressMonitor::pressedKeysChanged);

    deliver(RawKeyEventType::KeyDown, 9999);
    deliver(RawKeyEventType::KeyDown, KEY_A);

    QVERIFY(m_monitor->pressedKeys().isEmpty());
    QCOMPARE(changedSpy.count(), 0);
    QCOMPARE(m_monitor->droppedEventCount(), quint64(2));
}

void TestKeyPressMonitor::test_deliveryThreadEventsAreMarshaled()
{
    QVERIFY(m_monitor->start());
    QSignalSpy pressedSpy(m_monitor.get(), &KeyPressMonitor::keyPressed);

    m_tap->deliverOnThread({
        { RawKeyEventType::KeyDown, KEY_F7 },
        { RawKeyEventType::KeyUp, KEY_F7 },
        { RawKeyEventType::KeyDown, KEY_F7 },
        { RawKeyEventType::KeyDown, KEY_F8 },
    });
    m_tap->joinDelivery();

    // 还没有处理事件循环，集合未被投递线程直接修改
    QVERIFY(m_monitor->pressedKeys().isEmpty());

    QTRY_COMPARE(m_monitor->pressedKeys(), QSet<int>({7, 8}));
    QCOMPARE(pressedSpy.count(), 3);
}

void TestKeyPressMonitor::test_stopClearsPressedSet()
{
    QVERIFY(m_monitor->start());
    deliver(RawKeyEventType::KeyDown, KEY_F3);
    QVERIFY(m_monitor->isPressed(3));

    QSignalSpy changedSpy(m_monitor.get(), &KeyPressMonitor::pressedKeysChanged);
    m_monitor->stop();
    QVERIFY(m_monitor->pressedKeys().isEmpty());
    QCOMPARE(changedSpy.count(), 1);
}

void TestKeyPressMonitor::test_lateCallbackAfterStopIsNoop()
{
    QVERIFY(m_monitor->start());
    m_monitor->stop();

    m_tapState->invokeStale(RawKeyEventType::KeyDown, KEY_F2);
    QCoreApplication::processEvents();

    QVERIFY(m_monitor->pressedKeys().isEmpty());
    QCOMPARE(m_monitor->droppedEventCount(), quint64(0));
}

void TestKeyPressMonitor::test_stopDuringFloodIsSafe()
{
    QVERIFY(m_monitor->start());
    m_tap->floodOnThread(RawKeyEventType::KeyDown, KEY_F9);

    QTRY_VERIFY(m_tapState->deliveredCount.load() > 100);
    m_monitor->stop();

    // 停用之后投递线程已被注销，旧令牌只会得到“所有者已消失”
    m_tapState->invokeStale(RawKeyEventType::KeyDown, KEY_F9);
    QCoreApplication::processEvents();

    QVERIFY(m_monitor->pressedKeys().isEmpty());
    QCOMPARE(m_monitor->state(), KeyPressMonitor::State::Stopped);
}

void TestKeyPressMonitor::test_restartIgnoresPreviousSession()
{
    QVERIFY(m_monitor->start());
    m_tapState->invokeStale(RawKeyEventType::KeyDown, KEY_F4);
    m_monitor->stop();
    QVERIFY(m_monitor->start());

    QCoreApplication::processEvents();
    QVERIFY(!m_monitor->isPressed(4));

    deliver(RawKeyEventType::KeyDown, KEY_F4);
    QVERIFY(m_monitor->isPressed(4));
}

void TestKeyPressMonitor::test_destroyingActiveMonitorIsSafe()
{
    QVERIFY(m_monitor->start());
    m_tapState->invokeStale(RawKeyEventType::KeyDown, KEY_F6);
    m_monitor.reset();
    QCoreApplication::processEvents();
    QCOMPARE(m_tapState->calls, QStringList() << "install" << "disable" << "unregister");
}

QTEST_GUILESS_MAIN(TestKeyPressMonitor)
#include "test_keypressmonitor.moc"

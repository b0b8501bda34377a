#include <QtTest/QtTest>
#include "../src/monitor/CallbackBridge.h"

#include <atomic>
#include <thread>

namespace {

struct Owner {
    int hits = 0;
};

} // namespace

class TestCallbackBridge : public QObject
{
    Q_OBJECT
private slots:
    void test_resolvesLiveOwner();

    /**
     * @brief 令牌只能取一次
     */
    void test_tokenIsIssuedOnce();

    void test_nullTokenResolvesToGone();

    void test_detachReportsOwnerGone();

    /**
     * @brief release 之后同一调度周期内令牌仍可安全解析为“已消失”
     */
    void test_releaseDefersContextByOneTick();

    /**
     * @brief 投递线程持续解析令牌时断开所有者：断开之后不会再看到所有者
     */
    void test_detachRacesWithResolvingThread();

    /**
     * @brief 推迟释放的上下文挂在应用对象下，事件循环不再运行时随应用析构
     */
    void test_releasedContextIsOwnedByApplication();
};

void TestCallbackBridge::test_resolvesLiveOwner()
{
    Owner owner;
    CallbackBridge<Owner> bridge(&owner);
    void* token = bridge.token();
    QVERIFY(token);

    auto guard = CallbackBridge<Owner>::resolve(token);
    QVERIFY(guard);
    QCOMPARE(guard.owner(), &owner);
}

void TestCallbackBridge::test_tokenIsIssuedOnce()
{
    Owner owner;
    CallbackBridge<Owner> bridge(&owner);
    QVERIFY(bridge.token() != nullptr);
    QTest::ignoreMessage(QtWarningMsg, "Callback token requested more than once");
    QVERIFY(bridge.token() == nullptr);
}

void TestCallbackBridge::test_nullTokenResolvesToGone()
{
    auto guard = CallbackBridge<Owner>::resolve(nullptr);
    QVERIFY(!guard);
    QVERIFY(guard.owner() == nullptr);
}

void TestCallbackBridge::test_detachReportsOwnerGone()
{
    Owner owner;
    CallbackBridge<Owner> bridge(&owner);
    void* token = bridge.token();
    bridge.detach();

    auto guard = CallbackBridge<Owner>::resolve(token);
    QVERIFY(!guard);
}

void TestCallbackBridge::test_releaseDefersContextByOneTick()
{
    Owner owner;
    auto bridge = std::make_unique<CallbackBridge<Owner>>(&owner);
    void* token = bridge->token();

    bridge->release();
    QVERIFY(bridge->isReleased());
    {
        auto guard = CallbackBridge<Owner>::resolve(token);
        QVERIFY(!guard);
    }

    // 幂等
    bridge->release();
    bridge.reset();
    QCoreApplication::processEvents();
}

void TestCallbackBridge::test_detachRacesWithResolvingThread()
{
    Owner owner;
    CallbackBridge<Owner> bridge(&owner);
    void* token = bridge.token();

    std::atomic<bool> running{true};
    std::atomic<bool> detached{false};
    std::atomic<int> seenAfterDetach{0};

    std::thread worker([&]() {
        while ( running.load() ) {
            auto guard = CallbackBridge<Owner>::resolve(token);
            if ( guard ) {
                // 持有 Guard 期间 detach 无法完成
                if ( detached.load() ) {
                    ++seenAfterDetach;
                }
                ++guard.owner()->hits;
            }
        }
    });

    QTest::qWait(10);
    bridge.detach();
    detached.store(true);
    QTest::qWait(10);
    running.store(false);
    worker.join();

    QCOMPARE(seenAfterDetach.load(), 0);
    bridge.release();
    QCoreApplication::processEvents();
}

void TestCallbackBridge::test_releasedContextIsOwnedByApplication()
{
    QCoreApplication* app = QCoreApplication::instance();
    const int before = app->findChildren<QObject*>("CallbackBridgeContext", Qt::FindDirectChildrenOnly).size();

    Owner owner;
    CallbackBridge<Owner> bridge(&owner);
    QVERIFY(bridge.token() != nullptr);
    bridge.release();

    const QList<QObject*> pending = app->findChildren<QObject*>("CallbackBridgeContext", Qt::FindDirectChildrenOnly);
    QCOMPARE(pending.size(), before + 1);

    // 事件循环运行一次后被删除
    QTRY_COMPARE(app->findChildren<QObject*>("CallbackBridgeContext", Qt::FindDirectChildrenOnly).size(), 0);
}

QTEST_GUILESS_MAIN(TestCallbackBridge)
#include "test_callbackbridge.moc"

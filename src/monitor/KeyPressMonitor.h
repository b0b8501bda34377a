#ifndef KEYPRESSMONITOR_H
#define KEYPRESSMONITOR_H

#include "CallbackBridge.h"
#include "IEventTap.h"

#include <QtCore/QObject>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <atomic>
#include <memory>

/**
 * @brief 功能键按下状态监视器
 *
 * 通过只监听的全局钩子观察 F1-F12 的按下/抬起，维护当前按下的逻辑键集合。
 * 钩子回调在投递线程上运行，集合的修改统一排队到本对象所在线程执行。
 *
 * 状态机：Stopped -> Installing -> Active -> Stopping -> Stopped。
 * 安装失败（通常是没有读取输入设备的权限）时回到 Stopped 并只警告一次。
 */
class KeyPressMonitor : public QObject {
    Q_OBJECT

public:
    enum class State {
        Stopped,
        Installing,
        Active,
        Stopping
    };
    Q_ENUM(State)

    /**
     * @param tap 平台钩子，由监视器独占
     */
    explicit KeyPressMonitor(std::unique_ptr<IEventTap> tap, QObject* parent = nullptr);
    ~KeyPressMonitor() override;

    /**
     * @brief 安装钩子
     * @return 已处于 Active 或安装成功返回 true
     */
    bool start();

    /**
     * @brief 卸载钩子（幂等）
     *
     * 顺序固定：断开回调桥 -> 停用钩子 -> 注销投递 -> 推迟一个周期释放桥上下文。
     * 正在投递线程中执行的回调只会看到“所有者已消失”。
     */
    void stop();

    State state() const { return m_state; }
    bool isActive() const { return m_state == State::Active; }

    QSet<int> pressedKeys() const { return m_pressedKeys; }
    bool isPressed(int logicalKey) const { return m_pressedKeys.contains(logicalKey); }

    /// 被丢弃的未映射原始事件数量（只计数，不记录内容）
    quint64 droppedEventCount() const { return m_droppedEvents.load(); }

    QString lastError() const { return m_lastError; }

signals:
    void pressedKeysChanged(const QSet<int>& keys);
    void keyPressed(int logicalKey);
    void keyReleased(int logicalKey);
    void stateChanged(KeyPressMonitor::State state);
    void permissionDenied(const QString& reason);

private:
    using Bridge = CallbackBridge<KeyPressMonitor>;

    // 钩子回调入口，任意线程
    static void tapCallback(void* userInfo, RawKeyEventType type, int rawCode);

    // 投递线程上调用
    void handleRawEvent(RawKeyEventType type, int rawCode);

    // 本对象线程上调用
    void applyKeyEvent(RawKeyEventType type, int logicalKey, quint64 generation);

    void setState(State state);

    std::unique_ptr<IEventTap> m_tap;
    std::unique_ptr<Bridge> m_bridge;

    State m_state;
    QSet<int> m_pressedKeys;

    // 每次 start() 递增，旧会话排队中的事件据此丢弃
    std::atomic<quint64> m_generation;
    std::atomic<quint64> m_droppedEvents;

    bool m_permissionWarned;
    QString m_lastError;
};

#endif // KEYPRESSMONITOR_H

#ifndef KEYSIMULATOR_H
#define KEYSIMULATOR_H

#include "RateLimiter.h"
#include "../common/action/KeyAction.h"

#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <atomic>
#include <memory>

class ISyntheticEventSink;
class ISystemLauncher;

/**
 * @brief 功能键动作分发器
 *
 * 给定逻辑键和解析好的动作，先校验键范围、再经过限流器，
 * 放行后恰好执行一种效果：发出默认系统事件、启动应用、打开 URL 或执行命令。
 * 越界的键、被限流的触发以及外部效果的失败都静默丢弃，不向调用方报告。
 *
 * 界面点击和物理按键两条触发路径共用同一个实例，因此共用同一个限流器。
 */
class KeySimulator : public QObject {
    Q_OBJECT

public:
    /**
     * @brief 使用当前平台的事件输出和启动器
     * @param uinputDevice uinput 设备节点，为空时使用 /dev/uinput
     */
    explicit KeySimulator(const QString& uinputDevice = QString(), QObject* parent = nullptr);

    KeySimulator(std::unique_ptr<ISyntheticEventSink> sink,
                 std::unique_ptr<ISystemLauncher> launcher,
                 QObject* parent = nullptr);
    ~KeySimulator() override;

    // 初始化和清理
    bool initialize();
    void cleanup();
    bool isInitialized() const;

    /**
     * @brief 触发一次按键动作
     * @param logicalKey 逻辑键 1-12
     * @param action 该键当前生效的动作
     */
    void simulateKeyPress(int logicalKey, const KeyAction& action);

    /// 同上，使用调用方给出的单调时钟时间戳
    void simulateKeyPress(int logicalKey, const KeyAction& action, qint64 nowMs);

    // 限流配置
    void setRateLimitInterval(int intervalMs);
    int rateLimitInterval() const;

    /// 因限流被丢弃的触发次数
    quint64 rateLimitedCount() const { return m_rateLimited.load(); }

    // 错误处理
    QString lastError() const;

signals:
    void actionDispatched(int logicalKey, KeyAction::Type type);

private:
    void dispatch(int logicalKey, const KeyAction& action);
    bool postSystemEvents(int logicalKey);
    void setLastError(const QString& error);

    std::unique_ptr<ISyntheticEventSink> m_sink;
    std::unique_ptr<ISystemLauncher> m_launcher;

    RateLimiter m_rateLimiter;
    std::atomic<quint64> m_rateLimited;

    bool m_initialized;
    QString m_lastError;

    // 线程安全
    mutable QMutex m_mutex;
};

#endif // KEYSIMULATOR_H

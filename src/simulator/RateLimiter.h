#ifndef RATELIMITER_H
#define RATELIMITER_H

#include "../common/core/config/Constants.h"

#include <QtCore/QElapsedTimer>
#include <QtCore/QMutex>
#include <atomic>

/**
 * @brief 按逻辑键限制动作触发频率
 *
 * 每个逻辑键记录上次触发的单调时钟时间戳，距离上次触发不足间隔时拒绝。
 * 表的大小固定为 12 项；每项有自己的锁，不同按键之间互不阻塞。
 * 拒绝没有副作用，也不向调用方报错。
 */
class RateLimiter {
public:
    explicit RateLimiter(int intervalMs = FnKeyConstants::Simulator::DEFAULT_RATE_LIMIT_INTERVAL_MS);

    /**
     * @brief 判断按键此刻是否允许触发，允许时记录时间戳
     * @param logicalKey 逻辑键 1-12，越界返回 false
     * @param nowMs 单调时钟毫秒数
     */
    bool shouldFire(int logicalKey, qint64 nowMs);

    /// 使用内部单调时钟
    bool shouldFire(int logicalKey);

    void setInterval(int intervalMs);
    int interval() const { return m_intervalMs.load(); }

    /// 内部单调时钟当前值（毫秒）
    qint64 now() const { return m_clock.elapsed(); }

    /// 清空所有记录
    void reset();

private:
    struct Entry {
        QMutex mutex;
        bool hasFired = false;
        qint64 lastFiredMs = 0;
    };

    Entry m_entries[FnKeyConstants::Keys::LOGICAL_KEY_COUNT];
    std::atomic<int> m_intervalMs;
    QElapsedTimer m_clock;
};

#endif // RATELIMITER_H

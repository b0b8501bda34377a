#include "RateLimiter.h"
#include "../common/core/logging/LoggingCategories.h"

#include <QtCore/QMutexLocker>

RateLimiter::RateLimiter(int intervalMs)
    : m_intervalMs(FnKeyConstants::clampRateLimitInterval(intervalMs)) {
    m_clock.start();
}

bool RateLimiter::shouldFire(int logicalKey, qint64 nowMs) {
    if ( !FnKeyConstants::isValidLogicalKey(logicalKey) ) {
        return false;
    }

    Entry& entry = m_entries[logicalKey - FnKeyConstants::Keys::MIN_LOGICAL_KEY];
    QMutexLocker locker(&entry.mutex);

    if ( entry.hasFired && nowMs - entry.lastFiredMs < m_intervalMs.load() ) {
        return false;
    }

    entry.hasFired = true;
    entry.lastFiredMs = nowMs;
    return true;
}

bool RateLimiter::shouldFire(int logicalKey) {
    return shouldFire(logicalKey, m_clock.elapsed());
}

void RateLimiter::setInterval(int intervalMs) {
    const int clamped = FnKeyConstants::clampRateLimitInterval(intervalMs);
    if ( clamped != intervalMs ) {
        qCWarning(lcRateLimit) << "Rate limit interval" << intervalMs << "ms clamped to" << clamped << "ms";
    }
    m_intervalMs.store(clamped);
}

void RateLimiter::reset() {
    for ( Entry& entry : m_entries ) {
        QMutexLocker locker(&entry.mutex);
        entry.hasFired = false;
        entry.lastFiredMs = 0;
    }
}

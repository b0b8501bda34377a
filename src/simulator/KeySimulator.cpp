#include "KeySimulator.h"
#include "DesktopLauncher.h"
#include "ISyntheticEventSink.h"
#include "SyntheticEvent.h"
#include "../common/core/config/Constants.h"
#include "../common/core/logging/LoggingCategories.h"

// 平台特定的包含
#ifdef Q_OS_LINUX
#include "SyntheticEventSinkLinux.h"
#endif

#include <QtCore/QMutexLocker>

KeySimulator::KeySimulator(const QString& uinputDevice, QObject* parent)
    : QObject(parent)
    , m_launcher(std::make_unique<DesktopLauncher>())
    , m_rateLimited(0)
    , m_initialized(false) {
    // 根据平台创建事件输出
#ifdef Q_OS_LINUX
    m_sink = std::make_unique<SyntheticEventSinkLinux>(uinputDevice);
#else
    Q_UNUSED(uinputDevice)
    qCWarning(lcDispatch) << "KeySimulator: Unsupported platform, system events disabled";
#endif

    initialize();
}

KeySimulator::KeySimulator(std::unique_ptr<ISyntheticEventSink> sink,
                           std::unique_ptr<ISystemLauncher> launcher,
                           QObject* parent)
    : QObject(parent)
    , m_sink(std::move(sink))
    , m_launcher(std::move(launcher))
    , m_rateLimited(0)
    , m_initialized(false) {
    initialize();
}

KeySimulator::~KeySimulator() {
    cleanup();
}

bool KeySimulator::initialize() {
    QMutexLocker locker(&m_mutex);

    if ( m_initialized ) {
        return true;
    }

    if ( !m_sink ) {
        setLastError("No synthetic event sink for this platform");
        return false;
    }

    m_initialized = m_sink->initialize();
    if ( m_initialized ) {
        qCDebug(lcDispatch) << "KeySimulator: Initialized successfully";
    } else {
        setLastError("Failed to initialize synthetic event sink: " + m_sink->lastError());
        qCWarning(lcDispatch) << "KeySimulator: System key events unavailable:" << m_lastError;
    }
    return m_initialized;
}

void KeySimulator::cleanup() {
    QMutexLocker locker(&m_mutex);

    if ( m_sink ) {
        m_sink->cleanup();
    }
    m_initialized = false;
}

bool KeySimulator::isInitialized() const {
    QMutexLocker locker(&m_mutex);
    return m_initialized;
}

void KeySimulator::simulateKeyPress(int logicalKey, const KeyAction& action) {
    simulateKeyPress(logicalKey, action, m_rateLimiter.now());
}

void KeySimulator::simulateKeyPress(int logicalKey, const KeyAction& action, qint64 nowMs) {
    if ( !FnKeyConstants::isValidLogicalKey(logicalKey) ) {
        return;
    }

    if ( !m_rateLimiter.shouldFire(logicalKey, nowMs) ) {
        m_rateLimited.fetch_add(1, std::memory_order_relaxed);
        qCDebug(lcRateLimit) << "Key" << logicalKey << "rate limited";
        return;
    }

    dispatch(logicalKey, action);
    emit actionDispatched(logicalKey, action.type());
}

void KeySimulator::setRateLimitInterval(int intervalMs) {
    m_rateLimiter.setInterval(intervalMs);
}

int KeySimulator::rateLimitInterval() const {
    return m_rateLimiter.interval();
}

QString KeySimulator::lastError() const {
    QMutexLocker locker(&m_mutex);
    return m_lastError;
}

void KeySimulator::dispatch(int logicalKey, const KeyAction& action) {
    QMutexLocker locker(&m_mutex);

    switch ( action.type() ) {
        case KeyAction::Type::System:
            postSystemEvents(logicalKey);
            break;
        case KeyAction::Type::OpenApplication:
            if ( m_launcher ) {
                m_launcher->openApplication(action.target());
            }
            break;
        case KeyAction::Type::OpenUrl:
            if ( m_launcher ) {
                m_launcher->openUrl(action.url());
            }
            break;
        case KeyAction::Type::RunShellCommand:
            if ( m_launcher ) {
                m_launcher->runShellCommand(action.target());
            }
            break;
    }

    qCDebug(lcDispatch) << "Key" << logicalKey << "dispatched" << action.typeName();
}

bool KeySimulator::postSystemEvents(int logicalKey) {
    if ( !m_initialized || !m_sink ) {
        qCDebug(lcDispatch) << "System event for key" << logicalKey << "skipped, sink unavailable";
        return false;
    }

    bool ok = true;
    const QVector<SyntheticEvent> events = SyntheticEventEncoder::eventsForKey(logicalKey);
    for ( const SyntheticEvent& event : events ) {
        if ( !m_sink->post(event) ) {
            ok = false;
            setLastError(m_sink->lastError());
        }
    }

    if ( !ok ) {
        qCDebug(lcDispatch) << "System event for key" << logicalKey << "not delivered:" << m_lastError;
    }
    return ok;
}

void KeySimulator::setLastError(const QString& error) {
    m_lastError = error;
}

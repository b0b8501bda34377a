#include "KeyPressMonitor.h"
#include "../common/keys/KeyCodeMap.h"
#include "../common/core/logging/LoggingCategories.h"

#include <QtCore/QMetaObject>

KeyPressMonitor::KeyPressMonitor(std::unique_ptr<IEventTap> tap, QObject* parent)
    : QObject(parent)
    , m_tap(std::move(tap))
    , m_state(State::Stopped)
    , m_generation(0)
    , m_droppedEvents(0)
    , m_permissionWarned(false) {
    qRegisterMetaType<KeyPressMonitor::State>("KeyPressMonitor::State");
}

KeyPressMonitor::~KeyPressMonitor() {
    stop();
}

bool KeyPressMonitor::start() {
    if ( m_state == State::Active ) {
        return true;
    }
    if ( m_state != State::Stopped ) {
        qCWarning(lcEventTap) << "start() ignored in state" << m_state;
        return false;
    }

    if ( !m_tap ) {
        m_lastError = "No event tap available on this platform";
        qCWarning(lcEventTap) << m_lastError;
        return false;
    }

    setState(State::Installing);
    ++m_generation;

    m_bridge = std::make_unique<Bridge>(this);
    void* token = m_bridge->token();

    if ( !m_tap->install(&KeyPressMonitor::tapCallback, token) ) {
        m_lastError = m_tap->lastError();
        m_bridge->release();
        m_bridge.reset();
        setState(State::Stopped);

        if ( !m_permissionWarned ) {
            m_permissionWarned = true;
            qCWarning(lcEventTap) << "Key monitoring disabled:" << m_lastError;
            emit permissionDenied(m_lastError);
        }
        return false;
    }

    m_lastError.clear();
    setState(State::Active);
    qCInfo(lcEventTap) << "Key monitoring active";
    return true;
}

void KeyPressMonitor::stop() {
    if ( m_state == State::Stopped || m_state == State::Stopping ) {
        return;
    }

    setState(State::Stopping);

    // 先断开所有者，已经在途的回调持有 Guard 时这里会等它结束
    if ( m_bridge ) {
        m_bridge->detach();
    }

    m_tap->disable();
    m_tap->unregister();

    if ( m_bridge ) {
        m_bridge->release();
        m_bridge.reset();
    }

    // 使排队中的旧事件失效
    ++m_generation;

    if ( !m_pressedKeys.isEmpty() ) {
        m_pressedKeys.clear();
        emit pressedKeysChanged(m_pressedKeys);
    }

    setState(State::Stopped);
    qCInfo(lcEventTap) << "Key monitoring stopped";
}

void KeyPressMonitor::tapCallback(void* userInfo, RawKeyEventType type, int rawCode) {
    auto guard = Bridge::resolve(userInfo);
    if ( !guard ) {
        return;
    }
    guard.owner()->handleRawEvent(type, rawCode);
}

void KeyPressMonitor::handleRawEvent(RawKeyEventType type, int rawCode) {
    const int logicalKey = KeyCodeMap::toLogicalKey(rawCode);
    if ( logicalKey == KeyCodeMap::INVALID_KEY ) {
        m_droppedEvents.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    const quint64 generation = m_generation.load();
    QMetaObject::invokeMethod(this, [this, type, logicalKey, generation]() {
        applyKeyEvent(type, logicalKey, generation);
    }, Qt::QueuedConnection);
}

void KeyPressMonitor::applyKeyEvent(RawKeyEventType type, int logicalKey, quint64 generation) {
    if ( m_state != State::Active || generation != m_generation.load() ) {
        return;
    }

    if ( type == RawKeyEventType::KeyDown ) {
        if ( m_pressedKeys.contains(logicalKey) ) {
            return;
        }
        m_pressedKeys.insert(logicalKey);
        emit pressedKeysChanged(m_pressedKeys);
        emit keyPressed(logicalKey);
    } else {
        if ( !m_pressedKeys.remove(logicalKey) ) {
            return;
        }
        emit pressedKeysChanged(m_pressedKeys);
        emit keyReleased(logicalKey);
    }
}

void KeyPressMonitor::setState(State state) {
    if ( m_state == state ) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

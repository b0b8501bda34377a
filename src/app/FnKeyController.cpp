#include "FnKeyController.h"
#include "../common/action/ProfileResolver.h"
#include "../common/core/logging/LoggingCategories.h"
#include "../monitor/KeyPressMonitor.h"
#include "../simulator/KeySimulator.h"

FnKeyController::FnKeyController(std::unique_ptr<KeyPressMonitor> monitor,
                                 std::unique_ptr<KeySimulator> simulator,
                                 const ProfileResolver* resolver,
                                 QObject* parent)
    : QObject(parent)
    , m_monitor(std::move(monitor))
    , m_simulator(std::move(simulator))
    , m_resolver(resolver)
    , m_dispatchPhysicalKeys(true) {
    if ( m_monitor ) {
        connect(m_monitor.get(), &KeyPressMonitor::pressedKeysChanged,
                this, &FnKeyController::pressedKeysChanged);
        connect(m_monitor.get(), &KeyPressMonitor::keyPressed,
                this, &FnKeyController::onKeyPressed);
    }
}

FnKeyController::~FnKeyController() {
    stopMonitoring();
}

bool FnKeyController::startMonitoring() {
    if ( !m_monitor ) {
        return false;
    }
    return m_monitor->start();
}

void FnKeyController::stopMonitoring() {
    if ( m_monitor ) {
        m_monitor->stop();
    }
}

QSet<int> FnKeyController::pressedKeys() const {
    return m_monitor ? m_monitor->pressedKeys() : QSet<int>();
}

void FnKeyController::fire(int logicalKey) {
    if ( !m_simulator ) {
        return;
    }

    const KeyAction action = m_resolver ? m_resolver->resolve(logicalKey) : KeyAction::system();
    m_simulator->simulateKeyPress(logicalKey, action);
}

void FnKeyController::onKeyPressed(int logicalKey) {
    if ( !m_dispatchPhysicalKeys ) {
        return;
    }
    qCDebug(lcApp) << "Physical key" << logicalKey << "pressed";
    fire(logicalKey);
}

#include "SyntheticEventSinkLinux.h"

#ifdef Q_OS_LINUX

#include "../common/core/config/Constants.h"
#include "../common/core/logging/LoggingCategories.h"

#include <QtCore/QFile>
#include <QtCore/QStringList>
#include <QtCore/QThread>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/uinput.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <X11/Xlib.h>
#include <X11/extensions/XTest.h>

SyntheticEventSinkLinux::SyntheticEventSinkLinux(const QString& uinputDevice)
    : m_uinputDevice(uinputDevice.isEmpty() ? QString(FnKeyConstants::Simulator::DEFAULT_UINPUT_DEVICE) : uinputDevice)
    , m_uinputFd(-1)
    , m_display(nullptr)
    , m_initialized(false) {
}

SyntheticEventSinkLinux::~SyntheticEventSinkLinux() {
    cleanup();
}

bool SyntheticEventSinkLinux::initialize() {
    if ( m_initialized ) {
        return true;
    }

    QStringList errors;

    if ( !openUinputDevice() ) {
        errors << m_lastError;
    }

    m_display = XOpenDisplay(nullptr);
    if ( !m_display ) {
        errors << "Failed to open X11 display";
        qCWarning(lcSimulatorLinux) << "Failed to open X11 display, virtual keys unavailable";
    } else {
        int eventBase = 0;
        int errorBase = 0;
        int major = 0;
        int minor = 0;
        if ( !XTestQueryExtension(m_display, &eventBase, &errorBase, &major, &minor) ) {
            errors << "XTest extension not available";
            qCWarning(lcSimulatorLinux) << "XTest extension not available, virtual keys unavailable";
            XCloseDisplay(m_display);
            m_display = nullptr;
        }
    }

    m_initialized = hasSpecialKeyBackend() || hasVirtualKeyBackend();
    if ( !errors.isEmpty() ) {
        setLastError(errors.join("; "));
    }

    if ( m_initialized ) {
        qCInfo(lcSimulatorLinux) << "Synthetic event sink ready, special keys:" << hasSpecialKeyBackend()
                                 << "virtual keys:" << hasVirtualKeyBackend();
    } else {
        qCWarning(lcSimulatorLinux) << "Synthetic event sink unavailable:" << m_lastError;
    }
    return m_initialized;
}

void SyntheticEventSinkLinux::cleanup() {
    closeUinputDevice();

    if ( m_display ) {
        XCloseDisplay(m_display);
        m_display = nullptr;
    }
    m_initialized = false;
}

bool SyntheticEventSinkLinux::post(const SyntheticEvent& event) {
    if ( !m_initialized ) {
        setLastError("Synthetic event sink not initialized");
        return false;
    }

    switch ( event.family ) {
        case EventFamily::SpecialKey: {
            int code = 0;
            bool keyDown = false;
            if ( !SyntheticEventEncoder::decodeSpecialKey(event, &code, &keyDown) ) {
                setLastError("Malformed special key event");
                return false;
            }
            return emitSpecialKey(code, keyDown);
        }
        case EventFamily::VirtualKey:
            return emitVirtualKey(event.virtualKey, event.keyDown);
    }
    return false;
}

bool SyntheticEventSinkLinux::openUinputDevice() {
    const QByteArray nativePath = QFile::encodeName(m_uinputDevice);
    m_uinputFd = open(nativePath.constData(), O_WRONLY | O_NONBLOCK | O_CLOEXEC);
    if ( m_uinputFd < 0 ) {
        setLastError(QString("Failed to open %1: %2").arg(m_uinputDevice, QString::fromLocal8Bit(strerror(errno))));
        qCWarning(lcSimulatorLinux) << m_lastError << "- special keys unavailable";
        return false;
    }

    // 只声明默认行为表里的特殊键
    bool ok = ioctl(m_uinputFd, UI_SET_EVBIT, EV_KEY) >= 0
           && ioctl(m_uinputFd, UI_SET_EVBIT, EV_SYN) >= 0;
    const QVector<SystemKeyBinding> bindings = SyntheticEventEncoder::bindings();
    for ( const SystemKeyBinding& binding : bindings ) {
        if ( ok && binding.family == EventFamily::SpecialKey ) {
            ok = ioctl(m_uinputFd, UI_SET_KEYBIT, static_cast<int>(binding.code)) >= 0;
        }
    }

    if ( ok ) {
        uinput_setup setup;
        std::memset(&setup, 0, sizeof(setup));
        setup.id.bustype = BUS_VIRTUAL;
        setup.id.vendor = 0x1209;
        setup.id.product = 0xf12a;
        setup.id.version = FnKeyConstants::Version::MAJOR;
        std::strncpy(setup.name, FnKeyConstants::Simulator::UINPUT_DEVICE_NAME, UINPUT_MAX_NAME_SIZE - 1);

        ok = ioctl(m_uinputFd, UI_DEV_SETUP, &setup) >= 0
          && ioctl(m_uinputFd, UI_DEV_CREATE) >= 0;
    }

    if ( !ok ) {
        setLastError(QString("Failed to create uinput device: %1").arg(QString::fromLocal8Bit(strerror(errno))));
        qCWarning(lcSimulatorLinux) << m_lastError;
        close(m_uinputFd);
        m_uinputFd = -1;
        return false;
    }

    // 等 udev 和 libinput 打开新节点，否则最先写入的事件没有读取方
    QThread::msleep(FnKeyConstants::Simulator::UINPUT_SETTLE_MS);

    qCDebug(lcSimulatorLinux) << "uinput device created on" << m_uinputDevice;
    return true;
}

void SyntheticEventSinkLinux::closeUinputDevice() {
    if ( m_uinputFd < 0 ) {
        return;
    }
    if ( ioctl(m_uinputFd, UI_DEV_DESTROY) < 0 ) {
        qCDebug(lcSimulatorLinux) << "UI_DEV_DESTROY failed:" << strerror(errno);
    }
    close(m_uinputFd);
    m_uinputFd = -1;
}

bool SyntheticEventSinkLinux::emitSpecialKey(int code, bool keyDown) {
    if ( m_uinputFd < 0 ) {
        setLastError("Special key backend unavailable");
        return false;
    }

    if ( !writeInputEvent(EV_KEY, code, keyDown ? 1 : 0) || !writeInputEvent(EV_SYN, SYN_REPORT, 0) ) {
        setLastError(QString("uinput write failed: %1").arg(QString::fromLocal8Bit(strerror(errno))));
        qCDebug(lcSimulatorLinux) << m_lastError;
        return false;
    }

    qCDebug(lcSimulatorLinux) << "Special key" << code << (keyDown ? "down" : "up");
    return true;
}

bool SyntheticEventSinkLinux::emitVirtualKey(quint32 keysym, bool keyDown) {
    if ( !m_display ) {
        setLastError("Virtual key backend unavailable");
        return false;
    }

    KeyCode keycode = XKeysymToKeycode(m_display, static_cast<KeySym>(keysym));
    if ( keycode == 0 ) {
        setLastError(QString("No keycode for keysym 0x%1").arg(keysym, 0, 16));
        qCWarning(lcSimulatorLinux) << "Failed to convert KeySym to KeyCode:" << Qt::hex << keysym;
        return false;
    }

    bool result = XTestFakeKeyEvent(m_display, keycode, keyDown ? True : False, CurrentTime) == True;
    XFlush(m_display);

    qCDebug(lcSimulatorLinux) << "Virtual key" << Qt::hex << keysym << (keyDown ? "down" : "up");
    return result;
}

bool SyntheticEventSinkLinux::writeInputEvent(int type, int code, int value) {
    input_event event;
    std::memset(&event, 0, sizeof(event));
    event.type = static_cast<__u16>(type);
    event.code = static_cast<__u16>(code);
    event.value = value;

    return write(m_uinputFd, &event, sizeof(event)) == static_cast<ssize_t>(sizeof(event));
}

void SyntheticEventSinkLinux::setLastError(const QString& error) {
    m_lastError = error;
}

#endif // Q_OS_LINUX

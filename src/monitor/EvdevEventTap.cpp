#include "EvdevEventTap.h"

#ifdef Q_OS_LINUX

#include "../common/core/config/Constants.h"
#include "../common/core/logging/LoggingCategories.h"
#include "../common/keys/KeyCodeMap.h"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QStringList>
#include <QtCore/QVarLengthArray>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <linux/input.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {

constexpr int kBitsPerLong = sizeof(unsigned long) * 8;
constexpr int kKeyBitsLength = (KEY_MAX + kBitsPerLong) / kBitsPerLong;
constexpr int kReadBatch = 64;
constexpr int kWatchBufferSize = 4096;

bool testBit(const unsigned long* bits, int bit) {
    return (bits[bit / kBitsPerLong] >> (bit % kBitsPerLong)) & 1UL;
}

} // namespace

EvdevEventTap::EvdevEventTap(const QString& devicePath, const QString& inputDir)
    : m_devicePath(devicePath)
    , m_inputDir(inputDir.isEmpty() ? QString(FnKeyConstants::Monitor::INPUT_DEVICE_DIR) : inputDir)
    , m_wakeFd(-1)
    , m_inotifyFd(-1)
    , m_callback(nullptr)
    , m_userInfo(nullptr)
    , m_enabled(false) {
}

EvdevEventTap::~EvdevEventTap() {
    disable();
    unregister();
}

bool EvdevEventTap::install(Callback callback, void* userInfo) {
    if ( m_thread ) {
        return true;
    }

    if ( !callback ) {
        m_lastError = "No callback supplied";
        return false;
    }

    bool permissionDenied = false;
    if ( !openDevices(&permissionDenied) ) {
        const QString target = m_devicePath.isEmpty() ? m_inputDir : m_devicePath;
        if ( permissionDenied ) {
            m_lastError = QString("Permission denied reading %1; add the user to the 'input' group").arg(target);
        } else if ( !QFileInfo::exists(target) ) {
            m_lastError = QString("Input device %1 does not exist").arg(target);
        } else {
            m_lastError = QString("%1 is not a keyboard with function keys").arg(target);
        }
        closeDevices();
        return false;
    }

    m_wakeFd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if ( m_wakeFd < 0 ) {
        m_lastError = QString("eventfd failed: %1").arg(QString::fromLocal8Bit(strerror(errno)));
        closeDevices();
        return false;
    }

    if ( !startWatching() ) {
        qCWarning(lcEventTap) << "Keyboards attached later will not be detected";
    }

    m_callback = callback;
    m_userInfo = userInfo;
    m_enabled.store(true);

    QStringList paths;
    for ( const Device& device : m_devices ) {
        paths << device.path;
    }

    m_thread.reset(QThread::create([this]() { deliveryLoop(); }));
    m_thread->setObjectName("EvdevEventTap");
    m_thread->start();

    if ( paths.isEmpty() ) {
        qCInfo(lcEventTap) << "No keyboard with function keys yet, waiting on" << watchDirectory();
    } else {
        qCInfo(lcEventTap) << "Listening on" << paths;
    }
    return true;
}

void EvdevEventTap::disable() {
    if ( !m_enabled.exchange(false) ) {
        return;
    }

    if ( m_wakeFd >= 0 ) {
        const uint64_t one = 1;
        if ( write(m_wakeFd, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one)) ) {
            // poll 超时后投递线程仍会看到标志并退出
            qCDebug(lcEventTap) << "Wake-up write failed:" << strerror(errno);
        }
    }
}

void EvdevEventTap::unregister() {
    disable();

    if ( m_thread ) {
        m_thread->wait();
        m_thread.reset();
    }

    closeDevices();

    if ( m_inotifyFd >= 0 ) {
        close(m_inotifyFd);
        m_inotifyFd = -1;
    }

    if ( m_wakeFd >= 0 ) {
        close(m_wakeFd);
        m_wakeFd = -1;
    }

    m_callback = nullptr;
    m_userInfo = nullptr;
}

bool EvdevEventTap::openDevices(bool* permissionDenied) {
    *permissionDenied = false;

    if ( !m_devicePath.isEmpty() ) {
        return openDevice(m_devicePath, permissionDenied);
    }

    QDir inputDir(m_inputDir);
    if ( !inputDir.exists() ) {
        return false;
    }

    const QStringList entries = inputDir.entryList(QStringList() << "event*", QDir::System | QDir::Files, QDir::Name);
    for ( const QString& entry : entries ) {
        bool denied = false;
        openDevice(inputDir.filePath(entry), &denied);
        *permissionDenied = *permissionDenied || denied;
    }

    // 扫描模式下暂时没有键盘不算失败，等热插拔；只有权限不足才算
    if ( m_devices.isEmpty() && *permissionDenied ) {
        return false;
    }
    *permissionDenied = false;
    return true;
}

bool EvdevEventTap::openDevice(const QString& path, bool* permissionDenied) {
    const QByteArray nativePath = QFile::encodeName(path);
    int fd = open(nativePath.constData(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if ( fd < 0 ) {
        if ( errno == EACCES || errno == EPERM ) {
            *permissionDenied = true;
        }
        return false;
    }

    if ( !acceptDevice(fd, path) ) {
        close(fd);
        return false;
    }

    m_devices.append(Device{fd, path, QSet<int>()});
    return true;
}

bool EvdevEventTap::acceptDevice(int fd, const QString& path) {
    char name[256] = {0};
    if ( ioctl(fd, EVIOCGNAME(sizeof(name) - 1), name) < 0 ) {
        name[0] = '\0';
    }

    // 跳过本程序自己的 uinput 设备，也跳过没有功能键的设备
    if ( qstrcmp(name, FnKeyConstants::Simulator::UINPUT_DEVICE_NAME) == 0 || !hasFunctionKeys(fd) ) {
        return false;
    }

    qCDebug(lcEventTap) << "Opened keyboard" << path << name;
    return true;
}

bool EvdevEventTap::isOpen(const QString& path) const {
    for ( const Device& device : m_devices ) {
        if ( device.path == path ) {
            return true;
        }
    }
    return false;
}

bool EvdevEventTap::isCandidateName(const QString& fileName) const {
    if ( !m_devicePath.isEmpty() ) {
        return fileName == QFileInfo(m_devicePath).fileName();
    }
    return fileName.startsWith("event");
}

bool EvdevEventTap::hasFunctionKeys(int fd) {
    unsigned long keyBits[kKeyBitsLength];
    std::memset(keyBits, 0, sizeof(keyBits));

    if ( ioctl(fd, EVIOCGBIT(EV_KEY, sizeof(keyBits)), keyBits) < 0 ) {
        return false;
    }
    return testBit(keyBits, KEY_F1) && testBit(keyBits, KEY_F12);
}

void EvdevEventTap::closeDevices() {
    for ( const Device& device : m_devices ) {
        if ( device.fd >= 0 ) {
            close(device.fd);
        }
    }
    m_devices.clear();
}

QString EvdevEventTap::watchDirectory() const {
    return m_devicePath.isEmpty() ? m_inputDir : QFileInfo(m_devicePath).absolutePath();
}

bool EvdevEventTap::startWatching() {
    m_inotifyFd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if ( m_inotifyFd < 0 ) {
        qCWarning(lcEventTap) << "inotify_init1 failed:" << strerror(errno);
        return false;
    }

    // udev 先创建节点再调整权限，所以 IN_ATTRIB 也要重试打开
    const QByteArray nativeDir = QFile::encodeName(watchDirectory());
    if ( inotify_add_watch(m_inotifyFd, nativeDir.constData(), IN_CREATE | IN_ATTRIB | IN_MOVED_TO) < 0 ) {
        qCWarning(lcEventTap) << "Unable to watch" << watchDirectory() << ":" << strerror(errno);
        close(m_inotifyFd);
        m_inotifyFd = -1;
        return false;
    }
    return true;
}

void EvdevEventTap::handleWatchEvents() {
    alignas(inotify_event) char buffer[kWatchBufferSize];
    const QDir dir(watchDirectory());

    for ( ;; ) {
        ssize_t n = read(m_inotifyFd, buffer, sizeof(buffer));
        if ( n <= 0 ) {
            return;
        }

        for ( ssize_t offset = 0; offset < n; ) {
            const inotify_event* event = reinterpret_cast<const inotify_event*>(buffer + offset);
            offset += static_cast<ssize_t>(sizeof(inotify_event) + event->len);

            if ( event->len == 0 ) {
                continue;
            }

            const QString fileName = QFile::decodeName(event->name);
            const QString path = dir.filePath(fileName);
            if ( !isCandidateName(fileName) || isOpen(path) ) {
                continue;
            }

            bool denied = false;
            if ( openDevice(path, &denied) ) {
                qCInfo(lcEventTap) << "Keyboard device added:" << path;
            } else if ( denied ) {
                qCDebug(lcEventTap) << "New input node not readable yet:" << path;
            }
        }
    }
}

void EvdevEventTap::removeDevice(int index) {
    Device& device = m_devices[index];
    if ( device.fd >= 0 ) {
        close(device.fd);
        device.fd = -1;
    }

    // 设备消失时补发抬起，避免按键永远停留在按下状态
    for ( int code : device.pressedCodes ) {
        if ( m_enabled.load() ) {
            m_callback(m_userInfo, RawKeyEventType::KeyUp, code);
        }
    }

    qCInfo(lcEventTap) << "Keyboard device removed:" << device.path;
    m_devices.remove(index);
}

void EvdevEventTap::deliveryLoop() {
    QVarLengthArray<pollfd, 16> fds;
    bool idleLogged = false;

    while ( m_enabled.load() ) {
        fds.clear();
        fds.append(pollfd{m_wakeFd, POLLIN, 0});
        const int watchIndex = m_inotifyFd >= 0 ? fds.size() : -1;
        if ( watchIndex >= 0 ) {
            fds.append(pollfd{m_inotifyFd, POLLIN, 0});
        }
        const int firstDevice = fds.size();
        for ( const Device& device : m_devices ) {
            fds.append(pollfd{device.fd, POLLIN, 0});
        }

        if ( m_devices.isEmpty() ) {
            if ( !idleLogged ) {
                qCInfo(lcEventTap) << "No keyboard device open, waiting for one to appear";
                idleLogged = true;
            }
        } else {
            idleLogged = false;
        }

        int ready = poll(fds.data(), static_cast<nfds_t>(fds.size()), FnKeyConstants::Monitor::POLL_TIMEOUT_MS);
        if ( ready < 0 ) {
            if ( errno == EINTR ) {
                continue;
            }
            qCWarning(lcEventTap) << "poll failed:" << strerror(errno);
            break;
        }

        if ( fds[0].revents & POLLIN ) {
            break;
        }

        for ( int i = firstDevice; i < fds.size() && m_enabled.load(); ++i ) {
            Device& device = m_devices[i - firstDevice];
            if ( fds[i].revents & POLLIN ) {
                drainDevice(device);
            }
            if ( device.fd >= 0 && (fds[i].revents & (POLLERR | POLLHUP | POLLNVAL)) ) {
                close(device.fd);
                device.fd = -1;
            }
        }

        // 移除已关闭的设备，投递线程运行期间 m_devices 只由本线程修改
        for ( int i = m_devices.size() - 1; i >= 0; --i ) {
            if ( m_devices.at(i).fd < 0 ) {
                removeDevice(i);
            }
        }

        if ( watchIndex >= 0 && (fds[watchIndex].revents & POLLIN) && m_enabled.load() ) {
            handleWatchEvents();
        }
    }

    qCDebug(lcEventTap) << "Delivery loop finished";
}

bool EvdevEventTap::drainDevice(Device& device) {
    input_event events[kReadBatch];

    for ( ;; ) {
        ssize_t n = read(device.fd, events, sizeof(events));
        if ( n < 0 ) {
            if ( errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR ) {
                return true;
            }
            qCInfo(lcEventTap) << "Keyboard device read failed:" << device.path << strerror(errno);
            close(device.fd);
            device.fd = -1;
            return false;
        }
        if ( n == 0 ) {
            close(device.fd);
            device.fd = -1;
            return false;
        }

        const int count = static_cast<int>(n / static_cast<ssize_t>(sizeof(input_event)));
        for ( int i = 0; i < count; ++i ) {
            if ( !m_enabled.load() ) {
                return true;
            }

            const input_event& ev = events[i];
            if ( ev.type != EV_KEY ) {
                continue;
            }

            // value: 0 抬起，1 按下，2 自动重复
            const RawKeyEventType type = ev.value == 0 ? RawKeyEventType::KeyUp : RawKeyEventType::KeyDown;
            if ( KeyCodeMap::isMapped(ev.code) ) {
                if ( type == RawKeyEventType::KeyDown ) {
                    device.pressedCodes.insert(ev.code);
                } else {
                    device.pressedCodes.remove(ev.code);
                }
            }
            m_callback(m_userInfo, type, ev.code);
        }

        if ( count < kReadBatch ) {
            return true;
        }
    }
}

#endif // Q_OS_LINUX

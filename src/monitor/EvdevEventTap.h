#ifndef EVDEVEVENTTAP_H
#define EVDEVEVENTTAP_H

#include "IEventTap.h"

#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QThread>
#include <QtCore/QVector>
#include <atomic>
#include <memory>

#ifdef Q_OS_LINUX

/**
 * @brief 基于 evdev 的只监听全局键盘钩子
 *
 * 以只读方式打开所有带功能键的 event* 设备（不做 EVIOCGRAB，
 * 因此不影响其他程序收到的事件），在独立的投递线程中 poll 读取 EV_KEY 事件。
 *
 * 设备目录通过 inotify 监视：新接入（或权限刚被 udev 放开）的键盘会被打开，
 * 拔出的键盘上仍按着的功能键会补发抬起事件。没有任何键盘时投递线程继续等待。
 *
 * 停用通过原子标志和 eventfd 唤醒实现；注销时等待投递线程退出并关闭设备。
 */
class EvdevEventTap : public IEventTap {
public:
    /**
     * @param devicePath 指定单个设备节点；为空时扫描 inputDir
     * @param inputDir 扫描和监视的设备目录
     */
    explicit EvdevEventTap(const QString& devicePath = QString(),
                           const QString& inputDir = QString());
    ~EvdevEventTap() override;

    bool install(Callback callback, void* userInfo) override;
    void disable() override;
    void unregister() override;

    bool isInstalled() const override { return m_thread != nullptr; }
    QString lastError() const override { return m_lastError; }

    /// 投递线程是否在监视设备目录的新增节点
    bool isWatchingHotplug() const { return m_inotifyFd >= 0; }

protected:
    /**
     * @brief 判断已打开的节点是否是需要监听的键盘
     *
     * 默认要求同时声明 KEY_F1 和 KEY_F12，并排除本程序自己的 uinput 设备。
     * 投递线程运行期间也会调用；重写它的子类必须在自己析构前调用 unregister()。
     */
    virtual bool acceptDevice(int fd, const QString& path);

private:
    struct Device {
        int fd;
        QString path;
        QSet<int> pressedCodes;     // 只记录已映射的功能键
    };

    bool openDevices(bool* permissionDenied);
    bool openDevice(const QString& path, bool* permissionDenied);
    bool isOpen(const QString& path) const;
    bool isCandidateName(const QString& fileName) const;
    static bool hasFunctionKeys(int fd);
    void closeDevices();

    QString watchDirectory() const;
    bool startWatching();
    void handleWatchEvents();
    void removeDevice(int index);

    // 投递线程主循环
    void deliveryLoop();
    bool drainDevice(Device& device);

    QString m_devicePath;
    QString m_inputDir;
    QVector<Device> m_devices;
    int m_wakeFd;
    int m_inotifyFd;

    Callback m_callback;
    void* m_userInfo;

    std::atomic<bool> m_enabled;
    std::unique_ptr<QThread> m_thread;

    QString m_lastError;
};

#endif // Q_OS_LINUX

#endif // EVDEVEVENTTAP_H

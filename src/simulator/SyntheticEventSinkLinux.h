#ifndef SYNTHETICEVENTSINKLINUX_H
#define SYNTHETICEVENTSINKLINUX_H

#include "ISyntheticEventSink.h"

#ifdef Q_OS_LINUX

// Xlib 的宏与 Qt 头文件冲突，头文件里只前向声明
struct _XDisplay;

/**
 * @brief Linux 合成事件输出
 *
 * - 特殊键族：通过 uinput 创建一个只声明媒体/亮度/音量键的虚拟键盘，
 *   写入 EV_KEY + SYN_REPORT，走的是和硬件媒体键相同的内核输入路径；
 * - 虚拟键族：通过 XTest 向 X 服务器发送 keysym 对应的按键。
 *
 * 两个后端相互独立，任一可用即算初始化成功，不可用的族投递时返回 false。
 */
class SyntheticEventSinkLinux : public ISyntheticEventSink {
public:
    explicit SyntheticEventSinkLinux(const QString& uinputDevice = QString());
    ~SyntheticEventSinkLinux() override;

    // 初始化和清理
    bool initialize() override;
    void cleanup() override;
    bool isInitialized() const override { return m_initialized; }

    bool post(const SyntheticEvent& event) override;

    QString lastError() const override { return m_lastError; }

    bool hasSpecialKeyBackend() const { return m_uinputFd >= 0; }
    bool hasVirtualKeyBackend() const { return m_display != nullptr; }

private:
    bool openUinputDevice();
    void closeUinputDevice();
    bool emitSpecialKey(int code, bool keyDown);
    bool emitVirtualKey(quint32 keysym, bool keyDown);
    bool writeInputEvent(int type, int code, int value);

    void setLastError(const QString& error);

    QString m_uinputDevice;
    int m_uinputFd;
    _XDisplay* m_display;
    bool m_initialized;
    QString m_lastError;
};

#endif // Q_OS_LINUX

#endif // SYNTHETICEVENTSINKLINUX_H

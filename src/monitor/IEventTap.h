#ifndef IEVENTTAP_H
#define IEVENTTAP_H

#include <QtCore/QString>

/**
 * @brief 原始按键事件类型
 */
enum class RawKeyEventType : int {
    KeyDown = 0,    // 按下（含自动重复）
    KeyUp = 1       // 抬起
};

/**
 * @brief 只监听的全局输入钩子接口
 *
 * 钩子只观察事件，不消费、不修改系统输入流。回调在钩子自己的投递上下文中执行，
 * 不保证是调用 install() 的线程。
 */
class IEventTap {
public:
    /// 原生风格回调：userInfo 为 install() 时传入的不透明令牌
    using Callback = void (*)(void* userInfo, RawKeyEventType type, int rawCode);

    virtual ~IEventTap() = default;

    /**
     * @brief 创建钩子、注册投递上下文并启用
     * @return 缺少权限等原因无法创建时返回 false，详见 lastError()
     */
    virtual bool install(Callback callback, void* userInfo) = 0;

    /// 停用钩子：返回后不再开始新的回调
    virtual void disable() = 0;

    /// 注销投递上下文：返回后没有任何回调仍在执行
    virtual void unregister() = 0;

    virtual bool isInstalled() const = 0;
    virtual QString lastError() const = 0;
};

#endif // IEVENTTAP_H

#ifndef FNKEYCONTROLLER_H
#define FNKEYCONTROLLER_H

#include <QtCore/QObject>
#include <QtCore/QSet>
#include <memory>

class KeyPressMonitor;
class KeySimulator;
class ProfileResolver;

/**
 * @brief 应用层连接：监视器、配置档案和动作分发器
 *
 * fire() 是外部请求模拟的唯一入口（界面点击或物理按键）。
 * 开启物理按键分发时，按键从未按下变为按下会在本对象线程上调用 fire()。
 */
class FnKeyController : public QObject {
    Q_OBJECT

public:
    /**
     * @param monitor 可为空（不监听物理按键）
     * @param simulator 动作分发器
     * @param resolver 非拥有，生命周期须长于本对象
     */
    FnKeyController(std::unique_ptr<KeyPressMonitor> monitor,
                    std::unique_ptr<KeySimulator> simulator,
                    const ProfileResolver* resolver,
                    QObject* parent = nullptr);
    ~FnKeyController() override;

    /// 启动按键监听；没有监视器或安装失败时返回 false
    bool startMonitoring();
    void stopMonitoring();

    void setDispatchPhysicalKeys(bool enabled) { m_dispatchPhysicalKeys = enabled; }
    bool dispatchPhysicalKeys() const { return m_dispatchPhysicalKeys; }

    QSet<int> pressedKeys() const;

    KeyPressMonitor* monitor() const { return m_monitor.get(); }
    KeySimulator* simulator() const { return m_simulator.get(); }

public slots:
    /// 解析该键当前的动作并交给分发器
    void fire(int logicalKey);

signals:
    void pressedKeysChanged(const QSet<int>& keys);

private slots:
    void onKeyPressed(int logicalKey);

private:
    std::unique_ptr<KeyPressMonitor> m_monitor;
    std::unique_ptr<KeySimulator> m_simulator;
    const ProfileResolver* m_resolver;
    bool m_dispatchPhysicalKeys;
};

#endif // FNKEYCONTROLLER_H

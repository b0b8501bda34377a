#ifndef CORE_CONSTANTS_H
#define CORE_CONSTANTS_H

#include <QtCore/QString>

/**
 * @brief 核心常量定义类
 *
 * 提供系统级别的常量定义，按功能模块分组管理。
 */
class FnKeyConstants {
public:
    /**
     * @brief 系统版本信息
     */
    struct Version {
        static constexpr int MAJOR = 1;
        static constexpr int MINOR = 0;
        static constexpr int PATCH = 0;
        static const QString VERSION_STRING;
    };

    /**
     * @brief 应用程序信息
     */
    struct Application {
        static constexpr const char* NAME = "Qt Fn Keyboard";
        static constexpr const char* ORGANIZATION = "QtFnKeyboard";
        static constexpr const char* ORGANIZATION_DOMAIN = "qtfnkeyboard.org";
    };

    /**
     * @brief 逻辑功能键相关常量
     */
    struct Keys {
        static constexpr int MIN_LOGICAL_KEY = 1;                       ///< 最小逻辑键编号
        static constexpr int MAX_LOGICAL_KEY = 12;                      ///< 最大逻辑键编号
        static constexpr int LOGICAL_KEY_COUNT = MAX_LOGICAL_KEY - MIN_LOGICAL_KEY + 1;
    };

    /**
     * @brief 按键模拟相关常量
     */
    struct Simulator {
        static constexpr int DEFAULT_RATE_LIMIT_INTERVAL_MS = 150;      ///< 同一按键最短触发间隔 150ms
        static constexpr int MIN_RATE_LIMIT_INTERVAL_MS = DEFAULT_RATE_LIMIT_INTERVAL_MS; ///< 配置只能加长间隔，不能低于 150ms
        static constexpr int MAX_RATE_LIMIT_INTERVAL_MS = 5000;         ///< 配置允许的最大间隔
        static constexpr const char* DEFAULT_UINPUT_DEVICE = "/dev/uinput";
        static constexpr const char* UINPUT_DEVICE_NAME = "Qt Fn Keyboard special keys";
        static constexpr int UINPUT_SETTLE_MS = 100;                    ///< UI_DEV_CREATE 后等待 udev/libinput 打开新节点
        static constexpr int FIRE_ONCE_EXIT_DELAY_MS = 200;             ///< --fire 模式下退出前留给读取方的时间
        static constexpr const char* SHELL_PATH = "/bin/sh";
    };

    /**
     * @brief 输入监听相关常量
     */
    struct Monitor {
        static constexpr const char* INPUT_DEVICE_DIR = "/dev/input";
        static constexpr int POLL_TIMEOUT_MS = 500;                     ///< 投递线程 poll 超时
    };

    /**
     * @brief 配置档案相关常量
     */
    struct Profile {
        static const QString DEFAULT_PROFILE_ID;                        ///< 内置 Default 档案的固定 UUID
        static const QString DEFAULT_PROFILE_NAME;
    };

    /**
     * @brief 获取应用程序版本信息
     * @return 版本字符串
     */
    static QString getVersionString();

    /**
     * @brief 验证逻辑键编号是否在 [1,12] 范围内
     * @param key 逻辑键编号
     * @return 是否有效
     */
    static bool isValidLogicalKey(int key);

    /**
     * @brief 将配置的限流间隔约束到有效范围
     */
    static int clampRateLimitInterval(int intervalMs);

private:
    FnKeyConstants() = delete;
};

#endif // CORE_CONSTANTS_H

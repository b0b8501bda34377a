#ifndef LOGGING_CATEGORIES_H
#define LOGGING_CATEGORIES_H

#include <QtCore/QLoggingCategory>
#include <QtCore/QObject>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QStringList>

/**
 * @brief 日志分类管理类
 *
 * 提供统一的日志分类定义和管理功能，支持动态日志级别控制。
 * 按功能模块组织日志分类，便于调试和问题定位。
 */
class LoggingCategories {
    Q_GADGET

public:
    /**
     * @brief 日志级别枚举（与 QtMsgType 的严重程度顺序一致）
     */
    enum LogLevel {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Critical = 3
    };
    Q_ENUM(LogLevel)

    /**
     * @brief 设置全局日志级别
     * @param level 最低输出级别，低于该级别的消息被过滤
     */
    static void setGlobalLogLevel(LogLevel level);

    /**
     * @brief 设置特定分类的日志级别
     * @param categoryName 分类名称，例如 "monitor.tap"
     * @param level 最低输出级别
     */
    static void setCategoryLogLevel(const QString& categoryName, LogLevel level);

    /**
     * @brief 根据级别生成 QLoggingCategory 过滤规则
     * @param pattern 分类匹配模式（支持通配符 *）
     * @param level 最低输出级别
     * @return 以换行分隔的规则文本
     */
    static QString filterRulesFor(const QString& pattern, LogLevel level);

    /**
     * @brief 获取所有日志分类名称
     * @return 分类名称列表
     */
    static QStringList getAllCategoryNames();

private:
    LoggingCategories() = delete;
};

// ============================================================================
// 核心模块日志分类
// ============================================================================

/// 应用程序主模块日志
Q_DECLARE_LOGGING_CATEGORY(lcApp)

/// 配置管理日志
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

/// 按键配置档案日志
Q_DECLARE_LOGGING_CATEGORY(lcProfile)

// ============================================================================
// 按键监听模块日志分类
// ============================================================================

/// 全局输入钩子日志
Q_DECLARE_LOGGING_CATEGORY(lcEventTap)

/// 回调桥接日志
Q_DECLARE_LOGGING_CATEGORY(lcCallbackBridge)

// ============================================================================
// 按键模拟模块日志分类
// ============================================================================

/// 动作分发日志
Q_DECLARE_LOGGING_CATEGORY(lcDispatch)

/// 限流器日志
Q_DECLARE_LOGGING_CATEGORY(lcRateLimit)

/// Linux 合成事件输出日志
Q_DECLARE_LOGGING_CATEGORY(lcSimulatorLinux)

/// 应用/URL/命令启动日志
Q_DECLARE_LOGGING_CATEGORY(lcLauncher)

// ============================================================================
// 测试模块日志分类
// ============================================================================

/// 测试主模块日志
Q_DECLARE_LOGGING_CATEGORY(lcTest)

#endif // LOGGING_CATEGORIES_H

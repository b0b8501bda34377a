#include "LoggingCategories.h"

// ============================================================================
// 核心模块日志分类定义
// ============================================================================

/// 应用程序主模块日志
Q_LOGGING_CATEGORY(lcApp, "app", QtDebugMsg)

/// 配置管理日志
Q_LOGGING_CATEGORY(lcConfig, "core.config", QtDebugMsg)

/// 按键配置档案日志
Q_LOGGING_CATEGORY(lcProfile, "core.profile", QtDebugMsg)

// ============================================================================
// 按键监听模块日志分类定义
// ============================================================================

/// 全局输入钩子日志
Q_LOGGING_CATEGORY(lcEventTap, "monitor.tap", QtDebugMsg)

/// 回调桥接日志
Q_LOGGING_CATEGORY(lcCallbackBridge, "monitor.bridge", QtDebugMsg)

// ============================================================================
// 按键模拟模块日志分类定义
// ============================================================================

/// 动作分发日志
Q_LOGGING_CATEGORY(lcDispatch, "simulator.dispatch", QtDebugMsg)

/// 限流器日志
Q_LOGGING_CATEGORY(lcRateLimit, "simulator.ratelimit", QtDebugMsg)

/// Linux 合成事件输出日志
Q_LOGGING_CATEGORY(lcSimulatorLinux, "simulator.linux", QtDebugMsg)

/// 应用/URL/命令启动日志
Q_LOGGING_CATEGORY(lcLauncher, "simulator.launcher", QtDebugMsg)

// ============================================================================
// 测试模块日志分类定义
// ============================================================================

/// 测试主模块日志
Q_LOGGING_CATEGORY(lcTest, "test", QtDebugMsg)

// ============================================================================
// LoggingCategories类实现
// ============================================================================

QString LoggingCategories::filterRulesFor(const QString& pattern, LogLevel level) {
    // QLoggingCategory 规则按类型开关，级别以下的类型全部关闭
    static const char* const kTypes[] = { "debug", "info", "warning", "critical" };

    QStringList rules;
    for ( int i = 0; i < 4; ++i ) {
        rules << QString("%1.%2=%3").arg(pattern, QLatin1String(kTypes[i]),
                                        i >= static_cast<int>(level) ? QStringLiteral("true") : QStringLiteral("false"));
    }
    return rules.join('\n');
}

void LoggingCategories::setGlobalLogLevel(LogLevel level) {
    QLoggingCategory::setFilterRules(filterRulesFor("*", level));
}

void LoggingCategories::setCategoryLogLevel(const QString& categoryName, LogLevel level) {
    QLoggingCategory::setFilterRules(filterRulesFor(categoryName, level));
}

QStringList LoggingCategories::getAllCategoryNames() {
    static QStringList categories = {
        // 核心模块
        "app", "core.config", "core.profile",

        // 按键监听模块
        "monitor.tap", "monitor.bridge",

        // 按键模拟模块
        "simulator.dispatch", "simulator.ratelimit", "simulator.linux", "simulator.launcher",

        // 测试模块
        "test"
    };

    return categories;
}

#include <QtGui/QGuiApplication>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QDateTime>
#include <QtCore/QStandardPaths>
#include "common/core/logging/LoggingCategories.h"
#include <QtCore/QTimer>
#include <QtCore/QTextStream>
#include <QtCore/QCommandLineParser>
#include <QtCore/QCommandLineOption>
#include <signal.h>
#include <memory>

#include "app/FnKeyController.h"
#include "common/action/JsonProfileStore.h"
#include "common/core/config/Config.h"
#include "common/core/config/Constants.h"
#include "common/keys/FunctionKeyCatalog.h"
#include "monitor/EvdevEventTap.h"
#include "monitor/KeyPressMonitor.h"
#include "simulator/KeySimulator.h"
#include "simulator/SyntheticEvent.h"

// 信号处理器函数
void signalHandler(int signal) {
    qCInfo(lcApp, "Received signal %d, quitting", signal);
    QTimer::singleShot(0, QCoreApplication::instance(), &QCoreApplication::quit);
}

// 安装信号处理器
void installSignalHandlers() {
    signal(SIGTERM, signalHandler);
    signal(SIGINT, signalHandler);
}

// 初始化应用程序设置
void initializeApplication(QGuiApplication& app) {
    app.setApplicationName(FnKeyConstants::Application::NAME);
    app.setApplicationVersion(FnKeyConstants::getVersionString());
    app.setOrganizationName(FnKeyConstants::Application::ORGANIZATION);
    app.setOrganizationDomain(FnKeyConstants::Application::ORGANIZATION_DOMAIN);
    app.setQuitOnLastWindowClosed(false);
}

// 自定义消息处理器，用于处理相对路径
static QString s_projectRoot;

void customMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    // ANSI颜色代码
    const char* colorReset = "\033[0m";       // 重置颜色 - Debug
    const char* colorGreen = "\033[32m";      // 绿色 - Info
    const char* colorYellow = "\033[33m";     // 黄色 - Warning
    const char* colorRed = "\033[31m";        // 红色 - Critical
    const char* colorBoldRed = "\033[1;31m";  // 粗体红色 - Fatal
    const char* colorCyan = "\033[36m";       // 青色 - 时间戳

    // 获取相对路径
    QString file = context.file ? context.file : "";
    if ( !file.isEmpty() && !s_projectRoot.isEmpty() && file.startsWith(s_projectRoot) ) {
        file = file.mid(s_projectRoot.length());
        if ( file.startsWith("/") ) {
            file = file.mid(1);
        }
    } else if ( !file.isEmpty() ) {
        file = QFileInfo(file).fileName();
    }

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");

    const char* typeColor = colorReset;
    QString typeStr;
    switch ( type ) {
        case QtDebugMsg:
            typeStr = "Debug";
            typeColor = colorReset;
            break;
        case QtInfoMsg:
            typeStr = "Info";
            typeColor = colorGreen;
            break;
        case QtWarningMsg:
            typeStr = "Warning";
            typeColor = colorYellow;
            break;
        case QtCriticalMsg:
            typeStr = "Critical";
            typeColor = colorRed;
            break;
        case QtFatalMsg:
            typeStr = "Fatal";
            typeColor = colorBoldRed;
            break;
    }

    QString category = context.category ? context.category : "default";

    QString formattedMsg = QString("%1[%2]%3 %4[%5 %6](%7:%8):%9%10")
        .arg(colorCyan)
        .arg(timestamp)
        .arg(colorReset)
        .arg(typeColor)
        .arg(typeStr)
        .arg(category)
        .arg(file)
        .arg(context.line)
        .arg(msg)
        .arg(colorReset);

    // 输出到标准错误
    fprintf(stderr, "%s\n", formattedMsg.toLocal8Bit().constData());
    fflush(stderr);

    if ( type == QtFatalMsg ) {
        abort();
    }
}

// 初始化日志系统（消息处理器；过滤规则在配置加载后应用）
void initializeLogging() {
    s_projectRoot = QDir::currentPath();
    QString srcPath = QString(__FILE__);
    int srcIndex = srcPath.indexOf("/src/");
    if ( srcIndex > 0 ) {
        s_projectRoot = srcPath.left(srcIndex);
    }

    qInstallMessageHandler(customMessageHandler);
}

// 应用 Qt 分类日志规则（优先环境变量 QT_LOGGING_RULES，其次配置项 Logging/rules）
void applyLoggingRules() {
    const QByteArray envRules = qgetenv("QT_LOGGING_RULES");
    QString rules = envRules.isEmpty()
        ? Config::instance()->getString("rules", QString(), Config::Logging)
        : QString::fromUtf8(envRules);

    if ( rules.isEmpty() ) {
        rules = LoggingCategories::filterRulesFor("*", LoggingCategories::Info);
    }

    QLoggingCategory::setFilterRules(rules);
    qCDebug(lcApp, "Effective logging rules: %s", qPrintable(rules));
}

// 初始化配置系统
void initializeConfig(const QString& configFile) {
    QString path = configFile;
    if ( path.isEmpty() ) {
        path = Config::defaultConfigPath();
        QDir().mkpath(QFileInfo(path).absolutePath());
    }

    Config::instance()->setConfigFile(path);
    Config::instance()->load();
}

// 打印功能键表
void printKeyTable() {
    QTextStream out(stdout);
    for ( const FunctionKeyInfo& info : FunctionKeyCatalog::allKeys() ) {
        const SystemKeyBinding* binding = SyntheticEventEncoder::bindingFor(info.id);
        out << QString("%1  %2  %3  %4")
                   .arg(info.id, 2)
                   .arg(info.label, -4)
                   .arg(info.group, -11)
                   .arg(info.description)
            << "  [" << SyntheticEventEncoder::familyName(binding->family) << "]"
            << Qt::endl;
    }
}

int main(int argc, char* argv[]) {
    QGuiApplication app(argc, argv);
    initializeApplication(app);

    QCommandLineParser parser;
    parser.setApplicationDescription("Qt Fn Keyboard - function key agent");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(QStringList() << "c" << "config",
        "Use <file> as the settings file.", "file");
    parser.addOption(configOption);

    QCommandLineOption profilesOption(QStringList() << "p" << "profiles",
        "Read key profiles from <file>.", "file");
    parser.addOption(profilesOption);

    QCommandLineOption listKeysOption(QStringList() << "list-keys",
        "Print the function key table and exit.");
    parser.addOption(listKeysOption);

    QCommandLineOption fireOption(QStringList() << "fire",
        "Fire logical key <n> (1-12) once and exit.", "n");
    parser.addOption(fireOption);

    QCommandLineOption noMonitorOption(QStringList() << "no-monitor",
        "Do not listen to physical key presses.");
    parser.addOption(noMonitorOption);

    parser.process(app);

    if ( parser.isSet(listKeysOption) ) {
        printKeyTable();
        return 0;
    }

    try {
        initializeLogging();
        initializeConfig(parser.value(configOption));
        applyLoggingRules();

        qCInfo(lcApp, "%s %s starting, Qt %s", FnKeyConstants::Application::NAME,
               qPrintable(FnKeyConstants::getVersionString()), qVersion());
        qCInfo(lcApp, "Configuration: %s", qPrintable(Config::instance()->configFile()));

        Config* config = Config::instance();

        // 配置档案
        JsonProfileStore profiles;
        const QString profilesFile = parser.isSet(profilesOption)
            ? parser.value(profilesOption)
            : config->getString("file", QString(), Config::Profiles);
        if ( !profiles.loadFromFile(profilesFile) ) {
            qCWarning(lcApp, "Using built-in profile: %s", qPrintable(profiles.lastError()));
        }

        // 动作分发
        auto simulator = std::make_unique<KeySimulator>(config->getString("uinputDevice", QString(), Config::Simulator));
        simulator->setRateLimitInterval(config->getInt("rateLimitIntervalMs",
            FnKeyConstants::Simulator::DEFAULT_RATE_LIMIT_INTERVAL_MS, Config::Simulator));

        // 物理按键监听
        const bool fireOnce = parser.isSet(fireOption);
        const bool monitorEnabled = !fireOnce && !parser.isSet(noMonitorOption)
            && config->value("enabled", QVariant(), Config::Monitor).toBool();

        std::unique_ptr<KeyPressMonitor> monitor;
        if ( monitorEnabled ) {
#ifdef Q_OS_LINUX
            monitor = std::make_unique<KeyPressMonitor>(
                std::make_unique<EvdevEventTap>(config->getString("devicePath", QString(), Config::Monitor)));
#else
            qCWarning(lcApp, "Key monitoring is not supported on this platform");
#endif
        }

        FnKeyController controller(std::move(monitor), std::move(simulator), &profiles);
        controller.setDispatchPhysicalKeys(config->value("dispatchPhysicalKeys", QVariant(), Config::Monitor).toBool());

        // 应用退出时卸载钩子，此时应用对象仍存活，可回收回调桥上下文
        QObject::connect(&app, &QCoreApplication::aboutToQuit, &controller, &FnKeyController::stopMonitoring);

        QObject::connect(config, &Config::valueChanged, &controller,
            [&controller](const QString& key, const QVariant& value, Config::ConfigGroup group) {
                if ( group == Config::Simulator && key == "rateLimitIntervalMs" ) {
                    bool ok = false;
                    const int intervalMs = value.toInt(&ok);
                    controller.simulator()->setRateLimitInterval(
                        ok ? intervalMs : FnKeyConstants::Simulator::DEFAULT_RATE_LIMIT_INTERVAL_MS);
                } else if ( group == Config::Monitor && key == "dispatchPhysicalKeys" ) {
                    controller.setDispatchPhysicalKeys(value.toBool());
                }
            });

        if ( fireOnce ) {
            bool ok = false;
            const int key = parser.value(fireOption).toInt(&ok);
            if ( !ok || !FnKeyConstants::isValidLogicalKey(key) ) {
                qCCritical(lcApp, "Invalid key for --fire: %s", qPrintable(parser.value(fireOption)));
                return 1;
            }
            controller.fire(key);
            // 给 udev/桌面环境时间读取事件，再销毁 uinput 设备
            QTimer::singleShot(FnKeyConstants::Simulator::FIRE_ONCE_EXIT_DELAY_MS, &app, &QCoreApplication::quit);
        } else if ( monitorEnabled ) {
            controller.startMonitoring();
        }

        installSignalHandlers();

        qCInfo(lcApp, "Application initialized successfully");

        int result = app.exec();

        config->saveIfModified();

        qCInfo(lcApp, "Application exiting with code: %d", result);
        return result;

    } catch ( const std::exception& e ) {
        qCCritical(lcApp, "Unhandled exception: %s", e.what());
        return -1;
    }
}

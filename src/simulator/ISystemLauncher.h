#ifndef ISYSTEMLAUNCHER_H
#define ISYSTEMLAUNCHER_H

#include <QtCore/QString>
#include <QtCore/QUrl>

/**
 * @brief 启动应用、打开 URL、执行命令的系统接口
 *
 * 所有操作都是即发即忘：返回值只用于日志，不向上层报告错误。
 */
class ISystemLauncher {
public:
    virtual ~ISystemLauncher() = default;

    /// 按桌面文件 ID 启动应用，无法解析时返回 false
    virtual bool openApplication(const QString& applicationId) = 0;

    /// 交给系统默认程序打开 URL
    virtual bool openUrl(const QUrl& url) = 0;

    /// 通过 /bin/sh -c 在后台执行命令，不等待结束
    virtual bool runShellCommand(const QString& command) = 0;
};

#endif // ISYSTEMLAUNCHER_H

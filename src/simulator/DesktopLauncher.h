#ifndef DESKTOPLAUNCHER_H
#define DESKTOPLAUNCHER_H

#include "ISystemLauncher.h"

#include <QtCore/QStringList>

/**
 * @brief 基于 freedesktop 约定和 Qt 的系统启动器
 *
 * 应用 ID 为桌面文件 ID（"firefox" 或 "firefox.desktop"），也可以是 .desktop 文件的绝对路径；
 * 找不到桌面文件时再按 PATH 中的可执行文件名查找。
 */
class DesktopLauncher : public ISystemLauncher {
public:
    DesktopLauncher() = default;

    bool openApplication(const QString& applicationId) override;
    bool openUrl(const QUrl& url) override;
    bool runShellCommand(const QString& command) override;

    /**
     * @brief 查找桌面文件
     * @return 文件路径，找不到时为空
     */
    static QString resolveDesktopFile(const QString& applicationId);

    /**
     * @brief 读取桌面文件 [Desktop Entry] 中的 Exec 行并拆分为程序和参数
     *
     * 字段代码（%f %U 等）被去掉，"%%" 还原为 "%"。
     * @return 读取失败或没有 Exec 时为空
     */
    static QStringList execCommandLine(const QString& desktopFilePath);
};

#endif // DESKTOPLAUNCHER_H

#include "DesktopLauncher.h"
#include "../common/core/config/Constants.h"
#include "../common/core/logging/LoggingCategories.h"

#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <QtCore/QStandardPaths>
#include <QtCore/QTextStream>
#include <QtGui/QDesktopServices>

bool DesktopLauncher::openApplication(const QString& applicationId) {
    const QString id = applicationId.trimmed();
    if ( id.isEmpty() ) {
        return false;
    }

    QStringList commandLine;
    const QString desktopFile = resolveDesktopFile(id);
    if ( !desktopFile.isEmpty() ) {
        commandLine = execCommandLine(desktopFile);
    } else {
        const QString executable = QStandardPaths::findExecutable(id);
        if ( !executable.isEmpty() ) {
            commandLine << executable;
        }
    }

    if ( commandLine.isEmpty() ) {
        qCDebug(lcLauncher) << "Application not found:" << id;
        return false;
    }

    const QString program = commandLine.takeFirst();
    if ( !QProcess::startDetached(program, commandLine) ) {
        qCDebug(lcLauncher) << "Failed to start application" << id;
        return false;
    }

    qCDebug(lcLauncher) << "Started application" << id;
    return true;
}

bool DesktopLauncher::openUrl(const QUrl& url) {
    if ( !url.isValid() || url.isEmpty() ) {
        return false;
    }

    if ( !QDesktopServices::openUrl(url) ) {
        qCDebug(lcLauncher) << "URL declined by the system:" << url.toString();
        return false;
    }
    return true;
}

bool DesktopLauncher::runShellCommand(const QString& command) {
    if ( command.trimmed().isEmpty() ) {
        return false;
    }

    QProcess process;
    process.setProgram(FnKeyConstants::Simulator::SHELL_PATH);
    process.setArguments(QStringList() << "-c" << command);
    process.setStandardInputFile(QProcess::nullDevice());
    process.setStandardOutputFile(QProcess::nullDevice());
    process.setStandardErrorFile(QProcess::nullDevice());

    qint64 pid = 0;
    if ( !process.startDetached(&pid) ) {
        qCDebug(lcLauncher) << "Failed to spawn shell command";
        return false;
    }

    qCDebug(lcLauncher) << "Spawned shell command, pid" << pid;
    return true;
}

QString DesktopLauncher::resolveDesktopFile(const QString& applicationId) {
    QFileInfo direct(applicationId);
    if ( direct.isAbsolute() ) {
        return direct.isFile() ? direct.absoluteFilePath() : QString();
    }

    QString fileName = applicationId;
    if ( !fileName.endsWith(".desktop") ) {
        fileName += ".desktop";
    }

    QString path = QStandardPaths::locate(QStandardPaths::ApplicationsLocation, fileName);
    if ( path.isEmpty() && fileName.contains('-') ) {
        // 桌面文件 ID 中的 '-' 可能对应子目录
        QString nested = fileName;
        nested.replace('-', '/');
        path = QStandardPaths::locate(QStandardPaths::ApplicationsLocation, nested);
    }
    return path;
}

QStringList DesktopLauncher::execCommandLine(const QString& desktopFilePath) {
    QFile file(desktopFilePath);
    if ( !file.open(QIODevice::ReadOnly | QIODevice::Text) ) {
        qCDebug(lcLauncher) << "Cannot read desktop file" << desktopFilePath;
        return QStringList();
    }

    QString exec;
    bool inDesktopEntry = false;
    QTextStream in(&file);
    while ( !in.atEnd() ) {
        const QString line = in.readLine().trimmed();
        if ( line.startsWith('[') ) {
            inDesktopEntry = line == "[Desktop Entry]";
            continue;
        }
        if ( inDesktopEntry && line.startsWith("Exec=") ) {
            exec = line.mid(5);
            break;
        }
    }

    QStringList result;
    const QStringList tokens = QProcess::splitCommand(exec);
    for ( QString token : tokens ) {
        // 整个参数是字段代码时丢弃
        if ( token.size() == 2 && token.at(0) == '%' && token.at(1) != '%' ) {
            continue;
        }
        token.replace("%%", "%");
        result << token;
    }
    return result;
}

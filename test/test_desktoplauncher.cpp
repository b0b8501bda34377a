#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "../src/simulator/DesktopLauncher.h"

class TestDesktopLauncher : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir m_dir;

    QString writeDesktopFile(const QString& name, const QByteArray& contents);

private slots:
    void initTestCase();

    /**
     * @brief Exec 行去掉字段代码，保留引号内的参数
     */
    void test_execLineStripsFieldCodes();

    void test_execLineUnescapesPercent();

    void test_missingExecGivesEmptyCommand();

    void test_absoluteDesktopPathResolves();

    /**
     * @brief 无法解析的目标静默失败
     */
    void test_unresolvableTargetsFailQuietly();

    void test_shellCommandSpawnsDetached();
};

QString TestDesktopLauncher::writeDesktopFile(const QString& name, const QByteArray& contents)
{
    const QString path = m_dir.filePath(name);
    QFile file(path);
    if ( !file.open(QIODevice::WriteOnly) ) {
        return QString();
    }
    file.write(contents);
    return path;
}

void TestDesktopLauncher::initTestCase()
{
    QVERIFY(m_dir.isValid());
}

void TestDesktopLauncher::test_execLineStripsFieldCodes()
{
    const QString path = writeDesktopFile("editor.desktop",
        "[Desktop Entry]\n"
        "Name=Editor\n"
        "Exec=/usr/bin/editor --new-window \"My File\" %U\n"
        "[Desktop Action New]\n"
        "Exec=/usr/bin/editor --other\n");
    QVERIFY(!path.isEmpty());

    QCOMPARE(DesktopLauncher::execCommandLine(path),
             QStringList() << "/usr/bin/editor" << "--new-window" << "My File");
}

void TestDesktopLauncher::test_execLineUnescapesPercent()
{
    const QString path = writeDesktopFile("percent.desktop",
        "[Desktop Entry]\n"
        "Exec=printf 100%% %f\n");
    QCOMPARE(DesktopLauncher::execCommandLine(path), QStringList() << "printf" << "100%");
}

void TestDesktopLauncher::test_missingExecGivesEmptyCommand()
{
    const QString path = writeDesktopFile("noexec.desktop", "[Desktop Entry]\nName=Nothing\n");
    QVERIFY(DesktopLauncher::execCommandLine(path).isEmpty());
    QVERIFY(DesktopLauncher::execCommandLine(m_dir.filePath("absent.desktop")).isEmpty());
}

void TestDesktopLauncher::test_absoluteDesktopPathResolves()
{
    const QString path = writeDesktopFile("direct.desktop", "[Desktop Entry]\nExec=true\n");
    QCOMPARE(DesktopLauncher::resolveDesktopFile(path), QFileInfo(path).absoluteFilePath());
    QVERIFY(DesktopLauncher::resolveDesktopFile(m_dir.filePath("gone.desktop")).isEmpty());
}

void TestDesktopLauncher::test_unresolvableTargetsFailQuietly()
{
    DesktopLauncher launcher;
    QVERIFY(!launcher.openApplication(""));
    QVERIFY(!launcher.openApplication("definitely-not-an-installed-app-4711"));
    QVERIFY(!launcher.openUrl(QUrl()));
    QVERIFY(!launcher.runShellCommand("   "));
}

void TestDesktopLauncher::test_shellCommandSpawnsDetached()
{
    DesktopLauncher launcher;
    const QString marker = m_dir.filePath("marker");
    QVERIFY(launcher.runShellCommand(QString("echo done > '%1'").arg(marker)));
    QTRY_VERIFY(QFile::exists(marker));
}

QTEST_GUILESS_MAIN(TestDesktopLauncher)
#include "test_desktoplauncher.moc"

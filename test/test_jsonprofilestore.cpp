#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "../src/common/action/JsonProfileStore.h"
#include "../src/common/core/config/Constants.h"

namespace {

const char* const kWorkId = "6F1C1E52-8D0B-4B8E-9D5F-3C1A2B4D5E6F";
const char* const kGameId = "0b7c2a6e-1111-4c3d-9e8f-aabbccddeeff";

QByteArray twoProfiles(const QString& activeId) {
    return QString(R"({
        "activeProfileID": "%1",
        "profiles": [
            { "id": "%2", "name": "Work",
              "actions": {
                  "1": {"type": "openApp", "bundleID": "org.gnome.Terminal"},
                  "4": {"type": "system"},
                  "7": {"type": "openURL", "url": "https://example.org/standup"}
              } },
            { "id": "%3", "name": "Game",
              "actions": { "12": {"type": "shellCommand", "cmd": "pactl set-sink-mute @DEFAULT_SINK@ toggle"} } }
        ]
    })").arg(activeId, kWorkId, kGameId).toUtf8();
}

} // namespace

class TestJsonProfileStore : public QObject
{
    Q_OBJECT
private slots:
    /**
     * @brief 默认只有内置 Default 档案，所有键解析为 System
     */
    void test_builtinProfileByDefault();

    void test_missingFileUsesBuiltin();

    void test_emptyDocumentUsesBuiltin();

    void test_loadsActiveProfile();

    /**
     * @brief 未知的当前档案 ID 回落到第一个档案
     */
    void test_unknownActiveIdFallsBackToFirst();

    void test_setActiveProfileSwitchesResolution();

    /**
     * @brief 格式错误的档案和动作被跳过，其余正常加载
     */
    void test_skipsMalformedEntries();

    void test_invalidJsonKeepsPreviousProfiles();

    void test_loadsFromFile();
};

void TestJsonProfileStore::test_builtinProfileByDefault()
{
    JsonProfileStore store;
    QCOMPARE(store.profiles().size(), 1);
    QCOMPARE(store.activeProfile().id, FnKeyConstants::Profile::DEFAULT_PROFILE_ID);
    QCOMPARE(store.activeProfile().name, QString("Default"));
    for ( int key = 1; key <= 12; ++key ) {
        QVERIFY(store.resolve(key).isSystem());
    }
}

void TestJsonProfileStore::test_missingFileUsesBuiltin()
{
    QTemporaryDir dir;
    JsonProfileStore store;
    QVERIFY(store.loadFromFile(dir.filePath("absent.json")));
    QCOMPARE(store.activeProfile().id, FnKeyConstants::Profile::DEFAULT_PROFILE_ID);
}

void TestJsonProfileStore::test_emptyDocumentUsesBuiltin()
{
    JsonProfileStore store;
    QVERIFY(store.loadFromJson("  \n"));
    QCOMPARE(store.profiles().size(), 1);
}

void TestJsonProfileStore::test_loadsActiveProfile()
{
    JsonProfileStore store;
    QSignalSpy spy(&store, &JsonProfileStore::profilesReloaded);
    QVERIFY(store.loadFromJson(twoProfiles(kWorkId)));
    QCOMPARE(spy.count(), 1);

    QCOMPARE(store.profiles().size(), 2);
    QCOMPARE(store.activeProfile().name, QString("Work"));
    QCOMPARE(store.resolve(1), KeyAction::openApplication("org.gnome.Terminal"));
    QCOMPARE(store.resolve(7), KeyAction::openUrl(QUrl("https://example.org/standup")));
    QVERIFY(store.resolve(4).isSystem());
    QVERIFY(store.resolve(12).isSystem());
    // 显式的 system 不单独存储
    QVERIFY(!store.activeProfile().actions.contains(4));
}

void TestJsonProfileStore::test_unknownActiveIdFallsBackToFirst()
{
    JsonProfileStore store;
    QVERIFY(store.loadFromJson(twoProfiles("ffffffff-ffff-4fff-8fff-ffffffffffff")));
    QCOMPARE(store.activeProfile().name, QString("Work"));
}

void TestJsonProfileStore::test_setActiveProfileSwitchesResolution()
{
    JsonProfileStore store;
    QVERIFY(store.loadFromJson(twoProfiles(kWorkId)));
    QSignalSpy spy(&store, &JsonProfileStore::activeProfileChanged);

    QVERIFY(store.setActiveProfile(kGameId));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(store.resolve(12).type(), KeyAction::Type::RunShellCommand);
    QVERIFY(store.resolve(1).isSystem());

    QVERIFY(!store.setActiveProfile("not-a-profile"));
    QCOMPARE(store.activeProfile().name, QString("Game"));
    QVERIFY(!store.lastError().isEmpty());
}

void TestJsonProfileStore::test_skipsMalformedEntries()
{
    const QByteArray json = QString(R"({
        "profiles": [
            "not an object",
            { "id": "not-a-uuid", "name": "Broken" },
            { "id": "%1", "name": "Work",
              "actions": {
                  "0": {"type": "shellCommand", "cmd": "ignored"},
                  "x": {"type": "shellCommand", "cmd": "ignored"},
                  "2": {"type": "teleport"},
                  "3": {"type": "openURL", "url": ""},
                  "5": {"type": "shellCommand", "cmd": "true"}
              } }
        ]
    })").arg(kWorkId).toUtf8();

    JsonProfileStore store;
    QVERIFY(store.loadFromJson(json));
    QCOMPARE(store.profiles().size(), 1);
    QCOMPARE(store.activeProfile().actions.size(), 1);
    QCOMPARE(store.resolve(5), KeyAction::runShellCommand("true"));
    QVERIFY(store.resolve(2).isSystem());
    QVERIFY(store.resolve(3).isSystem());
}

void TestJsonProfileStore::test_invalidJsonKeepsPreviousProfiles()
{
    JsonProfileStore store;
    QVERIFY(store.loadFromJson(twoProfiles(kGameId)));
    QVERIFY(!store.loadFromJson("{ broken"));
    QVERIFY(!store.lastError().isEmpty());
    QCOMPARE(store.activeProfile().name, QString("Game"));
}

void TestJsonProfileStore::test_loadsFromFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("profiles.json");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(twoProfiles(kGameId));
    file.close();

    JsonProfileStore store;
    QVERIFY(store.loadFromFile(path));
    QCOMPARE(store.activeProfile().name, QString("Game"));
}

QTEST_GUILESS_MAIN(TestJsonProfileStore)
#include "test_jsonprofilestore.moc"

#ifndef JSONPROFILESTORE_H
#define JSONPROFILESTORE_H

#include "ProfileResolver.h"

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QVector>

/**
 * @brief 一组命名的按键动作覆盖
 *
 * actions 中不存在的键使用 System 动作。
 */
struct KeyProfile {
    QString id;
    QString name;
    QHash<int, KeyAction> actions;
};

/**
 * @brief 从 JSON 文件读取的配置档案集合
 *
 * 文件格式：
 * {
 *   "activeProfileID": "<uuid>",
 *   "profiles": [ { "id": "<uuid>", "name": "...", "actions": { "1": {KeyAction}, ... } } ]
 * }
 *
 * 只读：档案的增删改与写回由外部负责。文件缺失或为空时只有内置 Default 档案。
 */
class JsonProfileStore : public QObject, public ProfileResolver {
    Q_OBJECT

public:
    explicit JsonProfileStore(QObject* parent = nullptr);
    ~JsonProfileStore() override;

    /**
     * @brief 从文件加载
     * @return 文件不存在视为成功（使用内置档案）；读取或解析失败返回 false
     */
    bool loadFromFile(const QString& filePath);

    bool loadFromJson(const QByteArray& data);

    QVector<KeyProfile> profiles() const { return m_profiles; }
    KeyProfile activeProfile() const;

    /**
     * @brief 切换当前档案
     * @return id 不存在时返回 false，当前档案不变
     */
    bool setActiveProfile(const QString& id);

    KeyAction resolve(int logicalKey) const override;

    QString lastError() const { return m_lastError; }

signals:
    void activeProfileChanged(const QString& id);
    void profilesReloaded();

private:
    void resetToBuiltin();
    bool parseProfile(const QJsonObject& json, KeyProfile* profile);
    void setLastError(const QString& error);

    QVector<KeyProfile> m_profiles;
    int m_activeIndex;
    QString m_lastError;
};

#endif // JSONPROFILESTORE_H

#ifndef CONFIG_H
#define CONFIG_H

#include <QtCore/QObject>
#include <QtCore/QSettings>
#include <QtCore/QVariant>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QHash>
#include <QtCore/QMutex>

class Config : public QObject
{
    Q_OBJECT

public:
    // 配置组
    enum ConfigGroup {
        General,
        Monitor,
        Simulator,
        Profiles,
        Logging
    };
    Q_ENUM(ConfigGroup)

    // 单例模式
    static Config* instance();
    static void destroyInstance();

    // 配置文件管理（目前仅支持 INI）
    void setConfigFile(const QString &filePath);
    QString configFile() const;

    // 基本操作
    void setValue(const QString &key, const QVariant &value, ConfigGroup group = General);
    QVariant value(const QString &key, const QVariant &defaultValue = QVariant(), ConfigGroup group = General) const;

    bool contains(const QString &key, ConfigGroup group = General) const;
    void remove(const QString &key, ConfigGroup group = General);

    QStringList keys(ConfigGroup group = General) const;

    // 类型安全的getter/setter
    void setString(const QString &key, const QString &value, ConfigGroup group = General);
    QString getString(const QString &key, const QString &defaultValue = QString(), ConfigGroup group = General) const;

    void setInt(const QString &key, int value, ConfigGroup group = General);
    int getInt(const QString &key, int defaultValue = 0, ConfigGroup group = General) const;

    void setBool(const QString &key, bool value, ConfigGroup group = General);
    bool getBool(const QString &key, bool defaultValue = false, ConfigGroup group = General) const;

    // 文件操作
    bool load();
    bool save();

    // 默认配置
    void resetToDefaults();
    bool isDefault(const QString &key, ConfigGroup group = General) const;
    QVariant defaultValue(const QString &key, ConfigGroup group = General) const;

    // 状态
    bool isLoaded() const;
    bool isModified() const;

    // 工具函数
    static QString groupToString(ConfigGroup group);

    // 路径工具
    static QString defaultConfigPath();
    static QString defaultProfilesPath();

signals:
    void valueChanged(const QString &key, const QVariant &value, Config::ConfigGroup group);
    void configSaved();

public slots:
    void saveIfModified();

protected:
    explicit Config(QObject *parent = nullptr);
    ~Config() override;

private:
    // 路径处理
    QString getGroupKey(const QString &key, ConfigGroup group) const;

    // 默认值设置
    void setupDefaults();
    void setDefaultValue(const QString &key, const QVariant &value, ConfigGroup group);

    // 无锁版本，供已持有 m_mutex 的成员调用
    bool saveLocked();

    // 成员变量
    static Config *s_instance;
    static QMutex s_instanceMutex;

    QString m_configFilePath;
    QSettings *m_settings;

    bool m_isLoaded;
    bool m_isModified;

    // 默认配置（键为 "组/键"）
    QHash<QString, QVariant> m_defaults;

    // 线程安全
    mutable QMutex m_mutex;
};

#endif // CONFIG_H

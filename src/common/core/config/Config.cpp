#include "Config.h"
#include "Constants.h"
#include "../logging/LoggingCategories.h"
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QStandardPaths>
#include <QtCore/QMutexLocker>

// Static member definitions
Config *Config::s_instance = nullptr;
QMutex Config::s_instanceMutex;

Config::Config(QObject *parent)
    : QObject(parent)
    , m_settings(nullptr)
    , m_isLoaded(false)
    , m_isModified(false)
{
    m_configFilePath = defaultConfigPath();
    setupDefaults();
}

Config::~Config()
{
    delete m_settings;
    m_settings = nullptr;
}

Config* Config::instance()
{
    QMutexLocker locker(&s_instanceMutex);
    if (s_instance == nullptr) {
        s_instance = new Config();
    }
    return s_instance;
}

void Config::destroyInstance()
{
    QMutexLocker locker(&s_instanceMutex);
    delete s_instance;
    s_instance = nullptr;
}

void Config::setConfigFile(const QString &filePath)
{
    QMutexLocker locker(&m_mutex);

    m_configFilePath = filePath;

    // 重建 QSettings 实例
    delete m_settings;
    m_settings = new QSettings(m_configFilePath, QSettings::IniFormat);
    m_isLoaded = false;
    m_isModified = false;

    qCDebug(lcConfig) << "Config file set to" << m_configFilePath;
}

QString Config::configFile() const
{
    QMutexLocker locker(&m_mutex);
    return m_configFilePath;
}

bool Config::load()
{
    QMutexLocker locker(&m_mutex);

    if (!m_settings) {
        m_settings = new QSettings(m_configFilePath, QSettings::IniFormat);
    }

    if (!QFile::exists(m_configFilePath)) {
        qCInfo(lcConfig) << "Config file does not exist, using defaults:" << m_configFilePath;
        m_isLoaded = false;
        return false;
    }

    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qCWarning(lcConfig) << "Failed to read config file:" << m_configFilePath;
        m_isLoaded = false;
        return false;
    }

    m_isLoaded = true;
    m_isModified = false;
    return true;
}

bool Config::save()
{
    QMutexLocker locker(&m_mutex);
    bool success = saveLocked();
    locker.unlock();

    if (success) {
        emit configSaved();
    }
    return success;
}

bool Config::saveLocked()
{
    if (!m_settings) {
        return false;
    }

    QDir().mkpath(QFileInfo(m_configFilePath).absolutePath());
    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qCWarning(lcConfig) << "Failed to write config file:" << m_configFilePath;
        return false;
    }

    m_isModified = false;
    return true;
}

void Config::saveIfModified()
{
    if (isModified()) {
        save();
    }
}

void Config::setValue(const QString &key, const QVariant &value, ConfigGroup group)
{
    QMutexLocker locker(&m_mutex);

    if (!m_settings) {
        m_settings = new QSettings(m_configFilePath, QSettings::IniFormat);
    }

    QString groupKey = getGroupKey(key, group);
    if (m_settings->value(groupKey) == value) {
        return;
    }

    m_settings->setValue(groupKey, value);
    m_isModified = true;
    locker.unlock();

    emit valueChanged(key, value, group);
}

QVariant Config::value(const QString &key, const QVariant &defaultValue, ConfigGroup group) const
{
    QMutexLocker locker(&m_mutex);

    QString groupKey = getGroupKey(key, group);
    if (m_settings && m_settings->contains(groupKey)) {
        return m_settings->value(groupKey);
    }

    // 调用方未给出默认值时，回落到注册的默认配置
    if (!defaultValue.isValid()) {
        return m_defaults.value(groupKey);
    }
    return defaultValue;
}

bool Config::contains(const QString &key, ConfigGroup group) const
{
    QMutexLocker locker(&m_mutex);

    QString groupKey = getGroupKey(key, group);
    return m_settings ? m_settings->contains(groupKey) : false;
}

void Config::remove(const QString &key, ConfigGroup group)
{
    QMutexLocker locker(&m_mutex);

    QString groupKey = getGroupKey(key, group);
    if (!m_settings || !m_settings->contains(groupKey)) {
        return;
    }

    m_settings->remove(groupKey);
    m_isModified = true;
    locker.unlock();

    emit valueChanged(key, QVariant(), group);
}

QStringList Config::keys(ConfigGroup group) const
{
    QMutexLocker locker(&m_mutex);
    if (!m_settings) return QStringList();

    m_settings->beginGroup(groupToString(group));
    QStringList keys = m_settings->childKeys();
    m_settings->endGroup();
    return keys;
}

void Config::setString(const QString &key, const QString &value, ConfigGroup group)
{
    setValue(key, value, group);
}

QString Config::getString(const QString &key, const QString &defaultValue, ConfigGroup group) const
{
    return value(key, defaultValue.isNull() ? QVariant() : QVariant(defaultValue), group).toString();
}

void Config::setInt(const QString &key, int value, ConfigGroup group)
{
    setValue(key, value, group);
}

int Config::getInt(const QString &key, int defaultValue, ConfigGroup group) const
{
    bool ok = false;
    int result = value(key, defaultValue, group).toInt(&ok);
    return ok ? result : defaultValue;
}

void Config::setBool(const QString &key, bool value, ConfigGroup group)
{
    setValue(key, value, group);
}

bool Config::getBool(const QString &key, bool defaultValue, ConfigGroup group) const
{
    return value(key, defaultValue, group).toBool();
}

void Config::resetToDefaults()
{
    QMutexLocker locker(&m_mutex);

    if (!m_settings) {
        m_settings = new QSettings(m_configFilePath, QSettings::IniFormat);
    }

    m_settings->clear();
    for (auto it = m_defaults.constBegin(); it != m_defaults.constEnd(); ++it) {
        m_settings->setValue(it.key(), it.value());
    }
    m_isModified = true;
}

bool Config::isDefault(const QString &key, ConfigGroup group) const
{
    QMutexLocker locker(&m_mutex);

    QString groupKey = getGroupKey(key, group);
    if (!m_settings || !m_settings->contains(groupKey)) {
        return true;
    }
    return m_settings->value(groupKey) == m_defaults.value(groupKey);
}

QVariant Config::defaultValue(const QString &key, ConfigGroup group) const
{
    QMutexLocker locker(&m_mutex);
    return m_defaults.value(getGroupKey(key, group));
}

bool Config::isLoaded() const
{
    QMutexLocker locker(&m_mutex);
    return m_isLoaded;
}

bool Config::isModified() const
{
    QMutexLocker locker(&m_mutex);
    return m_isModified;
}

QString Config::getGroupKey(const QString &key, ConfigGroup group) const
{
    return groupToString(group) + "/" + key;
}

void Config::setDefaultValue(const QString &key, const QVariant &value, ConfigGroup group)
{
    m_defaults.insert(getGroupKey(key, group), value);
}

void Config::setupDefaults()
{
    setDefaultValue("rateLimitIntervalMs", FnKeyConstants::Simulator::DEFAULT_RATE_LIMIT_INTERVAL_MS, Simulator);
    setDefaultValue("uinputDevice", QString::fromLatin1(FnKeyConstants::Simulator::DEFAULT_UINPUT_DEVICE), Simulator);

    setDefaultValue("enabled", true, Monitor);
    setDefaultValue("devicePath", QString(), Monitor);
    setDefaultValue("dispatchPhysicalKeys", true, Monitor);

    setDefaultValue("file", defaultProfilesPath(), Profiles);

    setDefaultValue("rules", QString(), Logging);
}

QString Config::groupToString(ConfigGroup group)
{
    switch (group) {
    case ConfigGroup::General:
        return "General";
    case ConfigGroup::Monitor:
        return "Monitor";
    case ConfigGroup::Simulator:
        return "Simulator";
    case ConfigGroup::Profiles:
        return "Profiles";
    case ConfigGroup::Logging:
        return "Logging";
    }
    return "General";
}

QString Config::defaultConfigPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) + "/settings.ini";
}

QString Config::defaultProfilesPath()
{
    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) + "/profiles.json";
}

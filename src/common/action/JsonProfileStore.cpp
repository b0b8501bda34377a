#include "JsonProfileStore.h"
#include "../core/config/Constants.h"
#include "../core/logging/LoggingCategories.h"

#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonParseError>
#include <QtCore/QUuid>

JsonProfileStore::JsonProfileStore(QObject* parent)
    : QObject(parent)
    , m_activeIndex(0) {
    resetToBuiltin();
}

JsonProfileStore::~JsonProfileStore() {
}

bool JsonProfileStore::loadFromFile(const QString& filePath) {
    QFile file(filePath);
    if ( !file.exists() ) {
        qCInfo(lcProfile) << "Profile file does not exist, using built-in Default profile:" << filePath;
        resetToBuiltin();
        emit profilesReloaded();
        return true;
    }

    if ( !file.open(QIODevice::ReadOnly) ) {
        setLastError(QString("Failed to open profile file %1: %2").arg(filePath, file.errorString()));
        qCWarning(lcProfile) << m_lastError;
        return false;
    }

    return loadFromJson(file.readAll());
}

bool JsonProfileStore::loadFromJson(const QByteArray& data) {
    if ( data.trimmed().isEmpty() ) {
        resetToBuiltin();
        emit profilesReloaded();
        return true;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if ( parseError.error != QJsonParseError::NoError || !doc.isObject() ) {
        setLastError(QString("Invalid profile document: %1").arg(parseError.errorString()));
        qCWarning(lcProfile) << m_lastError;
        return false;
    }

    const QJsonObject root = doc.object();
    QVector<KeyProfile> loaded;
    const QJsonArray profiles = root.value("profiles").toArray();
    for ( const QJsonValue& value : profiles ) {
        KeyProfile profile;
        if ( !value.isObject() || !parseProfile(value.toObject(), &profile) ) {
            qCWarning(lcProfile) << "Skipping malformed profile entry";
            continue;
        }
        loaded.append(profile);
    }

    if ( loaded.isEmpty() ) {
        resetToBuiltin();
    } else {
        m_profiles = loaded;
        m_activeIndex = 0;

        const QString activeId = root.value("activeProfileID").toString();
        for ( int i = 0; i < m_profiles.size(); ++i ) {
            if ( m_profiles.at(i).id == activeId ) {
                m_activeIndex = i;
                break;
            }
        }
    }

    qCInfo(lcProfile) << "Loaded" << m_profiles.size() << "profile(s), active:" << activeProfile().name;
    emit profilesReloaded();
    return true;
}

KeyProfile JsonProfileStore::activeProfile() const {
    return m_profiles.at(m_activeIndex);
}

bool JsonProfileStore::setActiveProfile(const QString& id) {
    for ( int i = 0; i < m_profiles.size(); ++i ) {
        if ( m_profiles.at(i).id == id ) {
            if ( i != m_activeIndex ) {
                m_activeIndex = i;
                qCInfo(lcProfile) << "Active profile:" << m_profiles.at(i).name;
                emit activeProfileChanged(id);
            }
            return true;
        }
    }

    setLastError(QString("Unknown profile id %1").arg(id));
    return false;
}

KeyAction JsonProfileStore::resolve(int logicalKey) const {
    return m_profiles.at(m_activeIndex).actions.value(logicalKey, KeyAction::system());
}

void JsonProfileStore::resetToBuiltin() {
    KeyProfile builtin;
    builtin.id = FnKeyConstants::Profile::DEFAULT_PROFILE_ID;
    builtin.name = FnKeyConstants::Profile::DEFAULT_PROFILE_NAME;

    m_profiles.clear();
    m_profiles.append(builtin);
    m_activeIndex = 0;
}

bool JsonProfileStore::parseProfile(const QJsonObject& json, KeyProfile* profile) {
    const QString id = json.value("id").toString();
    if ( QUuid::fromString(id).isNull() ) {
        return false;
    }

    profile->id = id;
    profile->name = json.value("name").toString();

    const QJsonObject actions = json.value("actions").toObject();
    for ( auto it = actions.constBegin(); it != actions.constEnd(); ++it ) {
        bool keyOk = false;
        const int key = it.key().toInt(&keyOk);
        if ( !keyOk || !FnKeyConstants::isValidLogicalKey(key) ) {
            qCWarning(lcProfile) << "Profile" << profile->name << "ignores action for invalid key" << it.key();
            continue;
        }

        bool actionOk = false;
        QString error;
        const KeyAction action = KeyAction::fromJson(it.value().toObject(), &actionOk, &error);
        if ( !actionOk ) {
            qCWarning(lcProfile) << "Profile" << profile->name << "key" << key << ":" << error;
            continue;
        }

        // 缺省即 System，不单独存储
        if ( !action.isSystem() ) {
            profile->actions.insert(key, action);
        }
    }
    return true;
}

void JsonProfileStore::setLastError(const QString& error) {
    m_lastError = error;
}

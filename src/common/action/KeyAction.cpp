#include "KeyAction.h"
#include <QtCore/QJsonValue>

namespace {

const QString kTypeKey = QStringLiteral("type");
const QString kBundleIdKey = QStringLiteral("bundleID");
const QString kUrlKey = QStringLiteral("url");
const QString kCommandKey = QStringLiteral("cmd");

QString payloadKeyFor(KeyAction::Type type) {
    switch ( type ) {
        case KeyAction::Type::OpenApplication:
            return kBundleIdKey;
        case KeyAction::Type::OpenUrl:
            return kUrlKey;
        case KeyAction::Type::RunShellCommand:
            return kCommandKey;
        case KeyAction::Type::System:
            break;
    }
    return QString();
}

void setResult(bool* ok, QString* error, bool success, const QString& message = QString()) {
    if ( ok ) {
        *ok = success;
    }
    if ( error ) {
        *error = message;
    }
}

} // namespace

KeyAction::KeyAction()
    : m_type(Type::System) {
}

KeyAction::KeyAction(Type type, const QString& target)
    : m_type(type)
    , m_target(target) {
}

KeyAction KeyAction::system() {
    return KeyAction();
}

KeyAction KeyAction::openApplication(const QString& applicationId) {
    return KeyAction(Type::OpenApplication, applicationId);
}

KeyAction KeyAction::openUrl(const QUrl& url) {
    return KeyAction(Type::OpenUrl, url.toString(QUrl::FullyEncoded));
}

KeyAction KeyAction::runShellCommand(const QString& command) {
    return KeyAction(Type::RunShellCommand, command);
}

QUrl KeyAction::url() const {
    if ( m_type != Type::OpenUrl ) {
        return QUrl();
    }
    return QUrl(m_target, QUrl::StrictMode);
}

QJsonObject KeyAction::toJson() const {
    QJsonObject json;
    json.insert(kTypeKey, typeToString(m_type));

    const QString payloadKey = payloadKeyFor(m_type);
    if ( !payloadKey.isEmpty() ) {
        json.insert(payloadKey, m_target);
    }
    return json;
}

KeyAction KeyAction::fromJson(const QJsonObject& json, bool* ok, QString* error) {
    const QJsonValue typeValue = json.value(kTypeKey);
    if ( !typeValue.isString() ) {
        setResult(ok, error, false, "Missing or non-string \"type\" field");
        return KeyAction();
    }

    Type type = Type::System;
    if ( !typeFromString(typeValue.toString(), &type) ) {
        setResult(ok, error, false, QString("Unknown action type \"%1\"").arg(typeValue.toString()));
        return KeyAction();
    }

    if ( type == Type::System ) {
        setResult(ok, error, true);
        return KeyAction();
    }

    const QString payloadKey = payloadKeyFor(type);
    const QJsonValue payload = json.value(payloadKey);
    if ( !payload.isString() ) {
        setResult(ok, error, false, QString("Missing or non-string \"%1\" field").arg(payloadKey));
        return KeyAction();
    }

    const QString target = payload.toString();
    if ( type == Type::OpenUrl ) {
        QUrl url(target, QUrl::StrictMode);
        if ( target.isEmpty() || !url.isValid() ) {
            setResult(ok, error, false, QString("Invalid URL \"%1\"").arg(target));
            return KeyAction();
        }
    }

    setResult(ok, error, true);
    return KeyAction(type, target);
}

QString KeyAction::typeToString(Type type) {
    switch ( type ) {
        case Type::System:
            return QStringLiteral("system");
        case Type::OpenApplication:
            return QStringLiteral("openApp");
        case Type::OpenUrl:
            return QStringLiteral("openURL");
        case Type::RunShellCommand:
            return QStringLiteral("shellCommand");
    }
    return QStringLiteral("system");
}

bool KeyAction::typeFromString(const QString& str, Type* type) {
    Type parsed;
    if ( str == QLatin1String("system") ) {
        parsed = Type::System;
    } else if ( str == QLatin1String("openApp") ) {
        parsed = Type::OpenApplication;
    } else if ( str == QLatin1String("openURL") ) {
        parsed = Type::OpenUrl;
    } else if ( str == QLatin1String("shellCommand") ) {
        parsed = Type::RunShellCommand;
    } else {
        return false;
    }

    if ( type ) {
        *type = parsed;
    }
    return true;
}

QString KeyAction::typeName() const {
    switch ( m_type ) {
        case Type::System:
            return QStringLiteral("System");
        case Type::OpenApplication:
            return QStringLiteral("App");
        case Type::OpenUrl:
            return QStringLiteral("URL");
        case Type::RunShellCommand:
            return QStringLiteral("Shell");
    }
    return QStringLiteral("System");
}

QString KeyAction::displaySummary() const {
    if ( m_type == Type::System ) {
        return QStringLiteral("System Default");
    }
    return m_target;
}

bool KeyAction::operator==(const KeyAction& other) const {
    return m_type == other.m_type && m_target == other.m_target;
}

#ifndef KEYACTION_H
#define KEYACTION_H

#include <QtCore/QJsonObject>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QUrl>

/**
 * @brief 功能键被触发时执行的动作
 *
 * 不可变的值类型，四种变体：
 * - System：发送该键的默认系统事件
 * - OpenApplication：按桌面文件 ID 启动应用
 * - OpenUrl：交给系统默认程序打开 URL
 * - RunShellCommand：通过 /bin/sh -c 在后台执行命令
 *
 * 持久化格式与外部配置档案共享，必须逐字段往返：
 * {"type":"system"} / {"type":"openApp","bundleID":...} /
 * {"type":"openURL","url":...} / {"type":"shellCommand","cmd":...}
 */
class KeyAction {
public:
    enum class Type {
        System,
        OpenApplication,
        OpenUrl,
        RunShellCommand
    };

    KeyAction();

    static KeyAction system();
    static KeyAction openApplication(const QString& applicationId);
    static KeyAction openUrl(const QUrl& url);
    static KeyAction runShellCommand(const QString& command);

    Type type() const { return m_type; }
    bool isSystem() const { return m_type == Type::System; }

    /// 应用 ID、URL 字符串或命令文本；System 为空
    QString target() const { return m_target; }
    QUrl url() const;

    // 序列化
    QJsonObject toJson() const;

    /**
     * @brief 从持久化记录解析
     * @param json 记录对象
     * @param ok 解析成功时置 true；失败时置 false 并返回 System
     * @param error 可选的错误描述
     */
    static KeyAction fromJson(const QJsonObject& json, bool* ok = nullptr, QString* error = nullptr);

    // 类型字符串（持久化 "type" 字段）
    static QString typeToString(Type type);
    static bool typeFromString(const QString& str, Type* type);

    // 显示辅助
    QString typeName() const;
    QString displaySummary() const;

    bool operator==(const KeyAction& other) const;
    bool operator!=(const KeyAction& other) const { return !(*this == other); }

private:
    KeyAction(Type type, const QString& target);

    Type m_type;
    QString m_target;
};

Q_DECLARE_METATYPE(KeyAction)
Q_DECLARE_METATYPE(KeyAction::Type)

#endif // KEYACTION_H

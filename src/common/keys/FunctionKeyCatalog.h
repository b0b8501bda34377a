#ifndef FUNCTIONKEYCATALOG_H
#define FUNCTIONKEYCATALOG_H

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>

/**
 * @brief 功能键的静态描述信息
 */
struct FunctionKeyInfo {
    int id;                 // 逻辑键 1-12
    QString label;          // 键帽文字，例如 "F1"
    QString description;    // 默认系统功能，例如 "Brightness Down"
    QString group;          // 物理键盘上的分组，例如 "Brightness"
};

/**
 * @brief 12 个功能键的元数据目录
 */
class FunctionKeyCatalog {
public:
    static const QVector<FunctionKeyInfo>& allKeys();

    /**
     * @brief 按逻辑键查找
     * @return 越界时返回 nullptr
     */
    static const FunctionKeyInfo* find(int id);

    /// 分组名称，按键盘从左到右的顺序
    static QStringList groups();

    static QVector<FunctionKeyInfo> keysInGroup(const QString& group);

private:
    FunctionKeyCatalog() = delete;
};

#endif // FUNCTIONKEYCATALOG_H

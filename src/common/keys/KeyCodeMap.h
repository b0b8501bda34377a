#ifndef KEYCODEMAP_H
#define KEYCODEMAP_H

#include <QtCore/QVector>

/**
 * @brief 原始键码与逻辑功能键之间的静态映射
 *
 * 原始键码为 Linux evdev 键码（KEY_F1 ... KEY_F12），逻辑键为 1-12。
 * 纯查表，无状态，可在任意线程调用。
 */
class KeyCodeMap {
public:
    /// 无映射时的返回值
    static constexpr int INVALID_KEY = 0;

    /**
     * @brief 原始键码转逻辑键
     * @return 逻辑键 1-12，未映射的键码返回 INVALID_KEY
     */
    static int toLogicalKey(int rawCode);

    /**
     * @brief 逻辑键转原始键码
     * @return evdev 键码，逻辑键越界时返回 INVALID_KEY
     */
    static int toRawCode(int logicalKey);

    static bool isMapped(int rawCode) { return toLogicalKey(rawCode) != INVALID_KEY; }

    /// 所有被映射的原始键码，按逻辑键顺序
    static QVector<int> rawCodes();

private:
    KeyCodeMap() = delete;
};

#endif // KEYCODEMAP_H

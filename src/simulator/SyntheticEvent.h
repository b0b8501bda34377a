#ifndef SYNTHETICEVENT_H
#define SYNTHETICEVENT_H

#include <QtCore/QString>
#include <QtCore/QVector>
#include <QtCore/QtGlobal>

/**
 * @brief 合成事件的两个族
 *
 * 系统把亮度/音量/媒体这类“特殊功能键”和普通虚拟键建模为不同的事件族，
 * 没有一种编码能同时覆盖两者。
 */
enum class EventFamily {
    SpecialKey,     // 系统定义事件，经 uinput 发出
    VirtualKey      // 普通虚拟键，经 XTest 发出
};

/**
 * @brief 一条待发出的合成事件
 *
 * 特殊键：subtype 固定为辅助控制按钮，data1 = (键码 << 16) | 状态标志，data2 = -1（不重复）。
 * 虚拟键：virtualKey 为 X11 keysym。
 */
struct SyntheticEvent {
    EventFamily family = EventFamily::SpecialKey;
    int subtype = 0;
    int data1 = 0;
    int data2 = 0;
    quint32 virtualKey = 0;
    bool keyDown = false;

    bool operator==(const SyntheticEvent& other) const;
    bool operator!=(const SyntheticEvent& other) const { return !(*this == other); }
};

/**
 * @brief 逻辑键的默认系统行为：事件族 + 该族中的键码
 */
struct SystemKeyBinding {
    int logicalKey;
    EventFamily family;
    quint32 code;           ///< 特殊键为 evdev 键码，虚拟键为 keysym
    const char* name;
};

/**
 * @brief 合成事件编码
 *
 * 默认行为表是一个静态数组，新增按键只需要加一行数据。
 */
class SyntheticEventEncoder {
public:
    static constexpr int AUX_CONTROL_BUTTON_SUBTYPE = 8;
    static constexpr int KEY_DOWN_FLAGS = 0x0a00;
    static constexpr int KEY_UP_FLAGS = 0x0b00;
    static constexpr int NO_REPEAT = -1;

    static SyntheticEvent specialKeyEvent(int specialKeyCode, bool keyDown);
    static SyntheticEvent virtualKeyEvent(quint32 keysym, bool keyDown);

    /**
     * @brief 解出特殊键事件的键码和按下状态
     * @return 事件不是合法的特殊键编码时返回 false
     */
    static bool decodeSpecialKey(const SyntheticEvent& event, int* specialKeyCode, bool* keyDown);

    /// 查默认行为表，逻辑键越界返回 nullptr
    static const SystemKeyBinding* bindingFor(int logicalKey);

    /// 整张默认行为表
    static QVector<SystemKeyBinding> bindings();

    /**
     * @brief 逻辑键默认行为对应的事件序列：按下紧跟抬起
     * @return 逻辑键越界时为空
     */
    static QVector<SyntheticEvent> eventsForKey(int logicalKey);

    static QString familyName(EventFamily family);

private:
    SyntheticEventEncoder() = delete;
};

#endif // SYNTHETICEVENT_H

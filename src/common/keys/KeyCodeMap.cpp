#include "KeyCodeMap.h"
#include "../core/config/Constants.h"

#include <linux/input-event-codes.h>

namespace {

// 下标 = 逻辑键 - 1
constexpr int kRawCodes[FnKeyConstants::Keys::LOGICAL_KEY_COUNT] = {
    KEY_F1,   // 59
    KEY_F2,   // 60
    KEY_F3,   // 61
    KEY_F4,   // 62
    KEY_F5,   // 63
    KEY_F6,   // 64
    KEY_F7,   // 65
    KEY_F8,   // 66
    KEY_F9,   // 67
    KEY_F10,  // 68
    KEY_F11,  // 87
    KEY_F12   // 88
};

} // namespace

int KeyCodeMap::toLogicalKey(int rawCode) {
    for ( int i = 0; i < FnKeyConstants::Keys::LOGICAL_KEY_COUNT; ++i ) {
        if ( kRawCodes[i] == rawCode ) {
            return i + FnKeyConstants::Keys::MIN_LOGICAL_KEY;
        }
    }
    return INVALID_KEY;
}

int KeyCodeMap::toRawCode(int logicalKey) {
    if ( !FnKeyConstants::isValidLogicalKey(logicalKey) ) {
        return INVALID_KEY;
    }
    return kRawCodes[logicalKey - FnKeyConstants::Keys::MIN_LOGICAL_KEY];
}

QVector<int> KeyCodeMap::rawCodes() {
    QVector<int> codes;
    codes.reserve(FnKeyConstants::Keys::LOGICAL_KEY_COUNT);
    for ( int code : kRawCodes ) {
        codes.append(code);
    }
    return codes;
}

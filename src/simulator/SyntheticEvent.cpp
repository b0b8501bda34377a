#include "SyntheticEvent.h"
#include "../common/core/config/Constants.h"

#include <linux/input-event-codes.h>
#include <X11/XF86keysym.h>

namespace {

const SystemKeyBinding kSystemBindings[FnKeyConstants::Keys::LOGICAL_KEY_COUNT] = {
    { 1, EventFamily::SpecialKey, KEY_BRIGHTNESSDOWN, "Brightness Down" },
    { 2, EventFamily::SpecialKey, KEY_BRIGHTNESSUP, "Brightness Up" },
    { 3, EventFamily::VirtualKey, XF86XK_LaunchA, "Mission Control" },
    { 4, EventFamily::VirtualKey, XF86XK_LaunchB, "Launchpad" },
    { 5, EventFamily::SpecialKey, KEY_KBDILLUMDOWN, "Keyboard Brightness Down" },
    { 6, EventFamily::SpecialKey, KEY_KBDILLUMUP, "Keyboard Brightness Up" },
    { 7, EventFamily::SpecialKey, KEY_PREVIOUSSONG, "Previous Track" },
    { 8, EventFamily::SpecialKey, KEY_PLAYPAUSE, "Play/Pause" },
    { 9, EventFamily::SpecialKey, KEY_NEXTSONG, "Next Track" },
    { 10, EventFamily::SpecialKey, KEY_MUTE, "Mute" },
    { 11, EventFamily::SpecialKey, KEY_VOLUMEDOWN, "Volume Down" },
    { 12, EventFamily::SpecialKey, KEY_VOLUMEUP, "Volume Up" }
};

} // namespace

bool SyntheticEvent::operator==(const SyntheticEvent& other) const {
    return family == other.family
        && subtype == other.subtype
        && data1 == other.data1
        && data2 == other.data2
        && virtualKey == other.virtualKey
        && keyDown == other.keyDown;
}

SyntheticEvent SyntheticEventEncoder::specialKeyEvent(int specialKeyCode, bool keyDown) {
    SyntheticEvent event;
    event.family = EventFamily::SpecialKey;
    event.subtype = AUX_CONTROL_BUTTON_SUBTYPE;
    event.data1 = (specialKeyCode << 16) | (keyDown ? KEY_DOWN_FLAGS : KEY_UP_FLAGS);
    event.data2 = NO_REPEAT;
    event.keyDown = keyDown;
    return event;
}

SyntheticEvent SyntheticEventEncoder::virtualKeyEvent(quint32 keysym, bool keyDown) {
    SyntheticEvent event;
    event.family = EventFamily::VirtualKey;
    event.virtualKey = keysym;
    event.keyDown = keyDown;
    return event;
}

bool SyntheticEventEncoder::decodeSpecialKey(const SyntheticEvent& event, int* specialKeyCode, bool* keyDown) {
    if ( event.family != EventFamily::SpecialKey || event.subtype != AUX_CONTROL_BUTTON_SUBTYPE ) {
        return false;
    }

    const int flags = event.data1 & 0xffff;
    if ( flags != KEY_DOWN_FLAGS && flags != KEY_UP_FLAGS ) {
        return false;
    }

    if ( specialKeyCode ) {
        *specialKeyCode = (event.data1 >> 16) & 0xffff;
    }
    if ( keyDown ) {
        *keyDown = flags == KEY_DOWN_FLAGS;
    }
    return true;
}

const SystemKeyBinding* SyntheticEventEncoder::bindingFor(int logicalKey) {
    if ( !FnKeyConstants::isValidLogicalKey(logicalKey) ) {
        return nullptr;
    }
    return &kSystemBindings[logicalKey - FnKeyConstants::Keys::MIN_LOGICAL_KEY];
}

QVector<SystemKeyBinding> SyntheticEventEncoder::bindings() {
    QVector<SystemKeyBinding> result;
    result.reserve(FnKeyConstants::Keys::LOGICAL_KEY_COUNT);
    for ( const SystemKeyBinding& binding : kSystemBindings ) {
        result.append(binding);
    }
    return result;
}

QVector<SyntheticEvent> SyntheticEventEncoder::eventsForKey(int logicalKey) {
    QVector<SyntheticEvent> events;
    const SystemKeyBinding* binding = bindingFor(logicalKey);
    if ( !binding ) {
        return events;
    }

    switch ( binding->family ) {
        case EventFamily::SpecialKey:
            events << specialKeyEvent(static_cast<int>(binding->code), true)
                   << specialKeyEvent(static_cast<int>(binding->code), false);
            break;
        case EventFamily::VirtualKey:
            events << virtualKeyEvent(binding->code, true)
                   << virtualKeyEvent(binding->code, false);
            break;
    }
    return events;
}

QString SyntheticEventEncoder::familyName(EventFamily family) {
    switch ( family ) {
        case EventFamily::SpecialKey:
            return "SpecialKey";
        case EventFamily::VirtualKey:
            return "VirtualKey";
    }
    return "Unknown";
}

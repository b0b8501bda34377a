#include "FunctionKeyCatalog.h"
#include "../core/config/Constants.h"

const QVector<FunctionKeyInfo>& FunctionKeyCatalog::allKeys() {
    static const QVector<FunctionKeyInfo> keys = {
        { 1,  "F1",  "Brightness Down",          "Brightness" },
        { 2,  "F2",  "Brightness Up",            "Brightness" },
        { 3,  "F3",  "Mission Control",          "Desktop" },
        { 4,  "F4",  "Launchpad",                "Desktop" },
        { 5,  "F5",  "Keyboard Brightness Down", "KB Light" },
        { 6,  "F6",  "Keyboard Brightness Up",   "KB Light" },
        { 7,  "F7",  "Previous Track",           "Media" },
        { 8,  "F8",  "Play / Pause",             "Media" },
        { 9,  "F9",  "Next Track",               "Media" },
        { 10, "F10", "Mute",                     "Sound" },
        { 11, "F11", "Volume Down",              "Sound" },
        { 12, "F12", "Volume Up",                "Sound" },
    };
    return keys;
}

const FunctionKeyInfo* FunctionKeyCatalog::find(int id) {
    if ( !FnKeyConstants::isValidLogicalKey(id) ) {
        return nullptr;
    }
    return &allKeys().at(id - FnKeyConstants::Keys::MIN_LOGICAL_KEY);
}

QStringList FunctionKeyCatalog::groups() {
    QStringList result;
    for ( const FunctionKeyInfo& info : allKeys() ) {
        if ( !result.contains(info.group) ) {
            result << info.group;
        }
    }
    return result;
}

QVector<FunctionKeyInfo> FunctionKeyCatalog::keysInGroup(const QString& group) {
    QVector<FunctionKeyInfo> result;
    for ( const FunctionKeyInfo& info : allKeys() ) {
        if ( info.group == group ) {
            result.append(info);
        }
    }
    return result;
}

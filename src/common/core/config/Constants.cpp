#include "Constants.h"
#include <QtCore/QtGlobal>

// 版本信息静态成员定义
const QString FnKeyConstants::Version::VERSION_STRING =
    QString("%1.%2.%3").arg(MAJOR).arg(MINOR).arg(PATCH);

// 配置档案字符串常量
const QString FnKeyConstants::Profile::DEFAULT_PROFILE_ID = "00000000-0000-0000-0000-000000000001";
const QString FnKeyConstants::Profile::DEFAULT_PROFILE_NAME = "Default";

/**
 * @brief 获取应用程序版本信息
 * @return 版本字符串
 */
QString FnKeyConstants::getVersionString()
{
    return Version::VERSION_STRING;
}

bool FnKeyConstants::isValidLogicalKey(int key)
{
    return key >= Keys::MIN_LOGICAL_KEY && key <= Keys::MAX_LOGICAL_KEY;
}

int FnKeyConstants::clampRateLimitInterval(int intervalMs)
{
    return qBound(Simulator::MIN_RATE_LIMIT_INTERVAL_MS, intervalMs, Simulator::MAX_RATE_LIMIT_INTERVAL_MS);
}

#ifndef PROFILERESOLVER_H
#define PROFILERESOLVER_H

#include "KeyAction.h"

/**
 * @brief 逻辑键到动作的解析接口
 *
 * 由外部配置档案提供。实现必须是同步、无副作用的查表；
 * 未配置的键返回 KeyAction::system()。
 */
class ProfileResolver {
public:
    virtual ~ProfileResolver() = default;

    virtual KeyAction resolve(int logicalKey) const = 0;
};

#endif // PROFILERESOLVER_H

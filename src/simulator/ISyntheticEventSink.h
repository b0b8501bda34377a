#ifndef ISYNTHETICEVENTSINK_H
#define ISYNTHETICEVENTSINK_H

#include "SyntheticEvent.h"

#include <QtCore/QString>

/**
 * @brief 合成事件的输出端
 *
 * 把编码好的事件投递回操作系统。投递是尽力而为的，调用方不等待结果。
 */
class ISyntheticEventSink {
public:
    virtual ~ISyntheticEventSink() = default;

    // 初始化和清理
    virtual bool initialize() = 0;
    virtual void cleanup() = 0;
    virtual bool isInitialized() const = 0;

    /**
     * @brief 投递一条事件
     * @return 平台拒绝或该事件族不可用时返回 false
     */
    virtual bool post(const SyntheticEvent& event) = 0;

    virtual QString lastError() const = 0;
};

#endif // ISYNTHETICEVENTSINK_H

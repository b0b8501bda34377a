#ifndef CALLBACKBRIDGE_H
#define CALLBACKBRIDGE_H

#include "../common/core/logging/LoggingCategories.h"

#include <QtCore/QCoreApplication>
#include <QtCore/QMutex>
#include <QtCore/QThread>
#include <QtCore/QTimer>

/**
 * @brief 跨越原生回调边界的安全句柄
 *
 * 原生钩子只接受一个不透明的 void* 作为回调上下文，并且可能在任意线程、
 * 任意时刻（包括所有者开始析构之后）调用回调。本类把这个 void* 变成一个
 * 只能通过 resolve() 访问的令牌：
 *
 * - token() 只能取一次，交给原生注册接口；
 * - resolve(token) 返回 Guard，要么持有存活的所有者（非拥有引用），
 *   要么表示“所有者已消失”；Guard 存活期间所有者不会被 detach；
 * - detach() 之后所有 resolve() 都得到“已消失”；
 * - release() 幂等，先 detach，再把上下文的释放推迟到下一次事件循环，
 *   让已经在途的回调先结束。
 *
 * 调用方负责顺序：先停用钩子、再注销投递、最后 release()。
 * release() 之后上下文内存仍保留一个调度周期，超过这个周期再使用令牌属于调用方错误。
 * 事件循环已经退出时（例如在 aboutToQuit 中停止），上下文随应用对象一起析构。
 */
template <typename Owner>
class CallbackBridge {
    struct Context {
        explicit Context(Owner* o) : owner(o) {}
        QMutex mutex;
        Owner* owner;   // detach 后为 nullptr
    };

    // 推迟释放期间持有上下文；父对象为应用对象，定时器来不及触发时随应用析构
    class ContextHolder : public QObject {
    public:
        ContextHolder(Context* context, QObject* parent)
            : QObject(parent)
            , m_context(context) {
            setObjectName(QStringLiteral("CallbackBridgeContext"));
        }
        ~ContextHolder() override { delete m_context; }

    private:
        Context* m_context;
    };

public:
    /**
     * @brief resolve() 的结果
     *
     * 持有上下文锁直到析构，因此不要在 Guard 存活期间做阻塞操作。
     */
    class Guard {
    public:
        ~Guard() {
            if ( m_mutex ) {
                m_mutex->unlock();
            }
        }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        Owner* owner() const { return m_owner; }
        explicit operator bool() const { return m_owner != nullptr; }

    private:
        friend class CallbackBridge;

        explicit Guard(Context* context)
            : m_mutex(context ? &context->mutex : nullptr)
            , m_owner(nullptr) {
            if ( m_mutex ) {
                m_mutex->lock();
                m_owner = context->owner;
            }
        }

        QMutex* m_mutex;
        Owner* m_owner;
    };

    explicit CallbackBridge(Owner* owner)
        : m_context(new Context(owner))
        , m_tokenIssued(false) {
    }

    ~CallbackBridge() {
        release();
    }

    CallbackBridge(const CallbackBridge&) = delete;
    CallbackBridge& operator=(const CallbackBridge&) = delete;

    /**
     * @brief 取得交给原生回调的不透明令牌
     * @return 第二次及以后调用、或已 release 时返回 nullptr
     */
    void* token() {
        if ( m_tokenIssued || !m_context ) {
            qCWarning(lcCallbackBridge) << "Callback token requested more than once";
            return nullptr;
        }
        m_tokenIssued = true;
        return m_context;
    }

    /**
     * @brief 从令牌解析所有者，可在任意线程调用
     */
    static Guard resolve(void* token) {
        return Guard(static_cast<Context*>(token));
    }

    /// 之后所有 resolve() 都得到“所有者已消失”；会等待正在持有 Guard 的回调结束
    void detach() {
        if ( !m_context ) {
            return;
        }
        QMutexLocker locker(&m_context->mutex);
        m_context->owner = nullptr;
    }

    bool isReleased() const { return m_context == nullptr; }

    /**
     * @brief 释放上下文（幂等）
     *
     * 有应用对象时推迟一个调度周期再删除，否则立即删除。
     */
    void release() {
        if ( !m_context ) {
            return;
        }

        detach();
        Context* context = m_context;
        m_context = nullptr;

        QCoreApplication* app = QCoreApplication::instance();
        if ( app ) {
            QObject* parent = QThread::currentThread() == app->thread() ? app : nullptr;
            auto* holder = new ContextHolder(context, parent);
            QTimer::singleShot(0, holder, &QObject::deleteLater);
        } else {
            delete context;
        }
        qCDebug(lcCallbackBridge) << "Callback context released";
    }

private:
    Context* m_context;
    bool m_tokenIssued;
};

#endif // CALLBACKBRIDGE_H

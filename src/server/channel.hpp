// ======================= channel.hpp =======================
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "msg.pb.h"   // Message, BasicProperties

#include "consumer.hpp"
#include "delivery_engine.hpp"
#include "virtual_host.hpp"

namespace mqsim {

enum class channel_state { unopened, open, closing, closed };
enum class channel_event { open, close };

const char* channel_state_name(channel_state state);

// 通道生命周期事件
using channel_listener = std::function<void(channel_event ev, uint16_t channel_id)>;
// mandatory 发布没有命中任何队列时，消息交还给这里
using return_callback  = std::function<void(const message_ptr&)>;

// consume() 的可选参数
struct consume_options {
    std::string consumer_tag;   // 空则生成 amq.ctag-<n>
    bool        no_ack{false};
    bool        exclusive{false};
    int32_t     priority{0};
    field_table args;
};

// =================================================================
// channel : 一条逻辑通道（AMQP 风格），由 connection 创建
// 除 open / close 外的操作只在 open 状态可用，否则抛 channel_not_open
// =================================================================
class channel : public std::enable_shared_from_this<channel> {
public:
    using ptr = std::shared_ptr<channel>;

    channel(uint16_t id, uint64_t connection_id,
            const virtual_host::ptr& host,
            const flow_limit::ptr& conn_limit);
    virtual ~channel();

    void open();
    // closing -> 取消全部消费者 -> closed；未确认的消息保持未确认
    virtual void close();

    uint16_t id() const { return __id; }
    uint64_t connection_id() const { return __conn_id; }
    channel_state state() const;

    void on_event(const channel_listener& listener);
    void on_return(const return_callback& cb);

    // ------------------- Queue ----------------------
    queue_declare_ok assert_queue(const std::string& name,
                                  bool durable = false, bool exclusive = false,
                                  bool auto_delete = false, const field_table& args = {});
    queue_declare_ok check_queue(const std::string& name);
    size_t delete_queue(const std::string& name, bool if_unused = false, bool if_empty = false);
    size_t purge_queue(const std::string& name);
    void bind_queue(const std::string& queue, const std::string& exchange,
                    const std::string& pattern, const field_table& args = {});
    void unbind_queue(const std::string& queue, const std::string& exchange,
                      const std::string& pattern);

    // ------------------- Exchange -------------------
    void assert_exchange(const std::string& name, ExchangeType type,
                         bool durable = false, bool internal = false,
                         bool auto_delete = false, const field_table& args = {});
    void check_exchange(const std::string& name);
    void delete_exchange(const std::string& name, bool if_unused = false);
    void bind_exchange(const std::string& destination, const std::string& source,
                       const std::string& pattern, const field_table& args = {});
    void unbind_exchange(const std::string& destination, const std::string& source,
                         const std::string& pattern);

    // ------------------- Message --------------------
    bool publish(const std::string& exchange, const std::string& routing_key,
                 const std::string& body,
                 const BasicProperties& props = BasicProperties(),
                 bool mandatory = false);
    bool send_to_queue(const std::string& queue, const std::string& body,
                       const BasicProperties& props = BasicProperties(),
                       bool mandatory = false);

    std::string consume(const std::string& queue, const consumer_callback& cb,
                        const consume_options& opts = consume_options());
    void cancel(const std::string& consumer_tag);
    // 无消息时返回 nullptr
    message_ptr get(const std::string& queue, bool no_ack = false);

    void ack(uint64_t delivery_tag, bool multiple = false);
    void ack_all();
    void nack(uint64_t delivery_tag, bool multiple = false, bool requeue = true);
    void nack_all(bool requeue = true);
    void reject(uint64_t delivery_tag, bool requeue = true);

    // global=false：每个消费者的上限；global=true：整个连接共享的上限。0 = 不限
    void prefetch(uint32_t count, bool global = false);
    size_t recover();

    size_t unacked_count() const { return __ctx->unacked_count(); }
    size_t consumer_count() const;
    // 等待已提交的回调全部执行完（回调线程内调用时直接返回）
    void wait_idle() { __ctx->wait_idle(); }

protected:
    void ensure_open() const;
    static Message make_message(const std::string& exchange, const std::string& routing_key,
                                const std::string& body, const BasicProperties& props);
    // 路由并入队；mandatory 且无人接收时交给 on_return 回调
    void route_message(const Message& msg, bool mandatory);
    // 每次成功发布之后调用
    virtual void on_published(const Message&) {}

    void emit(channel_event ev);

    const virtual_host::ptr& host() const { return __host; }
    const channel_context::ptr& context() const { return __ctx; }

private:
    bool shutdown();   // 已在 closing / closed 时返回 false
    // 只在 tag 仍指向 c 时移除
    void forget_consumer(const consumer::ptr& c);

    uint16_t             __id;
    uint64_t             __conn_id;
    virtual_host::ptr    __host;
    channel_context::ptr __ctx;

    mutable std::mutex                              __mtx;
    channel_state                                   __state{channel_state::unopened};
    std::unordered_map<std::string, consumer::ptr>  __consumers;   // tag -> consumer
    std::vector<channel_listener>                   __listeners;
    return_callback                                 __on_return;
};

}

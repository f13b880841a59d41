// ======================= channel.cpp =======================
#include "channel.hpp"

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "../common/logger.hpp"

#include <utility>

namespace mqsim {

const char* channel_state_name(channel_state state)
{
    switch (state) {
    case channel_state::unopened: return "unopened";
    case channel_state::open:     return "open";
    case channel_state::closing:  return "closing";
    case channel_state::closed:   return "closed";
    }
    return "unknown";
}

// -----------------------------------------------------------------------------
// 构造 / 析构
// -----------------------------------------------------------------------------
channel::channel(uint16_t id, uint64_t connection_id,
                 const virtual_host::ptr& host,
                 const flow_limit::ptr& conn_limit)
    : __id(id), __conn_id(connection_id), __host(host),
      __ctx(std::make_shared<channel_context>(id, connection_id, conn_limit)) {}

channel::~channel()
{
    // 未关闭就被释放：把消费者从队列上摘下来，不再触发事件
    shutdown();
}

// -----------------------------------------------------------------------------
// 生命周期
// -----------------------------------------------------------------------------
void channel::open()
{
    {
        std::unique_lock<std::mutex> lock(__mtx);
        if (__state != channel_state::unopened) return;
        __state = channel_state::open;
    }
    LOG(INFO) << "channel " << __id << " of connection " << __conn_id << " opened";
    emit(channel_event::open);
}

void channel::close()
{
    if (!shutdown()) return;
    LOG(INFO) << "channel " << __id << " of connection " << __conn_id << " closed";
    emit(channel_event::close);
}

bool channel::shutdown()
{
    std::vector<consumer::ptr> consumers;
    {
        std::unique_lock<std::mutex> lock(__mtx);
        if (__state == channel_state::closing || __state == channel_state::closed) return false;
        __state = channel_state::closing;
        for (const auto& [tag, c] : __consumers) consumers.push_back(c);
        __consumers.clear();
    }

    for (const auto& c : consumers) {
        try {
            __host->engine().cancel_consumer(c);
        } catch (const mq_error& e) {
            LOG(WARNING) << "channel " << __id << ": cancel consumer [" << c->tag
                         << "] failed: " << e.what();
        }
    }
    __ctx->deactivate();

    std::unique_lock<std::mutex> lock(__mtx);
    __state = channel_state::closed;
    return true;
}

channel_state channel::state() const
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __state;
}

void channel::ensure_open() const
{
    std::unique_lock<std::mutex> lock(__mtx);
    if (__state != channel_state::open) {
        throw channel_error(error_code::channel_not_open,
                            MQSIM_MSG("channel " << __id << " is " << channel_state_name(__state)));
    }
}

void channel::on_event(const channel_listener& listener)
{
    std::unique_lock<std::mutex> lock(__mtx);
    __listeners.push_back(listener);
}

void channel::on_return(const return_callback& cb)
{
    std::unique_lock<std::mutex> lock(__mtx);
    __on_return = cb;
}

void channel::emit(channel_event ev)
{
    std::vector<channel_listener> listeners;
    {
        std::unique_lock<std::mutex> lock(__mtx);
        listeners = __listeners;
    }
    for (const auto& l : listeners) {
        try {
            l(ev, __id);
        } catch (const std::exception& e) {
            LOG(ERROR) << "channel " << __id << " listener failed: " << e.what();
        }
    }
}

// -----------------------------------------------------------------------------
// Queue ops
// -----------------------------------------------------------------------------
queue_declare_ok channel::assert_queue(const std::string& name, bool durable, bool exclusive,
                                       bool auto_delete, const field_table& args)
{
    ensure_open();
    return __host->topo().declare_queue(name, durable, exclusive, auto_delete, args, __conn_id);
}

queue_declare_ok channel::check_queue(const std::string& name)
{
    ensure_open();
    return __host->topo().check_queue(name, __conn_id);
}

size_t channel::delete_queue(const std::string& name, bool if_unused, bool if_empty)
{
    ensure_open();
    return __host->delete_queue(name, if_unused, if_empty, __conn_id);
}

size_t channel::purge_queue(const std::string& name)
{
    ensure_open();
    return __host->topo().purge_queue(name, __conn_id);
}

void channel::bind_queue(const std::string& queue, const std::string& exchange,
                         const std::string& pattern, const field_table& args)
{
    ensure_open();
    __host->topo().bind_queue(queue, exchange, pattern, args, __conn_id);
}

void channel::unbind_queue(const std::string& queue, const std::string& exchange,
                           const std::string& pattern)
{
    ensure_open();
    __host->topo().unbind_queue(queue, exchange, pattern, __conn_id);
}

// -----------------------------------------------------------------------------
// Exchange ops
// -----------------------------------------------------------------------------
void channel::assert_exchange(const std::string& name, ExchangeType type, bool durable,
                              bool internal, bool auto_delete, const field_table& args)
{
    ensure_open();
    __host->topo().declare_exchange(name, type, durable, internal, auto_delete, args);
}

void channel::check_exchange(const std::string& name)
{
    ensure_open();
    __host->topo().check_exchange(name);
}

void channel::delete_exchange(const std::string& name, bool if_unused)
{
    ensure_open();
    __host->topo().delete_exchange(name, if_unused);
}

void channel::bind_exchange(const std::string& destination, const std::string& source,
                            const std::string& pattern, const field_table& args)
{
    ensure_open();
    __host->topo().bind_exchange(destination, source, pattern, args);
}

void channel::unbind_exchange(const std::string& destination, const std::string& source,
                              const std::string& pattern)
{
    ensure_open();
    __host->topo().unbind_exchange(destination, source, pattern);
}

// -----------------------------------------------------------------------------
// Message ops
// -----------------------------------------------------------------------------
Message channel::make_message(const std::string& exchange, const std::string& routing_key,
                              const std::string& body, const BasicProperties& props)
{
    Message msg;
    msg.mutable_fields()->set_exchange(exchange);
    msg.mutable_fields()->set_routing_key(routing_key);
    *msg.mutable_properties() = props;
    msg.set_body(body);
    return msg;
}

void channel::route_message(const Message& msg, bool mandatory)
{
    size_t routed = __host->publish(msg);
    if (routed > 0 || !mandatory) return;

    return_callback cb;
    {
        std::unique_lock<std::mutex> lock(__mtx);
        cb = __on_return;
    }
    if (!cb) {
        LOG(WARNING) << "channel " << __id << ": mandatory message to [" << msg.fields().exchange()
                     << "] with key [" << msg.fields().routing_key()
                     << "] is unroutable and no return callback is set";
        return;
    }

    auto returned = std::make_shared<Message>(msg);
    __ctx->post([cb, returned] {
        try {
            cb(returned);
        } catch (const std::exception& e) {
            LOG(ERROR) << "return callback failed: " << e.what();
        } catch (...) {
            LOG(ERROR) << "return callback failed: unknown exception";
        }
    });
}

bool channel::publish(const std::string& exchange, const std::string& routing_key,
                      const std::string& body, const BasicProperties& props, bool mandatory)
{
    ensure_open();
    Message msg = make_message(exchange, routing_key, body, props);
    route_message(msg, mandatory);
    on_published(msg);
    return true;
}

bool channel::send_to_queue(const std::string& queue, const std::string& body,
                            const BasicProperties& props, bool mandatory)
{
    return publish(DEFAULT_EXCHANGE, queue, body, props, mandatory);
}

std::string channel::consume(const std::string& queue, const consumer_callback& cb,
                             const consume_options& opts)
{
    ensure_open();
    __host->topo().access_queue(queue, __conn_id);

    std::string tag = opts.consumer_tag.empty() ? __host->next_consumer_tag() : opts.consumer_tag;
    auto c = std::make_shared<consumer>(tag, queue, opts.no_ack, opts.exclusive,
                                        opts.priority, cb, __ctx);
    {
        std::unique_lock<std::mutex> lock(__mtx);
        if (__state != channel_state::open) {
            throw channel_error(error_code::channel_not_open,
                                MQSIM_MSG("channel " << __id << " is " << channel_state_name(__state)));
        }
        // 队列被删除时消费者已由 broker 取消（inactive），它的 tag 可以复用
        auto it = __consumers.find(tag);
        if (it != __consumers.end() && it->second->active) {
            throw channel_error(error_code::not_allowed,
                                MQSIM_MSG("consumer tag [" << tag << "] already in use on channel "
                                          << __id));
        }
        __consumers[tag] = c;
    }

    try {
        __host->engine().add_consumer(c);
    } catch (const mq_error&) {
        forget_consumer(c);
        throw;
    }

    // 注册期间通道被关闭：关闭时的快照可能没有包含这个消费者
    if (state() != channel_state::open) {
        forget_consumer(c);
        __host->engine().cancel_consumer(c);
        throw channel_error(error_code::channel_not_open,
                            MQSIM_MSG("channel " << __id << " closed while consuming from ["
                                      << queue << "]"));
    }
    return tag;
}

void channel::forget_consumer(const consumer::ptr& c)
{
    std::unique_lock<std::mutex> lock(__mtx);
    auto it = __consumers.find(c->tag);
    if (it != __consumers.end() && it->second == c) __consumers.erase(it);
}

void channel::cancel(const std::string& consumer_tag)
{
    ensure_open();
    consumer::ptr c;
    {
        std::unique_lock<std::mutex> lock(__mtx);
        auto it = __consumers.find(consumer_tag);
        if (it == __consumers.end()) return;
        c = it->second;
        __consumers.erase(it);
    }
    __host->engine().cancel_consumer(c);
}

message_ptr channel::get(const std::string& queue, bool no_ack)
{
    ensure_open();
    __host->topo().access_queue(queue, __conn_id);
    return __host->engine().get(*__ctx, queue, no_ack);
}

void channel::ack(uint64_t delivery_tag, bool multiple)
{
    ensure_open();
    __host->engine().ack(*__ctx, delivery_tag, multiple);
}

void channel::ack_all()
{
    ack(0, true);
}

void channel::nack(uint64_t delivery_tag, bool multiple, bool requeue)
{
    ensure_open();
    __host->engine().nack(*__ctx, delivery_tag, multiple, requeue);
}

void channel::nack_all(bool requeue)
{
    nack(0, true, requeue);
}

void channel::reject(uint64_t delivery_tag, bool requeue)
{
    nack(delivery_tag, false, requeue);
}

void channel::prefetch(uint32_t count, bool global)
{
    ensure_open();
    if (global && __ctx->connection_limit()) {
        __ctx->connection_limit()->set_limit(count);
    } else {
        __ctx->set_prefetch(count);
    }
    __host->engine().dispatch_all();   // 上限放宽后可能有积压可投
}

size_t channel::recover()
{
    ensure_open();
    return __host->engine().recover(*__ctx);
}

size_t channel::consumer_count() const
{
    std::unique_lock<std::mutex> lock(__mtx);
    size_t n = 0;
    for (const auto& [tag, c] : __consumers) {
        if (c->active) ++n;
    }
    return n;
}

}

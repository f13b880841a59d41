// ======================= delivery_engine.cpp =======================
#include "delivery_engine.hpp"

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "../common/logger.hpp"
#include "route.hpp"
#include "topology.hpp"

#include <unordered_map>

namespace mqsim {

// -----------------------------------------------------------------------------
// flow_limit
// -----------------------------------------------------------------------------
void flow_limit::set_limit(uint32_t limit)
{
    std::unique_lock<std::mutex> lock(__mtx);
    __limit = limit;
}

uint32_t flow_limit::limit() const
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __limit;
}

uint32_t flow_limit::in_use() const
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __used;
}

bool flow_limit::try_acquire()
{
    std::unique_lock<std::mutex> lock(__mtx);
    if (__limit > 0 && __used >= __limit) return false;
    ++__used;
    return true;
}

void flow_limit::release(uint32_t n)
{
    std::unique_lock<std::mutex> lock(__mtx);
    __used = (n > __used) ? 0 : __used - n;
}

// -----------------------------------------------------------------------------
// channel_context
// -----------------------------------------------------------------------------
channel_context::channel_context(uint16_t channel_id, uint64_t connection_id,
                                 const flow_limit::ptr& conn_limit)
    : __channel_id(channel_id), __connection_id(connection_id), __conn_limit(conn_limit) {}

channel_context::~channel_context()
{
    __delivery.stop();
}

bool channel_context::try_claim(const consumer::ptr& c, const std::string& queue,
                                const message_ptr& queued, uint64_t& tag)
{
    std::unique_lock<std::mutex> lock(__mtx);
    if (!__active || !c->active) return false;

    if (c->no_ack) {
        tag = __next_tag++;
        return true;
    }
    if (__prefetch > 0 && c->outstanding >= __prefetch) return false;
    if (__conn_limit && !__conn_limit->try_acquire()) return false;

    tag = __next_tag++;
    __unacked.emplace(tag, unacked_entry{queue, queued, c, __conn_limit != nullptr});
    ++c->outstanding;
    return true;
}

uint64_t channel_context::record_get(const std::string& queue, const message_ptr& queued,
                                     bool no_ack)
{
    std::unique_lock<std::mutex> lock(__mtx);
    uint64_t tag = __next_tag++;
    if (!no_ack) {
        __unacked.emplace(tag, unacked_entry{queue, queued, nullptr, false});
    }
    return tag;
}

void channel_context::release_entry(const unacked_entry& e)
{
    if (e.owner && e.owner->outstanding > 0) --e.owner->outstanding;
    if (e.counted && __conn_limit) __conn_limit->release(1);
}

std::vector<unacked_entry> channel_context::take(uint64_t tag, bool multiple)
{
    std::unique_lock<std::mutex> lock(__mtx);
    std::vector<unacked_entry> out;

    if (multiple) {
        auto end = (tag == 0) ? __unacked.end() : __unacked.upper_bound(tag);
        for (auto it = __unacked.begin(); it != end;) {
            release_entry(it->second);
            out.push_back(std::move(it->second));
            it = __unacked.erase(it);
        }
        return out;
    }

    auto it = __unacked.find(tag);
    if (it == __unacked.end()) return out;   // 未知 tag：忽略
    release_entry(it->second);
    out.push_back(std::move(it->second));
    __unacked.erase(it);
    return out;
}

std::vector<unacked_entry> channel_context::take_all()
{
    return take(0, true);
}

void channel_context::set_prefetch(uint32_t count)
{
    std::unique_lock<std::mutex> lock(__mtx);
    __prefetch = count;
}

uint32_t channel_context::prefetch() const
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __prefetch;
}

size_t channel_context::unacked_count() const
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __unacked.size();
}

void channel_context::deactivate()
{
    std::unique_lock<std::mutex> lock(__mtx);
    __active = false;
}

bool channel_context::active() const
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __active;
}

// -----------------------------------------------------------------------------
// delivery_engine
// -----------------------------------------------------------------------------
delivery_engine::delivery_engine(topology& topo)
    : __topo(topo) {}

void delivery_engine::deliver(const channel_context::ptr& ctx, const consumer::ptr& c,
                              const message_ptr& msg)
{
    ctx->post([c, msg] {
        try {
            c->callback(msg);
        } catch (const std::exception& e) {
            // 回调异常只影响该消费者，消息留在未确认集合里等待 recover
            LOG(ERROR) << "consumer [" << c->tag << "] on queue [" << c->qname
                       << "] callback failed: " << e.what();
        } catch (...) {
            LOG(ERROR) << "consumer [" << c->tag << "] on queue [" << c->qname
                       << "] callback failed: unknown exception";
        }
    });
}

void delivery_engine::enqueue(const std::string& queue, const message_ptr& msg)
{
    auto qm = __topo.select_queue_message(queue);
    if (!qm) return;
    {
        auto lock = qm->lock();
        if (qm->deleted()) return;
        qm->push_back(msg);
    }
    dispatch(qm);
}

void delivery_engine::dispatch(const queue_message::ptr& qm)
{
    auto lock = qm->lock();
    if (qm->deleted()) return;

    while (qm->getable_count() > 0) {
        bool delivered = false;
        for (const auto& c : qm->consumers().candidates()) {
            auto ctx = c->owner.lock();
            if (!ctx) continue;

            uint64_t tag = 0;
            message_ptr head = qm->front();
            if (!ctx->try_claim(c, qm->name(), head, tag)) continue;

            qm->pop_front();
            qm->consumers().advance(c);

            auto msg = std::make_shared<Message>(*head);
            msg->mutable_fields()->set_delivery_tag(tag);
            msg->mutable_fields()->set_consumer_tag(c->tag);
            // 在队列锁内提交，保证同一消费者看到的顺序与出队顺序一致
            deliver(ctx, c, msg);
            delivered = true;
            break;
        }
        if (!delivered) break;   // 没有消费者有余量
    }
}

void delivery_engine::dispatch_all()
{
    for (const auto& qm : __topo.all_queue_messages()) {
        if (!qm->consumers().empty()) dispatch(qm);
    }
}

message_ptr delivery_engine::get(channel_context& ctx, const std::string& queue, bool no_ack)
{
    auto qm = __topo.select_queue_message(queue);
    if (!qm) return nullptr;

    auto lock = qm->lock();
    if (qm->deleted() || qm->getable_count() == 0) return nullptr;

    message_ptr head = qm->pop_front();
    uint64_t tag = ctx.record_get(queue, head, no_ack);

    auto msg = std::make_shared<Message>(*head);
    msg->mutable_fields()->set_delivery_tag(tag);
    msg->mutable_fields()->clear_consumer_tag();
    msg->mutable_fields()->set_message_count(static_cast<uint32_t>(qm->getable_count()));
    return msg;
}

void delivery_engine::add_consumer(const consumer::ptr& c)
{
    auto qm = __topo.select_queue_message(c->qname);
    if (!qm) {
        throw channel_error(error_code::not_found, MQSIM_MSG("no queue [" << c->qname << "]"));
    }
    {
        auto lock = qm->lock();
        if (qm->deleted()) {
            throw channel_error(error_code::not_found, MQSIM_MSG("no queue [" << c->qname << "]"));
        }
        qm->consumers().add(c);
    }
    dispatch(qm);
}

void delivery_engine::cancel_consumer(const consumer::ptr& c)
{
    c->active = false;

    auto qm = __topo.select_queue_message(c->qname);
    if (!qm) return;

    bool now_empty = false;
    {
        auto lock = qm->lock();
        if (!qm->consumers().remove(c)) return;
        now_empty = qm->consumers().empty();
    }

    auto q = __topo.select_queue(c->qname);
    if (!now_empty || !q || !q->auto_delete) return;

    // 释放队列锁之后可能又有消费者注册：以 if_unused 删除，检查与删除在同一把队列锁内
    try {
        __topo.delete_queue(c->qname, true, false, q->owner);
        LOG(INFO) << "auto-delete queue [" << c->qname << "] after last consumer cancelled";
    } catch (const channel_error& e) {
        if (e.code() != error_code::precondition_failed) throw;
        LOG(INFO) << "auto-delete queue [" << c->qname << "] skipped: new consumer registered";
    }
}

void delivery_engine::drop_consumers(const queue_message::ptr& qm)
{
    std::vector<consumer::ptr> removed;
    {
        auto lock = qm->lock();
        removed = qm->consumers().clear();
    }
    for (const auto& c : removed) {
        c->active = false;
        if (auto ctx = c->owner.lock()) deliver(ctx, c, nullptr);
    }
}

size_t delivery_engine::ack(channel_context& ctx, uint64_t tag, bool multiple)
{
    auto entries = ctx.take(tag, multiple);
    if (!entries.empty()) dispatch_all();   // 释放了 prefetch 余量
    return entries.size();
}

size_t delivery_engine::nack(channel_context& ctx, uint64_t tag, bool multiple, bool requeue_flag)
{
    auto entries = ctx.take(tag, multiple);
    if (entries.empty()) return 0;

    if (requeue_flag) {
        requeue(entries);
    } else {
        discard(entries);
    }
    dispatch_all();
    return entries.size();
}

size_t delivery_engine::recover(channel_context& ctx)
{
    auto entries = ctx.take_all();
    if (entries.empty()) return 0;

    requeue(entries);
    dispatch_all();
    return entries.size();
}

void delivery_engine::requeue(const std::vector<unacked_entry>& entries)
{
    // entries 按 tag 升序；逆序放回队头，使最早投递的那条排在最前
    std::unordered_map<std::string, std::vector<message_ptr>> by_queue;
    for (const auto& e : entries) by_queue[e.queue].push_back(e.message);

    for (const auto& [qname, msgs] : by_queue) {
        auto qm = __topo.select_queue_message(qname);
        if (!qm) continue;   // 队列已删除，消息随之丢弃
        auto lock = qm->lock();
        if (qm->deleted()) continue;
        for (auto it = msgs.rbegin(); it != msgs.rend(); ++it) qm->push_front(*it);
    }
}

void delivery_engine::discard(const std::vector<unacked_entry>& entries)
{
    for (const auto& e : entries) dead_letter(e.queue, e.message);
}

void delivery_engine::dead_letter(const std::string& queue, const message_ptr& msg)
{
    auto q = __topo.select_queue(queue);
    if (!q || !q->has_dead_letter_config()) return;

    const auto& dlq = q->dlq_config;
    std::string key = dlq.routing_key.empty() ? msg->fields().routing_key() : dlq.routing_key;

    Message dead = *msg;
    auto& headers = *dead.mutable_properties()->mutable_headers();
    headers["x-first-death-queue"]    = queue;
    headers["x-first-death-reason"]   = "rejected";
    headers["x-first-death-exchange"] = msg->fields().exchange();
    dead.mutable_fields()->set_exchange(dlq.exchange_name);
    dead.mutable_fields()->set_routing_key(key);
    dead.mutable_fields()->set_redelivered(false);

    auto targets = router::route(__topo, dlq.exchange_name, key, dead.properties());
    if (targets.empty()) {
        LOG(WARNING) << "dead-letter from [" << queue << "] via [" << dlq.exchange_name
                     << "] routed nowhere, dropped";
    }
    for (const auto& target : targets) {
        enqueue(target, std::make_shared<Message>(dead));
    }
}

}

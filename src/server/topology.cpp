// ======================= topology.cpp =======================
#include "topology.hpp"

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "../common/logger.hpp"

#include <algorithm>

namespace mqsim {

namespace {

bool reserved_name(const std::string& name)
{
    return name.compare(0, std::char_traits<char>::length(RESERVED_PREFIX), RESERVED_PREFIX) == 0;
}

} // namespace

// -----------------------------------------------------------------------------
// ctor：预声明默认交换机与 amq.* 标准交换机
// -----------------------------------------------------------------------------
topology::topology()
{
    bool created = false;
    __exchange_mgr.declare_exchange(DEFAULT_EXCHANGE, ExchangeType::DIRECT, true, false, false, {}, created);
    __exchange_mgr.declare_exchange("amq.direct",  ExchangeType::DIRECT,  true, false, false, {}, created);
    __exchange_mgr.declare_exchange("amq.fanout",  ExchangeType::FANOUT,  true, false, false, {}, created);
    __exchange_mgr.declare_exchange("amq.topic",   ExchangeType::TOPIC,   true, false, false, {}, created);
    __exchange_mgr.declare_exchange("amq.headers", ExchangeType::HEADERS, true, false, false, {}, created);
}

void topology::check_client_exchange_name(const std::string& name, const char* op)
{
    if (name.empty()) {
        throw channel_error(error_code::not_allowed,
                            MQSIM_MSG(op << " not allowed for default exchange"));
    }
}

// -----------------------------------------------------------------------------
// Exchange ops
// -----------------------------------------------------------------------------
exchange::ptr topology::declare_exchange(const std::string& name, ExchangeType type,
                                         bool durable, bool internal, bool auto_delete,
                                         const field_table& args)
{
    check_client_exchange_name(name, "declare");
    if (type == ExchangeType::UNKNOWNTYPE) {
        throw channel_error(error_code::not_allowed,
                            MQSIM_MSG("exchange [" << name << "]: unknown exchange type"));
    }

    std::unique_lock<std::mutex> lock(__mtx);
    if (reserved_name(name) && !__exchange_mgr.exists(name)) {
        throw channel_error(error_code::not_allowed,
                            MQSIM_MSG("exchange name [" << name << "] uses reserved prefix "
                                      << RESERVED_PREFIX));
    }

    bool created = false;
    auto ex = __exchange_mgr.declare_exchange(name, type, durable, internal, auto_delete,
                                              args, created);
    if (!created && ex->type != type) {
        throw channel_error(error_code::precondition_failed,
                            MQSIM_MSG("exchange [" << name << "] already declared as "
                                      << exchange_type_name(ex->type) << ", not "
                                      << exchange_type_name(type)));
    }
    if (created) {
        LOG(INFO) << "declare exchange [" << name << "] type=" << exchange_type_name(type);
    }
    return ex;
}

exchange::ptr topology::check_exchange(const std::string& name)
{
    auto ex = __exchange_mgr.select_exchange(name);
    if (!ex) {
        throw channel_error(error_code::not_found,
                            MQSIM_MSG("no exchange [" << name << "]"));
    }
    return ex;
}

exchange::ptr topology::select_exchange(const std::string& name)
{
    return __exchange_mgr.select_exchange(name);
}

void topology::delete_exchange(const std::string& name, bool if_unused)
{
    check_client_exchange_name(name, "delete");
    if (reserved_name(name)) {
        throw channel_error(error_code::not_allowed,
                            MQSIM_MSG("cannot delete reserved exchange [" << name << "]"));
    }

    std::unique_lock<std::mutex> lock(__mtx);
    if (!__exchange_mgr.exists(name)) return;

    auto it = __exchange_bindings.find(name);
    bool in_use = it != __exchange_bindings.end() && !it->second.empty();
    if (if_unused && in_use) {
        throw channel_error(error_code::precondition_failed,
                            MQSIM_MSG("cannot delete exchange [" << name << "]; exchange in use"));
    }

    __exchange_bindings.erase(name);
    __exchange_mgr.delete_exchange(name);
    remove_bindings_to(name, binding_target::exchange);
    LOG(INFO) << "delete exchange [" << name << "]";
}

// -----------------------------------------------------------------------------
// Queue ops
// -----------------------------------------------------------------------------
queue_declare_ok topology::declare_queue(const std::string& name, bool durable, bool exclusive,
                                         bool auto_delete, const field_table& args,
                                         uint64_t owner)
{
    std::unique_lock<std::mutex> lock(__mtx);

    std::string qname = name.empty() ? GEN_QUEUE_PREFIX + std::to_string(++__gen_seq) : name;

    bool created = false;
    auto q = __queue_mgr.declare_queue(qname, durable, exclusive, auto_delete, args,
                                       owner, created);
    if (created) {
        __queue_messages[qname] = std::make_shared<queue_message>(qname);
        /* 与 AMQP 默认直连交换机 "" 建立 <队列名> 绑定 */
        add_binding(DEFAULT_EXCHANGE, qname, binding_target::queue, qname, {});
        LOG(INFO) << "declare queue [" << qname << "]";
    } else {
        if (!q->accessible_by(owner)) {
            throw channel_error(error_code::resource_locked,
                                MQSIM_MSG("cannot declare queue [" << qname
                                          << "]; it is exclusive to another connection"));
        }
        if (q->durable != durable || q->exclusive != exclusive || q->auto_delete != auto_delete) {
            LOG(WARNING) << "redeclare queue [" << qname << "] with different flags, keeping existing";
        }
    }

    auto qm = __queue_messages[qname];
    auto qlock = qm->lock();
    queue_declare_ok ok;
    ok.queue          = qname;
    ok.message_count  = static_cast<uint32_t>(qm->getable_count());
    ok.consumer_count = static_cast<uint32_t>(qm->consumers().size());
    return ok;
}

queue_declare_ok topology::check_queue(const std::string& name, uint64_t owner)
{
    access_queue(name, owner);
    auto qm = select_queue_message(name);
    queue_declare_ok ok;
    ok.queue = name;
    if (!qm) return ok;   // 并发删除
    auto qlock = qm->lock();
    ok.message_count  = static_cast<uint32_t>(qm->getable_count());
    ok.consumer_count = static_cast<uint32_t>(qm->consumers().size());
    return ok;
}

msg_queue::ptr topology::select_queue(const std::string& name)
{
    return __queue_mgr.select_queue(name);
}

queue_message::ptr topology::select_queue_message(const std::string& name)
{
    std::unique_lock<std::mutex> lock(__mtx);
    auto it = __queue_messages.find(name);
    return (it == __queue_messages.end()) ? nullptr : it->second;
}

msg_queue::ptr topology::access_queue(const std::string& name, uint64_t owner)
{
    auto q = __queue_mgr.select_queue(name);
    if (!q) {
        throw channel_error(error_code::not_found, MQSIM_MSG("no queue [" << name << "]"));
    }
    if (!q->accessible_by(owner)) {
        throw channel_error(error_code::resource_locked,
                            MQSIM_MSG("queue [" << name << "] is exclusive to another connection"));
    }
    return q;
}

size_t topology::delete_queue(const std::string& name, bool if_unused, bool if_empty,
                              uint64_t owner, queue_message::ptr* removed)
{
    std::unique_lock<std::mutex> lock(__mtx);

    auto q = __queue_mgr.select_queue(name);
    if (!q) return 0;
    if (!q->accessible_by(owner)) {
        throw channel_error(error_code::resource_locked,
                            MQSIM_MSG("cannot delete queue [" << name
                                      << "]; it is exclusive to another connection"));
    }

    auto qm = __queue_messages[name];
    size_t purged = 0;
    {
        auto qlock = qm->lock();
        if (if_unused && !qm->consumers().empty()) {
            throw channel_error(error_code::precondition_failed,
                                MQSIM_MSG("cannot delete queue [" << name << "]; queue in use"));
        }
        if (if_empty && qm->getable_count() > 0) {
            throw channel_error(error_code::precondition_failed,
                                MQSIM_MSG("cannot delete queue [" << name << "]; queue not empty"));
        }
        qm->mark_deleted();
        purged = qm->purge();
    }

    __queue_messages.erase(name);
    __queue_mgr.delete_queue(name);
    remove_bindings_to(name, binding_target::queue);

    if (removed) *removed = qm;
    LOG(INFO) << "delete queue [" << name << "], purged " << purged << " message(s)";
    return purged;
}

size_t topology::purge_queue(const std::string& name, uint64_t owner)
{
    access_queue(name, owner);
    auto qm = select_queue_message(name);
    if (!qm) return 0;
    auto qlock = qm->lock();
    return qm->purge();
}

std::vector<std::string> topology::exclusive_queues(uint64_t owner)
{
    std::vector<std::string> names;
    for (const auto& [qname, q] : __queue_mgr.all()) {
        if (q->exclusive && q->owner == owner) names.push_back(qname);
    }
    return names;
}

std::vector<queue_message::ptr> topology::all_queue_messages()
{
    std::unique_lock<std::mutex> lock(__mtx);
    std::vector<queue_message::ptr> result;
    result.reserve(__queue_messages.size());
    for (const auto& [qname, qm] : __queue_messages) result.push_back(qm);
    return result;
}

// -----------------------------------------------------------------------------
// Binding ops
// -----------------------------------------------------------------------------
void topology::bind_queue(const std::string& queue, const std::string& exchange,
                          const std::string& key, const field_table& args, uint64_t owner)
{
    check_client_exchange_name(exchange, "bind");

    std::unique_lock<std::mutex> lock(__mtx);
    access_queue(queue, owner);
    if (!__exchange_mgr.exists(exchange)) {
        throw channel_error(error_code::not_found,
                            MQSIM_MSG("bind failed. No such exchange: " << exchange));
    }
    add_binding(exchange, queue, binding_target::queue, key, args);
}

void topology::unbind_queue(const std::string& queue, const std::string& exchange,
                            const std::string& key, uint64_t owner)
{
    check_client_exchange_name(exchange, "unbind");

    std::unique_lock<std::mutex> lock(__mtx);
    auto q = __queue_mgr.select_queue(queue);
    if (q && !q->accessible_by(owner)) {
        throw channel_error(error_code::resource_locked,
                            MQSIM_MSG("cannot unbind queue [" << queue
                                      << "]; it is exclusive to another connection"));
    }
    if (remove_binding(exchange, queue, binding_target::queue, key)) {
        collect_auto_delete(exchange);
    }
}

void topology::bind_exchange(const std::string& destination, const std::string& source,
                             const std::string& key, const field_table& args)
{
    check_client_exchange_name(source, "bind");
    check_client_exchange_name(destination, "bind");

    std::unique_lock<std::mutex> lock(__mtx);
    if (!__exchange_mgr.exists(source)) {
        throw channel_error(error_code::not_found,
                            MQSIM_MSG("bind failed. No such exchange: " << source));
    }
    if (!__exchange_mgr.exists(destination)) {
        throw channel_error(error_code::not_found,
                            MQSIM_MSG("bind failed. No such exchange: " << destination));
    }
    add_binding(source, destination, binding_target::exchange, key, args);
}

void topology::unbind_exchange(const std::string& destination, const std::string& source,
                               const std::string& key)
{
    check_client_exchange_name(source, "unbind");
    check_client_exchange_name(destination, "unbind");

    std::unique_lock<std::mutex> lock(__mtx);
    if (remove_binding(source, destination, binding_target::exchange, key)) {
        collect_auto_delete(source);
    }
}

binding_list topology::exchange_bindings(const std::string& exchange_name)
{
    std::unique_lock<std::mutex> lock(__mtx);
    auto it = __exchange_bindings.find(exchange_name);
    return (it == __exchange_bindings.end()) ? binding_list{} : it->second;
}

// -----------------------------------------------------------------------------
// helpers（调用方持有 __mtx）
// -----------------------------------------------------------------------------
void topology::add_binding(const std::string& source, const std::string& dest,
                           binding_target target, const std::string& key,
                           const field_table& args)
{
    auto& list = __exchange_bindings[source];
    for (const auto& b : list) {
        if (b->same_as(dest, target, key)) return;   // 幂等
    }
    list.push_back(std::make_shared<binding>(source, dest, target, key, args));
}

bool topology::remove_binding(const std::string& source, const std::string& dest,
                              binding_target target, const std::string& key)
{
    auto it = __exchange_bindings.find(source);
    if (it == __exchange_bindings.end()) return false;
    auto& list = it->second;
    auto old_size = list.size();
    list.erase(std::remove_if(list.begin(), list.end(),
                              [&](const binding::ptr& b) { return b->same_as(dest, target, key); }),
               list.end());
    return list.size() != old_size;
}

void topology::remove_bindings_to(const std::string& dest, binding_target target)
{
    std::vector<std::string> touched;
    for (auto& [source, list] : __exchange_bindings) {
        auto old_size = list.size();
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [&](const binding::ptr& b) {
                                      return b->target == target && b->destination == dest;
                                  }),
                   list.end());
        if (list.size() != old_size) touched.push_back(source);
    }
    for (const auto& source : touched) collect_auto_delete(source);
}

void topology::collect_auto_delete(const std::string& source)
{
    auto ex = __exchange_mgr.select_exchange(source);
    if (!ex || !ex->auto_delete) return;

    auto it = __exchange_bindings.find(source);
    if (it != __exchange_bindings.end() && !it->second.empty()) return;

    __exchange_bindings.erase(source);
    __exchange_mgr.delete_exchange(source);
    LOG(INFO) << "auto-delete exchange [" << source << "]";
    remove_bindings_to(source, binding_target::exchange);
}

}

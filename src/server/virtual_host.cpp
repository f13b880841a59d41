#include "virtual_host.hpp"

#include "../common/error.hpp"
#include "../common/logger.hpp"
#include "route.hpp"

namespace mqsim {

// -----------------------------------------------------------------------------
// ctor
// -----------------------------------------------------------------------------
virtual_host::virtual_host(const std::string& name, const confirm_strategy::ptr& strategy)
    : __name(name),
      __engine(__topo),
      __strategy(strategy ? strategy : std::make_shared<always_ack_strategy>())
{
    LOG(INFO) << "virtual host [" << __name << "] created";
}

confirm_strategy::ptr virtual_host::confirms() const
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __strategy;
}

void virtual_host::set_confirm_strategy(const confirm_strategy::ptr& strategy)
{
    std::unique_lock<std::mutex> lock(__mtx);
    __strategy = strategy ? strategy : std::make_shared<always_ack_strategy>();
}

std::string virtual_host::next_consumer_tag()
{
    return GEN_CTAG_PREFIX + std::to_string(++__ctag_seq);
}

// -----------------------------------------------------------------------------
// Message ops
// -----------------------------------------------------------------------------
size_t virtual_host::publish(const Message& msg)
{
    const std::string& exchange_name = msg.fields().exchange();

    auto ex = __topo.select_exchange(exchange_name);
    if (!ex) {
        throw channel_error(error_code::not_found,
                            MQSIM_MSG("publish failed: no exchange [" << exchange_name << "]"));
    }
    if (ex->internal) {
        throw channel_error(error_code::not_allowed,
                            MQSIM_MSG("cannot publish to internal exchange [" << exchange_name << "]"));
    }

    auto targets = router::route(__topo, exchange_name, msg.fields().routing_key(), msg.properties());
    // 每个队列持有自己的副本：重新入队时会改写 redelivered
    for (const auto& qname : targets) {
        __engine.enqueue(qname, std::make_shared<Message>(msg));
    }
    return targets.size();
}

// -----------------------------------------------------------------------------
// Queue ops
// -----------------------------------------------------------------------------
size_t virtual_host::delete_queue(const std::string& name, bool if_unused, bool if_empty,
                                  uint64_t owner)
{
    queue_message::ptr removed;
    size_t purged = __topo.delete_queue(name, if_unused, if_empty, owner, &removed);
    if (removed) __engine.drop_consumers(removed);
    return purged;
}

std::vector<std::string> virtual_host::delete_exclusive_queues(uint64_t owner)
{
    auto names = __topo.exclusive_queues(owner);
    for (const auto& qname : names) {
        delete_queue(qname, false, false, owner);
    }
    return names;
}

}

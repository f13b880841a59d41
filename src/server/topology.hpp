// ======================= topology.hpp =======================
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "../common/binding.hpp"
#include "../common/exchange.hpp"
#include "../common/queue.hpp"
#include "queue_message.hpp"

namespace mqsim {

struct queue_declare_ok {
    std::string queue;
    uint32_t    message_count{0};
    uint32_t    consumer_count{0};
};

// ==============================================================
// topology : 交换机 / 队列 / 绑定的权威存储（属于某个 virtual_host）
// owner 参数是发起操作的连接 id，用于 exclusive 队列的访问检查
// ==============================================================
class topology {
public:
    using ptr = std::shared_ptr<topology>;

    topology();

    // ------------------- Exchange -------------------
    // 已存在时类型不同抛 precondition_failed，其余标志不做比较
    exchange::ptr declare_exchange(const std::string& name, ExchangeType type,
                                   bool durable, bool internal, bool auto_delete,
                                   const field_table& args);
    exchange::ptr check_exchange(const std::string& name);
    exchange::ptr select_exchange(const std::string& name);
    void delete_exchange(const std::string& name, bool if_unused);

    // ------------------- Queue ----------------------
    // name 为空时生成 amq.gen-<n>；已存在时返回当前计数，标志不做比较
    queue_declare_ok declare_queue(const std::string& name, bool durable, bool exclusive,
                                   bool auto_delete, const field_table& args,
                                   uint64_t owner);
    queue_declare_ok check_queue(const std::string& name, uint64_t owner);
    msg_queue::ptr select_queue(const std::string& name);
    queue_message::ptr select_queue_message(const std::string& name);

    // 返回被清掉的消息数；removed 带回被摘下的运行时对象（供取消其消费者）
    size_t delete_queue(const std::string& name, bool if_unused, bool if_empty,
                        uint64_t owner, queue_message::ptr* removed = nullptr);
    size_t purge_queue(const std::string& name, uint64_t owner);

    std::vector<std::string> exclusive_queues(uint64_t owner);
    std::vector<queue_message::ptr> all_queue_messages();

    // 未找到或无权访问时抛异常
    msg_queue::ptr access_queue(const std::string& name, uint64_t owner);

    // ------------------- Binding --------------------
    void bind_queue(const std::string& queue, const std::string& exchange,
                    const std::string& key, const field_table& args, uint64_t owner);
    void unbind_queue(const std::string& queue, const std::string& exchange,
                      const std::string& key, uint64_t owner);
    void bind_exchange(const std::string& destination, const std::string& source,
                       const std::string& key, const field_table& args);
    void unbind_exchange(const std::string& destination, const std::string& source,
                         const std::string& key);

    binding_list exchange_bindings(const std::string& exchange_name);

private:
    void add_binding(const std::string& source, const std::string& dest,
                     binding_target target, const std::string& key, const field_table& args);
    bool remove_binding(const std::string& source, const std::string& dest,
                        binding_target target, const std::string& key);
    // 删除所有指向 dest 的绑定；之后清理变空的 auto-delete 交换机
    void remove_bindings_to(const std::string& dest, binding_target target);
    void collect_auto_delete(const std::string& source);
    static void check_client_exchange_name(const std::string& name, const char* op);

    std::mutex                                    __mtx;
    exchange_manager                              __exchange_mgr;
    msg_queue_manager                             __queue_mgr;
    std::unordered_map<std::string, binding_list> __exchange_bindings; // exchange -> bindings
    std::unordered_map<std::string, queue_message::ptr> __queue_messages;
    std::atomic<uint64_t>                         __gen_seq{0};
};

}

// ======================= queue.hpp =======================
#pragma once

#include <cstdint>
#include <unordered_map>
#include <string>
#include <mutex>
#include <memory>

#include "binding.hpp"   // field_table

namespace mqsim {

// ---------- 死信配置（取自队列参数 x-dead-letter-*） ----------
struct dead_letter_config {
    std::string exchange_name;  // 死信交换机名称
    std::string routing_key;    // 死信路由键，空则沿用原路由键

    dead_letter_config() = default;
    dead_letter_config(const std::string& ex, const std::string& key)
        : exchange_name(ex), routing_key(key) {}
};

// ---------- 队列元数据 ----------
struct msg_queue {
    using ptr = std::shared_ptr<msg_queue>;

    std::string name;
    bool durable{false};
    bool exclusive{false};
    bool auto_delete{false};
    field_table args;
    uint64_t owner{0};              // exclusive 队列所属连接 id
    dead_letter_config dlq_config;  // 死信队列配置

    msg_queue() = default;
    msg_queue(const std::string& qname, bool qdurable, bool qexclusive,
              bool qauto_delete, const field_table& qargs, uint64_t qowner);

    bool has_dead_letter_config() const { return !dlq_config.exchange_name.empty(); }
    // exclusive 队列只允许所属连接访问
    bool accessible_by(uint64_t conn_id) const { return !exclusive || owner == conn_id; }
};

// "k=v&k2=v2" <--> field_table
field_table parse_field_table(const std::string& str_args);
[[nodiscard]] std::string format_field_table(const field_table& args);

// 队列名 → 元数据
using queue_map = std::unordered_map<std::string, msg_queue::ptr>;

// ---------- 内存队列管理器 ----------
class msg_queue_manager {
public:
    using ptr = std::shared_ptr<msg_queue_manager>;

    msg_queue_manager() = default;

    // 已存在时返回现有队列，created 置 false
    msg_queue::ptr declare_queue(const std::string& qname, bool qdurable, bool qexclusive,
                                 bool qauto_delete, const field_table& qargs,
                                 uint64_t owner, bool& created);
    void delete_queue(const std::string& name);
    msg_queue::ptr select_queue(const std::string& name);
    queue_map all();
    bool exists(const std::string& name);
    size_t size();

private:
    std::mutex __mtx;
    queue_map __msg_queues;
};

}

// ======================= virtual_host.hpp =======================
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "../common/config.hpp"
#include "confirm_strategy.hpp"
#include "delivery_engine.hpp"
#include "topology.hpp"

namespace mqsim {

// ==============================================================
// virtual_host : 一个 broker 实例（拓扑 + 投递引擎 + 确认策略）
// 由调用方创建并注入连接；同一进程可以有多个互不相干的实例
// ==============================================================
class virtual_host {
public:
    using ptr = std::shared_ptr<virtual_host>;

    explicit virtual_host(const std::string& name = HOST_NAME,
                          const confirm_strategy::ptr& strategy = nullptr);

    const std::string& name() const { return __name; }

    topology& topo() { return __topo; }
    delivery_engine& engine() { return __engine; }

    confirm_strategy::ptr confirms() const;
    void set_confirm_strategy(const confirm_strategy::ptr& strategy);

    uint64_t next_connection_id() { return ++__conn_seq; }
    std::string next_consumer_tag();

    // ------------------- Message --------------------
    // 按 msg.fields() 中的 exchange / routing_key 路由并入队，返回命中的队列数
    // 交换机不存在抛 not_found，internal 交换机抛 not_allowed
    size_t publish(const Message& msg);

    // ------------------- Queue ----------------------
    // 删除队列并取消其上的消费者（回调收到 nullptr）
    size_t delete_queue(const std::string& name, bool if_unused, bool if_empty, uint64_t owner);
    // 连接关闭时清理它独占的队列，返回删除的队列名
    std::vector<std::string> delete_exclusive_queues(uint64_t owner);

private:
    std::string           __name;
    topology              __topo;
    delivery_engine       __engine;

    mutable std::mutex    __mtx;
    confirm_strategy::ptr __strategy;

    std::atomic<uint64_t> __conn_seq{0};
    std::atomic<uint64_t> __ctag_seq{0};
};

}

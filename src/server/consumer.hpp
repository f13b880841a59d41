// ======================= consumer.hpp =======================
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "msg.pb.h"   // Message

namespace mqsim {

using message_ptr = std::shared_ptr<Message>;

class channel_context;

// 回调：收到一条投递；broker 端取消（如队列被删除）时收到 nullptr
using consumer_callback = std::function<void(const message_ptr&)>;

// --------- consumer ----------
struct consumer {
    using ptr = std::shared_ptr<consumer>;

    std::string tag;      // 标识（通道内唯一）
    std::string qname;    // 订阅队列
    bool no_ack{false};
    bool exclusive{false};
    int32_t priority{0};
    consumer_callback callback;
    std::weak_ptr<channel_context> owner;   // 所属通道的投递上下文

    uint32_t outstanding{0};                // 未确认数，受 owner 的锁保护
    std::atomic<bool> active{true};

    consumer(const std::string& ctag, const std::string& queue_name,
             bool ack_flag, bool excl, int32_t prio, const consumer_callback& cb,
             const std::weak_ptr<channel_context>& ctx);
};

// --------- queue_consumer : 同一队列上的所有消费者 ----------
class queue_consumer {
public:
    using ptr = std::shared_ptr<queue_consumer>;

    explicit queue_consumer(const std::string& qname);

    // 独占冲突时抛 channel_error(resource_locked)
    void add(const consumer::ptr& c);
    bool remove(const consumer::ptr& c);

    // 投递候选顺序：优先级高者在前，同优先级从轮询位置开始按注册顺序
    std::vector<consumer::ptr> candidates();
    void advance(const consumer::ptr& chosen);   // 轮询位置移到 chosen 之后

    bool empty();
    size_t size();
    std::vector<consumer::ptr> clear();

private:
    std::string __qname;
    std::mutex __mtx;
    size_t __rr_index{0};
    std::vector<consumer::ptr> __consumers;   // 注册顺序
};

}

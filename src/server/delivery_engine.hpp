// ======================= delivery_engine.hpp =======================
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../common/thread_pool.hpp"
#include "consumer.hpp"
#include "queue_message.hpp"

namespace mqsim {

class topology;

// ---------------------------------------------------------------------------
// flow_limit : 连接级 prefetch（prefetch(count, global=true)），同一连接的通道共享
// ---------------------------------------------------------------------------
class flow_limit {
public:
    using ptr = std::shared_ptr<flow_limit>;

    void set_limit(uint32_t limit);
    uint32_t limit() const;
    uint32_t in_use() const;

    bool try_acquire();
    void release(uint32_t n);

private:
    mutable std::mutex __mtx;
    uint32_t __limit{0};   // 0 = 不限
    uint32_t __used{0};
};

// 未确认集合中的一项
struct unacked_entry {
    std::string   queue;          // 来源队列
    message_ptr   message;        // 入队时的消息（重新入队用）
    consumer::ptr owner;          // 由 get() 取得时为空
    bool          counted{false}; // 是否占用了连接级额度
};

// ---------------------------------------------------------------------------
// channel_context : 一个通道在投递引擎中的全部状态
//   delivery tag 计数、未确认集合、prefetch、单线程投递执行器
// ---------------------------------------------------------------------------
class channel_context {
public:
    using ptr = std::shared_ptr<channel_context>;

    channel_context(uint16_t channel_id, uint64_t connection_id, const flow_limit::ptr& conn_limit);
    ~channel_context();

    uint16_t channel_id() const { return __channel_id; }
    uint64_t connection_id() const { return __connection_id; }
    const flow_limit::ptr& connection_limit() const { return __conn_limit; }

    // 消费者有余量时分配 tag 并记入未确认集合（no_ack 不记录）；在队列锁内调用
    bool try_claim(const consumer::ptr& c, const std::string& queue,
                   const message_ptr& queued, uint64_t& tag);
    // get() 拉取：不受 prefetch 限制
    uint64_t record_get(const std::string& queue, const message_ptr& queued, bool no_ack);

    // 按 ack/nack 规则摘出条目：multiple 取所有 <= tag 的，tag 为 0 且 multiple 取全部
    std::vector<unacked_entry> take(uint64_t tag, bool multiple);
    std::vector<unacked_entry> take_all();

    void set_prefetch(uint32_t count);
    uint32_t prefetch() const;
    size_t unacked_count() const;

    // 通道关闭后不再接受新的投递
    void deactivate();
    bool active() const;

    // 投递回调在通道自己的执行器上按顺序运行
    bool post(thread_pool::task t) { return __delivery.push(std::move(t)); }
    void wait_idle() { __delivery.wait_idle(); }

private:
    void release_entry(const unacked_entry& e);

    uint16_t                          __channel_id;
    uint64_t                          __connection_id;
    flow_limit::ptr                   __conn_limit;

    mutable std::mutex                __mtx;
    uint64_t                          __next_tag{1};
    std::map<uint64_t, unacked_entry> __unacked;
    uint32_t                          __prefetch{0};   // 每个消费者的上限，0 = 不限
    bool                              __active{true};

    thread_pool                       __delivery{1};
};

// ---------------------------------------------------------------------------
// delivery_engine : 入队、按 prefetch 派发、ack / nack / recover
// ---------------------------------------------------------------------------
class delivery_engine {
public:
    using ptr = std::shared_ptr<delivery_engine>;

    explicit delivery_engine(topology& topo);

    // 追加到队尾并尝试派发；队列不存在时丢弃
    void enqueue(const std::string& queue, const message_ptr& msg);

    void dispatch(const queue_message::ptr& qm);
    void dispatch_all();

    // 非订阅拉取：无消息时返回 nullptr
    message_ptr get(channel_context& ctx, const std::string& queue, bool no_ack);

    // 注册后立即派发；独占冲突抛 resource_locked
    void add_consumer(const consumer::ptr& c);
    // 注销；auto-delete 队列失去最后一个消费者时被删除
    void cancel_consumer(const consumer::ptr& c);
    // 队列被删除：通知其所有消费者（回调收到 nullptr）
    void drop_consumers(const queue_message::ptr& qm);

    size_t ack(channel_context& ctx, uint64_t tag, bool multiple);
    size_t nack(channel_context& ctx, uint64_t tag, bool multiple, bool requeue);
    size_t recover(channel_context& ctx);

private:
    void requeue(const std::vector<unacked_entry>& entries);
    void discard(const std::vector<unacked_entry>& entries);
    void dead_letter(const std::string& queue, const message_ptr& msg);
    static void deliver(const channel_context::ptr& ctx, const consumer::ptr& c,
                        const message_ptr& msg);

    topology& __topo;
};

}

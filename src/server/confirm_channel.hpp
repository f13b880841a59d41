// ======================= confirm_channel.hpp =======================
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "channel.hpp"

namespace mqsim {

// 发布确认回调：seq 为发布序号，acked=false 表示被 nack 或超时
using confirm_callback = std::function<void(uint64_t seq, bool acked)>;

// =================================================================
// confirm_channel : 带发布确认的通道
//   开启后每次发布分配一个从 1 开始严格递增的序号，
//   由 virtual_host 的 confirm_strategy 决议，每个序号恰好决议一次
// =================================================================
class confirm_channel : public channel {
public:
    using ptr = std::shared_ptr<confirm_channel>;

    confirm_channel(uint16_t id, uint64_t connection_id,
                    const virtual_host::ptr& host,
                    const flow_limit::ptr& conn_limit,
                    std::chrono::milliseconds confirm_timeout);

    // 单向开关，重复调用无副作用
    void enable_confirms();
    bool confirms_enabled() const;

    using channel::publish;
    using channel::send_to_queue;

    // 带确认回调的发布；未开启确认时抛 confirms_not_enabled
    bool publish(const std::string& exchange, const std::string& routing_key,
                 const std::string& body, const confirm_callback& cb,
                 const BasicProperties& props = BasicProperties(),
                 bool mandatory = false);
    bool send_to_queue(const std::string& queue, const std::string& body,
                       const confirm_callback& cb,
                       const BasicProperties& props = BasicProperties(),
                       bool mandatory = false);

    // 阻塞直到没有待确认的发布。
    // 最老的一条超过 confirm_timeout 仍未决议：清空待确认集合，回调收到 acked=false，
    // 抛 confirm_timeout。自上次等待以来出现过 nack 时返回 false。
    // 不要在本通道的回调里调用：决议也在同一个执行器上运行
    bool wait_for_confirms();

    size_t pending_confirms() const;
    uint64_t next_publish_seq() const;

    // 先等待确认（超时只记日志），再按普通通道关闭
    void close() override;

protected:
    void on_published(const Message& msg) override;

private:
    struct pending_confirm {
        confirm_callback                      callback;
        std::chrono::steady_clock::time_point issued;
        bool                                  resolved{false};
    };

    void track(const Message& msg, const confirm_callback& cb);
    void resolve(uint64_t seq, bool acked);

    std::chrono::milliseconds             __timeout;

    mutable std::mutex                    __confirm_mtx;
    std::condition_variable               __confirm_cv;
    bool                                  __enabled{false};
    uint64_t                              __next_seq{1};
    std::map<uint64_t, pending_confirm>   __pending;
    bool                                  __nacked{false};   // 自上次 wait_for_confirms 以来
};

}

// ======================= queue_message.hpp =======================
#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "consumer.hpp"   // message_ptr, queue_consumer

namespace mqsim {

// ---------------------------------------------------------------------------
// queue_message : 单个队列的运行时状态（待投递消息 + 消费者）
// 除 lock() / consumers() 外的成员函数要求调用方已持有 lock()
// ---------------------------------------------------------------------------
class queue_message {
public:
    using ptr = std::shared_ptr<queue_message>;

    explicit queue_message(const std::string& queue_name);

    std::unique_lock<std::mutex> lock() const
    {   return std::unique_lock<std::mutex>(mtx_); }

    const std::string& name() const { return name_; }
    queue_consumer& consumers() { return consumers_; }

    void push_back(const message_ptr& msg) { msgs_.push_back(msg); }
    // 重新入队：放回队头，先于后来的消息投递
    void push_front(const message_ptr& msg);

    message_ptr front() const
    {   return msgs_.empty() ? nullptr : msgs_.front(); }
    message_ptr pop_front();

    std::size_t getable_count() const { return msgs_.size(); }
    std::size_t purge();

    bool deleted() const { return deleted_; }
    void mark_deleted() { deleted_ = true; }

private:
    std::string             name_;
    std::deque<message_ptr> msgs_;
    queue_consumer          consumers_;
    bool                    deleted_{false};
    mutable std::mutex      mtx_;
};

} // namespace mqsim

// ==================== Implementation ====================
inline mqsim::queue_message::queue_message(const std::string& queue_name)
    : name_(queue_name), consumers_(queue_name) {}

inline void mqsim::queue_message::push_front(const message_ptr& msg)
{
    msg->mutable_fields()->set_redelivered(true);
    msgs_.push_front(msg);
}

inline mqsim::message_ptr mqsim::queue_message::pop_front()
{
    if (msgs_.empty()) return nullptr;
    message_ptr msg = msgs_.front();
    msgs_.pop_front();
    return msg;
}

inline std::size_t mqsim::queue_message::purge()
{
    std::size_t n = msgs_.size();
    msgs_.clear();
    return n;
}

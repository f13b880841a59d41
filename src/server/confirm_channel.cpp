// ======================= confirm_channel.cpp =======================
#include "confirm_channel.hpp"

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "../common/logger.hpp"

#include <utility>
#include <vector>

namespace mqsim {

confirm_channel::confirm_channel(uint16_t id, uint64_t connection_id,
                                 const virtual_host::ptr& host,
                                 const flow_limit::ptr& conn_limit,
                                 std::chrono::milliseconds confirm_timeout)
    : channel(id, connection_id, host, conn_limit), __timeout(confirm_timeout) {}

void confirm_channel::enable_confirms()
{
    ensure_open();
    std::unique_lock<std::mutex> lock(__confirm_mtx);
    if (__enabled) return;
    __enabled = true;
    LOG(INFO) << "channel " << id() << ": publisher confirms enabled";
}

bool confirm_channel::confirms_enabled() const
{
    std::unique_lock<std::mutex> lock(__confirm_mtx);
    return __enabled;
}

size_t confirm_channel::pending_confirms() const
{
    std::unique_lock<std::mutex> lock(__confirm_mtx);
    return __pending.size();
}

uint64_t confirm_channel::next_publish_seq() const
{
    std::unique_lock<std::mutex> lock(__confirm_mtx);
    return __next_seq;
}

// -----------------------------------------------------------------------------
// 发布
// -----------------------------------------------------------------------------
bool confirm_channel::publish(const std::string& exchange, const std::string& routing_key,
                              const std::string& body, const confirm_callback& cb,
                              const BasicProperties& props, bool mandatory)
{
    ensure_open();
    if (!confirms_enabled()) {
        throw channel_error(error_code::confirms_not_enabled,
                            MQSIM_MSG("channel " << id() << ": publish with confirm callback "
                                      "before enable_confirms"));
    }

    Message msg = make_message(exchange, routing_key, body, props);
    route_message(msg, mandatory);
    track(msg, cb);
    return true;
}

bool confirm_channel::send_to_queue(const std::string& queue, const std::string& body,
                                    const confirm_callback& cb,
                                    const BasicProperties& props, bool mandatory)
{
    return publish(DEFAULT_EXCHANGE, queue, body, cb, props, mandatory);
}

void confirm_channel::on_published(const Message& msg)
{
    // 不带回调的发布同样占用序号，并计入 wait_for_confirms
    if (confirms_enabled()) track(msg, nullptr);
}

void confirm_channel::track(const Message& msg, const confirm_callback& cb)
{
    uint64_t seq = 0;
    {
        std::unique_lock<std::mutex> lock(__confirm_mtx);
        seq = __next_seq++;
        __pending.emplace(seq, pending_confirm{cb, std::chrono::steady_clock::now(), false});
    }

    std::weak_ptr<confirm_channel> weak =
        std::static_pointer_cast<confirm_channel>(shared_from_this());

    // 决议统一转到通道执行器上，回调与消费回调同线程、不在发布者栈上
    host()->confirms()->on_publish(seq, msg, [weak, seq](bool acked) {
        auto self = weak.lock();
        if (!self) return;
        self->context()->post([weak, seq, acked] {
            if (auto ch = weak.lock()) ch->resolve(seq, acked);
        });
    });
}

void confirm_channel::resolve(uint64_t seq, bool acked)
{
    confirm_callback cb;
    {
        std::unique_lock<std::mutex> lock(__confirm_mtx);
        auto it = __pending.find(seq);
        if (it == __pending.end() || it->second.resolved) return;   // 已决议或已超时
        it->second.resolved = true;
        cb = it->second.callback;
        if (!acked) __nacked = true;
    }

    if (cb) {
        try {
            cb(seq, acked);
        } catch (const std::exception& e) {
            LOG(ERROR) << "channel " << id() << ": confirm callback for seq " << seq
                       << " failed: " << e.what();
        } catch (...) {
            LOG(ERROR) << "channel " << id() << ": confirm callback for seq " << seq
                       << " failed: unknown exception";
        }
    }

    {
        std::unique_lock<std::mutex> lock(__confirm_mtx);
        __pending.erase(seq);
    }
    __confirm_cv.notify_all();
}

// -----------------------------------------------------------------------------
// 等待
// -----------------------------------------------------------------------------
bool confirm_channel::wait_for_confirms()
{
    ensure_open();

    std::unique_lock<std::mutex> lock(__confirm_mtx);
    if (!__enabled) {
        throw channel_error(error_code::confirms_not_enabled,
                            MQSIM_MSG("channel " << id() << ": confirms not enabled"));
    }

    while (!__pending.empty()) {
        auto deadline = __pending.begin()->second.issued + __timeout;
        if (__confirm_cv.wait_until(lock, deadline) != std::cv_status::timeout) continue;
        if (__pending.empty()) break;
        if (std::chrono::steady_clock::now() < __pending.begin()->second.issued + __timeout) continue;

        std::vector<std::pair<uint64_t, confirm_callback>> expired;
        for (auto& [seq, p] : __pending) {
            if (p.resolved) continue;
            p.resolved = true;
            expired.emplace_back(seq, p.callback);
        }
        size_t outstanding = __pending.size();
        __pending.clear();
        __nacked = false;
        lock.unlock();

        for (const auto& [seq, cb] : expired) {
            if (!cb) continue;
            context()->post([cb = cb, seq = seq] {
                try {
                    cb(seq, false);
                } catch (const std::exception& e) {
                    LOG(ERROR) << "confirm callback for seq " << seq << " failed: " << e.what();
                } catch (...) {
                    LOG(ERROR) << "confirm callback for seq " << seq << " failed: unknown exception";
                }
            });
        }
        throw channel_error(error_code::confirm_timeout,
                            MQSIM_MSG("channel " << id() << ": " << outstanding
                                      << " confirm(s) outstanding longer than "
                                      << __timeout.count() << "ms"));
    }

    bool all_acked = !__nacked;
    __nacked = false;
    return all_acked;
}

void confirm_channel::close()
{
    if (state() == channel_state::open && confirms_enabled()) {
        try {
            wait_for_confirms();
        } catch (const channel_error& e) {
            LOG(WARNING) << "channel " << id() << ": closing with unconfirmed publishes: " << e.what();
        }
    }
    channel::close();
}

}

// ======================= connection.cpp =======================
#include "connection.hpp"

#include "../common/error.hpp"
#include "../common/logger.hpp"

#include "muduo/net/EventLoop.h"
#include "muduo/net/EventLoopThread.h"

#include <future>
#include <limits>
#include <utility>

namespace mqsim {

const char* connection_state_name(connection_state state)
{
    switch (state) {
    case connection_state::disconnected: return "disconnected";
    case connection_state::connected:    return "connected";
    case connection_state::closed:       return "closed";
    }
    return "unknown";
}

const char* connection_event_name(connection_event ev)
{
    switch (ev) {
    case connection_event::connect:   return "connect";
    case connection_event::close:     return "close";
    case connection_event::error:     return "error";
    case connection_event::heartbeat: return "heartbeat";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// connection
// ---------------------------------------------------------------------------
connection::connection(const virtual_host::ptr& host, const connection_options& opts)
    : __host(host), __opts(opts), __id(host->next_connection_id()),
      __limit(std::make_shared<flow_limit>()) {}

connection::~connection()
{
    if (state() == connection_state::connected) close();
}

connection_state connection::state() const
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __state;
}

size_t connection::channel_count() const
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __channels.size();
}

void connection::on_event(const connection_listener& listener)
{
    std::unique_lock<std::mutex> lock(__mtx);
    __listeners.push_back(listener);
}

void connection::on_channel_event(const channel_listener& listener)
{
    std::unique_lock<std::mutex> lock(__mtx);
    __channel_listeners.push_back(listener);
}

void connection::emit(connection_event ev, const std::string& detail)
{
    std::vector<connection_listener> listeners;
    {
        std::unique_lock<std::mutex> lock(__mtx);
        listeners = __listeners;
    }
    for (const auto& l : listeners) {
        try {
            l(ev, detail);
        } catch (const std::exception& e) {
            LOG(ERROR) << "connection [" << __opts.name << "] " << connection_event_name(ev)
                       << " listener failed: " << e.what();
        }
    }
}

// ---------------------------------------------------------------------------
// connect / close
// ---------------------------------------------------------------------------
void connection::connect()
{
    {
        std::unique_lock<std::mutex> lock(__mtx);
        if (__state == connection_state::closed) {
            throw connection_error(error_code::connection_closed,
                                   MQSIM_MSG("connection [" << __opts.name << "] is closed"));
        }
        if (__state == connection_state::connected) return;
        __state = connection_state::connected;
        start_heartbeat();
    }
    LOG(INFO) << "connection [" << __opts.name << "] #" << __id << " connected to vhost ["
              << __host->name() << "]";
    emit(connection_event::connect, __opts.name);
}

void connection::start_heartbeat()
{
    if (__opts.heartbeat_sec <= 0) return;

    __heartbeat_thread = std::make_unique<muduo::net::EventLoopThread>(
        muduo::net::EventLoopThread::ThreadInitCallback(), "mqsim-heartbeat");
    muduo::net::EventLoop* loop = __heartbeat_thread->startLoop();
    loop->runEvery(__opts.heartbeat_sec, [this] {
        emit(connection_event::heartbeat, __opts.name);
    });
}

void connection::stop_heartbeat()
{
    std::unique_ptr<muduo::net::EventLoopThread> heartbeat;
    {
        std::unique_lock<std::mutex> lock(__mtx);
        heartbeat = std::move(__heartbeat_thread);
    }
    // 在锁外 join：心跳回调自己也要拿 __mtx
    heartbeat.reset();
}

void connection::close()
{
    std::map<uint16_t, channel::ptr> channels;
    {
        std::unique_lock<std::mutex> lock(__mtx);
        if (__state == connection_state::closed) return;
        __state = connection_state::closed;
        channels.swap(__channels);
    }

    std::vector<std::future<void>> closing;
    closing.reserve(channels.size());
    for (const auto& [cid, ch] : channels) {
        closing.push_back(std::async(std::launch::async, [ch = ch] { ch->close(); }));
    }
    for (auto& f : closing) {
        try {
            f.get();
        } catch (const std::exception& e) {
            LOG(ERROR) << "connection [" << __opts.name << "]: channel close failed: " << e.what();
            emit(connection_event::error, e.what());
        }
    }

    stop_heartbeat();

    try {
        for (const auto& qname : __host->delete_exclusive_queues(__id)) {
            LOG(INFO) << "connection [" << __opts.name << "]: dropped exclusive queue [" << qname << "]";
        }
    } catch (const mq_error& e) {
        LOG(ERROR) << "connection [" << __opts.name << "]: exclusive queue cleanup failed: "
                   << e.what();
        emit(connection_event::error, e.what());
    }

    LOG(INFO) << "connection [" << __opts.name << "] #" << __id << " closed";
    emit(connection_event::close, __opts.name);
}

// ---------------------------------------------------------------------------
// channels
// ---------------------------------------------------------------------------
template <typename T, typename... Args>
std::shared_ptr<T> connection::open_channel(Args&&... args)
{
    std::shared_ptr<T> ch;
    std::vector<channel_listener> listeners;
    {
        std::unique_lock<std::mutex> lock(__mtx);
        if (__state == connection_state::disconnected) {
            throw connection_error(error_code::connection_not_open,
                                   MQSIM_MSG("connection [" << __opts.name << "] is not connected"));
        }
        if (__state == connection_state::closed) {
            throw connection_error(error_code::connection_closed,
                                   MQSIM_MSG("connection [" << __opts.name << "] is closed"));
        }

        uint32_t channel_max = __opts.channel_max == 0 ? std::numeric_limits<uint16_t>::max()
                                                       : __opts.channel_max;
        if (__next_channel_id > channel_max) {
            throw connection_error(error_code::channel_max_reached,
                                   MQSIM_MSG("connection [" << __opts.name << "]: channel_max "
                                             << channel_max << " reached"));
        }

        auto cid = static_cast<uint16_t>(__next_channel_id++);   // 不复用
        ch = std::make_shared<T>(cid, __id, __host, __limit, std::forward<Args>(args)...);
        __channels[cid] = ch;
        listeners = __channel_listeners;
    }

    for (const auto& l : listeners) ch->on_event(l);
    // 单独关闭的通道从连接中摘除；通道号不回收。
    // 连接析构前会关闭全部通道，之后不会再有 close 事件回到这里
    ch->on_event([this](channel_event ev, uint16_t cid) {
        if (ev != channel_event::close) return;
        std::unique_lock<std::mutex> lock(__mtx);
        __channels.erase(cid);
    });
    ch->open();
    return ch;
}

channel::ptr connection::create_channel()
{
    return open_channel<channel>();
}

confirm_channel::ptr connection::create_confirm_channel()
{
    auto ch = open_channel<confirm_channel>(__opts.confirm_timeout);
    ch->enable_confirms();
    return ch;
}

}

// ======================= connection.hpp =======================
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../common/config.hpp"
#include "channel.hpp"
#include "confirm_channel.hpp"

// 前向声明，避免在头文件里引入 muduo 网络库 ---------------------------
namespace muduo {
namespace net {
class EventLoop;
class EventLoopThread;
} // namespace net
} // namespace muduo

namespace mqsim {

enum class connection_state { disconnected, connected, closed };
enum class connection_event { connect, close, error, heartbeat };

const char* connection_state_name(connection_state state);
const char* connection_event_name(connection_event ev);

// detail：connect/close/heartbeat 为连接名，error 为错误描述
using connection_listener = std::function<void(connection_event ev, const std::string& detail)>;

// ================================================================
// connection : 一条客户端连接及其通道
//   disconnected -> connected -> closed
// ================================================================
class connection {
public:
    using ptr = std::shared_ptr<connection>;

    explicit connection(const virtual_host::ptr& host,
                        const connection_options& opts = connection_options());
    ~connection();

    connection(const connection&) = delete;
    connection& operator=(const connection&) = delete;

    // 幂等；已关闭时抛 connection_closed。heartbeat_sec > 0 时开始周期性心跳事件
    void connect();
    // 并发关闭全部通道；失败只记录并以 error 事件报告，从不抛出
    void close();

    channel::ptr create_channel();
    // 已开启发布确认的通道
    confirm_channel::ptr create_confirm_channel();

    connection_state state() const;
    uint64_t id() const { return __id; }
    const connection_options& options() const { return __opts; }
    const virtual_host::ptr& host() const { return __host; }
    size_t channel_count() const;   // 未关闭的通道数

    void on_event(const connection_listener& listener);
    // 注册到此后创建的每一条通道上
    void on_channel_event(const channel_listener& listener);

private:
    template <typename T, typename... Args>
    std::shared_ptr<T> open_channel(Args&&... args);

    void emit(connection_event ev, const std::string& detail);
    void start_heartbeat();
    void stop_heartbeat();

    virtual_host::ptr                   __host;
    connection_options                  __opts;
    uint64_t                            __id;
    flow_limit::ptr                     __limit;   // prefetch(count, global=true)

    mutable std::mutex                  __mtx;
    connection_state                    __state{connection_state::disconnected};
    uint32_t                            __next_channel_id{1};
    std::map<uint16_t, channel::ptr>    __channels;
    std::vector<connection_listener>    __listeners;
    std::vector<channel_listener>       __channel_listeners;

    std::unique_ptr<muduo::net::EventLoopThread> __heartbeat_thread;
};

}

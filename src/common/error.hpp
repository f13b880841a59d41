// ======================= error.hpp =======================
#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

namespace mqsim {

// 用流式语法拼装异常信息：throw channel_error(code, MQSIM_MSG("queue " << q));
#define MQSIM_MSG(message) \
    (static_cast<const std::ostringstream&>(std::ostringstream() << message).str())

enum class error_code {
    // connection
    connection_not_open,
    connection_closed,
    channel_max_reached,
    // channel
    channel_not_open,
    not_found,
    precondition_failed,
    resource_locked,
    not_allowed,
    confirms_not_enabled,
    confirm_timeout,
};

const char* error_name(error_code code);

// ---------- 所有 broker 错误的基类 ----------
class mq_error : public std::runtime_error {
public:
    mq_error(error_code code, const std::string& what);

    error_code code() const noexcept { return __code; }

private:
    error_code __code;
};

// 连接状态错误：未连接 / 已关闭 / 通道数耗尽
class connection_error : public mq_error {
public:
    using mq_error::mq_error;
};

// 通道级错误：状态不对、资源不存在、前置条件失败、独占冲突、确认相关
class channel_error : public mq_error {
public:
    using mq_error::mq_error;
};

} // namespace mqsim

// ======================= config.hpp =======================
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace mqsim {

// 常量 -------------------------------------------------------------
inline constexpr const char* DEFAULT_EXCHANGE   = "";
inline constexpr const char* RESERVED_PREFIX    = "amq.";
inline constexpr const char* GEN_QUEUE_PREFIX   = "amq.gen-";
inline constexpr const char* GEN_CTAG_PREFIX    = "amq.ctag-";
inline constexpr const char* HOST_NAME          = "/";

// 队列参数键
inline constexpr const char* ARG_DLX             = "x-dead-letter-exchange";
inline constexpr const char* ARG_DLX_ROUTING_KEY = "x-dead-letter-routing-key";
inline constexpr const char* ARG_X_MATCH         = "x-match";

inline constexpr uint16_t DEFAULT_CHANNEL_MAX = 2047;
inline constexpr std::chrono::milliseconds DEFAULT_CONFIRM_TIMEOUT{30000};

// ---------- 连接参数 ----------
struct connection_options {
    std::string               name{"mqsim"};
    double                    heartbeat_sec{0.0};       // 0 = 不发心跳
    uint16_t                  channel_max{DEFAULT_CHANNEL_MAX};
    std::chrono::milliseconds confirm_timeout{DEFAULT_CONFIRM_TIMEOUT};
};

} // namespace mqsim

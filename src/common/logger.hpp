// ======================= logger.hpp =======================
#pragma once

#include "muduo/base/Logging.h"

// LOG(INFO) / LOG(WARNING) / LOG(ERROR) << ...
// 直接落到 muduo::Logger，日志级别由 muduo::Logger::setLogLevel 控制
namespace mqsim::log_severity {
constexpr muduo::Logger::LogLevel INFO    = muduo::Logger::INFO;
constexpr muduo::Logger::LogLevel WARNING = muduo::Logger::WARN;
constexpr muduo::Logger::LogLevel ERROR   = muduo::Logger::ERROR;
} // namespace mqsim::log_severity

#define LOG(severity)                                                          \
    if (::muduo::Logger::logLevel() <= ::mqsim::log_severity::severity)        \
        ::muduo::Logger(__FILE__, __LINE__, ::mqsim::log_severity::severity,   \
                        __func__).stream()

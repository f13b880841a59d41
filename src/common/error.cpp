// ======================= error.cpp =======================
#include "error.hpp"

namespace mqsim {

const char* error_name(error_code code)
{
    switch (code) {
    case error_code::connection_not_open:  return "CONNECTION_NOT_OPEN";
    case error_code::connection_closed:    return "CONNECTION_CLOSED";
    case error_code::channel_max_reached:  return "CHANNEL_MAX_REACHED";
    case error_code::channel_not_open:     return "CHANNEL_NOT_OPEN";
    case error_code::not_found:            return "NOT_FOUND";
    case error_code::precondition_failed:  return "PRECONDITION_FAILED";
    case error_code::resource_locked:      return "RESOURCE_LOCKED";
    case error_code::not_allowed:          return "NOT_ALLOWED";
    case error_code::confirms_not_enabled: return "CONFIRMS_NOT_ENABLED";
    case error_code::confirm_timeout:      return "CONFIRM_TIMEOUT";
    }
    return "UNKNOWN";
}

mq_error::mq_error(error_code code, const std::string& what)
    : std::runtime_error(std::string(error_name(code)) + " - " + what),
      __code(code) {}

} // namespace mqsim

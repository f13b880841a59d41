// ======================= exchange.cpp =======================
#include "exchange.hpp"

namespace mqsim {

exchange::exchange(const std::string& ename, ExchangeType etype, bool edurable,
                   bool einternal, bool eauto_delete, const field_table& eargs)
    : name(ename),
      type(etype),
      durable(edurable),
      internal(einternal),
      auto_delete(eauto_delete),
      args(eargs) {}

ExchangeType exchange_type_from_string(const std::string& type)
{
    if (type == "direct")  return ExchangeType::DIRECT;
    if (type == "fanout")  return ExchangeType::FANOUT;
    if (type == "topic")   return ExchangeType::TOPIC;
    if (type == "headers") return ExchangeType::HEADERS;
    return ExchangeType::UNKNOWNTYPE;
}

const char* exchange_type_name(ExchangeType type)
{
    switch (type) {
    case ExchangeType::DIRECT:  return "direct";
    case ExchangeType::FANOUT:  return "fanout";
    case ExchangeType::TOPIC:   return "topic";
    case ExchangeType::HEADERS: return "headers";
    default:                    return "unknown";
    }
}

// ---------- exchange_manager ----------
exchange::ptr exchange_manager::declare_exchange(const std::string& name, ExchangeType type,
                                                 bool durable, bool internal, bool auto_delete,
                                                 const field_table& args, bool& created)
{
    std::unique_lock<std::mutex> lock(__mtx);

    auto it = __exchanges.find(name);
    if (it != __exchanges.end()) {
        created = false;
        return it->second;
    }

    auto eptr = std::make_shared<exchange>(name, type, durable, internal, auto_delete, args);
    __exchanges[name] = eptr;
    created = true;
    return eptr;
}

void exchange_manager::delete_exchange(const std::string& name)
{
    std::unique_lock<std::mutex> lock(__mtx);
    __exchanges.erase(name);
}

exchange::ptr exchange_manager::select_exchange(const std::string& name)
{
    std::unique_lock<std::mutex> lock(__mtx);
    auto it = __exchanges.find(name);
    return (it == __exchanges.end()) ? nullptr : it->second;
}

bool exchange_manager::exists(const std::string& name)
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __exchanges.find(name) != __exchanges.end();
}

exchange_map exchange_manager::all()
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __exchanges;
}

}

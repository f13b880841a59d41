// ======================= exchange.hpp =======================
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "binding.hpp"   // field_table
#include "msg.pb.h"      // ExchangeType

namespace mqsim {

// ---------- 交换机元数据：纯路由节点，不存消息 ----------
struct exchange {
    using ptr = std::shared_ptr<exchange>;

    std::string  name;
    ExchangeType type{ExchangeType::DIRECT};
    bool durable{false};
    bool internal{false};      // internal 交换机不接受客户端直接发布
    bool auto_delete{false};
    field_table args;

    exchange() = default;
    exchange(const std::string& ename, ExchangeType etype, bool edurable,
             bool einternal, bool eauto_delete, const field_table& eargs);
};

using exchange_map = std::unordered_map<std::string, exchange::ptr>;

// "direct" / "fanout" / "topic" / "headers" <--> ExchangeType
ExchangeType exchange_type_from_string(const std::string& type);
const char* exchange_type_name(ExchangeType type);

// ---------- 交换机管理器 ----------
class exchange_manager {
public:
    using ptr = std::shared_ptr<exchange_manager>;

    exchange_manager() = default;

    // 已存在时返回现有交换机，created 置 false
    exchange::ptr declare_exchange(const std::string& name, ExchangeType type,
                                   bool durable, bool internal, bool auto_delete,
                                   const field_table& args, bool& created);
    void delete_exchange(const std::string& name);
    exchange::ptr select_exchange(const std::string& name);
    bool exists(const std::string& name);
    exchange_map all();

private:
    std::mutex   __mtx;
    exchange_map __exchanges;
};

}

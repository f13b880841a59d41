// ======================= binding.hpp =======================
#pragma once

#include <string>
#include <memory>
#include <vector>
#include <unordered_map>

namespace mqsim {

using field_table = std::unordered_map<std::string, std::string>;

// 绑定目标：队列，或 exchange-to-exchange 绑定中的下游交换机
enum class binding_target { queue, exchange };

// 交换机与目标的绑定关系
struct binding {
    using ptr = std::shared_ptr<binding>;

    std::string    exchange_name;      // 源交换机
    std::string    destination;        // 队列名或下游交换机名
    binding_target target{binding_target::queue};
    std::string    binding_key;
    field_table    binding_args;       // 绑定参数，用于Headers Exchange过滤

    binding(const std::string& ex,
            const std::string& dest,
            binding_target t,
            const std::string& key,
            const field_table& args = {})
        : exchange_name(ex), destination(dest), target(t), binding_key(key), binding_args(args) {}

    // 同一 (目标, 路由键) 视为同一条绑定
    bool same_as(const std::string& dest, binding_target t, const std::string& key) const
    {
        return target == t && destination == dest && binding_key == key;
    }
};

// 对某个交换机来说：按绑定先后排列的所有绑定
using binding_list = std::vector<binding::ptr>;

}

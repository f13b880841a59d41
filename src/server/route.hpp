// ======================= route.hpp =======================
#pragma once

#include <string>
#include <vector>

#include "../common/binding.hpp"
#include "msg.pb.h"   // ExchangeType, BasicProperties

namespace mqsim {

class topology;

namespace router {

// topic 匹配：'*' 恰好匹配一段，'#' 匹配零或多段（以 '.' 分段）
bool match_topic(const std::string& routing_key, const std::string& binding_key);

// headers 匹配：x-match=all（缺省）要求全部命中，any 命中其一即可；x- 开头的参数不参与比较
bool match_headers(const field_table& binding_args,
                   const google::protobuf::Map<std::string, std::string>& headers);

// 判断某条绑定是否匹配（根据交换机类型）
bool match_route(ExchangeType type,
                 const std::string& routing_key,
                 const binding& bind,
                 const BasicProperties& props);

// 计算从 exchange_name 出发应投递的队列，按绑定顺序去重；沿 exchange-to-exchange 绑定递归，
// 每个交换机最多访问一次。交换机不存在时返回空
std::vector<std::string> route(topology& topo,
                               const std::string& exchange_name,
                               const std::string& routing_key,
                               const BasicProperties& props);

} // namespace router
} // namespace mqsim

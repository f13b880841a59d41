// ======================= route.cpp =======================
#include "route.hpp"
#include "topology.hpp"
#include "../common/config.hpp"

#include <unordered_set>

namespace mqsim::router {

namespace {

std::vector<std::string> split_segments(const std::string& key)
{
    std::vector<std::string> segs;
    size_t start = 0;
    while (true) {
        size_t dot = key.find('.', start);
        segs.push_back(key.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return segs;
}

bool match_segments(const std::vector<std::string>& key, size_t ki,
                    const std::vector<std::string>& pattern, size_t pi)
{
    while (pi < pattern.size()) {
        if (pattern[pi] == "#") {
            // 连续的 '#' 等价于一个
            while (pi + 1 < pattern.size() && pattern[pi + 1] == "#") ++pi;
            if (pi + 1 == pattern.size()) return true;   // '#' 匹配剩余全部
            for (size_t skip = ki; skip <= key.size(); ++skip) {
                if (match_segments(key, skip, pattern, pi + 1)) return true;
            }
            return false;
        }
        if (ki == key.size()) return false;
        if (pattern[pi] != "*" && pattern[pi] != key[ki]) return false;
        ++ki;
        ++pi;
    }
    return ki == key.size();
}

} // namespace

bool match_topic(const std::string& routing_key, const std::string& binding_key)
{
    if (routing_key == binding_key) return true;
    if (binding_key == "#") return true;
    if (binding_key.find_first_of("*#") == std::string::npos) return false;

    return match_segments(split_segments(routing_key), 0, split_segments(binding_key), 0);
}

bool match_headers(const field_table& binding_args,
                   const google::protobuf::Map<std::string, std::string>& headers)
{
    bool match_any = false;
    auto xm = binding_args.find(ARG_X_MATCH);
    if (xm != binding_args.end()) match_any = (xm->second == "any");

    size_t conditions = 0;
    size_t hits = 0;
    for (const auto& [key, value] : binding_args) {
        if (key.compare(0, 2, "x-") == 0) continue;
        ++conditions;
        auto it = headers.find(key);
        if (it != headers.end() && it->second == value) ++hits;
    }
    if (conditions == 0) return true;   // 无过滤条件：全部匹配
    return match_any ? hits > 0 : hits == conditions;
}

bool match_route(ExchangeType type,
                 const std::string& routing_key,
                 const binding& bind,
                 const BasicProperties& props)
{
    switch (type) {
    case ExchangeType::DIRECT:
        // 精确匹配
        return routing_key == bind.binding_key;

    case ExchangeType::FANOUT:
        // 全量投递
        return true;

    case ExchangeType::TOPIC:
        return match_topic(routing_key, bind.binding_key);

    case ExchangeType::HEADERS:
        return match_headers(bind.binding_args, props.headers());

    default:
        return false;
    }
}

std::vector<std::string> route(topology& topo,
                               const std::string& exchange_name,
                               const std::string& routing_key,
                               const BasicProperties& props)
{
    std::vector<std::string> queues;
    std::unordered_set<std::string> seen_queues;
    std::unordered_set<std::string> visited;
    std::vector<std::string> pending{exchange_name};

    while (!pending.empty()) {
        std::string ename = pending.front();
        pending.erase(pending.begin());
        if (!visited.insert(ename).second) continue;

        auto ex = topo.select_exchange(ename);
        if (!ex) continue;

        for (const auto& b : topo.exchange_bindings(ename)) {
            if (!match_route(ex->type, routing_key, *b, props)) continue;

            if (b->target == binding_target::exchange) {
                pending.push_back(b->destination);
            } else if (seen_queues.insert(b->destination).second) {
                queues.push_back(b->destination);
            }
        }
    }
    return queues;
}

} // namespace mqsim::router

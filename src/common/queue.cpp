// ======================= queue.cpp =======================
#include "queue.hpp"
#include "config.hpp"

#include <iterator>

namespace mqsim {

// ---------- msg_queue ----------
msg_queue::msg_queue(const std::string& qname, bool qdurable, bool qexclusive,
                     bool qauto_delete, const field_table& qargs, uint64_t qowner)
    : name(qname),
      durable(qdurable),
      exclusive(qexclusive),
      auto_delete(qauto_delete),
      args(qargs),
      owner(qowner)
{
    auto dlx = args.find(ARG_DLX);
    if (dlx != args.end()) {
        auto key = args.find(ARG_DLX_ROUTING_KEY);
        dlq_config = dead_letter_config(dlx->second, key == args.end() ? "" : key->second);
    }
}

field_table parse_field_table(const std::string& str_args)
{
    field_table args;
    size_t start = 0;
    while (start < str_args.size()) {
        size_t pos = str_args.find('&', start);
        std::string pair = str_args.substr(start, pos - start);
        size_t eq = pair.find('=');
        if (eq != std::string::npos) {
            args[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return args;
}

std::string format_field_table(const field_table& args)
{
    std::string result;
    for (auto it = args.begin(); it != args.end(); ++it) {
        result += it->first + "=" + it->second;
        if (std::next(it) != args.end()) result += "&";
    }
    return result;
}

// ---------- msg_queue_manager ----------
msg_queue::ptr msg_queue_manager::declare_queue(const std::string& qname, bool qdurable,
                                                bool qexclusive, bool qauto_delete,
                                                const field_table& qargs,
                                                uint64_t owner, bool& created)
{
    std::unique_lock<std::mutex> lock(__mtx);

    auto it = __msg_queues.find(qname);
    if (it != __msg_queues.end()) {   // 已存在
        created = false;
        return it->second;
    }

    auto qptr = std::make_shared<msg_queue>(qname, qdurable, qexclusive,
                                            qauto_delete, qargs, owner);
    __msg_queues[qname] = qptr;
    created = true;
    return qptr;
}

void msg_queue_manager::delete_queue(const std::string& name)
{
    std::unique_lock<std::mutex> lock(__mtx);
    __msg_queues.erase(name);
}

msg_queue::ptr msg_queue_manager::select_queue(const std::string& name)
{
    std::unique_lock<std::mutex> lock(__mtx);

    auto it = __msg_queues.find(name);
    return (it == __msg_queues.end()) ? nullptr : it->second;
}

queue_map msg_queue_manager::all()
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __msg_queues;
}

bool msg_queue_manager::exists(const std::string& name)
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __msg_queues.find(name) != __msg_queues.end();
}

size_t msg_queue_manager::size()
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __msg_queues.size();
}

}

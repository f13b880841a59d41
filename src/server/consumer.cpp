// ======================= consumer.cpp =======================
#include "consumer.hpp"
#include "../common/error.hpp"
#include "../common/logger.hpp"

#include <algorithm>

namespace mqsim {

// --------- consumer ----------
consumer::consumer(const std::string& ctag, const std::string& queue_name,
                   bool ack_flag, bool excl, int32_t prio, const consumer_callback& cb,
                   const std::weak_ptr<channel_context>& ctx)
    : tag(ctag),
      qname(queue_name),
      no_ack(ack_flag),
      exclusive(excl),
      priority(prio),
      callback(cb),
      owner(ctx) {}

// --------- queue_consumer ----------
queue_consumer::queue_consumer(const std::string& qname)
    : __qname(qname), __rr_index(0) {}

void queue_consumer::add(const consumer::ptr& c)
{
    std::unique_lock<std::mutex> lock(__mtx);
    if (c->exclusive && !__consumers.empty()) {
        throw channel_error(error_code::resource_locked,
                            MQSIM_MSG("queue [" << __qname << "] already has consumers, "
                                      "exclusive consume refused"));
    }
    for (const auto& other : __consumers) {
        if (other->exclusive) {
            throw channel_error(error_code::resource_locked,
                                MQSIM_MSG("queue [" << __qname << "] has exclusive consumer ["
                                          << other->tag << "]"));
        }
    }
    __consumers.push_back(c);
}

bool queue_consumer::remove(const consumer::ptr& c)
{
    std::unique_lock<std::mutex> lock(__mtx);
    auto it = std::find(__consumers.begin(), __consumers.end(), c);
    if (it == __consumers.end()) {
        LOG(WARNING) << "consumer tag [" << c->tag << "] not found on queue [" << __qname << "]";
        return false;
    }
    size_t pos = static_cast<size_t>(it - __consumers.begin());
    __consumers.erase(it);
    if (pos < __rr_index) --__rr_index;
    if (__consumers.empty() || __rr_index >= __consumers.size()) __rr_index = 0;
    return true;
}

std::vector<consumer::ptr> queue_consumer::candidates()
{
    std::unique_lock<std::mutex> lock(__mtx);
    std::vector<consumer::ptr> order;
    order.reserve(__consumers.size());
    for (size_t i = 0; i < __consumers.size(); ++i) {
        order.push_back(__consumers[(__rr_index + i) % __consumers.size()]);
    }
    std::stable_sort(order.begin(), order.end(),
                     [](const consumer::ptr& a, const consumer::ptr& b) {
                         return a->priority > b->priority;
                     });
    return order;
}

void queue_consumer::advance(const consumer::ptr& chosen)
{
    std::unique_lock<std::mutex> lock(__mtx);
    auto it = std::find(__consumers.begin(), __consumers.end(), chosen);
    if (it == __consumers.end()) return;
    __rr_index = (static_cast<size_t>(it - __consumers.begin()) + 1) % __consumers.size();
}

bool queue_consumer::empty()
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __consumers.empty();
}

size_t queue_consumer::size()
{
    std::unique_lock<std::mutex> lock(__mtx);
    return __consumers.size();
}

std::vector<consumer::ptr> queue_consumer::clear()
{
    std::unique_lock<std::mutex> lock(__mtx);
    std::vector<consumer::ptr> removed;
    removed.swap(__consumers);
    __rr_index = 0;
    return removed;
}

}

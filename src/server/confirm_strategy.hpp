// ======================= confirm_strategy.hpp =======================
#pragma once

#include <cstdint>
#include <functional>
#include <memory>

#include "msg.pb.h"   // Message

namespace mqsim {

// ---------------------------------------------------------------------------
// confirm_strategy : 决定一次发布何时、以何种结果被确认
//   resolve 可在任意线程、任意时刻调用；同一 seq 只有第一次调用生效
// ---------------------------------------------------------------------------
class confirm_strategy {
public:
    using ptr      = std::shared_ptr<confirm_strategy>;
    using resolver = std::function<void(bool acked)>;

    virtual ~confirm_strategy() = default;

    virtual void on_publish(uint64_t seq, const Message& msg, const resolver& resolve) = 0;
};

// 缺省：每条发布都立即 ack
class always_ack_strategy : public confirm_strategy {
public:
    void on_publish(uint64_t, const Message&, const resolver& resolve) override { resolve(true); }
};

}

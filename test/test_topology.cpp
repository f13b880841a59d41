/******************************************************************
 *  拓扑存储 单元测试（GTest）
 ******************************************************************/
#include <gtest/gtest.h>
#include "../src/common/error.hpp"
#include "../src/server/topology.hpp"
#include "test_util.hpp"

using namespace mqsim;
using mqsim::test_util::error_of;

class TopologyFixture : public ::testing::Test {
protected:
    static constexpr uint64_t OWNER = 1;
    static constexpr uint64_t OTHER = 2;

    void push(const std::string& qname, const std::string& body)
    {
        auto qm = topo.select_queue_message(qname);
        ASSERT_NE(qm, nullptr);
        auto msg = std::make_shared<Message>();
        msg->set_body(body);
        auto lock = qm->lock();
        qm->push_back(msg);
    }

    topology topo;
};

/* ---------- F1 预声明交换机 ---------- */
TEST_F(TopologyFixture, PredeclaredExchanges)
{
    EXPECT_EQ(topo.check_exchange("")->type, ExchangeType::DIRECT);
    EXPECT_EQ(topo.check_exchange("amq.direct")->type, ExchangeType::DIRECT);
    EXPECT_EQ(topo.check_exchange("amq.fanout")->type, ExchangeType::FANOUT);
    EXPECT_EQ(topo.check_exchange("amq.topic")->type, ExchangeType::TOPIC);
    EXPECT_EQ(topo.check_exchange("amq.headers")->type, ExchangeType::HEADERS);
}

/* ---------- F2 交换机声明规则 ---------- */
TEST_F(TopologyFixture, DeclareExchange_Rules)
{
    topo.declare_exchange("ex", ExchangeType::DIRECT, false, false, false, {});
    // 同类型重复声明：幂等
    EXPECT_EQ(error_of([&] { topo.declare_exchange("ex", ExchangeType::DIRECT, true, false, false, {}); }),
              std::nullopt);
    // 不同类型：precondition_failed
    EXPECT_EQ(error_of([&] { topo.declare_exchange("ex", ExchangeType::FANOUT, false, false, false, {}); }),
              error_code::precondition_failed);
    // 保留名 / 默认交换机 / 未知类型：not_allowed
    EXPECT_EQ(error_of([&] { topo.declare_exchange("amq.custom", ExchangeType::DIRECT, false, false, false, {}); }),
              error_code::not_allowed);
    EXPECT_EQ(error_of([&] { topo.declare_exchange("", ExchangeType::DIRECT, false, false, false, {}); }),
              error_code::not_allowed);
    EXPECT_EQ(error_of([&] { topo.declare_exchange("x", ExchangeType::UNKNOWNTYPE, false, false, false, {}); }),
              error_code::not_allowed);
    // 已存在的 amq.* 以相同类型断言是允许的
    EXPECT_EQ(error_of([&] { topo.declare_exchange("amq.topic", ExchangeType::TOPIC, true, false, false, {}); }),
              std::nullopt);
}

TEST_F(TopologyFixture, CheckExchange_NotFound)
{
    EXPECT_EQ(error_of([&] { topo.check_exchange("ghost"); }), error_code::not_found);
}

/* ---------- F3 删除交换机 ---------- */
TEST_F(TopologyFixture, DeleteExchange_IfUnused)
{
    topo.declare_exchange("ex", ExchangeType::FANOUT, false, false, false, {});
    topo.declare_queue("q", false, false, false, {}, OWNER);
    topo.bind_queue("q", "ex", "", {}, OWNER);

    EXPECT_EQ(error_of([&] { topo.delete_exchange("ex", true); }), error_code::precondition_failed);
    topo.delete_exchange("ex", false);
    EXPECT_EQ(topo.select_exchange("ex"), nullptr);
    // 队列保留，只删掉绑定
    EXPECT_NE(topo.select_queue("q"), nullptr);
    EXPECT_TRUE(topo.exchange_bindings("ex").empty());

    EXPECT_EQ(error_of([&] { topo.delete_exchange("amq.fanout", false); }), error_code::not_allowed);
    EXPECT_EQ(error_of([&] { topo.delete_exchange("", false); }), error_code::not_allowed);
    EXPECT_EQ(error_of([&] { topo.delete_exchange("ghost", false); }), std::nullopt);
}

TEST_F(TopologyFixture, DeleteExchange_RemovesExchangeBindingsToIt)
{
    topo.declare_exchange("src", ExchangeType::FANOUT, false, false, false, {});
    topo.declare_exchange("dst", ExchangeType::FANOUT, false, false, false, {});
    topo.bind_exchange("dst", "src", "", {});
    ASSERT_EQ(topo.exchange_bindings("src").size(), 1u);

    topo.delete_exchange("dst", false);
    EXPECT_TRUE(topo.exchange_bindings("src").empty());
}

/* ---------- F4 队列声明 ---------- */
TEST_F(TopologyFixture, DeclareQueue_Idempotent)
{
    auto ok = topo.declare_queue("q", false, false, false, {}, OWNER);
    EXPECT_EQ(ok.queue, "q");
    EXPECT_EQ(ok.message_count, 0u);

    push("q", "m1");
    push("q", "m2");
    auto again = topo.declare_queue("q", true, false, false, {}, OWNER);
    EXPECT_EQ(again.message_count, 2u);
    EXPECT_EQ(again.consumer_count, 0u);
    EXPECT_FALSE(topo.select_queue("q")->durable);   // 保留首次声明的标志
}

TEST_F(TopologyFixture, DeclareQueue_GeneratedName)
{
    auto a = topo.declare_queue("", false, false, false, {}, OWNER);
    auto b = topo.declare_queue("", false, false, false, {}, OWNER);
    EXPECT_EQ(a.queue.rfind("amq.gen-", 0), 0u);
    EXPECT_NE(a.queue, b.queue);
    EXPECT_NE(topo.select_queue(a.queue), nullptr);
}

TEST_F(TopologyFixture, DeclareQueue_BoundToDefaultExchange)
{
    topo.declare_queue("q", false, false, false, {}, OWNER);
    auto bindings = topo.exchange_bindings("");
    ASSERT_EQ(bindings.size(), 1u);
    EXPECT_EQ(bindings[0]->destination, "q");
    EXPECT_EQ(bindings[0]->binding_key, "q");
}

TEST_F(TopologyFixture, CheckQueue)
{
    EXPECT_EQ(error_of([&] { topo.check_queue("ghost", OWNER); }), error_code::not_found);
    topo.declare_queue("q", false, false, false, {}, OWNER);
    push("q", "m");
    EXPECT_EQ(topo.check_queue("q", OWNER).message_count, 1u);
}

/* ---------- F5 删除 / 清空队列 ---------- */
TEST_F(TopologyFixture, DeleteQueue_IfEmpty)
{
    topo.declare_queue("q", false, false, false, {}, OWNER);
    push("q", "m1");
    push("q", "m2");

    EXPECT_EQ(error_of([&] { topo.delete_queue("q", false, true, OWNER); }),
              error_code::precondition_failed);
    EXPECT_EQ(topo.delete_queue("q", false, false, OWNER), 2u);
    EXPECT_EQ(topo.select_queue("q"), nullptr);
    EXPECT_EQ(topo.select_queue_message("q"), nullptr);
    EXPECT_TRUE(topo.exchange_bindings("").empty());
}

TEST_F(TopologyFixture, DeleteQueue_Unknown)
{
    EXPECT_EQ(topo.delete_queue("ghost", true, true, OWNER), 0u);
}

TEST_F(TopologyFixture, DeleteQueue_HandsBackRuntimeState)
{
    topo.declare_queue("q", false, false, false, {}, OWNER);
    queue_message::ptr removed;
    topo.delete_queue("q", false, false, OWNER, &removed);
    ASSERT_NE(removed, nullptr);
    auto lock = removed->lock();
    EXPECT_TRUE(removed->deleted());
}

TEST_F(TopologyFixture, PurgeQueue)
{
    topo.declare_queue("q", false, false, false, {}, OWNER);
    push("q", "m1");
    push("q", "m2");
    push("q", "m3");
    EXPECT_EQ(topo.purge_queue("q", OWNER), 3u);
    EXPECT_EQ(topo.check_queue("q", OWNER).message_count, 0u);
    EXPECT_EQ(error_of([&] { topo.purge_queue("ghost", OWNER); }), error_code::not_found);
}

/* ---------- F6 绑定 ---------- */
TEST_F(TopologyFixture, Bind_Errors)
{
    topo.declare_queue("q", false, false, false, {}, OWNER);
    EXPECT_EQ(error_of([&] { topo.bind_queue("q", "ghost", "k", {}, OWNER); }), error_code::not_found);
    EXPECT_EQ(error_of([&] { topo.bind_queue("ghost", "amq.direct", "k", {}, OWNER); }),
              error_code::not_found);
    EXPECT_EQ(error_of([&] { topo.bind_queue("q", "", "k", {}, OWNER); }), error_code::not_allowed);
    EXPECT_EQ(error_of([&] { topo.bind_exchange("amq.direct", "", "k", {}); }), error_code::not_allowed);
    EXPECT_EQ(error_of([&] { topo.bind_exchange("ghost", "amq.direct", "k", {}); }), error_code::not_found);
}

TEST_F(TopologyFixture, Unbind_Idempotent)
{
    topo.declare_queue("q", false, false, false, {}, OWNER);
    topo.bind_queue("q", "amq.direct", "k", {}, OWNER);
    topo.unbind_queue("q", "amq.direct", "k", OWNER);
    topo.unbind_queue("q", "amq.direct", "k", OWNER);
    EXPECT_TRUE(topo.exchange_bindings("amq.direct").empty());
}

/* ---------- F7 auto-delete 交换机 ---------- */
TEST_F(TopologyFixture, AutoDeleteExchange_AfterLastUnbind)
{
    topo.declare_exchange("tmp", ExchangeType::DIRECT, false, false, true, {});
    topo.declare_queue("q", false, false, false, {}, OWNER);

    // 从未绑定过的 auto-delete 交换机保持存在；解绑不存在的绑定也不触发
    topo.unbind_queue("q", "tmp", "k", OWNER);
    EXPECT_NE(topo.select_exchange("tmp"), nullptr);

    topo.bind_queue("q", "tmp", "k1", {}, OWNER);
    topo.bind_queue("q", "tmp", "k2", {}, OWNER);
    topo.unbind_queue("q", "tmp", "k1", OWNER);
    EXPECT_NE(topo.select_exchange("tmp"), nullptr);
    topo.unbind_queue("q", "tmp", "k2", OWNER);
    EXPECT_EQ(topo.select_exchange("tmp"), nullptr);
}

TEST_F(TopologyFixture, AutoDeleteExchange_WhenQueueDeleted)
{
    topo.declare_exchange("tmp", ExchangeType::FANOUT, false, false, true, {});
    topo.declare_queue("q", false, false, false, {}, OWNER);
    topo.bind_queue("q", "tmp", "", {}, OWNER);

    topo.delete_queue("q", false, false, OWNER);
    EXPECT_EQ(topo.select_exchange("tmp"), nullptr);
}

/* ---------- F8 exclusive 队列 ---------- */
TEST_F(TopologyFixture, ExclusiveQueue_OtherConnectionLockedOut)
{
    topo.declare_queue("excl", false, true, false, {}, OWNER);

    EXPECT_EQ(error_of([&] { topo.declare_queue("excl", false, true, false, {}, OTHER); }),
              error_code::resource_locked);
    EXPECT_EQ(error_of([&] { topo.bind_queue("excl", "amq.direct", "k", {}, OTHER); }),
              error_code::resource_locked);
    EXPECT_EQ(error_of([&] { topo.unbind_queue("excl", "amq.direct", "k", OTHER); }),
              error_code::resource_locked);
    EXPECT_EQ(error_of([&] { topo.purge_queue("excl", OTHER); }), error_code::resource_locked);
    EXPECT_EQ(error_of([&] { topo.delete_queue("excl", false, false, OTHER); }),
              error_code::resource_locked);
    EXPECT_EQ(error_of([&] { topo.check_queue("excl", OTHER); }), error_code::resource_locked);

    // 所属连接不受影响
    EXPECT_EQ(error_of([&] { topo.bind_queue("excl", "amq.direct", "k", {}, OWNER); }), std::nullopt);
    EXPECT_EQ(topo.exclusive_queues(OWNER), std::vector<std::string>{"excl"});
    EXPECT_TRUE(topo.exclusive_queues(OTHER).empty());
}

// gtest 头
#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "test_util.hpp"

using namespace mqsim;
using namespace mqsim::test_util;

/* ---------- 发布订阅测试夹具 ---------- */
class PubSubFixture : public broker_fixture {
protected:
    void SetUp() override
    {
        broker_fixture::SetUp();

        // 创建测试交换机
        ch->assert_exchange("fanout_ex", ExchangeType::FANOUT);
        ch->assert_exchange("topic_ex", ExchangeType::TOPIC);

        // 创建测试队列并绑定到 fanout 交换机
        ch->assert_queue("q1");
        ch->assert_queue("q2");
        ch->bind_queue("q1", "fanout_ex", "");
        ch->bind_queue("q2", "fanout_ex", "");
    }
};

/* ---------- F1 fanout：每个订阅队列各得一份 ---------- */
TEST_F(PubSubFixture, FanoutEveryQueueGetsACopy)
{
    collector s1, s2;
    ch->consume("q1", s1.callback());
    ch->consume("q2", s2.callback());

    ch->publish("fanout_ex", "ignored.key", "broadcast");
    ASSERT_TRUE(s1.wait_for(1));
    ASSERT_TRUE(s2.wait_for(1));
    EXPECT_EQ(s1.bodies(), std::vector<std::string>{"broadcast"});
    EXPECT_EQ(s2.bodies(), std::vector<std::string>{"broadcast"});
    EXPECT_EQ(s1.messages()[0]->fields().exchange(), "fanout_ex");
}

TEST_F(PubSubFixture, CopiesAreIndependent)
{
    ch->publish("fanout_ex", "", "m");
    auto a = ch->get("q1");
    ASSERT_NE(a, nullptr);
    ch->reject(a->fields().delivery_tag(), true);   // 只影响 q1 的副本

    auto b = ch->get("q2", true);
    ASSERT_NE(b, nullptr);
    EXPECT_FALSE(b->fields().redelivered());
    auto again = ch->get("q1", true);
    ASSERT_NE(again, nullptr);
    EXPECT_TRUE(again->fields().redelivered());
}

/* ---------- F2 topic：q1 / ex1 / "a.*" 往返 ---------- */
TEST_F(PubSubFixture, TopicRoundTrip)
{
    ch->assert_exchange("ex1", ExchangeType::TOPIC);
    ch->assert_queue("tq");
    ch->bind_queue("tq", "ex1", "a.*");

    collector got;
    ch->consume("tq", got.callback());
    ch->publish("ex1", "a.b", "hi");
    ch->publish("ex1", "a.b.c", "too-deep");
    ch->publish("ex1", "x.b", "wrong-prefix");

    ASSERT_TRUE(got.wait_for(1));
    std::this_thread::sleep_for(30ms);
    ASSERT_EQ(got.size(), 1u);
    auto msg = got.messages()[0];
    EXPECT_EQ(msg->body(), "hi");
    EXPECT_EQ(msg->fields().routing_key(), "a.b");
    EXPECT_EQ(msg->fields().exchange(), "ex1");
}

TEST_F(PubSubFixture, TopicStarVersusHash)
{
    ch->assert_queue("star");
    ch->assert_queue("hash");
    ch->bind_queue("star", "topic_ex", "a.*");
    ch->bind_queue("hash", "topic_ex", "a.#");

    ch->publish("topic_ex", "a.b.c", "deep");
    ch->publish("topic_ex", "a.b", "shallow");

    EXPECT_EQ(ch->check_queue("star").message_count, 1u);
    EXPECT_EQ(ch->check_queue("hash").message_count, 2u);
    EXPECT_EQ(ch->get("star", true)->body(), "shallow");
}

/* ---------- F3 解绑后不再收到 ---------- */
TEST_F(PubSubFixture, UnbindStopsRouting)
{
    ch->unbind_queue("q2", "fanout_ex", "");
    ch->publish("fanout_ex", "", "only-q1");
    EXPECT_EQ(ch->check_queue("q1").message_count, 1u);
    EXPECT_EQ(ch->check_queue("q2").message_count, 0u);
}

/* ---------- F4 未命中：静默丢弃 / mandatory 退回 ---------- */
TEST_F(PubSubFixture, UnroutableDroppedSilently)
{
    EXPECT_TRUE(ch->publish("topic_ex", "nobody.listens", "lost"));
    EXPECT_EQ(ch->check_queue("q1").message_count, 0u);
}

TEST_F(PubSubFixture, MandatoryUnroutableIsReturned)
{
    std::atomic<int> returned{0};
    std::string body;
    ch->on_return([&](const message_ptr& msg) {
        body = msg->body();
        ++returned;
    });

    ch->publish("topic_ex", "nobody.listens", "bounce", BasicProperties(), true);
    ASSERT_TRUE(wait_until([&] { return returned.load() == 1; }));
    EXPECT_EQ(body, "bounce");

    ch->publish("fanout_ex", "", "routed", BasicProperties(), true);
    ch->wait_idle();
    EXPECT_EQ(returned.load(), 1);
}

/* ---------- F5 发布错误 ---------- */
TEST_F(PubSubFixture, PublishErrors)
{
    EXPECT_EQ(error_of([&] { ch->publish("ghost", "k", "x"); }), error_code::not_found);

    ch->assert_exchange("inner", ExchangeType::FANOUT, false, true);
    EXPECT_EQ(error_of([&] { ch->publish("inner", "k", "x"); }), error_code::not_allowed);
    // internal 交换机仍可作为 exchange-to-exchange 的下游
    ch->bind_exchange("inner", "fanout_ex", "");
    ch->assert_queue("q3");
    ch->bind_queue("q3", "inner", "");
    ch->publish("fanout_ex", "", "via-inner");
    EXPECT_EQ(ch->check_queue("q3").message_count, 1u);
}

/* ---------- F6 多发布者并发 ---------- */
TEST_F(PubSubFixture, ConcurrentPublishers)
{
    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;

    collector s1, s2;
    ch->consume("q1", s1.callback(), consume_options{"", true, false, 0, {}});
    ch->consume("q2", s2.callback(), consume_options{"", true, false, 0, {}});

    std::vector<std::thread> publishers;
    for (int t = 0; t < kThreads; ++t) {
        publishers.emplace_back([this, t] {
            auto pch = conn->create_channel();
            for (int i = 0; i < kPerThread; ++i) {
                pch->publish("fanout_ex", "", std::to_string(t) + ":" + std::to_string(i));
            }
        });
    }
    for (auto& th : publishers) th.join();

    ASSERT_TRUE(s1.wait_for(kThreads * kPerThread));
    ASSERT_TRUE(s2.wait_for(kThreads * kPerThread));

    // 同一发布者的消息保持发布顺序
    std::vector<int> last(kThreads, -1);
    for (const auto& body : s1.bodies()) {
        auto colon = body.find(':');
        int t = std::stoi(body.substr(0, colon));
        int i = std::stoi(body.substr(colon + 1));
        EXPECT_GT(i, last[t]);
        last[t] = i;
    }
}

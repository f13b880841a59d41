#include <gtest/gtest.h>
#include <thread>

#include "test_util.hpp"

using namespace mqsim;
using namespace mqsim::test_util;

class AckTestFixture : public broker_fixture {
protected:
    void SetUp() override
    {
        broker_fixture::SetUp();
        ch->assert_queue("q1");
        ch->assert_queue("q2");
    }

    void send(const std::string& queue, const std::string& body)
    {
        ch->send_to_queue(queue, body);
    }

    uint32_t depth(const std::string& queue) { return ch->check_queue(queue).message_count; }
};

/* ---------- F1 ack 后消息从未确认集合移除 ---------- */
TEST_F(AckTestFixture, AckAfterGet)
{
    send("q1", "hello");
    auto msg = ch->get("q1");
    ASSERT_NE(msg, nullptr);
    EXPECT_EQ(msg->body(), "hello");
    EXPECT_EQ(ch->unacked_count(), 1u);

    ch->ack(msg->fields().delivery_tag());
    EXPECT_EQ(ch->unacked_count(), 0u);
    EXPECT_EQ(depth("q1"), 0u);
}

/* ---------- F2 重复 ack / 未知 tag：无副作用 ---------- */
TEST_F(AckTestFixture, AckTwiceAndUnknownTag)
{
    send("q1", "a");
    send("q1", "b");
    auto m1 = ch->get("q1");
    auto m2 = ch->get("q1");

    ch->ack(m1->fields().delivery_tag());
    ch->ack(m1->fields().delivery_tag());   // 幂等
    ch->ack(999);                           // 未知 tag
    EXPECT_EQ(ch->unacked_count(), 1u);

    ch->ack(m2->fields().delivery_tag());
    EXPECT_EQ(ch->unacked_count(), 0u);
}

/* ---------- F3 multiple / ack_all ---------- */
TEST_F(AckTestFixture, AckMultiple)
{
    for (auto b : {"1", "2", "3"}) send("q1", b);
    auto m1 = ch->get("q1");
    auto m2 = ch->get("q1");
    auto m3 = ch->get("q1");
    EXPECT_LT(m1->fields().delivery_tag(), m2->fields().delivery_tag());
    EXPECT_LT(m2->fields().delivery_tag(), m3->fields().delivery_tag());

    ch->ack(m2->fields().delivery_tag(), true);   // 覆盖 m1、m2
    EXPECT_EQ(ch->unacked_count(), 1u);

    ch->ack_all();
    EXPECT_EQ(ch->unacked_count(), 0u);
}

TEST_F(AckTestFixture, MultiQueueAck)
{
    send("q1", "a");
    send("q2", "b");
    auto msg1 = ch->get("q1");
    auto msg2 = ch->get("q2");
    ASSERT_NE(msg1, nullptr);
    ASSERT_NE(msg2, nullptr);
    // 同一通道内 tag 连续递增，跨队列不重复
    EXPECT_EQ(msg2->fields().delivery_tag(), msg1->fields().delivery_tag() + 1);

    ch->ack_all();
    EXPECT_EQ(ch->get("q1"), nullptr);
    EXPECT_EQ(ch->get("q2"), nullptr);
}

/* ---------- F4 nack requeue：放回队头且保持相对顺序 ---------- */
TEST_F(AckTestFixture, NackRequeuePreservesOrderAtHead)
{
    for (auto b : {"m1", "m2", "m3", "m4"}) send("q1", b);
    ch->get("q1");
    ch->get("q1");
    auto m3 = ch->get("q1");

    ch->nack(m3->fields().delivery_tag(), true, true);
    EXPECT_EQ(ch->unacked_count(), 0u);
    EXPECT_EQ(depth("q1"), 4u);

    std::vector<std::string> bodies;
    std::vector<bool> redelivered;
    while (auto m = ch->get("q1", true)) {
        bodies.push_back(m->body());
        redelivered.push_back(m->fields().redelivered());
    }
    EXPECT_EQ(bodies, (std::vector<std::string>{"m1", "m2", "m3", "m4"}));
    EXPECT_EQ(redelivered, (std::vector<bool>{true, true, true, false}));
}

TEST_F(AckTestFixture, NackWithoutRequeueDiscards)
{
    send("q1", "drop-me");
    auto m = ch->get("q1");
    ch->nack(m->fields().delivery_tag(), false, false);
    EXPECT_EQ(ch->unacked_count(), 0u);
    EXPECT_EQ(depth("q1"), 0u);
}

TEST_F(AckTestFixture, NackAll)
{
    send("q1", "a");
    send("q2", "b");
    ch->get("q1");
    ch->get("q2");
    ch->nack_all(true);
    EXPECT_EQ(depth("q1"), 1u);
    EXPECT_EQ(depth("q2"), 1u);
}

TEST_F(AckTestFixture, RejectRequeueSetsRedelivered)
{
    send("q1", "again");
    auto first = ch->get("q1");
    EXPECT_FALSE(first->fields().redelivered());
    ch->reject(first->fields().delivery_tag(), true);

    auto second = ch->get("q1");
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->body(), "again");
    EXPECT_TRUE(second->fields().redelivered());
    EXPECT_NE(second->fields().delivery_tag(), first->fields().delivery_tag());
}

/* ---------- F5 auto-ack（no_ack）：不进入未确认集合 ---------- */
TEST_F(AckTestFixture, NoAckGetAndConsume)
{
    send("q1", "pull");
    auto m = ch->get("q1", true);
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(ch->unacked_count(), 0u);

    collector got;
    consume_options opts;
    opts.no_ack = true;
    ch->consume("q2", got.callback(), opts);
    for (int i = 0; i < 3; ++i) send("q2", "push" + std::to_string(i));
    ASSERT_TRUE(got.wait_for(3));
    EXPECT_EQ(ch->unacked_count(), 0u);
}

/* ---------- F6 prefetch(1)：三条消息逐条投递 ---------- */
TEST_F(AckTestFixture, PrefetchOneDeliversOneAtATime)
{
    ch->prefetch(1);
    collector got;
    ch->consume("q1", got.callback());
    for (auto b : {"a", "b", "c"}) send("q1", b);

    ASSERT_TRUE(got.wait_for(1));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(got.size(), 1u);
    EXPECT_EQ(depth("q1"), 2u);

    ch->ack(got.messages()[0]->fields().delivery_tag());
    ASSERT_TRUE(got.wait_for(2));
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(got.size(), 2u);

    ch->ack(got.messages()[1]->fields().delivery_tag());
    ASSERT_TRUE(got.wait_for(3));
    EXPECT_EQ(got.bodies(), (std::vector<std::string>{"a", "b", "c"}));
}

/* ---------- F7 未确认数永不超过 prefetch ---------- */
TEST_F(AckTestFixture, OutstandingNeverExceedsPrefetch)
{
    ch->prefetch(3);
    collector got;
    ch->consume("q1", got.callback());
    for (int i = 0; i < 20; ++i) send("q1", std::to_string(i));

    size_t acked = 0;
    while (acked < 20) {
        ASSERT_TRUE(got.wait_for(acked + 1));
        EXPECT_LE(ch->unacked_count(), 3u);
        ch->ack(got.messages()[acked]->fields().delivery_tag());
        ++acked;
    }
    EXPECT_EQ(ch->unacked_count(), 0u);
}

/* ---------- F8 connection 级 prefetch：通道间共享 ---------- */
TEST_F(AckTestFixture, GlobalPrefetchSharedAcrossChannels)
{
    auto ch2 = conn->create_channel();
    ch->prefetch(1, true);

    collector got1, got2;
    ch->consume("q1", got1.callback());
    ch2->consume("q2", got2.callback());
    send("q1", "a");
    send("q2", "b");

    ASSERT_TRUE(wait_until([&] { return got1.size() + got2.size() >= 1; }));
    std::this_thread::sleep_for(50ms);
    ASSERT_EQ(got1.size() + got2.size(), 1u);

    if (got1.size() == 1) ch->ack(got1.messages()[0]->fields().delivery_tag());
    else                  ch2->ack(got2.messages()[0]->fields().delivery_tag());

    EXPECT_TRUE(wait_until([&] { return got1.size() + got2.size() == 2; }));
}

TEST(FlowLimit, SharedBudget)
{
    flow_limit limit;
    EXPECT_EQ(limit.limit(), 0u);
    EXPECT_TRUE(limit.try_acquire());   // 0 = 不限
    limit.release(1);

    limit.set_limit(2);
    EXPECT_TRUE(limit.try_acquire());
    EXPECT_TRUE(limit.try_acquire());
    EXPECT_FALSE(limit.try_acquire());
    EXPECT_EQ(limit.in_use(), 2u);

    limit.release(1);
    EXPECT_EQ(limit.in_use(), 1u);
    limit.release(5);   // 不会减到负数
    EXPECT_EQ(limit.in_use(), 0u);
    EXPECT_EQ(limit.limit(), 2u);
}

/* ---------- F9 recover：未确认消息重新投递 ---------- */
TEST_F(AckTestFixture, RecoverRedeliversUnacked)
{
    collector got;
    ch->consume("q1", got.callback());
    send("q1", "x");
    send("q1", "y");
    ASSERT_TRUE(got.wait_for(2));

    EXPECT_EQ(ch->recover(), 2u);
    ASSERT_TRUE(got.wait_for(4));

    auto msgs = got.messages();
    EXPECT_EQ(msgs[2]->body(), "x");
    EXPECT_EQ(msgs[3]->body(), "y");
    EXPECT_TRUE(msgs[2]->fields().redelivered());
    EXPECT_TRUE(msgs[3]->fields().redelivered());
    EXPECT_EQ(ch->unacked_count(), 2u);
}

/* ---------- F10 通道关闭：未确认消息保持未确认 ---------- */
TEST_F(AckTestFixture, CloseLeavesUnackedUnacked)
{
    send("q1", "held");
    ASSERT_NE(ch->get("q1"), nullptr);
    ch->close();

    EXPECT_EQ(ch->unacked_count(), 1u);
    auto other = conn->create_channel();
    EXPECT_EQ(other->check_queue("q1").message_count, 0u);
    EXPECT_EQ(error_of([&] { ch->ack_all(); }), error_code::channel_not_open);
}

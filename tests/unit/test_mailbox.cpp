// File: tests/unit/test_mailbox.cpp
// Purpose: Verify the single-slot mailbox keeps at most one message and always
//          prefers the most recent offer.
// Key invariants: offer never blocks or fails; tryTake drains the slot.
// Ownership/Lifetime: Mailboxes are test-local; writer threads are joined.
// Links: src/task/Mailbox.hpp

#include "task/Mailbox.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace ite::task;

TEST(Mailbox, StartsEmpty)
{
    OutputMailbox box;
    EXPECT_TRUE(box.empty());
    EXPECT_FALSE(box.tryTake().has_value());
}

TEST(Mailbox, TakeReturnsOfferedMessage)
{
    OutputMailbox box;
    EXPECT_FALSE(box.offer(OutputMessage{1, "Build successful\n"}));
    EXPECT_FALSE(box.empty());

    auto msg = box.tryTake();
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->epoch, 1u);
    EXPECT_EQ(msg->text, "Build successful\n");
}

TEST(Mailbox, SecondOfferReplacesUnreadMessage)
{
    OutputMailbox box;
    box.offer(OutputMessage{1, "first"});
    EXPECT_TRUE(box.offer(OutputMessage{2, "second"}));

    auto msg = box.tryTake();
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->text, "second");
    EXPECT_FALSE(box.tryTake().has_value());
}

TEST(Mailbox, DrainIsIdempotent)
{
    OutputMailbox box;
    box.offer(OutputMessage{7, "x"});
    ASSERT_TRUE(box.tryTake().has_value());
    for (int i = 0; i < 3; ++i)
    {
        EXPECT_FALSE(box.tryTake().has_value());
        EXPECT_TRUE(box.empty());
    }
}

TEST(Mailbox, TransfersMoveOnlyPayloads)
{
    Mailbox<std::unique_ptr<int>> box;
    box.offer(std::make_unique<int>(42));
    auto msg = box.tryTake();
    ASSERT_TRUE(msg.has_value());
    ASSERT_NE(*msg, nullptr);
    EXPECT_EQ(**msg, 42);
}

TEST(Mailbox, ConcurrentWritersLeaveExactlyOneMessage)
{
    OutputMailbox box;
    constexpr int kWriters = 8;
    constexpr int kPerWriter = 200;
    std::atomic<int> replaced{0};

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w)
    {
        writers.emplace_back(
            [&, w]
            {
                for (int i = 0; i < kPerWriter; ++i)
                {
                    const auto epoch = static_cast<std::uint64_t>(w * kPerWriter + i + 1);
                    if (box.offer(OutputMessage{epoch, std::to_string(epoch)}))
                        replaced.fetch_add(1);
                }
            });
    }
    for (auto &t : writers)
        t.join();

    // Every offer except the first found an unread message.
    EXPECT_EQ(replaced.load(), kWriters * kPerWriter - 1);
    auto msg = box.tryTake();
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->text, std::to_string(msg->epoch));
    EXPECT_FALSE(box.tryTake().has_value());
}

TEST(Mailbox, ReaderNeverSeesTornMessages)
{
    OutputMailbox box;
    std::atomic<bool> done{false};
    std::thread writer(
        [&]
        {
            for (std::uint64_t i = 1; i <= 2000; ++i)
                box.offer(OutputMessage{i, std::string(static_cast<std::size_t>(i % 64), 'a')});
            done = true;
        });

    std::uint64_t taken = 0;
    while (!done.load() || !box.empty())
    {
        if (auto msg = box.tryTake())
        {
            EXPECT_EQ(msg->text.size(), msg->epoch % 64);
            ++taken;
        }
    }
    writer.join();
    EXPECT_GE(taken, 1u);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "fsesl/esl/reply_channel.h"

using fsesl::esl::ReplyChannel;
using namespace std::chrono_literals;

TEST(ReplyChannelTest, HandsOverOneValue) {
  ReplyChannel<std::string> channel;

  auto receiver = std::async(std::launch::async, [&] {
    return channel.receive();
  });
  EXPECT_TRUE(channel.send("+OK"));

  auto value = receiver.get();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, "+OK");
}

TEST(ReplyChannelTest, SendWaitsForReceiver) {
  ReplyChannel<int> channel;
  std::atomic<bool> sent{false};

  std::thread sender([&] {
    channel.send(7);
    sent = true;
  });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(sent.load());

  auto value = channel.receive();
  sender.join();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 7);
  EXPECT_TRUE(sent.load());
}

TEST(ReplyChannelTest, SequentialRepliesKeepOrder) {
  ReplyChannel<int> channel;

  std::thread sender([&] {
    for (int i = 0; i < 5; ++i) {
      channel.send(i);
    }
  });
  for (int i = 0; i < 5; ++i) {
    auto value = channel.receive();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, i);
  }
  sender.join();
}

TEST(ReplyChannelTest, CloseWakesReceiver) {
  ReplyChannel<std::string> channel;

  auto receiver = std::async(std::launch::async, [&] {
    return channel.receive();
  });
  std::this_thread::sleep_for(20ms);
  channel.close();

  EXPECT_FALSE(receiver.get().has_value());
  EXPECT_TRUE(channel.closed());
}

TEST(ReplyChannelTest, CloseWakesSender) {
  ReplyChannel<int> channel;

  auto sender = std::async(std::launch::async, [&] { return channel.send(1); });
  std::this_thread::sleep_for(20ms);
  channel.close();

  EXPECT_FALSE(sender.get());
}

TEST(ReplyChannelTest, ReopenAfterClose) {
  ReplyChannel<int> channel;
  channel.close();
  EXPECT_FALSE(channel.receive().has_value());
  EXPECT_FALSE(channel.send(1));

  channel.reopen();
  auto receiver = std::async(std::launch::async, [&] {
    return channel.receive();
  });
  EXPECT_TRUE(channel.send(2));
  EXPECT_EQ(receiver.get(), 2);
}

TEST(ReplyChannelTest, ReceiverFromOlderEpochFailsFast) {
  ReplyChannel<int> channel;
  channel.reopen(2);
  EXPECT_EQ(channel.epoch(), 2u);

  // Command written on connection 1 after the channel moved to connection 2
  EXPECT_FALSE(channel.receive(1).has_value());
  EXPECT_FALSE(channel.send(5, 1));

  auto receiver = std::async(std::launch::async, [&] {
    return channel.receive(2);
  });
  EXPECT_TRUE(channel.send(6, 2));
  EXPECT_EQ(receiver.get(), 6);
}

TEST(ReplyChannelTest, CloseForOlderEpochIsIgnored) {
  ReplyChannel<int> channel;
  channel.reopen(3);
  channel.close(2);
  EXPECT_FALSE(channel.closed());

  channel.close(3);
  EXPECT_TRUE(channel.closed());
  EXPECT_FALSE(channel.receive(3).has_value());
}

TEST(ReplyChannelTest, ReopenWakesReceiverOfPreviousEpoch) {
  ReplyChannel<int> channel;
  channel.reopen(1);

  auto receiver = std::async(std::launch::async, [&] {
    return channel.receive(1);
  });
  std::this_thread::sleep_for(20ms);
  channel.reopen(2);

  EXPECT_FALSE(receiver.get().has_value());
  EXPECT_FALSE(channel.closed());
}

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "server/hub.hpp"

namespace hookhub {

namespace {

class RecordingSink : public IClientSink {
public:
  void Deliver(Frame frame) override {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.push_back(*frame);
  }

  std::vector<std::string> frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::string> frames_;
};

Frame MakeFrame(std::string s) {
  return std::make_shared<const std::string>(std::move(s));
}

} // namespace

TEST(HubTest, BroadcastWithNoMembers) {
  Hub hub;
  EXPECT_EQ(hub.Size(), 0u);
  EXPECT_EQ(hub.Broadcast(MakeFrame("x")), 0u);
}

TEST(HubTest, EveryMemberGetsEveryFrameInOrder) {
  Hub hub;
  std::vector<std::shared_ptr<RecordingSink>> sinks;
  for (int i = 0; i < 3; ++i) {
    sinks.push_back(std::make_shared<RecordingSink>());
    hub.Register(sinks.back());
  }
  EXPECT_EQ(hub.Size(), 3u);

  EXPECT_EQ(hub.Broadcast(MakeFrame("one")), 3u);
  EXPECT_EQ(hub.Broadcast(MakeFrame("two")), 3u);

  for (const auto &sink : sinks) {
    const std::vector<std::string> expected{"one", "two"};
    EXPECT_EQ(sink->frames(), expected);
  }
}

TEST(HubTest, RegisterHandsOutDistinctIds) {
  Hub hub;
  auto a = hub.Register(std::make_shared<RecordingSink>());
  auto b = hub.Register(std::make_shared<RecordingSink>());
  EXPECT_NE(a, b);
}

TEST(HubTest, UnregisterIsIdempotent) {
  Hub hub;
  auto sink = std::make_shared<RecordingSink>();
  auto id = hub.Register(sink);
  EXPECT_TRUE(hub.Unregister(id));
  EXPECT_FALSE(hub.Unregister(id));
  EXPECT_FALSE(hub.Unregister(id + 100));
  EXPECT_EQ(hub.Size(), 0u);

  hub.Broadcast(MakeFrame("late"));
  EXPECT_TRUE(sink->frames().empty());
}

TEST(HubTest, ConcurrentBroadcastAndMembershipChanges) {
  Hub hub;
  auto stable = std::make_shared<RecordingSink>();
  hub.Register(stable);

  std::thread churn([&hub]() {
    for (int i = 0; i < 200; ++i) {
      auto id = hub.Register(std::make_shared<RecordingSink>());
      hub.Unregister(id);
    }
  });
  for (int i = 0; i < 200; ++i) {
    hub.Broadcast(MakeFrame(std::to_string(i)));
  }
  churn.join();

  const auto frames = stable->frames();
  ASSERT_EQ(frames.size(), 200u);
  for (int i = 0; i < 200; ++i) {
    EXPECT_EQ(frames[i], std::to_string(i));
  }
  EXPECT_EQ(hub.Size(), 1u);
}

} // namespace hookhub

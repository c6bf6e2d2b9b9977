#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "conduit/client/body_stream.h"
#include "conduit/client/subscribable.h"

namespace conduit {
namespace client {
namespace {

TEST(AbortControllerTest, FiresEveryHandlerOnce) {
  AbortController controller;
  int first = 0;
  int second = 0;
  auto sub1 = controller.subscribe("abort", [&first] { ++first; });
  auto sub2 = controller.subscribe("abort", [&second] { ++second; });
  EXPECT_EQ(2u, controller.listenerCount());

  controller.abort();
  controller.abort();

  EXPECT_EQ(1, first);
  EXPECT_EQ(1, second);
  EXPECT_TRUE(controller.aborted());
  EXPECT_EQ(0u, controller.listenerCount());
}

TEST(AbortControllerTest, DroppedSubscriptionDoesNotFire) {
  AbortController controller;
  int calls = 0;
  auto sub = controller.subscribe("abort", [&calls] { ++calls; });
  sub.reset();
  EXPECT_EQ(0u, controller.listenerCount());
  controller.abort();
  EXPECT_EQ(0, calls);
}

TEST(AbortControllerTest, HandlerMayDropItsOwnSubscription) {
  AbortController controller;
  SubscriptionPtr sub;
  int calls = 0;
  sub = controller.subscribe("abort", [&] {
    ++calls;
    sub.reset();
  });
  controller.abort();
  EXPECT_EQ(1, calls);
  EXPECT_EQ(nullptr, sub);
}

TEST(AbortControllerTest, OtherEventsAndLateSubscribersNeverFire) {
  AbortController controller;
  int calls = 0;
  auto other = controller.subscribe("close", [&calls] { ++calls; });
  ASSERT_NE(nullptr, other);
  EXPECT_EQ(0u, controller.listenerCount());

  controller.abort();
  auto late = controller.subscribe("abort", [&calls] { ++calls; });
  ASSERT_NE(nullptr, late);
  EXPECT_EQ(0, calls);
}

TEST(AbortControllerTest, SubscriptionOutlivingController) {
  SubscriptionPtr sub;
  {
    AbortController controller;
    sub = controller.subscribe("abort", [] {});
  }
  sub.reset();
  SUCCEED();
}

TEST(PushBodyStreamTest, BuffersUntilStarted) {
  PushBodyStream stream;
  EXPECT_TRUE(stream.push("a"));
  EXPECT_TRUE(stream.push("b"));
  stream.end();
  EXPECT_FALSE(stream.push("c"));

  std::vector<std::string> chunks;
  bool ended = false;
  stream.start([&chunks](const std::string& chunk) { chunks.push_back(chunk); },
               [&ended] { ended = true; });

  EXPECT_EQ((std::vector<std::string>{"a", "b"}), chunks);
  EXPECT_TRUE(ended);
  EXPECT_TRUE(stream.started());
  EXPECT_TRUE(stream.ended());
}

TEST(PushBodyStreamTest, DeliversLiveAfterStart) {
  PushBodyStream stream;
  std::vector<std::string> chunks;
  int ended = 0;
  stream.start([&chunks](const std::string& chunk) { chunks.push_back(chunk); },
               [&ended] { ++ended; });

  stream.push("x");
  EXPECT_EQ(1u, chunks.size());
  stream.end();
  stream.end();
  EXPECT_EQ(1, ended);
}

TEST(PushBodyStreamTest, DestroyStopsDelivery) {
  PushBodyStream stream;
  std::vector<std::string> chunks;
  stream.push("queued");
  stream.destroy(requestAbortedError());

  stream.start([&chunks](const std::string& chunk) { chunks.push_back(chunk); },
               nullptr);
  EXPECT_FALSE(stream.push("more"));
  EXPECT_TRUE(chunks.empty());
  EXPECT_TRUE(stream.destroyed());
  ASSERT_TRUE(stream.destroyError().has_value());
  EXPECT_EQ(ErrorCode::RequestAborted, stream.destroyError()->code);
}

TEST(PushBodyStreamTest, FailNotifiesObserversThenDestroys) {
  PushBodyStream stream;
  std::vector<std::string> seen;
  auto sub = stream.onError(
      [&seen](const Error& error) { seen.push_back(error.message); });
  auto dropped = stream.onError(
      [&seen](const Error&) { seen.push_back("dropped"); });
  dropped.reset();

  stream.fail(socketError("disk read failed"));
  stream.fail(socketError("again"));

  EXPECT_EQ((std::vector<std::string>{"disk read failed"}), seen);
  EXPECT_TRUE(stream.destroyed());
}

}  // namespace
}  // namespace client
}  // namespace conduit

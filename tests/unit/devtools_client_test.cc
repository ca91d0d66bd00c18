#include "core/ink_devtools_client.h"
#include "core/ink_errors.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace ink {
namespace {

using test::FakeTransport;
using test::SharedTransport;

class DevToolsClientTest : public ::testing::Test {
 protected:
  void Connect(FakeTransport::CommandHandler handler = FakeTransport::CommandHandler()) {
    transport_ = std::make_shared<FakeTransport>(std::move(handler));
    client_.reset(new DevToolsClient(std::unique_ptr<Transport>(new SharedTransport(transport_)), "test"));
  }

  std::shared_ptr<FakeTransport> transport_;
  std::unique_ptr<DevToolsClient> client_;
};

TEST_F(DevToolsClientTest, CommandReturnsResultOfMatchingReply) {
  Connect([](FakeTransport& transport, const json& command) {
    transport.Reply(command, {{"echo", command["params"]["value"]}});
  });

  json result = client_->SendCommand("Test.echo", {{"value", 42}}, 1000);
  EXPECT_EQ(result["echo"], 42);

  std::vector<json> sent = transport_->sent();
  ASSERT_EQ(sent.size(), 1u);
  EXPECT_EQ(sent[0]["method"], "Test.echo");
  EXPECT_TRUE(sent[0]["id"].is_number_integer());
}

TEST_F(DevToolsClientTest, RepliesAreCorrelatedById) {
  Connect();

  std::thread answer([this] {
    json first = transport_->WaitForSent("Test.first", 1000);
    json second = transport_->WaitForSent("Test.second", 1000);
    // Answer out of order
    transport_->Reply(second, {{"which", "second"}});
    transport_->Reply(first, {{"which", "first"}});
  });

  json first_result;
  std::thread first_caller([&] { first_result = client_->SendCommand("Test.first", json::object(), 2000); });
  ASSERT_FALSE(transport_->WaitForSent("Test.first", 1000).is_null());
  json second_result = client_->SendCommand("Test.second", json::object(), 2000);
  first_caller.join();
  answer.join();

  EXPECT_EQ(first_result["which"], "first");
  EXPECT_EQ(second_result["which"], "second");
}

TEST_F(DevToolsClientTest, ErrorReplyThrowsCommandError) {
  Connect([](FakeTransport& transport, const json& command) {
    transport.ReplyError(command, -32000, "No node with given id found");
  });

  try {
    client_->SendCommand("DOM.describeNode", {{"nodeId", 7}}, 1000);
    FAIL() << "expected ProtocolCommandError";
  } catch (const ProtocolCommandError& e) {
    EXPECT_EQ(e.error_code(), -32000);
    EXPECT_EQ(e.kind(), ErrorKind::PROTOCOL_COMMAND);
    EXPECT_NE(std::string(e.what()).find("No node with given id found"), std::string::npos);
  }
}

TEST_F(DevToolsClientTest, UnansweredCommandTimesOut) {
  Connect();
  try {
    client_->SendCommand("Test.silent", json::object(), 50);
    FAIL() << "expected ProtocolTimeoutError";
  } catch (const ProtocolTimeoutError& e) {
    EXPECT_FALSE(e.countdown_expired());
  }
  EXPECT_TRUE(client_->IsConnected());
}

TEST_F(DevToolsClientTest, CountdownExpiryIsReported) {
  Connect();
  CountdownTimer timer(30);
  timer.Start();
  try {
    client_->SendCommand("Test.silent", json::object(), 5000, &timer);
    FAIL() << "expected ProtocolTimeoutError";
  } catch (const ProtocolTimeoutError& e) {
    EXPECT_TRUE(e.countdown_expired());
  }
}

TEST_F(DevToolsClientTest, LateReplyAfterTimeoutIsDropped) {
  Connect();
  EXPECT_THROW(client_->SendCommand("Test.slow", json::object(), 20), ProtocolTimeoutError);

  json slow = transport_->WaitForSent("Test.slow", 100);
  transport_->Reply(slow, {{"late", true}});
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_TRUE(client_->IsConnected());
}

TEST_F(DevToolsClientTest, EventResolvesSubscription) {
  Connect();
  EventWaiterPtr waiter = client_->ExpectEvent(EventMatcher("Page.loadEventFired"));
  transport_->Deliver(json{{"method", "Page.loadEventFired"}, {"params", {{"timestamp", 3.5}}}});

  json event = client_->WaitForEvent(waiter, 1000);
  EXPECT_EQ(event["params"]["timestamp"], 3.5);
}

TEST_F(DevToolsClientTest, EventMatcherFiltersOnParameter) {
  Connect();
  EventMatcher matcher("Page.lifecycleEvent", "name", "networkIdle");
  EventWaiterPtr waiter = client_->ExpectEvent(matcher);

  transport_->Deliver(json{{"method", "Page.lifecycleEvent"}, {"params", {{"name", "load"}}}});
  transport_->Deliver(json{{"method", "Page.lifecycleEvent"}, {"params", {{"name", "networkIdle"}}}});

  json event = client_->WaitForEvent(waiter, 1000);
  EXPECT_EQ(event["params"]["name"], "networkIdle");
}

TEST_F(DevToolsClientTest, DuplicateSubscriptionIsRejected) {
  Connect();
  EventWaiterPtr waiter = client_->ExpectEvent(EventMatcher("Page.loadEventFired"));
  EXPECT_THROW(client_->ExpectEvent(EventMatcher("Page.loadEventFired")), std::logic_error);

  client_->CancelEvent(waiter);
  EXPECT_NO_THROW(client_->ExpectEvent(EventMatcher("Page.loadEventFired")));
}

TEST_F(DevToolsClientTest, EventWaitTimesOutAndUnsubscribes) {
  Connect();
  EXPECT_THROW(client_->WaitForEvent(EventMatcher("Page.loadEventFired"), 30), ProtocolTimeoutError);
  EXPECT_NO_THROW(client_->ExpectEvent(EventMatcher("Page.loadEventFired")));
}

TEST_F(DevToolsClientTest, UnclaimedEventsReachTheListener) {
  Connect();
  std::atomic<int> seen{0};
  client_->SetEventListener([&](const json& event) {
    if (event["method"] == "Network.requestWillBeSent") seen++;
  });

  transport_->Deliver(json{{"method", "Network.requestWillBeSent"}, {"params", json::object()}});
  transport_->Deliver(json{{"method", "Network.requestWillBeSent"}, {"params", json::object()}});

  // Replies are processed in order, so the events have been dispatched once
  // this command returns
  std::thread answer([this] {
    transport_->Reply(transport_->WaitForSent("Test.barrier", 1000), json::object());
  });
  client_->SendCommand("Test.barrier", json::object(), 1000);
  answer.join();

  EXPECT_EQ(seen, 2);
}

TEST_F(DevToolsClientTest, MalformedMessagesAreSkipped) {
  Connect([](FakeTransport& transport, const json& command) {
    transport.Deliver(std::string("this is not json"));
    transport.Deliver(json{{"id", "seven"}, {"result", json::object()}});
    transport.Deliver(json{{"neither", true}});
    transport.Reply(command, {{"ok", true}});
  });

  json result = client_->SendCommand("Test.ping", json::object(), 1000);
  EXPECT_EQ(result["ok"], true);
  EXPECT_TRUE(client_->IsConnected());
}

TEST_F(DevToolsClientTest, ConnectionLossFailsPendingWork) {
  Connect();
  EventWaiterPtr waiter = client_->ExpectEvent(EventMatcher("Page.loadEventFired"));

  std::thread drop([this] {
    transport_->WaitForSent("Test.never", 1000);
    transport_->Fault();
  });
  EXPECT_THROW(client_->SendCommand("Test.never", json::object(), 2000), ProtocolConnectionError);
  drop.join();

  EXPECT_THROW(client_->WaitForEvent(waiter, 1000), ProtocolConnectionError);
  EXPECT_FALSE(client_->IsConnected());
  EXPECT_THROW(client_->SendCommand("Test.after", json::object(), 100), ProtocolConnectionError);
}

TEST_F(DevToolsClientTest, RemoteCloseDisconnects) {
  Connect();
  transport_->Close();
  for (int i = 0; i < 100 && client_->IsConnected(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_FALSE(client_->IsConnected());
}

TEST_F(DevToolsClientTest, PostCommandFromListenerDoesNotBlock) {
  Connect([](FakeTransport& transport, const json& command) {
    if (command["method"] != "Fetch.continueRequest") {
      transport.Reply(command, json::object());
    }
  });
  DevToolsClient* client = client_.get();
  client_->SetEventListener([client](const json& event) {
    client->PostCommand("Fetch.continueRequest", {{"requestId", event["params"]["requestId"]}});
  });

  transport_->Deliver(json{{"method", "Fetch.requestPaused"}, {"params", {{"requestId", "r1"}}}});
  json posted = transport_->WaitForSent("Fetch.continueRequest", 1000);
  ASSERT_FALSE(posted.is_null());
  EXPECT_EQ(posted["params"]["requestId"], "r1");

  EXPECT_NO_THROW(client_->SendCommand("Test.after", json::object(), 1000));
}

TEST_F(DevToolsClientTest, CloseIsIdempotent) {
  Connect();
  client_->Close();
  client_->Close();
  EXPECT_FALSE(client_->IsConnected());
  EXPECT_TRUE(transport_->closed());
}

}  // namespace
}  // namespace ink

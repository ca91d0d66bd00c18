#pragma once

#include "network/ink_transport.h"
#include "util/ink_countdown_timer.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ink {

using json = nlohmann::json;

// Selects inbound events by method name and, optionally, one parameter.
struct EventMatcher {
  std::string method;
  std::string param_key;  // Empty = match on method only
  json param_value;

  EventMatcher() = default;
  explicit EventMatcher(std::string method_name) : method(std::move(method_name)) {}
  EventMatcher(std::string method_name, std::string key, json value)
      : method(std::move(method_name)), param_key(std::move(key)), param_value(std::move(value)) {}

  bool Matches(const json& event) const;

  // Two subscriptions with the same kind may not be active at once.
  std::string Kind() const;
};

// One-shot subscription. Obtained from DevToolsClient::ExpectEvent() and
// resolved by the receive thread with the event's full message.
class EventWaiter {
 public:
  explicit EventWaiter(EventMatcher matcher)
      : matcher_(std::move(matcher)), future_(promise_.get_future()) {}

  const EventMatcher& matcher() const { return matcher_; }

 private:
  friend class DevToolsClient;

  EventMatcher matcher_;
  std::promise<json> promise_;
  std::future<json> future_;
};

using EventWaiterPtr = std::shared_ptr<EventWaiter>;

// Called on the receive thread for events no subscription claimed. It must
// not call SendCommand() (the reply would never be read); PostCommand() is
// safe.
using EventListener = std::function<void(const json& event)>;

// Command/reply/event multiplexer for one DevTools connection.
//
// A receive thread is started by the constructor and reads the transport
// until it closes. Commands are correlated by id through one promise per
// request; events go to the first matching subscription, otherwise to the
// listener, otherwise they are dropped.
class DevToolsClient {
 public:
  // `name` only labels log lines ("browser", "page").
  DevToolsClient(std::unique_ptr<Transport> transport, std::string name);
  ~DevToolsClient();

  DevToolsClient(const DevToolsClient&) = delete;
  DevToolsClient& operator=(const DevToolsClient&) = delete;

  // Sends a command and waits for its reply, bounded by timeout_ms (negative
  // = no own limit) and the countdown when one is given. Returns the reply's
  // `result` object.
  // Throws ProtocolTimeoutError, ProtocolCommandError, ProtocolConnectionError.
  json SendCommand(const std::string& method,
                   const json& params = json::object(),
                   int64_t timeout_ms = -1,
                   const CountdownTimer* timer = nullptr);

  // Sends a command whose reply is not awaited. An error reply is logged.
  void PostCommand(const std::string& method, const json& params = json::object());

  // Registers a subscription. Call before sending the command that triggers
  // the event. Throws std::logic_error when a subscription of the same kind
  // is still active.
  EventWaiterPtr ExpectEvent(const EventMatcher& matcher);

  // Waits for a subscription registered with ExpectEvent(). On timeout the
  // subscription is removed and ProtocolTimeoutError is thrown.
  json WaitForEvent(const EventWaiterPtr& waiter, int64_t timeout_ms,
                    const CountdownTimer* timer = nullptr);

  // ExpectEvent() + WaitForEvent() for events not triggered by a command.
  json WaitForEvent(const EventMatcher& matcher, int64_t timeout_ms,
                    const CountdownTimer* timer = nullptr);

  // Drops a subscription that will no longer be waited for.
  void CancelEvent(const EventWaiterPtr& waiter);

  void SetEventListener(EventListener listener);
  void ClearEventListener();

  // Idempotent. Closes the transport, joins the receive thread and fails
  // everything still pending with ProtocolConnectionError.
  void Close();

  bool IsConnected() const { return connected_; }
  const std::string& name() const { return name_; }

 private:
  void ReceiveLoop();
  void HandleMessage(const std::string& text);
  void HandleReply(int64_t id, const json& message);
  void HandleEvent(const json& message);
  void FailAll(const std::string& reason);

  std::unique_ptr<Transport> transport_;
  std::string name_;
  std::string log_component_;

  std::atomic<int64_t> next_id_{1};
  std::atomic<bool> connected_{true};
  std::atomic<bool> closing_{false};

  std::mutex mutex_;  // Guards everything below
  std::unordered_map<int64_t, std::promise<json>> pending_;
  std::unordered_map<int64_t, std::string> posted_;  // Fire-and-forget id -> method
  std::vector<EventWaiterPtr> waiters_;
  EventListener listener_;

  std::mutex close_mutex_;
  std::thread receive_thread_;
};

}  // namespace ink

#include "core/ink_devtools_client.h"
#include "core/ink_errors.h"
#include "util/logger.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace ink {

namespace {

// Waits on a future for bound_ms (negative = unbounded).
template <typename T>
bool WaitBounded(std::future<T>& future, int64_t bound_ms) {
  if (bound_ms < 0) {
    future.wait();
    return true;
  }
  return future.wait_for(std::chrono::milliseconds(bound_ms)) == std::future_status::ready;
}

std::string Abbreviate(const std::string& text, size_t limit = 300) {
  if (text.size() <= limit) return text;
  return text.substr(0, limit) + "... (" + std::to_string(text.size()) + " bytes)";
}

}  // namespace

bool EventMatcher::Matches(const json& event) const {
  auto method_it = event.find("method");
  if (method_it == event.end() || !method_it->is_string() || *method_it != method) {
    return false;
  }
  if (param_key.empty()) {
    return true;
  }
  auto params_it = event.find("params");
  if (params_it == event.end() || !params_it->is_object()) {
    return false;
  }
  auto value_it = params_it->find(param_key);
  return value_it != params_it->end() && *value_it == param_value;
}

std::string EventMatcher::Kind() const {
  if (param_key.empty()) return method;
  return method + "[" + param_key + "=" + param_value.dump() + "]";
}

DevToolsClient::DevToolsClient(std::unique_ptr<Transport> transport, std::string name)
    : transport_(std::move(transport)),
      name_(std::move(name)),
      log_component_("DevTools:" + name_) {
  receive_thread_ = std::thread(&DevToolsClient::ReceiveLoop, this);
}

DevToolsClient::~DevToolsClient() {
  Close();
}

json DevToolsClient::SendCommand(const std::string& method, const json& params,
                                 int64_t timeout_ms, const CountdownTimer* timer) {
  if (!connected_) {
    throw ProtocolConnectionError("Cannot send '" + method + "', connection '" + name_ + "' is closed");
  }

  int64_t id = next_id_++;
  std::future<json> future;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    future = pending_[id].get_future();
  }

  json message = {{"id", id}, {"method", method}, {"params", params}};
  LOG_DEBUG(log_component_, "-> " + Abbreviate(message.dump()));

  try {
    transport_->Send(message.dump());
  } catch (const ProtocolConnectionError&) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(id);
    throw;
  }

  int64_t bound = CombinedTimeoutMs(timeout_ms, timer);
  if (!WaitBounded(future, bound)) {
    bool still_pending;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      still_pending = pending_.erase(id) > 0;
    }
    // The reply can land between the timeout and the erase
    if (still_pending) {
      bool countdown = timer != nullptr && timer->IsExpired();
      throw ProtocolTimeoutError("Command '" + method + "' timed out after " +
                                 std::to_string(bound) + " ms", countdown);
    }
  }

  json reply = future.get();  // Rethrows ProtocolConnectionError set by FailAll()

  auto error_it = reply.find("error");
  if (error_it != reply.end() && error_it->is_object()) {
    int code = error_it->value("code", 0);
    std::string error_message = error_it->value("message", std::string("unknown error"));
    throw ProtocolCommandError(method, code, error_message);
  }

  auto result_it = reply.find("result");
  if (result_it == reply.end()) {
    return json::object();
  }
  return *result_it;
}

void DevToolsClient::PostCommand(const std::string& method, const json& params) {
  if (!connected_) {
    throw ProtocolConnectionError("Cannot post '" + method + "', connection '" + name_ + "' is closed");
  }

  int64_t id = next_id_++;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    posted_[id] = method;
  }

  json message = {{"id", id}, {"method", method}, {"params", params}};
  LOG_DEBUG(log_component_, "-> " + Abbreviate(message.dump()) + " (no wait)");

  try {
    transport_->Send(message.dump());
  } catch (const ProtocolConnectionError&) {
    std::lock_guard<std::mutex> lock(mutex_);
    posted_.erase(id);
    throw;
  }
}

EventWaiterPtr DevToolsClient::ExpectEvent(const EventMatcher& matcher) {
  auto waiter = std::make_shared<EventWaiter>(matcher);
  std::string kind = matcher.Kind();

  std::lock_guard<std::mutex> lock(mutex_);
  if (!connected_) {
    throw ProtocolConnectionError("Cannot subscribe to '" + kind + "', connection '" + name_ + "' is closed");
  }
  for (const auto& existing : waiters_) {
    if (existing->matcher_.Kind() == kind) {
      throw std::logic_error("A subscription for '" + kind + "' is already active on '" + name_ + "'");
    }
  }
  waiters_.push_back(waiter);
  return waiter;
}

json DevToolsClient::WaitForEvent(const EventWaiterPtr& waiter, int64_t timeout_ms,
                                  const CountdownTimer* timer) {
  int64_t bound = CombinedTimeoutMs(timeout_ms, timer);
  if (!WaitBounded(waiter->future_, bound)) {
    bool still_waiting;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
      still_waiting = it != waiters_.end();
      if (still_waiting) waiters_.erase(it);
    }
    if (still_waiting) {
      bool countdown = timer != nullptr && timer->IsExpired();
      throw ProtocolTimeoutError("Event '" + waiter->matcher_.Kind() + "' not received within " +
                                 std::to_string(bound) + " ms", countdown);
    }
  }
  return waiter->future_.get();
}

json DevToolsClient::WaitForEvent(const EventMatcher& matcher, int64_t timeout_ms,
                                  const CountdownTimer* timer) {
  return WaitForEvent(ExpectEvent(matcher), timeout_ms, timer);
}

void DevToolsClient::CancelEvent(const EventWaiterPtr& waiter) {
  std::lock_guard<std::mutex> lock(mutex_);
  waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), waiter), waiters_.end());
}

void DevToolsClient::SetEventListener(EventListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = std::move(listener);
}

void DevToolsClient::ClearEventListener() {
  std::lock_guard<std::mutex> lock(mutex_);
  listener_ = nullptr;
}

void DevToolsClient::Close() {
  std::lock_guard<std::mutex> lock(close_mutex_);
  closing_ = true;
  transport_->Close();

  // A listener may end up here on the receive thread; the destructor joins
  // it later from the owning thread.
  if (receive_thread_.joinable() && receive_thread_.get_id() != std::this_thread::get_id()) {
    receive_thread_.join();
  }
  connected_ = false;
  FailAll("Connection '" + name_ + "' was closed");
}

void DevToolsClient::ReceiveLoop() {
  std::string reason;
  std::string text;
  try {
    while (transport_->Receive(&text)) {
      try {
        HandleMessage(text);
      } catch (const ProtocolFormatError& e) {
        LOG_WARN(log_component_, std::string("Dropped message: ") + e.what());
      }
    }
    reason = closing_ ? "Connection '" + name_ + "' was closed"
                      : "Connection '" + name_ + "' was closed by the browser";
  } catch (const ProtocolConnectionError& e) {
    reason = "Connection '" + name_ + "' failed: " + e.what();
    LOG_ERROR(log_component_, reason);
  }

  connected_ = false;
  FailAll(reason);
  LOG_DEBUG(log_component_, "Receive loop finished");
}

void DevToolsClient::HandleMessage(const std::string& text) {
  json message = json::parse(text, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    throw ProtocolFormatError("Not a JSON object: " + Abbreviate(text, 120));
  }

  auto id_it = message.find("id");
  if (id_it != message.end()) {
    if (!id_it->is_number_integer()) {
      throw ProtocolFormatError("Reply id is not an integer: " + Abbreviate(text, 120));
    }
    HandleReply(id_it->get<int64_t>(), message);
    return;
  }

  if (message.contains("method")) {
    HandleEvent(message);
    return;
  }

  throw ProtocolFormatError("Neither reply nor event: " + Abbreviate(text, 120));
}

void DevToolsClient::HandleReply(int64_t id, const json& message) {
  std::promise<json> promise;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
      auto posted_it = posted_.find(id);
      if (posted_it == posted_.end()) {
        LOG_WARN(log_component_, "Reply for unknown id " + std::to_string(id) + " dropped");
        return;
      }
      if (message.contains("error")) {
        LOG_WARN(log_component_, "Command '" + posted_it->second + "' failed: " +
                 message["error"].dump());
      }
      posted_.erase(posted_it);
      return;
    }
    promise = std::move(it->second);
    pending_.erase(it);
  }

  LOG_DEBUG(log_component_, "<- " + Abbreviate(message.dump()));
  promise.set_value(message);
}

void DevToolsClient::HandleEvent(const json& message) {
  EventWaiterPtr matched;
  EventListener listener;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = waiters_.begin(); it != waiters_.end(); ++it) {
      if ((*it)->matcher_.Matches(message)) {
        matched = *it;
        waiters_.erase(it);
        break;
      }
    }
    if (!matched) {
      listener = listener_;
    }
  }

  if (matched) {
    matched->promise_.set_value(message);
    return;
  }

  if (!listener) {
    return;
  }

  try {
    listener(message);
  } catch (const InkError& e) {
    LOG_WARN(log_component_, "Event listener failed on '" +
             message.value("method", std::string()) + "': " + e.what());
  } catch (const json::exception& e) {
    LOG_WARN(log_component_, "Event listener could not read '" +
             message.value("method", std::string()) + "': " + e.what());
  }
}

void DevToolsClient::FailAll(const std::string& reason) {
  std::unordered_map<int64_t, std::promise<json>> pending;
  std::vector<EventWaiterPtr> waiters;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending.swap(pending_);
    posted_.clear();
    waiters.swap(waiters_);
    listener_ = nullptr;
  }

  for (auto& entry : pending) {
    entry.second.set_exception(std::make_exception_ptr(ProtocolConnectionError(reason)));
  }
  for (auto& waiter : waiters) {
    waiter->promise_.set_exception(std::make_exception_ptr(ProtocolConnectionError(reason)));
  }
}

}  // namespace ink

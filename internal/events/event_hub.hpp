#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"

namespace tierbridge::events {

/*
  EventHub

  Named topics with many-to-one fan-out. Subscribers attach and detach
  without affecting the producer; a topic with no subscribers simply drops
  its events.

  Callbacks run on the publishing thread, outside the hub lock, so a
  callback may (un)subscribe. A callback that throws is logged and skipped.
*/
template <typename Event>
class EventHub {
 public:
  using Callback = std::function<void(const Event&)>;
  using Token    = uint64_t;

  Token Subscribe(const std::string& topic, Callback callback) {
    std::lock_guard lock(mutex_);
    const Token     token = next_token_++;
    topics_[topic].emplace_back(token, std::make_shared<Callback>(std::move(callback)));
    token_topics_.emplace(token, topic);
    return token;
  }

  void Unsubscribe(Token token) {
    std::lock_guard lock(mutex_);
    auto            it = token_topics_.find(token);
    if (it == token_topics_.end()) return;

    auto topic_it = topics_.find(it->second);
    if (topic_it != topics_.end()) {
      auto& subs = topic_it->second;
      for (auto sub = subs.begin(); sub != subs.end(); ++sub) {
        if (sub->first == token) {
          subs.erase(sub);
          break;
        }
      }
      if (subs.empty()) topics_.erase(topic_it);
    }
    token_topics_.erase(it);
  }

  void Publish(const std::string& topic, const Event& event) {
    std::vector<std::shared_ptr<Callback>> targets;
    {
      std::lock_guard lock(mutex_);
      auto            it = topics_.find(topic);
      if (it == topics_.end()) return;
      targets.reserve(it->second.size());
      for (const auto& [_, callback] : it->second) {
        targets.push_back(callback);
      }
    }

    for (const auto& callback : targets) {
      try {
        (*callback)(event);
      } catch (const std::exception& e) {
        TIERBRIDGE_LOG_WARN("event subscriber failed",
                            {observability::StringField("topic", topic), observability::StringField("error", e.what())});
      }
    }
  }

  size_t SubscriberCount(const std::string& topic) const {
    std::lock_guard lock(mutex_);
    auto            it = topics_.find(topic);
    return it == topics_.end() ? 0 : it->second.size();
  }

 private:
  mutable std::mutex                                                                     mutex_;
  Token                                                                                  next_token_ = 1;
  std::unordered_map<std::string, std::vector<std::pair<Token, std::shared_ptr<Callback>>>> topics_;
  std::unordered_map<Token, std::string>                                                 token_topics_;
};

/*
  Blocking subscriber used by server-streaming RPCs.

  Subscribes on construction and unsubscribes on destruction. When the
  consumer falls behind by more than `capacity` events the oldest are
  dropped; progress events are snapshots, so the newest one wins.
*/
template <typename Event>
class EventQueue {
 public:
  EventQueue(EventHub<Event>& hub, std::string topic, size_t capacity = 1024)
      : hub_(hub), state_(std::make_shared<State>()) {
    state_->capacity = capacity == 0 ? 1 : capacity;
    auto state       = state_;
    token_           = hub_.Subscribe(topic, [state](const Event& event) {
      {
        std::lock_guard lock(state->mutex);
        if (state->closed) return;
        if (state->events.size() >= state->capacity) state->events.pop_front();
        state->events.push_back(event);
      }
      state->cv.notify_one();
    });
  }

  ~EventQueue() {
    hub_.Unsubscribe(token_);
    Close();
  }

  EventQueue(const EventQueue&)            = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  // nullopt on timeout or once closed and drained.
  std::optional<Event> Pop(std::chrono::milliseconds timeout) {
    std::unique_lock lock(state_->mutex);
    state_->cv.wait_for(lock, timeout, [this] { return state_->closed || !state_->events.empty(); });
    if (state_->events.empty()) return std::nullopt;
    Event event = std::move(state_->events.front());
    state_->events.pop_front();
    return event;
  }

  void Close() {
    {
      std::lock_guard lock(state_->mutex);
      state_->closed = true;
    }
    state_->cv.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard lock(state_->mutex);
    return state_->closed;
  }

 private:
  struct State {
    std::mutex              mutex;
    std::condition_variable cv;
    std::deque<Event>       events;
    size_t                  capacity = 1024;
    bool                    closed   = false;
  };

  EventHub<Event>&       hub_;
  std::shared_ptr<State> state_;
  typename EventHub<Event>::Token token_ = 0;
};

} // namespace tierbridge::events

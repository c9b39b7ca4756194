#include "internal/events/event_hub.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using tierbridge::events::EventHub;
using tierbridge::events::EventQueue;

void TestFanOutPerTopic() {
  EventHub<int>    hub;
  std::vector<int> a;
  std::vector<int> b;

  const auto ta = hub.Subscribe("t", [&](const int& v) { a.push_back(v); });
  hub.Subscribe("t", [&](const int& v) { b.push_back(v * 10); });
  hub.Subscribe("other", [&](const int&) { assert(false); });

  hub.Publish("t", 1);
  assert(hub.SubscriberCount("t") == 2);

  hub.Unsubscribe(ta);
  hub.Publish("t", 2);

  assert((a == std::vector<int>{1}));
  assert((b == std::vector<int>{10, 20}));

  // Topics without subscribers drop events; unknown tokens are ignored.
  hub.Publish("nobody", 3);
  hub.Unsubscribe(9999);
}

void TestThrowingSubscriberDoesNotStopDelivery() {
  EventHub<int> hub;
  int           delivered = 0;

  hub.Subscribe("t", [](const int&) { throw std::runtime_error("boom"); });
  hub.Subscribe("t", [&](const int&) { ++delivered; });

  hub.Publish("t", 1);
  assert(delivered == 1);
}

void TestCallbackMayUnsubscribeItself() {
  EventHub<int>        hub;
  EventHub<int>::Token token = 0;
  int                  calls = 0;

  token = hub.Subscribe("t", [&](const int&) {
    ++calls;
    hub.Unsubscribe(token);
  });

  hub.Publish("t", 1);
  hub.Publish("t", 2);
  assert(calls == 1);
  assert(hub.SubscriberCount("t") == 0);
}

void TestQueueDeliversAcrossThreads() {
  EventHub<std::string>   hub;
  EventQueue<std::string> queue(hub, "progress");

  std::thread producer([&] {
    for (int i = 0; i < 3; ++i) {
      hub.Publish("progress", "event-" + std::to_string(i));
    }
  });

  for (int i = 0; i < 3; ++i) {
    auto event = queue.Pop(std::chrono::seconds(2));
    assert(event.has_value());
    assert(*event == "event-" + std::to_string(i));
  }
  producer.join();

  assert(!queue.Pop(std::chrono::milliseconds(10)).has_value());
}

void TestQueueDropsOldestWhenFull() {
  EventHub<int>   hub;
  EventQueue<int> queue(hub, "t", 2);

  hub.Publish("t", 1);
  hub.Publish("t", 2);
  hub.Publish("t", 3);

  assert(queue.Pop(std::chrono::milliseconds(0)) == 2);
  assert(queue.Pop(std::chrono::milliseconds(0)) == 3);
}

void TestQueueUnsubscribesOnDestruction() {
  EventHub<int> hub;
  {
    EventQueue<int> queue(hub, "t");
    assert(hub.SubscriberCount("t") == 1);

    queue.Close();
    assert(queue.IsClosed());
    hub.Publish("t", 1);
    assert(!queue.Pop(std::chrono::milliseconds(0)).has_value());
  }
  assert(hub.SubscriberCount("t") == 0);
}

} // namespace

int main() {
  TestFanOutPerTopic();
  TestThrowingSubscriberDoesNotStopDelivery();
  TestCallbackMayUnsubscribeItself();
  TestQueueDeliversAcrossThreads();
  TestQueueDropsOldestWhenFull();
  TestQueueUnsubscribesOnDestruction();

  std::cout << "tierbridge_unit_event_hub: pass\n";
  return 0;
}

#include "internal/sync/event_hub.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace {

using gearledger::sync::EventHub;
using gearledger::sync::Subscription;
using namespace std::chrono_literals;

void TestPublishWithoutSubscribersIsDropped() {
  EventHub hub(8);
  assert(hub.Publish("lost") == 0);

  auto subscription = hub.Subscribe();
  std::string event;
  assert(subscription->Pop(20ms, &event) == Subscription::PopStatus::kTimeout);
}

void TestEverySubscriberReceivesInOrder() {
  EventHub hub(8);
  auto     a = hub.Subscribe();
  auto     b = hub.Subscribe();
  assert(hub.SubscriberCount() == 2);

  assert(hub.Publish("one") == 2);
  assert(hub.Publish("two") == 2);

  for (const auto& subscription : {a, b}) {
    std::string event;
    assert(subscription->Pop(100ms, &event) == Subscription::PopStatus::kEvent);
    assert(event == "one");
    assert(subscription->Pop(100ms, &event) == Subscription::PopStatus::kEvent);
    assert(event == "two");
  }
}

void TestFullSubscriberIsEvicted() {
  EventHub hub(2);
  auto     slow = hub.Subscribe();
  auto     fast = hub.Subscribe();

  std::string event;
  assert(hub.Publish("1") == 2);
  assert(fast->Pop(100ms, &event) == Subscription::PopStatus::kEvent);
  assert(hub.Publish("2") == 2);
  assert(fast->Pop(100ms, &event) == Subscription::PopStatus::kEvent);

  // `slow` now holds two events; the third overflows it.
  assert(hub.Publish("3") == 1);
  assert(hub.SubscriberCount() == 1);
  assert(slow->IsClosed());

  // Queued events are drained before the close is reported.
  assert(slow->Pop(10ms, &event) == Subscription::PopStatus::kEvent && event == "1");
  assert(slow->Pop(10ms, &event) == Subscription::PopStatus::kEvent && event == "2");
  assert(slow->Pop(10ms, &event) == Subscription::PopStatus::kClosed);

  assert(fast->Pop(100ms, &event) == Subscription::PopStatus::kEvent && event == "3");
}

void TestUnsubscribeStopsDelivery() {
  EventHub hub(4);
  auto     subscription = hub.Subscribe();
  hub.Unsubscribe(subscription);

  assert(hub.SubscriberCount() == 0);
  assert(hub.Publish("x") == 0);

  std::string event;
  assert(subscription->Pop(10ms, &event) == Subscription::PopStatus::kClosed);
}

void TestPopWakesOnPublish() {
  EventHub hub(4);
  auto     subscription = hub.Subscribe();

  std::thread publisher([&hub] {
    std::this_thread::sleep_for(20ms);
    hub.Publish("wake");
  });

  std::string event;
  assert(subscription->Pop(2000ms, &event) == Subscription::PopStatus::kEvent);
  assert(event == "wake");
  publisher.join();
}

void TestCloseAllReleasesWaitersAndLaterSubscribers() {
  EventHub hub(4);
  auto     subscription = hub.Subscribe();

  std::thread closer([&hub] {
    std::this_thread::sleep_for(20ms);
    hub.CloseAll();
  });

  std::string event;
  assert(subscription->Pop(2000ms, &event) == Subscription::PopStatus::kClosed);
  closer.join();

  assert(hub.SubscriberCount() == 0);
  auto late = hub.Subscribe();
  assert(late->IsClosed());
  assert(hub.SubscriberCount() == 0);
}

} // namespace

int main() {
  TestPublishWithoutSubscribersIsDropped();
  TestEverySubscriberReceivesInOrder();
  TestFullSubscriberIsEvicted();
  TestUnsubscribeStopsDelivery();
  TestPopWakesOnPublish();
  TestCloseAllReleasesWaitersAndLaterSubscribers();

  std::cout << "gearledger_unit_event_hub: pass\n";
  return 0;
}

#include "internal/transfer/transfer_scheduler.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

#include "internal/transfer/speed_window.hpp"

namespace {

using tierbridge::transfer::SpeedWindow;
using tierbridge::transfer::TransferScheduler;
using tierbridge::transfer::TransferTask;

void TestSaturatedSourceIsSkipped() {
  TransferScheduler scheduler(1);
  scheduler.Enqueue(TransferTask{"t1", "s3"});
  scheduler.Enqueue(TransferTask{"t2", "s3"});
  scheduler.Enqueue(TransferTask{"t3", "nas"});

  auto first = scheduler.Dequeue();
  assert(first.has_value() && first->transfer_id == "t1");
  assert(scheduler.Running("s3") == 1);

  // t2 waits for the s3 slot; t3 overtakes it.
  auto second = scheduler.Dequeue();
  assert(second.has_value() && second->transfer_id == "t3");

  scheduler.Release("s3");
  auto third = scheduler.Dequeue();
  assert(third.has_value() && third->transfer_id == "t2");

  scheduler.Release("s3");
  scheduler.Release("nas");
  assert(scheduler.Running("s3") == 0);
  assert(scheduler.Queued() == 0);
}

void TestRemoveDropsQueuedTask() {
  TransferScheduler scheduler(2);
  scheduler.Enqueue(TransferTask{"t1", "s3"});
  scheduler.Enqueue(TransferTask{"t2", "s3"});

  assert(scheduler.Remove("t1"));
  assert(!scheduler.Remove("t1"));
  assert(scheduler.Queued() == 1);

  auto next = scheduler.Dequeue();
  assert(next.has_value() && next->transfer_id == "t2");
}

void TestShutdownWakesBlockedWorker() {
  TransferScheduler scheduler(1);
  bool              woke = false;

  std::thread worker([&] {
    auto task = scheduler.Dequeue();
    woke      = !task.has_value();
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  scheduler.Shutdown();
  worker.join();
  assert(woke);
}

void TestSpeedWindowIgnoresTimeBeforeReset() {
  using namespace std::chrono;
  SpeedWindow window(milliseconds(5000));
  const auto  t0 = SpeedWindow::Clock::now();

  assert(!window.Rate(t0).has_value());

  // A long pause followed by a resume must not dilute the rate.
  window.Reset(t0 + seconds(60));
  window.Add(1000, t0 + seconds(61));
  auto rate = window.Rate(t0 + seconds(62));
  assert(rate.has_value());
  assert(*rate == 500.0);

  // Samples older than the window drop out.
  window.Add(0, t0 + seconds(70));
  rate = window.Rate(t0 + seconds(70));
  assert(rate.has_value() && *rate == 0.0);

  window.Clear();
  assert(!window.Rate(t0 + seconds(71)).has_value());
}

} // namespace

int main() {
  TestSaturatedSourceIsSkipped();
  TestRemoveDropsQueuedTask();
  TestShutdownWakesBlockedWorker();
  TestSpeedWindowIgnoresTimeBeforeReset();

  std::cout << "tierbridge_unit_transfer_scheduler: pass\n";
  return 0;
}

#include <atomic>
#include <cassert>
#include <future>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "internal/runtime/worker_pool.hpp"
#include "internal/util/errors.hpp"

using healthstore::runtime::WorkerPool;

namespace {

void TestRunsSubmittedTasks() {
  WorkerPool pool(4, 64);
  pool.Start();

  std::atomic<int>              sum{0};
  std::vector<std::future<int>> futures;
  for (int i = 1; i <= 32; ++i) {
    futures.push_back(pool.Submit([i, &sum] {
      sum += i;
      return i * 2;
    }));
  }

  int doubled = 0;
  for (auto& future : futures) doubled += future.get();

  assert(sum == 528);
  assert(doubled == 1056);
  pool.Stop();
}

void TestExceptionsReachTheCaller() {
  WorkerPool pool(1, 4);
  pool.Start();

  auto future = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
  bool threw  = false;
  try {
    future.get();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestFullQueueIsRejected() {
  // not started: nothing drains the queue
  WorkerPool pool(1, 2);
  auto       first  = pool.Submit([] {});
  auto       second = pool.Submit([] {});

  bool threw = false;
  try {
    pool.Submit([] {});
  } catch (const healthstore::util::ResourceExhausted&) {
    threw = true;
  }
  assert(threw);

  // queued tasks still run once the pool starts and stops
  pool.Start();
  pool.Stop();
  first.get();
  second.get();
}

void TestStoppedPoolRejectsWork() {
  WorkerPool pool(2, 8);
  pool.Start();
  pool.Stop();

  bool threw = false;
  try {
    pool.Submit([] {});
  } catch (const healthstore::util::ResourceExhausted&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestRunsSubmittedTasks();
  TestExceptionsReachTheCaller();
  TestFullQueueIsRejected();
  TestStoppedPoolRejectsWork();

  std::cout << "health_store_unit_worker_pool: pass\n";
  return 0;
}

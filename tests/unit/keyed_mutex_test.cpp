#include "internal/util/keyed_mutex.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using freight::util::KeyedLock;
using freight::util::KeyedMutex;

void TestEntryLivesOnlyWhileLocked() {
  KeyedMutex registry;
  assert(registry.Size() == 0);
  {
    KeyedLock a(registry, "shipment-1");
    KeyedLock b(registry, "shipment-2");
    assert(registry.Size() == 2);
  }
  assert(registry.Size() == 0);
}

void TestContendedKeyIsReleasedByLastHolder() {
  KeyedMutex registry;
  int        counter = 0;

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&registry, &counter]() {
      for (int i = 0; i < 500; ++i) {
        KeyedLock lock(registry, "hot");
        ++counter;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(counter == 8 * 500);
  assert(registry.Size() == 0);
}

void TestManyKeysDoNotAccumulate() {
  KeyedMutex       registry;
  std::atomic<int> done{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&registry, &done, t]() {
      for (int i = 0; i < 1000; ++i) {
        KeyedLock lock(registry, "driver-" + std::to_string(t) + "-" + std::to_string(i));
        done.fetch_add(1);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(done.load() == 4000);
  assert(registry.Size() == 0);
}

} // namespace

int main() {
  TestEntryLivesOnlyWhileLocked();
  TestContendedKeyIsReleasedByLastHolder();
  TestManyKeysDoNotAccumulate();

  std::cout << "freight_exchange_unit_keyed_mutex: pass\n";
  return 0;
}

#include "wtmirror/scheduler.hpp"
#include "wtmirror/settings.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

// Runs `n` delayed units and returns the highest in-flight count observed.
static int peak_in_flight(std::size_t parallelism, int n) {
  std::atomic<int> in_flight{0};
  std::atomic<int> peak{0};

  std::vector<std::function<int()>> units;
  for (int i = 0; i < n; ++i) {
    units.emplace_back([&, i] {
      const int now = ++in_flight;
      int seen = peak.load();
      while (now > seen && !peak.compare_exchange_weak(seen, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5 + (i % 3) * 5));
      --in_flight;
      return i;
    });
  }

  const wtmirror::BoundedScheduler scheduler{parallelism};
  const auto results = scheduler.run(std::move(units));
  for (int i = 0; i < n; ++i) {
    if (!results[i] || *results[i] != i)
      return -1;
  }
  return peak.load();
}

int main() {
  for (const std::size_t p : {1U, 2U, 4U}) {
    const int peak = peak_in_flight(p, 16);
    if (peak < 0) {
      std::cerr << "results out of order for P=" << p << "\n";
      return 1;
    }
    if (peak > static_cast<int>(p)) {
      std::cerr << "P=" << p << " but observed " << peak << " in flight\n";
      return 1;
    }
  }

  // a failing unit is isolated; results stay in input order
  {
    std::vector<std::function<int()>> units;
    units.emplace_back([] { return 10; });
    units.emplace_back([]() -> int { throw std::runtime_error("boom"); });
    units.emplace_back([] {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      return 30;
    });
    units.emplace_back([] { return 40; });
    const auto results = wtmirror::BoundedScheduler{2}.run(std::move(units));
    if (results.size() != 4 || results[0] != 10 || results[1].has_value() || results[2] != 30 ||
        results[3] != 40) {
      std::cerr << "failure isolation / ordering broken\n";
      return 1;
    }
  }

  // 0 means "all logical processors"
  if (wtmirror::BoundedScheduler{0}.parallelism() < 1) {
    std::cerr << "parallelism 0 should resolve to at least 1\n";
    return 1;
  }
  if (wtmirror::effective_parallelism(0, 8) != 8 || wtmirror::effective_parallelism(3, 8) != 3 ||
      wtmirror::effective_parallelism(0, 0) != 1) {
    std::cerr << "effective_parallelism mismatch\n";
    return 1;
  }

  if (!wtmirror::BoundedScheduler{4}.run(std::vector<std::function<int()>>{}).empty()) {
    std::cerr << "empty batch should yield no results\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}

#pragma once
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <optional>
#include <semaphore>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace wtmirror {

// Runs units of work with at most `parallelism` in flight. Units start in list
// order; the caller blocks for a free slot once the limit is reached.
class BoundedScheduler {
public:
  // 0 selects the number of logical processors
  explicit BoundedScheduler(std::size_t parallelism);

  [[nodiscard]] std::size_t parallelism() const { return parallelism_; }

  // result[i] holds unit i's value, or is empty if unit i threw. Failures never
  // affect other units and are not retried.
  template <typename T>
  auto run(std::vector<std::function<T()>> units) const -> std::vector<std::optional<T>>;

private:
  std::size_t parallelism_;
};

template <typename T>
auto BoundedScheduler::run(std::vector<std::function<T()>> units) const
    -> std::vector<std::optional<T>> {
  using Slots = std::counting_semaphore<>;
  Slots slots(static_cast<std::ptrdiff_t>(parallelism_));

  // Returns the slot even when the unit throws
  struct SlotRelease {
    Slots &s;
    ~SlotRelease() { s.release(); }
  };

  std::vector<std::optional<std::future<T>>> inflight;
  inflight.reserve(units.size());
  for (auto &unit : units) {
    slots.acquire();
    try {
      inflight.emplace_back(std::async(std::launch::async, [&slots, fn = std::move(unit)]() -> T {
        const SlotRelease release{slots};
        return fn();
      }));
    } catch (const std::system_error &) {
      // no thread available for this unit: it fails, the batch continues
      slots.release();
      inflight.emplace_back(std::nullopt);
    }
  }

  std::vector<std::optional<T>> results;
  results.reserve(inflight.size());
  for (auto &f : inflight) {
    if (!f) {
      results.emplace_back(std::nullopt);
      continue;
    }
    try {
      results.emplace_back(f->get());
    } catch (const std::exception &) {
      results.emplace_back(std::nullopt);
    }
  }
  return results;
}

} // namespace wtmirror

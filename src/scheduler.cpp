#include "wtmirror/scheduler.hpp"

#include <thread>

namespace wtmirror {

BoundedScheduler::BoundedScheduler(std::size_t parallelism) : parallelism_(parallelism) {
  if (parallelism_ == 0) {
    parallelism_ = std::thread::hardware_concurrency();
    if (parallelism_ == 0)
      parallelism_ = 1;
  }
}

} // namespace wtmirror

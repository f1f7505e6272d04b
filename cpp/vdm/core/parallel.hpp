#pragma once
/*
================================================================================
Fragment 1.8 - Core: Fork/Join Helper
FILE: cpp/vdm/core/parallel.hpp

Purpose:
  - Run `count` independent jobs on up to `threads` std::threads and join
    them all before returning (stage barrier).
  - Jobs are claimed through an atomic counter; the mapping job -> thread is
    irrelevant to results as long as jobs write disjoint outputs.

Error policy:
  - The first exception thrown by any job is rethrown on the calling thread
    after every worker has joined. Remaining jobs are skipped.
================================================================================
*/

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace vdm {

// 0 -> hardware concurrency (at least 1).
inline std::size_t resolve_thread_count(int requested) noexcept {
  if (requested > 0) return static_cast<std::size_t>(requested);
  const unsigned hc = std::thread::hardware_concurrency();
  return hc == 0 ? 1u : static_cast<std::size_t>(hc);
}

template <class Fn>
void parallel_for(std::size_t count, std::size_t threads, Fn&& fn) {
  if (count == 0) return;
  threads = std::max<std::size_t>(1, std::min(threads, count));

  if (threads == 1) {
    for (std::size_t i = 0; i < count; ++i) fn(i);
    return;
  }

  std::atomic<std::size_t> next{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto worker = [&]() {
    for (;;) {
      if (failed.load()) return;
      const std::size_t i = next.fetch_add(1);
      if (i >= count) return;
      try {
        fn(i);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) first_error = std::current_exception();
        failed.store(true);
        return;
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(threads);
  for (std::size_t t = 0; t < threads; ++t) pool.emplace_back(worker);
  for (auto& th : pool) th.join();

  if (first_error) std::rethrow_exception(first_error);
}

}  // namespace vdm

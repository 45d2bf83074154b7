#pragma once
/*
================================================================================
Fragment 4.1 — Analysis: Slot-Indexed Worker Pool
FILE: cpp/engine/analysis/worker_pool.hpp

Purpose:
  - Run `count` independent jobs on up to `workers` threads.
  - Job i writes ONLY to result slot i; workers share nothing else, so no
    locking is needed and the collected output equals a sequential run.

Hardening:
  - Static striping (worker t takes i = t, t+W, ...): assignment does not
    depend on timing.
  - An exception thrown by a job is captured in its slot and rethrown on
    the calling thread after every worker has joined (lowest slot first).
================================================================================
*/

#include <algorithm>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

namespace fleetopt::analysis {

template <class Job>
void run_slots(std::size_t count, int workers, Job&& job) {
  if (count == 0) return;

  std::vector<std::exception_ptr> errors(count);
  auto run_one = [&](std::size_t i) {
    try {
      job(i);
    } catch (...) {
      errors[i] = std::current_exception();  // rethrown below
    }
  };

  const std::size_t w = std::min<std::size_t>(count, static_cast<std::size_t>(std::max(1, workers)));
  if (w == 1) {
    for (std::size_t i = 0; i < count; ++i) run_one(i);
  } else {
    std::vector<std::thread> pool;
    pool.reserve(w);
    for (std::size_t t = 0; t < w; ++t) {
      pool.emplace_back([&, t] {
        for (std::size_t i = t; i < count; i += w) run_one(i);
      });
    }
    for (auto& th : pool) th.join();
  }

  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }
}

}  // namespace fleetopt::analysis

#include "thread_pool.hpp"

#include <exception>
#include <string>

#include "errors.hpp"
#include "log.hpp"

ThreadPool::ThreadPool(int threads, size_t queue_cap) : q_(queue_cap) {
  if (threads < 1) {
    throw PoolConfigurationError("worker pool size must be at least 1, got " +
                                 std::to_string(threads));
  }

  workers_.reserve(static_cast<size_t>(threads));
  try {
    for (size_t i = 0; i < static_cast<size_t>(threads); i++) {
      workers_.push_back(Worker{i, std::thread([this, i] { worker_loop(i); })});
    }
  } catch (...) {
    // std::thread failed to spawn: stop the ones already running, then report
    shutdown();
    throw;
  }
}

ThreadPool::~ThreadPool() { shutdown(); }

void ThreadPool::shutdown() {
  std::lock_guard<std::mutex> lk(shutdown_mu_);
  q_.close();

  for (auto& w : workers_) {
    if (w.thread.joinable()) w.thread.join();
  }
}

bool ThreadPool::submit(Job job) { return q_.push(std::move(job)); }

void ThreadPool::worker_loop(size_t worker_id) {
  while (true) {
    auto job = q_.pop();
    if (!job.has_value()) break;  // closed + drained

    // A faulting job must not take the worker down with it.
    try {
      (*job)();
    } catch (const std::exception& e) {
      log_error("worker " + std::to_string(worker_id) +
                ": job failed: " + e.what());
    } catch (...) {
      log_error("worker " + std::to_string(worker_id) +
                ": job failed with unknown exception");
    }
  }
  log_debug("worker " + std::to_string(worker_id) + " exiting");
}

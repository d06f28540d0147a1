#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "blocking_queue.hpp"

// Fixed set of workers draining one shared job queue.
//
// The pool size never changes after construction. Closing the queue is the
// only shutdown signal: workers finish whatever is in flight and whatever is
// already queued, then exit and are joined by shutdown().
class ThreadPool {
 public:
  using Job = std::function<void()>;

  // Throws PoolConfigurationError if threads < 1. queue_cap == 0 means the
  // queue is unbounded; otherwise submit() blocks while it is full.
  ThreadPool(int threads, size_t queue_cap);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Returns false once the pool has been shut down; the job is not run.
  bool submit(Job job);

  // Idempotent. Blocks until every worker thread has been joined.
  void shutdown();

  size_t size() const { return workers_.size(); }
  size_t pending() const { return q_.size(); }

 private:
  struct Worker {
    size_t id;
    std::thread thread;
  };

  void worker_loop(size_t worker_id);

  BlockingQueue<Job> q_;
  std::vector<Worker> workers_;
  std::mutex shutdown_mu_;
};

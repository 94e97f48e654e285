#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace logship::upload {

/*
  Thread-safe blocking queue of transfer jobs.
*/
class TransferQueue {
 public:
  using Job = std::function<void()>;

  void Enqueue(Job job);

  // blocking wait; nullopt once shut down and drained
  std::optional<Job> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Job>         queue_;
  bool                    shutdown_ = false;
};

/*
  Fixed set of worker threads running file transfers in parallel.
  Each file is one job; its parts and commit run on that job's thread.
*/
class TransferPool {
 public:
  explicit TransferPool(size_t workers);
  ~TransferPool();

  TransferPool(const TransferPool&)            = delete;
  TransferPool& operator=(const TransferPool&) = delete;

  void Start();
  void Stop();

  // The future carries any exception thrown by fn.
  std::future<void> Submit(std::function<void()> fn);

  size_t workers() const {
    return worker_count_;
  }

 private:
  void Run();

  size_t                   worker_count_;
  TransferQueue            queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace logship::upload

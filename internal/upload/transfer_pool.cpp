#include "transfer_pool.hpp"

#include <algorithm>
#include <memory>

#include "internal/observability/logging.hpp"

namespace logship::upload {

using logship::observability::StringField;

void TransferQueue::Enqueue(Job job) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(job));
  }
  cv_.notify_one();
}

std::optional<TransferQueue::Job> TransferQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  Job job = std::move(queue_.front());
  queue_.pop();
  return job;
}

void TransferQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

TransferPool::TransferPool(size_t workers) : worker_count_(std::max<size_t>(workers, 1)) {
}

TransferPool::~TransferPool() {
  Stop();
}

void TransferPool::Start() {
  if (running_.exchange(true)) {
    return;
  }
  for (size_t i = 0; i < worker_count_; ++i) {
    threads_.emplace_back(&TransferPool::Run, this);
  }
}

void TransferPool::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  queue_.Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

std::future<void> TransferPool::Submit(std::function<void()> fn) {
  auto task   = std::make_shared<std::packaged_task<void()>>(std::move(fn));
  auto future = task->get_future();
  queue_.Enqueue([task] { (*task)(); });
  return future;
}

void TransferPool::Run() {
  while (true) {
    auto job = queue_.Dequeue();
    if (!job) break;

    try {
      (*job)();
    } catch (const std::exception& e) {
      // packaged_task captures exceptions; this only guards raw jobs.
      LOGSHIP_LOG_ERROR("Transfer job failed", {StringField("error", e.what())});
    }
  }
}

} // namespace logship::upload

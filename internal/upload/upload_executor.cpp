#include "internal/upload/upload_executor.hpp"

#include <stdexcept>

namespace archiver::upload {

UploadExecutor::UploadExecutor(std::size_t threads) {
  if (threads == 0) threads = 1;
  workers_.reserve(threads);
  for (std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back(&UploadExecutor::Run, this);
  }
}

UploadExecutor::~UploadExecutor() {
  Stop();
}

std::shared_future<void> UploadExecutor::Submit(std::function<void()> fn) {
  std::packaged_task<void()> task(std::move(fn));
  auto                       future = task.get_future().share();
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) throw std::runtime_error("upload executor is stopped");
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return future;
}

std::optional<std::packaged_task<void()>> UploadExecutor::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  auto task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void UploadExecutor::Stop() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
}

void UploadExecutor::Run() {
  while (auto task = Dequeue()) {
    // Exceptions are captured in the task's future.
    (*task)();
  }
}

} // namespace archiver::upload

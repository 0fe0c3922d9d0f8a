#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <vector>

namespace archiver::upload {

/*
  Fixed pool of transfer threads fed by a blocking queue.

  Tasks still queued at Stop() are run before the workers exit, so every
  future handed out by Submit() becomes ready.
*/
class UploadExecutor {
 public:
  explicit UploadExecutor(std::size_t threads);
  ~UploadExecutor();

  UploadExecutor(const UploadExecutor&)            = delete;
  UploadExecutor& operator=(const UploadExecutor&) = delete;

  std::shared_future<void> Submit(std::function<void()> fn);

  void Stop();

 private:
  std::optional<std::packaged_task<void()>> Dequeue();
  void                                      Run();

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::queue<std::packaged_task<void()>> queue_;
  bool                                   shutdown_ = false;

  std::vector<std::thread> workers_;
};

} // namespace archiver::upload

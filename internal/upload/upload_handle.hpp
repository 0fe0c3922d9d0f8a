#pragma once

#include <future>
#include <string>
#include <utility>

namespace archiver::upload {

/*
  Completion token of one scheduled upload.
*/
class UploadHandle {
 public:
  UploadHandle() = default;
  UploadHandle(std::string local_path, std::shared_future<void> done) : local_path_(std::move(local_path)), done_(std::move(done)) {
  }

  // Blocks until the transfer finished; rethrows its failure.
  void Get() const {
    done_.get();
  }

  const std::string& LocalPath() const {
    return local_path_;
  }

 private:
  std::string              local_path_;
  std::shared_future<void> done_;
};

} // namespace archiver::upload

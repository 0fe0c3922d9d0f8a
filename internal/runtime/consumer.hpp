#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "internal/kafka/message_source.hpp"
#include "internal/registry/file_registry.hpp"
#include "internal/tracker/offset_tracker.hpp"
#include "internal/uploader/policy_runner.hpp"
#include "internal/writer/message_writer.hpp"

namespace archiver::runtime {

/*
  Ingestion loop: polls the source, buffers accepted messages and gives the
  upload policy a chance to run between polls.

  Buffered files of revoked partitions are dropped together with their
  tracker state; the new owner re-consumes from the group's commit.
*/
class Consumer {
 public:
  Consumer(std::shared_ptr<kafka::MessageSource> source, std::shared_ptr<writer::MessageWriter> writer,
           std::shared_ptr<uploader::PolicyRunner> runner, std::shared_ptr<registry::FileRegistry> registry,
           std::shared_ptr<tracker::OffsetTracker> tracker, std::chrono::milliseconds poll_timeout);
  ~Consumer();

  Consumer(const Consumer&)            = delete;
  Consumer& operator=(const Consumer&) = delete;

  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }
  // Set when the loop stopped on an error rather than on Stop().
  bool Failed() const {
    return failed_;
  }

  // One poll plus one policy check. Returns true when a message was buffered.
  bool PollOnce();

 private:
  void Loop();
  void DropPartitions(const std::vector<model::TopicPartition>& revoked);

  std::shared_ptr<kafka::MessageSource>   source_;
  std::shared_ptr<writer::MessageWriter>  writer_;
  std::shared_ptr<uploader::PolicyRunner> runner_;
  std::shared_ptr<registry::FileRegistry> registry_;
  std::shared_ptr<tracker::OffsetTracker> tracker_;
  std::chrono::milliseconds               poll_timeout_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> failed_{false};
};

} // namespace archiver::runtime

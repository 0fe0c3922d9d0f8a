#include "consumer.hpp"

#include "internal/observability/logging.hpp"

namespace archiver::runtime {

using archiver::observability::StringField;

Consumer::Consumer(std::shared_ptr<kafka::MessageSource> source, std::shared_ptr<writer::MessageWriter> writer,
                   std::shared_ptr<uploader::PolicyRunner> runner, std::shared_ptr<registry::FileRegistry> registry,
                   std::shared_ptr<tracker::OffsetTracker> tracker, std::chrono::milliseconds poll_timeout)
    : source_(std::move(source)),
      writer_(std::move(writer)),
      runner_(std::move(runner)),
      registry_(std::move(registry)),
      tracker_(std::move(tracker)),
      poll_timeout_(poll_timeout) {
  source_->OnRevoke([this](const std::vector<model::TopicPartition>& revoked) { DropPartitions(revoked); });
}

Consumer::~Consumer() {
  Stop();
}

void Consumer::Start() {
  running_ = true;
  thread_  = std::thread(&Consumer::Loop, this);
}

void Consumer::Stop() {
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

bool Consumer::PollOnce() {
  bool buffered = false;
  if (auto message = source_->Poll(poll_timeout_)) {
    if (writer_->Adjust(*message)) {
      writer_->Write(*message);
      buffered = true;
    }
  }
  runner_->MaybeRun();
  return buffered;
}

void Consumer::Loop() {
  ARCHIVER_LOG_INFO("consumer loop started");
  while (running_) {
    try {
      PollOnce();
    } catch (const std::exception& e) {
      // A record that cannot be buffered must not be skipped, so the loop stops.
      ARCHIVER_LOG_ERROR("consumer loop failed", {StringField("error", e.what())});
      failed_  = true;
      running_ = false;
    }
  }
  ARCHIVER_LOG_INFO("consumer loop stopped");
}

void Consumer::DropPartitions(const std::vector<model::TopicPartition>& revoked) {
  for (const auto& tp : revoked) {
    ARCHIVER_LOG_INFO(tp, "dropping buffered files of revoked partition");
    registry_->DeleteTopicPartition(tp);
    tracker_->Reset(tp);
  }
}

} // namespace archiver::runtime

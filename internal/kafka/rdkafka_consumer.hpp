#pragma once

#include <librdkafka/rdkafkacpp.h>

#include <memory>
#include <mutex>
#include <string>

#include "config/config.pb.h"
#include "internal/kafka/commit_log_client.hpp"
#include "internal/kafka/message_source.hpp"

namespace archiver::kafka {

/*
  librdkafka consumer shared by ingestion and the upload policy.

  Commits go through the same group member that consumes, with auto commit
  disabled; the only commits are the ones the uploader makes after a
  successful upload.
*/
class RdKafkaConsumer final : public CommitLogClient, public MessageSource {
 public:
  explicit RdKafkaConsumer(const archiver::runtime::config::KafkaConfig& config);
  ~RdKafkaConsumer() override;

  RdKafkaConsumer(const RdKafkaConsumer&)            = delete;
  RdKafkaConsumer& operator=(const RdKafkaConsumer&) = delete;

  int64_t Committed(const model::TopicPartition& tp) override;
  void    CommitSync(const model::TopicPartition& tp, int64_t offset) override;

  std::optional<model::ParsedMessage> Poll(std::chrono::milliseconds timeout) override;
  void                                OnRevoke(RevokeCallback callback) override;
  void                                Close() override;

 private:
  class Rebalancer : public RdKafka::RebalanceCb {
   public:
    explicit Rebalancer(RdKafkaConsumer& owner) : owner_(owner) {
    }
    void rebalance_cb(RdKafka::KafkaConsumer* consumer, RdKafka::ErrorCode err, std::vector<RdKafka::TopicPartition*>& partitions) override;

   private:
    RdKafkaConsumer& owner_;
  };

  int                                     committed_timeout_ms_;
  Rebalancer                              rebalancer_;
  RevokeCallback                          on_revoke_;
  std::unique_ptr<RdKafka::KafkaConsumer> consumer_;
  std::mutex                              close_mutex_;
  bool                                    closed_ = false;
};

} // namespace archiver::kafka

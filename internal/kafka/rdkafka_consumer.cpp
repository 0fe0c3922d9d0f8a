#include "internal/kafka/rdkafka_consumer.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace archiver::kafka {

using archiver::observability::OffsetField;
using archiver::observability::StringField;

namespace {

constexpr int kDefaultCommittedTimeoutMs = 10000;

void SetOrThrow(RdKafka::Conf& conf, const std::string& key, const std::string& value) {
  std::string errstr;
  if (conf.set(key, value, errstr) != RdKafka::Conf::CONF_OK) {
    throw util::InvalidArgument("kafka property " + key + ": " + errstr);
  }
}

// Owns the vector elements librdkafka allocates.
struct PartitionList {
  std::vector<RdKafka::TopicPartition*> items;
  ~PartitionList() {
    RdKafka::TopicPartition::destroy(items);
  }
};

} // namespace

RdKafkaConsumer::RdKafkaConsumer(const archiver::runtime::config::KafkaConfig& config)
    : committed_timeout_ms_(config.committed_timeout_ms() > 0 ? static_cast<int>(config.committed_timeout_ms()) : kDefaultCommittedTimeoutMs),
      rebalancer_(*this) {
  if (config.bootstrap_servers().empty()) throw util::InvalidArgument("kafka.bootstrap_servers is required");
  if (config.group_id().empty()) throw util::InvalidArgument("kafka.group_id is required");

  std::unique_ptr<RdKafka::Conf> conf(RdKafka::Conf::create(RdKafka::Conf::CONF_GLOBAL));
  SetOrThrow(*conf, "bootstrap.servers", config.bootstrap_servers());
  SetOrThrow(*conf, "group.id", config.group_id());
  SetOrThrow(*conf, "enable.auto.commit", "false");
  SetOrThrow(*conf, "auto.offset.reset", "earliest");
  for (const auto& [key, value] : config.properties()) {
    SetOrThrow(*conf, key, value);
  }

  std::string errstr;
  if (conf->set("rebalance_cb", &rebalancer_, errstr) != RdKafka::Conf::CONF_OK) {
    throw util::InvalidArgument("kafka rebalance callback: " + errstr);
  }

  consumer_.reset(RdKafka::KafkaConsumer::create(conf.get(), errstr));
  if (!consumer_) throw std::runtime_error("failed to create kafka consumer: " + errstr);

  const std::string filter = config.topic_filter().empty() ? ".*" : config.topic_filter();
  // librdkafka treats subscriptions starting with '^' as regular expressions.
  const std::string subscription = filter.front() == '^' ? filter : "^" + filter;
  if (auto err = consumer_->subscribe({subscription}); err != RdKafka::ERR_NO_ERROR) {
    throw std::runtime_error("failed to subscribe to " + subscription + ": " + RdKafka::err2str(err));
  }

  ARCHIVER_LOG_INFO("kafka consumer started", {StringField("bootstrap_servers", config.bootstrap_servers()), StringField("group_id", config.group_id()),
                                              StringField("subscription", subscription)});
}

RdKafkaConsumer::~RdKafkaConsumer() {
  try {
    Close();
  } catch (const std::exception& e) {
    ARCHIVER_LOG_WARN("kafka consumer close failed", {StringField("error", e.what())});
  }
}

int64_t RdKafkaConsumer::Committed(const model::TopicPartition& tp) {
  PartitionList list;
  list.items.push_back(RdKafka::TopicPartition::create(tp.topic, tp.partition));

  if (auto err = consumer_->committed(list.items, committed_timeout_ms_); err != RdKafka::ERR_NO_ERROR) {
    throw util::CommitFailed("committed offset read for " + tp.ToString() + " failed: " + RdKafka::err2str(err));
  }

  const auto* result = list.items.front();
  if (result->err() != RdKafka::ERR_NO_ERROR) {
    throw util::CommitFailed("committed offset read for " + tp.ToString() + " failed: " + RdKafka::err2str(result->err()));
  }
  if (result->offset() < 0) {
    throw util::CommitFailed("no committed offset for " + tp.ToString());
  }
  return result->offset();
}

void RdKafkaConsumer::CommitSync(const model::TopicPartition& tp, int64_t offset) {
  PartitionList list;
  list.items.push_back(RdKafka::TopicPartition::create(tp.topic, tp.partition, offset));

  if (auto err = consumer_->commitSync(list.items); err != RdKafka::ERR_NO_ERROR) {
    throw util::CommitFailed("commit of " + tp.ToString() + " at " + std::to_string(offset) + " failed: " + RdKafka::err2str(err));
  }
  if (auto err = list.items.front()->err(); err != RdKafka::ERR_NO_ERROR) {
    throw util::CommitFailed("commit of " + tp.ToString() + " at " + std::to_string(offset) + " failed: " + RdKafka::err2str(err));
  }
  ARCHIVER_LOG_DEBUG(tp, "committed offset", {OffsetField("offset", offset)});
}

std::optional<model::ParsedMessage> RdKafkaConsumer::Poll(std::chrono::milliseconds timeout) {
  std::unique_ptr<RdKafka::Message> message(consumer_->consume(static_cast<int>(timeout.count())));
  if (!message) return std::nullopt;

  switch (message->err()) {
    case RdKafka::ERR_NO_ERROR:
      break;
    case RdKafka::ERR__TIMED_OUT:
    case RdKafka::ERR__PARTITION_EOF:
      return std::nullopt;
    default:
      ARCHIVER_LOG_WARN("kafka consume error", {StringField("error", message->errstr())});
      return std::nullopt;
  }

  model::ParsedMessage parsed;
  parsed.topic           = message->topic_name();
  parsed.kafka_partition = message->partition();
  parsed.offset          = message->offset();
  parsed.timestamp       = message->timestamp().timestamp;
  if (const std::string* key = message->key()) parsed.key = *key;
  parsed.payload.assign(static_cast<const char*>(message->payload()), message->len());
  return parsed;
}

void RdKafkaConsumer::OnRevoke(RevokeCallback callback) {
  on_revoke_ = std::move(callback);
}

void RdKafkaConsumer::Close() {
  std::lock_guard lock(close_mutex_);
  if (closed_ || !consumer_) return;
  closed_ = true;
  if (auto err = consumer_->close(); err != RdKafka::ERR_NO_ERROR) {
    throw std::runtime_error("failed to close kafka consumer: " + RdKafka::err2str(err));
  }
}

void RdKafkaConsumer::Rebalancer::rebalance_cb(RdKafka::KafkaConsumer* consumer, RdKafka::ErrorCode err,
                                               std::vector<RdKafka::TopicPartition*>& partitions) {
  if (err == RdKafka::ERR__ASSIGN_PARTITIONS) {
    for (const auto* p : partitions) {
      ARCHIVER_LOG_INFO(model::TopicPartition{p->topic(), p->partition()}, "partition assigned");
    }
    consumer->assign(partitions);
    return;
  }

  if (err == RdKafka::ERR__REVOKE_PARTITIONS) {
    std::vector<model::TopicPartition> revoked;
    revoked.reserve(partitions.size());
    for (const auto* p : partitions) {
      revoked.push_back({p->topic(), p->partition()});
      ARCHIVER_LOG_INFO(revoked.back(), "partition revoked");
    }
    if (owner_.on_revoke_) {
      try {
        owner_.on_revoke_(revoked);
      } catch (const std::exception& e) {
        ARCHIVER_LOG_ERROR("revoke handler failed", {StringField("error", e.what())});
      }
    }
    consumer->unassign();
    return;
  }

  ARCHIVER_LOG_ERROR("rebalance error", {StringField("error", RdKafka::err2str(err))});
  consumer->unassign();
}

} // namespace archiver::kafka

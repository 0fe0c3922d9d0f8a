#include "internal/writer/message_writer.hpp"

#include "internal/observability/logging.hpp"

namespace archiver::writer {

using archiver::observability::OffsetField;

MessageWriter::MessageWriter(std::shared_ptr<tracker::OffsetTracker> tracker, std::shared_ptr<registry::FileRegistry> registry,
                             io::CompressionCodec codec, std::string local_prefix, uint32_t generation)
    : tracker_(std::move(tracker)),
      registry_(std::move(registry)),
      codec_(std::move(codec)),
      local_prefix_(std::move(local_prefix)),
      generation_(generation) {
}

bool MessageWriter::Adjust(const model::ParsedMessage& message) {
  const model::TopicPartition tp{message.topic, message.kafka_partition};
  tracker_->SetLastSeenOffset(tp, message.offset);

  const int64_t committed = tracker_->GetTrueCommittedOffsetCount(tp);
  if (committed != tracker::OffsetTracker::kUnknownCommittedOffset && message.offset < committed) {
    ARCHIVER_LOG_DEBUG(tp, "skipping already committed message", {OffsetField("offset", message.offset), OffsetField("committed", committed)});
    return false;
  }
  return true;
}

void MessageWriter::Write(const model::ParsedMessage& message) {
  const model::TopicPartition tp{message.topic, message.kafka_partition};
  const int64_t               start = tracker_->GetAdjustedCommittedOffsetCount(tp);

  model::LogFilePath path(local_prefix_, generation_, start, message, codec_.extension);
  auto               writer = registry_->GetOrCreateWriter(path, codec_);
  writer->Write(model::KeyValue{message.offset, message.timestamp, message.key, message.payload});
}

} // namespace archiver::writer

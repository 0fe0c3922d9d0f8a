#pragma once

#include <memory>
#include <string>

#include "internal/io/compression.hpp"
#include "internal/model/key_value.hpp"
#include "internal/registry/file_registry.hpp"
#include "internal/tracker/offset_tracker.hpp"

namespace archiver::writer {

/*
  Ingestion side of the buffer: advances the last seen offset and appends
  records to the partition's current local file.
*/
class MessageWriter {
 public:
  MessageWriter(std::shared_ptr<tracker::OffsetTracker> tracker, std::shared_ptr<registry::FileRegistry> registry, io::CompressionCodec codec,
                std::string local_prefix, uint32_t generation);

  // Records the message as seen. Returns false when it lies below the
  // committed count, i.e. it was already uploaded by another consumer.
  bool Adjust(const model::ParsedMessage& message);

  void Write(const model::ParsedMessage& message);

 private:
  std::shared_ptr<tracker::OffsetTracker>  tracker_;
  std::shared_ptr<registry::FileRegistry>  registry_;
  io::CompressionCodec                     codec_;
  std::string                              local_prefix_;
  uint32_t                                 generation_;
};

} // namespace archiver::writer

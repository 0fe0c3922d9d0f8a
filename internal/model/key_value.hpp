#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace archiver::model {

/*
  One buffered record. Offsets are assigned by the source log and only ever
  compared, never rewritten.
*/
struct KeyValue {
  int64_t     offset    = 0;
  int64_t     timestamp = 0;
  std::string key;
  std::string value;
};

/*
  A record as handed over by ingestion, together with the partition key
  components (path segments) it is filed under locally and remotely.
*/
struct ParsedMessage {
  std::string              topic;
  int32_t                  kafka_partition = 0;
  int64_t                  offset          = 0;
  int64_t                  timestamp       = 0;
  std::string              key;
  std::string              payload;
  std::vector<std::string> partitions;
};

} // namespace archiver::model

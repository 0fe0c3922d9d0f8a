#include "internal/io/compression.hpp"

#include <algorithm>
#include <cctype>

#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace archiver::io {

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

CompressionCodec ResolveCodec(const std::string& name) {
  const auto key = Lower(name);

  CompressionCodec codec;
  codec.name = key.empty() ? "none" : key;

  if (key.empty() || key == "none" || key == "uncompressed") {
    return codec;
  } else if (key == "gzip" || key == "gz") {
    codec.type      = arrow::Compression::GZIP;
    codec.extension = ".gz";
  } else if (key == "zstd") {
    codec.type      = arrow::Compression::ZSTD;
    codec.extension = ".zst";
  } else if (key == "lz4" || key == "lz4_frame") {
    codec.type      = arrow::Compression::LZ4_FRAME;
    codec.extension = ".lz4";
  } else if (key == "brotli") {
    codec.type      = arrow::Compression::BROTLI;
    codec.extension = ".br";
  } else if (key == "bz2") {
    codec.type      = arrow::Compression::BZ2;
    codec.extension = ".bz2";
  } else if (key == "snappy") {
    throw util::InvalidArgument("compression codec snappy has no streaming mode; use zstd, gzip or lz4");
  } else {
    throw util::InvalidArgument("unknown compression codec: " + name);
  }

  if (!arrow::util::Codec::IsAvailable(codec.type)) {
    throw util::InvalidArgument("compression codec " + codec.name + " is not available in this Arrow build");
  }
  return codec;
}

std::unique_ptr<arrow::util::Codec> MakeArrowCodec(const CompressionCodec& codec) {
  if (!codec.Enabled()) return nullptr;
  return storage::common::Unwrap(arrow::util::Codec::Create(codec.type));
}

} // namespace archiver::io

#pragma once

#include <arrow/util/compression.h>

#include <memory>
#include <string>

namespace archiver::io {

/*
  Compression applied to buffered files. Only Arrow codecs with streaming
  support are accepted, since files are written record by record.
*/
struct CompressionCodec {
  arrow::Compression::type type = arrow::Compression::UNCOMPRESSED;
  std::string              name;
  // Appended to buffered and uploaded file names, e.g. ".gz".
  std::string extension;

  bool Enabled() const {
    return type != arrow::Compression::UNCOMPRESSED;
  }
};

// Empty or "none" means uncompressed. Throws util::InvalidArgument for unknown or
// unavailable codecs.
CompressionCodec ResolveCodec(const std::string& name);

// nullptr when codec is not enabled.
std::unique_ptr<arrow::util::Codec> MakeArrowCodec(const CompressionCodec& codec);

} // namespace archiver::io

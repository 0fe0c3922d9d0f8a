#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "internal/io/compression.hpp"
#include "internal/model/key_value.hpp"
#include "internal/model/log_file_path.hpp"

namespace archiver::io {

/*
  Append-only writer over one buffered file. Once a record is appended the
  file is never edited in place; trimming rewrites it into a new file.
*/
class FileWriter {
 public:
  virtual ~FileWriter() = default;

  // Bytes written to local media so far. Compressed streams may lag.
  virtual int64_t Length() = 0;

  virtual void Write(const model::KeyValue& record) = 0;

  // Flushes and closes. Safe to call more than once.
  virtual void Close() = 0;
};

class FileReader {
 public:
  virtual ~FileReader() = default;

  // std::nullopt at end of file.
  virtual std::optional<model::KeyValue> Next() = 0;

  virtual void Close() = 0;
};

class FileReaderWriterFactory {
 public:
  virtual ~FileReaderWriterFactory() = default;

  virtual std::unique_ptr<FileReader> BuildFileReader(const model::LogFilePath& path, const CompressionCodec& codec) = 0;
  // append continues a file this process wrote earlier; otherwise any existing file is truncated.
  virtual std::unique_ptr<FileWriter> BuildFileWriter(const model::LogFilePath& path, const CompressionCodec& codec, bool append) = 0;
};

using FileReaderWriterFactoryPtr = std::shared_ptr<FileReaderWriterFactory>;

} // namespace archiver::io

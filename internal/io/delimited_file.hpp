#pragma once

#include <arrow/io/interfaces.h>

#include <memory>

#include "internal/io/file_reader_writer.hpp"

namespace archiver::io {

/*
  Length-delimited record file on Arrow IO.

  Record layout (little endian):

      int64 offset | int64 timestamp | uint32 key_len | key | uint32 value_len | value

  With a codec configured the record stream is wrapped in Arrow's streaming
  compressor, so the file on disk is e.g. a plain gzip stream. Appending to
  a compressed file adds a new compressed member; the reader decodes
  concatenated members as one stream.
*/
class DelimitedFileWriter final : public FileWriter {
 public:
  DelimitedFileWriter(const model::LogFilePath& path, const CompressionCodec& codec, bool append);
  ~DelimitedFileWriter() override;

  int64_t Length() override;
  void    Write(const model::KeyValue& record) override;
  void    Close() override;

 private:
  std::string                               path_;
  std::unique_ptr<arrow::util::Codec>       codec_;
  std::shared_ptr<arrow::io::OutputStream> raw_;
  std::shared_ptr<arrow::io::OutputStream> stream_;
  int64_t                                   base_length_ = 0;
  bool                                      closed_      = false;
};

class DelimitedFileReader final : public FileReader {
 public:
  DelimitedFileReader(const model::LogFilePath& path, const CompressionCodec& codec);
  ~DelimitedFileReader() override;

  std::optional<model::KeyValue> Next() override;
  void                           Close() override;

 private:
  // Reads exactly n bytes. Returns false on a clean end of file before the
  // first byte when allow_eof is set; throws CorruptRecord otherwise.
  bool ReadExact(void* out, int64_t n, bool allow_eof);

  std::string                              path_;
  std::unique_ptr<arrow::util::Codec>      codec_;
  std::shared_ptr<arrow::io::InputStream> stream_;
  bool                                     closed_ = false;
};

class DelimitedFileReaderWriterFactory final : public FileReaderWriterFactory {
 public:
  std::unique_ptr<FileReader> BuildFileReader(const model::LogFilePath& path, const CompressionCodec& codec) override;
  std::unique_ptr<FileWriter> BuildFileWriter(const model::LogFilePath& path, const CompressionCodec& codec, bool append) override;
};

} // namespace archiver::io

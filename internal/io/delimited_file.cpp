#include "internal/io/delimited_file.hpp"

#include <arrow/io/compressed.h>
#include <arrow/io/file.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace archiver::io {

using namespace archiver::storage::common;

namespace {

template <typename T>
void PutLittleEndian(std::string* out, T value) {
  auto bits = static_cast<std::make_unsigned_t<T>>(value);
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    out->push_back(static_cast<char>(bits & 0xFF));
    bits >>= 8;
  }
}

template <typename T>
T GetLittleEndian(const uint8_t* in) {
  std::make_unsigned_t<T> bits = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    bits |= static_cast<std::make_unsigned_t<T>>(in[i]) << (8 * i);
  }
  return static_cast<T>(bits);
}

void CheckFieldSize(const std::string& field, const char* name) {
  if (field.size() > std::numeric_limits<uint32_t>::max()) {
    throw util::InvalidArgument(std::string("record ") + name + " exceeds 4GiB");
  }
}

} // namespace

// ------------------------------------------------------------
// Writer
// ------------------------------------------------------------

DelimitedFileWriter::DelimitedFileWriter(const model::LogFilePath& path, const CompressionCodec& codec, bool append)
    : path_(path.LogFilePathString()), codec_(MakeArrowCodec(codec)) {
  if (append) {
    std::error_code ec;
    const auto      size = std::filesystem::file_size(path_, ec);
    if (!ec) base_length_ = static_cast<int64_t>(size);
  }
  raw_ = Unwrap(arrow::io::FileOutputStream::Open(path_, append));
  if (codec_) {
    stream_ = Unwrap(arrow::io::CompressedOutputStream::Make(codec_.get(), raw_));
  } else {
    stream_ = raw_;
  }
}

DelimitedFileWriter::~DelimitedFileWriter() {
  if (closed_) return;
  auto status = stream_->Close();
  if (!status.ok()) {
    ARCHIVER_LOG_WARN("failed to close buffered file", {observability::StringField("path", path_), observability::StringField("error", status.ToString())});
  }
}

int64_t DelimitedFileWriter::Length() {
  if (closed_) return 0;
  // In append mode the position reads 0 until the first write.
  return std::max(Unwrap(raw_->Tell()), base_length_);
}

void DelimitedFileWriter::Write(const model::KeyValue& record) {
  if (closed_) {
    throw util::InvalidArgument("write to closed file " + path_);
  }
  CheckFieldSize(record.key, "key");
  CheckFieldSize(record.value, "value");

  std::string frame;
  frame.reserve(24 + record.key.size() + record.value.size());
  PutLittleEndian<int64_t>(&frame, record.offset);
  PutLittleEndian<int64_t>(&frame, record.timestamp);
  PutLittleEndian<uint32_t>(&frame, static_cast<uint32_t>(record.key.size()));
  frame.append(record.key);
  PutLittleEndian<uint32_t>(&frame, static_cast<uint32_t>(record.value.size()));
  frame.append(record.value);

  Unwrap(stream_->Write(frame.data(), static_cast<int64_t>(frame.size())));
}

void DelimitedFileWriter::Close() {
  if (closed_) return;
  closed_ = true;
  Unwrap(stream_->Flush());
  Unwrap(stream_->Close());
}

// ------------------------------------------------------------
// Reader
// ------------------------------------------------------------

DelimitedFileReader::DelimitedFileReader(const model::LogFilePath& path, const CompressionCodec& codec)
    : path_(path.LogFilePathString()), codec_(MakeArrowCodec(codec)) {
  std::shared_ptr<arrow::io::InputStream> raw = Unwrap(arrow::io::ReadableFile::Open(path_));
  if (codec_) {
    stream_ = Unwrap(arrow::io::CompressedInputStream::Make(codec_.get(), raw));
  } else {
    stream_ = std::move(raw);
  }
}

DelimitedFileReader::~DelimitedFileReader() {
  if (closed_) return;
  auto status = stream_->Close();
  if (!status.ok()) {
    ARCHIVER_LOG_WARN("failed to close buffered file reader", {observability::StringField("path", path_), observability::StringField("error", status.ToString())});
  }
}

bool DelimitedFileReader::ReadExact(void* out, int64_t n, bool allow_eof) {
  auto*   dst  = static_cast<uint8_t*>(out);
  int64_t read = 0;
  while (read < n) {
    const int64_t got = Unwrap(stream_->Read(n - read, dst + read));
    if (got == 0) break;
    read += got;
  }
  if (read == n) return true;
  if (read == 0 && allow_eof) return false;
  throw util::CorruptRecord("truncated record in " + path_);
}

std::optional<model::KeyValue> DelimitedFileReader::Next() {
  if (closed_) {
    throw util::InvalidArgument("read from closed file " + path_);
  }

  std::array<uint8_t, 20> header{};
  if (!ReadExact(header.data(), static_cast<int64_t>(header.size()), /*allow_eof=*/true)) {
    return std::nullopt;
  }

  model::KeyValue record;
  record.offset    = GetLittleEndian<int64_t>(header.data());
  record.timestamp = GetLittleEndian<int64_t>(header.data() + 8);

  record.key.resize(GetLittleEndian<uint32_t>(header.data() + 16));
  ReadExact(record.key.data(), static_cast<int64_t>(record.key.size()), /*allow_eof=*/false);

  std::array<uint8_t, 4> value_len{};
  ReadExact(value_len.data(), static_cast<int64_t>(value_len.size()), /*allow_eof=*/false);
  record.value.resize(GetLittleEndian<uint32_t>(value_len.data()));
  ReadExact(record.value.data(), static_cast<int64_t>(record.value.size()), /*allow_eof=*/false);

  return record;
}

void DelimitedFileReader::Close() {
  if (closed_) return;
  closed_ = true;
  Unwrap(stream_->Close());
}

// ------------------------------------------------------------
// Factory
// ------------------------------------------------------------

std::unique_ptr<FileReader> DelimitedFileReaderWriterFactory::BuildFileReader(const model::LogFilePath& path, const CompressionCodec& codec) {
  return std::make_unique<DelimitedFileReader>(path, codec);
}

std::unique_ptr<FileWriter> DelimitedFileReaderWriterFactory::BuildFileWriter(const model::LogFilePath& path, const CompressionCodec& codec,
                                                                             bool append) {
  return std::make_unique<DelimitedFileWriter>(path, codec, append);
}

} // namespace archiver::io

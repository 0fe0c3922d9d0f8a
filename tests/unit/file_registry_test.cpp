#include "internal/registry/file_registry.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "internal/io/compression.hpp"
#include "internal/io/delimited_file.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using archiver::io::CompressionCodec;
using archiver::io::DelimitedFileReaderWriterFactory;
using archiver::model::KeyValue;
using archiver::model::LogFilePath;
using archiver::model::TopicPartition;
using archiver::registry::FileRegistry;
using archiver::testing::MakeTempDir;
using archiver::testing::ManualClock;
using archiver::testing::ReadOffsets;

void Append(FileRegistry& registry, const LogFilePath& path, int64_t offset) {
  registry.GetOrCreateWriter(path, CompressionCodec{})->Write(KeyValue{offset, 0, "k", "value"});
}

void TestTracksFilesPerPartition() {
  const auto   dir = MakeTempDir("registry_tracks");
  ManualClock  clock;
  FileRegistry registry(std::make_shared<DelimitedFileReaderWriterFactory>(), clock.Fn());

  LogFilePath a(dir.string(), "events", {}, 1, 0, 100, "");
  LogFilePath b(dir.string(), "events", {}, 1, 0, 200, "");
  LogFilePath c(dir.string(), "events", {}, 1, 1, 0, "");
  Append(registry, b, 200);
  Append(registry, a, 100);
  Append(registry, c, 0);

  assert(registry.GetTopicPartitions().size() == 2);
  const auto paths = registry.GetPaths({"events", 0});
  assert(paths.size() == 2);
  assert(paths.begin()->Offset() == 100);
  assert(registry.GetPaths({"missing", 0}).empty());
}

void TestSizeCountsOpenAndClosedFiles() {
  const auto   dir = MakeTempDir("registry_size");
  ManualClock  clock;
  FileRegistry registry(std::make_shared<DelimitedFileReaderWriterFactory>(), clock.Fn());
  TopicPartition tp{"events", 0};

  LogFilePath path(dir.string(), "events", {}, 1, 0, 0, "");
  Append(registry, path, 0);
  Append(registry, path, 1);
  const int64_t open_size = registry.GetSize(tp);
  assert(open_size > 0);

  registry.DeleteWriters(tp);
  assert(registry.GetSize(tp) == static_cast<int64_t>(std::filesystem::file_size(path.LogFilePathString())));
  assert(registry.GetSize(tp) == open_size);
  assert(registry.GetSize({"events", 9}) == 0);
}

void TestModificationAgeOldestAndYoungest() {
  const auto  dir = MakeTempDir("registry_age");
  ManualClock clock;
  TopicPartition tp{"events", 0};

  FileRegistry oldest(std::make_shared<DelimitedFileReaderWriterFactory>(), clock.Fn(), false);
  FileRegistry youngest(std::make_shared<DelimitedFileReaderWriterFactory>(), clock.Fn(), true);
  assert(oldest.GetModificationAgeSec(tp) == -1);

  LogFilePath first((dir / "o").string(), "events", {}, 1, 0, 0, "");
  LogFilePath second((dir / "o").string(), "events", {}, 1, 0, 50, "");
  LogFilePath y_first((dir / "y").string(), "events", {}, 1, 0, 0, "");
  LogFilePath y_second((dir / "y").string(), "events", {}, 1, 0, 50, "");

  Append(oldest, first, 0);
  Append(youngest, y_first, 0);
  clock.Advance(std::chrono::seconds(30));
  Append(oldest, second, 50);
  Append(youngest, y_second, 50);
  clock.Advance(std::chrono::seconds(10));

  assert(oldest.GetModificationAgeSec(tp) == 40);
  assert(youngest.GetModificationAgeSec(tp) == 10);
}

void TestReopenAppendsButStaleFilesAreReplaced() {
  const auto   dir = MakeTempDir("registry_reopen");
  ManualClock  clock;
  auto         factory = std::make_shared<DelimitedFileReaderWriterFactory>();
  LogFilePath  path(dir.string(), "events", {}, 1, 0, 0, "");

  {
    FileRegistry registry(factory, clock.Fn());
    Append(registry, path, 0);
    registry.DeleteWriter(path);
    Append(registry, path, 1);
    registry.DeleteWriter(path);
    assert((ReadOffsets(*factory, path, CompressionCodec{}) == std::vector<int64_t>{0, 1}));
  }

  std::ofstream(path.LogFileCrcPath()) << "crc";

  // A new process does not trust files it did not write.
  FileRegistry fresh(factory, clock.Fn());
  Append(fresh, path, 7);
  fresh.DeleteWriter(path);
  assert((ReadOffsets(*factory, path, CompressionCodec{}) == std::vector<int64_t>{7}));
  assert(!std::filesystem::exists(path.LogFileCrcPath()));
}

void TestDeleteRemovesFilesAndState() {
  const auto   dir = MakeTempDir("registry_delete");
  ManualClock  clock;
  FileRegistry registry(std::make_shared<DelimitedFileReaderWriterFactory>(), clock.Fn());
  TopicPartition tp{"events", 0};

  LogFilePath a(dir.string(), "events", {}, 1, 0, 0, "");
  LogFilePath b(dir.string(), "events", {}, 1, 0, 10, "");
  Append(registry, a, 0);
  Append(registry, b, 10);

  registry.DeletePath(a);
  assert(!std::filesystem::exists(a.LogFilePathString()));
  assert(registry.GetPaths(tp).size() == 1);

  registry.DeleteTopicPartition(tp);
  assert(!std::filesystem::exists(b.LogFilePathString()));
  assert(registry.GetTopicPartitions().empty());
  assert(registry.GetModificationAgeSec(tp) == -1);
}

// A delete that fails on disk keeps the path tracked so the next delete retries it.
void TestFailedDeleteKeepsPathTracked() {
  const auto     dir = MakeTempDir("registry_failed_delete");
  ManualClock    clock;
  FileRegistry   registry(std::make_shared<DelimitedFileReaderWriterFactory>(), clock.Fn());
  TopicPartition tp{"events", 0};

  LogFilePath path(dir.string(), "events", {}, 1, 0, 0, "");
  Append(registry, path, 0);
  registry.DeleteWriter(path);

  // A non-empty directory in place of the file cannot be unlinked.
  std::filesystem::remove(path.LogFilePathString());
  std::filesystem::create_directories(path.LogFilePathString());
  std::ofstream(path.LogFilePathString() + "/blocker") << "x";

  bool failed = false;
  try {
    registry.DeletePath(path);
  } catch (const archiver::util::LocalFileError&) {
    failed = true;
  }
  assert(failed);
  assert(registry.GetPaths(tp).count(path) == 1);
  assert(registry.GetModificationAgeSec(tp) == 0);

  std::filesystem::remove_all(path.LogFilePathString());
  registry.DeletePath(path);
  assert(registry.GetPaths(tp).empty());
  assert(registry.GetTopicPartitions().empty());
}

} // namespace

int main() {
  TestTracksFilesPerPartition();
  TestSizeCountsOpenAndClosedFiles();
  TestModificationAgeOldestAndYoungest();
  TestReopenAppendsButStaleFilesAreReplaced();
  TestDeleteRemovesFilesAndState();
  TestFailedDeleteKeepsPathTracked();

  std::cout << "stream_archiver_unit_file_registry: pass\n";
  return 0;
}

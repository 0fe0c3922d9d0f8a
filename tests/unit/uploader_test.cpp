#include "internal/uploader/uploader.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/io/delimited_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/writer/message_writer.hpp"
#include "test_support.hpp"

namespace {

using archiver::io::CompressionCodec;
using archiver::model::LogFilePath;
using archiver::model::ParsedMessage;
using archiver::model::TopicPartition;
using archiver::testing::FakeCommitLog;
using archiver::testing::LocalUploadManager;
using archiver::testing::MakeTempDir;
using archiver::testing::ManualClock;
using archiver::testing::ReadOffsets;
using archiver::uploader::ReconcileAction;
using archiver::uploader::Uploader;
using archiver::uploader::UploaderOptions;

const TopicPartition kEvents{"events", 0};

struct Fixture {
  explicit Fixture(const std::string& name, UploaderOptions options = DefaultOptions())
      : dir(MakeTempDir(name)),
        factory(std::make_shared<archiver::io::DelimitedFileReaderWriterFactory>()),
        tracker(std::make_shared<archiver::tracker::OffsetTracker>()),
        registry(std::make_shared<archiver::registry::FileRegistry>(factory, clock.Fn())),
        commit_log(std::make_shared<FakeCommitLog>()),
        uploads(std::make_shared<LocalUploadManager>(dir / "remote")),
        writer(tracker, registry, options.codec, (dir / "local").string(), 1),
        uploader(options, Dependencies()) {
  }

  static UploaderOptions DefaultOptions() {
    UploaderOptions options;
    options.max_file_size_bytes = 1;
    options.max_file_age_sec    = 3600;
    return options;
  }

  archiver::uploader::PolicyDependencies Dependencies() {
    archiver::uploader::PolicyDependencies deps;
    deps.tracker        = tracker;
    deps.registry       = registry;
    deps.upload_manager = uploads;
    deps.commit_log     = commit_log;
    deps.now            = clock.Fn();
    return deps;
  }

  // Buffers offsets [from, to) the way ingestion does.
  void Ingest(const TopicPartition& tp, int64_t from, int64_t to) {
    for (int64_t offset = from; offset < to; ++offset) {
      ParsedMessage message;
      message.topic           = tp.topic;
      message.kafka_partition = tp.partition;
      message.offset          = offset;
      message.timestamp       = offset;
      message.key             = "k";
      message.payload         = "value-" + std::to_string(offset);
      if (writer.Adjust(message)) writer.Write(message);
    }
  }

  std::vector<int64_t> Offsets(const LogFilePath& path) {
    registry->DeleteWriter(path);
    return ReadOffsets(*factory, path, CompressionCodec{});
  }

  std::filesystem::path RemoteFile(const TopicPartition& tp, int64_t offset) {
    LogFilePath path((dir / "local").string(), tp.topic, {}, 1, tp.partition, offset, "");
    return dir / "remote" / path.LogFileDir() / path.LogFileBasename();
  }

  ManualClock                                                clock;
  std::filesystem::path                                      dir;
  std::shared_ptr<archiver::io::DelimitedFileReaderWriterFactory> factory;
  std::shared_ptr<archiver::tracker::OffsetTracker>          tracker;
  std::shared_ptr<archiver::registry::FileRegistry>          registry;
  std::shared_ptr<FakeCommitLog>                             commit_log;
  std::shared_ptr<LocalUploadManager>                        uploads;
  archiver::writer::MessageWriter                            writer;
  Uploader                                                   uploader;
};

// Scenario A: nobody else committed, the whole buffer is uploaded and committed.
void TestUploadWhenCommitUnchanged() {
  Fixture f("uploader_upload");
  f.tracker->SetCommittedOffsetCount(kEvents, 100);
  f.commit_log->offsets[kEvents] = 100;
  f.Ingest(kEvents, 100, 180);

  assert(f.uploader.Reconcile(kEvents) == ReconcileAction::kUpload);

  assert(f.commit_log->commits.size() == 1);
  assert(f.commit_log->commits[0].second == 180);
  assert(f.tracker->GetTrueCommittedOffsetCount(kEvents) == 180);
  assert(f.tracker->GetTrueCommittedOffsetCount(kEvents) <= f.tracker->GetLastSeenOffset(kEvents) + 1);
  assert(f.registry->GetPaths(kEvents).empty());
  assert(std::filesystem::exists(f.RemoteFile(kEvents, 100)));

  LogFilePath remote = LogFilePath::Parse((f.dir / "remote").string(), f.RemoteFile(kEvents, 100).string());
  const auto  offsets = ReadOffsets(*f.factory, remote, CompressionCodec{});
  assert(offsets.size() == 80 && offsets.front() == 100 && offsets.back() == 179);
}

// Scenario B: another consumer committed past everything buffered here.
void TestDeleteWhenCommitBeyondLastSeen() {
  Fixture f("uploader_delete");
  f.tracker->SetCommittedOffsetCount(kEvents, 100);
  f.Ingest(kEvents, 100, 180);
  const auto local = *f.registry->GetPaths(kEvents).begin();
  f.commit_log->offsets[kEvents] = 500;

  assert(f.uploader.Reconcile(kEvents) == ReconcileAction::kDelete);

  assert(f.commit_log->commits.empty());
  assert(f.uploads->Scheduled().empty());
  assert(f.registry->GetTopicPartitions().empty());
  assert(!std::filesystem::exists(local.LogFilePathString()));
  assert(f.tracker->GetTrueCommittedOffsetCount(kEvents) == 500);
}

// Scenario C: a commit landed inside the buffered range; the committed prefix is trimmed off.
void TestTrimRoundTripAcrossFiles() {
  Fixture f("uploader_trim");
  f.tracker->SetCommittedOffsetCount(kEvents, 100);
  f.Ingest(kEvents, 100, 200);
  f.tracker->SetCommittedOffsetCount(kEvents, 200);
  f.Ingest(kEvents, 200, 350);
  assert(f.registry->GetPaths(kEvents).size() == 2);

  f.commit_log->offsets[kEvents] = 250;
  assert(f.uploader.Reconcile(kEvents) == ReconcileAction::kTrim);

  assert(f.commit_log->commits.empty());
  const auto paths = f.registry->GetPaths(kEvents);
  assert(paths.size() == 1);
  const auto trimmed = *paths.begin();
  assert(trimmed.Offset() == 250);
  const auto offsets = f.Offsets(trimmed);
  assert(offsets.size() == 100 && offsets.front() == 250 && offsets.back() == 349);

  // Next cycle sees an unchanged commit and uploads the remainder.
  assert(f.uploader.Reconcile(kEvents) == ReconcileAction::kUpload);
  assert(f.commit_log->commits.size() == 1 && f.commit_log->commits[0].second == 350);
  assert(std::filesystem::exists(f.RemoteFile(kEvents, 250)));
  assert(!std::filesystem::exists(f.RemoteFile(kEvents, 100)));
}

void TestTrimAtFileStartIsNoop() {
  Fixture f("uploader_trim_noop");
  f.tracker->SetCommittedOffsetCount(kEvents, 100);
  f.Ingest(kEvents, 100, 110);
  const auto path = *f.registry->GetPaths(kEvents).begin();

  f.uploader.Trim(path, 100);
  f.uploader.Trim(path, 100);

  assert(f.registry->GetPaths(kEvents).size() == 1);
  assert(f.Offsets(path).size() == 10);
}

std::size_t CountOpenDescriptors() {
  std::size_t count = 0;
  for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd")) {
    (void)entry;
    ++count;
  }
  return count;
}

// A buffered file cut mid-record fails the trim; nothing is committed and the source stays buffered.
void TestTrimOfTruncatedFileFailsWithoutCommit() {
  Fixture f("uploader_trim_truncated");
  f.tracker->SetCommittedOffsetCount(kEvents, 100);
  f.Ingest(kEvents, 100, 150);
  const auto source = *f.registry->GetPaths(kEvents).begin();
  f.registry->DeleteWriter(source);

  const auto size = std::filesystem::file_size(source.LogFilePathString());
  std::filesystem::resize_file(source.LogFilePathString(), size - 5);

  const auto descriptors_before = CountOpenDescriptors();
  f.commit_log->offsets[kEvents] = 120;

  bool corrupt = false;
  try {
    f.uploader.Reconcile(kEvents);
  } catch (const archiver::util::CorruptRecord&) {
    corrupt = true;
  }
  assert(corrupt);

  assert(f.registry->GetPaths(kEvents).count(source) == 1);
  assert(std::filesystem::exists(source.LogFilePathString()));
  assert(f.tracker->GetTrueCommittedOffsetCount(kEvents) == 120);
  assert(f.commit_log->commits.empty());
  assert(f.uploads->Scheduled().empty());

  // The partially written destination is the only file left open.
  f.registry->DeleteWriters(kEvents);
  assert(CountOpenDescriptors() == descriptors_before);

  // Through the policy entry point the same failure is reported per partition.
  f.commit_log->offsets[kEvents] = 130;
  bool policy_failed = false;
  try {
    f.uploader.ApplyPolicy();
  } catch (const archiver::util::PolicyFailed& e) {
    policy_failed = true;
    assert(std::string(e.what()).find("events/0") != std::string::npos);
    assert(std::string(e.what()).find("truncated record") != std::string::npos);
  }
  assert(policy_failed);
  assert(f.registry->GetPaths(kEvents).count(source) == 1);
  assert(f.tracker->GetTrueCommittedOffsetCount(kEvents) == 130);
  assert(f.commit_log->commits.empty());
}

void TestGateClosedLeavesPartitionUntouched() {
  auto options                = Fixture::DefaultOptions();
  options.max_file_size_bytes = 1 << 30;
  Fixture f("uploader_gate", options);
  f.tracker->SetCommittedOffsetCount(kEvents, 0);
  f.Ingest(kEvents, 0, 5);

  f.clock.Advance(std::chrono::seconds(3599));
  assert(f.uploader.Reconcile(kEvents) == ReconcileAction::kNone);
  assert(f.commit_log->committed_reads == 0);

  // Age reaching the threshold exactly opens the gate.
  f.clock.Advance(std::chrono::seconds(1));
  f.commit_log->offsets[kEvents] = 0;
  assert(f.uploader.Reconcile(kEvents) == ReconcileAction::kUpload);
  assert(f.commit_log->commits.size() == 1 && f.commit_log->commits[0].second == 5);
}

void TestSizeThresholdIsInclusive() {
  Fixture sizing("uploader_size_sizing");
  sizing.tracker->SetCommittedOffsetCount(kEvents, 0);
  sizing.Ingest(kEvents, 0, 3);
  const int64_t size = sizing.registry->GetSize(kEvents);

  auto options                = Fixture::DefaultOptions();
  options.max_file_size_bytes = size;
  Fixture f("uploader_size", options);
  f.tracker->SetCommittedOffsetCount(kEvents, 0);
  f.commit_log->offsets[kEvents] = 0;
  f.Ingest(kEvents, 0, 2);
  assert(f.uploader.Reconcile(kEvents) == ReconcileAction::kNone);
  f.Ingest(kEvents, 2, 3);
  assert(f.registry->GetSize(kEvents) == size);
  assert(f.uploader.Reconcile(kEvents) == ReconcileAction::kUpload);
}

void TestPolicyIsIdempotentAfterUpload() {
  Fixture f("uploader_idempotent");
  f.tracker->SetCommittedOffsetCount(kEvents, 100);
  f.commit_log->offsets[kEvents] = 100;
  f.Ingest(kEvents, 100, 120);

  f.uploader.ApplyPolicy();
  f.uploader.ApplyPolicy();

  assert(f.commit_log->commits.size() == 1);
  assert(f.uploads->Scheduled().size() == 1);
  assert(f.tracker->GetTrueCommittedOffsetCount(kEvents) == 120);
}

void TestUploadFailureCommitsNothingAndOtherPartitionsProceed() {
  Fixture              f("uploader_upload_failure");
  const TopicPartition other{"events", 1};

  f.tracker->SetCommittedOffsetCount(kEvents, 100);
  f.Ingest(kEvents, 100, 200);
  f.tracker->SetCommittedOffsetCount(kEvents, 200);
  f.Ingest(kEvents, 200, 260);
  f.commit_log->offsets[kEvents] = 200;

  f.tracker->SetCommittedOffsetCount(other, 0);
  f.commit_log->offsets[other] = 0;
  f.Ingest(other, 0, 10);

  f.uploads->fail_paths.insert(200);

  bool threw = false;
  try {
    f.uploader.ApplyPolicy();
  } catch (const archiver::util::PolicyFailed& e) {
    threw = true;
    assert(std::string(e.what()).find("events/0") != std::string::npos);
  }
  assert(threw);

  // Both transfers of the failed partition were attempted before giving up.
  assert(f.uploads->Scheduled().size() == 3);
  assert(f.registry->GetPaths(kEvents).size() == 2);
  assert(f.tracker->GetTrueCommittedOffsetCount(kEvents) == 200);
  for (const auto& [tp, offset] : f.commit_log->commits) {
    assert(tp == other && offset == 10);
  }
  assert(f.commit_log->commits.size() == 1);
  assert(f.registry->GetPaths(other).empty());
}

void TestCommitFailurePropagates() {
  Fixture f("uploader_commit_failure");
  f.tracker->SetCommittedOffsetCount(kEvents, 0);
  f.commit_log->offsets[kEvents] = 0;
  f.commit_log->fail_commits     = true;
  f.Ingest(kEvents, 0, 10);

  bool threw = false;
  try {
    f.uploader.UploadAll(kEvents);
  } catch (const archiver::util::CommitFailed&) {
    threw = true;
  }
  assert(threw);
  assert(f.tracker->GetTrueCommittedOffsetCount(kEvents) == 0);
}

void TestCommitReadFailureDegradesToZero() {
  Fixture f("uploader_read_degrade");
  f.tracker->SetCommittedOffsetCount(kEvents, 100);
  f.Ingest(kEvents, 100, 150);
  f.commit_log->fail_reads = true;

  assert(f.uploader.Reconcile(kEvents) == ReconcileAction::kTrim);

  assert(f.tracker->GetTrueCommittedOffsetCount(kEvents) == 0);
  assert(f.commit_log->commits.empty());
  const auto paths = f.registry->GetPaths(kEvents);
  assert(paths.size() == 1 && paths.begin()->Offset() == 0);
  assert(f.Offsets(*paths.begin()).size() == 50);
}

void TestCommitReadFailureCanSkipPartition() {
  auto options                        = Fixture::DefaultOptions();
  options.skip_on_commit_read_failure = true;
  Fixture f("uploader_read_skip", options);
  f.tracker->SetCommittedOffsetCount(kEvents, 100);
  f.Ingest(kEvents, 100, 150);
  const auto before = f.registry->GetPaths(kEvents);
  f.commit_log->fail_reads = true;

  assert(f.uploader.Reconcile(kEvents) == ReconcileAction::kSkip);

  assert(f.tracker->GetTrueCommittedOffsetCount(kEvents) == 100);
  assert(f.registry->GetPaths(kEvents) == before);
  assert(f.uploads->Scheduled().empty());
}

void TestMinuteMarkOpensGateForMatchingTopics() {
  ManualClock reference;
  auto        options              = Fixture::DefaultOptions();
  options.max_file_size_bytes      = 1 << 30;
  options.minute_mark_topic_filter = "events";
  options.minute_mark              = archiver::util::MinuteOfHour(reference.now);
  Fixture f("uploader_minute_mark", options);

  const TopicPartition audit{"audit", 0};
  f.tracker->SetCommittedOffsetCount(kEvents, 0);
  f.tracker->SetCommittedOffsetCount(audit, 0);
  f.commit_log->offsets[kEvents] = 0;
  f.commit_log->offsets[audit]   = 0;
  f.Ingest(kEvents, 0, 3);
  f.Ingest(audit, 0, 3);

  assert(f.uploader.Reconcile(kEvents) == ReconcileAction::kUpload);
  assert(f.uploader.Reconcile(audit) == ReconcileAction::kNone);

  f.Ingest(kEvents, 3, 6);
  f.clock.Advance(std::chrono::seconds(60));
  assert(f.uploader.Reconcile(kEvents) == ReconcileAction::kNone);
}

void TestSkipsMessagesBelowCommit() {
  Fixture f("uploader_skip_committed");
  f.tracker->SetCommittedOffsetCount(kEvents, 100);
  f.Ingest(kEvents, 90, 105);

  const auto paths = f.registry->GetPaths(kEvents);
  assert(paths.size() == 1);
  const auto offsets = f.Offsets(*paths.begin());
  assert(offsets.size() == 5 && offsets.front() == 100);
  assert(f.tracker->GetLastSeenOffset(kEvents) == 104);
}

} // namespace

int main() {
  TestUploadWhenCommitUnchanged();
  TestDeleteWhenCommitBeyondLastSeen();
  TestTrimRoundTripAcrossFiles();
  TestTrimAtFileStartIsNoop();
  TestTrimOfTruncatedFileFailsWithoutCommit();
  TestGateClosedLeavesPartitionUntouched();
  TestSizeThresholdIsInclusive();
  TestPolicyIsIdempotentAfterUpload();
  TestUploadFailureCommitsNothingAndOtherPartitionsProceed();
  TestCommitFailurePropagates();
  TestCommitReadFailureDegradesToZero();
  TestCommitReadFailureCanSkipPartition();
  TestMinuteMarkOpensGateForMatchingTopics();
  TestSkipsMessagesBelowCommit();

  std::cout << "stream_archiver_unit_uploader: pass\n";
  return 0;
}

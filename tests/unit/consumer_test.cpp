#include "internal/runtime/consumer.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/factory.hpp"
#include "internal/uploader/policy_runner.hpp"
#include "internal/uploader/uploader.hpp"
#include "test_support.hpp"

namespace {

using archiver::model::TopicPartition;
using archiver::testing::FakeCommitLog;
using archiver::testing::FakeMessageSource;
using archiver::testing::LocalUploadManager;
using archiver::testing::MakeTempDir;
using archiver::testing::ManualClock;
using archiver::uploader::PolicyRunner;

const TopicPartition kEvents{"events", 0};

class CountingPolicy final : public archiver::uploader::UploadPolicy {
 public:
  void ApplyPolicy() override {
    ++runs;
    if (fail) throw archiver::util::PolicyFailed("injected");
  }
  int  runs = 0;
  bool fail = false;
};

void TestRunnerHonoursInterval() {
  ManualClock  clock;
  auto         policy = std::make_shared<CountingPolicy>();
  PolicyRunner runner(policy, std::chrono::seconds(10), clock.Fn());

  assert(runner.MaybeRun());
  assert(!runner.MaybeRun());
  clock.Advance(std::chrono::seconds(9));
  assert(!runner.MaybeRun());
  clock.Advance(std::chrono::seconds(1));
  assert(runner.MaybeRun());
  assert(policy->runs == 2);

  // A failed cycle is reported, not raised; the next one still runs.
  policy->fail = true;
  clock.Advance(std::chrono::seconds(10));
  assert(runner.MaybeRun());
  policy->fail = false;
  clock.Advance(std::chrono::seconds(10));
  assert(runner.MaybeRun());
  assert(policy->runs == 4);
}

void TestIngestThenUploadOnNextCycle() {
  const auto  dir = MakeTempDir("consumer_cycle");
  ManualClock clock;

  auto factory    = std::make_shared<archiver::io::DelimitedFileReaderWriterFactory>();
  auto tracker    = std::make_shared<archiver::tracker::OffsetTracker>();
  auto registry   = std::make_shared<archiver::registry::FileRegistry>(factory, clock.Fn());
  auto commit_log = std::make_shared<FakeCommitLog>();
  auto uploads    = std::make_shared<LocalUploadManager>(dir / "remote");
  auto source     = std::make_shared<FakeMessageSource>();

  archiver::uploader::UploaderOptions options;
  options.max_file_size_bytes = 1;
  options.max_file_age_sec    = 3600;

  archiver::uploader::PolicyDependencies deps;
  deps.tracker        = tracker;
  deps.registry       = registry;
  deps.upload_manager = uploads;
  deps.commit_log     = commit_log;
  deps.now            = clock.Fn();

  auto policy = std::make_shared<archiver::uploader::Uploader>(options, deps);
  auto runner = std::make_shared<PolicyRunner>(policy, std::chrono::seconds(10), clock.Fn());
  auto writer = std::make_shared<archiver::writer::MessageWriter>(tracker, registry, archiver::io::CompressionCodec{}, (dir / "local").string(), 1);
  archiver::runtime::Consumer consumer(source, writer, runner, registry, tracker, std::chrono::milliseconds(1));

  commit_log->offsets[kEvents] = 0;
  for (int64_t offset = 0; offset < 5; ++offset) {
    source->Push(kEvents.topic, kEvents.partition, offset);
  }

  // First poll also runs the first cycle: the fresh commit only aligns the tracker.
  assert(consumer.PollOnce());
  assert(commit_log->commits.empty());
  assert(tracker->GetTrueCommittedOffsetCount(kEvents) == 0);

  while (consumer.PollOnce()) {
  }
  assert(tracker->GetLastSeenOffset(kEvents) == 4);
  assert(commit_log->commits.empty());

  clock.Advance(std::chrono::seconds(10));
  assert(!consumer.PollOnce());
  assert(commit_log->commits.size() == 1 && commit_log->commits[0].second == 5);
  assert(registry->GetTopicPartitions().empty());
  assert(uploads->Scheduled().size() == 1);
}

void TestRevokedPartitionsAreDropped() {
  const auto dir    = MakeTempDir("consumer_revoke");
  auto       source = std::make_shared<FakeMessageSource>();
  auto       commit = std::make_shared<FakeCommitLog>();

  archiver::runtime::config::RuntimeConfig config;
  config.mutable_local()->set_path((dir / "local").string());
  config.mutable_local()->set_generation(1);
  config.mutable_uploader()->set_max_file_size_bytes(1 << 30);
  config.mutable_uploader()->mutable_max_file_age()->set_seconds(3600);
  config.mutable_uploader()->set_threads(1);
  config.mutable_storage()->set_root_path((dir / "remote").string());
  config.mutable_storage()->set_filesystem(archiver::runtime::config::FILE_SYSTEM_LOCAL);

  auto app = archiver::factory::Build(config, source, commit);

  source->Push(kEvents.topic, kEvents.partition, 40);
  source->Push("audit", 0, 7);
  assert(app.consumer->PollOnce());
  assert(app.consumer->PollOnce());
  assert(app.registry->GetTopicPartitions().size() == 2);

  const auto path = *app.registry->GetPaths(kEvents).begin();
  assert(path.Offset() == 40);

  source->on_revoke({kEvents});

  assert(app.registry->GetTopicPartitions().size() == 1);
  assert(!std::filesystem::exists(path.LogFilePathString()));
  assert(app.tracker->GetLastSeenOffset(kEvents) == archiver::tracker::OffsetTracker::kUnknownLastSeenOffset);
  assert(app.tracker->GetLastSeenOffset({"audit", 0}) == 7);
}

void TestLoopStartsAndStops() {
  const auto dir    = MakeTempDir("consumer_loop");
  auto       source = std::make_shared<FakeMessageSource>();

  archiver::runtime::config::RuntimeConfig config;
  config.mutable_local()->set_path((dir / "local").string());
  config.mutable_uploader()->set_max_file_size_bytes(1 << 30);
  config.mutable_uploader()->mutable_max_file_age()->set_seconds(3600);
  config.mutable_storage()->set_root_path((dir / "remote").string());
  config.mutable_storage()->set_filesystem(archiver::runtime::config::FILE_SYSTEM_LOCAL);

  auto app = archiver::factory::Build(config, source, std::make_shared<FakeCommitLog>());
  app.consumer->Start();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(app.consumer->Running());
  app.consumer->Stop();
  assert(!app.consumer->Running());
  assert(!app.consumer->Failed());
}

} // namespace

int main() {
  TestRunnerHonoursInterval();
  TestIngestThenUploadOnNextCycle();
  TestRevokedPartitionsAreDropped();
  TestLoopStartsAndStops();

  std::cout << "stream_archiver_unit_consumer: pass\n";
  return 0;
}

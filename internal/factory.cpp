#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/io/compression.hpp"
#include "internal/io/delimited_file.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/upload/object_upload_manager.hpp"
#include "internal/uploader/policy_runner.hpp"
#include "internal/uploader/upload_policy.hpp"
#include "internal/util/time.hpp"
#include "internal/writer/message_writer.hpp"
#if ARCHIVER_KAFKA_RDKAFKA
#include "internal/kafka/rdkafka_consumer.hpp"
#endif

namespace archiver::factory {

using archiver::observability::IntField;
using archiver::observability::StringField;

namespace {

constexpr uint32_t                  kDefaultUploadThreads = 4;
constexpr std::chrono::milliseconds kDefaultPollTimeout{1000};

void ConnectKafka(const archiver::runtime::config::RuntimeConfig& config, kafka::MessageSourcePtr& source, kafka::CommitLogClientPtr& commit_log) {
  if (source && commit_log) return;
#if ARCHIVER_KAFKA_RDKAFKA
  auto consumer = std::make_shared<kafka::RdKafkaConsumer>(config.kafka());
  if (!source) source = consumer;
  if (!commit_log) commit_log = consumer;
#else
  (void)config;
  throw std::runtime_error("kafka consumer requested but not enabled at build time");
#endif
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const archiver::runtime::config::RuntimeConfig& config, kafka::MessageSourcePtr source, kafka::CommitLogClientPtr commit_log) {
  Application app;

  const auto codec = io::ResolveCodec(config.uploader().compression_codec());

  // ------------------------------------------------------------------
  // Local buffer
  // ------------------------------------------------------------------
  app.tracker  = std::make_shared<tracker::OffsetTracker>();
  app.registry = std::make_shared<registry::FileRegistry>(std::make_shared<io::DelimitedFileReaderWriterFactory>(), util::Now,
                                                          config.uploader().file_age_youngest());

  // ------------------------------------------------------------------
  // Remote storage
  // ------------------------------------------------------------------
  auto [fs, root_path] = storage::common::Unwrap(storage::common::ResolveFileSystem(config.storage()));
  const uint32_t threads = config.uploader().threads() > 0 ? config.uploader().threads() : kDefaultUploadThreads;
  app.upload_manager     = std::make_shared<upload::ObjectUploadManager>(std::move(fs), root_path, threads);

  // ------------------------------------------------------------------
  // Kafka
  // ------------------------------------------------------------------
  ConnectKafka(config, source, commit_log);
  app.source     = source;
  app.commit_log = commit_log;

  // ------------------------------------------------------------------
  // Upload policy and ingestion
  // ------------------------------------------------------------------
  uploader::PolicyDependencies deps;
  deps.tracker        = app.tracker;
  deps.registry       = app.registry;
  deps.upload_manager = app.upload_manager;
  deps.commit_log     = app.commit_log;

  std::shared_ptr<uploader::UploadPolicy> policy = uploader::MakeUploadPolicy(config, std::move(deps));
  auto runner = std::make_shared<uploader::PolicyRunner>(policy, util::FromProto(config.uploader().policy_interval()));

  auto writer = std::make_shared<writer::MessageWriter>(app.tracker, app.registry, codec, config.local().path(), config.local().generation());

  const auto poll_timeout =
      config.kafka().poll_timeout_ms() > 0 ? std::chrono::milliseconds(config.kafka().poll_timeout_ms()) : kDefaultPollTimeout;
  app.consumer = std::make_unique<runtime::Consumer>(app.source, writer, runner, app.registry, app.tracker, poll_timeout);

  ARCHIVER_LOG_INFO("archiver built", {StringField("local_path", config.local().path()), StringField("storage_root", root_path),
                                       StringField("codec", codec.name), IntField("upload_threads", threads)});
  return app;
}

} // namespace archiver::factory

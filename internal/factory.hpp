#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/kafka/commit_log_client.hpp"
#include "internal/kafka/message_source.hpp"
#include "internal/registry/file_registry.hpp"
#include "internal/runtime/consumer.hpp"
#include "internal/tracker/offset_tracker.hpp"
#include "internal/upload/upload_manager.hpp"

namespace archiver::factory {

/*
  Application

  Owns all long-lived components of the archiver. Everything here lives for
  the lifetime of the process.
*/
struct Application {
  std::shared_ptr<tracker::OffsetTracker> tracker;
  std::shared_ptr<registry::FileRegistry> registry;
  upload::UploadManagerPtr                upload_manager;
  kafka::CommitLogClientPtr               commit_log;
  kafka::MessageSourcePtr                 source;
  std::unique_ptr<runtime::Consumer>      consumer;
};

/*
  Build

  Composition root: the only place that knows the concrete Kafka, storage
  and file format types.

  Source and commit log are injectable for tests; when null the Kafka
  consumer configured under kafka: provides both.
*/
Application Build(const archiver::runtime::config::RuntimeConfig& config, kafka::MessageSourcePtr source = nullptr,
                  kafka::CommitLogClientPtr commit_log = nullptr);

} // namespace archiver::factory

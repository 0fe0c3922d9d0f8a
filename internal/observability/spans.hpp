#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace archiver::runtime::config {
class RuntimeConfig;
}

namespace archiver::model {
struct TopicPartition;
}

namespace archiver::observability {

// Both return false when the signal is disabled in config or the build has no OpenTelemetry.
bool InitializeTracing(const archiver::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const archiver::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Span "uploader.reconcile" around one reconciliation of a partition that
  passed the upload gate. Carries topic, partition, the offsets compared
  and the chosen action. Ends when destroyed.
*/
class ReconcileSpan {
 public:
  explicit ReconcileSpan(const archiver::model::TopicPartition& tp);
  ~ReconcileSpan();

  ReconcileSpan(const ReconcileSpan&)            = delete;
  ReconcileSpan& operator=(const ReconcileSpan&) = delete;

  void SetOffsets(std::int64_t previous_committed, std::int64_t committed, std::int64_t last_seen);
  void SetAction(std::string_view action);
  // Marks the span as an error.
  void Fail(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // uploader.file_uploads.count
  void RecordUpload(const archiver::model::TopicPartition& tp, std::uint64_t files);
  // uploader.policy.actions, one per reconciliation outcome
  void RecordPolicyAction(const archiver::model::TopicPartition& tp, std::string_view action);
  // uploader.upload.duration_ms, one sample per transferred file
  void ObserveUploadDurationMs(std::string_view topic, double duration_ms);
  // uploader.buffered_bytes, reported per topic as the sum over its partitions
  void SetBufferedBytes(const archiver::model::TopicPartition& tp, std::uint64_t bytes);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const archiver::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const archiver::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline ReconcileSpan::ReconcileSpan(const archiver::model::TopicPartition&) {
}

inline ReconcileSpan::~ReconcileSpan() {
}

inline void ReconcileSpan::SetOffsets(std::int64_t, std::int64_t, std::int64_t) {
}

inline void ReconcileSpan::SetAction(std::string_view) {
}

inline void ReconcileSpan::Fail(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordUpload(const archiver::model::TopicPartition&, std::uint64_t) {
}

inline void Metrics::RecordPolicyAction(const archiver::model::TopicPartition&, std::string_view) {
}

inline void Metrics::ObserveUploadDurationMs(std::string_view, double) {
}

inline void Metrics::SetBufferedBytes(const archiver::model::TopicPartition&, std::uint64_t) {
}
#endif

} // namespace archiver::observability

#include "internal/uploader/policy_runner.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace archiver::uploader {

using archiver::observability::IntField;
using archiver::observability::StringField;

namespace {

constexpr std::chrono::milliseconds kDefaultInterval{10000};

} // namespace

PolicyRunner::PolicyRunner(std::shared_ptr<UploadPolicy> policy, std::chrono::milliseconds interval, util::NowFn now)
    : policy_(std::move(policy)), interval_(interval.count() > 0 ? interval : kDefaultInterval), now_(std::move(now)) {
  if (!policy_) throw util::InvalidArgument("policy runner requires a policy");
}

bool PolicyRunner::MaybeRun() {
  const auto now = now_();
  if (last_run_ && now - *last_run_ < interval_) return false;
  last_run_ = now;
  RunOnce();
  return true;
}

void PolicyRunner::RunOnce() {
  try {
    policy_->ApplyPolicy();
  } catch (const std::exception& e) {
    ARCHIVER_LOG_ERROR("upload policy cycle failed", {StringField("error", e.what()), IntField("interval_ms", interval_.count())});
  }
}

} // namespace archiver::uploader

#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "internal/uploader/upload_policy.hpp"
#include "internal/util/time.hpp"

namespace archiver::uploader {

/*
  Runs the upload policy at a fixed cadence from the ingestion loop.

  The policy runs on the thread that writes buffered files, so a writer is
  never appended to while the policy closes or uploads it.
*/
class PolicyRunner {
 public:
  PolicyRunner(std::shared_ptr<UploadPolicy> policy, std::chrono::milliseconds interval, util::NowFn now = util::Now);

  // Applies the policy when the interval elapsed since the last run. Returns true if it ran.
  bool MaybeRun();

  // Applies the policy now. Failures are logged, not raised.
  void RunOnce();

 private:
  std::shared_ptr<UploadPolicy>  policy_;
  std::chrono::milliseconds      interval_;
  util::NowFn                    now_;
  std::optional<util::TimePoint> last_run_;
};

} // namespace archiver::uploader

#include "time.hpp"

#include <ctime>

namespace archiver::util {

TimePoint Now() {
  return Clock::now();
}

int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

int MinuteOfHour(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           local{};
  localtime_r(&t, &local);
  return local.tm_min;
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& duration) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(duration.seconds()) +
                                                               std::chrono::nanoseconds(duration.nanos()));
}

} // namespace archiver::util

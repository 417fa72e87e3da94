#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace vera::util {

TimePoint Now() {
  return Clock::now();
}

std::string FormatIso8601(TimePoint tp) {
  const auto   sec    = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  const auto   millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - sec).count();
  std::time_t  t      = Clock::to_time_t(sec);
  std::tm      utc{};
  gmtime_r(&t, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace vera::util

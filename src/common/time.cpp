#include "talekeeper/common/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace talekeeper::common {

namespace {

std::tm to_utc(const std::chrono::system_clock::time_point when) {
  const auto t = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  return tm;
}

} // namespace

std::string format_rfc3339(const std::chrono::system_clock::time_point when) {
  const std::tm tm = to_utc(when);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          when.time_since_epoch()) %
                      1000;

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << (millis.count() < 0 ? millis.count() + 1000 : millis.count()) << 'Z';
  return out.str();
}

std::string now_rfc3339() { return format_rfc3339(std::chrono::system_clock::now()); }

std::string compact_timestamp(const std::string &rfc3339) {
  // "2026-10-18T12:00:00.000Z" -> "20261018_120000"
  std::string out;
  for (const char ch : rfc3339.substr(0, 19)) {
    if (ch >= '0' && ch <= '9') {
      out.push_back(ch);
    } else if (ch == 'T') {
      out.push_back('_');
    }
  }
  return out;
}

TimestampFn system_clock_fn() {
  return [] { return now_rfc3339(); };
}

} // namespace talekeeper::common

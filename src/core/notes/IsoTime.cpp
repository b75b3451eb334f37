#include "IsoTime.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace notes {

std::string to_iso8601(Timestamp t) {
  using namespace std::chrono;
  // floor so pre-epoch values keep a non-negative fraction
  const auto secs = time_point_cast<seconds>(t);
  const auto whole = secs > t ? secs - seconds(1) : secs;
  const auto micros = duration_cast<microseconds>(t - whole).count();

  const std::time_t tt = system_clock::to_time_t(whole);
  std::tm tm{};
#ifdef _WIN32
  if (gmtime_s(&tm, &tt) != 0) throw std::runtime_error("gmtime_s failed");
#else
  if (gmtime_r(&tt, &tm) == nullptr) throw std::runtime_error("gmtime_r failed");
#endif

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<long long>(micros));
  return buf;
}

} // namespace notes

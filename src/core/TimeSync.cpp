#include "core/TimeSync.h"

#include <cstdlib>
#include <ctime>

#include "platform/Platform.h"

namespace {
constexpr time_t kUnixYear2000 = 946684800;
}  // namespace

namespace timesync {

void applyTimezone(const char* posixTz) {
  const char* tz = (posixTz == nullptr || *posixTz == '\0') ? "UTC0" : posixTz;
  setenv("TZ", tz, 1);
  tzset();
  platform::logi("time", "tz='%s'", tz);
}

bool hasValidTime() { return std::time(nullptr) > kUnixYear2000; }

}  // namespace timesync

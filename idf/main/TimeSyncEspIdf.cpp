#include "core/TimeSync.h"

#include "esp_sntp.h"
#include "platform/Platform.h"

namespace timesync {

void configureUtcNtp() {
  if (esp_sntp_enabled()) {
    return;
  }
  esp_sntp_setoperatingmode(ESP_SNTP_OPMODE_POLL);
  esp_sntp_setservername(0, "pool.ntp.org");
  esp_sntp_setservername(1, "time.nist.gov");
  esp_sntp_init();
}

bool ensureUtcTime(uint32_t timeoutMs) {
  configureUtcNtp();
  const uint32_t startMs = platform::millisMs();
  while (platform::millisMs() - startMs < timeoutMs) {
    if (hasValidTime()) {
      return true;
    }
    platform::sleepMs(120);
  }
  platform::logw("time", "sntp not synced after %u ms", static_cast<unsigned>(timeoutMs));
  return false;
}

}  // namespace timesync

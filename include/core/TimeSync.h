#pragma once

#include <cstdint>

namespace timesync {

// POSIX TZ string, e.g. "PST8PDT,M3.2.0,M11.1.0". Empty selects UTC.
void applyTimezone(const char* posixTz);
bool hasValidTime();

// SNTP, device only.
void configureUtcNtp();
bool ensureUtcTime(uint32_t timeoutMs = 6000);

}  // namespace timesync

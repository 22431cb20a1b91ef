#include "services/HttpTransportGate.h"

#include "platform/Platform.h"
#include "platform/Sync.h"

namespace {
constexpr const char* kTag = "http-gate";

platform::Mutex& transportMutex() {
  static platform::Mutex sTransportMutex;
  return sTransportMutex;
}

uint32_t sLastRequestMs = 0;
bool sAnyRequest = false;
}  // namespace

namespace httpgate {

Guard::Guard(uint32_t timeoutMs) {
  if (!transportMutex().lock(timeoutMs)) {
    platform::logw(kTag, "wait timeout timeout_ms=%u", static_cast<unsigned>(timeoutMs));
    return;
  }

  const uint32_t nowMs = platform::millisMs();
  const uint32_t elapsed = nowMs - sLastRequestMs;
  if (sAnyRequest && elapsed < kMinInterRequestGapMs) {
    platform::sleepMs(kMinInterRequestGapMs - elapsed);
  }
  sLastRequestMs = platform::millisMs();
  sAnyRequest = true;
  locked_ = true;
}

Guard::~Guard() {
  if (locked_) {
    transportMutex().unlock();
  }
}

}  // namespace httpgate

#pragma once

#include <cstdint>

// Serializes outbound HTTP requests and spaces them at least
// kMinInterRequestGapMs apart.
namespace httpgate {

constexpr uint32_t kMinInterRequestGapMs = 250U;

class Guard {
 public:
  explicit Guard(uint32_t timeoutMs);
  ~Guard();
  Guard(const Guard&) = delete;
  Guard& operator=(const Guard&) = delete;

  bool locked() const { return locked_; }

 private:
  bool locked_ = false;
};

}  // namespace httpgate

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/Frame.h"
#include "core/NavigationState.h"
#include "core/RateLimiter.h"

class RenderScheduler;
class ThemeState;

struct ControlRequest {
  std::string method = "GET";
  // May carry a query string; it is ignored.
  std::string path;
  // Raw Authorization header value, empty when absent.
  std::string authorization;
};

struct ControlResponse {
  int status = 200;
  std::string contentType = "text/plain";
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
  // Set for /screenshot; the transport encodes it as BMP.
  std::shared_ptr<const Frame> frame;
};

struct ControlCredentials {
  std::string user;
  std::string password;

  bool enabled() const { return !user.empty() && !password.empty(); }
};

// Transport-independent request handling for the HTTP control endpoints.
// Safe to call from several server threads at once.
class ControlPlane {
 public:
  ControlPlane(NavigationState& nav, RenderScheduler* scheduler, ThemeState* theme,
               uint16_t ratePerSecond, ControlCredentials credentials,
               uint32_t screenshotTimeoutMs = 3000);
  ControlPlane(NavigationState& nav, RenderScheduler* scheduler, ThemeState* theme,
               RateLimiter::Clock clock, uint16_t ratePerSecond, ControlCredentials credentials,
               uint32_t screenshotTimeoutMs = 3000);

  ControlResponse handle(const ControlRequest& request);

  bool authorized(const std::string& authorizationHeader) const;
  static bool decodeBase64(const std::string& in, std::string& out);

 private:
  static ControlResponse viewStatus(const NavSnapshot& snap);
  ControlResponse screenshot();
  ControlResponse themeStatus();

  NavigationState& nav_;
  RenderScheduler* scheduler_;
  ThemeState* theme_;
  RateLimiter limiter_;
  const ControlCredentials credentials_;
  const uint32_t screenshotTimeoutMs_;
};

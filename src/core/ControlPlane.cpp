#include "core/ControlPlane.h"

#include <cctype>
#include <utility>

#include "core/NavigationState.h"
#include "core/RenderScheduler.h"
#include "core/ThemeState.h"
#include "platform/Platform.h"

namespace {
constexpr const char* kTag = "ctl";
constexpr const char* kRealm = "Basic realm=\"SunPanel\"";

ControlResponse text(int status, std::string body) {
  ControlResponse resp;
  resp.status = status;
  resp.body = std::move(body);
  return resp;
}

ControlResponse json(std::string body) {
  ControlResponse resp;
  resp.contentType = "application/json";
  resp.body = std::move(body);
  return resp;
}

int base64Value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

std::string normalizedPath(const std::string& raw) {
  std::string path = raw.substr(0, raw.find_first_of("?#"));
  for (char& c : path) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return path;
}

// Length-independent comparison of two secrets.
bool sameSecret(const std::string& a, const std::string& b) {
  unsigned diff = static_cast<unsigned>(a.size() ^ b.size());
  const size_t n = a.size() < b.size() ? a.size() : b.size();
  for (size_t i = 0; i < n; ++i) {
    diff |= static_cast<unsigned>(static_cast<unsigned char>(a[i]) ^
                                  static_cast<unsigned char>(b[i]));
  }
  return diff == 0;
}

}  // namespace

ControlPlane::ControlPlane(NavigationState& nav, RenderScheduler* scheduler, ThemeState* theme,
                           uint16_t ratePerSecond, ControlCredentials credentials,
                           uint32_t screenshotTimeoutMs)
    : ControlPlane(nav, scheduler, theme, &platform::millisMs, ratePerSecond,
                   std::move(credentials), screenshotTimeoutMs) {}

ControlPlane::ControlPlane(NavigationState& nav, RenderScheduler* scheduler, ThemeState* theme,
                           RateLimiter::Clock clock, uint16_t ratePerSecond,
                           ControlCredentials credentials, uint32_t screenshotTimeoutMs)
    : nav_(nav),
      scheduler_(scheduler),
      theme_(theme),
      limiter_(ratePerSecond, std::move(clock)),
      credentials_(std::move(credentials)),
      screenshotTimeoutMs_(screenshotTimeoutMs) {
  platform::logi(kTag, "rate=%u/s auth=%s", static_cast<unsigned>(limiter_.rate()),
                 credentials_.enabled() ? "basic" : "off");
}

bool ControlPlane::decodeBase64(const std::string& in, std::string& out) {
  out.clear();
  uint32_t acc = 0;
  int bits = 0;
  size_t padding = 0;
  for (char c : in) {
    if (c == '=') {
      ++padding;
      continue;
    }
    if (padding > 0) {
      return false;
    }
    const int v = base64Value(c);
    if (v < 0) {
      return false;
    }
    acc = (acc << 6) | static_cast<uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<char>((acc >> bits) & 0xFFU));
    }
  }
  return padding <= 2 && (in.size() % 4 == 0 || padding == 0);
}

bool ControlPlane::authorized(const std::string& authorizationHeader) const {
  if (!credentials_.enabled()) {
    return true;
  }
  static constexpr char kPrefix[] = "Basic ";
  if (authorizationHeader.compare(0, sizeof(kPrefix) - 1, kPrefix) != 0) {
    return false;
  }
  std::string decoded;
  if (!decodeBase64(authorizationHeader.substr(sizeof(kPrefix) - 1), decoded)) {
    return false;
  }
  const size_t colon = decoded.find(':');
  if (colon == std::string::npos) {
    return false;
  }
  const bool userOk = sameSecret(decoded.substr(0, colon), credentials_.user);
  const bool passOk = sameSecret(decoded.substr(colon + 1), credentials_.password);
  return userOk && passOk;
}

ControlResponse ControlPlane::handle(const ControlRequest& request) {
  if (!limiter_.allow()) {
    ControlResponse resp = text(429, "Too Many Requests");
    resp.headers.emplace_back("Retry-After", "1");
    return resp;
  }
  if (!authorized(request.authorization)) {
    platform::logw(kTag, "unauthorized path=%s", request.path.c_str());
    ControlResponse resp = text(401, "Unauthorized");
    resp.headers.emplace_back("WWW-Authenticate", kRealm);
    return resp;
  }
  if (request.method != "GET") {
    ControlResponse resp = text(405, "Method Not Allowed");
    resp.headers.emplace_back("Allow", "GET");
    return resp;
  }

  const std::string path = normalizedPath(request.path);
  platform::logd(kTag, "GET %s", path.c_str());
  if (path == "/health") {
    return text(200, "OK");
  }
  if (path == "/screenshot") {
    return screenshot();
  }
  if (path == "/next") {
    return viewStatus(nav_.next());
  }
  if (path == "/prev") {
    return viewStatus(nav_.prev());
  }
  if (path == "/view") {
    return viewStatus(nav_.snapshot());
  }
  if (path == "/theme") {
    return themeStatus();
  }
  static constexpr char kThemePrefix[] = "/theme/";
  if (path.compare(0, sizeof(kThemePrefix) - 1, kThemePrefix) == 0) {
    if (theme_ == nullptr) {
      return text(503, "Theme not available");
    }
    ThemeMode mode = ThemeMode::kAuto;
    if (!parseThemeMode(path.substr(sizeof(kThemePrefix) - 1), mode)) {
      return text(404, "Not Found");
    }
    theme_->setMode(mode);
    nav_.wake();
    return themeStatus();
  }
  return text(404, "Not Found");
}

// /next and /prev pass the snapshot their own step returned.
ControlResponse ControlPlane::viewStatus(const NavSnapshot& snap) {
  return text(200, std::string(panelName(snap.panel)) + " (" + std::to_string(snap.index + 1) +
                       "/" + std::to_string(snap.count) + ")");
}

ControlResponse ControlPlane::screenshot() {
  if (scheduler_ == nullptr) {
    return text(503, "No frame available");
  }
  std::shared_ptr<const Frame> frame = scheduler_->renderOnDemand(screenshotTimeoutMs_);
  if (frame == nullptr) {
    return text(503, "No frame available");
  }
  ControlResponse resp;
  resp.contentType = "image/bmp";
  resp.headers.emplace_back("Cache-Control", "no-cache");
  resp.frame = std::move(frame);
  return resp;
}

ControlResponse ControlPlane::themeStatus() {
  if (theme_ == nullptr) {
    return text(503, "Theme not available");
  }
  return json(theme_->statusJson());
}

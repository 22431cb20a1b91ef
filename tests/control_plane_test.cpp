#include <gtest/gtest.h>

#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "core/ControlPlane.h"
#include "core/NavigationState.h"
#include "core/RenderScheduler.h"
#include "core/ThemeState.h"
#include "core/TimeSync.h"

namespace {

class SolidRenderer : public PanelRenderer {
 public:
  bool render(const NavSnapshot& nav, Frame& frame) override {
    (void)nav;
    frame.fill(0x07E0);
    return true;
  }
  void renderFailure(const NavSnapshot& nav, Frame& frame) override { (void)render(nav, frame); }
};

class NullSink : public DisplaySink {
 public:
  bool write(const Frame& frame) override {
    (void)frame;
    return true;
  }
};

// 2024-03-20 12:00 UTC.
constexpr time_t kNoonUtc = 1710936000;

std::string header(const ControlResponse& resp, const std::string& name) {
  for (const auto& h : resp.headers) {
    if (h.first == name) {
      return h.second;
    }
  }
  return "";
}

ControlRequest get(const std::string& path, const std::string& auth = "") {
  ControlRequest req;
  req.path = path;
  req.authorization = auth;
  return req;
}

class ControlPlaneTest : public ::testing::Test {
 protected:
  ControlPlaneTest()
      : nav_(defaultPanelOrder(), 0, wake_),
        scheduler_(nav_, renderer_, sink_, wake_, 8, 4),
        theme_(nullptr, ThemeMode::kAuto, 60000, [] { return kNoonUtc; }, [this] { return now_; }) {
    timesync::applyTimezone("UTC0");
  }

  ControlPlane makePlane(uint16_t rate = 100, ControlCredentials creds = {}) {
    return ControlPlane(nav_, &scheduler_, &theme_, [this] { return now_; }, rate, creds, 50);
  }

  uint32_t now_ = 0;
  platform::WakeSignal wake_;
  NavigationState nav_;
  SolidRenderer renderer_;
  NullSink sink_;
  RenderScheduler scheduler_;
  ThemeState theme_;
};

}  // namespace

TEST_F(ControlPlaneTest, HealthIsPlainOk) {
  ControlPlane plane = makePlane();
  const ControlResponse resp = plane.handle(get("/health"));
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(resp.contentType, "text/plain");
  EXPECT_EQ(resp.body, "OK");
}

TEST_F(ControlPlaneTest, ViewReportsNameAndOneBasedPosition) {
  ControlPlane plane = makePlane();
  EXPECT_EQ(plane.handle(get("/view")).body, "clock (1/9)");
  EXPECT_EQ(plane.handle(get("/next")).body, "weather (2/9)");
  EXPECT_EQ(plane.handle(get("/prev")).body, "clock (1/9)");
  EXPECT_EQ(plane.handle(get("/prev")).body, "analogclock (9/9)");
  EXPECT_EQ(nav_.index(), 8u);
}

TEST_F(ControlPlaneTest, ConcurrentStepsEachReportTheirOwnPosition) {
  ControlPlane plane = makePlane();
  // Eight steps from the first panel stay within one lap, so every reply
  // names a different panel when each one reports its own step.
  constexpr int kThreads = 4;
  constexpr int kStepsPerThread = 2;
  std::mutex mu;
  std::multiset<std::string> bodies;
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      for (int n = 0; n < kStepsPerThread; ++n) {
        const ControlResponse resp = plane.handle(get("/next"));
        std::lock_guard<std::mutex> lock(mu);
        bodies.insert(resp.body);
      }
    });
  }
  for (std::thread& t : threads) {
    t.join();
  }

  const std::vector<PanelId> order = defaultPanelOrder();
  ASSERT_EQ(bodies.size(), static_cast<size_t>(kThreads * kStepsPerThread));
  for (size_t i = 1; i <= bodies.size(); ++i) {
    const std::string expected = std::string(panelName(order[i])) + " (" +
                                 std::to_string(i + 1) + "/9)";
    EXPECT_EQ(bodies.count(expected), 1u) << expected;
  }
  EXPECT_EQ(nav_.index(), 8u);
}

TEST_F(ControlPlaneTest, PathIsCaseInsensitiveAndIgnoresQuery) {
  ControlPlane plane = makePlane();
  const ControlResponse resp = plane.handle(get("/NEXT?source=test"));
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body, "weather (2/9)");
}

TEST_F(ControlPlaneTest, UnknownPathIsNotFound) {
  ControlPlane plane = makePlane();
  const ControlResponse resp = plane.handle(get("/reboot"));
  EXPECT_EQ(resp.status, 404);
  EXPECT_EQ(resp.body, "Not Found");
}

TEST_F(ControlPlaneTest, OnlyGetIsAllowed) {
  ControlPlane plane = makePlane();
  ControlRequest req = get("/next");
  req.method = "POST";
  const ControlResponse resp = plane.handle(req);
  EXPECT_EQ(resp.status, 405);
  EXPECT_EQ(header(resp, "Allow"), "GET");
  EXPECT_EQ(nav_.index(), 0u);
}

TEST_F(ControlPlaneTest, RateLimitRejectsWithRetryAfter) {
  ControlPlane plane = makePlane(2);
  EXPECT_EQ(plane.handle(get("/health")).status, 200);
  EXPECT_EQ(plane.handle(get("/health")).status, 200);
  const ControlResponse limited = plane.handle(get("/health"));
  EXPECT_EQ(limited.status, 429);
  EXPECT_EQ(limited.body, "Too Many Requests");
  EXPECT_EQ(header(limited, "Retry-After"), "1");

  now_ += 1000;
  EXPECT_EQ(plane.handle(get("/health")).status, 200);
}

TEST_F(ControlPlaneTest, RateLimitIsCheckedBeforeAuth) {
  ControlCredentials creds;
  creds.user = "user";
  creds.password = "pass";
  ControlPlane plane = makePlane(1, creds);
  EXPECT_EQ(plane.handle(get("/health")).status, 401);
  EXPECT_EQ(plane.handle(get("/health")).status, 429);
}

TEST_F(ControlPlaneTest, BasicAuthGuardsEveryEndpoint) {
  ControlCredentials creds;
  creds.user = "user";
  creds.password = "pass";
  ControlPlane plane = makePlane(100, creds);

  const ControlResponse denied = plane.handle(get("/next"));
  EXPECT_EQ(denied.status, 401);
  EXPECT_EQ(denied.body, "Unauthorized");
  EXPECT_EQ(header(denied, "WWW-Authenticate"), "Basic realm=\"SunPanel\"");
  EXPECT_EQ(nav_.index(), 0u);

  // base64("user:pass")
  EXPECT_EQ(plane.handle(get("/health", "Basic dXNlcjpwYXNz")).status, 200);
  // base64("user:nope")
  EXPECT_EQ(plane.handle(get("/health", "Basic dXNlcjpub3Bl")).status, 401);
  EXPECT_EQ(plane.handle(get("/health", "Bearer dXNlcjpwYXNz")).status, 401);
  EXPECT_EQ(plane.handle(get("/health", "Basic !!!")).status, 401);
}

TEST_F(ControlPlaneTest, PasswordMayContainColons) {
  ControlCredentials creds;
  creds.user = "admin";
  creds.password = "a:b";
  ControlPlane plane = makePlane(100, creds);
  // base64("admin:a:b")
  EXPECT_TRUE(plane.authorized("Basic YWRtaW46YTpi"));
}

TEST_F(ControlPlaneTest, NoCredentialsMeansOpenAccess) {
  ControlPlane plane = makePlane();
  EXPECT_TRUE(plane.authorized(""));
}

TEST(ControlPlaneBase64Test, DecodesPaddedAndRejectsGarbage) {
  std::string out;
  ASSERT_TRUE(ControlPlane::decodeBase64("dXNlcjpwYXNz", out));
  EXPECT_EQ(out, "user:pass");
  ASSERT_TRUE(ControlPlane::decodeBase64("YQ==", out));
  EXPECT_EQ(out, "a");
  EXPECT_FALSE(ControlPlane::decodeBase64("YQ=a", out));
  EXPECT_FALSE(ControlPlane::decodeBase64("@@@@", out));
}

TEST_F(ControlPlaneTest, ThemeStatusIsJson) {
  ControlPlane plane = makePlane();
  const ControlResponse resp = plane.handle(get("/theme"));
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(resp.contentType, "application/json");
  EXPECT_EQ(resp.body, "{\"mode\":\"auto\",\"active_theme\":\"day\",\"is_daytime\":true}");
}

TEST_F(ControlPlaneTest, ThemeModeCanBeForced) {
  ControlPlane plane = makePlane();
  (void)wake_.wait(0);
  const ControlResponse resp = plane.handle(get("/theme/night"));
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(resp.body, "{\"mode\":\"night\",\"active_theme\":\"night\",\"is_daytime\":true}");
  EXPECT_EQ(theme_.mode(), ThemeMode::kNight);
  // The renderer is woken so the new palette shows at once.
  EXPECT_TRUE(wake_.wait(0));

  EXPECT_EQ(plane.handle(get("/theme/AUTO")).status, 200);
  EXPECT_EQ(theme_.mode(), ThemeMode::kAuto);
}

TEST_F(ControlPlaneTest, UnknownThemeModeIsNotFound) {
  ControlPlane plane = makePlane();
  EXPECT_EQ(plane.handle(get("/theme/sepia")).status, 404);
  EXPECT_EQ(theme_.mode(), ThemeMode::kAuto);
}

TEST_F(ControlPlaneTest, ThemeWithoutThemeStateIsUnavailable) {
  ControlPlane plane(nav_, &scheduler_, nullptr, [this] { return now_; }, 100, {}, 50);
  EXPECT_EQ(plane.handle(get("/theme")).status, 503);
  EXPECT_EQ(plane.handle(get("/theme/day")).status, 503);
}

TEST_F(ControlPlaneTest, ScreenshotWithoutFrameIsUnavailable) {
  ControlPlane plane = makePlane();
  const ControlResponse resp = plane.handle(get("/screenshot"));
  EXPECT_EQ(resp.status, 503);
  EXPECT_EQ(resp.body, "No frame available");
}

TEST_F(ControlPlaneTest, ScreenshotReturnsLastFrameAsBmp) {
  ASSERT_TRUE(scheduler_.renderOnce());
  ControlPlane plane = makePlane();
  const ControlResponse resp = plane.handle(get("/screenshot"));
  EXPECT_EQ(resp.status, 200);
  EXPECT_EQ(resp.contentType, "image/bmp");
  EXPECT_EQ(header(resp, "Cache-Control"), "no-cache");
  ASSERT_NE(resp.frame, nullptr);
  EXPECT_EQ(resp.frame->pixel(0, 0), 0x07E0);
}

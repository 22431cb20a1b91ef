#include "platform/Platform.h"
#include "RuntimeSettings.h"
#include "ControlServerEspIdf.h"
#include "DisplayBootstrapEspIdf.h"
#include "DisplaySinkEspIdf.h"
#include "DisplaySpiEspIdf.h"
#include "TouchInputEspIdf.h"
#include "core/AppSettings.h"
#include "core/BootCommon.h"
#include "core/ControlPlane.h"
#include "core/GestureClassifier.h"
#include "core/NavigationState.h"
#include "core/RenderScheduler.h"
#include "core/ThemeState.h"
#include "core/TimeSync.h"
#include "core/TouchMapper.h"
#include "panels/Panels.h"
#include "platform/Fs.h"
#include "platform/Http.h"
#include "platform/Net.h"
#include "platform/Prefs.h"
#include "platform/Sync.h"
#include "services/HttpJsonClient.h"
#include "services/SolarCalc.h"
#include "services/WeatherService.h"
#include "AppConfig.h"

#include "esp_err.h"
#include "esp_event.h"
#include "esp_log.h"
#include "esp_netif.h"
#include "esp_sleep.h"
#include "esp_wifi.h"
#include "freertos/event_groups.h"
#include "freertos/task.h"
#include "nvs_flash.h"

#include <algorithm>
#include <atomic>
#include <cstring>
#include <ctime>
#include <memory>
#include <string>
#include <vector>

namespace {
constexpr const char* kTag = "sunpanel";
constexpr const char* kBootTag = "boot";
constexpr const char* kWifiTag = "wifi";
constexpr const char* kTouchTag = "touch";
constexpr const char* kNetTag = "net";
constexpr uint32_t kButtonPollMs = 20;
constexpr uint32_t kTaskJoinTimeoutMs = 4000;
constexpr int kMaxTouchBusErrors = 20;
constexpr EventBits_t kWifiConnectedBit = BIT0;
constexpr EventBits_t kWifiFailedBit = BIT1;

EventGroupHandle_t sWifiEventGroup = nullptr;
bool sWifiHandlersRegistered = false;

// Everything the tasks share. Allocated once in app_main and never freed;
// shutdown ends in deep sleep.
struct AppRuntime {
  AppSettings settings;
  boot::BaselineState baselineState;
  bool wifiReady = false;

  platform::WakeSignal renderWake;
  platform::WakeSignal networkWake;
  std::atomic<bool> shutdownRequested{false};
  platform::WakeSignal renderDone;
  platform::WakeSignal touchDone;
  platform::WakeSignal networkDone;
  bool renderTaskStarted = false;
  bool touchTaskStarted = false;
  bool networkTaskStarted = false;

  std::unique_ptr<SolarCalc> solar;
  std::unique_ptr<ThemeState> theme;
  std::unique_ptr<HttpJsonClient> http;
  std::unique_ptr<WeatherService> weather;
  std::unique_ptr<NavigationState> nav;
  std::unique_ptr<DefaultPanelRenderer> renderer;
  SpiDisplaySink sink;
  std::unique_ptr<RenderScheduler> scheduler;
  std::unique_ptr<ControlPlane> control;
  std::unique_ptr<TouchMapper> touchMapper;
  NavBarLayout navBar;
};

void initNvs() {
  esp_err_t err = nvs_flash_init();
  if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
    ESP_ERROR_CHECK(nvs_flash_erase());
    err = nvs_flash_init();
  }
  ESP_ERROR_CHECK(err);
}

void onWifiEvent(void* arg, esp_event_base_t eventBase, int32_t eventId, void* eventData) {
  (void)arg;
  (void)eventData;
  if (sWifiEventGroup == nullptr) {
    return;
  }

  if (eventBase == WIFI_EVENT) {
    if (eventId == WIFI_EVENT_STA_DISCONNECTED) {
      xEventGroupSetBits(sWifiEventGroup, kWifiFailedBit);
    }
  } else if (eventBase == IP_EVENT && eventId == IP_EVENT_STA_GOT_IP) {
    xEventGroupSetBits(sWifiEventGroup, kWifiConnectedBit);
  }
}

bool ensureWifiStackReady() {
  if (sWifiEventGroup == nullptr) {
    sWifiEventGroup = xEventGroupCreate();
    if (sWifiEventGroup == nullptr) {
      ESP_LOGE(kWifiTag, "event group alloc failed");
      return false;
    }
  }

  const esp_err_t loopErr = esp_event_loop_create_default();
  if (loopErr != ESP_OK && loopErr != ESP_ERR_INVALID_STATE) {
    ESP_LOGE(kWifiTag, "event loop init failed err=0x%x", static_cast<unsigned>(loopErr));
    return false;
  }

  if (esp_netif_get_handle_from_ifkey("WIFI_STA_DEF") == nullptr) {
    esp_netif_create_default_wifi_sta();
  }

  wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
  const esp_err_t initErr = esp_wifi_init(&cfg);
  if (initErr != ESP_OK && initErr != ESP_ERR_INVALID_STATE) {
    ESP_LOGE(kWifiTag, "wifi init failed err=0x%x", static_cast<unsigned>(initErr));
    return false;
  }

  if (!sWifiHandlersRegistered) {
    ESP_ERROR_CHECK(
        esp_event_handler_register(WIFI_EVENT, ESP_EVENT_ANY_ID, &onWifiEvent, nullptr));
    ESP_ERROR_CHECK(
        esp_event_handler_register(IP_EVENT, IP_EVENT_STA_GOT_IP, &onWifiEvent, nullptr));
    sWifiHandlersRegistered = true;
  }

  ESP_ERROR_CHECK(esp_wifi_set_storage(WIFI_STORAGE_FLASH));
  ESP_ERROR_CHECK(esp_wifi_set_mode(WIFI_MODE_STA));

  const esp_err_t startErr = esp_wifi_start();
  if (startErr != ESP_OK && startErr != ESP_ERR_WIFI_CONN) {
    ESP_LOGE(kWifiTag, "wifi start failed err=0x%x", static_cast<unsigned>(startErr));
    return false;
  }
  return true;
}

// Config file secrets win; otherwise the credentials saved in prefs ns=wifi.
bool applyStaConfig(const SecretSettings& secrets) {
  std::string ssid = secrets.wifiSsid;
  std::string pass = secrets.wifiPassword;
  const char* source = "config";
  if (ssid.empty()) {
    ssid = platform::prefs::getString("wifi", "ssid", "");
    pass = platform::prefs::getString("wifi", "password", "");
    source = "prefs";
  }
  if (ssid.empty()) {
    ESP_LOGW(kWifiTag, "no credentials in config or prefs; trying driver-stored config");
    return false;
  }
  wifi_config_t staConfig = {};
  const size_t ssidLen =
      std::min(ssid.size(), sizeof(staConfig.sta.ssid) - static_cast<size_t>(1));
  std::memcpy(staConfig.sta.ssid, ssid.data(), ssidLen);

  const size_t passLen =
      std::min(pass.size(), sizeof(staConfig.sta.password) - static_cast<size_t>(1));
  std::memcpy(staConfig.sta.password, pass.data(), passLen);
  esp_err_t cfgErr = esp_wifi_set_config(WIFI_IF_STA, &staConfig);
  if (cfgErr == ESP_ERR_WIFI_STATE) {
    ESP_LOGW(kWifiTag, "set_config while busy; disconnecting and retrying");
    (void)esp_wifi_disconnect();
    platform::sleepMs(80);
    cfgErr = esp_wifi_set_config(WIFI_IF_STA, &staConfig);
  }
  if (cfgErr != ESP_OK) {
    ESP_LOGE(kWifiTag, "set_config failed err=0x%x", static_cast<unsigned>(cfgErr));
    return false;
  }
  ESP_LOGI(kWifiTag, "credentials loaded source=%s ssid=%s", source, ssid.c_str());
  return true;
}

bool startWifiStation(const SecretSettings& secrets, uint32_t timeoutMs) {
  ESP_LOGI(kBootTag, "start wifi station");
  if (!ensureWifiStackReady()) {
    return false;
  }
  (void)esp_wifi_disconnect();
  (void)applyStaConfig(secrets);
  xEventGroupClearBits(sWifiEventGroup, kWifiConnectedBit | kWifiFailedBit);
  const esp_err_t connectErr = esp_wifi_connect();
  if (connectErr != ESP_OK) {
    ESP_LOGE(kWifiTag, "connect failed err=0x%x", static_cast<unsigned>(connectErr));
    return false;
  }

  const EventBits_t bits =
      xEventGroupWaitBits(sWifiEventGroup, kWifiConnectedBit | kWifiFailedBit, pdFALSE, pdFALSE,
                          pdMS_TO_TICKS(timeoutMs));
  if ((bits & kWifiConnectedBit) != 0) {
    ESP_LOGI(kWifiTag, "connected");
    return true;
  }
  ESP_LOGW(kWifiTag, "connect timeout/failed; continuing offline");
  return false;
}

void stopWifi() {
  (void)esp_wifi_disconnect();
  const esp_err_t err = esp_wifi_stop();
  if (err != ESP_OK && err != ESP_ERR_WIFI_NOT_INIT) {
    ESP_LOGW(kWifiTag, "stop err=0x%x", static_cast<unsigned>(err));
  }
}

boot::LoopSnapshot loopSnapshot(const AppRuntime& app) {
  boot::LoopSnapshot snap;
  platform::net::LinkStatus link;
  snap.wifiConnected = platform::net::linkStatus(link);
  snap.rssi = link.rssi;
  if (app.scheduler) {
    snap.renderCount = app.scheduler->renderCount();
    snap.renderFailures = app.scheduler->failureCount();
  }
  if (app.nav) {
    snap.panel = panelName(app.nav->current());
  }
  return snap;
}

size_t initialPanelIndex(const AppSettings& settings, size_t panelCount) {
  if (RuntimeSettings::lastPanel >= 0 &&
      static_cast<size_t>(RuntimeSettings::lastPanel) < panelCount) {
    return static_cast<size_t>(RuntimeSettings::lastPanel);
  }
  if (settings.appearance.defaultPanel >= 0 &&
      static_cast<size_t>(settings.appearance.defaultPanel) < panelCount) {
    return static_cast<size_t>(settings.appearance.defaultPanel);
  }
  return 0;
}

ThemeMode initialThemeMode(const AppSettings& settings) {
  if (RuntimeSettings::themeMode >= 0) {
    return static_cast<ThemeMode>(RuntimeSettings::themeMode);
  }
  return settings.appearance.themeMode;
}

void buildServices(AppRuntime& app) {
  const AppSettings& s = app.settings;
  app.solar = std::make_unique<SolarCalc>(s.location.latitude, s.location.longitude);
  app.theme = std::make_unique<ThemeState>(app.solar.get(), initialThemeMode(s),
                                           AppConfig::kThemeCacheTtlMs);

  app.http = std::make_unique<HttpJsonClient>(
      [](const std::string& url, uint32_t timeoutMs, platform::http::TextResponse& out) {
        return platform::http::getText(url.c_str(), timeoutMs, out);
      },
      AppConfig::kHttpTimeoutMs);

  WeatherConfig weatherConfig;
  weatherConfig.apiKey = s.secrets.openWeatherApiKey;
  weatherConfig.latitude = s.location.latitude;
  weatherConfig.longitude = s.location.longitude;
  weatherConfig.units = s.weather.units;
  weatherConfig.weatherEnabled = s.weather.enabled;
  weatherConfig.airQualityEnabled = s.airQuality.enabled;
  weatherConfig.weatherIntervalS = static_cast<uint32_t>(s.weather.updateIntervalS);
  weatherConfig.airQualityIntervalS = static_cast<uint32_t>(s.airQuality.updateIntervalS);
  HttpJsonClient* client = app.http.get();
  app.weather = std::make_unique<WeatherService>(
      weatherConfig, [client](const std::string& url, JsonDocument& doc, std::string* error) {
        return client->get(url, doc, error);
      });
  if (!app.weather->weatherEnabled()) {
    ESP_LOGW(kNetTag, "weather disabled (flag off or no api key)");
  }

  const std::vector<PanelId> panels = defaultPanelOrder();
  const size_t startIndex = initialPanelIndex(s, panels.size());
  app.nav = std::make_unique<NavigationState>(panels, startIndex, app.renderWake);
  boot::logSettingsSummary(panelName(panels[startIndex]));

  const uint16_t width = static_cast<uint16_t>(s.display.width);
  const uint16_t height = static_cast<uint16_t>(s.display.height);
  app.navBar = NavBarLayout::fromAppConfig(width, height, static_cast<uint16_t>(s.display.navBarHeight));

  PanelContext ctx;
  ctx.navBar = app.navBar;
  ctx.solar = app.solar.get();
  ctx.theme = app.theme.get();
  ctx.weather = app.weather.get();
  ctx.locationName = s.location.name;
  ctx.metricUnits = s.weather.units == "metric";
  ctx.use24HourClock = &RuntimeSettings::use24HourClock;
  ctx.wallClock = []() { return std::time(nullptr); };
  app.renderer = std::make_unique<DefaultPanelRenderer>(ctx);

  app.scheduler = std::make_unique<RenderScheduler>(*app.nav, *app.renderer, app.sink,
                                                    app.renderWake, width, height);

  ControlCredentials creds;
  creds.user = s.secrets.httpUser;
  creds.password = s.secrets.httpPassword;
  app.control = std::make_unique<ControlPlane>(
      *app.nav, app.scheduler.get(), app.theme.get(),
      static_cast<uint16_t>(s.httpServer.rateLimitPerSecond), creds,
      AppConfig::kScreenshotRenderTimeoutMs);

  app.touchMapper = std::make_unique<TouchMapper>(width, height, s.touch.calibration);
}

void renderTask(void* arg) {
  auto* app = static_cast<AppRuntime*>(arg);
  ESP_LOGI(kTag, "render task core=%d", static_cast<int>(xPortGetCoreID()));
  app->scheduler->run();
  ESP_LOGI(kTag, "render task exit renders=%u failures=%u",
           static_cast<unsigned>(app->scheduler->renderCount()),
           static_cast<unsigned>(app->scheduler->failureCount()));
  app->renderDone.notify();
  vTaskDelete(nullptr);
}

void applyGesture(AppRuntime& app, const Gesture& gesture) {
  const NavAction action = navActionFor(gesture, app.navBar);
  if (action == NavAction::kNone) {
    ESP_LOGD(kTouchTag, "gesture=%s reason=%s ignored", gestureName(gesture), gesture.reason);
    return;
  }
  const NavSnapshot snap = action == NavAction::kNext ? app.nav->next() : app.nav->prev();
  ESP_LOGI(kTouchTag, "gesture=%s x=%u y=%u panel=%s", gestureName(gesture),
           static_cast<unsigned>(gesture.x), static_cast<unsigned>(gesture.y),
           panelName(snap.panel));
}

// Polls the controller and replays it as a down / axis samples / up stream.
void touchTask(void* arg) {
  auto* app = static_cast<AppRuntime*>(arg);
  GestureClassifier classifier(*app->touchMapper, app->settings.touch.gesture);
  bool pressed = false;
  int busErrors = 0;
  Gesture gesture;

  while (!app->shutdownRequested.load()) {
    touch_input::RawSample sample;
    const touch_input::ReadResult result = touch_input::read(sample);
    const uint32_t nowMs = platform::millisMs();

    if (result == touch_input::ReadResult::kBusError) {
      if (++busErrors >= kMaxTouchBusErrors) {
        ESP_LOGE(kTouchTag, "bus errors=%d; touch input stopped", busErrors);
        break;
      }
      platform::sleepMs(AppConfig::kTouchPollMs);
      continue;
    }
    busErrors = 0;

    if (result == touch_input::ReadResult::kPressed) {
      if (!pressed) {
        pressed = true;
        (void)classifier.onEvent(TouchEvent::down(nowMs), gesture);
      }
      (void)classifier.onEvent(TouchEvent::axisSample(TouchAxis::kX, sample.rawX, nowMs), gesture);
      (void)classifier.onEvent(TouchEvent::axisSample(TouchAxis::kY, sample.rawY, nowMs), gesture);
    } else if (pressed) {
      pressed = false;
      if (classifier.onEvent(TouchEvent::up(nowMs), gesture)) {
        applyGesture(*app, gesture);
      }
    }
    platform::sleepMs(AppConfig::kTouchPollMs);
  }

  touch_input::release();
  app->touchDone.notify();
  vTaskDelete(nullptr);
}

// Fills the weather caches off the render path; panels only peek.
void networkTask(void* arg) {
  auto* app = static_cast<AppRuntime*>(arg);
  while (!app->shutdownRequested.load()) {
    if (platform::net::isConnected()) {
      if (app->weather->weatherEnabled()) {
        (void)app->weather->weather();
      }
      if (app->weather->airQualityEnabled()) {
        (void)app->weather->airQuality();
      }
    }
    (void)app->networkWake.wait(AppConfig::kNetworkTaskPeriodMs);
  }
  app->networkDone.notify();
  vTaskDelete(nullptr);
}

bool startTask(TaskFunction_t fn, const char* name, uint32_t stack, UBaseType_t priority,
               AppRuntime* app, BaseType_t core) {
  if (xTaskCreatePinnedToCore(fn, name, stack, app, priority, nullptr, core) != pdPASS) {
    ESP_LOGE(kTag, "task start failed name=%s", name);
    return false;
  }
  return true;
}

void joinTask(platform::WakeSignal& done, bool started, const char* name) {
  if (started && !done.wait(kTaskJoinTimeoutMs)) {
    ESP_LOGW(kTag, "task join timeout name=%s", name);
  }
}

// Orderly stop: every task sees the flag, the server stops accepting, the
// active panel and theme are saved, the panel sleeps, then deep sleep until
// the BOOT button is pressed again.
[[noreturn]] void shutdown(AppRuntime& app) {
  ESP_LOGI(kTag, "shutdown requested");
  app.shutdownRequested.store(true);
  control_server::stop();
  app.scheduler->requestStop();
  app.networkWake.notify();

  joinTask(app.renderDone, app.renderTaskStarted, "render");
  joinTask(app.touchDone, app.touchTaskStarted, "touch");
  joinTask(app.networkDone, app.networkTaskStarted, "network");

  RuntimeSettings::lastPanel = static_cast<int32_t>(app.nav->index());
  RuntimeSettings::themeMode = static_cast<int8_t>(app.theme->mode());
  RuntimeSettings::save();

  stopWifi();
  if (!display_spi::sleep()) {
    ESP_LOGW(kTag, "display sleep failed");
  }
  display_bootstrap::setBacklight(false);
  ESP_LOGI(kTag, "entering deep sleep");
  platform::sleepMs(100);

  if (!display_bootstrap::armWakeOnUserButton()) {
    ESP_LOGW(kTag, "no wake source; only reset will restart");
  }
  esp_deep_sleep_start();
}

}  // namespace

extern "C" void app_main() {
  auto* app = new AppRuntime();
  boot::start(app->baselineState, AppConfig::kBaselineMetricsEnabled);
  initNvs();
  ESP_ERROR_CHECK(esp_netif_init());

  ESP_LOGI(kTag, "SunPanel boot");
  // The render tick and request lines are debug level; the IDF HTTP client
  // logs every redirect and header at info.
  platform::setLogLevel("HTTP_CLIENT", platform::LogLevel::kWarn);
  platform::setLogLevel("httpd_txrx", platform::LogLevel::kWarn);
  boot::mark(app->baselineState, "setup_start");
  RuntimeSettings::load();
  const bool fsReady = platform::fs::mount(true);
  ESP_LOGI(kBootTag, "littlefs=%d", fsReady ? 1 : 0);

  std::vector<std::string> configErrors;
  if (!AppSettings::loadFromFile(AppConfig::kConfigPath, app->settings, &configErrors)) {
    for (const std::string& error : configErrors) {
      ESP_LOGE("config", "%s", error.c_str());
    }
    ESP_LOGW("config", "config rejected path=%s; using defaults", AppConfig::kConfigPath);
    app->settings = AppSettings::defaults();
  }
  timesync::applyTimezone(app->settings.location.timezone.c_str());
  boot::mark(app->baselineState, "config_ready");

  ESP_LOGI(kBootTag, "init backlight + TFT");
  display_bootstrap::initPins();
  display_bootstrap::initUserButton();
  display_spi::PanelOptions panelOptions;
  panelOptions.rotation = static_cast<uint8_t>(app->settings.display.rotation);
  panelOptions.bgr = app->settings.display.colorBgr;
  panelOptions.invert = app->settings.display.invertColors;
  if (!display_spi::init()) {
    ESP_LOGE(kBootTag, "TFT SPI init failed");
  } else if (!display_spi::initPanel(panelOptions)) {
    ESP_LOGE(kBootTag, "TFT panel init failed");
  } else if (!display_spi::clear(0x0000)) {
    ESP_LOGE(kBootTag, "TFT clear failed");
  }
  app->sink.invalidate();
  if (display_spi::width() != app->settings.display.width ||
      display_spi::height() != app->settings.display.height) {
    ESP_LOGW(kBootTag, "display %dx%d does not match panel %ux%u at rotation %d; frames rejected",
             app->settings.display.width, app->settings.display.height, display_spi::width(),
             display_spi::height(), app->settings.display.rotation);
  }
  boot::mark(app->baselineState, "tft_ready");

  app->wifiReady = startWifiStation(app->settings.secrets, AppConfig::kWifiConnectTimeoutMs);
  platform::net::LinkStatus link;
  if (app->wifiReady && platform::net::linkStatus(link)) {
    ESP_LOGI(kWifiTag, "connected ssid=%s ip=%s rssi=%d", link.ssid.c_str(), link.ip.c_str(),
             link.rssi);
  }
  boot::mark(app->baselineState, "wifi_ready");

  if (app->wifiReady) {
    (void)timesync::ensureUtcTime();
  }
  boot::mark(app->baselineState, "time_ready");

  buildServices(*app);
  boot::mark(app->baselineState, "services_ready");

  app->renderTaskStarted = startTask(renderTask, "render", 8192, 4, app, 1);
  if (app->settings.touch.enabled && AppConfig::kTouchEnabled) {
    touch_input::Options touchOptions;
    touchOptions.pressureThreshold = static_cast<uint16_t>(app->settings.touch.pressureThreshold);
    touchOptions.samplesPerAxis = AppConfig::kTouchSamplesPerAxis;
    if (touch_input::init(touchOptions)) {
      app->touchTaskStarted = startTask(touchTask, "touch", 4096, 5, app, 1);
    } else {
      ESP_LOGE(kTouchTag, "touch init failed; navigation via HTTP only");
    }
  }
  app->networkTaskStarted = startTask(networkTask, "network", 8192, 3, app, 0);

  if (app->settings.httpServer.enabled && app->wifiReady) {
    (void)control_server::start(static_cast<uint16_t>(app->settings.httpServer.port),
                                *app->control);
  }
  ESP_LOGI(kBootTag, "setup complete");
  boot::mark(app->baselineState, "setup_complete");

  display_bootstrap::ButtonHold shutdownHold(AppConfig::kShutdownHoldMs);
  for (;;) {
    platform::sleepMs(kButtonPollMs);
    if (shutdownHold.update(display_bootstrap::userButtonPressed(), platform::millisMs())) {
      shutdown(*app);
    }

    (void)boot::markLoop(app->baselineState, loopSnapshot(*app),
                         AppConfig::kBaselineLoopLogPeriodMs);
  }
}

#include "platform/Http.h"

#include "esp_crt_bundle.h"
#include "esp_http_client.h"
#include "esp_log.h"

namespace {
constexpr const char* kTag = "http";
constexpr size_t kMaxBodyBytes = 48 * 1024;
}  // namespace

namespace platform::http {

bool getText(const char* url, uint32_t timeoutMs, TextResponse& out) {
  out = {};
  if (url == nullptr || *url == '\0') {
    out.reason = "url-empty";
    return false;
  }

  esp_http_client_config_t cfg = {};
  cfg.url = url;
  cfg.method = HTTP_METHOD_GET;
  cfg.timeout_ms = static_cast<int>(timeoutMs);
  cfg.buffer_size = 1024;
  cfg.crt_bundle_attach = esp_crt_bundle_attach;
  cfg.user_agent = "SunPanel-IDF/1.0";

  esp_http_client_handle_t client = esp_http_client_init(&cfg);
  if (client == nullptr) {
    out.reason = "client-init";
    return false;
  }

  bool ok = false;
  const esp_err_t err = esp_http_client_open(client, 0);
  if (err == ESP_OK) {
    (void)esp_http_client_fetch_headers(client);
    out.statusCode = esp_http_client_get_status_code(client);
    out.body.reserve(1024);
    char buf[384];
    for (;;) {
      const int n = esp_http_client_read(client, buf, sizeof(buf));
      if (n > 0) {
        out.body.append(buf, static_cast<size_t>(n));
        if (out.body.size() > kMaxBodyBytes) {
          out.reason = "body-too-large";
          break;
        }
        continue;
      }
      if (n == 0) {
        ok = true;
      } else {
        out.reason = "read";
      }
      break;
    }
  } else {
    out.reason = esp_err_to_name(err);
  }

  if (!ok) {
    ESP_LOGW(kTag, "get failed status=%d reason=%s", out.statusCode, out.reason.c_str());
  }
  esp_http_client_close(client);
  esp_http_client_cleanup(client);
  return ok;
}

}  // namespace platform::http

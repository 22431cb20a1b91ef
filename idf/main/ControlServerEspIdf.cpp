#include "ControlServerEspIdf.h"

#include "core/BmpEncoder.h"
#include "core/ControlPlane.h"

#include "esp_http_server.h"
#include "esp_log.h"

#include <cstdio>
#include <string>
#include <utility>

namespace {
constexpr const char* kTag = "http";
constexpr size_t kChunkBytes = 4096;

httpd_handle_t sServer = nullptr;

const char* methodName(int method) {
  switch (method) {
    case HTTP_GET:
      return "GET";
    case HTTP_POST:
      return "POST";
    case HTTP_PUT:
      return "PUT";
    case HTTP_DELETE:
      return "DELETE";
    default:
      return "OTHER";
  }
}

const char* reasonPhrase(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 401:
      return "Unauthorized";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 429:
      return "Too Many Requests";
    case 500:
      return "Internal Server Error";
    case 503:
      return "Service Unavailable";
    default:
      return "";
  }
}

bool readAuthorization(httpd_req_t* req, std::string& out) {
  const size_t len = httpd_req_get_hdr_value_len(req, "Authorization");
  if (len == 0) {
    return false;
  }
  std::string value(len + 1, '\0');
  if (httpd_req_get_hdr_value_str(req, "Authorization", &value[0], value.size()) != ESP_OK) {
    return false;
  }
  value.resize(len);
  out = std::move(value);
  return true;
}

esp_err_t streamBmp(httpd_req_t* req, const Frame& frame) {
  std::string chunk;
  chunk.reserve(kChunkBytes + static_cast<size_t>(frame.width()) * 2U);
  bmp::encodeHeader(frame, chunk);
  for (uint16_t y = 0; y < frame.height(); ++y) {
    bmp::encodeRow(frame, y, chunk);
    if (chunk.size() >= kChunkBytes) {
      const esp_err_t err = httpd_resp_send_chunk(req, chunk.data(), chunk.size());
      if (err != ESP_OK) {
        ESP_LOGW(kTag, "screenshot stream aborted err=0x%x", static_cast<unsigned>(err));
        return err;
      }
      chunk.clear();
    }
  }
  if (!chunk.empty()) {
    const esp_err_t err = httpd_resp_send_chunk(req, chunk.data(), chunk.size());
    if (err != ESP_OK) {
      return err;
    }
  }
  return httpd_resp_send_chunk(req, nullptr, 0);
}

esp_err_t handleRequest(httpd_req_t* req) {
  auto* plane = static_cast<ControlPlane*>(req->user_ctx);
  ControlRequest request;
  request.method = methodName(req->method);
  request.path = req->uri;
  (void)readAuthorization(req, request.authorization);

  const ControlResponse response = plane->handle(request);

  char status[48];
  std::snprintf(status, sizeof(status), "%d %s", response.status, reasonPhrase(response.status));
  httpd_resp_set_status(req, status);
  httpd_resp_set_type(req, response.contentType.c_str());
  for (const auto& header : response.headers) {
    httpd_resp_set_hdr(req, header.first.c_str(), header.second.c_str());
  }

  ESP_LOGD(kTag, "%s %s -> %d", request.method.c_str(), request.path.c_str(), response.status);
  if (response.frame) {
    return streamBmp(req, *response.frame);
  }
  return httpd_resp_send(req, response.body.data(), static_cast<ssize_t>(response.body.size()));
}

}  // namespace

namespace control_server {

bool start(uint16_t port, ControlPlane& plane) {
  if (sServer != nullptr) {
    return true;
  }
  httpd_config_t config = HTTPD_DEFAULT_CONFIG();
  config.server_port = port;
  config.ctrl_port = static_cast<uint16_t>(port + 1);
  config.uri_match_fn = httpd_uri_match_wildcard;
  config.stack_size = 8192;
  config.lru_purge_enable = true;

  const esp_err_t err = httpd_start(&sServer, &config);
  if (err != ESP_OK) {
    ESP_LOGE(kTag, "server start failed port=%u err=0x%x", static_cast<unsigned>(port),
             static_cast<unsigned>(err));
    sServer = nullptr;
    return false;
  }

  static constexpr httpd_method_t kMethods[] = {HTTP_GET, HTTP_POST, HTTP_PUT, HTTP_DELETE};
  for (const httpd_method_t method : kMethods) {
    httpd_uri_t uri = {};
    uri.uri = "/*";
    uri.method = method;
    uri.handler = handleRequest;
    uri.user_ctx = &plane;
    if (httpd_register_uri_handler(sServer, &uri) != ESP_OK) {
      ESP_LOGW(kTag, "handler register failed method=%s", methodName(method));
    }
  }
  ESP_LOGI(kTag, "control server listening port=%u", static_cast<unsigned>(port));
  return true;
}

void stop() {
  if (sServer == nullptr) {
    return;
  }
  const esp_err_t err = httpd_stop(sServer);
  if (err != ESP_OK) {
    ESP_LOGW(kTag, "server stop err=0x%x", static_cast<unsigned>(err));
  }
  sServer = nullptr;
  ESP_LOGI(kTag, "control server stopped");
}

bool running() { return sServer != nullptr; }

}  // namespace control_server

#pragma once

#include <cstdint>

class ControlPlane;

// esp_http_server front end for ControlPlane. One wildcard handler per
// method; screenshots are streamed as chunked BMP.
namespace control_server {

bool start(uint16_t port, ControlPlane& plane);
void stop();
bool running();

}  // namespace control_server

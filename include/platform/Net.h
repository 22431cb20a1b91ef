#pragma once

#include <string>

namespace platform::net {

struct LinkStatus {
  bool connected = false;
  int rssi = 0;
  std::string ssid;
  std::string ip;
};

// False (and a default status) while the station is not associated.
bool linkStatus(LinkStatus& out);
bool isConnected();

}  // namespace platform::net

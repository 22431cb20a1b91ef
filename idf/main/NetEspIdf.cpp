#include "platform/Net.h"

#include <arpa/inet.h>

#include <cstring>

#include "esp_netif.h"
#include "esp_wifi.h"

namespace platform::net {
namespace {

bool readStationIp(std::string& out) {
  esp_netif_t* netif = esp_netif_get_handle_from_ifkey("WIFI_STA_DEF");
  if (netif == nullptr) {
    return false;
  }
  esp_netif_ip_info_t ipInfo = {};
  if (esp_netif_get_ip_info(netif, &ipInfo) != ESP_OK || ipInfo.ip.addr == 0) {
    return false;
  }
  char buf[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &ipInfo.ip.addr, buf, sizeof(buf)) == nullptr) {
    return false;
  }
  out.assign(buf);
  return true;
}

}  // namespace

bool linkStatus(LinkStatus& out) {
  out = LinkStatus();
  wifi_ap_record_t apInfo = {};
  if (esp_wifi_sta_get_ap_info(&apInfo) != ESP_OK) {
    return false;
  }
  out.rssi = apInfo.rssi;
  out.ssid.assign(reinterpret_cast<const char*>(apInfo.ssid),
                  strnlen(reinterpret_cast<const char*>(apInfo.ssid), sizeof(apInfo.ssid)));
  // Associated but still waiting for DHCP counts as not connected.
  out.connected = readStationIp(out.ip);
  return out.connected;
}

bool isConnected() {
  LinkStatus status;
  return linkStatus(status);
}

}  // namespace platform::net

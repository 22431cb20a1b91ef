#include "platform/Fs.h"

#include <cstdio>
#include <cstring>
#include <memory>
#include <sys/stat.h>

#include "esp_littlefs.h"
#include "esp_log.h"

namespace {
constexpr const char* kTag = "fs";
constexpr char kMountPoint[] = "/littlefs";
constexpr const char* kPartitionLabel = "storage";
bool sMounted = false;

struct FileCloser {
  void operator()(FILE* f) const {
    if (f != nullptr) {
      std::fclose(f);
    }
  }
};

std::string resolve(const char* input) {
  if (input == nullptr || input[0] == '\0') {
    return std::string();
  }
  const size_t mountLen = sizeof(kMountPoint) - 1;
  if (std::strncmp(input, kMountPoint, mountLen) == 0 &&
      (input[mountLen] == '/' || input[mountLen] == '\0')) {
    return input;
  }
  std::string full(kMountPoint);
  if (input[0] != '/') {
    full.push_back('/');
  }
  full.append(input);
  return full;
}
}  // namespace

namespace platform::fs {

bool mount(bool formatOnFail) {
  if (sMounted) {
    return true;
  }
  esp_vfs_littlefs_conf_t conf = {};
  conf.base_path = kMountPoint;
  conf.partition_label = kPartitionLabel;
  conf.format_if_mount_failed = formatOnFail;
  conf.dont_mount = false;
  const esp_err_t err = esp_vfs_littlefs_register(&conf);
  if (err != ESP_OK) {
    ESP_LOGE(kTag, "mount %s failed err=%s", kPartitionLabel, esp_err_to_name(err));
    return false;
  }
  sMounted = true;

  Usage u;
  if (usage(u)) {
    ESP_LOGI(kTag, "mounted %s used=%u/%u", kMountPoint, static_cast<unsigned>(u.usedBytes),
             static_cast<unsigned>(u.totalBytes));
  }
  return true;
}

bool exists(const char* path) {
  const std::string full = resolve(path);
  struct stat st = {};
  return !full.empty() && stat(full.c_str(), &st) == 0;
}

bool readFile(const char* path, std::string& out, size_t maxBytes) {
  out.clear();
  const std::string full = resolve(path);
  struct stat st = {};
  if (full.empty() || stat(full.c_str(), &st) != 0) {
    return false;
  }
  if (static_cast<size_t>(st.st_size) > maxBytes) {
    ESP_LOGW(kTag, "file too large path=%s bytes=%u max=%u", full.c_str(),
             static_cast<unsigned>(st.st_size), static_cast<unsigned>(maxBytes));
    return false;
  }

  std::unique_ptr<FILE, FileCloser> f(std::fopen(full.c_str(), "rb"));
  if (!f) {
    return false;
  }
  out.resize(static_cast<size_t>(st.st_size));
  const size_t n = out.empty() ? 0 : std::fread(&out[0], 1, out.size(), f.get());
  if (n != out.size() || std::ferror(f.get()) != 0) {
    ESP_LOGW(kTag, "short read path=%s got=%u", full.c_str(), static_cast<unsigned>(n));
    out.clear();
    return false;
  }
  return true;
}

bool usage(Usage& out) {
  out = Usage();
  if (!sMounted) {
    return false;
  }
  size_t total = 0;
  size_t used = 0;
  if (esp_littlefs_info(kPartitionLabel, &total, &used) != ESP_OK) {
    return false;
  }
  out.totalBytes = total;
  out.usedBytes = used;
  return true;
}

}  // namespace platform::fs

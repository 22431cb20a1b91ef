#pragma once

#include <cstddef>
#include <string>

// Data partition holding config.json. On the device "/x" and "x" resolve
// under the LittleFS mount; the host uses paths as given.
namespace platform::fs {

struct Usage {
  size_t totalBytes = 0;
  size_t usedBytes = 0;
};

constexpr size_t kDefaultMaxFileBytes = 16 * 1024;

bool mount(bool formatOnFail);
bool exists(const char* path);
// Fails (and leaves out empty) when the file is larger than maxBytes.
bool readFile(const char* path, std::string& out, size_t maxBytes = kDefaultMaxFileBytes);
bool usage(Usage& out);

}  // namespace platform::fs

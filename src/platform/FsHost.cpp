#include "platform/Fs.h"

#include <fstream>
#include <iterator>
#include <sys/stat.h>

namespace platform::fs {

bool mount(bool formatOnFail) {
  (void)formatOnFail;
  return true;
}

bool exists(const char* path) {
  if (path == nullptr || *path == '\0') {
    return false;
  }
  struct stat st = {};
  return stat(path, &st) == 0;
}

bool readFile(const char* path, std::string& out, size_t maxBytes) {
  out.clear();
  struct stat st = {};
  if (path == nullptr || *path == '\0' || stat(path, &st) != 0) {
    return false;
  }
  if (static_cast<size_t>(st.st_size) > maxBytes) {
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

bool usage(Usage& out) {
  out = Usage();
  return false;
}

}  // namespace platform::fs

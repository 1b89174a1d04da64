#include "TimeFormat.hpp"

#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace fam {

std::string isoLocal(std::time_t t) {
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return buf;
}

std::string isoNow() {
  return isoLocal(std::time(nullptr));
}

std::string fileModificationDate(const std::filesystem::path& file) {
  struct stat st{};
  if (::stat(file.c_str(), &st) != 0) {
    throw std::runtime_error("stat failed: " + file.string() + ": " + std::strerror(errno));
  }
  return isoLocal(st.st_mtime);
}

std::string compactTimestamp(const std::string& iso) {
  std::string out;
  for (char c : iso) {
    if (c == 'T') out.push_back('_');
    else if (c != '-' && c != ':') out.push_back(c);
  }
  return out;
}

} // namespace fam

#include "MediaFiles.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <string>
#include <system_error>

namespace fam {

namespace fs = std::filesystem;

static const std::set<std::string> kPhotoExtensions = {
  ".jpg", ".jpeg", ".png", ".heic", ".tiff", ".bmp",
  ".gif", ".webp", ".nef", ".nrw",
};
static const std::set<std::string> kVideoExtensions = {
  ".mp4", ".mov", ".avi", ".mkv", ".wmv", ".m4v",
};

static std::string lowerExtension(const fs::path& file) {
  std::string ext = file.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

// Consecutive walk errors tolerated before a tree is abandoned.
static constexpr int kMaxWalkFailures = 100;

static bool isHidden(const fs::path& p) {
  const std::string name = p.filename().string();
  return !name.empty() && name[0] == '.';
}

bool isSupportedMedia(const fs::path& file) {
  const std::string ext = lowerExtension(file);
  return kPhotoExtensions.count(ext) > 0 || kVideoExtensions.count(ext) > 0;
}

MediaType classifyMedia(const fs::path& file) {
  return kVideoExtensions.count(lowerExtension(file)) ? MediaType::Video : MediaType::Photo;
}

std::vector<fs::path> discoverMediaFiles(const fs::path& root) {
  std::vector<fs::path> files;
  std::error_code ec;
  if (!fs::is_directory(root, ec)) return files;

  int failures = 0;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  fs::recursive_directory_iterator end;
  while (it != end) {
    if (ec) {
      spdlog::warn("skipping entry under {}: {}", root.string(), ec.message());
      if (++failures > kMaxWalkFailures) {
        spdlog::error("giving up on {} after {} walk errors", root.string(), failures);
        break;
      }
      ec.clear();
      it.increment(ec);
      continue;
    }
    const fs::path& path = it->path();
    std::error_code statEc;
    if (isHidden(path)) {
      if (it->is_directory(statEc)) it.disable_recursion_pending();
    } else if (it->is_regular_file(statEc)) {
      if (isSupportedMedia(path)) files.push_back(path);
    } else if (statEc) {
      spdlog::warn("skipping {}: {}", path.string(), statEc.message());
    }
    it.increment(ec);
  }
  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

} // namespace fam

#include "ArchiveStore.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace fam {

std::filesystem::path ArchiveStore::put(const std::filesystem::path& source,
                                        const std::string& archiveDir,
                                        const std::string& filename) {
  namespace fs = std::filesystem;
  fs::path dir = root_ / archiveDir;
  fs::create_directories(dir);
  fs::path file = dir / filename;
  if (fs::exists(file)) {
    throw CollisionError("refusing to overwrite archive file " + file.string());
  }

  fs::path staging = dir / ("." + filename + ".partial");
  fs::copy_file(source, staging, fs::copy_options::overwrite_existing);
  try {
    fs::last_write_time(staging, fs::last_write_time(source));
    fs::rename(staging, file);
  } catch (...) {
    std::error_code ec;
    fs::remove(staging, ec);
    throw;
  }
  return file;
}

void ArchiveStore::discard(const std::string& archiveDir, const std::string& filename) {
  std::error_code ec;
  const auto file = pathFor(archiveDir, filename);
  std::filesystem::remove(file, ec);
  if (ec) spdlog::error("could not remove {} after failed index write: {}", file.string(), ec.message());
}

} // namespace fam

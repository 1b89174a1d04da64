#pragma once
#include <filesystem>
#include <string>
#include <utility>

namespace fam {

class ArchiveStore {
public:
  explicit ArchiveStore(std::filesystem::path root) : root_(std::move(root)) {}

  const std::filesystem::path& root() const { return root_; }

  std::filesystem::path pathFor(const std::string& archiveDir, const std::string& filename) const {
    return root_ / archiveDir / filename;
  }

  // Copies source into root/archiveDir/filename via a hidden staging file and
  // a rename, keeping the source's modification time; returns the full path.
  // Never overwrites: an occupied target throws CollisionError.
  std::filesystem::path put(const std::filesystem::path& source,
                            const std::string& archiveDir,
                            const std::string& filename);

  // Undo of put() after a failed index write.
  void discard(const std::string& archiveDir, const std::string& filename);

private:
  std::filesystem::path root_;
};

} // namespace fam

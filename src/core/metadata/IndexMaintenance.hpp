#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace fam {

class MediaIndex;

// Copies the index to "<stem>_<YYYYMMDD_HHMMSS><ext>" beside it using the
// SQLite online backup API. Returns nullopt when there is no index yet.
std::optional<std::filesystem::path> backupIndex(const std::filesystem::path& dbPath);

struct MergeStats {
  int media_added = 0;
  int media_matched = 0;       // fingerprint already indexed
  int location_conflicts = 0;  // archive location held by other content, not merged
  int sources_added = 0;
  int tags_attached = 0;
};

// Folds the records of another index (e.g. one written by a session on a
// second machine) into `target`, keyed by fingerprint. Sources and tags are
// unioned onto matched records. Runs as one transaction.
MergeStats mergeIndex(MediaIndex& target, const std::filesystem::path& otherDbPath);

} // namespace fam

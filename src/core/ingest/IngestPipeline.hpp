#pragma once
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "FolderTagger.hpp"
#include "MetadataProbe.hpp"
#include "core/concurrency/HashWorkerPool.hpp"
#include "core/hashing/Hasher.hpp"
#include "core/metadata/MediaIndex.hpp"
#include "core/storage/ArchiveStore.hpp"
#include "core/storage/PlacementResolver.hpp"

namespace fam {

enum class TransferMode { Copy, Move };

struct IngestOptions {
  TransferMode             mode = TransferMode::Copy;
  std::vector<std::string> stop_words;
  std::size_t              hash_workers = 1;  // >1 hashes ahead on a pool; placement stays ordered
  std::string              session_ts;        // ISO-8601; now when empty
};

enum class FileOutcome { Imported, Duplicate, Error };

// Audit summary of one session.
struct SessionStats {
  int imported = 0;
  int duplicates = 0;
  int tags_added = 0;
  int errors = 0;
  std::vector<std::string> error_details;
};

// Per source folder: derived tags and how many files were seen there.
struct FolderSummary {
  std::vector<std::string> tags;
  int                      file_count = 0;
};

// Drives hash -> dedup -> place-or-skip -> provenance -> tags for source trees.
// Single-threaded apart from optional hash prefetching: discovery order alone
// decides which file gets a contested name. One pipeline per session; the
// caller ensures no other session writes the same archive concurrently.
class IngestPipeline {
public:
  IngestPipeline(MediaIndex& index,
                 ArchiveStore& store,
                 const Hasher& hasher,
                 MetadataProbe& probe,
                 IngestOptions options,
                 TagPrompt prompt = nullptr);

  // Ingests every supported file under sourceRoot. Per-file failures are
  // counted and logged; CollisionError aborts.
  void ingestTree(const std::filesystem::path& sourceRoot);

  // Ingests one file found under sourceRoot whose hash outcome is known.
  FileOutcome ingestFile(const std::filesystem::path& sourceRoot, const HashOutcome& hashed);

  const SessionStats& stats() const { return stats_; }
  const std::string& sessionTimestamp() const { return options_.session_ts; }

  // Keyed "<root folder name>/<relative folder>", or the root folder name
  // for files directly in a root.
  const std::map<std::string, FolderSummary>& folders() const { return folders_; }

private:
  // What placeNew did on disk and in the scratch, so a failed transaction
  // can undo exactly that.
  struct StagedPlacement {
    std::string dir;
    std::string name;
    bool        created = false;
    bool        claimed = false;
  };

  MediaRecord placeNew(const std::filesystem::path& file, const std::string& fingerprint, StagedPlacement& staged);
  void learnClaim(const std::string& archiveDir, const std::string& filename, NameClaims& claims);
  void recordError(const std::filesystem::path& file, const std::string& fingerprint, const std::string& cause);
  static std::string folderKey(const std::filesystem::path& root, const std::filesystem::path& dir);

  MediaIndex&      index_;
  ArchiveStore&    store_;
  const Hasher&    hasher_;
  MetadataProbe&   probe_;
  IngestOptions    options_;
  FolderTagger     tagger_;
  PlacementScratch scratch_;
  SessionStats     stats_;
  std::map<std::string, FolderSummary> folders_;
};

} // namespace fam

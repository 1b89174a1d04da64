#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "core/concurrency/HashWorkerPool.hpp"
#include "core/hashing/Hasher.hpp"

namespace fam {

class MediaIndex;

// -------- path reconciliation --------

struct PathReport {
  std::vector<std::string> missing;    // recorded in the index, no file
  std::vector<std::string> untracked;  // file on disk, no record
  bool clean() const { return missing.empty() && untracked.empty(); }
};

// Compares relative media paths under archiveRoot with the recorded archive
// paths. Single-threaded, reads no file contents.
PathReport reconcilePaths(const std::filesystem::path& archiveRoot, const MediaIndex& index);

// -------- hash reconciliation --------

struct FileEntry {
  std::string path;         // relative to the archive root
  std::string fingerprint;
};

struct MovedEntry {
  std::string fingerprint;
  std::string expected_path;  // as recorded
  std::string found_path;     // where the content is now
};

struct ChangedEntry {
  std::string path;
  std::string expected_fingerprint;
  std::string found_fingerprint;
};

struct HashErrorEntry {
  std::string path;
  std::string reason;
  int         attempts = 1;
};

struct HashReport {
  std::vector<FileEntry>      untracked;         // content unknown to the index
  std::vector<MovedEntry>     moved;             // content intact, path drifted
  std::vector<FileEntry>      missing;           // recorded content found nowhere
  std::vector<ChangedEntry>   changed;           // recorded path holds other, unknown content
  std::vector<FileEntry>      duplicate_copies;  // extra copies of intact recorded content
  std::vector<HashErrorEntry> errors;            // could not be hashed; never counted as missing
  std::size_t files_checked = 0;
  std::size_t files_matched = 0;                 // content known to the index
  std::size_t index_records = 0;

  bool clean() const {
    return untracked.empty() && moved.empty() && missing.empty() && changed.empty() &&
           duplicate_copies.empty() && errors.empty();
  }
};

// Delivered on the coordinating thread as each file's hash lands.
struct HashProgress {
  std::size_t        done;
  std::size_t        total;
  const std::string& path;       // relative
  const HashOutcome& outcome;
  bool               indexed;    // fingerprint is known to the index
};
using HashProgressFn = std::function<void(const HashProgress&)>;

// Rehashes every media file under archiveRoot on `workers` threads and diffs
// the result against the index, which is only read. Classification happens
// once all results are in, so completion order never changes the report.
HashReport reconcileHashes(const std::filesystem::path& archiveRoot,
                           const MediaIndex& index,
                           const Hasher& hasher,
                           std::size_t workers,
                           const HashProgressFn& onProgress = nullptr);

// -------- manifest --------

struct ManifestStats {
  std::size_t files = 0;
  std::size_t errors = 0;
};

// One "relpath,fingerprint" (or "relpath,ERROR: reason") line per media file
// under root, in sorted path order whatever order the workers finish in.
ManifestStats writeHashManifest(const std::filesystem::path& root,
                                std::ostream& out,
                                const Hasher& hasher,
                                std::size_t workers,
                                const HashProgressFn& onProgress = nullptr);

// -------- reports --------

// CSV: kind,path,detail,fingerprint
void writeReconcileReport(const HashReport& report, std::ostream& out);
void writePathReport(const PathReport& report, std::ostream& out);

// SUMMARY block through the logger.
void logHashSummary(const HashReport& report);

} // namespace fam

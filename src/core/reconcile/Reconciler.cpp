#include "Reconciler.hpp"
#include "core/metadata/MediaIndex.hpp"
#include "core/storage/MediaFiles.hpp"
#include "core/util/Csv.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <spdlog/spdlog.h>

namespace fam {

namespace fs = std::filesystem;

static std::string relativeTo(const fs::path& root, const fs::path& file) {
  return file.lexically_relative(root).generic_string();
}

PathReport reconcilePaths(const fs::path& archiveRoot, const MediaIndex& index) {
  std::set<std::string> onDisk;
  for (const auto& f : discoverMediaFiles(archiveRoot)) onDisk.insert(relativeTo(archiveRoot, f));

  std::set<std::string> recorded;
  for (const auto& loc : index.allMediaWithLocations()) recorded.insert(loc.archive_path);

  PathReport report;
  std::set_difference(recorded.begin(), recorded.end(), onDisk.begin(), onDisk.end(),
                      std::back_inserter(report.missing));
  std::set_difference(onDisk.begin(), onDisk.end(), recorded.begin(), recorded.end(),
                      std::back_inserter(report.untracked));
  return report;
}

HashReport reconcileHashes(const fs::path& archiveRoot,
                           const MediaIndex& index,
                           const Hasher& hasher,
                           std::size_t workers,
                           const HashProgressFn& onProgress) {
  HashReport report;

  std::map<std::string, std::string> expectedPath;  // fingerprint -> recorded path
  for (auto& loc : index.allMediaWithLocations()) expectedPath[loc.fingerprint] = loc.archive_path;
  report.index_records = expectedPath.size();

  const auto files = discoverMediaFiles(archiveRoot);
  spdlog::info("hashing {} files with {} workers", files.size(), workers);

  // Coordinator-only state, filled as results arrive.
  std::map<std::string, std::vector<std::string>> foundAt;  // indexed fingerprint -> disk paths
  std::map<std::string, std::string> unknownAt;             // disk path -> unindexed fingerprint
  std::set<std::string> failedPaths;

  hashInParallel(hasher, files, workers, [&](HashOutcome&& outcome) {
    const std::string rel = relativeTo(archiveRoot, outcome.path);
    report.files_checked++;
    bool indexed = false;

    if (!outcome.ok()) {
      const auto& f = outcome.failure();
      spdlog::error("<< ERROR hashing {} after {} attempt(s): {}", rel, f.attempts, f.reason);
      report.errors.push_back({rel, f.reason, f.attempts});
      failedPaths.insert(rel);
    } else if (expectedPath.count(outcome.fingerprint())) {
      indexed = true;
      report.files_matched++;
      foundAt[outcome.fingerprint()].push_back(rel);
    } else {
      spdlog::warn("<< NOT IN INDEX: {}", rel);
      unknownAt[rel] = outcome.fingerprint();
    }
    if (onProgress) onProgress({report.files_checked, files.size(), rel, outcome, indexed});
  });

  std::set<std::string> changedPaths;
  for (const auto& [fingerprint, expected] : expectedPath) {
    auto found = foundAt.find(fingerprint);
    if (found == foundAt.end()) {
      // Unverifiable rather than missing: the recorded file exists but would not hash.
      if (failedPaths.count(expected)) continue;
      auto replaced = unknownAt.find(expected);
      if (replaced != unknownAt.end()) {
        report.changed.push_back({expected, fingerprint, replaced->second});
        changedPaths.insert(expected);
      } else {
        report.missing.push_back({expected, fingerprint});
      }
      continue;
    }

    auto paths = found->second;
    std::sort(paths.begin(), paths.end());
    if (failedPaths.count(expected)) {
      // Still at its recorded path, just unreadable: the rest are extra copies.
      for (const auto& p : paths) report.duplicate_copies.push_back({p, fingerprint});
      continue;
    }
    auto at = std::find(paths.begin(), paths.end(), expected);
    if (at == paths.end()) {
      report.moved.push_back({fingerprint, expected, paths.front()});
      at = paths.begin();
    }
    for (auto it = paths.begin(); it != paths.end(); ++it) {
      if (it != at) report.duplicate_copies.push_back({*it, fingerprint});
    }
  }

  for (const auto& [path, fingerprint] : unknownAt) {
    if (!changedPaths.count(path)) report.untracked.push_back({path, fingerprint});
  }

  auto byPath = [](const auto& a, const auto& b) { return a.path < b.path; };
  std::sort(report.missing.begin(), report.missing.end(), byPath);
  std::sort(report.changed.begin(), report.changed.end(), byPath);
  std::sort(report.duplicate_copies.begin(), report.duplicate_copies.end(), byPath);
  std::sort(report.errors.begin(), report.errors.end(), byPath);
  std::sort(report.moved.begin(), report.moved.end(),
            [](const MovedEntry& a, const MovedEntry& b) { return a.expected_path < b.expected_path; });
  return report;
}

ManifestStats writeHashManifest(const fs::path& root,
                                std::ostream& out,
                                const Hasher& hasher,
                                std::size_t workers,
                                const HashProgressFn& onProgress) {
  const auto files = discoverMediaFiles(root);
  ManifestStats stats;

  hashInOrder(hasher, files, workers, [&](HashOutcome&& outcome) {
    const std::string rel = relativeTo(root, outcome.path);
    stats.files++;
    if (outcome.ok()) {
      out << csvField(rel) << ',' << outcome.fingerprint() << '\n';
    } else {
      stats.errors++;
      out << csvField(rel) << ',' << csvField("ERROR: " + outcome.failure().reason) << '\n';
    }
    if (onProgress) onProgress({stats.files, files.size(), rel, outcome, false});
  });
  out.flush();
  return stats;
}

void writeReconcileReport(const HashReport& report, std::ostream& out) {
  auto row = [&](const char* kind, const std::string& path, const std::string& detail,
                 const std::string& fingerprint) {
    out << kind << ',' << csvField(path) << ',' << csvField(detail) << ',' << fingerprint << '\n';
  };

  out << "kind,path,detail,fingerprint\n";
  for (const auto& e : report.missing)          row("missing", e.path, "", e.fingerprint);
  for (const auto& e : report.untracked)        row("untracked", e.path, "", e.fingerprint);
  for (const auto& e : report.moved)            row("moved", e.found_path, "expected " + e.expected_path, e.fingerprint);
  for (const auto& e : report.changed)          row("changed", e.path, "expected " + e.expected_fingerprint, e.found_fingerprint);
  for (const auto& e : report.duplicate_copies) row("duplicate", e.path, "", e.fingerprint);
  for (const auto& e : report.errors)           row("error", e.path, e.reason, "");
}

void writePathReport(const PathReport& report, std::ostream& out) {
  out << "kind,path\n";
  for (const auto& p : report.missing)   out << "missing," << csvField(p) << '\n';
  for (const auto& p : report.untracked) out << "untracked," << csvField(p) << '\n';
}

void logHashSummary(const HashReport& report) {
  spdlog::info("SUMMARY:");
  spdlog::info("  Files checked on disk:    {}", report.files_checked);
  spdlog::info("  Files matched in index:   {}", report.files_matched);
  spdlog::info("  Untracked:                {}", report.untracked.size());
  spdlog::info("  Moved:                    {}", report.moved.size());
  spdlog::info("  Missing:                  {}", report.missing.size());
  spdlog::info("  Changed:                  {}", report.changed.size());
  spdlog::info("  Duplicate copies:         {}", report.duplicate_copies.size());
  spdlog::info("  Errors:                   {}", report.errors.size());
  spdlog::info("  Index records:            {}", report.index_records);
  if (report.clean()) spdlog::info("STATUS: OK - all files match");
  else                spdlog::warn("STATUS: MISMATCH - see report");
}

} // namespace fam

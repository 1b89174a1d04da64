#include "IndexMaintenance.hpp"
#include "MediaIndex.hpp"
#include "core/util/TimeFormat.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace fam {

namespace fs = std::filesystem;

static fs::path backupPathFor(const fs::path& dbPath) {
  const std::string base = dbPath.stem().string() + "_" + compactTimestamp(isoNow());
  const std::string ext = dbPath.extension().string();
  fs::path out = dbPath.parent_path() / (base + ext);
  for (int n = 1; fs::exists(out); ++n) {
    out = dbPath.parent_path() / (base + "_" + std::to_string(n) + ext);
  }
  return out;
}

static sqlite3* openDb(const fs::path& path, int flags) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(path.string().c_str(), &db, flags, nullptr) != SQLITE_OK) {
    std::string err = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("failed to open db " + path.string() + ": " + err);
  }
  return db;
}

std::optional<fs::path> backupIndex(const fs::path& dbPath) {
  if (!fs::exists(dbPath)) return std::nullopt;
  const fs::path dest = backupPathFor(dbPath);

  sqlite3* src = openDb(dbPath, SQLITE_OPEN_READWRITE);
  sqlite3* dst = nullptr;
  try {
    dst = openDb(dest, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
  } catch (...) {
    sqlite3_close(src);
    throw;
  }

  std::string err;
  sqlite3_backup* bk = sqlite3_backup_init(dst, "main", src, "main");
  if (!bk) {
    err = sqlite3_errmsg(dst);
  } else {
    const int rc = sqlite3_backup_step(bk, -1);
    if (rc != SQLITE_DONE) err = sqlite3_errstr(rc);
    if (sqlite3_backup_finish(bk) != SQLITE_OK && err.empty()) err = sqlite3_errmsg(dst);
  }
  sqlite3_close(dst);
  sqlite3_close(src);

  if (!err.empty()) {
    std::error_code ec;
    fs::remove(dest, ec);
    throw std::runtime_error("index backup to " + dest.string() + " failed: " + err);
  }
  spdlog::info("Index backed up to {}", dest.string());
  return dest;
}

MergeStats mergeIndex(MediaIndex& target, const fs::path& otherDbPath) {
  if (!fs::exists(otherDbPath)) {
    throw std::runtime_error("index to merge not found: " + otherDbPath.string());
  }
  MediaIndex other(otherDbPath.string());
  const auto incoming = other.allMediaWithDetails();

  MergeStats stats;
  IndexTransaction tx(target);
  for (const auto& d : incoming) {
    int64_t mediaId = 0;
    if (auto existing = target.findByFingerprint(d.record.fingerprint)) {
      mediaId = existing->id;
      stats.media_matched++;
    } else if (target.fingerprintAt(d.record.archive_dir, d.record.archive_filename)) {
      spdlog::warn("not merging {}: {} already holds other content",
                   d.record.fingerprint, d.record.archivePath());
      stats.location_conflicts++;
      continue;
    } else {
      mediaId = target.insertMedia(d.record);
      stats.media_added++;
    }

    for (const auto& s : d.sources) {
      const auto slash = s.rfind('/');
      if (slash == std::string::npos) continue;
      if (target.addSource(mediaId, s.substr(0, slash), s.substr(slash + 1))) stats.sources_added++;
    }
    stats.tags_attached += target.attachTags(mediaId, d.tags);
  }
  tx.commit();
  return stats;
}

} // namespace fam

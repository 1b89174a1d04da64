#include "MediaIndex.hpp"
#include "core/Errors.hpp"

#include <memory>
#include <stdexcept>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace fam {

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};
using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("prepare failed: " + err);
  }
  return Stmt(st);
}

void bindText(sqlite3_stmt* st, int i, const std::string& v) {
  sqlite3_bind_text(st, i, v.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt* st, int i) {
  const unsigned char* p = sqlite3_column_text(st, i);
  return p ? reinterpret_cast<const char*>(p) : std::string();
}

// Steps a write statement to completion.
void stepWrite(sqlite3* db, sqlite3_stmt* st, const char* what) {
  if (sqlite3_step(st) != SQLITE_DONE) {
    throw IndexWriteError(std::string(what) + " failed: " + sqlite3_errmsg(db));
  }
}

const char* kSelectMedia = R"SQL(
  SELECT id, archive_path, archive_filename, media_type, hash_signature,
         file_size, duration, exif_date, file_date, ingestion_timestamp
  FROM media
)SQL";

MediaRecord readRecord(sqlite3_stmt* st) {
  MediaRecord r;
  r.id               = sqlite3_column_int64(st, 0);
  r.archive_dir      = columnText(st, 1);
  r.archive_filename = columnText(st, 2);
  r.media_type       = mediaTypeFromString(columnText(st, 3));
  r.fingerprint      = columnText(st, 4);
  r.file_size        = sqlite3_column_int64(st, 5);
  if (sqlite3_column_type(st, 6) != SQLITE_NULL) r.duration = sqlite3_column_double(st, 6);
  if (sqlite3_column_type(st, 7) != SQLITE_NULL) r.exif_date = columnText(st, 7);
  r.file_date        = columnText(st, 8);
  r.ingested_at      = columnText(st, 9);
  return r;
}

} // namespace

MediaIndex::MediaIndex(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE, nullptr) != SQLITE_OK) {
    std::string err = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("failed to open db " + dbPath + ": " + err);
  }
  db_ = db;
  // foreign_keys and busy_timeout are per connection
  exec("PRAGMA foreign_keys=ON;");
  exec("PRAGMA busy_timeout=5000;");
}

MediaIndex::~MediaIndex() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void MediaIndex::exec(const char* sql) {
  auto* db = static_cast<sqlite3*>(db_);
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw IndexWriteError(std::string(sql) + " failed: " + msg);
  }
}

std::optional<MediaRecord> MediaIndex::findByFingerprint(const std::string& fingerprint) const {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, (std::string(kSelectMedia) + " WHERE hash_signature = ?").c_str());
  bindText(st.get(), 1, fingerprint);
  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return readRecord(st.get());
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("findByFingerprint failed: ") + sqlite3_errmsg(db));
  return std::nullopt;
}

std::optional<std::string> MediaIndex::fingerprintAt(const std::string& archiveDir,
                                                     const std::string& filename) const {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, R"SQL(
    SELECT hash_signature FROM media WHERE archive_path = ? AND archive_filename = ?
  )SQL");
  bindText(st.get(), 1, archiveDir);
  bindText(st.get(), 2, filename);
  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_ROW) return columnText(st.get(), 0);
  if (rc != SQLITE_DONE) throw std::runtime_error(std::string("fingerprintAt failed: ") + sqlite3_errmsg(db));
  return std::nullopt;
}

int64_t MediaIndex::insertMedia(const MediaRecord& r) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO media
      (archive_path, archive_filename, media_type, hash_signature, file_size,
       duration, exif_date, file_date, ingestion_timestamp)
    VALUES (?,?,?,?,?,?,?,?,?)
  )SQL";
  auto st = prepare(db, sql);
  int i = 1;
  bindText(st.get(), i++, r.archive_dir);
  bindText(st.get(), i++, r.archive_filename);
  bindText(st.get(), i++, toString(r.media_type));
  bindText(st.get(), i++, r.fingerprint);
  sqlite3_bind_int64(st.get(), i++, r.file_size);
  if (r.duration) sqlite3_bind_double(st.get(), i++, *r.duration);
  else            sqlite3_bind_null(st.get(), i++);
  if (r.exif_date) bindText(st.get(), i++, *r.exif_date);
  else             sqlite3_bind_null(st.get(), i++);
  bindText(st.get(), i++, r.file_date);
  bindText(st.get(), i++, r.ingested_at);

  stepWrite(db, st.get(), "insertMedia");
  return sqlite3_last_insert_rowid(db);
}

int64_t MediaIndex::sourceItemId(const std::string& sourcePath) {
  auto* db = static_cast<sqlite3*>(db_);
  auto ins = prepare(db, "INSERT OR IGNORE INTO source_item (source_path) VALUES (?)");
  bindText(ins.get(), 1, sourcePath);
  stepWrite(db, ins.get(), "insert source_item");

  auto sel = prepare(db, "SELECT id FROM source_item WHERE source_path = ?");
  bindText(sel.get(), 1, sourcePath);
  if (sqlite3_step(sel.get()) != SQLITE_ROW) {
    throw IndexWriteError("source_item lookup failed for " + sourcePath);
  }
  return sqlite3_column_int64(sel.get(), 0);
}

int64_t MediaIndex::tagId(const std::string& value) {
  auto* db = static_cast<sqlite3*>(db_);
  auto ins = prepare(db, "INSERT OR IGNORE INTO tag (value) VALUES (?)");
  bindText(ins.get(), 1, value);
  stepWrite(db, ins.get(), "insert tag");

  auto sel = prepare(db, "SELECT id FROM tag WHERE value = ?");
  bindText(sel.get(), 1, value);
  if (sqlite3_step(sel.get()) != SQLITE_ROW) {
    throw IndexWriteError("tag lookup failed for " + value);
  }
  return sqlite3_column_int64(sel.get(), 0);
}

bool MediaIndex::addSource(int64_t mediaId, const std::string& directory, const std::string& filename) {
  auto* db = static_cast<sqlite3*>(db_);
  const int64_t itemId = sourceItemId(directory);
  auto st = prepare(db, R"SQL(
    INSERT OR IGNORE INTO media_source (media_id, source_item_id, source_filename)
    VALUES (?,?,?)
  )SQL");
  sqlite3_bind_int64(st.get(), 1, mediaId);
  sqlite3_bind_int64(st.get(), 2, itemId);
  bindText(st.get(), 3, filename);
  stepWrite(db, st.get(), "addSource");
  return sqlite3_changes(db) > 0;
}

int MediaIndex::attachTags(int64_t mediaId, const std::vector<std::string>& tags) {
  auto* db = static_cast<sqlite3*>(db_);
  int added = 0;
  for (const auto& value : tags) {
    if (value.empty()) continue;
    const int64_t id = tagId(value);
    auto st = prepare(db, "INSERT OR IGNORE INTO media_tag (media_id, tag_id) VALUES (?,?)");
    sqlite3_bind_int64(st.get(), 1, mediaId);
    sqlite3_bind_int64(st.get(), 2, id);
    stepWrite(db, st.get(), "attachTags");
    added += sqlite3_changes(db) > 0 ? 1 : 0;
  }
  return added;
}

void MediaIndex::replaceTags(int64_t mediaId, const std::vector<std::string>& tags) {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, "DELETE FROM media_tag WHERE media_id = ?");
  sqlite3_bind_int64(st.get(), 1, mediaId);
  stepWrite(db, st.get(), "replaceTags");
  attachTags(mediaId, tags);
}

std::vector<std::string> MediaIndex::tagsFor(int64_t mediaId) const {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, R"SQL(
    SELECT t.value FROM tag t
    JOIN media_tag mt ON t.id = mt.tag_id
    WHERE mt.media_id = ?
    ORDER BY t.id
  )SQL");
  sqlite3_bind_int64(st.get(), 1, mediaId);
  std::vector<std::string> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(columnText(st.get(), 0));
  return out;
}

std::vector<std::string> MediaIndex::sourcesFor(int64_t mediaId) const {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, R"SQL(
    SELECT si.source_path, ms.source_filename
    FROM media_source ms
    JOIN source_item si ON ms.source_item_id = si.id
    WHERE ms.media_id = ?
    ORDER BY ms.source_item_id, ms.source_filename
  )SQL");
  sqlite3_bind_int64(st.get(), 1, mediaId);
  std::vector<std::string> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(columnText(st.get(), 0) + "/" + columnText(st.get(), 1));
  }
  return out;
}

std::vector<int64_t> MediaIndex::mediaIdsBySourceDirectory(const std::string& directory) const {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, R"SQL(
    SELECT DISTINCT ms.media_id FROM media_source ms
    JOIN source_item si ON ms.source_item_id = si.id
    WHERE si.source_path = ?
    ORDER BY ms.media_id
  )SQL");
  bindText(st.get(), 1, directory);
  std::vector<int64_t> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back(sqlite3_column_int64(st.get(), 0));
  return out;
}

std::set<std::string> MediaIndex::allFingerprints() const {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, "SELECT hash_signature FROM media");
  std::set<std::string> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) out.insert(columnText(st.get(), 0));
  return out;
}

std::vector<IndexedLocation> MediaIndex::allMediaWithLocations() const {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, R"SQL(
    SELECT hash_signature, archive_path, archive_filename FROM media ORDER BY id
  )SQL");
  std::vector<IndexedLocation> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back({columnText(st.get(), 0),
                   columnText(st.get(), 1) + "/" + columnText(st.get(), 2)});
  }
  return out;
}

std::vector<MediaDetails> MediaIndex::allMediaWithDetails() const {
  auto* db = static_cast<sqlite3*>(db_);
  std::vector<MediaDetails> out;
  {
    auto st = prepare(db, (std::string(kSelectMedia) + " ORDER BY id").c_str());
    while (sqlite3_step(st.get()) == SQLITE_ROW) out.push_back({readRecord(st.get()), {}, {}});
  }
  for (auto& d : out) {
    d.tags = tagsFor(d.record.id);
    d.sources = sourcesFor(d.record.id);
  }
  return out;
}

int64_t MediaIndex::mediaCount() const {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, "SELECT COUNT(*) FROM media");
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("mediaCount failed: ") + sqlite3_errmsg(db));
  }
  return sqlite3_column_int64(st.get(), 0);
}

// -------- transaction --------

IndexTransaction::IndexTransaction(MediaIndex& index) : index_(index) {
  index_.exec("BEGIN IMMEDIATE;");
}

IndexTransaction::~IndexTransaction() {
  if (done_) return;
  auto* db = static_cast<sqlite3*>(index_.db_);
  if (sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
    spdlog::error("rollback failed: {}", sqlite3_errmsg(db));
  }
}

void IndexTransaction::commit() {
  index_.exec("COMMIT;");
  done_ = true;
}

} // namespace fam

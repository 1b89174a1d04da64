#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "MediaRecord.hpp"

namespace fam {

// Fingerprint-keyed record store over the SQLite schema in schema.sql.
// Write methods throw IndexWriteError; callers group them per ingested file
// inside an IndexTransaction.
class MediaIndex {
public:
  // Opens an existing database (see initDatabase) read/write.
  explicit MediaIndex(const std::string& dbPath);
  ~MediaIndex();

  MediaIndex(const MediaIndex&) = delete;
  MediaIndex& operator=(const MediaIndex&) = delete;

  std::optional<MediaRecord> findByFingerprint(const std::string& fingerprint) const;

  // Fingerprint of the record stored at archiveDir/filename, if any.
  std::optional<std::string> fingerprintAt(const std::string& archiveDir,
                                           const std::string& filename) const;

  // Returns the new record id. Fails on a duplicate fingerprint or location.
  int64_t insertMedia(const MediaRecord& r);

  // Records (directory, filename) as a source of the media.
  // Returns false when that pair was already recorded.
  bool addSource(int64_t mediaId, const std::string& directory, const std::string& filename);

  // Set union with the media's current tags. Returns the number of tags
  // that were not attached before.
  int attachTags(int64_t mediaId, const std::vector<std::string>& tags);

  // Drops all tag memberships of the media, then attaches tags.
  void replaceTags(int64_t mediaId, const std::vector<std::string>& tags);

  std::vector<std::string> tagsFor(int64_t mediaId) const;
  std::vector<std::string> sourcesFor(int64_t mediaId) const;

  // Distinct media ids with at least one source in exactly this directory.
  std::vector<int64_t> mediaIdsBySourceDirectory(const std::string& directory) const;

  std::set<std::string> allFingerprints() const;
  std::vector<IndexedLocation> allMediaWithLocations() const;
  std::vector<MediaDetails> allMediaWithDetails() const;
  int64_t mediaCount() const;

private:
  friend class IndexTransaction;
  void exec(const char* sql);
  int64_t tagId(const std::string& value);
  int64_t sourceItemId(const std::string& sourcePath);

  void* db_; // sqlite3*
};

// BEGIN IMMEDIATE on construction; rolled back on destruction unless
// commit() succeeded.
class IndexTransaction {
public:
  explicit IndexTransaction(MediaIndex& index);
  ~IndexTransaction();

  IndexTransaction(const IndexTransaction&) = delete;
  IndexTransaction& operator=(const IndexTransaction&) = delete;

  void commit();

private:
  MediaIndex& index_;
  bool done_ = false;
};

} // namespace fam

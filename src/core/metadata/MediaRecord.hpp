#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fam {

enum class MediaType { Photo, Video };

inline const char* toString(MediaType t) {
  return t == MediaType::Video ? "video" : "photo";
}

inline MediaType mediaTypeFromString(const std::string& s) {
  return s == "video" ? MediaType::Video : MediaType::Photo;
}

struct MediaRecord {
  int64_t                    id = 0;
  std::string                archive_dir;       // relative to archive root, e.g. "2024/07"
  std::string                archive_filename;
  MediaType                  media_type = MediaType::Photo;
  std::string                fingerprint;       // sha256 hex
  int64_t                    file_size = 0;
  std::optional<double>      duration;          // seconds, video only
  std::optional<std::string> exif_date;         // ISO-8601
  std::string                file_date;         // ISO-8601
  std::string                ingested_at;       // ISO-8601

  std::string archivePath() const { return archive_dir + "/" + archive_filename; }
};

// Denormalized view used by the JSONL export.
struct MediaDetails {
  MediaRecord              record;
  std::vector<std::string> tags;
  std::vector<std::string> sources;  // "<directory>/<filename>"
};

struct IndexedLocation {
  std::string fingerprint;
  std::string archive_path;
};

} // namespace fam

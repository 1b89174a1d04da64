#pragma once
#include <filesystem>
#include <optional>
#include <string>

#include "core/metadata/MediaRecord.hpp"

namespace fam {

// Capture metadata extracted from file contents. Readers for EXIF and video
// containers plug in here; the archive core only consumes the results.
class MetadataProbe {
public:
  virtual ~MetadataProbe() = default;

  // EXIF DateTimeOriginal as ISO-8601, photos only.
  virtual std::optional<std::string> exifDate(const std::filesystem::path& file, MediaType type) = 0;

  // Playback length in seconds, videos only.
  virtual std::optional<double> duration(const std::filesystem::path& file, MediaType type) = 0;
};

// Probe for builds without a metadata reader: placement falls back to the
// file modification date and durations stay unknown.
class NullMetadataProbe : public MetadataProbe {
public:
  std::optional<std::string> exifDate(const std::filesystem::path&, MediaType) override { return std::nullopt; }
  std::optional<double> duration(const std::filesystem::path&, MediaType) override { return std::nullopt; }
};

} // namespace fam

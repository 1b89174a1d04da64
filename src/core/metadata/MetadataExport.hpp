#pragma once
#include <cstddef>
#include <filesystem>

namespace fam {

class MediaIndex;

// Rewrites `path` from scratch with one JSON object per media record:
// archive_path, hash, tags, sources, exif_date, file_date, ingested_at and,
// for videos with a known length, duration. The file is replaced atomically.
// Returns the number of records written.
std::size_t exportMetadataJsonl(const MediaIndex& index, const std::filesystem::path& path);

} // namespace fam

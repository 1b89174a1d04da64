#pragma once
#include <filesystem>
#include <vector>

#include "core/metadata/MediaRecord.hpp"

namespace fam {

// Extension (any case) is one of the supported photo or video formats.
bool isSupportedMedia(const std::filesystem::path& file);

MediaType classifyMedia(const std::filesystem::path& file);

// Supported media files under root in sorted path order. Hidden files and
// hidden directories are skipped, as are the archive's own staging files.
std::vector<std::filesystem::path> discoverMediaFiles(const std::filesystem::path& root);

} // namespace fam

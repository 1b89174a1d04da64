#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "IngestPipeline.hpp"

namespace fam {

class MediaIndex;

// Writes folder,file_count,tags rows (sorted by folder) for hand editing.
void writeTagReviewCsv(const std::map<std::string, FolderSummary>& folders,
                       const std::filesystem::path& csvPath);

// Folder -> cleaned tags from an edited review CSV. An empty tags cell
// yields an empty list.
std::map<std::string, std::vector<std::string>> loadTagReviewCsv(const std::filesystem::path& csvPath);

struct TagReviewResult {
  int records_updated = 0;
  int folders_skipped = 0;  // first path segment matched no source root
};

// Replaces the tags of every record sourced from each reviewed folder.
// Folder keys are "<root folder name>[/<relative folder>]" as produced by
// IngestPipeline::folders(); sourceRoots resolve the root folder names.
TagReviewResult applyTagReview(MediaIndex& index,
                               const std::map<std::string, std::vector<std::string>>& review,
                               const std::vector<std::filesystem::path>& sourceRoots);

} // namespace fam

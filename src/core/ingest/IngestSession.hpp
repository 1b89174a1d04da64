#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

#include "FolderTagger.hpp"
#include "IngestPipeline.hpp"
#include "MetadataProbe.hpp"
#include "TagReview.hpp"
#include "core/metadata/IndexMaintenance.hpp"

namespace fam {

struct Config;

struct SessionResult {
  SessionStats          stats;
  std::string           session_ts;
  std::size_t           exported = 0;  // records in the regenerated JSONL
  std::filesystem::path review_csv;
  std::filesystem::path session_log;
  std::optional<std::filesystem::path> index_backup;  // unset on the first session
};

// One ingestion session over `sources`: backs up and prepares the index,
// ingests every tree in order, then regenerates the JSONL export, writes the
// tag review CSV and the session log. Missing sources raise ConfigError
// before any file is touched.
SessionResult runIngestSession(const Config& cfg,
                               const std::vector<std::filesystem::path>& sources,
                               MetadataProbe& probe,
                               TagPrompt prompt = nullptr);

// Applies an edited tag review CSV and regenerates the JSONL export.
TagReviewResult runTagReviewSession(const Config& cfg,
                                    const std::filesystem::path& reviewCsv,
                                    const std::vector<std::filesystem::path>& sources);

// Merges another index into the archive index and regenerates the export.
MergeStats runMergeSession(const Config& cfg, const std::filesystem::path& otherDb);

} // namespace fam

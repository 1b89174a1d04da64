#include "IngestSession.hpp"
#include "core/Errors.hpp"
#include "core/config/Config.hpp"
#include "core/metadata/IndexMaintenance.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MediaIndex.hpp"
#include "core/metadata/MetadataExport.hpp"
#include "core/storage/ArchiveStore.hpp"
#include "core/util/Logging.hpp"
#include "core/util/Paths.hpp"
#include "core/util/TimeFormat.hpp"

#include <spdlog/spdlog.h>

#include <map>

namespace fam {

namespace fs = std::filesystem;

// Folders are keyed by root name, so two distinct roots may not share one.
static void requireSources(const std::vector<fs::path>& sources) {
  if (sources.empty()) throw ConfigError("no ingestion path given");
  std::map<std::string, fs::path> byName;
  for (const auto& s : sources) {
    if (!fs::is_directory(s)) throw ConfigError("ingestion path does not exist: " + s.string());
    const fs::path root = canonicalDir(s);
    auto [it, added] = byName.emplace(root.filename().string(), root);
    if (!added && it->second != root) {
      throw ConfigError("ingestion paths " + it->second.string() + " and " + root.string() +
                        " share the folder name '" + it->first + "'");
    }
  }
}

static const char* modeName(TransferMode m) {
  return m == TransferMode::Move ? "move" : "copy";
}

static fs::path writeSessionLog(const Config& cfg,
                                const std::vector<fs::path>& sources,
                                const SessionStats& stats,
                                const std::string& sessionTs) {
  const fs::path logPath = cfg.log_dir / ("session_" + compactTimestamp(sessionTs) + ".txt");
  const std::string name = "session-" + compactTimestamp(sessionTs);
  auto log = openReportLog(name, logPath);

  std::string joined;
  for (const auto& s : sources) {
    if (!joined.empty()) joined += ", ";
    joined += s.string();
  }
  log->info("Family Archive Ingestion Session");
  log->info("Timestamp: {}", sessionTs);
  log->info("Sources: {}", joined);
  log->info("Archive: {}", cfg.archive_root.string());
  log->info("Mode: {}", modeName(cfg.mode));
  log->info("");
  log->info("Session Summary:");
  log->info("  Imported: {}", stats.imported);
  log->info("  Duplicates skipped: {}", stats.duplicates);
  log->info("  Tags added: {}", stats.tags_added);
  log->info("  Errors: {}", stats.errors);
  if (!stats.error_details.empty()) {
    log->info("");
    log->info("Errors:");
    for (const auto& d : stats.error_details) log->info("  - {}", d);
  }
  log->flush();
  spdlog::drop(name);
  return logPath;
}

SessionResult runIngestSession(const Config& cfg,
                               const std::vector<fs::path>& sources,
                               MetadataProbe& probe,
                               TagPrompt prompt) {
  requireSources(sources);
  fs::create_directories(cfg.archive_root);
  const auto backup = backupIndex(cfg.db_path);
  initDatabase(cfg.db_path.string(), findSchemaPath(cfg));

  MediaIndex index(cfg.db_path.string());
  ArchiveStore store(cfg.archive_root);
  Hasher hasher(cfg.hash_retry);

  IngestOptions options;
  options.mode = cfg.mode;
  options.stop_words = cfg.tag_stop_words;
  options.hash_workers = cfg.workers;
  IngestPipeline pipeline(index, store, hasher, probe, options, std::move(prompt));

  SessionResult result;
  result.session_ts = pipeline.sessionTimestamp();
  result.index_backup = backup;
  for (size_t i = 0; i < sources.size(); ++i) {
    spdlog::info("Processing path: '{}' {} of {}", sources[i].filename().string(), i + 1, sources.size());
    pipeline.ingestTree(sources[i]);
  }
  result.stats = pipeline.stats();

  result.review_csv = cfg.metadata_path.parent_path() /
                      ("tag_review_" + compactTimestamp(result.session_ts) + ".csv");
  writeTagReviewCsv(pipeline.folders(), result.review_csv);
  spdlog::info("Tag review CSV: {}", result.review_csv.string());

  result.exported = exportMetadataJsonl(index, cfg.metadata_path);
  spdlog::info("Exported {} records to {}", result.exported, cfg.metadata_path.string());

  result.session_log = writeSessionLog(cfg, sources, result.stats, result.session_ts);
  spdlog::info("Session log: {}", result.session_log.string());

  spdlog::info("Session Summary:");
  spdlog::info("  Imported: {}", result.stats.imported);
  spdlog::info("  Duplicates skipped: {}", result.stats.duplicates);
  spdlog::info("  Tags added: {}", result.stats.tags_added);
  spdlog::info("  Errors: {}", result.stats.errors);
  return result;
}

TagReviewResult runTagReviewSession(const Config& cfg,
                                    const fs::path& reviewCsv,
                                    const std::vector<fs::path>& sources) {
  requireSources(sources);
  if (!fs::exists(reviewCsv)) throw ConfigError("CSV file not found: " + reviewCsv.string());
  backupIndex(cfg.db_path);
  initDatabase(cfg.db_path.string(), findSchemaPath(cfg));

  MediaIndex index(cfg.db_path.string());
  const auto review = loadTagReviewCsv(reviewCsv);
  const TagReviewResult result = applyTagReview(index, review, sources);
  const std::size_t exported = exportMetadataJsonl(index, cfg.metadata_path);

  spdlog::info("Updated tags for {} media records from {} folders.", result.records_updated, review.size());
  spdlog::info("Exported {} records to {}", exported, cfg.metadata_path.string());
  return result;
}

MergeStats runMergeSession(const Config& cfg, const fs::path& otherDb) {
  if (!fs::exists(otherDb)) throw ConfigError("index to merge not found: " + otherDb.string());
  std::error_code ec;
  if (fs::equivalent(cfg.db_path, otherDb, ec)) {
    throw ConfigError("cannot merge the archive index into itself: " + otherDb.string());
  }
  backupIndex(cfg.db_path);
  initDatabase(cfg.db_path.string(), findSchemaPath(cfg));

  MediaIndex index(cfg.db_path.string());
  const MergeStats stats = mergeIndex(index, otherDb);
  const std::size_t exported = exportMetadataJsonl(index, cfg.metadata_path);

  spdlog::info("Merged {}: {} added, {} already indexed, {} location conflicts",
               otherDb.string(), stats.media_added, stats.media_matched, stats.location_conflicts);
  spdlog::info("  Sources added: {}", stats.sources_added);
  spdlog::info("  Tags attached: {}", stats.tags_attached);
  spdlog::info("Exported {} records to {}", exported, cfg.metadata_path.string());
  return stats;
}

} // namespace fam

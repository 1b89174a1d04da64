// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/config/Config.hpp"
#include "core/ingest/IngestSession.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MediaIndex.hpp"
#include "core/reconcile/Reconciler.hpp"
#include "core/util/Logging.hpp"

namespace fs = std::filesystem;

// ---------- helpers ----------

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init                          # create/upgrade the index schema\n"
            << "  " << argv0 << " ingest <source>...              # ingest source trees into the archive\n"
            << "  " << argv0 << " apply-tags <review.csv> <source>...\n"
            << "  " << argv0 << " merge-index <session.db>        # merge another index into this archive\n"
            << "  " << argv0 << " check-paths [report.csv]        # fast path-only reconciliation\n"
            << "  " << argv0 << " check-hashes [report.csv]       # rehash the archive and diff against the index\n"
            << "  " << argv0 << " manifest <folder> <output>      # relpath,sha256 for every media file\n"
            << "\nConfiguration comes from FAM_* environment variables (FAM_ARCHIVE_ROOT is required).\n";
}

static std::vector<fs::path> paths_from(int argc, char** argv, int first) {
  std::vector<fs::path> out;
  for (int i = first; i < argc; ++i) out.emplace_back(fs::absolute(argv[i]).lexically_normal());
  return out;
}

// Opens the index of an existing archive; never creates one.
static void require_index(const fam::Config& cfg) {
  if (!fs::exists(cfg.db_path)) throw fam::ConfigError("database not found: " + cfg.db_path.string());
}

// Progress on a single overwritten terminal line.
static void print_progress(const fam::HashProgress& p) {
  std::cout << "\r   [" << p.done << "/" << p.total << "] " << p.path.substr(0, 70)
            << std::string(p.path.size() < 70 ? 70 - p.path.size() : 0, ' ') << std::flush;
  if (p.done == p.total) std::cout << "\n";
}

// ---------- commands ----------

static int cmd_init(const fam::Config& cfg) {
  fam::initDatabase(cfg.db_path.string(), fam::findSchemaPath(cfg));
  std::cout << "DB initialized at: " << cfg.db_path.string() << "\n";
  return 0;
}

static int cmd_ingest(const fam::Config& cfg, const std::vector<fs::path>& sources) {
  fam::NullMetadataProbe probe;
  const auto result = fam::runIngestSession(cfg, sources, probe);
  return result.stats.errors == 0 ? 0 : 1;
}

static int cmd_apply_tags(const fam::Config& cfg, const fs::path& csv, const std::vector<fs::path>& sources) {
  const auto result = fam::runTagReviewSession(cfg, csv, sources);
  return result.folders_skipped == 0 ? 0 : 1;
}

static int cmd_merge_index(const fam::Config& cfg, const fs::path& otherDb) {
  const auto stats = fam::runMergeSession(cfg, otherDb);
  return stats.location_conflicts == 0 ? 0 : 1;
}

static int cmd_check_paths(const fam::Config& cfg, const char* reportPath) {
  require_index(cfg);
  fam::MediaIndex index(cfg.db_path.string());
  const auto report = fam::reconcilePaths(cfg.archive_root, index);
  for (const auto& p : report.missing)   spdlog::warn(">> IN INDEX BUT NOT ON DISK: {}", p);
  for (const auto& p : report.untracked) spdlog::warn("<< ON DISK BUT NOT IN INDEX: {}", p);
  spdlog::info("missing: {}, untracked: {}", report.missing.size(), report.untracked.size());

  if (reportPath) {
    std::ofstream os(reportPath, std::ios::trunc);
    if (!os) throw std::runtime_error(std::string("cannot write ") + reportPath);
    fam::writePathReport(report, os);
    spdlog::info("Report written to: {}", reportPath);
  }
  return report.clean() ? 0 : 1;
}

static int cmd_check_hashes(const fam::Config& cfg, const char* reportPath) {
  require_index(cfg);
  fam::MediaIndex index(cfg.db_path.string());
  fam::Hasher hasher(cfg.hash_retry);

  const auto report = fam::reconcileHashes(cfg.archive_root, index, hasher, cfg.workers, print_progress);
  for (const auto& m : report.moved) {
    spdlog::warn("~~ PATH MISMATCH: {} (index expects {})", m.found_path, m.expected_path);
  }
  for (const auto& m : report.missing) spdlog::warn(">> IN INDEX BUT NOT ON DISK: {}", m.path);
  for (const auto& c : report.changed) spdlog::warn("!! CONTENT CHANGED: {}", c.path);
  fam::logHashSummary(report);

  if (reportPath) {
    std::ofstream os(reportPath, std::ios::trunc);
    if (!os) throw std::runtime_error(std::string("cannot write ") + reportPath);
    fam::writeReconcileReport(report, os);
    spdlog::info("Report written to: {}", reportPath);
  }
  return report.clean() ? 0 : 1;
}

static int cmd_manifest(const fam::Config& cfg, const fs::path& folder, const fs::path& output) {
  if (!fs::is_directory(folder)) throw fam::ConfigError("folder not found: " + folder.string());
  if (output.has_parent_path()) fs::create_directories(output.parent_path());
  std::ofstream os(output, std::ios::trunc);
  if (!os) throw std::runtime_error("cannot write " + output.string());

  fam::Hasher hasher(cfg.hash_retry);
  const auto stats = fam::writeHashManifest(folder, os, hasher, cfg.workers, print_progress);
  spdlog::info("Done. {} files hashed, {} errors.", stats.files, stats.errors);
  spdlog::info("Log written to: {}", output.string());
  return stats.errors == 0 ? 0 : 1;
}

// ---------- main ----------

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }
  const std::string verb = argv[1];

  try {
    fam::initLogging();

    if (verb == "manifest" && argc == 4) {
      // no index involved; only the hashing settings are needed
      fam::Config cfg;
      if (fam::processEnv("FAM_ARCHIVE_ROOT")) cfg = fam::loadConfig();
      return cmd_manifest(cfg, fs::absolute(argv[2]), fs::absolute(argv[3]));
    }

    const fam::Config cfg = fam::loadConfig();

    if (verb == "--init" && argc == 2)                      return cmd_init(cfg);
    if (verb == "ingest" && argc >= 3)                      return cmd_ingest(cfg, paths_from(argc, argv, 2));
    if (verb == "apply-tags" && argc >= 4)                  return cmd_apply_tags(cfg, fs::absolute(argv[2]), paths_from(argc, argv, 3));
    if (verb == "merge-index" && argc == 3)                 return cmd_merge_index(cfg, fs::absolute(argv[2]));
    if (verb == "check-paths" && (argc == 2 || argc == 3))  return cmd_check_paths(cfg, argc == 3 ? argv[2] : nullptr);
    if (verb == "check-hashes" && (argc == 2 || argc == 3)) return cmd_check_hashes(cfg, argc == 3 ? argv[2] : nullptr);

    print_usage(argv[0]);
    return 1;
  } catch (const fam::ConfigError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}

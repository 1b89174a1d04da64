#include "IngestPipeline.hpp"
#include "core/Errors.hpp"
#include "core/storage/MediaFiles.hpp"
#include "core/util/Paths.hpp"
#include "core/util/TimeFormat.hpp"

#include <spdlog/spdlog.h>
#include <system_error>

namespace fam {

namespace fs = std::filesystem;

IngestPipeline::IngestPipeline(MediaIndex& index,
                               ArchiveStore& store,
                               const Hasher& hasher,
                               MetadataProbe& probe,
                               IngestOptions options,
                               TagPrompt prompt)
  : index_(index),
    store_(store),
    hasher_(hasher),
    probe_(probe),
    options_(std::move(options)),
    tagger_(options_.stop_words, store.root(), std::move(prompt)) {
  if (options_.session_ts.empty()) options_.session_ts = isoNow();
}

void IngestPipeline::ingestTree(const fs::path& sourceRoot) {
  const fs::path root = canonicalDir(sourceRoot);
  spdlog::info("Scanning {} ...", root.string());
  const auto files = discoverMediaFiles(root);
  spdlog::info("Found {} media files.", files.size());

  hashInOrder(hasher_, files, options_.hash_workers, [&](HashOutcome&& hashed) {
    ingestFile(root, hashed);
  });
}

FileOutcome IngestPipeline::ingestFile(const fs::path& sourceRoot, const HashOutcome& hashed) {
  const fs::path& file = hashed.path;
  const fs::path root = canonicalDir(sourceRoot);
  const fs::path sourceDir = canonicalDir(file.parent_path());
  const std::string filename = file.filename().string();

  auto& folder = folders_[folderKey(root, sourceDir)];
  folder.file_count++;
  folder.tags = tagger_.folderTags(root, sourceDir);

  if (!hashed.ok()) {
    const auto& failure = hashed.failure();
    recordError(file, "", failure.reason + " (after " + std::to_string(failure.attempts) + " attempt(s))");
    return FileOutcome::Error;
  }
  const std::string& fingerprint = hashed.fingerprint();

  std::vector<std::string> tags = folder.tags;
  for (auto& t : FolderTagger::autoTags(sourceDir, filename)) tags.push_back(std::move(t));

  StagedPlacement staged;
  try {
    IndexTransaction tx(index_);

    FileOutcome outcome;
    int64_t mediaId = 0;
    if (auto existing = index_.findByFingerprint(fingerprint)) {
      mediaId = existing->id;
      index_.addSource(mediaId, sourceDir.string(), filename);
      spdlog::debug("duplicate of {}: {}", existing->archivePath(), file.string());
      outcome = FileOutcome::Duplicate;
    } else {
      MediaRecord rec = placeNew(file, fingerprint, staged);
      mediaId = index_.insertMedia(rec);
      index_.addSource(mediaId, sourceDir.string(), filename);
      outcome = FileOutcome::Imported;
    }
    const int added = index_.attachTags(mediaId, tags);
    tx.commit();

    stats_.tags_added += added;
    if (outcome == FileOutcome::Duplicate) {
      stats_.duplicates++;
      return outcome;
    }

    stats_.imported++;
    spdlog::info("imported {} -> {}/{}", file.string(), staged.dir, staged.name);
    if (options_.mode == TransferMode::Move) {
      std::error_code ec;
      fs::remove(file, ec);
      if (ec) spdlog::warn("archived but could not remove source {}: {}", file.string(), ec.message());
    }
    return outcome;
  } catch (const CollisionError& e) {
    spdlog::critical("integrity fault while placing {} [{}]: {}", file.string(), fingerprint, e.what());
    throw;
  } catch (const std::exception& e) {
    if (staged.claimed) scratch_.release(staged.dir, staged.name);
    if (staged.created) store_.discard(staged.dir, staged.name);
    recordError(file, fingerprint, e.what());
    return FileOutcome::Error;
  }
}

MediaRecord IngestPipeline::placeNew(const fs::path& file, const std::string& fingerprint, StagedPlacement& staged) {
  MediaRecord rec;
  rec.media_type  = classifyMedia(file);
  rec.fingerprint = fingerprint;
  rec.file_date   = fileModificationDate(file);
  rec.ingested_at = options_.session_ts;
  if (rec.media_type == MediaType::Photo) rec.exif_date = probe_.exifDate(file, rec.media_type);
  if (rec.media_type == MediaType::Video) rec.duration = probe_.duration(file, rec.media_type);

  // EXIF date wins for placement only; both dates are stored as found.
  rec.archive_dir = archiveDirectoryFor(rec.exif_date, rec.file_date);

  const std::string baseName = file.filename().string();
  NameClaims& claims = scratch_.claimsFor(rec.archive_dir);
  learnClaim(rec.archive_dir, baseName, claims);
  learnClaim(rec.archive_dir, suffixedName(baseName, fingerprint), claims);

  const Placement placement = resolvePlacement(baseName, fingerprint, claims);
  rec.archive_filename = placement.filename;
  staged.dir = rec.archive_dir;
  staged.name = rec.archive_filename;
  if (placement.reused) {
    spdlog::warn("reusing unrecorded archive copy {}/{}", rec.archive_dir, rec.archive_filename);
  } else {
    store_.put(file, rec.archive_dir, rec.archive_filename);
    staged.created = true;
  }
  scratch_.claim(rec.archive_dir, rec.archive_filename, fingerprint);
  staged.claimed = true;

  rec.file_size = static_cast<int64_t>(fs::file_size(store_.pathFor(rec.archive_dir, rec.archive_filename)));
  return rec;
}

// Fills in who holds `filename` when this session has not seen it yet:
// the index first, then whatever is already on disk.
void IngestPipeline::learnClaim(const std::string& archiveDir, const std::string& filename, NameClaims& claims) {
  if (claims.count(filename)) return;
  if (auto fp = index_.fingerprintAt(archiveDir, filename)) {
    claims[filename] = *fp;
    return;
  }
  const fs::path onDisk = store_.pathFor(archiveDir, filename);
  if (!fs::exists(onDisk)) return;
  try {
    claims[filename] = hasher_.hash(onDisk);
  } catch (const ReadError& e) {
    spdlog::warn("cannot identify existing archive file {}: {}", onDisk.string(), e.cause());
    claims[filename] = "";
  }
}

void IngestPipeline::recordError(const fs::path& file, const std::string& fingerprint, const std::string& cause) {
  stats_.errors++;
  std::string detail = file.string();
  if (!fingerprint.empty()) detail += " [" + fingerprint + "]";
  detail += ": " + cause;
  spdlog::error("ERROR processing {}", detail);
  stats_.error_details.push_back(std::move(detail));
}

std::string IngestPipeline::folderKey(const fs::path& root, const fs::path& dir) {
  const std::string rel = dir.lexically_relative(root).string();
  const std::string name = root.filename().string();
  return (rel.empty() || rel == ".") ? name : name + "/" + rel;
}

} // namespace fam

#include "TagReview.hpp"
#include "FolderTagger.hpp"
#include "core/Errors.hpp"
#include "core/metadata/MediaIndex.hpp"
#include "core/util/Csv.hpp"
#include "core/util/Paths.hpp"

#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace fam {

namespace fs = std::filesystem;

static std::string joinTags(const std::vector<std::string>& tags) {
  std::string out;
  for (const auto& t : tags) {
    if (!out.empty()) out.push_back(',');
    out += t;
  }
  return out;
}

void writeTagReviewCsv(const std::map<std::string, FolderSummary>& folders, const fs::path& csvPath) {
  if (csvPath.has_parent_path()) fs::create_directories(csvPath.parent_path());
  std::ofstream os(csvPath, std::ios::trunc);
  if (!os) throw std::runtime_error("cannot write " + csvPath.string());

  os << "folder,file_count,tags\n";
  for (const auto& [folder, summary] : folders) {
    os << csvField(folder) << ',' << summary.file_count << ',' << csvField(joinTags(summary.tags)) << '\n';
  }
  if (!os) throw std::runtime_error("write failed: " + csvPath.string());
}

std::map<std::string, std::vector<std::string>> loadTagReviewCsv(const fs::path& csvPath) {
  std::ifstream in(csvPath);
  if (!in) throw std::runtime_error("cannot read " + csvPath.string());

  std::string line;
  if (!std::getline(in, line)) throw std::runtime_error("empty tag review file: " + csvPath.string());
  const auto header = parseCsvLine(line);
  int folderCol = -1, tagsCol = -1;
  for (size_t i = 0; i < header.size(); ++i) {
    if (header[i] == "folder") folderCol = static_cast<int>(i);
    if (header[i] == "tags") tagsCol = static_cast<int>(i);
  }
  if (folderCol < 0 || tagsCol < 0) {
    throw std::runtime_error("tag review file needs folder and tags columns: " + csvPath.string());
  }

  std::map<std::string, std::vector<std::string>> result;
  while (std::getline(in, line)) {
    if (line.empty() || line == "\r") continue;
    const auto fields = parseCsvLine(line);
    if (static_cast<int>(fields.size()) <= std::max(folderCol, tagsCol)) continue;

    std::vector<std::string> tags;
    for (const auto& raw : parseCsvLine(fields[tagsCol])) {
      const std::string t = cleanTag(raw);
      if (!t.empty()) tags.push_back(t);
    }
    result[fields[folderCol]] = std::move(tags);
  }
  return result;
}

TagReviewResult applyTagReview(MediaIndex& index,
                               const std::map<std::string, std::vector<std::string>>& review,
                               const std::vector<fs::path>& sourceRoots) {
  std::map<std::string, fs::path> rootsByName;
  for (const auto& r : sourceRoots) {
    const fs::path root = canonicalDir(r);
    auto [it, added] = rootsByName.emplace(root.filename().string(), root);
    if (!added && it->second != root) {
      throw ConfigError("ingestion paths " + it->second.string() + " and " + root.string() +
                        " share the folder name '" + it->first + "'");
    }
  }

  TagReviewResult result;
  IndexTransaction tx(index);
  for (const auto& [folder, tags] : review) {
    const auto slash = folder.find('/');
    const std::string rootName = folder.substr(0, slash);
    auto it = rootsByName.find(rootName);
    if (it == rootsByName.end()) {
      spdlog::warn("unknown ingestion path '{}', skipping", rootName);
      result.folders_skipped++;
      continue;
    }
    fs::path dir = it->second;
    if (slash != std::string::npos) dir = (dir / folder.substr(slash + 1)).lexically_normal();

    for (int64_t mediaId : index.mediaIdsBySourceDirectory(dir.string())) {
      index.replaceTags(mediaId, tags);
      result.records_updated++;
    }
  }
  tx.commit();
  return result;
}

} // namespace fam

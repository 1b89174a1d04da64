#include "FolderTagger.hpp"

#include <algorithm>
#include <cctype>

namespace fam {

namespace fs = std::filesystem;

std::string cleanTag(const std::string& raw) {
  std::string tag;
  for (unsigned char c : raw) {
    c = static_cast<unsigned char>(std::tolower(c));
    if (std::isalnum(c) || c == '-' || c == '_') tag.push_back(static_cast<char>(c));
  }
  return tag;
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

FolderTagger::FolderTagger(const std::vector<std::string>& stopWords,
                           const fs::path& archiveRoot,
                           TagPrompt prompt)
  : prompt_(std::move(prompt)) {
  for (const auto& w : stopWords) stopWords_.insert(lower(w));
  for (const auto& part : archiveRoot.lexically_normal()) {
    const std::string c = cleanTag(part.string());
    if (!c.empty()) rootComponents_.insert(c);
  }
}

const std::vector<std::string>& FolderTagger::folderTags(const fs::path& ingestionRoot,
                                                         const fs::path& sourceDir) {
  const std::string key = sourceDir.lexically_normal().string();
  auto it = cache_.find(key);
  if (it != cache_.end()) return it->second;

  std::vector<std::string> tags;
  const fs::path rel = sourceDir.lexically_normal().lexically_relative(ingestionRoot.lexically_normal());
  for (const auto& part : rel) {
    const std::string name = part.string();
    if (name.empty() || name == "." || name == "..") continue;
    const std::string tag = cleanTag(name);
    if (tag.empty() || stopWords_.count(tag) || rootComponents_.count(tag)) continue;
    if (std::find(tags.begin(), tags.end(), tag) == tags.end()) tags.push_back(tag);
  }

  if (prompt_) {
    ++prompts_;
    std::vector<std::string> chosen;
    for (const auto& t : prompt_(sourceDir, tags)) {
      const std::string c = cleanTag(t);
      if (!c.empty() && std::find(chosen.begin(), chosen.end(), c) == chosen.end()) chosen.push_back(c);
    }
    tags = std::move(chosen);
  }
  return cache_.emplace(key, std::move(tags)).first->second;
}

std::vector<std::string> FolderTagger::autoTags(const fs::path& sourceDir, const std::string& filename) {
  if (lower(sourceDir.string()).find("thumb") != std::string::npos ||
      lower(filename).find("thumb") != std::string::npos) {
    return {"thumbnail"};
  }
  return {};
}

} // namespace fam

#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace fam {

// Lower-cases and keeps only [a-z0-9_-].
std::string cleanTag(const std::string& raw);

// Interactive review hook: receives the directory and the suggested tags,
// returns the tags to apply.
using TagPrompt = std::function<std::vector<std::string>(const std::filesystem::path& sourceDir,
                                                         const std::vector<std::string>& suggested)>;

class FolderTagger {
public:
  FolderTagger(const std::vector<std::string>& stopWords,
               const std::filesystem::path& archiveRoot,
               TagPrompt prompt = nullptr);

  // Tags for every file directly in sourceDir, from the directory names
  // between ingestionRoot and sourceDir. Computed (and prompted) once per
  // distinct directory per tagger.
  const std::vector<std::string>& folderTags(const std::filesystem::path& ingestionRoot,
                                             const std::filesystem::path& sourceDir);

  // "thumbnail" when the directory or file name mentions "thumb".
  static std::vector<std::string> autoTags(const std::filesystem::path& sourceDir,
                                           const std::string& filename);

  size_t promptCount() const { return prompts_; }

private:
  std::set<std::string> stopWords_;
  std::set<std::string> rootComponents_;
  TagPrompt prompt_;
  std::map<std::string, std::vector<std::string>> cache_;
  size_t prompts_ = 0;
};

} // namespace fam

#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/hashing/Hasher.hpp"
#include "core/ingest/IngestPipeline.hpp"

namespace fam {

struct Config {
  std::filesystem::path    archive_root;
  std::filesystem::path    db_path;
  std::filesystem::path    metadata_path;
  std::filesystem::path    log_dir;
  TransferMode             mode = TransferMode::Copy;
  std::vector<std::string> tag_stop_words;
  std::size_t              workers = 8;
  RetryPolicy              hash_retry;
  std::string              schema_path;  // empty: search the default locations
};

const std::vector<std::string>& defaultTagStopWords();

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment.
std::optional<std::string> processEnv(const std::string& key);

// Builds and validates the configuration from FAM_* variables. Relative
// paths are resolved against the archive root. Throws ConfigError.
Config loadConfig(const EnvLookup& env = processEnv);

// Schema file to apply: the configured one, else schema.sql in the working
// directory, else the copy next to the sources. Throws ConfigError.
std::string findSchemaPath(const Config& cfg);

} // namespace fam

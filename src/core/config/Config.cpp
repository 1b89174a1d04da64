#include "Config.hpp"
#include "core/Errors.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#ifndef FAM_SOURCE_SCHEMA_PATH
#define FAM_SOURCE_SCHEMA_PATH "src/core/metadata/schema.sql"
#endif

namespace fam {

namespace fs = std::filesystem;

const std::vector<std::string>& defaultTagStopWords() {
  static const std::vector<std::string> words = {
    "backup", "photos", "images", "media", "camera",
    "dcim", "export", "downloads", "documents",
  };
  return words;
}

std::optional<std::string> processEnv(const std::string& key) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key.c_str()) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return std::nullopt;
#else
  if (const char* v = std::getenv(key.c_str())) return std::string(v);
  return std::nullopt;
#endif
}

static std::string get_env_or(const EnvLookup& env, const char* key, const std::string& defval) {
  auto v = env(key);
  return (v && !v->empty()) ? *v : defval;
}

static long parsePositive(const EnvLookup& env, const char* key, long defval, long minval, long maxval) {
  const std::string raw = get_env_or(env, key, "");
  if (raw.empty()) return defval;
  long v = 0;
  try {
    size_t used = 0;
    v = std::stol(raw, &used);
    if (used != raw.size()) throw std::invalid_argument(raw);
  } catch (const std::exception&) {
    throw ConfigError(std::string(key) + " must be an integer, got '" + raw + "'");
  }
  if (v < minval) throw ConfigError(std::string(key) + " must be >= " + std::to_string(minval));
  if (v > maxval) throw ConfigError(std::string(key) + " must be <= " + std::to_string(maxval));
  return v;
}

static fs::path underRoot(const fs::path& root, const std::string& raw) {
  fs::path p(raw);
  return (p.is_absolute() ? p : root / p).lexically_normal();
}

static std::vector<std::string> splitList(const std::string& raw) {
  std::vector<std::string> out;
  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    const auto b = item.find_first_not_of(" \t");
    const auto e = item.find_last_not_of(" \t");
    if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
  }
  return out;
}

Config loadConfig(const EnvLookup& env) {
  Config cfg;

  const std::string root = get_env_or(env, "FAM_ARCHIVE_ROOT", "");
  if (root.empty()) throw ConfigError("Missing required config field: FAM_ARCHIVE_ROOT");
  cfg.archive_root = fs::absolute(root).lexically_normal();
  if (!cfg.archive_root.has_filename() && cfg.archive_root.has_relative_path()) {
    cfg.archive_root = cfg.archive_root.parent_path();
  }

  cfg.db_path       = underRoot(cfg.archive_root, get_env_or(env, "FAM_DB_PATH", "data/family-archive.db"));
  cfg.metadata_path = underRoot(cfg.archive_root, get_env_or(env, "FAM_METADATA_PATH", "data/metadata.jsonl"));
  cfg.log_dir       = underRoot(cfg.archive_root, get_env_or(env, "FAM_LOG_DIR", "logs"));

  const std::string mode = get_env_or(env, "FAM_MODE", "copy");
  if (mode == "copy")      cfg.mode = TransferMode::Copy;
  else if (mode == "move") cfg.mode = TransferMode::Move;
  else throw ConfigError("FAM_MODE must be 'copy' or 'move', got '" + mode + "'");

  if (auto words = env("FAM_TAG_STOP_WORDS")) cfg.tag_stop_words = splitList(*words);
  else                                        cfg.tag_stop_words = defaultTagStopWords();

  cfg.workers = static_cast<std::size_t>(parsePositive(env, "FAM_WORKERS", 8, 1, 256));
  cfg.hash_retry.max_attempts = static_cast<int>(parsePositive(env, "FAM_HASH_ATTEMPTS", 6, 1, 20));
  cfg.hash_retry.base_delay = std::chrono::milliseconds(parsePositive(env, "FAM_HASH_BACKOFF_MS", 1000, 0, 60000));

  cfg.schema_path = get_env_or(env, "FAM_SCHEMA_PATH", "");
  return cfg;
}

std::string findSchemaPath(const Config& cfg) {
  if (!cfg.schema_path.empty()) {
    if (!fs::exists(cfg.schema_path)) throw ConfigError("schema file not found: " + cfg.schema_path);
    return cfg.schema_path;
  }
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path(FAM_SOURCE_SCHEMA_PATH),
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw ConfigError("schema.sql not found (looked in the working directory and " FAM_SOURCE_SCHEMA_PATH ")");
}

} // namespace fam

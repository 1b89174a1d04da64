// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "core/config/Config.hpp"

#include <map>

using namespace fam;
namespace fs = std::filesystem;

namespace {

EnvLookup envFrom(std::map<std::string, std::string> vars) {
  return [vars](const std::string& key) -> std::optional<std::string> {
    auto it = vars.find(key);
    if (it == vars.end()) return std::nullopt;
    return it->second;
  };
}

} // namespace

TEST(ConfigTest, ArchiveRootIsRequired) {
  EXPECT_THROW(loadConfig(envFrom({})), ConfigError);
  EXPECT_THROW(loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", ""}})), ConfigError);
}

TEST(ConfigTest, DefaultsLiveUnderTheArchiveRoot) {
  const Config cfg = loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", "/srv/family"}}));
  EXPECT_EQ(cfg.archive_root, fs::path("/srv/family"));
  EXPECT_EQ(cfg.db_path, fs::path("/srv/family/data/family-archive.db"));
  EXPECT_EQ(cfg.metadata_path, fs::path("/srv/family/data/metadata.jsonl"));
  EXPECT_EQ(cfg.log_dir, fs::path("/srv/family/logs"));
  EXPECT_EQ(cfg.mode, TransferMode::Copy);
  EXPECT_EQ(cfg.workers, 8u);
  EXPECT_EQ(cfg.hash_retry.max_attempts, 6);
  EXPECT_EQ(cfg.hash_retry.base_delay, std::chrono::milliseconds(1000));
  EXPECT_EQ(cfg.tag_stop_words, defaultTagStopWords());
  EXPECT_TRUE(cfg.schema_path.empty());
}

TEST(ConfigTest, OverridesAreApplied) {
  const Config cfg = loadConfig(envFrom({
    {"FAM_ARCHIVE_ROOT", "/srv/family/"},
    {"FAM_DB_PATH", "/var/lib/fam/index.db"},
    {"FAM_METADATA_PATH", "export/meta.jsonl"},
    {"FAM_MODE", "move"},
    {"FAM_WORKERS", "3"},
    {"FAM_HASH_ATTEMPTS", "2"},
    {"FAM_HASH_BACKOFF_MS", "0"},
    {"FAM_TAG_STOP_WORDS", " misc, tmp ,,"},
  }));
  EXPECT_EQ(cfg.archive_root, fs::path("/srv/family"));
  EXPECT_EQ(cfg.db_path, fs::path("/var/lib/fam/index.db"));
  EXPECT_EQ(cfg.metadata_path, fs::path("/srv/family/export/meta.jsonl"));
  EXPECT_EQ(cfg.mode, TransferMode::Move);
  EXPECT_EQ(cfg.workers, 3u);
  EXPECT_EQ(cfg.hash_retry.max_attempts, 2);
  EXPECT_EQ(cfg.hash_retry.base_delay, std::chrono::milliseconds(0));
  EXPECT_EQ(cfg.tag_stop_words, (std::vector<std::string>{"misc", "tmp"}));
}

TEST(ConfigTest, EmptyStopWordListDisablesFiltering) {
  const Config cfg = loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", "/srv/family"}, {"FAM_TAG_STOP_WORDS", ""}}));
  EXPECT_TRUE(cfg.tag_stop_words.empty());
}

TEST(ConfigTest, InvalidValuesAreRejected) {
  const std::string root = "/srv/family";
  EXPECT_THROW(loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", root}, {"FAM_MODE", "link"}})), ConfigError);
  EXPECT_THROW(loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", root}, {"FAM_WORKERS", "0"}})), ConfigError);
  EXPECT_THROW(loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", root}, {"FAM_WORKERS", "four"}})), ConfigError);
  EXPECT_THROW(loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", root}, {"FAM_HASH_ATTEMPTS", "3x"}})), ConfigError);
  EXPECT_THROW(loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", root}, {"FAM_HASH_BACKOFF_MS", "-5"}})), ConfigError);
}

TEST(ConfigTest, OutOfRangeValuesAreRejected) {
  const std::string root = "/srv/family";
  EXPECT_THROW(loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", root}, {"FAM_HASH_ATTEMPTS", "65"}})), ConfigError);
  EXPECT_THROW(loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", root}, {"FAM_HASH_ATTEMPTS", "21"}})), ConfigError);
  EXPECT_THROW(loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", root}, {"FAM_HASH_BACKOFF_MS", "60001"}})), ConfigError);
  EXPECT_THROW(loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", root}, {"FAM_WORKERS", "257"}})), ConfigError);

  const Config cfg = loadConfig(envFrom({{"FAM_ARCHIVE_ROOT", root},
                                          {"FAM_HASH_ATTEMPTS", "20"},
                                          {"FAM_HASH_BACKOFF_MS", "60000"}}));
  EXPECT_EQ(cfg.hash_retry.max_attempts, 20);
  EXPECT_EQ(cfg.hash_retry.base_delay, std::chrono::milliseconds(60000));
}

TEST(ConfigTest, SchemaLookup) {
  Config cfg;
  cfg.schema_path = "/definitely/not/here/schema.sql";
  EXPECT_THROW(findSchemaPath(cfg), ConfigError);

  cfg.schema_path.clear();
  EXPECT_TRUE(fs::exists(findSchemaPath(cfg)));
}

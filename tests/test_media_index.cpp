// =============================================================================
// Media Index Tests
// =============================================================================

#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MediaIndex.hpp"
#include "test_support.hpp"

#include <sqlite3.h>

#include <memory>
#include <set>

using namespace fam;
using famtest::TempDir;

class MediaIndexTest : public ::testing::Test {
protected:
  void SetUp() override {
    dbPath = (tmp / "index.db").string();
    initDatabase(dbPath, famtest::schemaPath());
    index = std::make_unique<MediaIndex>(dbPath);
  }

  static MediaRecord record(const std::string& fp, const std::string& dir, const std::string& name) {
    MediaRecord r;
    r.archive_dir = dir;
    r.archive_filename = name;
    r.fingerprint = fp;
    r.file_size = 42;
    r.file_date = "2024-07-21T10:00:00";
    r.ingested_at = "2024-08-01T09:00:00";
    return r;
  }

  TempDir tmp;
  std::string dbPath;
  std::unique_ptr<MediaIndex> index;
};

TEST_F(MediaIndexTest, InsertAndLookupByFingerprint) {
  MediaRecord r = record("fp1", "2024/07", "a.mp4");
  r.media_type = MediaType::Video;
  r.duration = 12.5;
  const int64_t id = index->insertMedia(r);

  auto found = index->findByFingerprint("fp1");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->id, id);
  EXPECT_EQ(found->archivePath(), "2024/07/a.mp4");
  EXPECT_EQ(found->media_type, MediaType::Video);
  EXPECT_EQ(found->file_size, 42);
  ASSERT_TRUE(found->duration.has_value());
  EXPECT_DOUBLE_EQ(*found->duration, 12.5);
  EXPECT_FALSE(found->exif_date.has_value());
  EXPECT_EQ(found->file_date, "2024-07-21T10:00:00");

  EXPECT_FALSE(index->findByFingerprint("fp2").has_value());
  EXPECT_EQ(index->fingerprintAt("2024/07", "a.mp4"), std::optional<std::string>("fp1"));
  EXPECT_FALSE(index->fingerprintAt("2024/07", "b.mp4").has_value());
}

TEST_F(MediaIndexTest, FingerprintIsUnique) {
  index->insertMedia(record("fp1", "2024/07", "a.jpg"));
  EXPECT_THROW(index->insertMedia(record("fp1", "2024/07", "b.jpg")), IndexWriteError);
  EXPECT_EQ(index->mediaCount(), 1);
}

TEST_F(MediaIndexTest, ArchiveLocationIsUnique) {
  index->insertMedia(record("fp1", "2024/07", "a.jpg"));
  EXPECT_THROW(index->insertMedia(record("fp2", "2024/07", "a.jpg")), IndexWriteError);
}

TEST_F(MediaIndexTest, AddSourceIsIdempotent) {
  const int64_t id = index->insertMedia(record("fp1", "2024/07", "a.jpg"));
  EXPECT_TRUE(index->addSource(id, "/card/evt1", "a.jpg"));
  EXPECT_FALSE(index->addSource(id, "/card/evt1", "a.jpg"));
  EXPECT_TRUE(index->addSource(id, "/card/evt2", "a.jpg"));

  EXPECT_EQ(index->sourcesFor(id), (std::vector<std::string>{"/card/evt1/a.jpg", "/card/evt2/a.jpg"}));
  EXPECT_EQ(index->mediaIdsBySourceDirectory("/card/evt2"), (std::vector<int64_t>{id}));
  EXPECT_TRUE(index->mediaIdsBySourceDirectory("/card").empty());
}

TEST_F(MediaIndexTest, AttachTagsIsSetUnion) {
  const int64_t id = index->insertMedia(record("fp1", "2024/07", "a.jpg"));
  EXPECT_EQ(index->attachTags(id, {"beach", "summer"}), 2);
  EXPECT_EQ(index->attachTags(id, {"summer", "beach"}), 0);
  EXPECT_EQ(index->attachTags(id, {"summer", "family", ""}), 1);

  const auto tags = index->tagsFor(id);
  EXPECT_EQ(std::set<std::string>(tags.begin(), tags.end()),
            (std::set<std::string>{"beach", "summer", "family"}));
  EXPECT_EQ(tags.size(), 3u);
}

TEST_F(MediaIndexTest, ReplaceTagsDropsPreviousMembership) {
  const int64_t a = index->insertMedia(record("fp1", "2024/07", "a.jpg"));
  const int64_t b = index->insertMedia(record("fp2", "2024/07", "b.jpg"));
  index->attachTags(a, {"old", "shared"});
  index->attachTags(b, {"shared"});

  index->replaceTags(a, {"new"});
  EXPECT_EQ(index->tagsFor(a), (std::vector<std::string>{"new"}));
  EXPECT_EQ(index->tagsFor(b), (std::vector<std::string>{"shared"}));

  index->replaceTags(a, {});
  EXPECT_TRUE(index->tagsFor(a).empty());
}

TEST_F(MediaIndexTest, UncommittedTransactionRollsBack) {
  {
    IndexTransaction tx(*index);
    const int64_t id = index->insertMedia(record("fp1", "2024/07", "a.jpg"));
    index->addSource(id, "/card", "a.jpg");
    index->attachTags(id, {"beach"});
  }
  EXPECT_EQ(index->mediaCount(), 0);
  EXPECT_TRUE(index->mediaIdsBySourceDirectory("/card").empty());

  {
    IndexTransaction tx(*index);
    index->insertMedia(record("fp1", "2024/07", "a.jpg"));
    tx.commit();
  }
  EXPECT_EQ(index->mediaCount(), 1);
}

TEST_F(MediaIndexTest, CommittedDataSurvivesReopen) {
  const int64_t id = index->insertMedia(record("fp1", "2024/07", "a.jpg"));
  index->attachTags(id, {"beach"});
  index.reset();

  initDatabase(dbPath, famtest::schemaPath());
  MediaIndex reopened(dbPath);
  EXPECT_EQ(reopened.mediaCount(), 1);
  EXPECT_EQ(reopened.allFingerprints(), (std::set<std::string>{"fp1"}));
  const auto details = reopened.allMediaWithDetails();
  ASSERT_EQ(details.size(), 1u);
  EXPECT_EQ(details[0].tags, (std::vector<std::string>{"beach"}));
}

TEST_F(MediaIndexTest, LocationsListEveryRecord) {
  index->insertMedia(record("fp1", "2024/07", "a.jpg"));
  index->insertMedia(record("fp2", "2019/01", "b.jpg"));
  const auto locs = index->allMediaWithLocations();
  ASSERT_EQ(locs.size(), 2u);
  EXPECT_EQ(locs[0].fingerprint, "fp1");
  EXPECT_EQ(locs[0].archive_path, "2024/07/a.jpg");
  EXPECT_EQ(locs[1].archive_path, "2019/01/b.jpg");
}

TEST(MediaIndexOpen, MissingDatabaseIsNotCreated) {
  TempDir tmp;
  EXPECT_THROW({ MediaIndex idx((tmp / "absent.db").string()); }, std::runtime_error);
  EXPECT_FALSE(std::filesystem::exists(tmp / "absent.db"));
}

TEST(InitDatabaseTest, RefusesNewerSchemaVersion) {
  TempDir tmp;
  const std::string dbPath = (tmp / "index.db").string();
  EXPECT_TRUE(initDatabase(dbPath, famtest::schemaPath()));
  EXPECT_TRUE(initDatabase(dbPath, famtest::schemaPath()));

  sqlite3* db = nullptr;
  ASSERT_EQ(sqlite3_open(dbPath.c_str(), &db), SQLITE_OK);
  ASSERT_EQ(sqlite3_exec(db, "PRAGMA user_version=99;", nullptr, nullptr, nullptr), SQLITE_OK);
  sqlite3_close(db);

  EXPECT_THROW(initDatabase(dbPath, famtest::schemaPath()), std::runtime_error);
}

// =============================================================================
// Reconciliation Tests
// =============================================================================

#include <gtest/gtest.h>
#include "core/ingest/IngestPipeline.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MediaIndex.hpp"
#include "core/reconcile/Reconciler.hpp"
#include "core/storage/ArchiveStore.hpp"
#include "test_support.hpp"

#include <memory>
#include <sstream>

using namespace fam;
using famtest::TempDir;
using famtest::writeFile;
namespace fs = std::filesystem;

class ReconcilerTest : public ::testing::Test {
protected:
  void SetUp() override {
    archive = tmp / "archive";
    source = tmp / "card";
    fs::create_directories(archive);
    const std::string dbPath = (tmp / "index.db").string();
    initDatabase(dbPath, famtest::schemaPath());
    index = std::make_unique<MediaIndex>(dbPath);

    RetryPolicy policy;
    policy.max_attempts = 1;
    policy.base_delay = std::chrono::milliseconds(0);
    hasher = std::make_unique<Hasher>(policy);

    const char* names[] = {"a.jpg", "b.jpg", "c.mp4", "d.png", "e.jpg"};
    for (const char* n : names) {
      writeFile(source / "evt" / n, std::string("content of ") + n);
      famtest::setModified(source / "evt" / n, 2022, 11, 3);
    }

    ArchiveStore store(archive);
    NullMetadataProbe probe;
    IngestOptions options;
    options.session_ts = "2024-08-01T10:00:00";
    IngestPipeline pipeline(*index, store, *hasher, probe, options);
    pipeline.ingestTree(source);
    ASSERT_EQ(pipeline.stats().imported, 5);
  }

  // Swaps an archived file for a link whose reads fail with EIO.
  bool makeUnreadable(const std::string& rel) {
    if (!fs::exists("/proc/self/mem")) return false;
    fs::remove(archive / rel);
    fs::create_symlink("/proc/self/mem", archive / rel);
    return true;
  }

  HashReport check(std::size_t workers = 4) {
    return reconcileHashes(archive, *index, *hasher, workers);
  }

  TempDir tmp;
  fs::path archive;
  fs::path source;
  std::unique_ptr<MediaIndex> index;
  std::unique_ptr<Hasher> hasher;
};

TEST_F(ReconcilerTest, FreshArchiveIsClean) {
  const auto report = check();
  EXPECT_TRUE(report.clean());
  EXPECT_EQ(report.files_checked, 5u);
  EXPECT_EQ(report.files_matched, 5u);
  EXPECT_EQ(report.index_records, 5u);
  EXPECT_TRUE(reconcilePaths(archive, *index).clean());
}

TEST_F(ReconcilerTest, RenamedFileIsReportedAsMovedOnly) {
  fs::rename(archive / "2022/11/b.jpg", archive / "2022/11/renamed.jpg");

  const auto report = check();
  ASSERT_EQ(report.moved.size(), 1u);
  EXPECT_EQ(report.moved[0].expected_path, "2022/11/b.jpg");
  EXPECT_EQ(report.moved[0].found_path, "2022/11/renamed.jpg");
  EXPECT_TRUE(report.missing.empty());
  EXPECT_TRUE(report.untracked.empty());
  EXPECT_FALSE(report.clean());

  // The path-only check cannot tell a rename apart.
  const auto paths = reconcilePaths(archive, *index);
  EXPECT_EQ(paths.missing, (std::vector<std::string>{"2022/11/b.jpg"}));
  EXPECT_EQ(paths.untracked, (std::vector<std::string>{"2022/11/renamed.jpg"}));
}

TEST_F(ReconcilerTest, DeletedFileIsMissing) {
  fs::remove(archive / "2022/11/c.mp4");
  const auto report = check();
  ASSERT_EQ(report.missing.size(), 1u);
  EXPECT_EQ(report.missing[0].path, "2022/11/c.mp4");
  EXPECT_TRUE(report.moved.empty());
  EXPECT_TRUE(report.untracked.empty());
}

TEST_F(ReconcilerTest, NewFileIsUntracked) {
  writeFile(archive / "2023/01/stray.jpg", "stray");
  writeFile(archive / "2023/01/readme.txt", "not media");
  const auto report = check();
  ASSERT_EQ(report.untracked.size(), 1u);
  EXPECT_EQ(report.untracked[0].path, "2023/01/stray.jpg");
  EXPECT_EQ(report.untracked[0].fingerprint, sha256File(archive / "2023/01/stray.jpg"));
  EXPECT_TRUE(report.missing.empty());
}

TEST_F(ReconcilerTest, OverwrittenFileIsChanged) {
  writeFile(archive / "2022/11/d.png", "edited in place");
  const auto report = check();
  ASSERT_EQ(report.changed.size(), 1u);
  EXPECT_EQ(report.changed[0].path, "2022/11/d.png");
  EXPECT_EQ(report.changed[0].found_fingerprint, sha256File(archive / "2022/11/d.png"));
  EXPECT_TRUE(report.missing.empty());
  EXPECT_TRUE(report.untracked.empty());
}

TEST_F(ReconcilerTest, ExtraCopyOfRecordedContentIsADuplicate) {
  fs::copy_file(archive / "2022/11/a.jpg", archive / "2022/11/a (1).jpg");
  const auto report = check();
  ASSERT_EQ(report.duplicate_copies.size(), 1u);
  EXPECT_EQ(report.duplicate_copies[0].path, "2022/11/a (1).jpg");
  EXPECT_TRUE(report.moved.empty());
  EXPECT_TRUE(report.untracked.empty());
}

TEST_F(ReconcilerTest, UnreadableRecordedFileIsAnErrorNotMissing) {
  if (!makeUnreadable("2022/11/d.png")) GTEST_SKIP() << "no /proc/self/mem";
  const auto report = check();
  ASSERT_EQ(report.errors.size(), 1u);
  EXPECT_EQ(report.errors[0].path, "2022/11/d.png");
  EXPECT_EQ(report.errors[0].attempts, 1);
  EXPECT_TRUE(report.missing.empty());
  EXPECT_TRUE(report.moved.empty());
  EXPECT_TRUE(report.changed.empty());
  EXPECT_TRUE(report.untracked.empty());
  EXPECT_EQ(report.files_checked, 5u);
}

TEST_F(ReconcilerTest, UnreadableRecordedFileWithIntactCopyIsNotMoved) {
  fs::copy_file(archive / "2022/11/a.jpg", archive / "2022/11/a_copy.jpg");
  if (!makeUnreadable("2022/11/a.jpg")) GTEST_SKIP() << "no /proc/self/mem";

  const auto report = check(2);
  ASSERT_EQ(report.errors.size(), 1u);
  EXPECT_EQ(report.errors[0].path, "2022/11/a.jpg");
  EXPECT_TRUE(report.moved.empty());
  EXPECT_TRUE(report.missing.empty());
  ASSERT_EQ(report.duplicate_copies.size(), 1u);
  EXPECT_EQ(report.duplicate_copies[0].path, "2022/11/a_copy.jpg");
}

TEST_F(ReconcilerTest, WorkerCountDoesNotChangeTheReport) {
  fs::rename(archive / "2022/11/b.jpg", archive / "2022/11/z.jpg");
  fs::remove(archive / "2022/11/c.mp4");
  writeFile(archive / "2023/01/stray.jpg", "stray");

  const auto one = check(1);
  const auto many = check(8);
  std::ostringstream a, b;
  writeReconcileReport(one, a);
  writeReconcileReport(many, b);
  EXPECT_EQ(a.str(), b.str());
}

TEST_F(ReconcilerTest, ProgressIsReportedForEveryFile) {
  writeFile(archive / "2023/01/stray.jpg", "stray");
  std::size_t calls = 0, indexed = 0, last = 0;
  reconcileHashes(archive, *index, *hasher, 3, [&](const HashProgress& p) {
    ++calls;
    EXPECT_EQ(p.done, calls);
    EXPECT_EQ(p.total, 6u);
    if (p.indexed) ++indexed;
    last = p.done;
  });
  EXPECT_EQ(calls, 6u);
  EXPECT_EQ(indexed, 5u);
  EXPECT_EQ(last, 6u);
}

TEST_F(ReconcilerTest, ReportCsvListsEveryFinding) {
  fs::remove(archive / "2022/11/c.mp4");
  writeFile(archive / "2023/01/stray.jpg", "stray");
  std::ostringstream os;
  writeReconcileReport(check(), os);

  const std::string csv = os.str();
  EXPECT_EQ(csv.rfind("kind,path,detail,fingerprint\n", 0), 0u);
  EXPECT_NE(csv.find("missing,2022/11/c.mp4,,"), std::string::npos);
  EXPECT_NE(csv.find("untracked,2023/01/stray.jpg,,"), std::string::npos);
}

TEST_F(ReconcilerTest, ManifestIsSortedAndIndependentOfWorkers) {
  std::ostringstream one, many;
  const auto s1 = writeHashManifest(archive, one, *hasher, 1);
  const auto s8 = writeHashManifest(archive, many, *hasher, 8);

  EXPECT_EQ(s1.files, 5u);
  EXPECT_EQ(s1.errors, 0u);
  EXPECT_EQ(s8.files, 5u);
  EXPECT_EQ(one.str(), many.str());

  std::istringstream lines(one.str());
  std::string first;
  std::getline(lines, first);
  EXPECT_EQ(first, "2022/11/a.jpg," + sha256File(archive / "2022/11/a.jpg"));
}

TEST(PathReportTest, CsvRows) {
  PathReport report;
  report.missing = {"2020/01/a.jpg"};
  report.untracked = {"2020/01/b, c.jpg"};
  std::ostringstream os;
  writePathReport(report, os);
  EXPECT_EQ(os.str(), "kind,path\nmissing,2020/01/a.jpg\nuntracked,\"2020/01/b, c.jpg\"\n");
}

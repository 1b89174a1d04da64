// =============================================================================
// Placement Resolver Tests
// =============================================================================

#include <gtest/gtest.h>
#include "core/Errors.hpp"
#include "core/storage/PlacementResolver.hpp"

#include <stdexcept>

using namespace fam;

namespace {
const std::string kFpA = "aaaaaaaa11111111aaaaaaaa11111111aaaaaaaa11111111aaaaaaaa11111111";
const std::string kFpB = "bbbbbbbb22222222bbbbbbbb22222222bbbbbbbb22222222bbbbbbbb22222222";
const std::string kFpC = "cccccccc33333333cccccccc33333333cccccccc33333333cccccccc33333333";
}

TEST(PlacementTest, FreeNameIsUsedAsIs) {
  const auto p = resolvePlacement("IMG_0001.jpg", kFpA, {});
  EXPECT_EQ(p.filename, "IMG_0001.jpg");
  EXPECT_FALSE(p.reused);
}

TEST(PlacementTest, SameContentReusesName) {
  const NameClaims claims = {{"IMG_0001.jpg", kFpA}};
  const auto p = resolvePlacement("IMG_0001.jpg", kFpA, claims);
  EXPECT_EQ(p.filename, "IMG_0001.jpg");
  EXPECT_TRUE(p.reused);
}

TEST(PlacementTest, OtherContentGetsFingerprintSuffix) {
  const NameClaims claims = {{"IMG_0001.jpg", kFpA}};
  const auto p = resolvePlacement("IMG_0001.jpg", kFpB, claims);
  EXPECT_EQ(p.filename, "IMG_0001_bbbbbbbb.jpg");
  EXPECT_FALSE(p.reused);
}

TEST(PlacementTest, UnidentifiedOccupantForcesSuffix) {
  const NameClaims claims = {{"clip.MOV", ""}};
  EXPECT_EQ(resolvePlacement("clip.MOV", kFpC, claims).filename, "clip_cccccccc.MOV");
}

TEST(PlacementTest, SuffixedNameAlreadyHoldingSameContentIsReused) {
  const NameClaims claims = {{"a.jpg", kFpA}, {"a_bbbbbbbb.jpg", kFpB}};
  const auto p = resolvePlacement("a.jpg", kFpB, claims);
  EXPECT_EQ(p.filename, "a_bbbbbbbb.jpg");
  EXPECT_TRUE(p.reused);
}

TEST(PlacementTest, SuffixedNameHeldByOtherContentIsFatal) {
  const NameClaims claims = {{"a.jpg", kFpA}, {"a_bbbbbbbb.jpg", kFpC}};
  EXPECT_THROW(resolvePlacement("a.jpg", kFpB, claims), CollisionError);
}

TEST(PlacementTest, SuffixKeepsOnlyLastExtension) {
  EXPECT_EQ(suffixedName("holiday.tar.jpg", kFpA), "holiday.tar_aaaaaaaa.jpg");
}

TEST(PlacementTest, ScratchTracksClaimsPerDirectory) {
  PlacementScratch scratch;
  scratch.claim("2024/07", "a.jpg", kFpA);
  EXPECT_EQ(scratch.claimsFor("2024/07").count("a.jpg"), 1u);
  EXPECT_TRUE(scratch.claimsFor("2024/08").empty());

  scratch.release("2024/07", "a.jpg");
  EXPECT_TRUE(scratch.claimsFor("2024/07").empty());
  scratch.release("1999/01", "never.jpg");
}

TEST(ArchiveDirectoryTest, ExifDateTakesPriority) {
  EXPECT_EQ(archiveDirectoryFor(std::string("2019-03-04T08:15:00"), "2024-07-21T10:00:00"), "2019/03");
}

TEST(ArchiveDirectoryTest, FallsBackToFileDate) {
  EXPECT_EQ(archiveDirectoryFor(std::nullopt, "2024-07-21T10:00:00"), "2024/07");
  EXPECT_EQ(archiveDirectoryFor(std::string("0000:00:00 00:00:00"), "2024-12-01T00:00:00"), "2024/12");
  EXPECT_EQ(archiveDirectoryFor(std::string("2019-13-01T00:00:00"), "2024-01-31T00:00:00"), "2024/01");
}

TEST(ArchiveDirectoryTest, NoUsableDateIsAnError) {
  EXPECT_THROW(archiveDirectoryFor(std::nullopt, "yesterday"), std::invalid_argument);
}

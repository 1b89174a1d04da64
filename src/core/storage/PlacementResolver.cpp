#include "PlacementResolver.hpp"
#include "core/Errors.hpp"

#include <cctype>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace fam {

static constexpr std::size_t kSuffixLen = 8;

std::string suffixedName(const std::string& baseName, const std::string& fingerprint) {
  const std::filesystem::path p(baseName);
  return p.stem().string() + "_" + fingerprint.substr(0, kSuffixLen) + p.extension().string();
}

Placement resolvePlacement(const std::string& baseName,
                           const std::string& fingerprint,
                           const NameClaims& claims) {
  auto it = claims.find(baseName);
  if (it == claims.end()) return {baseName, false};
  if (it->second == fingerprint) return {baseName, true};

  const std::string alt = suffixedName(baseName, fingerprint);
  auto altIt = claims.find(alt);
  if (altIt == claims.end()) return {alt, false};
  if (altIt->second == fingerprint) return {alt, true};

  throw CollisionError("archive name " + alt + " for " + fingerprint +
                       " is already held by " +
                       (altIt->second.empty() ? std::string("unidentified content") : altIt->second));
}

// Year and month of an ISO-8601 date, if the prefix is well formed.
static std::optional<std::pair<int, int>> yearMonth(const std::string& iso) {
  if (iso.size() < 7 || iso[4] != '-') return std::nullopt;
  for (int i : {0, 1, 2, 3, 5, 6}) {
    if (!std::isdigit(static_cast<unsigned char>(iso[i]))) return std::nullopt;
  }
  const int year = std::stoi(iso.substr(0, 4));
  const int month = std::stoi(iso.substr(5, 2));
  if (month < 1 || month > 12) return std::nullopt;
  return std::make_pair(year, month);
}

std::string archiveDirectoryFor(const std::optional<std::string>& exifDate,
                                const std::string& fileDate) {
  std::optional<std::pair<int, int>> ym;
  if (exifDate) ym = yearMonth(*exifDate);
  if (!ym) ym = yearMonth(fileDate);
  if (!ym) throw std::invalid_argument("unparseable capture date: " + fileDate);

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d/%02d", ym->first, ym->second);
  return buf;
}

} // namespace fam

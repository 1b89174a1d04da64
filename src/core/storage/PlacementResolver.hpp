#pragma once
#include <map>
#include <optional>
#include <string>

namespace fam {

// File name -> fingerprint of the content occupying it. An empty fingerprint
// means the name is taken by content we have not identified.
using NameClaims = std::map<std::string, std::string>;

struct Placement {
  std::string filename;
  bool        reused = false;  // name already holds this fingerprint
};

// Picks the archive file name for `fingerprint` in a directory whose taken
// names are `claims`:
//   free base name           -> base name
//   base name, same content  -> base name, reused
//   base name, other content -> stem_<first 8 hex of fingerprint>.ext
// Throws CollisionError when the suffixed name is held by other content too.
Placement resolvePlacement(const std::string& baseName,
                           const std::string& fingerprint,
                           const NameClaims& claims);

// "stem_xxxxxxxx.ext" for baseName "stem.ext".
std::string suffixedName(const std::string& baseName, const std::string& fingerprint);

// Claims of every archive directory touched in one ingestion session, so
// names handed out earlier in the run are honoured before they reach the
// index or the disk.
class PlacementScratch {
public:
  NameClaims& claimsFor(const std::string& archiveDir) { return claims_[archiveDir]; }

  void claim(const std::string& archiveDir, const std::string& filename,
             const std::string& fingerprint) {
    claims_[archiveDir][filename] = fingerprint;
  }

  void release(const std::string& archiveDir, const std::string& filename) {
    auto it = claims_.find(archiveDir);
    if (it != claims_.end()) it->second.erase(filename);
  }

private:
  std::map<std::string, NameClaims> claims_;
};

// "YYYY/MM" from the EXIF date when it parses, otherwise from the file date.
// Both are ISO-8601 "YYYY-MM-DDTHH:MM:SS" strings.
std::string archiveDirectoryFor(const std::optional<std::string>& exifDate,
                                const std::string& fileDate);

} // namespace fam

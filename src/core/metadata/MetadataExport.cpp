#include "MetadataExport.hpp"
#include "MediaIndex.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using nlohmann::json;

namespace fam {

std::size_t exportMetadataJsonl(const MediaIndex& index, const std::filesystem::path& path) {
  namespace fs = std::filesystem;
  if (path.has_parent_path()) fs::create_directories(path.parent_path());

  const auto records = index.allMediaWithDetails();
  const fs::path tmp = path.string() + ".tmp";
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) throw std::runtime_error("cannot write " + tmp.string());

    for (const auto& d : records) {
      const MediaRecord& r = d.record;
      json line = {
        {"archive_path", r.archivePath()},
        {"hash",         r.fingerprint},
        {"tags",         d.tags},
        {"sources",      d.sources},
        {"exif_date",    r.exif_date ? json(*r.exif_date) : json(nullptr)},
        {"file_date",    r.file_date},
        {"ingested_at",  r.ingested_at},
      };
      if (r.media_type == MediaType::Video && r.duration) line["duration"] = *r.duration;
      os << line.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    }
    os.flush();
    if (!os) throw std::runtime_error("write failed: " + tmp.string());
  }
  fs::rename(tmp, path);
  return records.size();
}

} // namespace fam

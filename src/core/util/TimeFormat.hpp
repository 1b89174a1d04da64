#pragma once
#include <ctime>
#include <filesystem>
#include <string>

namespace fam {

// Local time as "YYYY-MM-DDTHH:MM:SS".
std::string isoLocal(std::time_t t);

std::string isoNow();

// Modification time of a file, local, ISO-8601.
std::string fileModificationDate(const std::filesystem::path& file);

// "20240131_154502" form of an ISO timestamp, for file names.
std::string compactTimestamp(const std::string& iso);

} // namespace fam

#pragma once
#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace fam {

// Console logger as the spdlog default. Level from FAM_LOG_LEVEL
// (trace, debug, info, warn, error), info otherwise.
void initLogging();

// Plain-text logger writing only the message to `file`, truncating it.
std::shared_ptr<spdlog::logger> openReportLog(const std::string& name, const std::filesystem::path& file);

} // namespace fam

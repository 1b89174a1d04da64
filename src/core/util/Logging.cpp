#include "Logging.hpp"

#include <cstdlib>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fam {

void initLogging() {
  auto console = spdlog::stdout_color_mt("family-archive");
  console->set_pattern("[%H:%M:%S] [%^%l%$] %v");
  spdlog::set_default_logger(console);

  const char* level = std::getenv("FAM_LOG_LEVEL");
  spdlog::set_level(level ? spdlog::level::from_str(level) : spdlog::level::info);
}

std::shared_ptr<spdlog::logger> openReportLog(const std::string& name, const std::filesystem::path& file) {
  if (file.has_parent_path()) std::filesystem::create_directories(file.parent_path());
  auto logger = spdlog::basic_logger_mt(name, file.string(), /*truncate=*/true);
  logger->set_pattern("%v");
  logger->set_level(spdlog::level::info);
  return logger;
}

} // namespace fam

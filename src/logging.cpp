#include "logging.hpp"

#include <filesystem>
#include <map>
#include <stdexcept>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

void configureLogging(const std::string& level, const std::string& logFile) {
  if (!logFile.empty()) {
    // A logger may already be registered under this name (tests run in one process).
    std::string loggerName = fs::path(logFile).filename().string();
    auto logger = spdlog::get(loggerName);
    if (!logger) {
      fs::path logDir = fs::path(logFile).parent_path();
      if (!logDir.empty() && !fs::exists(logDir)) {
        fs::create_directories(logDir);
      }
      logger = spdlog::basic_logger_mt(loggerName, logFile);
    }
    spdlog::set_default_logger(logger);
  } else {
    // stdout carries the program's JSON output.
    auto logger = spdlog::get("regionextract");
    if (!logger) logger = spdlog::stderr_color_mt("regionextract");
    spdlog::set_default_logger(logger);
  }

  static const std::map<std::string, spdlog::level::level_enum> levels{
    {"none", spdlog::level::off},
    {"error", spdlog::level::err},
    {"warning", spdlog::level::warn},
    {"information", spdlog::level::info},
    {"debug", spdlog::level::debug},
  };

  auto which = levels.find(level);
  if (which == levels.end()) {
    throw std::runtime_error("Unknown log level: " + level);
  }
  spdlog::set_level(which->second);
}

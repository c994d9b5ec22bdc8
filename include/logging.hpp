#pragma once

#include <string>

// Sets the level of the default spdlog logger from one of
// none|error|warning|information|debug, and, when logFile is non-empty,
// replaces the default logger with one writing to that file; otherwise the
// default logger writes to stderr.
// Throws std::runtime_error for an unknown level name.
void configureLogging(const std::string& level, const std::string& logFile = std::string());

#pragma once

#include "extraction_context.hpp"
#include "hierarchy.hpp"

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

// {"states": [{"name", "lgas": [{"name", "code", "wards": [{"name", "code"}]}]}]}
nlohmann::json documentToJson(const Document& document);

// Inverse of documentToJson. Throws std::runtime_error on a malformed tree.
Document documentFromJson(const nlohmann::json& j);

// {"total_states", "total_lgas", "total_wards", "states"}
nlohmann::json statisticsToJson(const Statistics& stats);

nlohmann::json countersToJson(const RowCounters& counters);

// Writes the document as pretty-printed JSON (2-space indent).
// Throws std::runtime_error if the file cannot be written.
void saveDocumentJson(const Document& document, const std::string& path);

// Throws std::runtime_error if the file cannot be read or parsed.
Document loadDocumentJson(const std::string& path);

// "<stem>_extracted_<YYYYmmdd_HHMMSS>.json" for the given input path, local time.
std::string makeOutputFileName(const std::string& inputPath,
                               std::chrono::system_clock::time_point when);

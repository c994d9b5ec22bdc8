#pragma once

#include "extraction_config.hpp"
#include "table_extractor.hpp"

#include <string>

enum class RowKind {
  Noise,
  TableHeader,
  RegionBanner,
  Level2Record,
  Level3Record,
};

const char* rowKindName(RowKind kind);

// Outcome of classifying one table row or text line. Names and codes are
// normalized (trimmed, whitespace-collapsed, upper-cased).
struct RowClassification {
  RowKind kind = RowKind::Noise;
  // Level1 name for a banner, Level2/Level3 name for a record.
  std::string name;
  std::string code;
  // A Level2Record may carry the first Level3 of that Level2 on the same row.
  std::string childName;
  std::string childCode;

  bool hasChild() const { return !childName.empty(); }
};

// A short token (<= maxLength) made of letters and digits with at least one digit.
bool isPlausibleCode(const std::string& token, size_t maxLength);

bool isNumericCode(const std::string& token);

bool isTableHeader(const Row& row, const ExtractionConfig& config);

// The Level1 name a banner line stands for: upper-cased, with banner keywords
// ("STATE") and surrounding punctuation removed from both ends.
std::string bannerLevel1Name(const std::string& line, const ExtractionConfig& config);

// Classifies a table row. hasCurrentLevel2 disambiguates two-cell name+code
// rows: the first such row after a boundary is a Level2, later ones are Level3.
RowClassification classifyRow(const Row& row, const ExtractionConfig& config, bool hasCurrentLevel2);

// Classifies a free-text line; yields only Noise or RegionBanner.
RowClassification classifyTextLine(const std::string& line, const ExtractionConfig& config);

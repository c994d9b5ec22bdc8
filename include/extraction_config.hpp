#pragma once

#include <string>
#include <vector>

// Designated column positions of the corpus layout
// [level2 name, level2 code, level3 name, ..., level3 code].
struct TableLayout {
  size_t level2NameColumn = 0;
  size_t level2CodeColumn = 1;
  size_t level3NameColumn = 2;
};

struct ExtractionConfig {
  // Ordered Level1 names. Enables pre-seeding and the code-reset heuristic.
  std::vector<std::string> referenceLevel1;
  bool preseedFirstLevel1 = true;
  // Accept banners that are not in referenceLevel1 (always accepted when the list is empty).
  bool acceptUnlistedBanners = false;
  // Keep the code-reset heuristic active while the current Level1 came from a banner.
  bool resetAfterBanner = false;
  // Codes take part in Level2/Level3 identity keys.
  bool includeCodeInIdentity = true;

  std::vector<std::string> tableHeaderKeywords;
  size_t minHeaderKeywordMatches = 2;

  // Trailing words stripped from a banner to obtain the Level1 name ("ABIA STATE").
  std::vector<std::string> bannerKeywords;
  // Words marking a section divider rather than a Level1 banner.
  std::vector<std::string> bannerRejectKeywords;
  size_t minBannerLength = 3;
  size_t maxBannerLength = 40;
  double bannerUppercaseRatio = 0.8;
  double bannerAlphaRatio = 0.7;

  size_t maxCodeLength = 5;

  TableLayout layout;

  ExtractionConfig();
};

// Normalizes every name and keyword list in place (trim, collapse, upper-case)
// and drops empty entries.
void normalizeConfig(ExtractionConfig& config);

// The 36 states and FCT, alphabetical.
std::vector<std::string> defaultReferenceLevel1();

// Loads a JSON config file. Keys absent from the file keep their defaults.
// Throws std::runtime_error on unreadable or malformed input.
ExtractionConfig loadExtractionConfig(const std::string& path);

// Same as loadExtractionConfig, from an in-memory JSON document.
ExtractionConfig parseExtractionConfig(const std::string& jsonText);

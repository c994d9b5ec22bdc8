#include "extraction_config.hpp"

#include "text_util.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

std::vector<std::string> normalizedList(const std::vector<std::string>& in) {
  std::vector<std::string> out;
  out.reserve(in.size());
  for (const auto& s : in) {
    std::string n = normalizeName(s);
    if (!n.empty()) out.push_back(n);
  }
  return out;
}

template <typename T>
void readKey(const json& j, const char* key, T& target) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return;
  try {
    target = it->get<T>();
  } catch (const json::exception& e) {
    throw std::runtime_error(std::string("Invalid value for config key '") + key + "': " + e.what());
  }
}

} // namespace

ExtractionConfig::ExtractionConfig()
  : referenceLevel1(defaultReferenceLevel1()),
    tableHeaderKeywords{"LGA NAME", "LGA CODE", "WARD NAME", "WARD CODE", "S/N", "STATE NAME", "STATE CODE"},
    bannerKeywords{"STATE"},
    bannerRejectKeywords{"LGA", "LGAS", "WARD", "WARDS", "CODE", "CODES", "NAME", "TOTAL", "PAGE",
                         "LIST", "S/N", "POLLING", "UNIT", "UNITS", "REGISTRATION", "AREA", "AREAS",
                         "SUMMARY", "CONTINUED"} {}

void normalizeConfig(ExtractionConfig& config) {
  config.referenceLevel1 = normalizedList(config.referenceLevel1);
  config.tableHeaderKeywords = normalizedList(config.tableHeaderKeywords);
  config.bannerKeywords = normalizedList(config.bannerKeywords);
  config.bannerRejectKeywords = normalizedList(config.bannerRejectKeywords);
}

std::vector<std::string> defaultReferenceLevel1() {
  return {
    "ABIA", "ADAMAWA", "AKWA IBOM", "ANAMBRA", "BAUCHI", "BAYELSA",
    "BENUE", "BORNO", "CROSS RIVER", "DELTA", "EBONYI", "EDO",
    "EKITI", "ENUGU", "FCT", "GOMBE", "IMO", "JIGAWA",
    "KADUNA", "KANO", "KATSINA", "KEBBI", "KOGI", "KWARA",
    "LAGOS", "NASARAWA", "NIGER", "OGUN", "ONDO", "OSUN",
    "OYO", "PLATEAU", "RIVERS", "SOKOTO", "TARABA", "YOBE",
    "ZAMFARA"
  };
}

ExtractionConfig parseExtractionConfig(const std::string& jsonText) {
  const json j = json::parse(jsonText, nullptr, false);
  if (j.is_discarded()) {
    throw std::runtime_error("Config is not valid JSON");
  }
  if (!j.is_object()) {
    throw std::runtime_error("Config must be a JSON object");
  }

  ExtractionConfig config;
  readKey(j, "reference_level1", config.referenceLevel1);
  readKey(j, "preseed_first_level1", config.preseedFirstLevel1);
  readKey(j, "accept_unlisted_banners", config.acceptUnlistedBanners);
  readKey(j, "reset_after_banner", config.resetAfterBanner);
  readKey(j, "include_code_in_identity", config.includeCodeInIdentity);
  readKey(j, "table_header_keywords", config.tableHeaderKeywords);
  readKey(j, "min_header_keyword_matches", config.minHeaderKeywordMatches);
  readKey(j, "banner_keywords", config.bannerKeywords);
  readKey(j, "banner_reject_keywords", config.bannerRejectKeywords);
  readKey(j, "min_banner_length", config.minBannerLength);
  readKey(j, "max_banner_length", config.maxBannerLength);
  readKey(j, "banner_uppercase_ratio", config.bannerUppercaseRatio);
  readKey(j, "banner_alpha_ratio", config.bannerAlphaRatio);
  readKey(j, "max_code_length", config.maxCodeLength);

  auto layout = j.find("layout");
  if (layout != j.end() && !layout->is_null()) {
    if (!layout->is_object()) {
      throw std::runtime_error("Config key 'layout' must be an object");
    }
    readKey(*layout, "level2_name_column", config.layout.level2NameColumn);
    readKey(*layout, "level2_code_column", config.layout.level2CodeColumn);
    readKey(*layout, "level3_name_column", config.layout.level3NameColumn);
  }

  normalizeConfig(config);
  if (config.minBannerLength > config.maxBannerLength) {
    throw std::runtime_error("min_banner_length exceeds max_banner_length");
  }
  if (config.maxCodeLength == 0) {
    throw std::runtime_error("max_code_length must be positive");
  }
  return config;
}

ExtractionConfig loadExtractionConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot open config file: " + path);
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return parseExtractionConfig(buf.str());
}

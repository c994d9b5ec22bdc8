#include "json_export.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

const json& member(const json& j, const char* key, const char* where) {
  if (!j.is_object()) {
    throw std::runtime_error(std::string("Expected an object for ") + where);
  }
  auto it = j.find(key);
  if (it == j.end()) {
    throw std::runtime_error(std::string("Missing '") + key + "' in " + where);
  }
  return *it;
}

std::string stringMember(const json& j, const char* key, const char* where) {
  const json& v = member(j, key, where);
  if (!v.is_string()) {
    throw std::runtime_error(std::string("'") + key + "' in " + where + " must be a string");
  }
  return v.get<std::string>();
}

const json& arrayMember(const json& j, const char* key, const char* where) {
  const json& v = member(j, key, where);
  if (!v.is_array()) {
    throw std::runtime_error(std::string("'") + key + "' in " + where + " must be an array");
  }
  return v;
}

} // namespace

json documentToJson(const Document& document) {
  json states = json::array();
  for (const auto& l1 : document.level1) {
    json lgas = json::array();
    for (const auto& l2 : l1.level2) {
      json wards = json::array();
      for (const auto& l3 : l2.level3) {
        wards.push_back({{"name", l3.name}, {"code", l3.code}});
      }
      lgas.push_back({{"name", l2.name}, {"code", l2.code}, {"wards", std::move(wards)}});
    }
    states.push_back({{"name", l1.name}, {"lgas", std::move(lgas)}});
  }
  return json{{"states", std::move(states)}};
}

Document documentFromJson(const json& j) {
  Document document;
  for (const auto& s : arrayMember(j, "states", "document")) {
    Level1 l1;
    l1.name = stringMember(s, "name", "state");
    for (const auto& l : arrayMember(s, "lgas", "state")) {
      Level2 l2;
      l2.name = stringMember(l, "name", "lga");
      l2.code = stringMember(l, "code", "lga");
      for (const auto& w : arrayMember(l, "wards", "lga")) {
        l2.level3.push_back(Level3{stringMember(w, "name", "ward"), stringMember(w, "code", "ward")});
      }
      l1.level2.push_back(std::move(l2));
    }
    document.level1.push_back(std::move(l1));
  }
  return document;
}

json statisticsToJson(const Statistics& stats) {
  return json{
    {"total_states", stats.level1Count},
    {"total_lgas", stats.level2Count},
    {"total_wards", stats.level3Count},
    {"states", stats.level1Names},
  };
}

json countersToJson(const RowCounters& counters) {
  return json{
    {"pages", counters.pages},
    {"table_rows", counters.tableRows},
    {"noise_rows", counters.noiseRows},
    {"header_rows", counters.headerRows},
    {"level2_records", counters.level2Records},
    {"level3_records", counters.level3Records},
    {"orphans_dropped", counters.orphansDropped},
    {"exhausted_dropped", counters.exhaustedDropped},
    {"banners_accepted", counters.bannersAccepted},
    {"code_resets", counters.codeResets},
  };
}

void saveDocumentJson(const Document& document, const std::string& path) {
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (!parent.empty() && !std::filesystem::exists(parent)) {
    std::filesystem::create_directories(parent);
  }
  std::ofstream ofs(path);
  if (!ofs) {
    throw std::runtime_error("Cannot write " + path);
  }
  ofs << documentToJson(document).dump(2) << "\n";
  if (!ofs) {
    throw std::runtime_error("Failed writing " + path);
  }
  spdlog::info("Data saved to {}", path);
}

Document loadDocumentJson(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) {
    throw std::runtime_error("Cannot open " + path);
  }
  json j = json::parse(ifs, nullptr, false);
  if (j.is_discarded()) {
    throw std::runtime_error(path + " is not valid JSON");
  }
  return documentFromJson(j);
}

std::string makeOutputFileName(const std::string& inputPath,
                               std::chrono::system_clock::time_point when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm local{};
  localtime_r(&t, &local);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
  return std::filesystem::path(inputPath).stem().string() + "_extracted_" + stamp + ".json";
}

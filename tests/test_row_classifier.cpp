#include <catch2/catch.hpp>

#include "row_classifier.hpp"

#include <string>

namespace {

ExtractionConfig unlistedConfig() {
  ExtractionConfig config;
  config.referenceLevel1.clear();
  return config;
}

} // namespace

TEST_CASE("rows with fewer than two filled cells are noise", "[classifier]") {
  ExtractionConfig config;
  REQUIRE(classifyRow({}, config, false).kind == RowKind::Noise);
  REQUIRE(classifyRow({std::string(""), std::nullopt, std::string("   ")}, config, false).kind == RowKind::Noise);
  REQUIRE(classifyRow({std::string("ABA NORTH"), std::nullopt}, config, false).kind == RowKind::Noise);
}

TEST_CASE("header rows need two column keywords", "[classifier]") {
  ExtractionConfig config;
  Row header{std::string("LGA Name"), std::string("LGA Code"), std::string("Ward Name"),
             std::nullopt, std::nullopt, std::string("Ward Code")};
  REQUIRE(isTableHeader(header, config));
  REQUIRE(classifyRow(header, config, false).kind == RowKind::TableHeader);

  Row single{std::string("S/N"), std::string("ABA")};
  REQUIRE_FALSE(isTableHeader(single, config));
}

TEST_CASE("plausible codes are short and carry a digit", "[classifier]") {
  REQUIRE(isPlausibleCode("01", 5));
  REQUIRE(isPlausibleCode("A12", 5));
  REQUIRE(isPlausibleCode("12345", 5));
  REQUIRE_FALSE(isPlausibleCode("123456", 5));
  REQUIRE_FALSE(isPlausibleCode("ABC", 5));
  REQUIRE_FALSE(isPlausibleCode("1-2", 5));
  REQUIRE_FALSE(isPlausibleCode("", 5));

  REQUIRE(isNumericCode("007"));
  REQUIRE_FALSE(isNumericCode("A12"));
}

TEST_CASE("row kinds have stable names for traces", "[classifier]") {
  REQUIRE(std::string(rowKindName(RowKind::Level3Record)) == "level3-record");
  REQUIRE(std::string(rowKindName(RowKind::TableHeader)) == "table-header");
}

TEST_CASE("wide rows carry a Level2 and its first Level3", "[classifier]") {
  ExtractionConfig config;
  Row row{std::string(" Aba  North "), std::string("01"), std::string("Ariaria"),
          std::nullopt, std::nullopt, std::string("05")};

  RowClassification c = classifyRow(row, config, true);
  REQUIRE(c.kind == RowKind::Level2Record);
  REQUIRE(c.name == "ABA NORTH");
  REQUIRE(c.code == "01");
  REQUIRE(c.hasChild());
  REQUIRE(c.childName == "ARIARIA");
  REQUIRE(c.childCode == "05");
}

TEST_CASE("continuation rows with empty Level2 columns are Level3", "[classifier]") {
  ExtractionConfig config;
  Row row{std::nullopt, std::string(""), std::string("Eziama"),
          std::nullopt, std::nullopt, std::string("06")};

  RowClassification c = classifyRow(row, config, false);
  REQUIRE(c.kind == RowKind::Level3Record);
  REQUIRE(c.name == "EZIAMA");
  REQUIRE(c.code == "06");
}

TEST_CASE("two-cell name and code rows depend on the current Level2", "[classifier]") {
  ExtractionConfig config;
  Row row{std::string("Umuahia"), std::string("03")};

  REQUIRE(classifyRow(row, config, false).kind == RowKind::Level2Record);
  RowClassification c = classifyRow(row, config, true);
  REQUIRE(c.kind == RowKind::Level3Record);
  REQUIRE(c.name == "UMUAHIA");
  REQUIRE(c.code == "03");
}

TEST_CASE("shape rules handle serial columns and shifted Level3 rows", "[classifier]") {
  ExtractionConfig config;

  RowClassification serial = classifyRow(
    {std::string("1"), std::string("Aba South"), std::string("02"), std::string("Asa")}, config, false);
  REQUIRE(serial.kind == RowKind::Level2Record);
  REQUIRE(serial.name == "ABA SOUTH");
  REQUIRE(serial.code == "02");
  REQUIRE_FALSE(serial.hasChild());

  RowClassification ward = classifyRow(
    {std::string("Aba North"), std::string("Ariaria"), std::string("05")}, config, true);
  REQUIRE(ward.kind == RowKind::Level3Record);
  REQUIRE(ward.name == "ARIARIA");
  REQUIRE(ward.code == "05");

  REQUIRE(classifyRow({std::string("Abia"), std::string("State")}, config, false).kind == RowKind::Noise);
}

TEST_CASE("reference names and STATE banners are region banners", "[classifier][banner]") {
  ExtractionConfig config;

  RowClassification c = classifyTextLine("   ABIA STATE  ", config);
  REQUIRE(c.kind == RowKind::RegionBanner);
  REQUIRE(c.name == "ABIA");

  c = classifyTextLine("Cross River State", config);
  REQUIRE(c.kind == RowKind::RegionBanner);
  REQUIRE(c.name == "CROSS RIVER");

  REQUIRE(bannerLevel1Name("Abia State:", config) == "ABIA");
  REQUIRE(bannerLevel1Name("- STATE -", config).empty());
}

TEST_CASE("banner heuristic enforces length, digits, case and reject words", "[classifier][banner]") {
  ExtractionConfig config = unlistedConfig();

  RowClassification c = classifyTextLine("NORTH CENTRAL", config);
  REQUIRE(c.kind == RowKind::RegionBanner);
  REQUIRE(c.name == "NORTH CENTRAL");

  REQUIRE(classifyTextLine("LIST OF WARDS", config).kind == RowKind::Noise);
  REQUIRE(classifyTextLine("ABIA 2023", config).kind == RowKind::Noise);
  REQUIRE(classifyTextLine("Abia north", config).kind == RowKind::Noise);
  REQUIRE(classifyTextLine("AB", config).kind == RowKind::Noise);
  REQUIRE(classifyTextLine(std::string(41, 'A'), config).kind == RowKind::Noise);
  REQUIRE(classifyTextLine("STATE", config).kind == RowKind::Noise);
  REQUIRE(classifyTextLine("", config).kind == RowKind::Noise);
}

#include <catch2/catch.hpp>

#include "table_extractor.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {

WordBox word(int page, double xMin, double yMin, double xMax, double yMax, const std::string& text) {
  WordBox w;
  w.pageNumber = page;
  w.xMin = xMin;
  w.yMin = yMin;
  w.xMax = xMax;
  w.yMax = yMax;
  w.text = text;
  return w;
}

// Two full rows and one row missing its code column.
std::vector<WordBox> samplePage(int page) {
  return {
    word(page, 10, 10, 40, 20, "ABA"),
    word(page, 200, 10, 215, 20, "01"),
    word(page, 10, 30, 50, 40, "EZIAMA"),
    word(page, 200, 30, 215, 40, "02"),
    word(page, 10, 50, 40, 60, "NOTE"),
  };
}

std::string readFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

} // namespace

TEST_CASE("bbox layout words are parsed per page", "[tables]") {
  const std::string xhtml =
    "<doc>\n"
    "<page width=\"595.0\" height=\"842.0\">\n"
    "<flow><block><line>\n"
    "<word xMin=\"10.5\" yMin=\"20.0\" xMax=\"40.0\" yMax=\"30.0\">ABA</word>\n"
    "<word xMin=\"50.0\" yMin=\"20.0\" xMax=\"80.0\" yMax=\"30.0\">A&amp;B</word>\n"
    "</line></block></flow>\n"
    "</page>\n"
    "<page width=\"595.0\" height=\"842.0\">\n"
    "<word xMin=\"1\" yMin=\"2\" xMax=\"3\" yMax=\"4\">&#65;</word>\n"
    "</page>\n"
    "</doc>\n";

  std::vector<WordBox> words = parseBboxWords(xhtml);

  REQUIRE(words.size() == 3);
  REQUIRE(words[0].pageNumber == 1);
  REQUIRE(words[0].xMin == Approx(10.5));
  REQUIRE(words[0].yMax == Approx(30.0));
  REQUIRE(words[1].text == "A&B");
  REQUIRE(words[2].pageNumber == 2);
  REQUIRE(words[2].text == "A");

  REQUIRE(parseBboxWords(xhtml, 5)[2].pageNumber == 6);
}

TEST_CASE("explicit page numbers are honoured", "[tables]") {
  const std::string xhtml =
    "<page number=\"7\" width=\"1\"><word xMin=\"1\" yMin=\"2\" xMax=\"3\" yMax=\"4\">X</word></page>";

  std::vector<WordBox> words = parseBboxWords(xhtml);
  REQUIRE(words.size() == 1);
  REQUIRE(words[0].pageNumber == 7);
}

TEST_CASE("words without coordinates are an error", "[tables]") {
  REQUIRE_THROWS_AS(parseBboxWords("<page><word xMin=\"1\">X</word></page>"), std::runtime_error);
}

TEST_CASE("words cluster into a grid with absent cells", "[tables]") {
  std::vector<WordBox> words = samplePage(1);
  std::vector<WordBox> second = samplePage(3);
  words.insert(words.end(), second.begin(), second.end());

  std::vector<Table> tables = buildTables(words);

  REQUIRE(tables.size() == 2);
  REQUIRE(tables[0].pageNumber == 1);
  REQUIRE(tables[1].pageNumber == 3);

  const Table& t = tables[0];
  REQUIRE(t.rows.size() == 3);
  REQUIRE(t.rows[0].size() == 2);
  REQUIRE(t.rows[0][0] == std::string("ABA"));
  REQUIRE(t.rows[1][1] == std::string("02"));
  REQUIRE(t.rows[2][0] == std::string("NOTE"));
  REQUIRE_FALSE(t.rows[2][1].has_value());
}

TEST_CASE("single-row or single-column pages carry no table", "[tables]") {
  std::vector<WordBox> oneRow{word(1, 10, 10, 40, 20, "ABA"), word(1, 200, 10, 215, 20, "01")};
  REQUIRE(buildTables(oneRow).empty());

  std::vector<WordBox> oneColumn{word(1, 10, 10, 40, 20, "ABA"), word(1, 10, 30, 40, 40, "EDO")};
  REQUIRE(buildTables(oneColumn).empty());
}

TEST_CASE("tables are written as CSV files", "[tables][io]") {
  std::filesystem::path dir = std::filesystem::temp_directory_path() / "regionextract_csv_test";
  std::filesystem::remove_all(dir);

  Table t;
  t.pageNumber = 4;
  t.rows.push_back({std::string("ABA, NORTH"), std::string("01")});
  t.rows.push_back({std::string("SAY \"HI\""), std::nullopt});

  writeTablesAsCsv({t, t}, dir.string());

  REQUIRE(readFile(dir / "table_4_0.csv") == "\"ABA, NORTH\",01\n\"SAY \"\"HI\"\"\",\n");
  REQUIRE(std::filesystem::exists(dir / "table_4_1.csv"));
  std::filesystem::remove_all(dir);
}

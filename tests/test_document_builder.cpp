#include <catch2/catch.hpp>

#include "document_builder.hpp"

#include <stdexcept>

TEST_CASE("generated codes come from word initials", "[builder]") {
  REQUIRE(generateCode("NORTH EAST") == "NE");
  REQUIRE(generateCode("akwa-ibom") == "AI");
  REQUIRE(generateCode("   ") == std::string(kFallbackCode));
  REQUIRE(generateCode("") == "XX");
  REQUIRE(generateCode("NORTH EAST") == generateCode("NORTH EAST"));
}

TEST_CASE("Level1 find-or-create normalizes and deduplicates", "[builder]") {
  ExtractionConfig config;
  config.referenceLevel1 = {"A", "B"};
  ExtractionContext context;
  DocumentBuilder builder(config, context);

  Level1& first = builder.findOrCreateLevel1(" b ", Level1Source::Banner);
  REQUIRE(first.name == "B");
  REQUIRE(context.currentLevel1 == 0u);
  REQUIRE(context.referenceCursor == 1u);
  REQUIRE(context.level1Source == Level1Source::Banner);

  builder.findOrCreateLevel1("A", Level1Source::Preseed);
  builder.findOrCreateLevel1("b", Level1Source::Banner);
  REQUIRE(builder.document().level1.size() == 2);
  REQUIRE(context.currentLevel1 == 0u);
  REQUIRE(context.seenLevel1.size() == 2);

  builder.findOrCreateLevel1("Unlisted", Level1Source::Banner);
  REQUIRE_FALSE(context.referenceCursor.has_value());
}

TEST_CASE("re-encountering a Level2 moves the cursor instead of appending", "[builder]") {
  ExtractionConfig config;
  ExtractionContext context;
  DocumentBuilder builder(config, context);
  builder.findOrCreateLevel1("ABIA", Level1Source::Banner);

  builder.findOrCreateLevel2(0, "Aba North", "01");
  builder.findOrCreateLevel2(0, "Aba South", "02");
  REQUIRE(context.currentLevel2 == 1u);

  Level2& again = builder.findOrCreateLevel2(0, "ABA  NORTH ", "01");
  REQUIRE(again.name == "ABA NORTH");
  REQUIRE(context.currentLevel2 == 0u);
  REQUIRE(builder.document().level1[0].level2.size() == 2);
  REQUIRE(context.seenLevel2.size() == 2);
}

TEST_CASE("missing codes are generated and stay stable", "[builder]") {
  ExtractionConfig config;
  ExtractionContext context;
  DocumentBuilder builder(config, context);
  builder.findOrCreateLevel1("ABIA", Level1Source::Banner);

  Level2& l2 = builder.findOrCreateLevel2(0, "North East", "");
  REQUIRE(l2.code == "NE");
  builder.findOrCreateLevel2(0, "north east", "");
  REQUIRE(builder.document().level1[0].level2.size() == 1);

  Level3& l3 = builder.findOrCreateLevel3(0, 0, "---", "");
  REQUIRE(l3.code == "XX");
}

TEST_CASE("Level3 identity is unique within its Level2", "[builder]") {
  ExtractionConfig config;
  ExtractionContext context;
  DocumentBuilder builder(config, context);
  builder.findOrCreateLevel1("ABIA", Level1Source::Banner);
  builder.findOrCreateLevel2(0, "Aba North", "01");
  builder.findOrCreateLevel2(0, "Aba South", "02");

  builder.findOrCreateLevel3(0, 0, "Ariaria", "01");
  builder.findOrCreateLevel3(0, 0, "ariaria", "01");
  builder.findOrCreateLevel3(0, 0, "Eziama", "02");
  builder.findOrCreateLevel3(0, 1, "Ariaria", "01");

  const Document& doc = builder.document();
  REQUIRE(doc.level1[0].level2[0].level3.size() == 2);
  REQUIRE(doc.level1[0].level2[0].level3[1].name == "EZIAMA");
  REQUIRE(doc.level1[0].level2[1].level3.size() == 1);
  REQUIRE(context.seenLevel3.size() == 3);
}

TEST_CASE("switching Level1 clears the Level2 cursor and last code", "[builder]") {
  ExtractionConfig config;
  ExtractionContext context;
  DocumentBuilder builder(config, context);
  builder.findOrCreateLevel1("ABIA", Level1Source::Banner);
  builder.findOrCreateLevel2(0, "Aba North", "01");
  context.lastLevel2Code = 1;

  builder.findOrCreateLevel1("ABIA", Level1Source::Banner);
  REQUIRE(context.currentLevel2 == 0u);

  builder.findOrCreateLevel1("ADAMAWA", Level1Source::Banner);
  REQUIRE_FALSE(context.currentLevel2.has_value());
  REQUIRE_FALSE(context.lastLevel2Code.has_value());
}

TEST_CASE("codes can be left out of identity keys", "[builder]") {
  ExtractionConfig config;
  config.includeCodeInIdentity = false;
  ExtractionContext context;
  DocumentBuilder builder(config, context);
  builder.findOrCreateLevel1("ABIA", Level1Source::Banner);

  builder.findOrCreateLevel2(0, "Aba North", "01");
  Level2& same = builder.findOrCreateLevel2(0, "Aba North", "07");
  REQUIRE(same.code == "01");
  REQUIRE(builder.document().level1[0].level2.size() == 1);
}

TEST_CASE("invalid parent indices are rejected", "[builder]") {
  ExtractionConfig config;
  ExtractionContext context;
  DocumentBuilder builder(config, context);
  REQUIRE_THROWS_AS(builder.findOrCreateLevel2(0, "Aba North", "01"), std::out_of_range);

  builder.findOrCreateLevel1("ABIA", Level1Source::Banner);
  REQUIRE_THROWS_AS(builder.findOrCreateLevel3(0, 3, "Ariaria", "01"), std::out_of_range);
}

TEST_CASE("release hands over the document", "[builder]") {
  ExtractionConfig config;
  ExtractionContext context;
  DocumentBuilder builder(config, context);
  builder.findOrCreateLevel1("ABIA", Level1Source::Banner);

  Document doc = builder.release();
  REQUIRE(doc.level1.size() == 1);
  REQUIRE(builder.document().level1.empty());
}

TEST_CASE("the Level1 source is recorded as the caller states it", "[builder]") {
  ExtractionConfig config;
  config.referenceLevel1 = {"A", "B"};
  ExtractionContext context;
  DocumentBuilder builder(config, context);

  builder.findOrCreateLevel1("A", Level1Source::Preseed);
  REQUIRE(context.level1Source == Level1Source::Preseed);

  builder.findOrCreateLevel1("B", Level1Source::CodeReset);
  REQUIRE(context.level1Source == Level1Source::CodeReset);
  REQUIRE(context.referenceCursor == 1u);

  builder.findOrCreateLevel1("B", Level1Source::Banner);
  REQUIRE(context.level1Source == Level1Source::Banner);
  REQUIRE(builder.document().level1.size() == 2);
}

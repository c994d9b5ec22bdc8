#pragma once

#include <optional>
#include <string>
#include <unordered_set>

// How the current Level1 became current.
enum class Level1Source {
  None,
  Preseed,
  CodeReset,
  Banner,
};

const char* level1SourceName(Level1Source source);

// Per-run diagnostic counters. They never influence the document.
struct RowCounters {
  size_t pages = 0;
  size_t tableRows = 0;
  size_t noiseRows = 0;
  size_t headerRows = 0;
  size_t level2Records = 0;
  size_t level3Records = 0;
  size_t orphansDropped = 0;
  size_t exhaustedDropped = 0;
  size_t bannersAccepted = 0;
  size_t codeResets = 0;
};

// Cursor state of one extraction run. Level1/Level2 are indices into the
// document being built.
struct ExtractionContext {
  std::optional<size_t> currentLevel1;
  std::optional<size_t> currentLevel2;
  std::optional<long> lastLevel2Code;
  Level1Source level1Source = Level1Source::None;
  // Position of the current Level1 in the reference ordering, if listed.
  std::optional<size_t> referenceCursor;
  // Set once the code-reset heuristic ran past the reference ordering.
  bool referenceExhausted = false;

  std::unordered_set<std::string> seenLevel1;
  std::unordered_set<std::string> seenLevel2;
  std::unordered_set<std::string> seenLevel3;

  // Makes the Level1 at index current. Switching to a different Level1 clears
  // the current Level2 and the last Level2 code.
  void enterLevel1(size_t index, Level1Source source, std::optional<size_t> referencePosition);

  // Leaves every Level1; used when the reference ordering is exhausted.
  void clearLevel1();

  bool hasCurrentLevel2() const { return currentLevel1.has_value() && currentLevel2.has_value(); }
};

// Joins normalized key parts with a unit separator.
std::string compositeKey(const std::string& a);
std::string compositeKey(const std::string& a, const std::string& b);
std::string compositeKey(const std::string& a, const std::string& b, const std::string& c);
std::string compositeKey(const std::string& a, const std::string& b, const std::string& c,
                         const std::string& d);

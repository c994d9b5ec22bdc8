#pragma once

#include "table_extractor.hpp"

#include <string>
#include <vector>

// One page of a source document as handed to the extraction engine: its
// tables (authoritative structure) and its full text (banner detection only).
struct Page {
  int number = 0;
  std::vector<Table> tables;
  std::string text;
};

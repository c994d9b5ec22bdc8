#pragma once

#include <string>
#include <vector>

// Level3: sub-sub-region (ward).
struct Level3 {
  std::string name;
  std::string code;
};

// Level2: sub-region (LGA). Exclusively owned by one Level1.
struct Level2 {
  std::string name;
  std::string code;
  std::vector<Level3> level3;
};

// Level1: top-level region (state).
struct Level1 {
  std::string name;
  std::vector<Level2> level2;
};

struct Document {
  std::vector<Level1> level1;
};

struct Statistics {
  size_t level1Count = 0;
  size_t level2Count = 0;
  size_t level3Count = 0;
  // Names of the Level1 entries with at least one Level2, in document order.
  std::vector<std::string> level1Names;
};

Statistics computeStatistics(const Document& document);

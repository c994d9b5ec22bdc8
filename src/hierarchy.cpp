#include "hierarchy.hpp"

Statistics computeStatistics(const Document& document) {
  Statistics stats;
  for (const auto& l1 : document.level1) {
    if (l1.level2.empty()) continue;
    stats.level1Count++;
    stats.level1Names.push_back(l1.name);
    stats.level2Count += l1.level2.size();
    for (const auto& l2 : l1.level2) stats.level3Count += l2.level3.size();
  }
  return stats;
}

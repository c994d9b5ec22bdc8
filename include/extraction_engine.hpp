#pragma once

#include "extraction_config.hpp"
#include "extraction_context.hpp"
#include "hierarchy.hpp"
#include "page.hpp"

#include <functional>
#include <vector>

struct ExtractionResult {
  Document document;
  Statistics statistics;
  RowCounters counters;
  // True when shouldCancel stopped the run before the last page.
  bool cancelled = false;
};

// Walks pages in document order and reconstructs the Level1/Level2/Level3
// hierarchy. Every call runs with a fresh context and document, so one engine
// may serve concurrent extractions of independent documents.
class ExtractionEngine {
public:
  explicit ExtractionEngine(ExtractionConfig config = ExtractionConfig());

  // Never throws on page content; malformed rows are dropped.
  // shouldCancel, when set, is polled before each page.
  ExtractionResult extract(const std::vector<Page>& pages,
                           const std::function<bool()>& shouldCancel = nullptr) const;

  const ExtractionConfig& config() const { return config_; }

private:
  ExtractionConfig config_;
};

#include "extraction_engine.hpp"

#include "document_builder.hpp"
#include "page_processor.hpp"

#include <utility>

#include <spdlog/spdlog.h>

ExtractionEngine::ExtractionEngine(ExtractionConfig config)
  : config_(std::move(config)) {
  normalizeConfig(config_);
}

ExtractionResult ExtractionEngine::extract(const std::vector<Page>& pages,
                                           const std::function<bool()>& shouldCancel) const {
  ExtractionResult result;
  ExtractionContext context;
  DocumentBuilder builder(config_, context);
  PageProcessor processor(config_, context, builder, result.counters);

  if (config_.preseedFirstLevel1 && !config_.referenceLevel1.empty()) {
    builder.findOrCreateLevel1(config_.referenceLevel1.front(), Level1Source::Preseed);
  }

  spdlog::info("Starting extraction from {} page(s)", pages.size());
  for (size_t i = 0; i < pages.size(); ++i) {
    if (shouldCancel && shouldCancel()) {
      spdlog::warn("Extraction cancelled after {} of {} page(s)", i, pages.size());
      result.cancelled = true;
      break;
    }
    spdlog::info("Processing page {} ({}/{})", pages[i].number, i + 1, pages.size());
    processor.processPage(pages[i]);
  }

  result.document = builder.release();
  result.statistics = computeStatistics(result.document);

  const RowCounters& c = result.counters;
  spdlog::info("Extraction complete: {} Level1, {} Level2, {} Level3",
               result.statistics.level1Count, result.statistics.level2Count, result.statistics.level3Count);
  spdlog::info("Rows: {} table, {} noise, {} header; dropped: {} orphan, {} after exhaustion; "
               "{} banner(s), {} code reset(s)",
               c.tableRows, c.noiseRows, c.headerRows, c.orphansDropped, c.exhaustedDropped,
               c.bannersAccepted, c.codeResets);
  return result;
}

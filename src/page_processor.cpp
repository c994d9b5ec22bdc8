#include "page_processor.hpp"

#include "text_util.hpp"

#include <algorithm>
#include <vector>

#include <spdlog/spdlog.h>

PageProcessor::PageProcessor(const ExtractionConfig& config,
                             ExtractionContext& context,
                             DocumentBuilder& builder,
                             RowCounters& counters)
  : config_(config), context_(context), builder_(builder), counters_(counters) {}

void PageProcessor::processPage(const Page& page) {
  pageNumber_ = page.number;
  counters_.pages++;
  const std::vector<std::string> lines = splitLines(page.text);

  // The first banner on a page heads the tables printed below it.
  size_t next = lines.size();
  for (size_t i = 0; i < lines.size(); ++i) {
    RowClassification c = classifyTextLine(lines[i], config_);
    if (c.kind == RowKind::RegionBanner && handleBanner(c.name)) {
      next = i + 1;
      break;
    }
  }

  for (const auto& table : page.tables) {
    for (const auto& row : table.rows) processRow(row);
  }
  for (size_t i = next; i < lines.size(); ++i) processTextLine(lines[i]);
}

void PageProcessor::processRow(const Row& row) {
  counters_.tableRows++;
  RowClassification c = classifyRow(row, config_, context_.hasCurrentLevel2());
  switch (c.kind) {
    case RowKind::Noise:
      counters_.noiseRows++;
      spdlog::debug("Page {}: {} row dropped", pageNumber_, rowKindName(c.kind));
      break;
    case RowKind::TableHeader:
      counters_.headerRows++;
      spdlog::debug("Page {}: {} row dropped", pageNumber_, rowKindName(c.kind));
      break;
    case RowKind::Level2Record:
      counters_.level2Records++;
      handleLevel2(c);
      break;
    case RowKind::Level3Record:
      counters_.level3Records++;
      handleLevel3(c.name, c.code);
      break;
    case RowKind::RegionBanner:
      handleBanner(c.name);
      break;
  }
}

void PageProcessor::processTextLine(const std::string& line) {
  RowClassification c = classifyTextLine(line, config_);
  if (c.kind == RowKind::RegionBanner) handleBanner(c.name);
}

void PageProcessor::handleLevel2(const RowClassification& c) {
  detectCodeReset(c.code);
  if (!context_.currentLevel1) {
    dropRecord("Level2", c.name, c.code);
    if (c.hasChild()) dropRecord("Level3", c.childName, c.childCode);
    return;
  }
  builder_.findOrCreateLevel2(*context_.currentLevel1, c.name, c.code);
  if (c.hasChild()) {
    counters_.level3Records++;
    handleLevel3(c.childName, c.childCode);
  }
}

void PageProcessor::handleLevel3(const std::string& name, const std::string& code) {
  if (!context_.hasCurrentLevel2()) {
    dropRecord("Level3", name, code);
    return;
  }
  builder_.findOrCreateLevel3(*context_.currentLevel1, *context_.currentLevel2, name, code);
}

bool PageProcessor::handleBanner(const std::string& name) {
  const auto& reference = config_.referenceLevel1;
  bool listed = std::find(reference.begin(), reference.end(), name) != reference.end();
  if (!reference.empty() && !listed && !config_.acceptUnlistedBanners) {
    spdlog::debug("Page {}: banner candidate '{}' is not a known Level1", pageNumber_, name);
    return false;
  }
  if (context_.currentLevel1 && context_.level1Source == Level1Source::Banner &&
      builder_.document().level1[*context_.currentLevel1].name == name) {
    return true;
  }
  builder_.findOrCreateLevel1(name, Level1Source::Banner);
  counters_.bannersAccepted++;
  spdlog::info("Page {}: banner switches Level1 to {}", pageNumber_, name);
  return true;
}

bool PageProcessor::codeResetAllowed() const {
  if (config_.referenceLevel1.empty() || !context_.currentLevel1 || !context_.referenceCursor) return false;
  return context_.level1Source != Level1Source::Banner || config_.resetAfterBanner;
}

void PageProcessor::detectCodeReset(const std::string& code) {
  if (!isNumericCode(code) || code.size() > 9) return;
  const long value = std::stol(code);
  if (context_.lastLevel2Code && value < *context_.lastLevel2Code) {
    if (codeResetAllowed()) {
      advanceReference();
    } else {
      spdlog::debug("Page {}: Level2 code {} restarted without boundary advance", pageNumber_, code);
    }
  }
  if (context_.currentLevel1) context_.lastLevel2Code = value;
}

void PageProcessor::advanceReference() {
  const size_t next = *context_.referenceCursor + 1;
  counters_.codeResets++;
  if (next >= config_.referenceLevel1.size()) {
    spdlog::warn("Page {}: Level2 code reset past the last reference Level1; dropping records until a banner",
                 pageNumber_);
    context_.clearLevel1();
    context_.referenceExhausted = true;
    return;
  }
  const std::string& name = config_.referenceLevel1[next];
  builder_.findOrCreateLevel1(name, Level1Source::CodeReset);
  spdlog::info("Page {}: Level2 code reset, moving to {}", pageNumber_, name);
}

void PageProcessor::dropRecord(const char* what, const std::string& name, const std::string& code) {
  if (context_.referenceExhausted) {
    counters_.exhaustedDropped++;
    spdlog::debug("Page {}: {} {} ({}) dropped after reference exhaustion", pageNumber_, what, name, code);
    return;
  }
  counters_.orphansDropped++;
  spdlog::warn("Page {}: orphan {} {} ({}) dropped", pageNumber_, what, name, code);
}

#pragma once

#include "document_builder.hpp"
#include "extraction_config.hpp"
#include "extraction_context.hpp"
#include "page.hpp"
#include "row_classifier.hpp"

#include <string>

// Drives one page: the page's first Level1 banner, then its table rows, then
// the remaining text lines for later banners.
class PageProcessor {
public:
  PageProcessor(const ExtractionConfig& config,
                ExtractionContext& context,
                DocumentBuilder& builder,
                RowCounters& counters);

  void processPage(const Page& page);
  void processRow(const Row& row);
  void processTextLine(const std::string& line);

private:
  void handleLevel2(const RowClassification& c);
  void handleLevel3(const std::string& name, const std::string& code);
  // Returns false when the banner names no acceptable Level1.
  bool handleBanner(const std::string& name);
  // Checks a numeric Level2 code against the last one and advances to the next
  // reference Level1 when the sequence restarted.
  void detectCodeReset(const std::string& code);
  bool codeResetAllowed() const;
  void advanceReference();
  void dropRecord(const char* what, const std::string& name, const std::string& code);

  const ExtractionConfig& config_;
  ExtractionContext& context_;
  DocumentBuilder& builder_;
  RowCounters& counters_;
  int pageNumber_ = 0;
};

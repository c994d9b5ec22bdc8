#include "pdf_reader.hpp"

#include "pdf_text.hpp"
#include "table_extractor.hpp"

#include <filesystem>
#include <map>
#include <stdexcept>

#include <spdlog/spdlog.h>

std::vector<Page> assemblePages(std::vector<Table> tables,
                                const std::vector<std::string>& pageTexts,
                                int firstPage) {
  if (firstPage < 1) firstPage = 1;

  std::map<int, Page> byNumber;
  for (size_t i = 0; i < pageTexts.size(); ++i) {
    int number = firstPage + static_cast<int>(i);
    Page& page = byNumber[number];
    page.number = number;
    page.text = pageTexts[i];
  }
  for (auto& t : tables) {
    Page& page = byNumber[t.pageNumber];
    page.number = t.pageNumber;
    page.tables.push_back(std::move(t));
  }

  std::vector<Page> pages;
  pages.reserve(byNumber.size());
  for (auto& kv : byNumber) pages.push_back(std::move(kv.second));
  return pages;
}

std::vector<Page> readPdfDocument(const std::string& pdfPath, int firstPage, int lastPage) {
  if (!std::filesystem::exists(pdfPath)) {
    throw std::runtime_error("PDF not found: " + pdfPath);
  }

  std::vector<Table> tables = extractTablesFromPdf(pdfPath, firstPage, lastPage);
  std::vector<std::string> texts = splitPageTexts(extractPdfText(pdfPath, firstPage, lastPage));
  spdlog::info("Read {}: {} page(s) of text, {} table(s)", pdfPath, texts.size(), tables.size());

  return assemblePages(std::move(tables), texts, firstPage);
}

#pragma once

#include "page.hpp"

#include <string>
#include <vector>

// Pairs per-page tables with per-page text. Pages are returned in document
// order; a page with neither tables nor text is still present.
std::vector<Page> assemblePages(std::vector<Table> tables,
                                const std::vector<std::string>& pageTexts,
                                int firstPage = 1);

// Resolves a PDF into Pages using poppler's pdftotext for both tables and text.
// Throws std::runtime_error if the file is missing or cannot be read.
std::vector<Page> readPdfDocument(const std::string& pdfPath,
                                  int firstPage = 1,
                                  int lastPage = -1);

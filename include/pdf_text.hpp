#pragma once

#include <string>
#include <vector>

// Builds the -f/-l page range options for pdftotext.
std::string pageRangeOptions(int firstPage, int lastPage);

// Runs `pdftotext <options> -q "<pdfPath>" -` and returns its stdout.
// Throws std::runtime_error if pdftotext is not installed or exits non-zero.
std::string runPdftotext(const std::string& options, const std::string& pdfPath);

// Returns the layout-preserving text of the PDF, pages separated by form feeds.
// If lastPage < firstPage or lastPage == -1, processes until end.
std::string extractPdfText(const std::string& pdfPath, int firstPage = 1, int lastPage = -1);

// Splits pdftotext output into one string per page. The empty remainder after
// the final form feed is not a page.
std::vector<std::string> splitPageTexts(const std::string& text);

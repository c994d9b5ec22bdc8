#pragma once

#include <optional>
#include <string>
#include <vector>

// A grid cell that received no word is absent.
using Cell = std::optional<std::string>;
using Row = std::vector<Cell>;

struct Table {
  int pageNumber = 0;
  std::vector<Row> rows;
};

struct WordBox {
  int pageNumber = 0;
  double xMin = 0.0;
  double yMin = 0.0;
  double xMax = 0.0;
  double yMax = 0.0;
  std::string text;
};

// Parses the XHTML produced by `pdftotext -bbox-layout` into word boxes.
// Page numbers come from the `number` attribute of <page> when present,
// otherwise pages are counted in document order starting at firstPageNumber.
std::vector<WordBox> parseBboxWords(const std::string& xhtml, int firstPageNumber = 1);

// Clusters the words of each page into a grid. Pages with fewer than two
// rows or two columns yield no table. Tables are ordered by page.
std::vector<Table> buildTables(std::vector<WordBox> words);

// Extract tables by invoking `pdftotext -bbox-layout` to get word bounding boxes,
// then clustering words into rows/columns heuristically.
// If lastPage < firstPage or lastPage == -1, processes until end.
// Throws std::runtime_error when pdftotext is missing or fails.
std::vector<Table> extractTablesFromPdf(const std::string& pdfPath,
                                        int firstPage = 1,
                                        int lastPage = -1);

// Write tables into CSV files in outDir as table_<page>_<index>.csv
void writeTablesAsCsv(const std::vector<Table>& tables, const std::string& outDir);

#include "table_extractor.hpp"

#include "pdf_text.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <regex>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace {

std::string decodeEntities(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '&') {
      size_t j = in.find(';', i + 1);
      if (j != std::string::npos) {
        std::string ent = in.substr(i + 1, j - (i + 1));
        std::string rep;
        if (ent == "amp") rep = "&";
        else if (ent == "lt") rep = "<";
        else if (ent == "gt") rep = ">";
        else if (ent == "quot") rep = "\"";
        else if (ent == "apos") rep = "'";
        else if (ent.size() > 1 && ent[0] == '#') {
          bool hex = ent[1] == 'x' || ent[1] == 'X';
          std::string digits = ent.substr(hex ? 2 : 1);
          if (!digits.empty() &&
              digits.find_first_not_of(hex ? "0123456789abcdefABCDEF" : "0123456789") == std::string::npos &&
              digits.size() <= 6) {
            unsigned long code = std::stoul(digits, nullptr, hex ? 16 : 10);
            if (code <= 0x7F) rep.push_back(static_cast<char>(code));
          }
        }
        if (!rep.empty()) {
          out += rep; i = j; continue;
        }
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

bool attributeValue(const std::string& attrs, const char* name, std::string& value) {
  std::regex re(std::string("\\b") + name + "=\"([^\"]*)\"");
  std::smatch m;
  if (!std::regex_search(attrs, m, re)) return false;
  value = m[1].str();
  return true;
}

double numericAttribute(const std::string& attrs, const char* name) {
  std::string value;
  if (!attributeValue(attrs, name, value)) {
    throw std::runtime_error(std::string("bbox word without ") + name + " attribute");
  }
  try {
    return std::stod(value);
  } catch (const std::exception&) {
    throw std::runtime_error(std::string("bbox word has malformed ") + name + ": " + value);
  }
}

double median(std::vector<double> v) {
  if (v.empty()) return 0.0;
  std::nth_element(v.begin(), v.begin() + v.size()/2, v.end());
  return v[v.size()/2];
}

struct RowGroup { double yCenter; std::vector<const WordBox*> words; };

std::vector<RowGroup> clusterRows(std::vector<WordBox>& wordsOnPage) {
  std::vector<RowGroup> rows;
  if (wordsOnPage.empty()) return rows;

  std::vector<double> heights; heights.reserve(wordsOnPage.size());
  for (const auto& w : wordsOnPage) heights.push_back(w.yMax - w.yMin);
  double hMed = median(heights);
  double tol = hMed > 0 ? hMed * 0.8 : 6.0;

  // pdftotext reports y growing downwards, so ascending y is reading order.
  std::stable_sort(wordsOnPage.begin(), wordsOnPage.end(), [](const WordBox& a, const WordBox& b) {
    double ya = (a.yMin + a.yMax) * 0.5;
    double yb = (b.yMin + b.yMax) * 0.5;
    if (ya == yb) return a.xMin < b.xMin;
    return ya < yb;
  });

  for (const auto& w : wordsOnPage) {
    double yc = (w.yMin + w.yMax) * 0.5;
    if (rows.empty() || std::abs(yc - rows.back().yCenter) > tol) {
      rows.push_back(RowGroup{yc, {}});
    }
    RowGroup& row = rows.back();
    row.words.push_back(&w);
    row.yCenter = (row.yCenter * (row.words.size() - 1) + yc) / row.words.size();
  }

  for (auto& r : rows) {
    std::stable_sort(r.words.begin(), r.words.end(), [](const WordBox* a, const WordBox* b){ return a->xMin < b->xMin; });
  }
  return rows;
}

std::vector<double> clusterColumns(const std::vector<RowGroup>& rows) {
  std::vector<double> centers;
  std::vector<double> widths;
  for (const auto& r : rows) {
    for (const auto* w : r.words) {
      centers.push_back((w->xMin + w->xMax) * 0.5);
      widths.push_back(w->xMax - w->xMin);
    }
  }
  if (centers.empty()) return {};
  double wMed = median(widths);
  double tol = std::max(8.0, wMed * 1.2);
  std::sort(centers.begin(), centers.end());
  std::vector<double> colCenters;
  double acc = centers.front();
  int count = 1;
  for (size_t i = 1; i < centers.size(); ++i) {
    if (centers[i] - centers[i-1] <= tol) {
      acc += centers[i]; count++;
    } else {
      colCenters.push_back(acc / count);
      acc = centers[i]; count = 1;
    }
  }
  colCenters.push_back(acc / count);
  return colCenters;
}

std::vector<Row> buildGrid(const std::vector<RowGroup>& rows, const std::vector<double>& colCenters) {
  const size_t numCols = colCenters.size();
  std::vector<Row> grid;
  grid.reserve(rows.size());
  for (const auto& r : rows) {
    Row row(numCols);
    for (const auto* w : r.words) {
      double xc = (w->xMin + w->xMax) * 0.5;
      size_t bestIdx = 0;
      double bestDist = std::abs(xc - colCenters[0]);
      for (size_t c = 1; c < numCols; ++c) {
        double d = std::abs(xc - colCenters[c]);
        if (d < bestDist) { bestDist = d; bestIdx = c; }
      }
      Cell& cell = row[bestIdx];
      if (cell) {
        *cell += ' ';
        *cell += w->text;
      } else {
        cell = w->text;
      }
    }
    grid.push_back(std::move(row));
  }
  return grid;
}

std::string csvField(const std::string& cell) {
  bool needQuotes = cell.find_first_of(",\"\n") != std::string::npos;
  if (!needQuotes) return cell;
  std::string escaped = "\"";
  for (char ch : cell) {
    if (ch == '"') escaped += '"';
    escaped += ch;
  }
  escaped += '"';
  return escaped;
}

} // namespace

std::vector<WordBox> parseBboxWords(const std::string& xhtml, int firstPageNumber) {
  std::vector<WordBox> words;
  std::regex tokenRe("<page\\b([^>]*)>|<word\\b([^>]*)>([^<]*)</word>");

  int currentPage = firstPageNumber - 1;
  for (std::sregex_iterator it(xhtml.begin(), xhtml.end(), tokenRe), end; it != end; ++it) {
    const std::smatch& m = *it;
    if (m[1].matched) {
      std::string number;
      if (attributeValue(m[1].str(), "number", number) && !number.empty() &&
          number.find_first_not_of("0123456789") == std::string::npos) {
        currentPage = std::stoi(number);
      } else {
        currentPage++;
      }
      continue;
    }
    const std::string attrs = m[2].str();
    WordBox w;
    w.pageNumber = std::max(currentPage, firstPageNumber);
    w.xMin = numericAttribute(attrs, "xMin");
    w.yMin = numericAttribute(attrs, "yMin");
    w.xMax = numericAttribute(attrs, "xMax");
    w.yMax = numericAttribute(attrs, "yMax");
    w.text = decodeEntities(m[3].str());
    words.push_back(std::move(w));
  }

  return words;
}

std::vector<Table> buildTables(std::vector<WordBox> words) {
  std::map<int, std::vector<WordBox>> pageWords;
  for (auto& w : words) pageWords[w.pageNumber].push_back(std::move(w));

  std::vector<Table> tables;
  for (auto& kv : pageWords) {
    int pageNo = kv.first;
    std::vector<RowGroup> rows = clusterRows(kv.second);
    if (rows.size() < 2) continue;
    std::vector<double> cols = clusterColumns(rows);
    if (cols.size() < 2) continue; // need at least 2 columns to be a table

    Table t;
    t.pageNumber = pageNo;
    t.rows = buildGrid(rows, cols);
    spdlog::debug("Page {}: table with {} row(s) x {} column(s)", pageNo, t.rows.size(), cols.size());
    tables.push_back(std::move(t));
  }

  return tables;
}

std::vector<Table> extractTablesFromPdf(const std::string& pdfPath, int firstPage, int lastPage) {
  std::string xhtml = runPdftotext("-bbox-layout" + pageRangeOptions(firstPage, lastPage), pdfPath);
  std::vector<WordBox> words = parseBboxWords(xhtml, firstPage > 0 ? firstPage : 1);
  return buildTables(std::move(words));
}

void writeTablesAsCsv(const std::vector<Table>& tables, const std::string& outDir) {
  if (!std::filesystem::exists(outDir)) {
    std::filesystem::create_directories(outDir);
  }
  int indexPerPage = 0;
  int prevPage = -1;
  for (const auto& t : tables) {
    if (t.pageNumber != prevPage) { prevPage = t.pageNumber; indexPerPage = 0; }
    std::string filename = outDir + "/table_" + std::to_string(t.pageNumber) + "_" + std::to_string(indexPerPage++) + ".csv";
    std::ofstream ofs(filename);
    if (!ofs) {
      throw std::runtime_error("Cannot write " + filename);
    }
    for (const auto& row : t.rows) {
      for (size_t i = 0; i < row.size(); ++i) {
        if (row[i]) ofs << csvField(*row[i]);
        if (i + 1 < row.size()) ofs << ',';
      }
      ofs << "\n";
    }
  }
}

#include "row_classifier.hpp"

#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace {

RowClassification record(RowKind kind, const std::string& name, const std::string& code) {
  RowClassification c;
  c.kind = kind;
  c.name = normalizeName(name);
  c.code = normalizeName(code);
  return c;
}

RowClassification ofKind(RowKind kind) {
  RowClassification c;
  c.kind = kind;
  return c;
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

std::string stripPunctuation(const std::string& word) {
  size_t a = 0, b = word.size();
  while (a < b && std::ispunct(static_cast<unsigned char>(word[a]))) a++;
  while (b > a && std::ispunct(static_cast<unsigned char>(word[b - 1]))) b--;
  return word.substr(a, b - a);
}

bool headerText(const std::string& upperText, const ExtractionConfig& config) {
  size_t hits = 0;
  for (const auto& keyword : config.tableHeaderKeywords) {
    if (!keyword.empty() && upperText.find(keyword) != std::string::npos) hits++;
  }
  return hits >= config.minHeaderKeywordMatches;
}

} // namespace

const char* rowKindName(RowKind kind) {
  switch (kind) {
    case RowKind::Noise: return "noise";
    case RowKind::TableHeader: return "table-header";
    case RowKind::RegionBanner: return "region-banner";
    case RowKind::Level2Record: return "level2-record";
    case RowKind::Level3Record: return "level3-record";
  }
  return "unknown";
}

bool isPlausibleCode(const std::string& token, size_t maxLength) {
  if (token.empty() || token.size() > maxLength) return false;
  bool hasDigit = false;
  for (char ch : token) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (std::isdigit(c)) hasDigit = true;
    else if (!std::isalpha(c)) return false;
  }
  return hasDigit;
}

bool isNumericCode(const std::string& token) {
  return isAllDigits(token);
}

bool isTableHeader(const Row& row, const ExtractionConfig& config) {
  std::string text;
  for (const auto& cell : row) {
    if (!cell) continue;
    std::string value = collapseWhitespace(*cell);
    if (value.empty()) continue;
    if (!text.empty()) text += ' ';
    text += value;
  }
  return headerText(toUpper(text), config);
}

std::string bannerLevel1Name(const std::string& line, const ExtractionConfig& config) {
  std::vector<std::string> words = splitWords(toUpper(line));
  auto isKeyword = [&](const std::string& w) {
    std::string bare = stripPunctuation(w);
    return bare.empty() || contains(config.bannerKeywords, bare);
  };
  while (!words.empty() && isKeyword(words.back())) words.pop_back();
  while (!words.empty() && isKeyword(words.front())) words.erase(words.begin());
  if (words.empty()) return std::string();

  words.front() = stripPunctuation(words.front());
  words.back() = stripPunctuation(words.back());
  std::string name;
  for (const auto& w : words) {
    if (!name.empty()) name += ' ';
    name += w;
  }
  return name;
}

RowClassification classifyRow(const Row& row, const ExtractionConfig& config, bool hasCurrentLevel2) {
  std::vector<std::string> cells;
  std::vector<size_t> filled;
  cells.reserve(row.size());
  for (size_t i = 0; i < row.size(); ++i) {
    cells.push_back(row[i] ? collapseWhitespace(*row[i]) : std::string());
    if (!cells.back().empty()) filled.push_back(i);
  }

  if (filled.size() < 2) return ofKind(RowKind::Noise);
  if (isTableHeader(row, config)) return ofKind(RowKind::TableHeader);

  auto code = [&](const std::string& s) { return isPlausibleCode(s, config.maxCodeLength); };
  const size_t last = filled.back();

  // Positional rules: the row is wide enough to carry the designated columns.
  const TableLayout& layout = config.layout;
  const size_t wideWidth =
    std::max({layout.level2NameColumn, layout.level2CodeColumn, layout.level3NameColumn}) + 2;
  if (row.size() >= wideWidth) {
    const std::string& l2Name = cells[layout.level2NameColumn];
    const std::string& l2Code = cells[layout.level2CodeColumn];
    const std::string& l3Name = cells[layout.level3NameColumn];
    const bool trailingCode = last > layout.level3NameColumn && code(cells[last]);

    if (!l2Name.empty() && !code(l2Name) && code(l2Code)) {
      RowClassification c = record(RowKind::Level2Record, l2Name, l2Code);
      if (!l3Name.empty() && !code(l3Name) && trailingCode) {
        c.childName = normalizeName(l3Name);
        c.childCode = normalizeName(cells[last]);
      }
      return c;
    }
    if (l2Name.empty() && l2Code.empty() && !l3Name.empty() && !code(l3Name) && trailingCode) {
      return record(RowKind::Level3Record, l3Name, cells[last]);
    }
  }

  // Shape rules, for narrow rows and rows whose columns have shifted.
  size_t first = 0;
  if (filled.size() >= 3 && isNumericCode(cells[filled[0]]) && !code(cells[filled[1]])) {
    first = 1; // serial number column
  }
  const size_t shapeCount = filled.size() - first;
  const std::string& name = cells[filled[first]];
  const std::string& second = cells[filled[first + 1]];

  if (!code(name) && code(second)) {
    if (shapeCount == 2) {
      return record(hasCurrentLevel2 ? RowKind::Level3Record : RowKind::Level2Record, name, second);
    }
    RowClassification c = record(RowKind::Level2Record, name, second);
    if (shapeCount >= 4 && code(cells[last])) {
      for (size_t k = first + 2; k + 1 < filled.size(); ++k) {
        if (!code(cells[filled[k]])) {
          c.childName = normalizeName(cells[filled[k]]);
          c.childCode = normalizeName(cells[last]);
          break;
        }
      }
    }
    return c;
  }

  if (shapeCount >= 3 && code(cells[last])) {
    for (size_t k = filled.size() - 1; k-- > first;) {
      if (!code(cells[filled[k]])) {
        return record(RowKind::Level3Record, cells[filled[k]], cells[last]);
      }
    }
  }

  return ofKind(RowKind::Noise);
}

RowClassification classifyTextLine(const std::string& line, const ExtractionConfig& config) {
  const std::string text = collapseWhitespace(line);
  if (text.empty()) return ofKind(RowKind::Noise);

  const std::string upper = toUpper(text);
  const std::string name = bannerLevel1Name(text, config);
  if (contains(config.referenceLevel1, upper) || (!name.empty() && contains(config.referenceLevel1, name))) {
    RowClassification c = ofKind(RowKind::RegionBanner);
    c.name = contains(config.referenceLevel1, name) ? name : upper;
    return c;
  }

  if (text.size() < config.minBannerLength || text.size() > config.maxBannerLength) {
    return ofKind(RowKind::Noise);
  }

  size_t nonSpace = 0, upperCount = 0, alphaOrSpace = 0;
  for (char ch : text) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (std::isdigit(c)) return ofKind(RowKind::Noise);
    if (std::isalpha(c) || c == ' ') alphaOrSpace++;
    if (c == ' ') continue;
    nonSpace++;
    if (std::isupper(c)) upperCount++;
  }
  if (nonSpace == 0) return ofKind(RowKind::Noise);
  if (static_cast<double>(upperCount) / nonSpace < config.bannerUppercaseRatio) return ofKind(RowKind::Noise);
  if (static_cast<double>(alphaOrSpace) / text.size() < config.bannerAlphaRatio) return ofKind(RowKind::Noise);

  for (const auto& word : splitWords(upper)) {
    if (contains(config.bannerRejectKeywords, stripPunctuation(word))) return ofKind(RowKind::Noise);
  }
  if (name.empty()) return ofKind(RowKind::Noise);

  RowClassification c = ofKind(RowKind::RegionBanner);
  c.name = name;
  return c;
}

#include "document_builder.hpp"

#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <spdlog/spdlog.h>

const char* const kFallbackCode = "XX";

std::string generateCode(const std::string& name) {
  std::string code;
  bool atWordStart = true;
  for (char ch : name) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (!std::isalnum(c)) {
      atWordStart = true;
      continue;
    }
    if (atWordStart) code.push_back(static_cast<char>(std::toupper(c)));
    atWordStart = false;
  }
  return code.empty() ? std::string(kFallbackCode) : code;
}

DocumentBuilder::DocumentBuilder(const ExtractionConfig& config, ExtractionContext& context)
  : config_(config), context_(context) {}

Level1& DocumentBuilder::findOrCreateLevel1(const std::string& name, Level1Source source) {
  const std::string normalized = normalizeName(name);
  auto& level1 = document_.level1;

  size_t index = level1.size();
  if (context_.seenLevel1.count(compositeKey(normalized))) {
    auto it = std::find_if(level1.begin(), level1.end(), [&](const Level1& l) { return l.name == normalized; });
    index = static_cast<size_t>(it - level1.begin());
  }
  if (index == level1.size()) {
    context_.seenLevel1.insert(compositeKey(normalized));
    level1.push_back(Level1{normalized, {}});
    spdlog::debug("Added Level1: {}", normalized);
  }

  std::optional<size_t> referencePosition;
  const auto& reference = config_.referenceLevel1;
  auto ref = std::find(reference.begin(), reference.end(), normalized);
  if (ref != reference.end()) referencePosition = static_cast<size_t>(ref - reference.begin());

  context_.enterLevel1(index, source, referencePosition);
  spdlog::debug("Current Level1: {} ({})", normalized, level1SourceName(source));
  return level1[index];
}

std::string DocumentBuilder::level2Key(const Level1& level1, const std::string& name, const std::string& code) const {
  return config_.includeCodeInIdentity ? compositeKey(level1.name, name, code) : compositeKey(level1.name, name);
}

Level2& DocumentBuilder::findOrCreateLevel2(size_t level1Index, const std::string& name, const std::string& code) {
  Level1& parent = document_.level1.at(level1Index);
  const std::string normalized = normalizeName(name);
  std::string normalizedCode = normalizeName(code);
  if (normalizedCode.empty()) normalizedCode = generateCode(normalized);

  const std::string key = level2Key(parent, normalized, normalizedCode);
  auto& children = parent.level2;
  size_t index = children.size();
  if (context_.seenLevel2.count(key)) {
    auto it = std::find_if(children.begin(), children.end(), [&](const Level2& l) {
      return level2Key(parent, l.name, l.code) == key;
    });
    index = static_cast<size_t>(it - children.begin());
  }
  if (index == children.size()) {
    context_.seenLevel2.insert(key);
    children.push_back(Level2{normalized, normalizedCode, {}});
    spdlog::debug("Added Level2: {} ({}) to {}", normalized, normalizedCode, parent.name);
  }

  context_.currentLevel2 = index;
  return children[index];
}

Level3& DocumentBuilder::findOrCreateLevel3(size_t level1Index, size_t level2Index,
                                            const std::string& name, const std::string& code) {
  Level1& grandparent = document_.level1.at(level1Index);
  Level2& parent = grandparent.level2.at(level2Index);
  const std::string normalized = normalizeName(name);
  std::string normalizedCode = normalizeName(code);
  if (normalizedCode.empty()) normalizedCode = generateCode(normalized);

  auto keyOf = [&](const std::string& n, const std::string& c) {
    return config_.includeCodeInIdentity
      ? compositeKey(grandparent.name, compositeKey(parent.name, parent.code), n, c)
      : compositeKey(grandparent.name, compositeKey(parent.name, parent.code), n);
  };
  const std::string key = keyOf(normalized, normalizedCode);

  auto& children = parent.level3;
  if (context_.seenLevel3.count(key)) {
    auto it = std::find_if(children.begin(), children.end(), [&](const Level3& l) {
      return keyOf(l.name, l.code) == key;
    });
    if (it != children.end()) return *it;
  }

  context_.seenLevel3.insert(key);
  children.push_back(Level3{normalized, normalizedCode});
  spdlog::debug("Added Level3: {} ({}) to {}", normalized, normalizedCode, parent.name);
  return children.back();
}

Document DocumentBuilder::release() {
  Document out = std::move(document_);
  document_ = Document();
  return out;
}

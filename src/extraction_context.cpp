#include "extraction_context.hpp"

namespace {

const char kKeySeparator = '\x1f';

} // namespace

const char* level1SourceName(Level1Source source) {
  switch (source) {
    case Level1Source::None: return "none";
    case Level1Source::Preseed: return "preseed";
    case Level1Source::CodeReset: return "code-reset";
    case Level1Source::Banner: return "banner";
  }
  return "unknown";
}

void ExtractionContext::enterLevel1(size_t index, Level1Source source, std::optional<size_t> referencePosition) {
  if (currentLevel1 != index) {
    currentLevel1 = index;
    currentLevel2.reset();
    lastLevel2Code.reset();
  }
  level1Source = source;
  referenceCursor = referencePosition;
  referenceExhausted = false;
}

void ExtractionContext::clearLevel1() {
  currentLevel1.reset();
  currentLevel2.reset();
  lastLevel2Code.reset();
  level1Source = Level1Source::None;
  referenceCursor.reset();
}

std::string compositeKey(const std::string& a) {
  return a;
}

std::string compositeKey(const std::string& a, const std::string& b) {
  return a + kKeySeparator + b;
}

std::string compositeKey(const std::string& a, const std::string& b, const std::string& c) {
  return compositeKey(a, b) + kKeySeparator + c;
}

std::string compositeKey(const std::string& a, const std::string& b, const std::string& c,
                         const std::string& d) {
  return compositeKey(a, b, c) + kKeySeparator + d;
}

#pragma once

#include "extraction_config.hpp"
#include "extraction_context.hpp"
#include "hierarchy.hpp"

#include <string>

// Code used when a name yields no initials.
extern const char* const kFallbackCode;

// Deterministic code from the initials of the name's words:
// "NORTH EAST" -> "NE". Returns kFallbackCode when the name has no usable word.
std::string generateCode(const std::string& name);

// Owns the document of one extraction run and performs find-or-create
// insertion keyed by composite identity, keeping the context's cursors and
// dedup sets in step.
class DocumentBuilder {
public:
  DocumentBuilder(const ExtractionConfig& config, ExtractionContext& context);

  // Finds or appends the Level1 and makes it current.
  Level1& findOrCreateLevel1(const std::string& name, Level1Source source);

  // Finds or appends a Level2 under the Level1 at level1Index and makes it
  // current. An empty code is replaced by generateCode(name).
  // Throws std::out_of_range for an invalid index.
  Level2& findOrCreateLevel2(size_t level1Index, const std::string& name, const std::string& code);

  // Finds or appends a Level3 under the given Level2. An empty code is
  // replaced by generateCode(name).
  // Throws std::out_of_range for an invalid index.
  Level3& findOrCreateLevel3(size_t level1Index, size_t level2Index,
                             const std::string& name, const std::string& code);

  const Document& document() const { return document_; }

  // Moves the document out; the builder is empty afterwards.
  Document release();

private:
  std::string level2Key(const Level1& level1, const std::string& name, const std::string& code) const;

  const ExtractionConfig& config_;
  ExtractionContext& context_;
  Document document_;
};

#ifndef PECK_RESPONSE_PARSER_H_
#define PECK_RESPONSE_PARSER_H_

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "peck_types.h"

/**
 * PeckResponseParser - Pulls a coordinate label out of free-form model text
 *
 * Extractors are tried in order and the first one that yields a label wins.
 * The default chain is:
 *   1. "structured": a JSON object (fenced ```json block or bare braces)
 *      holding the coordinate field. A null value, a malformed label, or a
 *      label outside the capture bounds falls through to the next stage.
 *   2. "pattern": the first XXXX,YYYY hex pair anywhere in the text
 *      (whitespace around the comma tolerated). Not bounds-checked here.
 * If nothing matches the result is NotFound.
 */
class PeckResponseParser {
 public:
  using Extractor = std::function<std::optional<CoordinateLabel>(const std::string& reply)>;

  struct ExtractResult {
    bool found = false;
    CoordinateLabel label;
    std::string stage;  // Name of the extractor that produced the label
  };

  // Default chain without bounds checking in the structured stage
  PeckResponseParser();

  // Default chain; the structured stage rejects labels outside width x height
  PeckResponseParser(int width, int height);

  // Append an extractor after the existing ones
  void AddExtractor(const std::string& name, Extractor extractor);

  ExtractResult Extract(const std::string& reply) const;

  // Stage 1. bounds may be null to skip range validation.
  static std::optional<CoordinateLabel> ExtractStructured(const std::string& reply,
                                                          const ScreenSize* bounds);

  // Stage 2
  static std::optional<CoordinateLabel> ExtractPattern(const std::string& reply);

  // JSON object texts found in a reply: fenced block contents first, then
  // every balanced {...} span in document order
  static std::vector<std::string> FindJsonCandidates(const std::string& text);

 private:
  struct NamedExtractor {
    std::string name;
    Extractor extract;
  };

  void InstallDefaultChain(const ScreenSize* bounds);

  std::vector<NamedExtractor> extractors_;
};

#endif  // PECK_RESPONSE_PARSER_H_

#include "peck_response_parser.h"
#include "peck_grid_codec.h"
#include "peck_prompt_protocol.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <regex>

using json = nlohmann::json;

namespace {

const char kFence[] = "```";
const size_t kFenceLength = 3;

// Each unmatched '{' costs a scan to the end of the reply
const int kMaxUnmatchedBraces = 64;

// Depth-first search for an object that has the coordinate field
const json* FindCoordinateField(const json& node) {
  if (node.is_object()) {
    auto it = node.find(PeckPromptProtocol::kCoordinateField);
    if (it != node.end()) {
      return &(*it);
    }
    for (const auto& item : node.items()) {
      const json* found = FindCoordinateField(item.value());
      if (found) return found;
    }
  } else if (node.is_array()) {
    for (const auto& element : node) {
      const json* found = FindCoordinateField(element);
      if (found) return found;
    }
  }
  return nullptr;
}

// Index of the brace closing the object opened at `open`, skipping string contents
size_t FindMatchingBrace(const std::string& text, size_t open) {
  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  for (size_t i = open; i < text.size(); i++) {
    char c = text[i];
    if (in_string) {
      if (escaped) {
        escaped = false;
      } else if (c == '\\') {
        escaped = true;
      } else if (c == '"') {
        in_string = false;
      }
      continue;
    }
    if (c == '"') {
      in_string = true;
    } else if (c == '{') {
      depth++;
    } else if (c == '}') {
      depth--;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

}  // namespace

PeckResponseParser::PeckResponseParser() {
  InstallDefaultChain(nullptr);
}

PeckResponseParser::PeckResponseParser(int width, int height) {
  ScreenSize bounds;
  bounds.width = width;
  bounds.height = height;
  InstallDefaultChain(&bounds);
}

void PeckResponseParser::InstallDefaultChain(const ScreenSize* bounds) {
  std::optional<ScreenSize> captured_bounds;
  if (bounds) {
    captured_bounds = *bounds;
  }

  AddExtractor("structured", [captured_bounds](const std::string& reply) {
    return ExtractStructured(reply, captured_bounds ? &(*captured_bounds) : nullptr);
  });
  AddExtractor("pattern", [](const std::string& reply) {
    return ExtractPattern(reply);
  });
}

void PeckResponseParser::AddExtractor(const std::string& name, Extractor extractor) {
  NamedExtractor entry;
  entry.name = name;
  entry.extract = std::move(extractor);
  extractors_.push_back(std::move(entry));
}

PeckResponseParser::ExtractResult PeckResponseParser::Extract(const std::string& reply) const {
  ExtractResult result;

  for (const auto& extractor : extractors_) {
    std::optional<CoordinateLabel> label = extractor.extract(reply);
    if (label) {
      result.found = true;
      result.label = *label;
      result.stage = extractor.name;
      LOG_DEBUG("ResponseParser", "Label " + label->ToString() + " from " + extractor.name + " stage");
      return result;
    }
    LOG_DEBUG("ResponseParser", "Stage '" + extractor.name + "' found no label");
  }

  return result;
}

std::vector<std::string> PeckResponseParser::FindJsonCandidates(const std::string& text) {
  std::vector<std::string> candidates;

  // ```json ... ``` (language tag optional). Plain find() keeps long
  // replies off the regex engine's recursion.
  size_t fence = text.find(kFence);
  while (fence != std::string::npos) {
    size_t body = fence + kFenceLength;
    if (text.compare(body, 4, "json") == 0 || text.compare(body, 4, "JSON") == 0) {
      body += 4;
    }
    while (body < text.size() && std::isspace(static_cast<unsigned char>(text[body]))) {
      body++;
    }
    size_t close = text.find(kFence, body);
    if (close == std::string::npos) {
      break;
    }
    candidates.push_back(text.substr(body, close - body));
    fence = text.find(kFence, close + kFenceLength);
  }

  // Bare objects anywhere in the text. An unbalanced brace in prose only
  // skips itself; later objects are still found.
  int unmatched = 0;
  size_t pos = text.find('{');
  while (pos != std::string::npos) {
    size_t close = FindMatchingBrace(text, pos);
    if (close == std::string::npos) {
      if (++unmatched > kMaxUnmatchedBraces) {
        break;
      }
      pos = text.find('{', pos + 1);
      continue;
    }
    candidates.push_back(text.substr(pos, close - pos + 1));
    pos = text.find('{', close + 1);
  }

  return candidates;
}

std::optional<CoordinateLabel> PeckResponseParser::ExtractStructured(const std::string& reply,
                                                                     const ScreenSize* bounds) {
  for (const auto& candidate : FindJsonCandidates(reply)) {
    json payload = json::parse(candidate, nullptr, false);
    if (payload.is_discarded()) {
      continue;
    }

    const json* field = FindCoordinateField(payload);
    if (!field) {
      continue;
    }
    if (field->is_null()) {
      LOG_DEBUG("ResponseParser", "Structured payload reports no target");
      continue;
    }
    if (!field->is_string()) {
      LOG_DEBUG("ResponseParser", "Coordinate field is not a string: " + field->dump());
      continue;
    }

    std::string value = field->get<std::string>();
    std::optional<CoordinateLabel> label = PeckGridCodec::ParseLabel(value);
    if (!label) {
      LOG_DEBUG("ResponseParser", "Malformed label in structured payload: '" + value + "'");
      continue;
    }
    if (bounds && !PeckGridCodec::ResolveLabel(*label, bounds->width, bounds->height).ok()) {
      LOG_DEBUG("ResponseParser", "Structured label out of range: " + label->ToString());
      continue;
    }
    return label;
  }

  return std::nullopt;
}

std::optional<CoordinateLabel> PeckResponseParser::ExtractPattern(const std::string& reply) {
  // Exactly four hex digits on each side, not part of a longer hex run.
  // Whitespace around the comma is bounded so the match depth stays small.
  static const std::regex pair_regex(
      R"((?:^|[^0-9A-Fa-f])([0-9A-Fa-f]{4})\s{0,8},\s{0,8}([0-9A-Fa-f]{4})(?![0-9A-Fa-f]))");

  std::smatch match;
  if (!std::regex_search(reply, match, pair_regex)) {
    return std::nullopt;
  }

  std::optional<CoordinateLabel> label =
      PeckGridCodec::ParseLabel(match[1].str() + "," + match[2].str());
  return label;
}

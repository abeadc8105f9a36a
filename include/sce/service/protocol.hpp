// sce/service/protocol.hpp - Slice/Inline request and response messages (JSON)
//
// Field names follow the editor-facing wire format:
//   source{filename, content, language, point{line, col}}, direction,
//   target_content, target_point; responses {ranges_to_remove} / {content};
//   errors {code, message}.
//
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

#include "sce/analysis/slicer.hpp"
#include "sce/basic/error.hpp"
#include "sce/basic/source_manager.hpp"

namespace sce
{

// ============================================================================
// Messages
// ============================================================================

struct Source
{
  std::string filename;
  std::string content;
  std::string language;  ///< editor language id, may be empty
  Point point;
};

struct SliceRequest
{
  Source source;
  SliceDirection direction = SliceDirection::Backward;
};

struct SliceResponse
{
  std::vector<TextRange> ranges_to_remove;
};

struct InlineRequest
{
  Source source;
  std::string target_content;
  Point target_point;
};

struct InlineResponse
{
  std::string content;
};

// ============================================================================
// JSON conversion
// ============================================================================

void to_json(nlohmann::json & j, const Point & p);
void to_json(nlohmann::json & j, const TextRange & r);
void to_json(nlohmann::json & j, const SliceResponse & r);
void to_json(nlohmann::json & j, const InlineResponse & r);
void to_json(nlohmann::json & j, const Error & e);

/// Decode a slice request; malformed input yields InvalidRequest
[[nodiscard]] Result<SliceRequest> parse_slice_request(const nlohmann::json & j);

/// Decode an inline request; malformed input yields InvalidRequest
[[nodiscard]] Result<InlineRequest> parse_inline_request(const nlohmann::json & j);

}  // namespace sce

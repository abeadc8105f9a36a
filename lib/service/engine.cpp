// sce/service/engine.cpp - Request-level entry points
#include "sce/service/engine.hpp"

#include <spdlog/spdlog.h>

#include <string>

#include "sce/analysis/reference_index.hpp"
#include "sce/analysis/slicer.hpp"
#include "sce/syntax/source_file.hpp"
#include "sce/transform/inliner.hpp"

namespace sce
{

using nlohmann::json;

Result<SliceResponse> Engine::slice(const SliceRequest & request) const
{
  const Source & src = request.source;

  auto grammar = resolve_language(src.filename, src.language, src.content, config_.languages);
  if (!grammar) return grammar.error();

  auto file =
    SourceFile::parse(src.filename, src.content, grammar.value(), config_.position_encoding);
  if (!file) return file.error();

  const ReferenceIndex index = ReferenceIndex::build(*file.value());
  const Slicer slicer(*file.value(), index, config_.slice);

  const uint32_t offset = file.value()->source().get_offset(src.point);
  SliceResponse response;
  response.ranges_to_remove = slicer.slice_at(offset, request.direction);

  spdlog::info(
    "slice {} {}:{}:{} -> {} range(s) to remove", to_string(request.direction), src.filename,
    src.point.line, src.point.column, response.ranges_to_remove.size());
  return response;
}

Result<InlineResponse> Engine::inline_call(const InlineRequest & request) const
{
  const Source & src = request.source;

  auto grammar = resolve_language(src.filename, src.language, src.content, config_.languages);
  if (!grammar) return grammar.error();

  auto call_file =
    SourceFile::parse(src.filename, src.content, grammar.value(), config_.position_encoding);
  if (!call_file) return call_file.error();

  // The definition arrives as text only; it is read with the call file's grammar.
  auto target_file = SourceFile::parse(
    src.filename + " (target)", request.target_content, grammar.value(),
    config_.position_encoding);
  if (!target_file) return target_file.error();

  const Inliner inliner(*call_file.value(), *target_file.value(), config_.inline_options);
  auto content = inliner.inline_call(
    call_file.value()->source().get_offset(src.point),
    target_file.value()->source().get_offset(request.target_point));
  if (!content) return content.error();

  return InlineResponse{std::move(content.value())};
}

// ============================================================================
// Message dispatch
// ============================================================================

namespace
{

json error_reply(const json & id, const Error & error)
{
  spdlog::debug("request failed: {}", error.describe());
  return json{{"id", id}, {"error", error}};
}

}  // namespace

json handle_message(const Engine & engine, const json & message)
{
  if (!message.is_object()) {
    return error_reply(nullptr, make_error(ErrorCode::InvalidRequest, "message must be an object"));
  }
  const json id = message.contains("id") ? message["id"] : json(nullptr);

  if (!message.contains("method") || !message["method"].is_string()) {
    return error_reply(id, make_error(ErrorCode::InvalidRequest, "'method' must be a string"));
  }
  const std::string method = message["method"].get<std::string>();
  const json params = message.contains("params") ? message["params"] : json::object();

  try {
    if (method == "slice") {
      auto request = parse_slice_request(params);
      if (!request) return error_reply(id, request.error());
      auto response = engine.slice(request.value());
      if (!response) return error_reply(id, response.error());
      return json{{"id", id}, {"result", response.value()}};
    }

    if (method == "inline") {
      auto request = parse_inline_request(params);
      if (!request) return error_reply(id, request.error());
      auto response = engine.inline_call(request.value());
      if (!response) return error_reply(id, response.error());
      return json{{"id", id}, {"result", response.value()}};
    }
  } catch (const json::exception & e) {
    return error_reply(id, make_error(ErrorCode::InvalidRequest, e.what()));
  }

  return error_reply(id, make_error(ErrorCode::InvalidRequest, "unknown method '" + method + "'"));
}

json handle_line(const Engine & engine, std::string_view line)
{
  json message;
  try {
    message = json::parse(line);
  } catch (const json::parse_error & e) {
    return error_reply(
      nullptr, make_error(ErrorCode::InvalidRequest, std::string("malformed JSON: ") + e.what()));
  }
  return handle_message(engine, message);
}

}  // namespace sce

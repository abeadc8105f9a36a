// sce/service/protocol.cpp - JSON encoding of requests and responses
#include "sce/service/protocol.hpp"

#include <limits>

namespace sce
{

using nlohmann::json;

namespace
{

Error invalid(std::string message)
{
  return make_error(ErrorCode::InvalidRequest, std::move(message));
}

bool read_uint32(const json & j, const char * key, uint32_t & out)
{
  if (!j.contains(key) || !j[key].is_number_integer()) {
    return false;
  }
  const auto v = j[key].get<int64_t>();
  if (v < 0 || v > std::numeric_limits<uint32_t>::max()) {
    return false;
  }
  out = static_cast<uint32_t>(v);
  return true;
}

Result<Point> parse_point(const json & j, const std::string & what)
{
  if (!j.is_object()) {
    return invalid(what + " must be an object {line, col}");
  }
  Point p;
  if (!read_uint32(j, "line", p.line)) {
    return invalid(what + ".line must be a non-negative integer");
  }
  if (!read_uint32(j, "col", p.column)) {
    return invalid(what + ".col must be a non-negative integer");
  }
  return p;
}

Result<Source> parse_source(const json & j)
{
  if (!j.is_object()) {
    return invalid("'source' must be an object");
  }

  Source s;
  if (!j.contains("filename") || !j["filename"].is_string()) {
    return invalid("source.filename must be a string");
  }
  s.filename = j["filename"].get<std::string>();

  if (!j.contains("content") || !j["content"].is_string()) {
    return invalid("source.content must be a string");
  }
  s.content = j["content"].get<std::string>();

  if (j.contains("language") && !j["language"].is_null()) {
    if (!j["language"].is_string()) {
      return invalid("source.language must be a string");
    }
    s.language = j["language"].get<std::string>();
  }

  if (!j.contains("point")) {
    return invalid("source.point is required");
  }
  auto point = parse_point(j["point"], "source.point");
  if (!point) return point.error();
  s.point = point.value();
  return s;
}

}  // namespace

// ============================================================================
// Encoding
// ============================================================================

void to_json(json & j, const Point & p)
{
  j = json{{"line", p.line}, {"col", p.column}};
}

void to_json(json & j, const TextRange & r)
{
  j = json{{"start", r.start}, {"end", r.end}};
}

void to_json(json & j, const SliceResponse & r)
{
  j = json{{"ranges_to_remove", r.ranges_to_remove}};
}

void to_json(json & j, const InlineResponse & r)
{
  j = json{{"content", r.content}};
}

void to_json(json & j, const Error & e)
{
  j = json{{"code", std::string(to_string(e.code))}, {"message", e.message}};
}

// ============================================================================
// Decoding
// ============================================================================

Result<SliceRequest> parse_slice_request(const json & j)
{
  if (!j.is_object()) {
    return invalid("slice request must be an object");
  }
  if (!j.contains("source")) {
    return invalid("slice request requires 'source'");
  }

  SliceRequest req;
  auto source = parse_source(j["source"]);
  if (!source) return source.error();
  req.source = std::move(source.value());

  if (j.contains("direction") && !j["direction"].is_null()) {
    const json & d = j["direction"];
    if (d.is_string()) {
      const auto dir = parse_slice_direction(d.get<std::string>());
      if (!dir) {
        return invalid("direction must be BACKWARD or FORWARD, got '" + d.get<std::string>() + "'");
      }
      req.direction = *dir;
    } else if (d.is_number_integer() && (d.get<int64_t>() == 0 || d.get<int64_t>() == 1)) {
      req.direction = d.get<int64_t>() == 0 ? SliceDirection::Backward : SliceDirection::Forward;
    } else {
      return invalid("direction must be \"BACKWARD\", \"FORWARD\", 0 or 1");
    }
  }
  return req;
}

Result<InlineRequest> parse_inline_request(const json & j)
{
  if (!j.is_object()) {
    return invalid("inline request must be an object");
  }
  if (!j.contains("source")) {
    return invalid("inline request requires 'source'");
  }

  InlineRequest req;
  auto source = parse_source(j["source"]);
  if (!source) return source.error();
  req.source = std::move(source.value());

  if (!j.contains("target_content") || !j["target_content"].is_string()) {
    return invalid("target_content must be a string");
  }
  req.target_content = j["target_content"].get<std::string>();

  if (!j.contains("target_point")) {
    return invalid("target_point is required");
  }
  auto target = parse_point(j["target_point"], "target_point");
  if (!target) return target.error();
  req.target_point = target.value();
  return req;
}

}  // namespace sce

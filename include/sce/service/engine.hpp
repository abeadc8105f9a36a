// sce/service/engine.hpp - Request-level entry points (slice, inline)
//
// Each call owns everything it builds (source files, trees, indices); an
// Engine holds only immutable configuration and may serve concurrent
// requests.
//
#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <utility>

#include "sce/basic/error.hpp"
#include "sce/project/engine_config.hpp"
#include "sce/service/protocol.hpp"

namespace sce
{

class Engine
{
public:
  explicit Engine(EngineConfig config = {}) : config_(std::move(config)) {}

  [[nodiscard]] const EngineConfig & config() const noexcept { return config_; }

  /// Compute the ranges to remove for a slice at the request's point
  [[nodiscard]] Result<SliceResponse> slice(const SliceRequest & request) const;

  /// Inline the call at the request's point; returns the new file content
  [[nodiscard]] Result<InlineResponse> inline_call(const InlineRequest & request) const;

private:
  EngineConfig config_;
};

// ============================================================================
// Message dispatch
// ============================================================================

/**
 * Handle one request envelope `{"id", "method", "params"}`.
 *
 * @return `{"id", "result"}` on success, `{"id", "error": {code, message}}`
 *         otherwise; never throws
 */
[[nodiscard]] nlohmann::json handle_message(const Engine & engine, const nlohmann::json & message);

/// Parse one line of JSON and handle it; malformed JSON yields an InvalidRequest error
[[nodiscard]] nlohmann::json handle_line(const Engine & engine, std::string_view line);

}  // namespace sce

/**
 * @file output_compare.hpp
 * @brief Normalization and comparison of program output against an
 *        expected answer.
 */

#pragma once

#include <json/value.h>

#include <optional>
#include <string>
#include <string_view>

namespace sandbox_gate {

/**
 * @brief Strip trailing whitespace from every line and drop trailing blank
 *        lines. CRLF line endings become LF.
 */
[[nodiscard]] std::string normalize_output(std::string_view text);

/// Strict single-document parse; nullopt for anything that is not JSON.
[[nodiscard]] std::optional<Json::Value> parse_json_document(std::string_view text);

/**
 * @brief Structural equality: numbers compare numerically (5 == 5.0),
 *        object members compare regardless of order.
 */
[[nodiscard]] bool json_equal(const Json::Value& lhs, const Json::Value& rhs);

/**
 * @brief Compare normalized outputs, structurally when both sides are JSON,
 *        otherwise as exact strings.
 */
[[nodiscard]] bool outputs_match(std::string_view actual, std::string_view expected);

}  // namespace sandbox_gate

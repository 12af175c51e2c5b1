/**
 * @file http_message.hpp
 * @brief HTTP/1.1 request/response types and their wire encoding.
 *
 * Only what the service needs: one request per connection, bodies framed
 * by Content-Length, no chunked transfer coding.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace sandbox_gate {

/// Header names are stored lower-cased.
using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest {
    std::string method;
    std::string target;         ///< As sent, including any query string
    std::string path;           ///< target without the query string
    std::string query;
    std::string version;
    HttpHeaders headers;
    std::string body;

    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

struct HttpResponse {
    int status{200};
    HttpHeaders headers;
    std::string body;

    [[nodiscard]] static HttpResponse json(int status, std::string body);
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
};

[[nodiscard]] std::string_view reason_phrase(int status) noexcept;

/**
 * @brief Parse the request line and headers (everything before the blank
 *        line, which must not be included).
 */
[[nodiscard]] Result<HttpRequest> parse_request_head(std::string_view head);

/**
 * @brief Body length announced by the head.
 *
 * Errors: ValidationError for a malformed Content-Length or a chunked body.
 */
[[nodiscard]] Result<uint64_t> content_length(const HttpRequest& request);

/// Status line, headers (Content-Length and Connection: close added) and body.
[[nodiscard]] std::string serialize_response(const HttpResponse& response);

/// Parse a complete response as produced by serialize_response.
[[nodiscard]] Result<HttpResponse> parse_response(std::string_view raw);

/// Decode %XX escapes in a path segment.
[[nodiscard]] std::string url_decode(std::string_view text);

}  // namespace sandbox_gate

/**
 * @file http_message.cpp
 * @brief HTTP/1.1 message parsing and serialization.
 */

#include "network/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace sandbox_gate {

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

/// Split "a\r\nb\r\n" into lines, tolerating bare LF.
template <typename F>
void for_each_line(std::string_view text, F&& func) {
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!func(line)) return;
        start = end + 1;
    }
}

bool parse_header_line(std::string_view line, HttpHeaders& headers) {
    const size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) return false;
    headers[to_lower(trim(line.substr(0, colon)))] = std::string{trim(line.substr(colon + 1))};
    return true;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // anonymous namespace

std::optional<std::string> HttpRequest::header(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    auto it = headers.find(to_lower(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

HttpResponse HttpResponse::json(int status, std::string body) {
    HttpResponse response;
    response.status = status;
    response.headers["content-type"] = "application/json";
    response.body = std::move(body);
    return response;
}

std::string_view reason_phrase(int status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 411: return "Length Required";
        case 413: return "Payload Too Large";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

Result<HttpRequest> parse_request_head(std::string_view head) {
    HttpRequest request;
    bool first = true;
    std::optional<Error> failure;

    for_each_line(head, [&](std::string_view line) {
        if (first) {
            first = false;
            const size_t sp1 = line.find(' ');
            const size_t sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
            if (sp2 == std::string_view::npos) {
                failure = Error{ErrorKind::ValidationError, "Malformed request line"};
                return false;
            }
            request.method = std::string{line.substr(0, sp1)};
            request.target = std::string{line.substr(sp1 + 1, sp2 - sp1 - 1)};
            request.version = std::string{line.substr(sp2 + 1)};
            if (!request.version.starts_with("HTTP/1.") || request.target.empty()) {
                failure = Error{ErrorKind::ValidationError, "Unsupported request line"};
                return false;
            }
            return true;
        }
        if (line.empty()) return true;
        if (!parse_header_line(line, request.headers)) {
            failure = Error{ErrorKind::ValidationError,
                            "Malformed header line: " + std::string{line}};
            return false;
        }
        return true;
    });

    if (failure) return *failure;
    if (first) return Error{ErrorKind::ValidationError, "Empty request"};

    const size_t q = request.target.find('?');
    request.path = request.target.substr(0, q);
    if (q != std::string::npos) request.query = request.target.substr(q + 1);
    return request;
}

Result<uint64_t> content_length(const HttpRequest& request) {
    if (auto te = request.header("transfer-encoding"); te && to_lower(*te) != "identity") {
        return Error{ErrorKind::ValidationError, "Transfer-Encoding is not supported"};
    }
    auto value = request.header("content-length");
    if (!value) return uint64_t{0};

    uint64_t length = 0;
    const char* begin = value->data();
    const char* end = begin + value->size();
    auto [ptr, ec] = std::from_chars(begin, end, length);
    if (ec != std::errc{} || ptr != end) {
        return Error{ErrorKind::ValidationError, "Invalid Content-Length: " + *value};
    }
    return length;
}

std::string serialize_response(const HttpResponse& response) {
    std::string out;
    out.reserve(response.body.size() + 256);
    out += "HTTP/1.1 ";
    out += std::to_string(response.status);
    out += ' ';
    out += reason_phrase(response.status);
    out += "\r\n";
    for (const auto& [name, value] : response.headers) {
        if (name == "content-length" || name == "connection") continue;
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    out += "content-length: " + std::to_string(response.body.size()) + "\r\n";
    out += "connection: close\r\n\r\n";
    out += response.body;
    return out;
}

Result<HttpResponse> parse_response(std::string_view raw) {
    const size_t head_end = raw.find("\r\n\r\n");
    if (head_end == std::string_view::npos) {
        return Error{ErrorKind::ValidationError, "Incomplete response head"};
    }

    HttpResponse response;
    bool first = true;
    bool ok = true;
    for_each_line(raw.substr(0, head_end), [&](std::string_view line) {
        if (first) {
            first = false;
            const size_t sp = line.find(' ');
            if (!line.starts_with("HTTP/1.") || sp == std::string_view::npos) {
                ok = false;
                return false;
            }
            auto code = line.substr(sp + 1, 3);
            auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(),
                                             response.status);
            ok = ec == std::errc{};
            return ok;
        }
        ok = parse_header_line(line, response.headers);
        return ok;
    });
    if (!ok || first) return Error{ErrorKind::ValidationError, "Malformed response head"};

    response.body = std::string{raw.substr(head_end + 4)};
    return response;
}

std::string url_decode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

}  // namespace sandbox_gate

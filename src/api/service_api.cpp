/**
 * @file service_api.cpp
 * @brief ServiceApi route table and handlers.
 */

#include "api/service_api.hpp"
#include "api/json_codec.hpp"
#include "network/http_server.hpp"

#include <string>
#include <vector>

namespace sandbox_gate {

namespace {

/// "/a/b/c" → {"a", "b", "c"}; empty segments are dropped.
std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        if (end > start) segments.push_back(url_decode(path.substr(start, end - start)));
        start = end + 1;
    }
    return segments;
}

HttpResponse method_not_allowed(std::string_view allowed) {
    auto response = error_response(405, "method_not_allowed",
                                   "Allowed: " + std::string{allowed});
    response.headers["allow"] = std::string{allowed};
    return response;
}

HttpResponse ok(const Json::Value& body) {
    return HttpResponse::json(200, write_json(body));
}

}  // anonymous namespace

ServiceApi::ServiceApi(ExecutionGateway& gateway, std::shared_ptr<Logger> logger)
    : gateway_(gateway)
    , logger_(std::move(logger)) {}

int ServiceApi::http_status_for(ExecutionStatus status) noexcept {
    return status == ExecutionStatus::InfrastructureError ? 503 : 200;
}

HttpResponse ServiceApi::handle(const HttpRequest& request, std::stop_token stop) {
    const auto segments = split_path(request.path);
    const auto& method = request.method;

    logger_->debug("HTTP request", {{"method", method}, {"path", request.path}});

    if (segments.size() == 1 && segments[0] == "execute") {
        if (method != "POST") return method_not_allowed("POST");
        return execute(request, stop);
    }
    if (segments.size() == 1 && segments[0] == "validate") {
        if (method != "POST") return method_not_allowed("POST");
        return validate(request);
    }
    if (segments.size() == 1 && segments[0] == "languages") {
        if (method != "GET") return method_not_allowed("GET");
        return languages();
    }
    if (segments.size() == 3 && segments[0] == "languages" && segments[2] == "validate") {
        if (method != "GET") return method_not_allowed("GET");
        return language_validate(segments[1]);
    }
    if (segments.size() == 1 && segments[0] == "health") {
        if (method != "GET") return method_not_allowed("GET");
        return health();
    }
    if (segments.size() == 1 && segments[0] == "executions") {
        if (method != "GET") return method_not_allowed("GET");
        return executions();
    }
    if (segments.size() == 2 && segments[0] == "executions") {
        if (method != "DELETE") return method_not_allowed("DELETE");
        return cancel(segments[1]);
    }

    return error_response(404, "not_found", "No route for " + request.path);
}

HttpResponse ServiceApi::execute(const HttpRequest& request, std::stop_token stop) {
    auto decoded = decode_execution_request(request.body);
    if (!decoded) return error_response(400, "validation_error", decoded.error().message);

    auto result = gateway_.execute(*decoded, stop);
    if (!result) {
        const int status = result.error().kind == ErrorKind::ValidationError ? 400 : 500;
        return error_response(status, std::string{to_string(result.error().kind)},
                              result.error().message);
    }
    return HttpResponse::json(http_status_for(result->status), write_json(to_json(*result)));
}

HttpResponse ServiceApi::validate(const HttpRequest& request) {
    auto decoded = decode_validate_request(request.body);
    if (!decoded) return error_response(400, "validation_error", decoded.error().message);
    return ok(to_json(gateway_.validate_only(decoded->code, decoded->language)));
}

HttpResponse ServiceApi::languages() {
    Json::Value list(Json::arrayValue);
    for (const auto& info : gateway_.languages()) list.append(to_json(info));

    Json::Value body(Json::objectValue);
    body["languages"] = list;
    return ok(body);
}

HttpResponse ServiceApi::language_validate(std::string_view language) {
    return ok(to_json(gateway_.language_supported(language)));
}

HttpResponse ServiceApi::health() {
    const auto report = gateway_.health();
    return HttpResponse::json(report.healthy ? 200 : 503,
                              write_json(to_json(report, kServiceName, kServiceVersion)));
}

HttpResponse ServiceApi::executions() {
    Json::Value list(Json::arrayValue);
    for (const auto& entry : gateway_.in_flight()) list.append(to_json(entry));

    Json::Value body(Json::objectValue);
    body["executions"] = list;
    return ok(body);
}

HttpResponse ServiceApi::cancel(std::string_view request_id) {
    const std::string id{request_id};
    if (!gateway_.cancel(id)) {
        return error_response(404, "not_found", "No in-flight execution " + id);
    }
    Json::Value body(Json::objectValue);
    body["request_id"] = id;
    body["cancelled"] = true;
    return ok(body);
}

}  // namespace sandbox_gate

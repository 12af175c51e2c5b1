/**
 * @file service_api.hpp
 * @brief HTTP routing onto the ExecutionGateway.
 *
 *   POST   /execute                        run a submission
 *   POST   /validate                       static screening only
 *   GET    /languages                      language catalogue
 *   GET    /languages/{language}/validate  support check for one language
 *   GET    /health                         runtime and admission state
 *   GET    /executions                     in-flight requests
 *   DELETE /executions/{request_id}        cancel an in-flight request
 */

#pragma once

#include "core/logger.hpp"
#include "gateway/gateway.hpp"
#include "network/http_message.hpp"

#include <memory>
#include <stop_token>
#include <string_view>

namespace sandbox_gate {

inline constexpr std::string_view kServiceName = "sandbox-gate";
inline constexpr std::string_view kServiceVersion = "1.0.0";

class ServiceApi {
public:
    ServiceApi(ExecutionGateway& gateway, std::shared_ptr<Logger> logger);

    /// Entry point handed to HttpServer::serve.
    HttpResponse handle(const HttpRequest& request, std::stop_token stop);

    /// 503 for infrastructure failures, 200 for every other outcome.
    [[nodiscard]] static int http_status_for(ExecutionStatus status) noexcept;

private:
    HttpResponse execute(const HttpRequest& request, std::stop_token stop);
    HttpResponse validate(const HttpRequest& request);
    HttpResponse languages();
    HttpResponse language_validate(std::string_view language);
    HttpResponse health();
    HttpResponse executions();
    HttpResponse cancel(std::string_view request_id);

    ExecutionGateway& gateway_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace sandbox_gate

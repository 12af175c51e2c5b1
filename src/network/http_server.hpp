/**
 * @file http_server.hpp
 * @brief Minimal HTTP/1.1 server over poll()-driven non-blocking sockets.
 *
 * An accept thread hands each connection to the worker ThreadPool; a
 * worker reads one request, calls the handler with its stop_token and
 * writes the response with "Connection: close". When the pool is full the
 * accept thread answers 503 itself.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "network/http_message.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

namespace sandbox_gate {

struct HttpServerOptions {
    std::string host{"0.0.0.0"};
    uint16_t port{8001};                 ///< 0 picks an ephemeral port
    uint64_t max_body_bytes{256 * 1024};
    uint32_t read_timeout_ms{10000};
    uint32_t write_timeout_ms{10000};
    int backlog{64};
};

class HttpServer {
public:
    static constexpr size_t MAX_HEAD_SIZE = 16 * 1024;

    using Handler = std::function<HttpResponse(const HttpRequest&, std::stop_token)>;

    HttpServer(HttpServerOptions options, ThreadPool& pool, std::shared_ptr<Logger> logger);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and listen; returns the bound port.
    Result<uint16_t> listen();

    void serve(Handler handler);
    void stop();

    [[nodiscard]] bool is_listening() const noexcept { return server_fd_ >= 0; }
    [[nodiscard]] uint16_t port() const noexcept { return bound_port_; }
    [[nodiscard]] uint64_t connections_accepted() const noexcept { return accepted_.load(); }

private:
    void handle_connection(int fd, std::stop_token stop);

    /// Read one request; on failure `error_status` is the status to answer with.
    Result<HttpRequest> read_request(int fd, int& error_status);

    static bool send_all(int fd, const void* buf, size_t len, uint32_t timeout_ms);
    void respond(int fd, const HttpResponse& response);

    HttpServerOptions options_;
    ThreadPool& pool_;
    std::shared_ptr<Logger> logger_;
    Handler handler_;

    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::jthread accept_thread_;
    std::atomic<uint64_t> accepted_{0};
};

/// {"error", "detail", "timestamp"} body used for every non-result response.
[[nodiscard]] HttpResponse error_response(int status, std::string_view error,
                                          std::string_view detail);

}  // namespace sandbox_gate

/**
 * @file http_server.cpp
 * @brief HttpServer implementation.
 *
 * Reads use poll() with the remaining read budget so a slow client cannot
 * hold a worker longer than read_timeout_ms.
 */

#include "network/http_server.hpp"
#include "core/request_id.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>

namespace sandbox_gate {

namespace {

void configure_socket(int fd) {
    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
}

void close_connection(int fd) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
}

/// Close after an early error reply: drain what the client is still sending
/// so the kernel does not reset the connection before the reply is read.
void linger_close(int fd) {
    ::shutdown(fd, SHUT_WR);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
    char sink[4096];
    while (std::chrono::steady_clock::now() < deadline) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, 50) <= 0) continue;
        if (::recv(fd, sink, sizeof(sink), 0) <= 0) break;
    }
    ::close(fd);
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

}  // anonymous namespace

HttpResponse error_response(int status, std::string_view error, std::string_view detail) {
    std::string body = "{\"error\":" + json_quote(error)
                     + ",\"detail\":" + json_quote(detail)
                     + ",\"timestamp\":" + json_quote(format_timestamp(std::chrono::system_clock::now()))
                     + "}";
    return HttpResponse::json(status, std::move(body));
}

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

HttpServer::HttpServer(HttpServerOptions options, ThreadPool& pool,
                       std::shared_ptr<Logger> logger)
    : options_(std::move(options))
    , pool_(pool)
    , logger_(std::move(logger)) {}

HttpServer::~HttpServer() {
    stop();
}

// ─────────────────────────────────────────────
// Listening
// ─────────────────────────────────────────────

Result<uint16_t> HttpServer::listen() {
    if (server_fd_ >= 0) {
        return Error{ErrorKind::Internal, "Already listening"};
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
    if (server_fd_ < 0) {
        return Error{ErrorKind::Internal,
                     "Failed to create server socket: " + std::string(strerror(errno))};
    }

    int optval = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(options_.port);
    if (::inet_pton(AF_INET, options_.host.c_str(), &addr.sin_addr) != 1) {
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorKind::ValidationError, "Invalid listen address: " + options_.host};
    }

    if (::bind(server_fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorKind::Internal, "Bind failed: " + std::string(strerror(errno))};
    }

    if (::listen(server_fd_, options_.backlog) < 0) {
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorKind::Internal, "Listen failed: " + std::string(strerror(errno))};
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    ::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &len);
    bound_port_ = ntohs(bound.sin_port);
    return bound_port_;
}

void HttpServer::serve(Handler handler) {
    if (server_fd_ < 0) return;
    handler_ = std::move(handler);

    accept_thread_ = std::jthread([this](std::stop_token stop) {
        while (!stop.stop_requested()) {
            pollfd pfd{};
            pfd.fd = server_fd_;
            pfd.events = POLLIN;

            int ready = ::poll(&pfd, 1, 100);  // 100ms timeout for stop check
            if (ready <= 0) continue;

            int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
            if (client_fd < 0) continue;

            configure_socket(client_fd);
            accepted_.fetch_add(1);

            const bool queued = pool_.try_post([this, client_fd](std::stop_token worker_stop) {
                handle_connection(client_fd, worker_stop);
            });
            if (!queued) {
                respond(client_fd, error_response(503, "service_unavailable",
                                                  "Server is at connection capacity"));
                close_connection(client_fd);
            }
        }
    });

    logger_->info("HTTP server listening", {
        {"host", options_.host},
        {"port", std::to_string(bound_port_)}
    });
}

void HttpServer::stop() {
    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

// ─────────────────────────────────────────────
// Connections
// ─────────────────────────────────────────────

void HttpServer::handle_connection(int fd, std::stop_token stop) {
    int error_status = 400;
    auto request = read_request(fd, error_status);
    if (!request) {
        respond(fd, error_response(error_status, std::string{reason_phrase(error_status)},
                                   request.error().message));
        linger_close(fd);
        return;
    }

    HttpResponse response;
    try {
        response = handler_(*request, stop);
    } catch (const std::exception& e) {
        logger_->error(std::string{"Request handler threw: "} + e.what(), {
            {"method", request->method},
            {"path", request->path}
        });
        response = error_response(500, "internal_error", e.what());
    }

    respond(fd, response);
    close_connection(fd);
}

Result<HttpRequest> HttpServer::read_request(int fd, int& error_status) {
    const auto deadline = std::chrono::steady_clock::now()
                        + std::chrono::milliseconds(options_.read_timeout_ms);
    std::string buffer;
    char chunk[4096];

    auto read_more = [&]() -> int {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, remaining_ms(deadline));
        if (ready <= 0) return -1;
        auto received = ::recv(fd, chunk, sizeof(chunk), 0);
        if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return 0;
        if (received <= 0) return -2;
        buffer.append(chunk, static_cast<size_t>(received));
        return static_cast<int>(received);
    };

    // Head
    size_t head_end = std::string::npos;
    while ((head_end = buffer.find("\r\n\r\n")) == std::string::npos) {
        if (buffer.size() > MAX_HEAD_SIZE) {
            error_status = 431;
            return Error{ErrorKind::InputTooLarge, "Request head too large"};
        }
        int got = read_more();
        if (got == -1) {
            error_status = 408;
            return Error{ErrorKind::TimeoutExceeded, "Timed out reading request"};
        }
        if (got == -2) {
            error_status = 400;
            return Error{ErrorKind::ValidationError, "Connection closed before request head"};
        }
    }

    auto request = parse_request_head(std::string_view{buffer}.substr(0, head_end));
    if (!request) {
        error_status = 400;
        return request.error();
    }

    auto length = content_length(*request);
    if (!length) {
        error_status = 400;
        return length.error();
    }
    if (*length > options_.max_body_bytes) {
        error_status = 413;
        return Error{ErrorKind::InputTooLarge,
                     "Request body of " + std::to_string(*length) + " bytes exceeds "
                     + std::to_string(options_.max_body_bytes)};
    }

    // Body
    const size_t body_start = head_end + 4;
    while (buffer.size() - body_start < *length) {
        int got = read_more();
        if (got == -1) {
            error_status = 408;
            return Error{ErrorKind::TimeoutExceeded, "Timed out reading request body"};
        }
        if (got == -2) {
            error_status = 400;
            return Error{ErrorKind::ValidationError, "Connection closed before request body"};
        }
    }

    request->body = buffer.substr(body_start, static_cast<size_t>(*length));
    return request;
}

void HttpServer::respond(int fd, const HttpResponse& response) {
    const std::string wire = serialize_response(response);
    if (!send_all(fd, wire.data(), wire.size(), options_.write_timeout_ms)) {
        logger_->debug("Client went away before the response was written");
    }
}

bool HttpServer::send_all(int fd, const void* buf, size_t len, uint32_t timeout_ms) {
    const auto* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready <= 0) return false;

        auto sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return false;
        }

        ptr += sent;
        remaining -= static_cast<size_t>(sent);
    }

    return true;
}

}  // namespace sandbox_gate

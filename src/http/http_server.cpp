/**
 * @file http_server.cpp
 * @brief Реализация многопоточного HTTP сервера
 */

#include "http_server.hpp"
#include "../core/json.hpp"
#include "../log/logger.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <condition_variable>
#include <cstring>
#include <format>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

namespace kasfaucet::http {

namespace {

constexpr std::string_view COMPONENT = "HttpServer";

/// @brief Ограничение на размер заголовков запроса
constexpr std::size_t MAX_HEADER_SIZE = 8 * 1024;

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

HttpMethod parse_method(std::string_view method) {
    if (method == "GET") return HttpMethod::GET;
    if (method == "POST") return HttpMethod::POST;
    if (method == "PUT") return HttpMethod::PUT;
    if (method == "DELETE") return HttpMethod::DELETE;
    if (method == "HEAD") return HttpMethod::HEAD;
    if (method == "OPTIONS") return HttpMethod::OPTIONS;
    return HttpMethod::UNKNOWN;
}

void add_cors_headers(HttpResponse& response) {
    response.headers["Access-Control-Allow-Origin"] = "*";
    response.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "Content-Type";
}

bool send_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    return true;
}

} // anonymous namespace

// =============================================================================
// HttpRequest
// =============================================================================

std::string HttpRequest::get_header(const std::string& name) const {
    auto lower_name = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == lower_name) {
            return value;
        }
    }
    return "";
}

// =============================================================================
// HttpResponse
// =============================================================================

HttpResponse HttpResponse::json(const std::string& json_body, HttpStatus status) {
    HttpResponse response;
    response.status = status;
    response.headers["Content-Type"] = "application/json";
    response.body = json_body;
    return response;
}

HttpResponse HttpResponse::text(const std::string& text_body) {
    HttpResponse response;
    response.status = HttpStatus::OK;
    response.headers["Content-Type"] = "text/plain; charset=utf-8";
    response.body = text_body;
    return response;
}

HttpResponse HttpResponse::error(HttpStatus status, std::string_view message) {
    HttpResponse response;
    response.status = status;
    response.headers["Content-Type"] = "application/json";
    response.body = "{\"error\":" + core::json::quote(message) + "}";
    return response;
}

std::string HttpResponse::serialize() const {
    std::ostringstream ss;

    ss << "HTTP/1.1 " << static_cast<int>(status) << " " << get_status_text(status) << "\r\n";

    for (const auto& [key, value] : headers) {
        ss << key << ": " << value << "\r\n";
    }

    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n";
    ss << "\r\n";
    ss << body;

    return ss.str();
}

// =============================================================================
// Разбор запроса
// =============================================================================

std::optional<HttpRequest> parse_request(std::string_view raw) {
    HttpRequest request;

    auto header_end = raw.find("\r\n\r\n");
    std::size_t body_start = header_end == std::string_view::npos ? raw.size() : header_end + 4;
    std::string_view head = raw.substr(0, std::min(header_end, raw.size()));

    auto next_line = [&head]() -> std::string_view {
        auto eol = head.find('\n');
        std::string_view line = head.substr(0, eol);
        head = eol == std::string_view::npos ? std::string_view{} : head.substr(eol + 1);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        return line;
    };

    // Request line: METHOD SP PATH SP VERSION
    std::string_view request_line = next_line();
    auto sp1 = request_line.find(' ');
    if (sp1 == std::string_view::npos) {
        return std::nullopt;
    }
    auto sp2 = request_line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos) {
        return std::nullopt;
    }

    std::string_view method = request_line.substr(0, sp1);
    std::string_view target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    std::string_view version = request_line.substr(sp2 + 1);

    if (target.empty() || target.front() != '/' || !version.starts_with("HTTP/")) {
        return std::nullopt;
    }

    request.method = parse_method(method);

    auto query_pos = target.find('?');
    if (query_pos != std::string_view::npos) {
        request.query = std::string(target.substr(query_pos + 1));
        request.path = std::string(target.substr(0, query_pos));
    } else {
        request.path = std::string(target);
    }

    while (!head.empty()) {
        std::string_view line = next_line();
        if (line.empty()) {
            break;
        }

        auto colon_pos = line.find(':');
        if (colon_pos == std::string_view::npos) {
            continue;
        }

        std::string_view name = line.substr(0, colon_pos);
        std::string_view value = line.substr(colon_pos + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
            value.remove_suffix(1);
        }

        request.headers[std::string(name)] = std::string(value);
    }

    if (body_start < raw.size()) {
        request.body = std::string(raw.substr(body_start));
    }

    return request;
}

// =============================================================================
// HttpServer Implementation
// =============================================================================

struct HttpServer::Impl {
    HttpServerConfig config;

    int server_fd{-1};
    uint16_t bound_port{0};

    std::atomic<bool> running{false};

    // Статистика
    std::atomic<uint64_t> requests_count{0};
    std::atomic<uint64_t> errors_count{0};

    // Маршруты
    struct Route {
        HttpMethod method;
        std::string path;
        HttpHandler handler;
    };
    std::vector<Route> routes;
    mutable std::mutex routes_mutex;

    // Активные соединения
    std::mutex connections_mutex;
    std::condition_variable connections_cv;
    std::atomic<uint32_t> active_connections{0};

    std::thread server_thread;

    explicit Impl(const HttpServerConfig& cfg) : config(cfg) {}

    ~Impl() {
        close_socket();
    }

    void close_socket() {
        if (server_fd >= 0) {
            ::close(server_fd);
            server_fd = -1;
        }
    }

    bool create_socket() {
        server_fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (server_fd < 0) {
            return false;
        }

        int opt = 1;
        ::setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        return true;
    }

    bool bind_socket() {
        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(config.port);

        if (config.bind_address == "0.0.0.0") {
            addr.sin_addr.s_addr = INADDR_ANY;
        } else {
            if (::inet_pton(AF_INET, config.bind_address.c_str(), &addr.sin_addr) <= 0) {
                return false;
            }
        }

        if (::bind(server_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
            return false;
        }

        // Порт 0: ядро выбирает свободный порт
        socklen_t len = sizeof(addr);
        if (::getsockname(server_fd, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
            bound_port = ntohs(addr.sin_port);
        }

        return true;
    }

    bool listen_socket() {
        return ::listen(server_fd, static_cast<int>(config.max_connections)) == 0;
    }

    void server_loop() {
        struct pollfd pfd{};
        pfd.fd = server_fd;
        pfd.events = POLLIN;

        while (running) {
            int ret = ::poll(&pfd, 1, 100);  // 100ms timeout

            if (ret < 0) {
                if (errno == EINTR) continue;
                log::error(COMPONENT, std::format("poll: {}", std::strerror(errno)));
                break;
            }

            if (ret == 0) continue;

            if (pfd.revents & POLLIN) {
                struct sockaddr_in client_addr{};
                socklen_t client_len = sizeof(client_addr);

                int client_fd = ::accept(server_fd,
                    reinterpret_cast<struct sockaddr*>(&client_addr), &client_len);

                if (client_fd < 0) {
                    continue;
                }

                char ip[INET_ADDRSTRLEN] = {};
                ::inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));

                spawn_connection(client_fd, ip);
            }
        }
    }

    void spawn_connection(int client_fd, std::string remote_address) {
        if (active_connections.load() >= config.max_connections) {
            errors_count++;
            auto response = HttpResponse::error(HttpStatus::ServiceUnavailable, "Server busy");
            add_cors_headers(response);
            send_all(client_fd, response.serialize());
            ::close(client_fd);
            return;
        }

        active_connections++;
        std::thread([this, client_fd, remote = std::move(remote_address)]() {
            handle_client(client_fd, remote);
            ::close(client_fd);

            std::lock_guard lock(connections_mutex);
            active_connections--;
            connections_cv.notify_all();
        }).detach();
    }

    /**
     * @brief Прочитать запрос целиком (заголовки + Content-Length байт тела)
     */
    std::optional<std::string> read_request(int client_fd, HttpStatus& failure) {
        struct timeval tv{};
        tv.tv_sec = static_cast<time_t>(config.read_timeout);
        ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::string data;
        std::size_t header_end = std::string::npos;
        std::size_t content_length = 0;
        char buffer[4096];

        while (true) {
            if (header_end == std::string::npos) {
                header_end = data.find("\r\n\r\n");
                if (header_end != std::string::npos) {
                    auto request = parse_request(std::string_view(data).substr(0, header_end + 4));
                    if (!request) {
                        failure = HttpStatus::BadRequest;
                        return std::nullopt;
                    }
                    auto length = request->get_header("Content-Length");
                    if (!length.empty()) {
                        auto [ptr, ec] = std::from_chars(length.data(), length.data() + length.size(),
                                                         content_length);
                        if (ec != std::errc{} || ptr != length.data() + length.size()) {
                            failure = HttpStatus::BadRequest;
                            return std::nullopt;
                        }
                    }
                    if (content_length > config.max_body_size) {
                        failure = HttpStatus::PayloadTooLarge;
                        return std::nullopt;
                    }
                } else if (data.size() > MAX_HEADER_SIZE) {
                    failure = HttpStatus::PayloadTooLarge;
                    return std::nullopt;
                }
            }

            if (header_end != std::string::npos &&
                data.size() >= header_end + 4 + content_length) {
                data.resize(header_end + 4 + content_length);
                return data;
            }

            ssize_t n = ::recv(client_fd, buffer, sizeof(buffer), 0);
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                failure = HttpStatus::BadRequest;
                return std::nullopt;
            }
            data.append(buffer, static_cast<std::size_t>(n));
        }
    }

    void handle_client(int client_fd, const std::string& remote_address) {
        HttpStatus failure = HttpStatus::BadRequest;
        auto raw = read_request(client_fd, failure);

        if (!raw) {
            errors_count++;
            auto response = HttpResponse::error(failure, get_status_text(failure));
            add_cors_headers(response);
            send_all(client_fd, response.serialize());
            return;
        }

        auto request = parse_request(*raw);
        if (!request) {
            errors_count++;
            auto response = HttpResponse::error(HttpStatus::BadRequest, "Bad request");
            add_cors_headers(response);
            send_all(client_fd, response.serialize());
            return;
        }
        request->remote_address = remote_address;

        HttpResponse response = dispatch(*request);

        if (!send_all(client_fd, response.serialize())) {
            errors_count++;
        }
        requests_count++;
    }

    HttpResponse route_request(const HttpRequest& request) {
        HttpHandler handler;
        bool path_known = false;
        std::string allow;

        {
            std::lock_guard<std::mutex> lock(routes_mutex);
            for (const auto& route : routes) {
                if (route.path != request.path) {
                    continue;
                }
                path_known = true;
                if (!allow.empty()) allow += ", ";
                allow += to_string(route.method);
                if (route.method == request.method) {
                    handler = route.handler;
                }
            }
        }

        if (handler) {
            try {
                return handler(request);
            } catch (const std::exception& e) {
                errors_count++;
                log::error(COMPONENT, std::format("Ошибка обработчика {}: {}", request.path, e.what()));
                return HttpResponse::error(HttpStatus::InternalServerError, "Internal server error");
            }
        }

        if (!path_known) {
            return HttpResponse::error(HttpStatus::NotFound, "Not found");
        }

        if (request.method == HttpMethod::OPTIONS) {
            HttpResponse response;
            response.status = HttpStatus::NoContent;
            response.headers["Allow"] = allow + ", OPTIONS";
            return response;
        }

        auto response = HttpResponse::error(HttpStatus::MethodNotAllowed, "Method not allowed");
        response.headers["Allow"] = allow;
        return response;
    }

    HttpResponse dispatch(const HttpRequest& request) {
        HttpResponse response = route_request(request);
        add_cors_headers(response);
        return response;
    }
};

// =============================================================================
// Публичный API
// =============================================================================

HttpServer::HttpServer(const HttpServerConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::route(HttpMethod method, const std::string& path, HttpHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->routes_mutex);
    impl_->routes.push_back({method, path, std::move(handler)});
}

HttpResponse HttpServer::dispatch(const HttpRequest& request) const {
    return impl_->dispatch(request);
}

Result<void> HttpServer::start() {
    if (impl_->running) {
        return {};
    }

    if (!impl_->create_socket()) {
        return std::unexpected(Error{ErrorCode::NetworkConnectionFailed,
            "Не удалось создать сокет"});
    }

    if (!impl_->bind_socket()) {
        impl_->close_socket();
        return std::unexpected(Error{ErrorCode::NetworkConnectionFailed,
            "Не удалось привязать сокет к " + impl_->config.bind_address +
            ":" + std::to_string(impl_->config.port)});
    }

    if (!impl_->listen_socket()) {
        impl_->close_socket();
        return std::unexpected(Error{ErrorCode::NetworkConnectionFailed,
            "Не удалось начать прослушивание"});
    }

    impl_->running = true;
    impl_->server_thread = std::thread([this]() {
        impl_->server_loop();
    });

    return {};
}

void HttpServer::stop() {
    impl_->running = false;

    if (impl_->server_thread.joinable()) {
        impl_->server_thread.join();
    }
    impl_->close_socket();

    std::unique_lock lock(impl_->connections_mutex);
    impl_->connections_cv.wait(lock, [this] {
        return impl_->active_connections.load() == 0;
    });
}

bool HttpServer::is_running() const noexcept {
    return impl_->running;
}

uint16_t HttpServer::get_port() const noexcept {
    return impl_->bound_port != 0 ? impl_->bound_port : impl_->config.port;
}

uint64_t HttpServer::get_requests_count() const noexcept {
    return impl_->requests_count;
}

uint64_t HttpServer::get_errors_count() const noexcept {
    return impl_->errors_count;
}

uint32_t HttpServer::get_active_connections() const noexcept {
    return impl_->active_connections;
}

} // namespace kasfaucet::http

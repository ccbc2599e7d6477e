/**
 * @file http_server.hpp
 * @brief Простой многопоточный HTTP/1.1 сервер
 *
 * Минималистичный HTTP/1.1 сервер для API faucet:
 * - /status, /claim - выдача средств
 * - /health - проверка здоровья для load balancer
 * - /metrics - метрики в формате Prometheus
 *
 * Каждое соединение обрабатывается в своём потоке, количество
 * одновременных соединений ограничено max_connections.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kasfaucet::http {

// =============================================================================
// HTTP типы
// =============================================================================

/**
 * @brief HTTP методы
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    UNKNOWN
};

[[nodiscard]] constexpr std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
        default: return "UNKNOWN";
    }
}

/**
 * @brief HTTP статус коды
 */
enum class HttpStatus {
    OK = 200,
    NoContent = 204,
    BadRequest = 400,
    NotFound = 404,
    MethodNotAllowed = 405,
    PayloadTooLarge = 413,
    TooManyRequests = 429,
    InternalServerError = 500,
    ServiceUnavailable = 503
};

/**
 * @brief Получить текст статуса
 */
[[nodiscard]] constexpr std::string_view get_status_text(HttpStatus status) noexcept {
    switch (status) {
        case HttpStatus::OK: return "OK";
        case HttpStatus::NoContent: return "No Content";
        case HttpStatus::BadRequest: return "Bad Request";
        case HttpStatus::NotFound: return "Not Found";
        case HttpStatus::MethodNotAllowed: return "Method Not Allowed";
        case HttpStatus::PayloadTooLarge: return "Payload Too Large";
        case HttpStatus::TooManyRequests: return "Too Many Requests";
        case HttpStatus::InternalServerError: return "Internal Server Error";
        case HttpStatus::ServiceUnavailable: return "Service Unavailable";
        default: return "Unknown";
    }
}

/**
 * @brief HTTP запрос
 */
struct HttpRequest {
    /// @brief Метод
    HttpMethod method{HttpMethod::GET};

    /// @brief Путь (например, "/claim")
    std::string path;

    /// @brief Query string (без ?)
    std::string query;

    /// @brief Заголовки
    std::unordered_map<std::string, std::string> headers;

    /// @brief Тело запроса
    std::string body;

    /// @brief IP адрес клиента
    std::string remote_address;

    /// @brief Получить заголовок (case-insensitive)
    [[nodiscard]] std::string get_header(const std::string& name) const;
};

/**
 * @brief HTTP ответ
 */
struct HttpResponse {
    /// @brief Статус
    HttpStatus status{HttpStatus::OK};

    /// @brief Заголовки
    std::unordered_map<std::string, std::string> headers;

    /// @brief Тело ответа
    std::string body;

    /**
     * @brief Создать ответ с JSON
     */
    static HttpResponse json(const std::string& json_body, HttpStatus status = HttpStatus::OK);

    /**
     * @brief Создать ответ OK с plain text
     */
    static HttpResponse text(const std::string& text_body);

    /**
     * @brief Создать ответ с ошибкой: {"error": message}
     */
    static HttpResponse error(HttpStatus status, std::string_view message);

    /**
     * @brief Сериализовать в HTTP строку
     */
    [[nodiscard]] std::string serialize() const;
};

/**
 * @brief Разобрать заголовок и тело HTTP запроса
 *
 * @param raw Полный текст запроса (заголовки и тело)
 * @return Запрос или nullopt, если строка запроса некорректна
 */
[[nodiscard]] std::optional<HttpRequest> parse_request(std::string_view raw);

// =============================================================================
// HTTP Handler
// =============================================================================

/**
 * @brief Тип обработчика HTTP запроса
 */
using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

// =============================================================================
// HTTP Server
// =============================================================================

/**
 * @brief Конфигурация HTTP сервера
 */
struct HttpServerConfig {
    /// @brief Адрес для прослушивания
    std::string bind_address{"0.0.0.0"};

    /// @brief Порт
    uint16_t port{constants::DEFAULT_SERVER_PORT};

    /// @brief Максимальное количество одновременных соединений
    uint32_t max_connections{constants::DEFAULT_MAX_CONNECTIONS};

    /// @brief Таймаут чтения (секунды)
    uint32_t read_timeout{10};

    /// @brief Максимальный размер тела запроса
    std::size_t max_body_size{constants::MAX_HTTP_BODY_SIZE};
};

/**
 * @brief HTTP сервер
 *
 * Все ответы несут разрешающие CORS заголовки. OPTIONS на известный
 * путь отвечает 204, неизвестный путь 404, известный путь с другим
 * методом 405.
 */
class HttpServer {
public:
    explicit HttpServer(const HttpServerConfig& config);

    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // ==========================================================================
    // Маршрутизация
    // ==========================================================================

    /**
     * @brief Зарегистрировать обработчик для метода и пути
     */
    void route(HttpMethod method, const std::string& path, HttpHandler handler);

    /**
     * @brief Обработать запрос без сети (маршрутизация + CORS)
     */
    [[nodiscard]] HttpResponse dispatch(const HttpRequest& request) const;

    // ==========================================================================
    // Управление
    // ==========================================================================

    /**
     * @brief Запустить сервер
     *
     * @return Result<void> Успех или NetworkConnectionFailed
     */
    [[nodiscard]] Result<void> start();

    /**
     * @brief Остановить сервер и дождаться активных соединений
     */
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    [[nodiscard]] uint16_t get_port() const noexcept;

    // ==========================================================================
    // Статистика
    // ==========================================================================

    [[nodiscard]] uint64_t get_requests_count() const noexcept;

    [[nodiscard]] uint64_t get_errors_count() const noexcept;

    [[nodiscard]] uint32_t get_active_connections() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace kasfaucet::http

/**
 * @file health_handler.hpp
 * @brief HTTP обработчик для /health endpoint
 *
 * Возвращает информацию о здоровье сервиса в формате JSON.
 */

#pragma once

#include "http_server.hpp"

#include <chrono>
#include <functional>
#include <sstream>
#include <utility>

namespace kasfaucet::http {

// =============================================================================
// Данные для Health Check
// =============================================================================

/**
 * @brief Провайдер данных для health check
 */
struct HealthData {
    /// @brief Время запуска сервиса
    std::chrono::steady_clock::time_point start_time;

    /// @brief Отвечала ли нода на последний запрос
    bool node_connected{false};

    /// @brief Outpoint'ы в резерве
    uint64_t reserved_outpoints{0};

    /// @brief Здоров ли сервис
    bool is_healthy{true};

    /// @brief Сообщение о статусе
    std::string status_message{"healthy"};
};

/**
 * @brief Функция получения данных для health check
 */
using HealthDataProvider = std::function<HealthData()>;

// =============================================================================
// Health Handler
// =============================================================================

/**
 * @brief Создать обработчик /health endpoint
 *
 * @param provider Функция получения данных
 * @return HttpHandler Обработчик
 */
inline HttpHandler create_health_handler(HealthDataProvider provider) {
    return [provider = std::move(provider)](const HttpRequest& /*request*/) -> HttpResponse {
        HealthData data = provider();

        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            now - data.start_time
        );

        std::ostringstream json;
        json << "{\n";
        json << "  \"status\": \"" << data.status_message << "\",\n";
        json << "  \"uptime_seconds\": " << uptime.count() << ",\n";
        json << "  \"kaspad\": \""
             << (data.node_connected ? "connected" : "disconnected") << "\",\n";
        json << "  \"reserved_outpoints\": " << data.reserved_outpoints << "\n";
        json << "}";

        return HttpResponse::json(
            json.str(),
            data.is_healthy ? HttpStatus::OK : HttpStatus::ServiceUnavailable
        );
    };
}

} // namespace kasfaucet::http

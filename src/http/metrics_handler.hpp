/**
 * @file metrics_handler.hpp
 * @brief HTTP обработчик для /metrics endpoint (Prometheus формат)
 */

#pragma once

#include "http_server.hpp"
#include "../monitoring/metrics.hpp"

#include <functional>
#include <utility>

namespace kasfaucet::http {

/**
 * @brief Функция обновления gauge значений перед экспортом
 */
using MetricsRefresher = std::function<void(monitoring::Metrics&)>;

/**
 * @brief Создать обработчик /metrics endpoint
 *
 * @param refresh Опционально обновляет gauges (например, число резерваций)
 * @return HttpHandler Обработчик
 */
inline HttpHandler create_metrics_handler(MetricsRefresher refresh = {}) {
    return [refresh = std::move(refresh)](const HttpRequest& /*request*/) -> HttpResponse {
        auto& metrics = monitoring::Metrics::instance();
        if (refresh) {
            refresh(metrics);
        }

        HttpResponse response;
        response.status = HttpStatus::OK;
        response.headers["Content-Type"] = "text/plain; version=0.0.4; charset=utf-8";
        response.body = metrics.export_prometheus();
        return response;
    };
}

} // namespace kasfaucet::http

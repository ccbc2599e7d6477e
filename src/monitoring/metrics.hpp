/**
 * @file metrics.hpp
 * @brief Prometheus метрики faucet
 *
 * Централизованный сбор метрик с потокобезопасным доступом.
 * Поддерживает counters, gauges и histograms.
 * Метрики только наблюдаются: логика выдачи их не читает.
 */

#pragma once

#include "../core/types.hpp"

#include <atomic>
#include <chrono>
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace kasfaucet::monitoring {

// =============================================================================
// Histogram Buckets
// =============================================================================

/**
 * @brief Bucket для histogram
 */
struct HistogramBucket {
    double le;           ///< Upper bound (less than or equal)
    std::atomic<uint64_t> count{0};

    explicit HistogramBucket(double upper_bound) : le(upper_bound) {}

    HistogramBucket(const HistogramBucket& other)
        : le(other.le), count(other.count.load()) {}

    HistogramBucket& operator=(const HistogramBucket& other) {
        if (this != &other) {
            le = other.le;
            count.store(other.count.load());
        }
        return *this;
    }
};

/**
 * @brief Histogram метрика
 */
struct Histogram {
    std::vector<HistogramBucket> buckets;
    std::atomic<double> sum{0.0};
    std::atomic<uint64_t> count{0};

    Histogram() = default;

    Histogram(const Histogram& other)
        : buckets(other.buckets)
        , sum(other.sum.load())
        , count(other.count.load()) {}

    Histogram& operator=(const Histogram& other) {
        if (this != &other) {
            buckets = other.buckets;
            sum.store(other.sum.load());
            count.store(other.count.load());
        }
        return *this;
    }

    /**
     * @brief Buckets для длительности выдачи (ms)
     *
     * Выдача включает запросы к ноде, поэтому шкала до 10 секунд.
     */
    static Histogram create_claim_latency_histogram() {
        Histogram h;
        for (double le : {10.0, 25.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0, 10000.0}) {
            h.buckets.emplace_back(le);
        }
        h.buckets.emplace_back(std::numeric_limits<double>::infinity()); // +Inf
        return h;
    }

    /**
     * @brief Записать наблюдение
     */
    void observe(double value) {
        for (auto& bucket : buckets) {
            if (value <= bucket.le) {
                bucket.count++;
            }
        }

        double expected = sum.load();
        while (!sum.compare_exchange_weak(expected, expected + value)) {
        }

        count++;
    }

    void reset() {
        for (auto& bucket : buckets) {
            bucket.count = 0;
        }
        sum = 0.0;
        count = 0;
    }
};

// =============================================================================
// Metrics Singleton
// =============================================================================

/**
 * @brief Централизованный сборщик метрик
 */
class Metrics {
public:
    static Metrics& instance();

    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    // =========================================================================
    // Время запуска
    // =========================================================================

    void set_start_time();

    [[nodiscard]] uint64_t get_uptime_seconds() const;

    // =========================================================================
    // Counters
    // =========================================================================

    void inc_http_requests();

    void inc_claims_received();

    /**
     * @brief Успешная выдача на сумму amount (sompi)
     */
    void inc_claims_succeeded(Amount amount);

    /**
     * @brief Неудачная выдача с причиной (имя кода ошибки)
     */
    void inc_claims_failed(std::string_view reason);

    // =========================================================================
    // Gauges
    // =========================================================================

    void set_balance(Amount sompi);

    void set_reserved_outpoints(uint64_t count);

    void set_node_connected(bool connected);

    // =========================================================================
    // Histograms
    // =========================================================================

    /**
     * @brief Длительность обработки выдачи (ms)
     */
    void observe_claim_latency(double ms);

    // =========================================================================
    // Получение значений
    // =========================================================================

    [[nodiscard]] uint64_t get_http_requests() const;
    [[nodiscard]] uint64_t get_claims_received() const;
    [[nodiscard]] uint64_t get_claims_succeeded() const;
    [[nodiscard]] uint64_t get_claims_failed(std::string_view reason) const;
    [[nodiscard]] uint64_t get_sompi_dispensed() const;
    [[nodiscard]] Amount get_balance() const;
    [[nodiscard]] bool is_node_connected() const;

    // =========================================================================
    // Экспорт
    // =========================================================================

    /**
     * @brief Экспортировать метрики в формате Prometheus
     */
    [[nodiscard]] std::string export_prometheus() const;

    /**
     * @brief Сбросить все метрики
     */
    void reset();

private:
    Metrics();
    ~Metrics() = default;

    std::chrono::steady_clock::time_point start_time_;

    // Counters
    std::atomic<uint64_t> http_requests_{0};
    std::atomic<uint64_t> claims_received_{0};
    std::atomic<uint64_t> claims_succeeded_{0};
    std::atomic<uint64_t> sompi_dispensed_{0};

    // Неудачи по причинам (упорядочены для стабильного экспорта)
    std::map<std::string, uint64_t, std::less<>> claims_failed_;
    mutable std::mutex claims_failed_mutex_;

    // Gauges
    std::atomic<uint64_t> balance_{0};
    std::atomic<uint64_t> reserved_outpoints_{0};
    std::atomic<bool> node_connected_{false};

    // Histograms
    Histogram claim_latency_histogram_;
};

} // namespace kasfaucet::monitoring

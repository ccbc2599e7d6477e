/**
 * @file metrics.cpp
 * @brief Реализация Prometheus метрик
 */

#include "metrics.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace kasfaucet::monitoring {

// =============================================================================
// Singleton
// =============================================================================

Metrics& Metrics::instance() {
    static Metrics instance;
    return instance;
}

Metrics::Metrics()
    : start_time_(std::chrono::steady_clock::now())
    , claim_latency_histogram_(Histogram::create_claim_latency_histogram()) {}

// =============================================================================
// Время
// =============================================================================

void Metrics::set_start_time() {
    start_time_ = std::chrono::steady_clock::now();
}

uint64_t Metrics::get_uptime_seconds() const {
    auto now = std::chrono::steady_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count()
    );
}

// =============================================================================
// Counters
// =============================================================================

void Metrics::inc_http_requests() {
    http_requests_++;
}

void Metrics::inc_claims_received() {
    claims_received_++;
}

void Metrics::inc_claims_succeeded(Amount amount) {
    claims_succeeded_++;
    sompi_dispensed_ += amount;
}

void Metrics::inc_claims_failed(std::string_view reason) {
    std::lock_guard<std::mutex> lock(claims_failed_mutex_);
    auto it = claims_failed_.find(reason);
    if (it == claims_failed_.end()) {
        claims_failed_.emplace(std::string(reason), 1);
    } else {
        ++it->second;
    }
}

// =============================================================================
// Gauges
// =============================================================================

void Metrics::set_balance(Amount sompi) {
    balance_ = sompi;
}

void Metrics::set_reserved_outpoints(uint64_t count) {
    reserved_outpoints_ = count;
}

void Metrics::set_node_connected(bool connected) {
    node_connected_ = connected;
}

// =============================================================================
// Histograms
// =============================================================================

void Metrics::observe_claim_latency(double ms) {
    claim_latency_histogram_.observe(ms);
}

// =============================================================================
// Getters
// =============================================================================

uint64_t Metrics::get_http_requests() const {
    return http_requests_;
}

uint64_t Metrics::get_claims_received() const {
    return claims_received_;
}

uint64_t Metrics::get_claims_succeeded() const {
    return claims_succeeded_;
}

uint64_t Metrics::get_claims_failed(std::string_view reason) const {
    std::lock_guard<std::mutex> lock(claims_failed_mutex_);
    auto it = claims_failed_.find(reason);
    return it == claims_failed_.end() ? 0 : it->second;
}

uint64_t Metrics::get_sompi_dispensed() const {
    return sompi_dispensed_;
}

Amount Metrics::get_balance() const {
    return balance_;
}

bool Metrics::is_node_connected() const {
    return node_connected_;
}

// =============================================================================
// Экспорт
// =============================================================================

std::string Metrics::export_prometheus() const {
    std::ostringstream out;
    out << std::fixed << std::setprecision(6);

    out << "# HELP kasfaucet_http_requests_total Total HTTP requests\n";
    out << "# TYPE kasfaucet_http_requests_total counter\n";
    out << "kasfaucet_http_requests_total " << http_requests_.load() << "\n\n";

    out << "# HELP kasfaucet_claims_received_total Total claim requests\n";
    out << "# TYPE kasfaucet_claims_received_total counter\n";
    out << "kasfaucet_claims_received_total " << claims_received_.load() << "\n\n";

    out << "# HELP kasfaucet_claims_succeeded_total Total successful claims\n";
    out << "# TYPE kasfaucet_claims_succeeded_total counter\n";
    out << "kasfaucet_claims_succeeded_total " << claims_succeeded_.load() << "\n\n";

    {
        std::lock_guard<std::mutex> lock(claims_failed_mutex_);
        out << "# HELP kasfaucet_claims_failed_total Failed claims by reason\n";
        out << "# TYPE kasfaucet_claims_failed_total counter\n";
        for (const auto& [reason, count] : claims_failed_) {
            out << "kasfaucet_claims_failed_total{reason=\"" << reason << "\"} "
                << count << "\n";
        }
        out << "\n";
    }

    out << "# HELP kasfaucet_dispensed_sompi_total Total sompi sent to claimants\n";
    out << "# TYPE kasfaucet_dispensed_sompi_total counter\n";
    out << "kasfaucet_dispensed_sompi_total " << sompi_dispensed_.load() << "\n\n";

    out << "# HELP kasfaucet_balance_sompi Last known faucet balance\n";
    out << "# TYPE kasfaucet_balance_sompi gauge\n";
    out << "kasfaucet_balance_sompi " << balance_.load() << "\n\n";

    out << "# HELP kasfaucet_reserved_outpoints Outpoints spent by unconfirmed faucet transactions\n";
    out << "# TYPE kasfaucet_reserved_outpoints gauge\n";
    out << "kasfaucet_reserved_outpoints " << reserved_outpoints_.load() << "\n\n";

    out << "# HELP kasfaucet_node_connected kaspad connection status\n";
    out << "# TYPE kasfaucet_node_connected gauge\n";
    out << "kasfaucet_node_connected " << (node_connected_.load() ? 1 : 0) << "\n\n";

    out << "# HELP kasfaucet_claim_latency_ms Claim processing time in milliseconds\n";
    out << "# TYPE kasfaucet_claim_latency_ms histogram\n";
    for (const auto& bucket : claim_latency_histogram_.buckets) {
        if (std::isinf(bucket.le)) {
            out << "kasfaucet_claim_latency_ms_bucket{le=\"+Inf\"} " << bucket.count.load() << "\n";
        } else {
            out << "kasfaucet_claim_latency_ms_bucket{le=\"" << bucket.le << "\"} "
                << bucket.count.load() << "\n";
        }
    }
    out << "kasfaucet_claim_latency_ms_sum " << claim_latency_histogram_.sum.load() << "\n";
    out << "kasfaucet_claim_latency_ms_count " << claim_latency_histogram_.count.load() << "\n\n";

    out << "# HELP kasfaucet_uptime_seconds Server uptime\n";
    out << "# TYPE kasfaucet_uptime_seconds counter\n";
    out << "kasfaucet_uptime_seconds " << get_uptime_seconds() << "\n\n";

    return out.str();
}

void Metrics::reset() {
    http_requests_ = 0;
    claims_received_ = 0;
    claims_succeeded_ = 0;
    sompi_dispensed_ = 0;
    balance_ = 0;
    reserved_outpoints_ = 0;
    node_connected_ = false;

    claim_latency_histogram_.reset();

    {
        std::lock_guard<std::mutex> lock(claims_failed_mutex_);
        claims_failed_.clear();
    }

    start_time_ = std::chrono::steady_clock::now();
}

} // namespace kasfaucet::monitoring

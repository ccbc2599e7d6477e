/**
 * @file faucet_handler.cpp
 * @brief Реализация обработчиков /status и /claim
 */

#include "faucet_handler.hpp"
#include "../core/json.hpp"
#include "../log/logger.hpp"
#include "../monitoring/metrics.hpp"

#include <chrono>
#include <format>
#include <string>
#include <utility>

namespace kasfaucet::http {

namespace json = core::json;

namespace {

constexpr std::string_view COMPONENT = "FaucetApi";

/// @brief Сообщение клиенту для серверных ошибок
constexpr std::string_view GENERIC_FAILURE = "Failed to process claim, please try again later";

std::string client_message(const Error& error) {
    switch (error.code) {
        case ErrorCode::InvalidAddress:
            return "Invalid Kaspa address";
        case ErrorCode::RateLimited:
            return std::format("Rate limited: {}", error.message);
        case ErrorCode::WalletBusy:
            return "Faucet is busy, please try again later";
        default:
            return std::string(GENERIC_FAILURE);
    }
}

} // anonymous namespace

HttpStatus status_for(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidAddress: return HttpStatus::BadRequest;
        case ErrorCode::RateLimited: return HttpStatus::TooManyRequests;
        case ErrorCode::WalletBusy: return HttpStatus::ServiceUnavailable;
        default: return HttpStatus::InternalServerError;
    }
}

std::string_view failure_reason(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidAddress: return "invalid_address";
        case ErrorCode::RateLimited: return "rate_limited";
        case ErrorCode::InsufficientFunds: return "insufficient_funds";
        case ErrorCode::SigningFailure: return "signing_failure";
        case ErrorCode::SubmissionFailure: return "submission_failure";
        case ErrorCode::NodeUnavailable: return "node_unavailable";
        case ErrorCode::WalletBusy: return "wallet_busy";
        default: return "internal";
    }
}

// =============================================================================
// /status
// =============================================================================

HttpHandler create_status_handler(faucet::ClaimOrchestrator& orchestrator) {
    return [&orchestrator](const HttpRequest& /*request*/) -> HttpResponse {
        auto& metrics = monitoring::Metrics::instance();
        metrics.inc_http_requests();

        auto status = orchestrator.status();
        if (!status) {
            metrics.set_node_connected(false);
            return HttpResponse::error(HttpStatus::InternalServerError, "Failed to fetch faucet status");
        }

        metrics.set_node_connected(true);
        metrics.set_balance(status->balance);

        std::string body = std::format(
            "{{\"active\":{},\"faucetAddress\":{},\"balanceKas\":{},\"nextClaimSeconds\":{}}}",
            status->active ? "true" : "false",
            json::quote(status->faucet_address),
            json::quote(std::to_string(status->balance)),
            status->next_claim_seconds
        );
        return HttpResponse::json(body);
    };
}

// =============================================================================
// /claim
// =============================================================================

HttpHandler create_claim_handler(faucet::ClaimOrchestrator& orchestrator) {
    return [&orchestrator](const HttpRequest& request) -> HttpResponse {
        auto& metrics = monitoring::Metrics::instance();
        metrics.inc_http_requests();
        metrics.inc_claims_received();

        auto body = std::string_view(request.body);
        auto address = json::get_string(body, "address");
        if (!address) {
            metrics.inc_claims_failed("bad_request");
            return HttpResponse::error(HttpStatus::BadRequest, "Request body must be {\"address\": \"kaspatest:...\"}");
        }

        faucet::ClaimRequest claim;
        claim.identity = request.remote_address;
        claim.destination_address = std::move(*address);

        auto started = std::chrono::steady_clock::now();
        auto receipt = orchestrator.claim(claim);
        auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started
        );
        metrics.observe_claim_latency(elapsed.count());
        metrics.set_reserved_outpoints(orchestrator.reserved_outpoints());

        if (!receipt) {
            const auto& error = receipt.error();
            metrics.inc_claims_failed(failure_reason(error.code));

            auto status = status_for(error.code);
            if (status == HttpStatus::InternalServerError) {
                log::error(COMPONENT, std::format("Выдача для {} не удалась: [{}] {}",
                                                  claim.identity, to_string(error.code), error.message));
            }
            return HttpResponse::error(status, client_message(error));
        }

        metrics.inc_claims_succeeded(receipt->amount);

        std::string response = std::format(
            "{{\"transactionId\":{},\"amountKas\":{},\"nextClaimSeconds\":{}}}",
            json::quote(receipt->transaction_id),
            json::quote(std::to_string(receipt->amount)),
            receipt->next_claim_seconds
        );
        return HttpResponse::json(response);
    };
}

} // namespace kasfaucet::http

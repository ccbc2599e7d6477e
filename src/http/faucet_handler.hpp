/**
 * @file faucet_handler.hpp
 * @brief HTTP обработчики API faucet: /status и /claim
 *
 * Ответы:
 * - GET /status → {"active", "faucetAddress", "balanceKas", "nextClaimSeconds"}
 * - POST /claim {"address"} → {"transactionId", "amountKas", "nextClaimSeconds"}
 *
 * balanceKas и amountKas несут целое число sompi строкой
 * ("100000000" = 1 KAS), как их отдавал исходный сервис.
 *
 * Коды ошибок /claim:
 * - 400: некорректное тело или адрес
 * - 429: лимит выдач для IP
 * - 500: ошибки средств, подписи, отправки, ноды (детали только в логе)
 * - 503: кошелёк занят
 */

#pragma once

#include "http_server.hpp"
#include "../faucet/orchestrator.hpp"

#include <string>
#include <string_view>

namespace kasfaucet::http {

/**
 * @brief HTTP статус для кода ошибки выдачи
 */
[[nodiscard]] HttpStatus status_for(ErrorCode code) noexcept;

/**
 * @brief Метка причины для метрик: "invalid_address", "rate_limited", ...
 */
[[nodiscard]] std::string_view failure_reason(ErrorCode code) noexcept;

/**
 * @brief Обработчик GET /status
 */
[[nodiscard]] HttpHandler create_status_handler(faucet::ClaimOrchestrator& orchestrator);

/**
 * @brief Обработчик POST /claim
 *
 * Идентичность клиента берётся из адреса TCP соединения.
 */
[[nodiscard]] HttpHandler create_claim_handler(faucet::ClaimOrchestrator& orchestrator);

} // namespace kasfaucet::http

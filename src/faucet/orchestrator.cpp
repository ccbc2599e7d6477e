/**
 * @file orchestrator.cpp
 * @brief Реализация оркестратора выдачи
 */

#include "orchestrator.hpp"
#include "../log/logger.hpp"

#include <format>
#include <utility>

namespace kasfaucet::faucet {

namespace {

constexpr std::string_view COMPONENT = "Orchestrator";

/**
 * @brief Могла ли нода принять транзакцию, несмотря на ошибку
 *
 * Точно не принята только при явном отказе ноды или если соединение
 * не было установлено. Таймаут, обрыв после отправки и неразобранный
 * ответ считаются возможным успехом.
 */
bool submission_may_have_landed(ErrorCode code) noexcept {
    return code != ErrorCode::RpcRejected && code != ErrorCode::RpcConnectionFailed;
}

} // anonymous namespace

ClaimOrchestrator::ClaimOrchestrator(
    std::shared_ptr<const FaucetWallet> wallet,
    NodeClient& node,
    Signer& signer,
    ClaimGuard& guard,
    ReservedOutpoints& reserved,
    ClaimPolicy policy
)
    : wallet_(std::move(wallet))
    , node_(node)
    , signer_(signer)
    , guard_(guard)
    , reserved_(reserved)
    , policy_(policy)
    , selector_(policy.fee_model)
    , assembler_(policy.dust_threshold) {}

void ClaimOrchestrator::set_state_observer(StateObserver observer) {
    std::lock_guard lock(observer_mutex_);
    observer_ = std::move(observer);
}

void ClaimOrchestrator::transition(const ClaimRequest& request, ClaimState state) {
    StateObserver observer;
    {
        std::lock_guard lock(observer_mutex_);
        observer = observer_;
    }

    if (log::Logger::instance().enabled(log::Level::Debug)) {
        log::debug(COMPONENT, std::format("{} → {}", request.identity, to_string(state)));
    }

    if (observer) {
        observer(request, state);
    }
}

Result<ClaimReceipt> ClaimOrchestrator::fail(const ClaimRequest& request, Error error) {
    transition(request, ClaimState::Failed);
    return std::unexpected(std::move(error));
}

// =============================================================================
// Выдача
// =============================================================================

Result<ClaimReceipt> ClaimOrchestrator::claim(const ClaimRequest& request) {
    transition(request, ClaimState::Received);

    auto destination = kaspa::parse_address(request.destination_address);
    if (!destination) {
        log::info(COMPONENT, std::format("Отклонён адрес от {}: {}",
                                         request.identity, destination.error().message));
        return fail(request, destination.error());
    }

    if (destination->prefix != wallet_->address().prefix) {
        log::info(COMPONENT, std::format("Адрес {} из другой сети (ожидается {})",
                                         request.destination_address, wallet_->address().prefix));
        return fail(request, Error{
            ErrorCode::InvalidAddress,
            std::format("Адрес должен начинаться с {}:", wallet_->address().prefix)
        });
    }
    transition(request, ClaimState::AddressValidated);

    if (!guard_.try_claim(request.identity)) {
        auto wait = guard_.seconds_until_next(request.identity);
        log::info(COMPONENT, std::format("Лимит для {}: следующая выдача через {} с",
                                         request.identity, wait));
        return fail(request, Error{
            ErrorCode::RateLimited,
            std::format("Следующая выдача возможна через {} с", wait)
        });
    }
    transition(request, ClaimState::GuardChecked);

    Amount amount = request.requested_amount != 0
                    ? request.requested_amount
                    : wallet_->amount_per_claim();

    std::unique_lock lock(wallet_mutex_, std::defer_lock);
    if (!lock.try_lock_for(policy_.wallet_lock_timeout)) {
        log::warn(COMPONENT, std::format("Кошелёк занят дольше {} с, выдача для {} отклонена",
                                         policy_.wallet_lock_timeout.count(), request.identity));
        return fail(request, Error{ErrorCode::WalletBusy});
    }
    transition(request, ClaimState::WalletLockAcquired);

    auto receipt = spend(request, *destination, amount);
    lock.unlock();

    if (!receipt) {
        return fail(request, receipt.error());
    }

    transition(request, ClaimState::Succeeded);
    return receipt;
}

Result<ClaimReceipt> ClaimOrchestrator::spend(
    const ClaimRequest& request,
    const kaspa::Address& destination,
    Amount amount
) {
    const auto& faucet_address = wallet_->address();

    auto reported = node_.get_utxos(faucet_address);
    if (!reported) {
        log::error(COMPONENT, std::format("Не удалось получить UTXO: {}", reported.error().message));
        return std::unexpected(Error{ErrorCode::NodeUnavailable, reported.error().message});
    }

    auto available = reserved_.reconcile(*reported);
    transition(request, ClaimState::UtxosFetched);

    auto selection = selector_.select(available, amount);
    if (!selection) {
        log::error(COMPONENT, std::format("Недостаточно средств для {} sompi: {} ({} UTXO, {} в резерве)",
                                          amount, selection.error().to_string(),
                                          available.size(), reported->size() - available.size()));
        return std::unexpected(Error{ErrorCode::InsufficientFunds, selection.error().to_string()});
    }
    transition(request, ClaimState::Selected);

    log::debug(COMPONENT, std::format("Выбрано {} входов на {} sompi, комиссия {}",
                                      selection->inputs.size(), selection->total_in, selection->fee));

    auto pending = assembler_.assemble(*selection, amount, destination, faucet_address);
    if (!pending) {
        log::error(COMPONENT, std::format("Ошибка сборки транзакции: {}", pending.error().message));
        return std::unexpected(pending.error());
    }
    transition(request, ClaimState::Assembled);

    auto signed_tx = signer_.sign(*pending, wallet_->secret_key());
    if (!signed_tx) {
        log::error(COMPONENT, std::format("Ошибка подписи: {}", signed_tx.error().message));
        return std::unexpected(Error{ErrorCode::SigningFailure, signed_tx.error().message});
    }
    transition(request, ClaimState::Signed);

    auto txid = node_.submit(*signed_tx);
    if (!txid) {
        if (submission_may_have_landed(txid.error().code)) {
            // Нода могла принять транзакцию: повторно эти выходы не тратим
            reserved_.reserve(signed_tx->spent_outpoints);
            log::error(COMPONENT, std::format("Исход отправки неизвестен, {} выходов в резерве: {}",
                                              signed_tx->spent_outpoints.size(), txid.error().message));
        } else {
            log::error(COMPONENT, std::format("Нода не приняла транзакцию: {}", txid.error().message));
        }
        return std::unexpected(Error{ErrorCode::SubmissionFailure, txid.error().message});
    }

    reserved_.reserve(signed_tx->spent_outpoints);
    transition(request, ClaimState::Submitted);

    log::info(COMPONENT, std::format("Выдано {} sompi на {} (tx {}, входов {}, комиссия {}, сдача {})",
                                     amount, request.destination_address, *txid,
                                     signed_tx->spent_outpoints.size(),
                                     signed_tx->fee, signed_tx->change));

    ClaimReceipt receipt;
    receipt.transaction_id = std::move(*txid);
    receipt.destination = request.destination_address;
    receipt.amount = amount;
    receipt.fee = signed_tx->fee;
    receipt.change = signed_tx->change;
    receipt.spent_outpoints = std::move(signed_tx->spent_outpoints);
    receipt.next_claim_seconds = static_cast<uint64_t>(guard_.cooldown().count());
    return receipt;
}

// =============================================================================
// Статус
// =============================================================================

Result<FaucetStatus> ClaimOrchestrator::status() {
    auto balance = node_.get_balance(wallet_->address());
    if (!balance) {
        log::error(COMPONENT, std::format("Не удалось получить баланс: {}", balance.error().message));
        return std::unexpected(Error{ErrorCode::NodeUnavailable, balance.error().message});
    }

    FaucetStatus status;
    status.active = true;
    status.faucet_address = wallet_->address_string();
    status.balance = *balance;
    status.next_claim_seconds = static_cast<uint64_t>(wallet_->claim_interval().count());
    return status;
}

} // namespace kasfaucet::faucet

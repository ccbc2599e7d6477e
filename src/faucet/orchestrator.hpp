/**
 * @file orchestrator.hpp
 * @brief Оркестратор выдачи средств
 *
 * Конечный автомат одной выдачи:
 *
 *   Received → AddressValidated → GuardChecked → WalletLockAcquired →
 *   UtxosFetched → Selected → Assembled → Signed → Submitted → Succeeded
 *
 * Любой шаг может перейти в Failed. Блокировка кошелька берётся до
 * запроса UTXO и держится до завершения отправки, поэтому две выдачи
 * никогда не выбирают одни и те же выходы. Повторов нет.
 */

#pragma once

#include "../core/types.hpp"
#include "../kaspa/transaction.hpp"
#include "fee_model.hpp"
#include "node_client.hpp"
#include "rate_limiter.hpp"
#include "reserved_outpoints.hpp"
#include "signer.hpp"
#include "tx_assembler.hpp"
#include "utxo_selector.hpp"
#include "wallet.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace kasfaucet::faucet {

// =============================================================================
// Состояния
// =============================================================================

enum class ClaimState {
    Received,
    AddressValidated,
    GuardChecked,
    WalletLockAcquired,
    UtxosFetched,
    Selected,
    Assembled,
    Signed,
    Submitted,
    Succeeded,
    Failed,
};

[[nodiscard]] constexpr std::string_view to_string(ClaimState state) noexcept {
    switch (state) {
        case ClaimState::Received: return "Received";
        case ClaimState::AddressValidated: return "AddressValidated";
        case ClaimState::GuardChecked: return "GuardChecked";
        case ClaimState::WalletLockAcquired: return "WalletLockAcquired";
        case ClaimState::UtxosFetched: return "UtxosFetched";
        case ClaimState::Selected: return "Selected";
        case ClaimState::Assembled: return "Assembled";
        case ClaimState::Signed: return "Signed";
        case ClaimState::Submitted: return "Submitted";
        case ClaimState::Succeeded: return "Succeeded";
        case ClaimState::Failed: return "Failed";
        default: return "Unknown";
    }
}

// =============================================================================
// Запрос и результат
// =============================================================================

struct ClaimRequest {
    /// @brief Идентичность клиента (IP адрес)
    std::string identity;

    /// @brief Адрес получателя
    std::string destination_address;

    /// @brief Сумма; 0 означает сумму по умолчанию из кошелька
    Amount requested_amount{0};
};

struct ClaimReceipt {
    std::string transaction_id;
    std::string destination;
    Amount amount{0};
    Amount fee{0};
    Amount change{0};
    std::vector<kaspa::Outpoint> spent_outpoints;
    uint64_t next_claim_seconds{0};
};

struct FaucetStatus {
    bool active{true};
    std::string faucet_address;
    Amount balance{0};
    uint64_t next_claim_seconds{0};
};

/**
 * @brief Параметры политики выдачи
 */
struct ClaimPolicy {
    FeeModel fee_model{};
    Amount dust_threshold{constants::DEFAULT_DUST_THRESHOLD};
    std::chrono::seconds wallet_lock_timeout{constants::DEFAULT_WALLET_LOCK_TIMEOUT};
};

/**
 * @brief Наблюдатель переходов (тесты, отладочный лог)
 *
 * Вызывается синхронно в потоке выдачи.
 */
using StateObserver = std::function<void(const ClaimRequest&, ClaimState)>;

// =============================================================================
// Оркестратор
// =============================================================================

class ClaimOrchestrator {
public:
    /**
     * @brief Создать оркестратор
     *
     * Нода, подписант, шлюз и резервации передаются по ссылке и должны
     * жить дольше оркестратора.
     */
    ClaimOrchestrator(
        std::shared_ptr<const FaucetWallet> wallet,
        NodeClient& node,
        Signer& signer,
        ClaimGuard& guard,
        ReservedOutpoints& reserved,
        ClaimPolicy policy = {}
    );

    ClaimOrchestrator(const ClaimOrchestrator&) = delete;
    ClaimOrchestrator& operator=(const ClaimOrchestrator&) = delete;

    /**
     * @brief Выполнить выдачу
     *
     * @return ClaimReceipt или ошибка: InvalidAddress, RateLimited,
     *         WalletBusy, NodeUnavailable, InsufficientFunds,
     *         SigningFailure, SubmissionFailure
     */
    [[nodiscard]] Result<ClaimReceipt> claim(const ClaimRequest& request);

    /**
     * @brief Состояние faucet: адрес, баланс, интервал
     */
    [[nodiscard]] Result<FaucetStatus> status();

    void set_state_observer(StateObserver observer);

    [[nodiscard]] const FaucetWallet& wallet() const noexcept { return *wallet_; }

    [[nodiscard]] std::size_t reserved_outpoints() const { return reserved_.size(); }

private:
    void transition(const ClaimRequest& request, ClaimState state);

    Result<ClaimReceipt> fail(const ClaimRequest& request, Error error);

    /**
     * @brief Путь трат под блокировкой кошелька
     */
    Result<ClaimReceipt> spend(
        const ClaimRequest& request,
        const kaspa::Address& destination,
        Amount amount
    );

    std::shared_ptr<const FaucetWallet> wallet_;
    NodeClient& node_;
    Signer& signer_;
    ClaimGuard& guard_;
    ReservedOutpoints& reserved_;

    ClaimPolicy policy_;
    UtxoSelector selector_;
    TxAssembler assembler_;

    std::timed_mutex wallet_mutex_;

    std::mutex observer_mutex_;
    StateObserver observer_;
};

} // namespace kasfaucet::faucet

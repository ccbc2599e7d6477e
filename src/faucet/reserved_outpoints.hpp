/**
 * @file reserved_outpoints.hpp
 * @brief Outpoint'ы, потраченные собственными неподтверждёнными транзакциями
 *
 * После успешной отправки нода может ещё какое-то время возвращать
 * потраченные выходы в getUtxosByAddresses. Резервация исключает
 * их из выбора до тех пор, пока нода не перестанет их сообщать
 * или не истечёт TTL.
 */

#pragma once

#include "../kaspa/transaction.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <span>
#include <unordered_map>
#include <vector>

namespace kasfaucet::faucet {

class ReservedOutpoints {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    /**
     * @brief Создать набор
     *
     * @param ttl Время жизни резервации
     * @param clock Источник времени (по умолчанию steady_clock::now)
     */
    explicit ReservedOutpoints(std::chrono::seconds ttl, Clock clock = {});

    /**
     * @brief Зарезервировать outpoint'ы отправленной транзакции
     */
    void reserve(std::span<const kaspa::Outpoint> outpoints);

    /**
     * @brief Согласовать с набором UTXO от ноды
     *
     * 1. Удаляет резервации с истёкшим TTL
     * 2. Освобождает резервации, которых нода больше не сообщает
     * 3. Возвращает UTXO без зарезервированных, порядок сохраняется
     */
    [[nodiscard]] std::vector<kaspa::UtxoEntry> reconcile(
        const std::vector<kaspa::UtxoEntry>& reported
    );

    [[nodiscard]] bool contains(const kaspa::Outpoint& outpoint) const;

    [[nodiscard]] std::size_t size() const;

private:
    std::chrono::steady_clock::time_point now() const;

    std::chrono::seconds ttl_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<kaspa::Outpoint, std::chrono::steady_clock::time_point,
                       kaspa::OutpointHash> expiry_;
};

} // namespace kasfaucet::faucet

/**
 * @file reserved_outpoints.cpp
 * @brief Реализация резервации outpoint'ов
 */

#include "reserved_outpoints.hpp"

#include <unordered_set>
#include <utility>

namespace kasfaucet::faucet {

ReservedOutpoints::ReservedOutpoints(std::chrono::seconds ttl, Clock clock)
    : ttl_(ttl)
    , clock_(std::move(clock)) {}

std::chrono::steady_clock::time_point ReservedOutpoints::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

void ReservedOutpoints::reserve(std::span<const kaspa::Outpoint> outpoints) {
    auto expires_at = now() + ttl_;
    std::lock_guard lock(mutex_);
    for (const auto& outpoint : outpoints) {
        expiry_[outpoint] = expires_at;
    }
}

std::vector<kaspa::UtxoEntry> ReservedOutpoints::reconcile(
    const std::vector<kaspa::UtxoEntry>& reported
) {
    auto current = now();

    std::unordered_set<kaspa::Outpoint, kaspa::OutpointHash> still_reported;
    still_reported.reserve(reported.size());
    for (const auto& utxo : reported) {
        still_reported.insert(utxo.outpoint);
    }

    std::lock_guard lock(mutex_);

    for (auto it = expiry_.begin(); it != expiry_.end();) {
        if (it->second <= current || !still_reported.contains(it->first)) {
            it = expiry_.erase(it);
        } else {
            ++it;
        }
    }

    std::vector<kaspa::UtxoEntry> available;
    available.reserve(reported.size());
    for (const auto& utxo : reported) {
        if (!expiry_.contains(utxo.outpoint)) {
            available.push_back(utxo);
        }
    }
    return available;
}

bool ReservedOutpoints::contains(const kaspa::Outpoint& outpoint) const {
    std::lock_guard lock(mutex_);
    return expiry_.contains(outpoint);
}

std::size_t ReservedOutpoints::size() const {
    std::lock_guard lock(mutex_);
    return expiry_.size();
}

} // namespace kasfaucet::faucet

/**
 * @file rate_limiter.cpp
 * @brief Реализация ClaimGuard
 */

#include "rate_limiter.hpp"

#include <utility>

namespace kasfaucet::faucet {

ClaimGuard::ClaimGuard(std::chrono::seconds cooldown, Clock clock)
    : cooldown_(cooldown)
    , clock_(std::move(clock)) {}

std::chrono::steady_clock::time_point ClaimGuard::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

bool ClaimGuard::try_claim(std::string_view identity) {
    std::lock_guard lock(mutex_);
    auto current = now();

    auto it = last_claim_.find(std::string(identity));
    if (it != last_claim_.end()) {
        if (current - it->second < cooldown_) {
            return false;
        }
        it->second = current;
        return true;
    }

    last_claim_.emplace(std::string(identity), current);
    return true;
}

uint64_t ClaimGuard::seconds_until_next(std::string_view identity) const {
    std::lock_guard lock(mutex_);

    auto it = last_claim_.find(std::string(identity));
    if (it == last_claim_.end()) {
        return 0;
    }

    auto elapsed = now() - it->second;
    if (elapsed >= cooldown_) {
        return 0;
    }

    // Округление вверх: клиенту нельзя сообщать время раньше фактического
    auto remaining = cooldown_ - elapsed;
    auto secs = std::chrono::ceil<std::chrono::seconds>(remaining);
    return static_cast<uint64_t>(secs.count());
}

std::size_t ClaimGuard::size() const {
    std::lock_guard lock(mutex_);
    return last_claim_.size();
}

} // namespace kasfaucet::faucet

/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "hashduel/ledger/challenge_arbiter.hpp"
#include "hashduel/crypto/verifier.hpp"

#include <fmt/format.h>
#include <memory>
#include <random>
#include <stdexcept>

namespace hashduel {
namespace ledger {

DifficultySource random_difficulty_source() {
    auto rng = std::make_shared<std::mt19937>(std::random_device{}());
    return [rng]() {
        std::uniform_int_distribution<int> dist(crypto::kMinChallenge, crypto::kMaxChallenge);
        return dist(*rng);
    };
}

ChallengeArbiter::ChallengeArbiter(TransactionTable& table, logging::Logger& log,
                                   DifficultySource next_difficulty)
    : table_(table), log_(log), next_difficulty_(std::move(next_difficulty)) {
    if (!next_difficulty_) {
        next_difficulty_ = random_difficulty_source();
    }
}

TransactionId ChallengeArbiter::current_id() const {
    return table_.current_id();
}

std::optional<int> ChallengeArbiter::get_challenge(TransactionId id) const {
    auto tx = table_.get(id);
    if (!tx) return std::nullopt;
    return tx->challenge;
}

TransactionStatus ChallengeArbiter::get_status(TransactionId id) const {
    auto tx = table_.get(id);
    if (!tx) return TransactionStatus::InvalidTransaction;
    return tx->resolved() ? TransactionStatus::Resolved : TransactionStatus::Pending;
}

WinnerQuery ChallengeArbiter::get_winner(TransactionId id) const {
    auto tx = table_.get(id);
    if (!tx) return {};
    if (!tx->resolved()) return {WinnerState::NoWinnerYet, 0};
    return {WinnerState::Won, *tx->winner};
}

std::optional<TransactionDetails> ChallengeArbiter::get_details(TransactionId id) const {
    auto tx = table_.get(id);
    if (!tx) return std::nullopt;
    TransactionDetails details;
    details.challenge = tx->challenge;
    if (tx->resolved()) {
        details.status = TransactionStatus::Resolved;
        details.solution = tx->solution.value_or(std::string{});
    } else {
        details.status = TransactionStatus::Pending;
    }
    return details;
}

SubmitResult ChallengeArbiter::submit(TransactionId id, ClientId client_id, std::string_view candidate) {
    SubmitResult result = SubmitResult::Rejected;
    std::optional<Transaction> next;
    {
        auto lock = table_.lock();
        const Transaction* tx = lock.find(id);
        if (tx == nullptr) {
            return SubmitResult::InvalidTransaction;
        }
        if (tx->resolved()) {
            result = SubmitResult::AlreadySolved;
        } else if (crypto::verify(tx->challenge, candidate)) {
            const int difficulty = next_difficulty_();
            if (!crypto::is_valid_challenge(difficulty)) {
                throw std::invalid_argument(fmt::format("difficulty source produced {}", difficulty));
            }
            if (!lock.resolve(id, std::string(candidate), client_id)) {
                return SubmitResult::AlreadySolved;
            }
            next = lock.create_next(difficulty);
            result = SubmitResult::Accepted;
        }
    }

    // Logged after the table lock is released.
    switch (result) {
    case SubmitResult::Accepted:
        log_.info(fmt::format("Solution ACCEPTED for tx {} from client {}", id, client_id));
        log_.info(fmt::format("New challenge for tx {} (challenge: {})", next->id, next->challenge));
        break;
    case SubmitResult::Rejected:
        log_.info(fmt::format("Solution REJECTED for tx {} from client {}", id, client_id));
        break;
    default:
        log_.debug(fmt::format("Late submission for tx {} from client {}", id, client_id));
        break;
    }
    return result;
}

const char* to_string(SubmitResult r) {
    switch (r) {
    case SubmitResult::InvalidTransaction: return "invalid transaction";
    case SubmitResult::Rejected: return "rejected";
    case SubmitResult::Accepted: return "accepted";
    case SubmitResult::AlreadySolved: return "already solved";
    }
    return "unknown";
}

const char* to_string(TransactionStatus s) {
    switch (s) {
    case TransactionStatus::InvalidTransaction: return "invalid transaction";
    case TransactionStatus::Resolved: return "resolved";
    case TransactionStatus::Pending: return "pending";
    }
    return "unknown";
}

} // namespace ledger
} // namespace hashduel

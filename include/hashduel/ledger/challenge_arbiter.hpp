/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <hashduel/ledger/transaction_table.hpp>
#include <hashduel/logging/logger.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace hashduel {
namespace ledger {

// Enumerator values are the wire codes of the corresponding operations.
enum class SubmitResult : int {
    InvalidTransaction = -1,
    Rejected = 0,
    Accepted = 1,
    AlreadySolved = 2,
};

enum class TransactionStatus : int {
    InvalidTransaction = -1,
    Resolved = 0,
    Pending = 1,
};

enum class WinnerState {
    InvalidTransaction,
    NoWinnerYet,
    Won,
};

struct WinnerQuery {
    WinnerState state{WinnerState::InvalidTransaction};
    ClientId client_id{0}; // meaningful only when state == Won
};

struct TransactionDetails {
    TransactionStatus status{TransactionStatus::Pending};
    int challenge{0};
    std::string solution; // empty while pending
};

// Draws the difficulty of each new round. Always invoked under the table lock.
using DifficultySource = std::function<int()>;

// Uniform draw in [1, 20] from a privately seeded std::mt19937
DifficultySource random_difficulty_source();

/**
 * Sole mutator of a TransactionTable. Every operation is one atomic step
 * under the table lock; business outcomes are return values, not errors.
 */
class ChallengeArbiter {
public:
    ChallengeArbiter(TransactionTable& table, logging::Logger& log,
                     DifficultySource next_difficulty = random_difficulty_source());

    TransactionId current_id() const;
    std::optional<int> get_challenge(TransactionId id) const;
    TransactionStatus get_status(TransactionId id) const;
    WinnerQuery get_winner(TransactionId id) const;
    std::optional<TransactionDetails> get_details(TransactionId id) const;

    /**
     * Verify a candidate for a pending round. On acceptance the round is resolved
     * and its successor created within the same lock acquisition.
     * @throws std::invalid_argument if the difficulty source yields a value outside [1, 20]
     *         (checked before the round is resolved)
     */
    SubmitResult submit(TransactionId id, ClientId client_id, std::string_view candidate);

private:
    TransactionTable& table_;
    logging::Logger& log_;
    DifficultySource next_difficulty_;
};

const char* to_string(SubmitResult r);
const char* to_string(TransactionStatus s);

} // namespace ledger
} // namespace hashduel

/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <hashduel/ledger/transaction.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace hashduel {
namespace ledger {

/**
 * Append-only table of rounds guarded by a single table-wide mutex.
 *
 * Single-step reads take the lock internally. Multi-step critical sections
 * (verify + resolve + create next round) go through a scoped Lock, which
 * is the only way to mutate the table after construction.
 */
class TransactionTable {
public:
    /**
     * Create the table with round 0 pending at the given difficulty
     * @throws std::invalid_argument if the challenge is outside [1, 20]
     */
    explicit TransactionTable(int initial_challenge);

    TransactionTable(const TransactionTable&) = delete;
    TransactionTable& operator=(const TransactionTable&) = delete;

    class Lock {
    public:
        explicit Lock(TransactionTable& table);

        TransactionId current_id() const { return table_.current_id_; }

        // Pointer into the table, valid while this lock is held. nullptr if the id is unknown.
        const Transaction* find(TransactionId id) const;

        // Set solution and winner of a pending round in one step.
        // Returns false if the round does not exist or is already resolved.
        bool resolve(TransactionId id, std::string solution, ClientId winner);

        /**
         * Append a pending round with id current_id()+1 and make it current
         * @throws std::invalid_argument if the challenge is outside [1, 20]
         */
        const Transaction& create_next(int challenge);

    private:
        TransactionTable& table_;
        std::unique_lock<std::mutex> guard_;
    };

    Lock lock() { return Lock(*this); }

    TransactionId current_id() const;
    std::optional<Transaction> get(TransactionId id) const;
    std::size_t size() const;

private:
    const Transaction& append_locked_(int challenge);

    mutable std::mutex mutex_;
    std::unordered_map<TransactionId, Transaction> rounds_;
    TransactionId current_id_{-1};
};

} // namespace ledger
} // namespace hashduel

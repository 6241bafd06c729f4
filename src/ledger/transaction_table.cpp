/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "hashduel/ledger/transaction_table.hpp"
#include "hashduel/crypto/verifier.hpp"

#include <fmt/format.h>
#include <stdexcept>

namespace hashduel {
namespace ledger {

static void require_valid_challenge(int challenge) {
    if (!crypto::is_valid_challenge(challenge)) {
        throw std::invalid_argument(fmt::format(
            "challenge {} outside [{}, {}]", challenge, crypto::kMinChallenge, crypto::kMaxChallenge));
    }
}

TransactionTable::TransactionTable(int initial_challenge) {
    require_valid_challenge(initial_challenge);
    append_locked_(initial_challenge);
}

const Transaction& TransactionTable::append_locked_(int challenge) {
    Transaction tx;
    tx.id = current_id_ + 1;
    tx.challenge = challenge;
    auto [it, inserted] = rounds_.emplace(tx.id, std::move(tx));
    (void)inserted;
    current_id_ = it->first;
    return it->second;
}

TransactionId TransactionTable::current_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_id_;
}

std::optional<Transaction> TransactionTable::get(TransactionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rounds_.find(id);
    if (it == rounds_.end()) return std::nullopt;
    return it->second;
}

std::size_t TransactionTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rounds_.size();
}

TransactionTable::Lock::Lock(TransactionTable& table)
    : table_(table), guard_(table.mutex_) {}

const Transaction* TransactionTable::Lock::find(TransactionId id) const {
    auto it = table_.rounds_.find(id);
    return it == table_.rounds_.end() ? nullptr : &it->second;
}

bool TransactionTable::Lock::resolve(TransactionId id, std::string solution, ClientId winner) {
    auto it = table_.rounds_.find(id);
    if (it == table_.rounds_.end() || it->second.resolved()) return false;
    it->second.solution = std::move(solution);
    it->second.winner = winner;
    return true;
}

const Transaction& TransactionTable::Lock::create_next(int challenge) {
    require_valid_challenge(challenge);
    return table_.append_locked_(challenge);
}

} // namespace ledger
} // namespace hashduel

/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <hashduel/ledger/challenge_arbiter.hpp>
#include <hashduel/net/channel.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace hashduel::protocol {

// GetDetails reply in wire form: status -1 / 0 / 1, challenge -1 when the id is invalid
struct DetailsReply {
    int status{-1};
    int challenge{-1};
    std::string solution;
};

/**
 * Typed calls to the authority over a Channel.
 *
 * Sentinel replies (-1 invalid id, 0 no winner yet, ...) are returned as values.
 * Transport failures, RPC error objects and malformed replies throw net::TransportError.
 */
class AuthorityClient {
public:
    explicit AuthorityClient(net::Channel& channel);

    ledger::TransactionId get_current_transaction_id();
    int get_challenge(ledger::TransactionId id);
    ledger::TransactionStatus get_status(ledger::TransactionId id);
    ledger::SubmitResult submit_solution(ledger::TransactionId id, ledger::ClientId client_id,
                                         const std::string& solution);
    std::int64_t get_winner(ledger::TransactionId id);
    DetailsReply get_details(ledger::TransactionId id);

private:
    nlohmann::json call_(std::string_view method, nlohmann::json params);

    net::Channel& channel_;
    std::uint64_t next_id_{1};
};

} // namespace hashduel::protocol

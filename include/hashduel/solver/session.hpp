/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <hashduel/config/types.hpp>
#include <hashduel/logging/logger.hpp>
#include <hashduel/mining/search_coordinator.hpp>
#include <hashduel/protocol/authority_client.hpp>

#include <iosfwd>
#include <optional>
#include <string>

namespace hashduel::solver {

/**
 * Solver-side flows: one-shot queries, the mine sequence and the interactive menu.
 * Results are reported through the logger; transport failures propagate as
 * net::TransportError except inside run_menu, which handles them.
 */
class SolverSession {
public:
    SolverSession(logging::Logger& log, protocol::AuthorityClient& client,
                  mining::SearchCoordinator& search, config::SolverConfig cfg);

    ledger::TransactionId show_current();
    int show_challenge(ledger::TransactionId id);
    ledger::TransactionStatus show_status(ledger::TransactionId id);
    std::int64_t show_winner(ledger::TransactionId id);
    protocol::DetailsReply show_details(ledger::TransactionId id);

    // Fetch the current round and its challenge, search locally, submit.
    // Empty when the round turned invalid before the search started.
    std::optional<ledger::SubmitResult> mine();

    // Run a named command (see --command). Returns the process exit code.
    int run_command(const std::string& command, std::optional<ledger::TransactionId> tx);

    // Interactive menu until '0' or end of input. Returns the process exit code.
    int run_menu(std::istream& in, std::ostream& out);

private:
    std::optional<ledger::TransactionId> read_tx_id_(std::istream& in, std::ostream& out);

    logging::Logger& log_;
    protocol::AuthorityClient& client_;
    mining::SearchCoordinator& search_;
    config::SolverConfig cfg_;
};

} // namespace hashduel::solver

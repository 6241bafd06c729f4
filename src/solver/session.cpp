/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <hashduel/solver/session.hpp>

#include <charconv>
#include <fmt/format.h>
#include <istream>
#include <ostream>

namespace hashduel::solver {

SolverSession::SolverSession(logging::Logger& log, protocol::AuthorityClient& client,
                             mining::SearchCoordinator& search, config::SolverConfig cfg)
    : log_(log), client_(client), search_(search), cfg_(std::move(cfg)) {}

ledger::TransactionId SolverSession::show_current() {
    const auto id = client_.get_current_transaction_id();
    log_.info(fmt::format("Current (pending) transaction: {}", id));
    return id;
}

int SolverSession::show_challenge(ledger::TransactionId id) {
    const int challenge = client_.get_challenge(id);
    if (challenge == -1) log_.info(fmt::format("Transaction {} is invalid", id));
    else log_.info(fmt::format("Challenge for tx {}: {} zeros", id, challenge));
    return challenge;
}

ledger::TransactionStatus SolverSession::show_status(ledger::TransactionId id) {
    const auto status = client_.get_status(id);
    if (status == ledger::TransactionStatus::InvalidTransaction) {
        log_.info(fmt::format("Transaction {} is invalid", id));
    } else {
        log_.info(fmt::format("Status of tx {}: {} ({})", id, static_cast<int>(status), ledger::to_string(status)));
    }
    return status;
}

std::int64_t SolverSession::show_winner(ledger::TransactionId id) {
    const auto winner = client_.get_winner(id);
    if (winner == -1) log_.info(fmt::format("Transaction {} is invalid", id));
    else if (winner == 0) log_.info(fmt::format("Tx {} has no winner yet", id));
    else log_.info(fmt::format("Winner of tx {}: client {}", id, winner));
    return winner;
}

protocol::DetailsReply SolverSession::show_details(ledger::TransactionId id) {
    auto d = client_.get_details(id);
    if (d.status == -1) {
        log_.info(fmt::format("Transaction {} is invalid", id));
        return d;
    }
    log_.info(fmt::format("Tx {}: status={} challenge={} solution={}", id,
                          d.status == 1 ? "pending" : "resolved", d.challenge,
                          d.solution.empty() ? "(n/a)" : d.solution));
    return d;
}

std::optional<ledger::SubmitResult> SolverSession::mine() {
    log_.info("Step 1: fetching current transaction id");
    const auto tx_id = client_.get_current_transaction_id();
    log_.info(fmt::format("  -> tx {}", tx_id));

    log_.info(fmt::format("Step 2: fetching challenge for tx {}", tx_id));
    const int challenge = client_.get_challenge(tx_id);
    if (challenge == -1) {
        log_.warn("  -> transaction became invalid before the search");
        return std::nullopt;
    }
    log_.info(fmt::format("  -> challenge {}", challenge));

    log_.info(fmt::format("Step 3: local search with {} workers", cfg_.workers));
    const auto found = search_.search(challenge, cfg_.workers);

    log_.info(fmt::format("Step 4: solution found locally: {}", found.nonce));

    log_.info(fmt::format("Step 5: submitting as client {}", cfg_.client_id));
    const auto result = client_.submit_solution(tx_id, cfg_.client_id, found.nonce);

    switch (result) {
    case ledger::SubmitResult::Accepted:
        log_.info("Step 6: (1) accepted, this client won the round");
        break;
    case ledger::SubmitResult::Rejected:
        log_.info("Step 6: (0) rejected, invalid solution");
        break;
    case ledger::SubmitResult::AlreadySolved:
        log_.info("Step 6: (2) too late, another client solved it first");
        break;
    case ledger::SubmitResult::InvalidTransaction:
        log_.info("Step 6: (-1) transaction id became invalid");
        break;
    }
    return result;
}

int SolverSession::run_command(const std::string& command, std::optional<ledger::TransactionId> tx) {
    if (command == "current") {
        show_current();
        return 0;
    }
    if (command == "mine") {
        return mine().has_value() ? 0 : 1;
    }
    if (command != "challenge" && command != "status" && command != "winner" && command != "details") {
        log_.error(fmt::format("Unknown command '{}'", command));
        return 1;
    }
    if (!tx) {
        log_.error(fmt::format("'{}' requires --tx", command));
        return 1;
    }
    if (command == "challenge") show_challenge(*tx);
    else if (command == "status") show_status(*tx);
    else if (command == "winner") show_winner(*tx);
    else show_details(*tx);
    return 0;
}

std::optional<ledger::TransactionId> SolverSession::read_tx_id_(std::istream& in, std::ostream& out) {
    out << "Transaction id: " << std::flush;
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    ledger::TransactionId id = 0;
    auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), id);
    if (ec != std::errc{} || ptr != line.data() + line.size()) {
        log_.warn("Invalid input, please type a number");
        return std::nullopt;
    }
    return id;
}

int SolverSession::run_menu(std::istream& in, std::ostream& out) {
    for (;;) {
        out << fmt::format("\n==============================\n"
                           "Solver client (id {})\n"
                           "==============================\n"
                           "1. Current transaction id\n"
                           "2. Challenge of a transaction\n"
                           "3. Status of a transaction\n"
                           "4. Winner of a transaction\n"
                           "5. Details of a transaction\n"
                           "6. Mine the current challenge\n"
                           "0. Exit\n"
                           "------------------------------\n"
                           "Choice: ", cfg_.client_id)
            << std::flush;

        std::string choice;
        if (!std::getline(in, choice) || choice == "0") {
            log_.info("Exiting");
            return 0;
        }

        try {
            if (choice == "1") {
                show_current();
            } else if (choice == "6") {
                mine();
            } else if (choice == "2" || choice == "3" || choice == "4" || choice == "5") {
                auto id = read_tx_id_(in, out);
                if (!id) continue;
                if (choice == "2") show_challenge(*id);
                else if (choice == "3") show_status(*id);
                else if (choice == "4") show_winner(*id);
                else show_details(*id);
            } else {
                log_.warn("Invalid option");
            }
        } catch (const net::TransportError& e) {
            log_.error(fmt::format("Communication error: {}", e.what()));
            log_.info("The authority may be down, probing once...");
            try {
                client_.get_current_transaction_id();
                log_.info("Reconnected");
            } catch (const net::TransportError& probe) {
                log_.error(fmt::format("Reconnect failed ({}), exiting", probe.what()));
                return 1;
            }
        }
    }
}

} // namespace hashduel::solver

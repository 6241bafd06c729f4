/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <hashduel/protocol/authority_client.hpp>
#include <hashduel/protocol/messages.hpp>

#include <fmt/format.h>

using nlohmann::json;

namespace hashduel::protocol {

namespace {

template <typename T>
T field(const json& result, const char* key, std::string_view method_name) {
    if (!result.is_object() || !result.contains(key)) {
        throw net::TransportError(fmt::format("{}: reply lacks '{}'", method_name, key));
    }
    try {
        return result.at(key).get<T>();
    } catch (const json::exception& e) {
        throw net::TransportError(fmt::format("{}: bad '{}': {}", method_name, key, e.what()));
    }
}

} // namespace

AuthorityClient::AuthorityClient(net::Channel& channel) : channel_(channel) {}

json AuthorityClient::call_(std::string_view method_name, json params) {
    const auto id = next_id_++;
    const auto reply = channel_.exchange(build_request(id, method_name, std::move(params)));

    auto parsed = parse_response(reply);
    if (!parsed) {
        throw net::TransportError(fmt::format("{}: malformed reply", method_name));
    }
    if (parsed->error) {
        throw net::TransportError(fmt::format("{}: rpc error {}: {}", method_name,
                                              parsed->error->code, parsed->error->message));
    }
    if (!parsed->id.is_number_unsigned() || parsed->id.get<std::uint64_t>() != id) {
        throw net::TransportError(fmt::format("{}: reply id mismatch", method_name));
    }
    return parsed->result;
}

ledger::TransactionId AuthorityClient::get_current_transaction_id() {
    auto r = call_(method::kGetCurrentTransactionId, json::object());
    return field<ledger::TransactionId>(r, "transaction_id", method::kGetCurrentTransactionId);
}

int AuthorityClient::get_challenge(ledger::TransactionId id) {
    auto r = call_(method::kGetChallenge, {{"transaction_id", id}});
    return field<int>(r, "challenge", method::kGetChallenge);
}

ledger::TransactionStatus AuthorityClient::get_status(ledger::TransactionId id) {
    auto r = call_(method::kGetStatus, {{"transaction_id", id}});
    const int status = field<int>(r, "status", method::kGetStatus);
    if (status < -1 || status > 1) {
        throw net::TransportError(fmt::format("{}: unexpected status {}", method::kGetStatus, status));
    }
    return static_cast<ledger::TransactionStatus>(status);
}

ledger::SubmitResult AuthorityClient::submit_solution(ledger::TransactionId id, ledger::ClientId client_id,
                                                      const std::string& solution) {
    auto r = call_(method::kSubmitSolution,
                   {{"transaction_id", id}, {"client_id", client_id}, {"solution", solution}});
    const int code = field<int>(r, "result", method::kSubmitSolution);
    if (code < -1 || code > 2) {
        throw net::TransportError(fmt::format("{}: unexpected result {}", method::kSubmitSolution, code));
    }
    return static_cast<ledger::SubmitResult>(code);
}

std::int64_t AuthorityClient::get_winner(ledger::TransactionId id) {
    auto r = call_(method::kGetWinner, {{"transaction_id", id}});
    return field<std::int64_t>(r, "winner_id", method::kGetWinner);
}

DetailsReply AuthorityClient::get_details(ledger::TransactionId id) {
    auto r = call_(method::kGetDetails, {{"transaction_id", id}});
    DetailsReply d;
    d.status = field<int>(r, "status", method::kGetDetails);
    d.challenge = field<int>(r, "challenge", method::kGetDetails);
    d.solution = field<std::string>(r, "solution", method::kGetDetails);
    return d;
}

} // namespace hashduel::protocol

/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <hashduel/protocol/miner_service.hpp>
#include <hashduel/protocol/messages.hpp>

#include <fmt/format.h>
#include <stdexcept>

using nlohmann::json;

namespace hashduel::protocol {

namespace {

struct RpcFailure : std::runtime_error {
    RpcFailure(RpcErrc c, const std::string& msg) : std::runtime_error(msg), code(c) {}
    RpcErrc code;
};

std::int64_t require_int(const json& params, const char* key) {
    if (!params.is_object() || !params.contains(key)) {
        throw RpcFailure(RpcErrc::InvalidParams, fmt::format("missing '{}'", key));
    }
    const auto& v = params.at(key);
    if (!v.is_number_integer()) {
        throw RpcFailure(RpcErrc::InvalidParams, fmt::format("'{}' must be an integer", key));
    }
    return v.get<std::int64_t>();
}

std::string require_string(const json& params, const char* key) {
    if (!params.is_object() || !params.contains(key)) {
        throw RpcFailure(RpcErrc::InvalidParams, fmt::format("missing '{}'", key));
    }
    const auto& v = params.at(key);
    if (!v.is_string()) {
        throw RpcFailure(RpcErrc::InvalidParams, fmt::format("'{}' must be a string", key));
    }
    return v.get<std::string>();
}

} // namespace

MinerService::MinerService(ledger::ChallengeArbiter& arbiter, logging::Logger& log)
    : arbiter_(arbiter), log_(log) {
    handlers_[method::kGetCurrentTransactionId] = [this](const json&) {
        return json{{"transaction_id", arbiter_.current_id()}};
    };
    handlers_[method::kGetChallenge] = [this](const json& p) {
        auto challenge = arbiter_.get_challenge(require_int(p, "transaction_id"));
        return json{{"challenge", challenge.value_or(-1)}};
    };
    handlers_[method::kGetStatus] = [this](const json& p) {
        auto status = arbiter_.get_status(require_int(p, "transaction_id"));
        return json{{"status", static_cast<int>(status)}};
    };
    handlers_[method::kSubmitSolution] = [this](const json& p) {
        const auto tx_id = require_int(p, "transaction_id");
        const auto client_id = require_int(p, "client_id");
        const auto solution = require_string(p, "solution");
        // 0 and -1 are GetWinner sentinels, so they cannot name a client.
        if (client_id <= 0) {
            throw RpcFailure(RpcErrc::InvalidParams, "'client_id' must be positive");
        }
        auto result = arbiter_.submit(tx_id, client_id, solution);
        return json{{"result", static_cast<int>(result)}};
    };
    handlers_[method::kGetWinner] = [this](const json& p) {
        auto q = arbiter_.get_winner(require_int(p, "transaction_id"));
        std::int64_t winner_id = -1;
        if (q.state == ledger::WinnerState::NoWinnerYet) winner_id = 0;
        else if (q.state == ledger::WinnerState::Won) winner_id = q.client_id;
        return json{{"winner_id", winner_id}};
    };
    handlers_[method::kGetDetails] = [this](const json& p) {
        auto details = arbiter_.get_details(require_int(p, "transaction_id"));
        if (!details) {
            return json{{"status", -1}, {"challenge", -1}, {"solution", ""}};
        }
        return json{{"status", static_cast<int>(details->status)},
                    {"challenge", details->challenge},
                    {"solution", details->solution}};
    };
}

json MinerService::dispatch(const std::string& method_name, const json& params) {
    auto it = handlers_.find(method_name);
    if (it == handlers_.end()) {
        throw RpcFailure(RpcErrc::MethodNotFound, fmt::format("unknown method '{}'", method_name));
    }
    return it->second(params);
}

std::string MinerService::handle_line(std::string_view line) {
    json req = json::parse(line.begin(), line.end(), nullptr, false);
    if (req.is_discarded()) {
        log_.warn("Discarding unparseable request");
        return build_error(nullptr, RpcErrc::ParseError, "parse error");
    }
    if (!req.is_object() || !req.contains("method") || !req.at("method").is_string()) {
        const json id = req.is_object() && req.contains("id") ? req.at("id") : json(nullptr);
        return build_error(id, RpcErrc::InvalidRequest, "request must carry a string 'method'");
    }

    const json id = req.contains("id") ? req.at("id") : json(nullptr);
    const auto method_name = req.at("method").get<std::string>();
    const json params = req.contains("params") ? req.at("params") : json::object();
    log_.debug(fmt::format("-> {} {}", method_name, params.dump()));

    try {
        return build_result(id, dispatch(method_name, params));
    } catch (const RpcFailure& e) {
        log_.warn(fmt::format("{} rejected: {}", method_name, e.what()));
        return build_error(id, e.code, e.what());
    } catch (const std::exception& e) {
        log_.error(fmt::format("{} failed: {}", method_name, e.what()));
        return build_error(id, RpcErrc::InternalError, e.what());
    }
}

} // namespace hashduel::protocol

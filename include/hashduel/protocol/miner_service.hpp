/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <hashduel/ledger/challenge_arbiter.hpp>
#include <hashduel/logging/logger.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace hashduel::protocol {

/**
 * Maps the authority's named operations onto a ChallengeArbiter.
 *
 * Business outcomes are encoded with the wire sentinels (-1 invalid id, ...).
 * Malformed requests get a JSON-RPC error object instead. Never throws.
 */
class MinerService {
public:
    MinerService(ledger::ChallengeArbiter& arbiter, logging::Logger& log);

    // One request line in, one response line out (both '\n' terminated).
    std::string handle_line(std::string_view line);

    // Dispatch an already parsed call. Throws on unknown method / bad params.
    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

    ledger::ChallengeArbiter& arbiter_;
    logging::Logger& log_;
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace hashduel::protocol

/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace hashduel::config {

struct AuthorityConfig {
    std::string host{"0.0.0.0"};
    std::uint16_t port{50051};
    unsigned threads{10};
    std::optional<int> initial_difficulty; // random in [1, 20] when unset
};

struct SolverConfig {
    std::string url{"localhost:50051"};
    std::int64_t client_id{0}; // 0 = pick a random id at startup
    unsigned workers{8};
    std::uint32_t timeout_ms{5000};
};

// Values given on the command line; unset fields keep file/env values.
struct AuthorityFlags {
    std::optional<std::string> host;
    std::optional<std::uint16_t> port;
    std::optional<unsigned> threads;
    std::optional<int> difficulty;
};

struct SolverFlags {
    std::optional<std::string> url;
    std::optional<std::int64_t> client_id;
    std::optional<unsigned> workers;
    std::optional<std::uint32_t> timeout_ms;
};

struct AuthorityParseResult {
    std::optional<AuthorityFlags> flags; // present when arguments parsed
    std::string config_path{"hashduel.conf"};
    bool show_only{false}; // true if --help/--version was printed
    bool debug{false};
};

struct SolverParseResult {
    std::optional<SolverFlags> flags;
    std::string config_path{"hashduel.conf"};
    bool show_only{false};
    bool debug{false};
    std::string command;               // empty = interactive menu
    std::optional<std::int64_t> tx_id; // --tx for one-shot queries
};

} // namespace hashduel::config

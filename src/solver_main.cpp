/*
 * hashduel solver bootstrap
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <chrono>
#include <exception>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <hashduel/cli/args.hpp>
#include <hashduel/config/loader.hpp>
#include <hashduel/config/validator.hpp>
#include <hashduel/logging/fmt_logger.hpp>
#include <hashduel/mining/search_coordinator.hpp>
#include <hashduel/net/tcp_channel.hpp>
#include <hashduel/protocol/authority_client.hpp>
#include <hashduel/solver/session.hpp>

using namespace hashduel;

static bool report(logging::Logger& log, const std::vector<std::string>& errs) {
    for (const auto& e : errs) log.error(e);
    return errs.empty();
}

int main(int argc, char** argv) {
    logging::FmtLogger log;
    auto parsed = cli::parse_solver(argc, argv, log);
    if (parsed.show_only) return 0;
    if (!parsed.flags) return 1;
    log.set_debug(parsed.debug);

    config::SolverConfig cfg;
    if (!report(log, config::load_from_file(cfg, parsed.config_path))) return 1;
    if (!report(log, config::apply_env_overrides(cfg))) return 1;
    config::apply_flags(cfg, *parsed.flags);
    if (!report(log, config::validate_final(cfg))) return 1;

    if (cfg.client_id == 0) {
        std::mt19937 rng(std::random_device{}());
        cfg.client_id = std::uniform_int_distribution<std::int64_t>(1000, 9999)(rng);
    }

    net::TcpChannelOptions channel_opts;
    config::split_host_port(cfg.url, channel_opts.host, channel_opts.port);
    channel_opts.timeout = std::chrono::milliseconds(cfg.timeout_ms);

    try {
        net::TcpChannel channel(log, channel_opts);
        protocol::AuthorityClient client(channel);
        mining::SearchCoordinator search(log);
        solver::SolverSession session(log, client, search, cfg);

        log.info(fmt::format("Connecting to authority at {} as client {}...", cfg.url, cfg.client_id));
        try {
            client.get_current_transaction_id();
        } catch (const net::TransportError& e) {
            log.error(fmt::format("Could not reach the authority at {}: {}", cfg.url, e.what()));
            return 1;
        }
        log.info("Connected");

        if (!parsed.command.empty()) {
            return session.run_command(parsed.command, parsed.tx_id);
        }
        return session.run_menu(std::cin, std::cout);
    } catch (const std::exception& e) {
        log.error(fmt::format("Fatal: {}", e.what()));
        return 1;
    }
}

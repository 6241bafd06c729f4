/*
 * hashduel authority bootstrap
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <exception>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <hashduel/cli/args.hpp>
#include <hashduel/config/loader.hpp>
#include <hashduel/ledger/challenge_arbiter.hpp>
#include <hashduel/ledger/transaction_table.hpp>
#include <hashduel/logging/fmt_logger.hpp>
#include <hashduel/net/authority_server.hpp>
#include <hashduel/protocol/miner_service.hpp>

using namespace hashduel;

static bool report(logging::Logger& log, const std::vector<std::string>& errs) {
    for (const auto& e : errs) log.error(e);
    return errs.empty();
}

int main(int argc, char** argv) {
    logging::FmtLogger log;
    auto parsed = cli::parse_authority(argc, argv, log);
    if (parsed.show_only) return 0;
    if (!parsed.flags) return 1;
    log.set_debug(parsed.debug);

    // Lowest to highest precedence: defaults, file, environment, command line
    config::AuthorityConfig cfg;
    if (!report(log, config::load_from_file(cfg, parsed.config_path))) return 1;
    if (!report(log, config::apply_env_overrides(cfg))) return 1;
    config::apply_flags(cfg, *parsed.flags);
    if (!report(log, config::validate_final(cfg))) return 1;

    try {
        auto draw = ledger::random_difficulty_source();
        ledger::TransactionTable table(cfg.initial_difficulty.value_or(draw()));
        log.info(fmt::format("New challenge for tx 0 (challenge: {})", table.get(0)->challenge));

        ledger::ChallengeArbiter arbiter(table, log, draw);
        protocol::MinerService service(arbiter, log);

        net::ServerOptions opts;
        opts.host = cfg.host;
        opts.port = cfg.port;
        opts.threads = cfg.threads;
        opts.handle_signals = true;

        net::AuthorityServer server(log, service, opts);
        server.start();
        server.wait();
        log.info("Authority stopped");
    } catch (const std::exception& e) {
        log.error(fmt::format("Fatal: {}", e.what()));
        return 1;
    }
    return 0;
}

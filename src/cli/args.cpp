/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <hashduel/cli/args.hpp>

#include <string>

#include <cxxopts.hpp>
#include <fmt/core.h>

#ifndef HASHDUEL_VERSION
#define HASHDUEL_VERSION "0.0.0"
#endif

namespace hashduel::cli {

hashduel::config::AuthorityParseResult parse_authority(int argc, char** argv, hashduel::logging::Logger& log) {
    hashduel::config::AuthorityParseResult pr;
    cxxopts::Options options("hashduel-authority", "Challenge authority: issues rounds and arbitrates solutions");
    options.add_options()
        ("host",       "Listen address", cxxopts::value<std::string>())
        ("port",       "Listen port", cxxopts::value<std::uint16_t>())
        ("threads",    "Request handling threads", cxxopts::value<unsigned>())
        ("difficulty", "Challenge of round 0 (random when omitted)", cxxopts::value<int>())
        ("config",     "Path to config file", cxxopts::value<std::string>()->default_value("hashduel.conf"))
        ("d,debug",    "Enable debug logging")
        ("v,version",  "Show version and exit")
        ("h,help",     "Show help and exit");
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("hashduel-authority v{}", HASHDUEL_VERSION));
            pr.show_only = true;
            return pr;
        }
        hashduel::config::AuthorityFlags flags;
        if (result.count("host"))       flags.host       = result["host"].as<std::string>();
        if (result.count("port"))       flags.port       = result["port"].as<std::uint16_t>();
        if (result.count("threads"))    flags.threads    = result["threads"].as<unsigned>();
        if (result.count("difficulty")) flags.difficulty = result["difficulty"].as<int>();
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        pr.flags = flags;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

hashduel::config::SolverParseResult parse_solver(int argc, char** argv, hashduel::logging::Logger& log) {
    hashduel::config::SolverParseResult pr;
    cxxopts::Options options("hashduel-solver", "Challenge solver: queries the authority and mines rounds");
    options.add_options()
        ("url",        "Authority address (host:port)", cxxopts::value<std::string>())
        ("client-id",  "Client identifier credited on wins (random when omitted)", cxxopts::value<std::int64_t>())
        ("workers",    "Parallel search workers", cxxopts::value<unsigned>())
        ("timeout-ms", "Per-request timeout in milliseconds", cxxopts::value<std::uint32_t>())
        ("config",     "Path to config file", cxxopts::value<std::string>()->default_value("hashduel.conf"))
        ("command",    "current | challenge | status | winner | details | mine (menu when omitted)",
                       cxxopts::value<std::string>())
        ("tx",         "Transaction id for challenge/status/winner/details", cxxopts::value<std::int64_t>())
        ("d,debug",    "Enable debug logging")
        ("v,version",  "Show version and exit")
        ("h,help",     "Show help and exit");
    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("hashduel-solver v{}", HASHDUEL_VERSION));
            pr.show_only = true;
            return pr;
        }
        hashduel::config::SolverFlags flags;
        if (result.count("url"))        flags.url        = result["url"].as<std::string>();
        if (result.count("client-id"))  flags.client_id  = result["client-id"].as<std::int64_t>();
        if (result.count("workers"))    flags.workers    = result["workers"].as<unsigned>();
        if (result.count("timeout-ms")) flags.timeout_ms = result["timeout-ms"].as<std::uint32_t>();
        if (result.count("command"))    pr.command       = result["command"].as<std::string>();
        if (result.count("tx"))         pr.tx_id         = result["tx"].as<std::int64_t>();
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;
        pr.flags = flags;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace hashduel::cli

/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <hashduel/logging/logger.hpp>
#include <hashduel/protocol/miner_service.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace hashduel::net {

struct ServerOptions {
    std::string host{"0.0.0.0"};
    std::uint16_t port{50051}; // 0 picks an ephemeral port
    unsigned threads{10};
    bool handle_signals{false}; // stop on SIGINT/SIGTERM
};

/**
 * Line-delimited JSON-RPC server. Requests from all connections are handled
 * on a fixed pool of threads running one io_context.
 */
class AuthorityServer {
public:
    AuthorityServer(logging::Logger& log, protocol::MinerService& service, ServerOptions opts);
    ~AuthorityServer();

    AuthorityServer(const AuthorityServer&) = delete;
    AuthorityServer& operator=(const AuthorityServer&) = delete;

    // Bind, listen and start the IO threads. Throws std::system_error if binding fails.
    void start();
    // Stop accepting, close sessions and join the IO threads.
    void stop();
    // Block until the IO threads exit (after stop() or a handled signal).
    void wait();

    // Bound port, valid after start()
    std::uint16_t port() const;

private:
    struct Impl;

    void do_accept_();

    logging::Logger& log_;
    protocol::MinerService& service_;
    ServerOptions opts_;
    std::unique_ptr<Impl> impl_;
    std::vector<std::thread> threads_;
};

} // namespace hashduel::net

/*
 * Loopback TCP test: authority server and solver channel
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <hashduel/net/authority_server.hpp>
#include <hashduel/net/tcp_channel.hpp>
#include <hashduel/protocol/authority_client.hpp>

#include "capture_logger.hpp"

#include <thread>
#include <vector>

using namespace hashduel;
using namespace std::chrono_literals;

namespace {

struct Server {
    Server() : table(1), arbiter(table, log, [] { return 1; }), service(arbiter, log),
               server(log, service, make_opts()) {
        server.start();
    }

    static net::ServerOptions make_opts() {
        net::ServerOptions opts;
        opts.host = "127.0.0.1";
        opts.port = 0;
        opts.threads = 4;
        return opts;
    }

    net::TcpChannelOptions channel_opts() const {
        net::TcpChannelOptions o;
        o.host = "127.0.0.1";
        o.port = std::to_string(server.port());
        o.timeout = 3000ms;
        return o;
    }

    CaptureLogger log;
    ledger::TransactionTable table;
    ledger::ChallengeArbiter arbiter;
    protocol::MinerService service;
    net::AuthorityServer server;
};

} // namespace

TEST_SUITE("Authority Server") {
    TEST_CASE("requests round-trip over TCP") {
        Server s;
        REQUIRE(s.server.port() != 0);

        net::TcpChannel channel(s.log, s.channel_opts());
        protocol::AuthorityClient client(channel);

        CHECK(client.get_current_transaction_id() == 0);
        CHECK(client.get_challenge(0) == 1);
        CHECK(client.submit_solution(0, 77, "n25") == ledger::SubmitResult::Accepted);
        CHECK(client.get_winner(0) == 77);
        CHECK(client.get_current_transaction_id() == 1);
        CHECK(channel.connected());
    }

    TEST_CASE("concurrent clients race for one round") {
        Server s;
        constexpr int kClients = 8;
        std::vector<ledger::SubmitResult> results(kClients, ledger::SubmitResult::Rejected);
        std::vector<std::thread> threads;
        for (int i = 0; i < kClients; ++i) {
            threads.emplace_back([&, i] {
                net::TcpChannel channel(s.log, s.channel_opts());
                protocol::AuthorityClient client(channel);
                results[i] = client.submit_solution(0, 100 + i, "n663");
            });
        }
        for (auto& t : threads) t.join();

        int accepted = 0;
        for (auto r : results) accepted += r == ledger::SubmitResult::Accepted ? 1 : 0;
        CHECK(accepted == 1);
        CHECK(s.arbiter.current_id() == 1);
    }

    TEST_CASE("unreachable authority is a transport error") {
        CaptureLogger log;
        std::uint16_t closed_port = 0;
        {
            Server s;
            closed_port = s.server.port();
        }
        net::TcpChannelOptions o;
        o.host = "127.0.0.1";
        o.port = std::to_string(closed_port);
        o.timeout = 1000ms;
        net::TcpChannel channel(log, o);
        protocol::AuthorityClient client(channel);
        CHECK_THROWS_AS(client.get_current_transaction_id(), net::TransportError);
        CHECK_FALSE(channel.connected());
    }

    TEST_CASE("closed channel reconnects on the next request") {
        CaptureLogger log;
        Server first;
        net::TcpChannel channel(log, first.channel_opts());
        protocol::AuthorityClient client(channel);
        CHECK(client.get_current_transaction_id() == 0);

        channel.close();
        CHECK_FALSE(channel.connected());
        CHECK(client.get_challenge(0) == 1);
        CHECK(channel.connected());
    }
}

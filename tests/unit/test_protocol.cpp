/*
 * Unit tests for the JSON-RPC messages, the authority service and its client
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <hashduel/protocol/authority_client.hpp>
#include <hashduel/protocol/messages.hpp>
#include <hashduel/protocol/miner_service.hpp>

#include "capture_logger.hpp"
#include "loopback_channel.hpp"

#include <nlohmann/json.hpp>

using namespace hashduel;
using namespace hashduel::protocol;
using json = nlohmann::json;

namespace {

struct Authority {
    explicit Authority(int challenge = 3)
        : table(challenge), arbiter(table, log, [] { return 2; }), service(arbiter, log) {}

    json call(const std::string& method_name, json params = json::object(), std::uint64_t id = 7) {
        auto reply = service.handle_line(build_request(id, method_name, std::move(params)));
        REQUIRE_FALSE(reply.empty());
        CHECK(reply.back() == '\n');
        return json::parse(reply);
    }

    CaptureLogger log;
    ledger::TransactionTable table;
    ledger::ChallengeArbiter arbiter;
    MinerService service;
};

} // namespace

TEST_SUITE("Messages") {
    TEST_CASE("build_request - structure") {
        auto line = build_request(42, method::kGetChallenge, {{"transaction_id", 3}});
        REQUIRE_FALSE(line.empty());
        CHECK(line.back() == '\n');
        auto j = json::parse(line);
        CHECK(j["id"].get<int>() == 42);
        CHECK(j["method"].get<std::string>() == "GetChallenge");
        CHECK(j["params"]["transaction_id"].get<int>() == 3);
    }

    TEST_CASE("build_request - null params become an empty object") {
        auto j = json::parse(build_request(1, method::kGetCurrentTransactionId, nullptr));
        CHECK(j["params"].is_object());
        CHECK(j["params"].empty());
    }

    TEST_CASE("parse_response - result") {
        auto r = parse_response(R"({"id":5,"result":{"challenge":4},"error":null})");
        REQUIRE(r.has_value());
        CHECK(r->id.get<int>() == 5);
        CHECK_FALSE(r->error.has_value());
        CHECK(r->result["challenge"].get<int>() == 4);
    }

    TEST_CASE("parse_response - error object") {
        auto line = build_error(9, RpcErrc::MethodNotFound, "unknown method 'x'");
        auto r = parse_response(line);
        REQUIRE(r.has_value());
        REQUIRE(r->error.has_value());
        CHECK(r->error->code == -32601);
        CHECK(r->error->message == "unknown method 'x'");
    }

    TEST_CASE("parse_response - malformed") {
        CHECK_FALSE(parse_response("not json").has_value());
        CHECK_FALSE(parse_response("[1,2]").has_value());
        CHECK_FALSE(parse_response(R"({"result":1})").has_value());
        CHECK_FALSE(parse_response(R"({"id":1})").has_value());
        CHECK_FALSE(parse_response(R"({"id":1,"error":{"message":"no code"}})").has_value());
    }
}

TEST_SUITE("Miner Service") {
    TEST_CASE("GetCurrentTransactionId") {
        Authority a;
        auto j = a.call(method::kGetCurrentTransactionId);
        CHECK(j["id"].get<int>() == 7);
        CHECK(j["error"].is_null());
        CHECK(j["result"]["transaction_id"].get<int>() == 0);
    }

    TEST_CASE("GetChallenge - valid and invalid ids") {
        Authority a(3);
        CHECK(a.call(method::kGetChallenge, {{"transaction_id", 0}})["result"]["challenge"] == 3);
        CHECK(a.call(method::kGetChallenge, {{"transaction_id", 1}})["result"]["challenge"] == -1);
    }

    TEST_CASE("GetStatus - pending, resolved, invalid") {
        Authority a(1);
        CHECK(a.call(method::kGetStatus, {{"transaction_id", 0}})["result"]["status"] == 1);
        a.call(method::kSubmitSolution, {{"transaction_id", 0}, {"client_id", 11}, {"solution", "n25"}});
        CHECK(a.call(method::kGetStatus, {{"transaction_id", 0}})["result"]["status"] == 0);
        CHECK(a.call(method::kGetStatus, {{"transaction_id", 9}})["result"]["status"] == -1);
    }

    TEST_CASE("SubmitSolution - every result code") {
        Authority a(3);
        auto submit = [&](int tx, const char* s) {
            return a.call(method::kSubmitSolution,
                          {{"transaction_id", tx}, {"client_id", 11}, {"solution", s}})["result"]["result"];
        };
        CHECK(submit(0, "abc") == 0);
        CHECK(submit(0, "n663") == 1);
        CHECK(submit(0, "n663") == 2);
        CHECK(submit(5, "n663") == -1);
    }

    TEST_CASE("GetWinner - invalid, none yet, client id") {
        Authority a(1);
        CHECK(a.call(method::kGetWinner, {{"transaction_id", 3}})["result"]["winner_id"] == -1);
        CHECK(a.call(method::kGetWinner, {{"transaction_id", 0}})["result"]["winner_id"] == 0);
        a.call(method::kSubmitSolution, {{"transaction_id", 0}, {"client_id", 5150}, {"solution", "n25"}});
        CHECK(a.call(method::kGetWinner, {{"transaction_id", 0}})["result"]["winner_id"] == 5150);
    }

    TEST_CASE("GetDetails - pending, resolved, invalid") {
        Authority a(1);
        auto pending = a.call(method::kGetDetails, {{"transaction_id", 0}})["result"];
        CHECK(pending["status"] == 1);
        CHECK(pending["challenge"] == 1);
        CHECK(pending["solution"] == "");

        a.call(method::kSubmitSolution, {{"transaction_id", 0}, {"client_id", 5}, {"solution", "n25"}});
        auto resolved = a.call(method::kGetDetails, {{"transaction_id", 0}})["result"];
        CHECK(resolved["status"] == 0);
        CHECK(resolved["solution"] == "n25");

        auto invalid = a.call(method::kGetDetails, {{"transaction_id", 99}})["result"];
        CHECK(invalid["status"] == -1);
        CHECK(invalid["challenge"] == -1);
        CHECK(invalid["solution"] == "");
    }

    TEST_CASE("protocol errors are distinct from business sentinels") {
        Authority a;
        auto parse_err = json::parse(a.service.handle_line("{not json"));
        CHECK(parse_err["id"].is_null());
        CHECK(parse_err["error"]["code"] == -32700);

        auto no_method = json::parse(a.service.handle_line(R"({"id":3,"params":{}})"));
        CHECK(no_method["id"] == 3);
        CHECK(no_method["error"]["code"] == -32600);

        auto unknown = a.call("getEverything");
        CHECK(unknown["error"]["code"] == -32601);
        CHECK(unknown["result"].is_null());

        auto missing = a.call(method::kGetChallenge);
        CHECK(missing["error"]["code"] == -32602);

        auto wrong_type = a.call(method::kGetChallenge, {{"transaction_id", "zero"}});
        CHECK(wrong_type["error"]["code"] == -32602);

        auto bad_client = a.call(method::kSubmitSolution,
                                 {{"transaction_id", 0}, {"client_id", 0}, {"solution", "n663"}});
        CHECK(bad_client["error"]["code"] == -32602);
        CHECK(a.arbiter.get_status(0) == ledger::TransactionStatus::Pending);
    }
}

TEST_SUITE("Authority Client") {
    TEST_CASE("typed calls decode every operation") {
        Authority a(3);
        LoopbackChannel channel(a.service);
        AuthorityClient client(channel);

        CHECK(client.get_current_transaction_id() == 0);
        CHECK(client.get_challenge(0) == 3);
        CHECK(client.get_challenge(4) == -1);
        CHECK(client.get_status(0) == ledger::TransactionStatus::Pending);
        CHECK(client.get_winner(0) == 0);

        CHECK(client.submit_solution(0, 31, "abc") == ledger::SubmitResult::Rejected);
        CHECK(client.submit_solution(0, 31, "n663") == ledger::SubmitResult::Accepted);
        CHECK(client.submit_solution(0, 32, "n663") == ledger::SubmitResult::AlreadySolved);
        CHECK(client.submit_solution(8, 32, "n663") == ledger::SubmitResult::InvalidTransaction);

        CHECK(client.get_status(0) == ledger::TransactionStatus::Resolved);
        CHECK(client.get_status(8) == ledger::TransactionStatus::InvalidTransaction);
        CHECK(client.get_winner(0) == 31);
        CHECK(client.get_winner(8) == -1);
        CHECK(client.get_current_transaction_id() == 1);
        CHECK(client.get_challenge(1) == 2);

        auto d = client.get_details(0);
        CHECK(d.status == 0);
        CHECK(d.challenge == 3);
        CHECK(d.solution == "n663");
    }

    TEST_CASE("transport failures surface as TransportError") {
        Authority a;
        LoopbackChannel channel(a.service);
        AuthorityClient client(channel);

        channel.fail_next = true;
        CHECK_THROWS_AS(client.get_current_transaction_id(), net::TransportError);
        // The next call goes through again
        CHECK(client.get_current_transaction_id() == 0);
    }

    TEST_CASE("rpc errors and malformed replies are not business results") {
        Authority a;
        LoopbackChannel channel(a.service);
        AuthorityClient client(channel);

        CHECK_THROWS_AS(client.submit_solution(0, 0, "n663"), net::TransportError);

        channel.reply_override = "garbage";
        CHECK_THROWS_AS(client.get_challenge(0), net::TransportError);

        channel.reply_override = R"({"id":999,"result":{"challenge":3},"error":null})";
        CHECK_THROWS_AS(client.get_challenge(0), net::TransportError);

        channel.reply_override = R"({"id":4,"result":{"status":7},"error":null})";
        CHECK_THROWS_AS(client.get_status(0), net::TransportError);
    }
}

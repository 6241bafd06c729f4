/*
 * Unit tests for the parallel candidate search
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <hashduel/crypto/verifier.hpp>
#include <hashduel/mining/search_coordinator.hpp>

#include "capture_logger.hpp"

#include <chrono>
#include <thread>

using namespace hashduel;
using namespace hashduel::mining;
using namespace std::chrono_literals;

TEST_SUITE("Search Coordinator") {
    TEST_CASE("difficulty 1 with 8 workers finds a valid candidate and drains all workers") {
        CaptureLogger log;
        SearchCoordinator search(log);

        auto result = search.search(1, 8);
        CHECK(crypto::verify(1, result.nonce));
        CHECK(result.nonce.size() == SearchCoordinator::kCandidateLength);
        CHECK(result.attempts >= 1);

        // Every worker reported its exit before search() returned
        CHECK(log.count("exiting after") == 8);
        CHECK(log.count("claimed") == 1);
    }

    TEST_CASE("candidates use the alphanumeric alphabet") {
        CaptureLogger log;
        SearchCoordinator search(log);
        auto result = search.search(2, 4);
        for (char c : result.nonce) {
            const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
            CHECK(alnum);
        }
        CHECK(crypto::verify(2, result.nonce));
    }

    TEST_CASE("single worker search") {
        CaptureLogger log;
        SearchCoordinator search(log);
        auto result = search.search(2, 1);
        CHECK(crypto::verify(2, result.nonce));
        CHECK(log.count("exiting after") == 1);
    }

    TEST_CASE("coordinator can run consecutive searches") {
        CaptureLogger log;
        SearchCoordinator search(log);
        for (int i = 0; i < 5; ++i) {
            auto result = search.search(1, 3);
            CHECK(crypto::verify(1, result.nonce));
        }
        CHECK(log.count("exiting after") == 15);
        CHECK(log.count("claimed") == 5);
    }

    TEST_CASE("invalid difficulty fails before spawning workers") {
        CaptureLogger log;
        SearchCoordinator search(log);

        for (int d : {0, -3, 21, 100}) {
            try {
                (void)search.search(d, 4);
                FAIL("expected SearchError");
            } catch (const SearchError& e) {
                CHECK(e.code() == SearchErrc::InvalidDifficulty);
            }
        }
        CHECK(log.count("exiting after") == 0);
    }

    TEST_CASE("zero workers fails before spawning workers") {
        CaptureLogger log;
        SearchCoordinator search(log);
        try {
            (void)search.search(1, 0);
            FAIL("expected SearchError");
        } catch (const SearchError& e) {
            CHECK(e.code() == SearchErrc::NoWorkers);
        }
        CHECK_THROWS_AS((void)search.search(1, 0u), std::invalid_argument);
        CHECK(log.count("exiting after") == 0);
    }

    TEST_CASE("external cancellation stops an unreachable search without a claim") {
        CaptureLogger log;
        SearchCoordinator search(log);

        SearchOptions opts;
        opts.workers = 4;
        opts.cancel = CancelToken{};
        CancelToken token = *opts.cancel;

        std::thread canceller([token]() mutable {
            std::this_thread::sleep_for(100ms);
            token.cancel();
        });
        auto result = search.search(20, opts);
        canceller.join();

        CHECK_FALSE(result.has_value());
        CHECK(log.count("exiting after") == 4);
        CHECK(log.count("claimed") == 0);
    }

    TEST_CASE("already cancelled token returns immediately") {
        CaptureLogger log;
        SearchCoordinator search(log);

        CancelToken token;
        token.cancel();
        SearchOptions opts;
        opts.workers = 2;
        opts.cancel = token;

        CHECK_FALSE(search.search(20, opts).has_value());
        CHECK(log.count("exiting after") == 2);
    }

    TEST_CASE("deadline bounds the search") {
        CaptureLogger log;
        SearchCoordinator search(log);

        SearchOptions opts;
        opts.workers = 2;
        opts.deadline = std::chrono::steady_clock::now() + 100ms;

        const auto started = std::chrono::steady_clock::now();
        auto result = search.search(20, opts);
        const auto took = std::chrono::steady_clock::now() - started;

        CHECK_FALSE(result.has_value());
        CHECK(took >= 100ms);
        CHECK(took < 10s);
        CHECK(log.count("exiting after") == 2);
    }

    TEST_CASE("options without cancellation still find a value") {
        CaptureLogger log;
        SearchCoordinator search(log);
        SearchOptions opts;
        opts.workers = 2;
        opts.deadline = std::chrono::steady_clock::now() + 60s;
        auto result = search.search(1, opts);
        REQUIRE(result.has_value());
        CHECK(crypto::verify(1, result->nonce));
    }

    TEST_CASE("hashrate is derived from attempts and elapsed time") {
        SearchResult r;
        r.attempts = 5000;
        r.elapsed = std::chrono::milliseconds(500);
        CHECK(r.hashrate() == doctest::Approx(10000.0));
        r.elapsed = std::chrono::milliseconds(0);
        CHECK(r.hashrate() == doctest::Approx(5000000.0));
    }
}

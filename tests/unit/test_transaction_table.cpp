/*
 * Unit tests for the transaction table
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <hashduel/ledger/transaction_table.hpp>

#include <stdexcept>
#include <thread>
#include <vector>

using namespace hashduel::ledger;

TEST_SUITE("Transaction Table") {
    TEST_CASE("construction creates pending round 0") {
        TransactionTable table(3);
        CHECK(table.current_id() == 0);
        CHECK(table.size() == 1);

        auto tx = table.get(0);
        REQUIRE(tx.has_value());
        CHECK(tx->id == 0);
        CHECK(tx->challenge == 3);
        CHECK_FALSE(tx->resolved());
        CHECK_FALSE(tx->solution.has_value());
    }

    TEST_CASE("construction rejects out of range challenge") {
        CHECK_THROWS_AS(TransactionTable(0), std::invalid_argument);
        CHECK_THROWS_AS(TransactionTable(21), std::invalid_argument);
    }

    TEST_CASE("get - unknown ids") {
        TransactionTable table(1);
        CHECK_FALSE(table.get(1).has_value());
        CHECK_FALSE(table.get(-1).has_value());
    }

    TEST_CASE("create_next - ids increase and current advances") {
        TransactionTable table(1);
        {
            auto lock = table.lock();
            const auto& next = lock.create_next(7);
            CHECK(next.id == 1);
            CHECK(next.challenge == 7);
            CHECK(lock.current_id() == 1);
        }
        CHECK(table.current_id() == 1);
        CHECK(table.size() == 2);
        CHECK(table.get(0)->challenge == 1);
    }

    TEST_CASE("create_next - invalid challenge leaves table unchanged") {
        TransactionTable table(2);
        auto lock = table.lock();
        CHECK_THROWS_AS(lock.create_next(0), std::invalid_argument);
        CHECK_THROWS_AS(lock.create_next(25), std::invalid_argument);
        CHECK(lock.current_id() == 0);
        CHECK(lock.find(1) == nullptr);
    }

    TEST_CASE("resolve - sets solution and winner once") {
        TransactionTable table(1);
        {
            auto lock = table.lock();
            CHECK(lock.resolve(0, "first", 42));
            CHECK_FALSE(lock.resolve(0, "second", 43));
            CHECK_FALSE(lock.resolve(5, "missing", 44));
        }
        auto tx = table.get(0);
        REQUIRE(tx.has_value());
        CHECK(tx->resolved());
        CHECK(*tx->solution == "first");
        CHECK(*tx->winner == 42);
    }

    TEST_CASE("get returns a snapshot") {
        TransactionTable table(1);
        auto before = table.get(0);
        {
            auto lock = table.lock();
            lock.resolve(0, "x", 1);
        }
        CHECK_FALSE(before->resolved());
        CHECK(table.get(0)->resolved());
    }

    TEST_CASE("concurrent create_next never reuses ids") {
        TransactionTable table(1);
        constexpr int kThreads = 8;
        constexpr int kPerThread = 100;
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&table] {
                for (int i = 0; i < kPerThread; ++i) {
                    auto lock = table.lock();
                    lock.create_next(1 + i % 20);
                }
            });
        }
        for (auto& th : threads) th.join();

        CHECK(table.size() == 1 + kThreads * kPerThread);
        CHECK(table.current_id() == kThreads * kPerThread);
        for (TransactionId id = 0; id <= table.current_id(); ++id) {
            CHECK(table.get(id).has_value());
        }
    }
}

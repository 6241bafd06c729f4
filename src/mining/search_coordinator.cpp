/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "hashduel/mining/search_coordinator.hpp"
#include "hashduel/crypto/verifier.hpp"

#include <condition_variable>
#include <exception>
#include <fmt/format.h>
#include <mutex>
#include <random>
#include <string_view>
#include <thread>
#include <vector>

namespace hashduel {
namespace mining {

namespace {

constexpr std::string_view kAlphabet =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr auto kCancelPollInterval = std::chrono::milliseconds(20);

// Shared by every worker of one search
struct SearchState {
    explicit SearchState(int d) : difficulty(d) {}

    const int difficulty;
    std::atomic<bool> stop{false};
    std::atomic<std::uint64_t> attempts{0};

    std::mutex claim_mutex;
    std::condition_variable claimed_cv;
    std::optional<std::string> claimed;
    std::exception_ptr error;
};

void raise_stop(SearchState& state) {
    {
        std::lock_guard<std::mutex> lock(state.claim_mutex);
        state.stop.store(true);
    }
    state.claimed_cv.notify_all();
}

void search_worker(SearchState& state, unsigned worker_id, logging::Logger& log) {
    std::mt19937_64 rng(std::random_device{}() ^ (static_cast<std::uint64_t>(worker_id) << 32));
    std::uniform_int_distribution<std::size_t> pick(0, kAlphabet.size() - 1);
    std::string candidate(SearchCoordinator::kCandidateLength, 'a');
    std::uint64_t local_attempts = 0;

    try {
        while (!state.stop.load(std::memory_order_relaxed)) {
            for (auto& c : candidate) c = kAlphabet[pick(rng)];
            ++local_attempts;
            if (!crypto::verify(state.difficulty, candidate)) continue;

            bool won = false;
            {
                std::lock_guard<std::mutex> lock(state.claim_mutex);
                if (!state.stop.load()) {
                    state.claimed = candidate;
                    state.stop.store(true);
                    won = true;
                }
            }
            if (won) {
                state.claimed_cv.notify_all();
                log.debug(fmt::format("Worker {} claimed {}", worker_id, candidate));
            } else {
                log.debug(fmt::format("Worker {} discarded late find {}", worker_id, candidate));
            }
            break;
        }
    } catch (...) {
        std::lock_guard<std::mutex> lock(state.claim_mutex);
        if (!state.error) state.error = std::current_exception();
        state.stop.store(true);
        state.claimed_cv.notify_all();
    }

    state.attempts.fetch_add(local_attempts);
    log.debug(fmt::format("Worker {} exiting after {} attempts", worker_id, local_attempts));
}

} // namespace

SearchCoordinator::SearchCoordinator(logging::Logger& log) : log_(log) {}

SearchResult SearchCoordinator::search(int difficulty, unsigned worker_count) {
    SearchOptions opts;
    opts.workers = worker_count;
    // Without a token or deadline the search only ends on a claim.
    return *search(difficulty, opts);
}

std::optional<SearchResult> SearchCoordinator::search(int difficulty, const SearchOptions& opts) {
    if (!crypto::is_valid_challenge(difficulty)) {
        throw SearchError(SearchErrc::InvalidDifficulty,
                          fmt::format("difficulty {} outside [{}, {}]", difficulty,
                                      crypto::kMinChallenge, crypto::kMaxChallenge));
    }
    if (opts.workers == 0) {
        throw SearchError(SearchErrc::NoWorkers, "search requires at least one worker");
    }

    log_.info(fmt::format("Searching for prefix of {} zeros with {} workers", difficulty, opts.workers));
    const auto started = std::chrono::steady_clock::now();

    SearchState state(difficulty);
    std::vector<std::thread> workers;
    workers.reserve(opts.workers);

    auto join_all = [&workers]() {
        for (auto& t : workers) {
            if (t.joinable()) t.join();
        }
    };

    try {
        for (unsigned i = 0; i < opts.workers; ++i) {
            workers.emplace_back(search_worker, std::ref(state), i, std::ref(log_));
        }
    } catch (...) {
        raise_stop(state);
        join_all();
        throw;
    }

    {
        std::unique_lock<std::mutex> lock(state.claim_mutex);
        while (!state.stop.load()) {
            if (opts.cancel && opts.cancel->cancelled()) {
                state.stop.store(true);
                break;
            }
            if (opts.deadline && std::chrono::steady_clock::now() >= *opts.deadline) {
                state.stop.store(true);
                break;
            }
            if (opts.cancel || opts.deadline) {
                state.claimed_cv.wait_for(lock, kCancelPollInterval);
            } else {
                state.claimed_cv.wait(lock);
            }
        }
    }

    // Draining: every worker sees the flag at the top of its loop.
    join_all();

    if (state.error) std::rethrow_exception(state.error);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (!state.claimed) {
        log_.warn(fmt::format("Search cancelled after {} attempts ({} ms)",
                              state.attempts.load(), elapsed.count()));
        return std::nullopt;
    }

    SearchResult result;
    result.nonce = std::move(*state.claimed);
    result.attempts = state.attempts.load();
    result.elapsed = elapsed;
    log_.info(fmt::format("Found {} after {} attempts in {} ms ({:.1f} H/s)",
                          result.nonce, result.attempts, elapsed.count(), result.hashrate()));
    return result;
}

} // namespace mining
} // namespace hashduel

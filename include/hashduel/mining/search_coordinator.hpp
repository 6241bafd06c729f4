/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <hashduel/logging/logger.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace hashduel {
namespace mining {

enum class SearchErrc {
    InvalidDifficulty,
    NoWorkers,
};

/**
 * Misuse of the search API, raised before any worker is spawned
 */
class SearchError : public std::invalid_argument {
public:
    SearchError(SearchErrc code, const std::string& what)
        : std::invalid_argument(what), code_(code) {}
    SearchErrc code() const noexcept { return code_; }

private:
    SearchErrc code_;
};

/**
 * Shared stop flag a caller can raise from any thread to abandon a search
 */
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    void cancel() noexcept { flag_->store(true); }
    bool cancelled() const noexcept { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct SearchOptions {
    unsigned workers{8};
    std::optional<CancelToken> cancel;
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

struct SearchResult {
    std::string nonce;
    std::uint64_t attempts{0};
    std::chrono::milliseconds elapsed{0};

    double hashrate() const {
        const auto ms = elapsed.count() > 0 ? elapsed.count() : 1;
        return static_cast<double>(attempts) * 1000.0 / static_cast<double>(ms);
    }
};

/**
 * Races independent workers for a candidate whose SHA-1 hex digest starts with
 * `difficulty` zeros. The first worker to claim the shared slot wins, every
 * other worker stops at its next iteration, and all are joined before return.
 */
class SearchCoordinator {
public:
    static constexpr std::size_t kCandidateLength = 16;

    explicit SearchCoordinator(logging::Logger& log);

    // Unbounded search. Only returns once a candidate was found.
    SearchResult search(int difficulty, unsigned worker_count);

    // Empty result when the cancel token or deadline fired before any claim.
    std::optional<SearchResult> search(int difficulty, const SearchOptions& opts);

private:
    logging::Logger& log_;
};

} // namespace mining
} // namespace hashduel

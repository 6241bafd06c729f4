/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <hashduel/logging/logger.hpp>

#include <atomic>
#include <cstdio>
#include <mutex>

namespace hashduel::logging {

// Timestamped line logger. Safe to share between search workers and server threads.
class FmtLogger : public Logger {
public:
    explicit FmtLogger(bool enable_debug = false) : enable_debug_(enable_debug) {}
    void info(std::string_view msg) override;
    void warn(std::string_view msg) override;
    void error(std::string_view msg) override;
    void debug(std::string_view msg) override;

    void set_debug(bool v) { enable_debug_.store(v); }
    bool debug_enabled() const { return enable_debug_.load(); }

private:
    void write_(std::FILE* out, std::string_view level, std::string_view msg);

    std::atomic<bool> enable_debug_{false};
    std::mutex out_mutex_;
};

} // namespace hashduel::logging

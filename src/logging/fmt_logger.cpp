/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <hashduel/logging/fmt_logger.hpp>
#include <hashduel/log.hpp>

#include <cstdio>
#include <fmt/core.h>

namespace hashduel::logging {

void FmtLogger::write_(std::FILE* out, std::string_view level, std::string_view msg) {
    const auto stamp = log::now_hms();
    std::lock_guard<std::mutex> lock(out_mutex_);
    fmt::print(out, "{} [{}] {}\n", stamp, level, msg);
    std::fflush(out);
}

void FmtLogger::info(std::string_view msg) { write_(stdout, "INFO", msg); }
void FmtLogger::warn(std::string_view msg) { write_(stdout, "WARN", msg); }
void FmtLogger::error(std::string_view msg) { write_(stderr, "ERROR", msg); }
void FmtLogger::debug(std::string_view msg) {
    if (enable_debug_.load()) write_(stdout, "DEBUG", msg);
}

} // namespace hashduel::logging

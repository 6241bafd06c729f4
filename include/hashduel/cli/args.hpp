/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <hashduel/config/types.hpp>
#include <hashduel/logging/logger.hpp>

namespace hashduel::cli {

// Parse CLI using cxxopts. Writes help/version through provided logger when requested.
hashduel::config::AuthorityParseResult parse_authority(int argc, char** argv, hashduel::logging::Logger& log);
hashduel::config::SolverParseResult parse_solver(int argc, char** argv, hashduel::logging::Logger& log);

} // namespace hashduel::cli

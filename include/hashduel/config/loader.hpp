/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>
#include <vector>

#include <hashduel/config/types.hpp>

namespace hashduel::config {

// Read configuration from file (JSON or key=value). A missing file is not an error.
// Returns list of validation errors (empty if ok); cfg is untouched on error.
std::vector<std::string> load_from_file(AuthorityConfig& cfg, const std::string& path);
std::vector<std::string> load_from_file(SolverConfig& cfg, const std::string& path);

// Same as load_from_file, from text already in memory.
std::vector<std::string> load_from_text(AuthorityConfig& cfg, const std::string& text);
std::vector<std::string> load_from_text(SolverConfig& cfg, const std::string& text);

// Apply HASHDUEL_* environment variables on top of current cfg.
// Authority: HOST, PORT, THREADS, DIFFICULTY. Solver: URL, CLIENT_ID, WORKERS, TIMEOUT_MS.
std::vector<std::string> apply_env_overrides(AuthorityConfig& cfg);
std::vector<std::string> apply_env_overrides(SolverConfig& cfg);

// Command line values have the highest precedence.
void apply_flags(AuthorityConfig& cfg, const AuthorityFlags& flags);
void apply_flags(SolverConfig& cfg, const SolverFlags& flags);

// Validate final config. Returns list of errors.
std::vector<std::string> validate_final(const AuthorityConfig& cfg);
std::vector<std::string> validate_final(const SolverConfig& cfg);

} // namespace hashduel::config

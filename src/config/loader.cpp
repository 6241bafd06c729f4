/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <hashduel/config/loader.hpp>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <limits>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <hashduel/config/validator.hpp>
#include <hashduel/crypto/verifier.hpp>

namespace hashduel::config {

namespace {

template <typename Cfg>
struct Field {
    const char* key;
    const char* env;
    bool numeric;
    std::function<bool(Cfg&, const std::string&)> set;
};

template <typename T>
bool parse_number(const std::string& text, T& out, T min, T max) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return false;
    if (value < min || value > max) return false;
    out = value;
    return true;
}

const std::vector<Field<AuthorityConfig>>& authority_fields() {
    static const std::vector<Field<AuthorityConfig>> fields = {
        {"host", "HASHDUEL_HOST", false,
         [](AuthorityConfig& c, const std::string& v) { c.host = v; return true; }},
        {"port", "HASHDUEL_PORT", true,
         [](AuthorityConfig& c, const std::string& v) {
             return parse_number<std::uint16_t>(v, c.port, 1, 65535);
         }},
        {"threads", "HASHDUEL_THREADS", true,
         [](AuthorityConfig& c, const std::string& v) {
             return parse_number<unsigned>(v, c.threads, 1, 1024);
         }},
        {"difficulty", "HASHDUEL_DIFFICULTY", true,
         [](AuthorityConfig& c, const std::string& v) {
             int d = 0;
             if (!parse_number<int>(v, d, crypto::kMinChallenge, crypto::kMaxChallenge)) return false;
             c.initial_difficulty = d;
             return true;
         }},
    };
    return fields;
}

const std::vector<Field<SolverConfig>>& solver_fields() {
    static const std::vector<Field<SolverConfig>> fields = {
        {"url", "HASHDUEL_URL", false,
         [](SolverConfig& c, const std::string& v) { c.url = v; return true; }},
        {"client_id", "HASHDUEL_CLIENT_ID", true,
         [](SolverConfig& c, const std::string& v) {
             return parse_number<std::int64_t>(v, c.client_id, 1, std::numeric_limits<std::int64_t>::max());
         }},
        {"workers", "HASHDUEL_WORKERS", true,
         [](SolverConfig& c, const std::string& v) {
             return parse_number<unsigned>(v, c.workers, 1, 1024);
         }},
        {"timeout_ms", "HASHDUEL_TIMEOUT_MS", true,
         [](SolverConfig& c, const std::string& v) {
             return parse_number<std::uint32_t>(v, c.timeout_ms, 1, 3600000);
         }},
    };
    return fields;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

template <typename Cfg>
void assign(Cfg& cfg, const Field<Cfg>& f, const std::string& value, std::vector<std::string>& errs) {
    if (!f.set(cfg, value)) {
        errs.push_back(fmt::format("invalid value for '{}': '{}'", f.key, value));
    }
}

template <typename Cfg>
std::vector<std::string> load_json(Cfg& cfg, const std::string& text, const std::vector<Field<Cfg>>& fields) {
    std::vector<std::string> errs;
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            errs.push_back("config root must be a JSON object");
            return errs;
        }
        for (const auto& f : fields) {
            if (!j.contains(f.key)) continue;
            const auto& v = j.at(f.key);
            if (f.numeric) {
                if (!v.is_number_integer()) {
                    errs.push_back(fmt::format("'{}' must be an integer", f.key));
                    continue;
                }
                assign(cfg, f, v.dump(), errs);
            } else {
                if (!v.is_string()) {
                    errs.push_back(fmt::format("'{}' must be a string", f.key));
                    continue;
                }
                assign(cfg, f, v.template get<std::string>(), errs);
            }
        }
    } catch (const std::exception& ex) {
        errs.push_back(fmt::format("Failed to read config: {}", ex.what()));
    }
    return errs;
}

template <typename Cfg>
std::vector<std::string> load_key_value(Cfg& cfg, const std::string& text, const std::vector<Field<Cfg>>& fields) {
    std::vector<std::string> errs;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        for (const auto& f : fields) {
            if (key == f.key) assign(cfg, f, val, errs);
        }
    }
    return errs;
}

template <typename Cfg>
std::vector<std::string> load_text(Cfg& cfg, const std::string& text, const std::vector<Field<Cfg>>& fields) {
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return {};

    Cfg staged = cfg;
    auto errs = text[first_non_space] == '{' ? load_json(staged, text, fields)
                                             : load_key_value(staged, text, fields);
    if (errs.empty()) cfg = std::move(staged);
    return errs;
}

template <typename Cfg>
std::vector<std::string> load_file(Cfg& cfg, const std::string& path, const std::vector<Field<Cfg>>& fields) {
    std::ifstream in(path);
    if (!in.good()) return {}; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    return load_text(cfg, buffer.str(), fields);
}

template <typename Cfg>
std::vector<std::string> apply_env(Cfg& cfg, const std::vector<Field<Cfg>>& fields) {
    std::vector<std::string> errs;
    for (const auto& f : fields) {
        if (const char* v = std::getenv(f.env)) {
            if (!f.set(cfg, v)) errs.push_back(fmt::format("invalid value for {}: '{}'", f.env, v));
        }
    }
    return errs;
}

} // namespace

std::vector<std::string> load_from_text(AuthorityConfig& cfg, const std::string& text) {
    return load_text(cfg, text, authority_fields());
}

std::vector<std::string> load_from_text(SolverConfig& cfg, const std::string& text) {
    return load_text(cfg, text, solver_fields());
}

std::vector<std::string> load_from_file(AuthorityConfig& cfg, const std::string& path) {
    return load_file(cfg, path, authority_fields());
}

std::vector<std::string> load_from_file(SolverConfig& cfg, const std::string& path) {
    return load_file(cfg, path, solver_fields());
}

std::vector<std::string> apply_env_overrides(AuthorityConfig& cfg) {
    return apply_env(cfg, authority_fields());
}

std::vector<std::string> apply_env_overrides(SolverConfig& cfg) {
    return apply_env(cfg, solver_fields());
}

void apply_flags(AuthorityConfig& cfg, const AuthorityFlags& flags) {
    if (flags.host) cfg.host = *flags.host;
    if (flags.port) cfg.port = *flags.port;
    if (flags.threads) cfg.threads = *flags.threads;
    if (flags.difficulty) cfg.initial_difficulty = *flags.difficulty;
}

void apply_flags(SolverConfig& cfg, const SolverFlags& flags) {
    if (flags.url) cfg.url = *flags.url;
    if (flags.client_id) cfg.client_id = *flags.client_id;
    if (flags.workers) cfg.workers = *flags.workers;
    if (flags.timeout_ms) cfg.timeout_ms = *flags.timeout_ms;
}

std::vector<std::string> validate_final(const AuthorityConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    if (!is_valid_hostname(cfg.host, e)) errs.push_back(fmt::format("host: {}", e));
    if (cfg.port == 0) errs.push_back("port is required (1-65535)");
    if (cfg.threads == 0) errs.push_back("threads must be at least 1");
    if (cfg.initial_difficulty && !crypto::is_valid_challenge(*cfg.initial_difficulty)) {
        errs.push_back(fmt::format("difficulty must be in [{}, {}]", crypto::kMinChallenge, crypto::kMaxChallenge));
    }
    return errs;
}

std::vector<std::string> validate_final(const SolverConfig& cfg) {
    std::vector<std::string> errs;
    if (cfg.url.empty()) errs.push_back("url is required");
    else {
        std::string e;
        if (!validate_host_port(cfg.url, e)) errs.push_back(e);
    }
    if (cfg.client_id < 0) errs.push_back("client_id must be positive");
    if (cfg.workers == 0) errs.push_back("workers must be at least 1");
    if (cfg.timeout_ms == 0) errs.push_back("timeout_ms must be positive");
    return errs;
}

} // namespace hashduel::config

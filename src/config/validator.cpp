/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <hashduel/config/validator.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace hashduel::config {

bool is_valid_hostname(const std::string& host, std::string& err) {
    if (host.empty()) { err = "empty hostname"; return false; }
    if (host.size() > 253) { err = "hostname too long (>253)"; return false; }
    std::size_t start = 0;
    while (start < host.size()) {
        auto dot = host.find('.', start);
        std::size_t end = (dot == std::string::npos) ? host.size() : dot;
        std::size_t len = end - start;
        if (len == 0) { err = "empty hostname label"; return false; }
        if (len > 63) { err = "hostname label too long (>63)"; return false; }
        if (host[start] == '-' || host[end-1] == '-') { err = "hostname label cannot start or end with '-'"; return false; }
        for (std::size_t i = start; i < end; ++i) {
            char c = host[i];
            if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '-')) {
                err = "hostname contains invalid characters"; return false; }
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return true;
}

bool validate_host_port(const std::string& url, std::string& err) {
    auto pos = url.rfind(':');
    if (pos == std::string::npos || pos == url.size() - 1) {
        err = "url must be in the form host:port"; return false; }
    std::string host = url.substr(0, pos);
    std::string port_s = url.substr(pos + 1);
    if (!std::all_of(port_s.begin(), port_s.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        err = "url port must contain digits only"; return false; }
    unsigned long port = 0;
    auto [ptr, ec] = std::from_chars(port_s.data(), port_s.data() + port_s.size(), port);
    if (ec != std::errc{} || ptr != port_s.data() + port_s.size()) {
        err = "port out of range (1-65535)"; return false; }
    if (port == 0 || port > 65535UL) { err = "port out of range (1-65535)"; return false; }
    if (!is_valid_hostname(host, err)) return false;
    return true;
}

void split_host_port(const std::string& url, std::string& host, std::string& port) {
    auto pos = url.rfind(':');
    host = url.substr(0, pos);
    port = pos == std::string::npos ? std::string{} : url.substr(pos + 1);
}

} // namespace hashduel::config

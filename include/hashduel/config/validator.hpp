/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <string>

namespace hashduel::config {

// Validates hostname (RFC-ish light rules) and returns error in 'err' if invalid.
bool is_valid_hostname(const std::string& host, std::string& err);

// Validates url in form host:port, checks hostname and port range [1..65535].
bool validate_host_port(const std::string& url, std::string& err);

// Splits a url already accepted by validate_host_port.
void split_host_port(const std::string& url, std::string& host, std::string& port);

} // namespace hashduel::config

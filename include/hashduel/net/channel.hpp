/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace hashduel::net {

// Connection lost, timeout, unreachable authority or an unusable reply.
// Never used for business outcomes such as an invalid transaction id.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Request/response line exchange with the authority
class Channel {
public:
    virtual ~Channel() = default;

    // Send one '\n' terminated request line and return the reply line (without '\n').
    // Throws TransportError.
    virtual std::string exchange(std::string_view request_line) = 0;
};

} // namespace hashduel::net

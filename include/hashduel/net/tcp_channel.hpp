/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <hashduel/logging/logger.hpp>
#include <hashduel/net/channel.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace hashduel::net {

struct TcpChannelOptions {
    std::string host;
    std::string port;
    std::chrono::milliseconds timeout{5000};
};

/**
 * Persistent TCP connection to the authority. Each exchange (and the lazy
 * connect before it) is bounded by the timeout; a failed exchange drops the
 * connection and the next call reconnects.
 */
class TcpChannel : public Channel {
public:
    TcpChannel(logging::Logger& log, TcpChannelOptions opts);
    ~TcpChannel() override;

    TcpChannel(const TcpChannel&) = delete;
    TcpChannel& operator=(const TcpChannel&) = delete;

    std::string exchange(std::string_view request_line) override;

    bool connected() const;
    void close();

private:
    struct Impl;

    void connect_();

    logging::Logger& log_;
    TcpChannelOptions opts_;
    std::unique_ptr<Impl> impl_;
};

} // namespace hashduel::net

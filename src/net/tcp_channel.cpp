/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <hashduel/net/tcp_channel.hpp>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/connect.hpp>
#include <asio/steady_timer.hpp>
#include <asio/error.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>
#include <asio/streambuf.hpp>

#include <fmt/format.h>
#include <istream>

namespace hashduel::net {

namespace {
constexpr std::size_t kMaxReplyBytes = 64 * 1024;
}

struct TcpChannel::Impl {
    asio::io_context ioc;
    asio::ip::tcp::socket socket{ioc};
    asio::steady_timer timer{ioc};
    asio::streambuf buffer{kMaxReplyBytes};

    // Run queued operations until they finish or the deadline closes the socket.
    bool run_with_timeout(std::chrono::milliseconds timeout) {
        bool timed_out = false;
        timer.expires_after(timeout);
        timer.async_wait([this, &timed_out](const std::error_code& ec) {
            if (ec) return;
            timed_out = true;
            std::error_code ignored;
            socket.close(ignored);
        });
        ioc.restart();
        ioc.run();
        return !timed_out;
    }

    void cancel_timer() {
        timer.cancel();
    }
};

TcpChannel::TcpChannel(logging::Logger& log, TcpChannelOptions opts)
    : log_(log), opts_(std::move(opts)), impl_(std::make_unique<Impl>()) {}

TcpChannel::~TcpChannel() { close(); }

bool TcpChannel::connected() const {
    return impl_->socket.is_open();
}

void TcpChannel::close() {
    std::error_code ignored;
    impl_->socket.close(ignored);
    impl_->buffer.consume(impl_->buffer.size());
}

void TcpChannel::connect_() {
    asio::ip::tcp::resolver resolver{impl_->ioc};
    std::error_code result_ec = asio::error::would_block;

    log_.debug(fmt::format("Resolving {}:{}", opts_.host, opts_.port));
    resolver.async_resolve(opts_.host, opts_.port,
        [this, &result_ec](const std::error_code& ec, asio::ip::tcp::resolver::results_type results) {
            if (ec) {
                result_ec = ec;
                impl_->cancel_timer();
                return;
            }
            asio::async_connect(impl_->socket, results,
                [this, &result_ec](const std::error_code& ec2, const asio::ip::tcp::endpoint&) {
                    result_ec = ec2;
                    impl_->cancel_timer();
                });
        });

    const bool in_time = impl_->run_with_timeout(opts_.timeout);
    if (!in_time) {
        resolver.cancel();
        close();
        throw TransportError(fmt::format("connect to {}:{} timed out ({} ms)",
                                         opts_.host, opts_.port, opts_.timeout.count()));
    }
    if (result_ec) {
        close();
        throw TransportError(fmt::format("connect to {}:{}: {}", opts_.host, opts_.port, result_ec.message()));
    }
    log_.debug(fmt::format("Connected to {}:{}", opts_.host, opts_.port));
}

std::string TcpChannel::exchange(std::string_view request_line) {
    if (!connected()) connect_();

    std::error_code write_ec = asio::error::would_block;
    std::error_code read_ec = asio::error::would_block;
    const std::string out(request_line);

    asio::async_write(impl_->socket, asio::buffer(out),
        [this, &write_ec, &read_ec](const std::error_code& ec, std::size_t) {
            write_ec = ec;
            if (ec) {
                impl_->cancel_timer();
                return;
            }
            asio::async_read_until(impl_->socket, impl_->buffer, '\n',
                [this, &read_ec](const std::error_code& ec2, std::size_t) {
                    read_ec = ec2;
                    impl_->cancel_timer();
                });
        });

    const bool in_time = impl_->run_with_timeout(opts_.timeout);
    if (!in_time) {
        close();
        throw TransportError(fmt::format("request to {}:{} timed out ({} ms)",
                                         opts_.host, opts_.port, opts_.timeout.count()));
    }
    if (write_ec) {
        close();
        throw TransportError(fmt::format("write: {}", write_ec.message()));
    }
    if (read_ec) {
        close();
        throw TransportError(fmt::format("read: {}", read_ec.message()));
    }

    std::istream is(&impl_->buffer);
    std::string line;
    std::getline(is, line);
    return line;
}

} // namespace hashduel::net

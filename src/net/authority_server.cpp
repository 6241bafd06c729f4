/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include <hashduel/net/authority_server.hpp>
#include <hashduel/protocol/messages.hpp>

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/error.hpp>
#include <asio/read_until.hpp>
#include <asio/signal_set.hpp>
#include <asio/write.hpp>
#include <asio/streambuf.hpp>

#include <fmt/format.h>
#include <csignal>
#include <istream>

namespace hashduel::net {

namespace {

constexpr std::size_t kMaxRequestBytes = 64 * 1024;

// One client connection: read a line, answer it, repeat.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(asio::ip::tcp::socket socket, protocol::MinerService& service, logging::Logger& log)
        : socket_(std::move(socket)), service_(service), log_(log) {
        std::error_code ec;
        auto ep = socket_.remote_endpoint(ec);
        peer_ = ec ? std::string("?") : fmt::format("{}:{}", ep.address().to_string(), ep.port());
    }

    void start() {
        log_.debug(fmt::format("Session opened: {}", peer_));
        read_next_();
    }

private:
    void read_next_() {
        auto self = shared_from_this();
        asio::async_read_until(socket_, buffer_, '\n',
            [this, self](const std::error_code& ec, std::size_t) {
                if (ec == asio::error::not_found) {
                    // Line longer than the buffer limit
                    reply_and_close_(protocol::build_error(nullptr, protocol::RpcErrc::InvalidRequest,
                                                           "request line too long"));
                    return;
                }
                if (ec) {
                    if (ec != asio::error::eof && ec != asio::error::operation_aborted) {
                        log_.debug(fmt::format("Session {} read: {}", peer_, ec.message()));
                    }
                    log_.debug(fmt::format("Session closed: {}", peer_));
                    return;
                }
                std::istream is(&buffer_);
                std::string line;
                std::getline(is, line);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (line.empty()) {
                    read_next_();
                    return;
                }
                reply_(service_.handle_line(line));
            });
    }

    void reply_(std::string response) {
        auto self = shared_from_this();
        auto out = std::make_shared<std::string>(std::move(response));
        asio::async_write(socket_, asio::buffer(*out),
            [this, self, out](const std::error_code& ec, std::size_t) {
                if (ec) {
                    log_.debug(fmt::format("Session {} write: {}", peer_, ec.message()));
                    return;
                }
                read_next_();
            });
    }

    void reply_and_close_(std::string response) {
        auto self = shared_from_this();
        auto out = std::make_shared<std::string>(std::move(response));
        asio::async_write(socket_, asio::buffer(*out),
            [this, self, out](const std::error_code&, std::size_t) {
                std::error_code ignored;
                socket_.close(ignored);
            });
    }

    asio::ip::tcp::socket socket_;
    protocol::MinerService& service_;
    logging::Logger& log_;
    asio::streambuf buffer_{kMaxRequestBytes};
    std::string peer_;
};

} // namespace

struct AuthorityServer::Impl {
    asio::io_context ioc;
    asio::ip::tcp::acceptor acceptor{ioc};
    asio::signal_set signals{ioc};
};

AuthorityServer::AuthorityServer(logging::Logger& log, protocol::MinerService& service, ServerOptions opts)
    : log_(log), service_(service), opts_(std::move(opts)), impl_(std::make_unique<Impl>()) {}

AuthorityServer::~AuthorityServer() { stop(); }

std::uint16_t AuthorityServer::port() const {
    std::error_code ec;
    auto ep = impl_->acceptor.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void AuthorityServer::start() {
    if (!threads_.empty()) return;

    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(opts_.host), opts_.port);
    impl_->acceptor.open(endpoint.protocol());
    impl_->acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    impl_->acceptor.bind(endpoint);
    impl_->acceptor.listen();

    if (opts_.handle_signals) {
        impl_->signals.add(SIGINT);
        impl_->signals.add(SIGTERM);
        impl_->signals.async_wait([this](const std::error_code& ec, int signo) {
            if (ec) return;
            log_.info(fmt::format("Signal {} received, shutting down", signo));
            impl_->ioc.stop();
        });
    }

    do_accept_();

    const unsigned n = opts_.threads == 0 ? 1 : opts_.threads;
    for (unsigned i = 0; i < n; ++i) {
        threads_.emplace_back([this] {
            try {
                impl_->ioc.run();
            } catch (const std::exception& e) {
                log_.error(fmt::format("Server IO error: {}", e.what()));
                impl_->ioc.stop();
            }
        });
    }
    log_.info(fmt::format("Authority listening on {}:{} ({} threads)", opts_.host, port(), n));
}

void AuthorityServer::do_accept_() {
    impl_->acceptor.async_accept(
        [this](const std::error_code& ec, asio::ip::tcp::socket socket) {
            if (ec) {
                if (ec == asio::error::operation_aborted) return;
                log_.warn(fmt::format("accept: {}", ec.message()));
            } else {
                std::make_shared<Session>(std::move(socket), service_, log_)->start();
            }
            do_accept_();
        });
}

void AuthorityServer::stop() {
    impl_->ioc.stop();
    wait();
    std::error_code ignored;
    impl_->acceptor.close(ignored);
}

void AuthorityServer::wait() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

} // namespace hashduel::net

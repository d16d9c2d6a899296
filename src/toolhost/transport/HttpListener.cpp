//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpListener.cpp
// Purpose: HTTP/HTTPS listener using Boost.Beast coroutines (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "toolhost/transport/HttpListener.hpp"

namespace toolhost {
namespace transport {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

template <typename StringView>
std::string toStd(const StringView& sv) {
    return std::string(sv.data(), sv.size());
}

std::string lowerCase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string percentDecode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out.push_back(' ');
        } else if (in[i] == '%' && i + 2 < in.size() &&
                   std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(in[i]);
        }
    }
    return out;
}

void splitTarget(HttpRequest& req) {
    const auto q = req.target.find('?');
    req.path = req.target.substr(0, q);
    if (q == std::string::npos) return;
    const std::string query = req.target.substr(q + 1);
    std::size_t pos = 0;
    while (pos <= query.size()) {
        std::size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        const std::string kv = query.substr(pos, amp - pos);
        if (!kv.empty()) {
            const auto eq = kv.find('=');
            const std::string key = percentDecode(kv.substr(0, eq));
            const std::string val = eq == std::string::npos ? std::string() : percentDecode(kv.substr(eq + 1));
            req.query[key] = val;
        }
        pos = amp + 1;
    }
}

} // namespace

class HttpListener::Impl {
public:
    Impl(const HttpListener::Options& o, HttpHandler h) : opts(o), handler(std::move(h)) {}

    ~Impl() {
        shutdown();
    }

    HttpListener::Options opts;
    HttpHandler handler;
    std::function<void(const std::string&)> errorHandler;

    std::mutex lifecycleMutex;
    std::atomic<bool> running{false};
    std::atomic<uint16_t> boundPort{0};
    std::atomic<std::size_t> connections{0};

    std::unique_ptr<net::io_context> ioc;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;

    struct ConnectionGuard {
        std::atomic<std::size_t>& count;
        explicit ConnectionGuard(std::atomic<std::size_t>& c) : count(c) { ++count; }
        ~ConnectionGuard() { --count; }
    };

    void setError(const std::string& msg) {
        if (!running.load()) {
            LOG_DEBUG("{}: suppressed during shutdown: {}", opts.name, msg);
            return;
        }
        LOG_WARN("{}: {}", opts.name, msg);
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void open() {
        ioc = std::make_unique<net::io_context>(1);
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
            sslCtx->use_certificate_chain_file(opts.certFile);
            sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
        }

        tcp::resolver resolver(*ioc);
        auto results = resolver.resolve(opts.address, std::to_string(opts.port));
        const tcp::endpoint ep = results.begin()->endpoint();

        acceptor = std::make_unique<tcp::acceptor>(*ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort = acceptor->local_endpoint().port();
    }

    void shutdown() {
        std::lock_guard<std::mutex> lock(lifecycleMutex);
        running = false;
        if (ioc) {
            ioc->stop();
        }
        if (ioThread.joinable()) {
            ioThread.join();
        }
        acceptor.reset();
        ioc.reset();
        sslCtx.reset();
        boundPort = 0;
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& raw) {
        HttpRequest req;
        req.method = toStd(raw.method_string());
        req.target = toStd(raw.target());
        splitTarget(req);
        for (const auto& field : raw) {
            req.headers[lowerCase(toStd(field.name_string()))] = toStd(field.value());
        }
        req.body = raw.body();

        HttpResponse out;
        try {
            out = handler(req);
        } catch (const std::exception& e) {
            LOG_ERROR("{}: handler failed for {} {}: {}", opts.name, req.method, req.path, e.what());
            out = HttpResponse{};
            out.status = 500;
            out.body = "{\"error\":\"Internal Server Error\"}";
        }

        http::response<http::string_body> res;
        res.version(raw.version());
        res.result(out.status);
        res.keep_alive(false);
        if (!out.contentType.empty()) {
            res.set(http::field::content_type, out.contentType);
        }
        for (const auto& [name, value] : out.headers) {
            res.set(name, value);
        }
        res.body() = std::move(out.body);
        res.prepare_payload();
        if (raw.method() == http::verb::head) {
            const auto length = res.body().size();
            res.body().clear();
            res.content_length(length);
        }
        return res;
    }

    template <typename Stream>
    net::awaitable<void> serveOne(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
        auto res = makeResponse(req);
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    net::awaitable<void> sessionPlain(tcp::socket socket) {
        ConnectionGuard guard(connections);
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            stream.expires_after(std::chrono::seconds(30));
            co_await serveOne(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            setError(std::string("plain session error: ") + e.what());
        }
        co_return;
    }

    net::awaitable<void> sessionTls(tcp::socket socket) {
        ConnectionGuard guard(connections);
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveOne(tls);
            boost::system::error_code ec;
            co_await tls.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        } catch (const std::exception& e) {
            setError(std::string("TLS session error: ") + e.what());
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (sslCtx) {
                    net::co_spawn(*ioc, sessionTls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(*ioc, sessionPlain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            setError(std::string("accept error: ") + e.what());
        }
        co_return;
    }
};

HttpListener::HttpListener(const Options& opts, HttpHandler handler)
    : pImpl(std::make_unique<Impl>(opts, std::move(handler))) {}

HttpListener::~HttpListener() = default;

std::future<void> HttpListener::Start() {
    std::promise<void> ready;
    auto fut = ready.get_future();
    std::lock_guard<std::mutex> lock(pImpl->lifecycleMutex);
    if (pImpl->running) {
        ready.set_value();
        return fut;
    }
    try {
        pImpl->open();
    } catch (const std::exception& e) {
        LOG_ERROR("{}: failed to listen on {}:{}: {}", pImpl->opts.name, pImpl->opts.address, pImpl->opts.port, e.what());
        pImpl->acceptor.reset();
        pImpl->ioc.reset();
        pImpl->sslCtx.reset();
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running = true;
    net::co_spawn(*pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([impl = pImpl.get()]() {
        try {
            impl->ioc->run();
        } catch (const std::exception& e) {
            impl->setError(std::string("I/O loop error: ") + e.what());
        }
    });
    LOG_INFO("{}: listening on {}://{}:{}", pImpl->opts.name, pImpl->opts.scheme, pImpl->opts.address,
             pImpl->boundPort.load());
    ready.set_value();
    return fut;
}

std::future<void> HttpListener::Stop() {
    pImpl->shutdown();
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

bool HttpListener::IsRunning() const {
    return pImpl->running.load();
}

uint16_t HttpListener::BoundPort() const {
    return pImpl->boundPort.load();
}

std::size_t HttpListener::ActiveConnections() const {
    return pImpl->connections.load();
}

void HttpListener::SetErrorHandler(std::function<void(const std::string&)> handler) {
    pImpl->errorHandler = std::move(handler);
}

} // namespace transport
} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: JSON-RPC over HTTP/HTTPS acceptor built on HttpListener
//==========================================================================================================

#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "toolhost/transport/Transport.h"

namespace toolhost {
namespace transport {

//==========================================================================================================
// HTTPServer
// Purpose: Serves JSON-RPC requests posted to a single endpoint.
// Notes:
//   - POST <rpcPath> with a request: 200 and the JSON-RPC response.
//   - POST <rpcPath> with a notification: 202 with an empty body.
//   - Other methods on rpcPath: 405 with "Allow: POST"; other paths: 404.
//==========================================================================================================
class HTTPServer : public ITransportAcceptor {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address.
    //   port: Listen port (0 picks an ephemeral port).
    //   rpcPath: JSON-RPC endpoint path.
    //   scheme: "http" or "https" (TLS 1.3 only for https).
    //   certFile/keyFile: PEM files required when scheme == https.
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        uint16_t port{0};
        std::string rpcPath{"/mcp"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
    };

    explicit HTTPServer(const Options& opts);
    ~HTTPServer() override;

    std::future<void> Start() override;
    std::future<void> Stop() override;

    void SetRequestHandler(RequestHandler handler) override;
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    std::size_t ActiveSessions() const override;

    uint16_t BoundPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace transport
} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpListener.hpp
// Purpose: Coroutine-based HTTP/HTTPS listener using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace toolhost {
namespace transport {

//==========================================================================================================
// HttpRequest
// Fields:
//   method: Upper-case verb ("GET", "HEAD", "POST", ...).
//   target: Raw request target; path and query are split from it.
//   headers: Header names lower-cased.
//==========================================================================================================
struct HttpRequest {
    std::string method;
    std::string target;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    unsigned status{200};
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::string contentType{"application/json"};
};

using HttpHandler = std::function<HttpResponse(const HttpRequest&)>;

//==========================================================================================================
// HttpListener
// Purpose: Accepts connections on a background I/O thread and answers one request per connection
//          through an HttpHandler.
// Notes:
//   - HEAD requests are passed to the handler as HEAD; the listener sends the handler's headers and
//     Content-Length without the body.
//   - Handler exceptions become 500 responses.
//   - The listener can be started again after Stop().
//==========================================================================================================
class HttpListener {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address.
    //   port: Listen port (0 picks an ephemeral port; see BoundPort()).
    //   scheme: "http" or "https" (TLS 1.3 only for https).
    //   certFile/keyFile: PEM files required when scheme == https.
    //   name: Label used in log lines.
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        uint16_t port{0};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::string name{"HttpListener"};
    };

    HttpListener(const Options& opts, HttpHandler handler);
    ~HttpListener();

    HttpListener(const HttpListener&) = delete;
    HttpListener& operator=(const HttpListener&) = delete;

    //==========================================================================================================
    // Binds and listens on the calling thread, then runs the accept loop on a background thread.
    // Returns:
    //   Ready future once listening; exceptional future when TLS setup, resolve or bind fails.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Closes the listener, abandons open connections and joins the I/O thread. Idempotent.
    //==========================================================================================================
    std::future<void> Stop();

    bool IsRunning() const;

    // Port actually bound (useful with port 0); 0 when not listening.
    uint16_t BoundPort() const;

    std::size_t ActiveConnections() const;

    void SetErrorHandler(std::function<void(const std::string&)> handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace transport
} // namespace toolhost

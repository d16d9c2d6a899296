//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.cpp
// Purpose: JSON-RPC over HTTP acceptor implementation
//==========================================================================================================

#include "toolhost/transport/HTTPServer.hpp"
#include "toolhost/transport/HttpListener.hpp"
#include "toolhost/transport/MessageRouter.h"
#include "logging/Logger.h"

namespace toolhost {
namespace transport {

class HTTPServer::Impl {
public:
    explicit Impl(const HTTPServer::Options& o) : opts(o) {
        HttpListener::Options lo;
        lo.address = opts.address;
        lo.port = opts.port;
        lo.scheme = opts.scheme;
        lo.certFile = opts.certFile;
        lo.keyFile = opts.keyFile;
        lo.name = "HTTPServer";
        listener = std::make_unique<HttpListener>(lo, [this](const HttpRequest& req) { return handle(req); });
    }

    HTTPServer::Options opts;
    std::unique_ptr<HttpListener> listener;
    RequestHandler requestHandler;
    NotificationHandler notificationHandler;

    HttpResponse handle(const HttpRequest& req) {
        HttpResponse res;
        if (req.path != opts.rpcPath) {
            res.status = 404;
            res.body = "{\"error\":\"Not found\"}";
            return res;
        }
        if (req.method != "POST") {
            res.status = 405;
            res.headers.emplace_back("Allow", "POST");
            res.body = "{\"error\":\"POST required\"}";
            return res;
        }
        RouteResult routed = RouteMessage(req.body, requestHandler, notificationHandler);
        if (routed.kind == MessageKind::Notification) {
            res.status = 202;
            res.contentType.clear();
            return res;
        }
        res.body = routed.response.value_or("{}");
        return res;
    }
};

HTTPServer::HTTPServer(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    return pImpl->listener->Start();
}

std::future<void> HTTPServer::Stop() {
    return pImpl->listener->Stop();
}

void HTTPServer::SetRequestHandler(RequestHandler handler) {
    pImpl->requestHandler = std::move(handler);
}

void HTTPServer::SetNotificationHandler(NotificationHandler handler) {
    pImpl->notificationHandler = std::move(handler);
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->listener->SetErrorHandler(std::move(handler));
}

std::size_t HTTPServer::ActiveSessions() const {
    return pImpl->listener->ActiveConnections();
}

uint16_t HTTPServer::BoundPort() const {
    return pImpl->listener->BoundPort();
}

} // namespace transport
} // namespace toolhost

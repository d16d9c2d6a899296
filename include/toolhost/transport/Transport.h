//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Server-side transport acceptor interface
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace transport {

//==========================================================================================================
// ITransportAcceptor
// Purpose: Owns the listen lifecycle of one wire transport and dispatches incoming JSON-RPC
//          requests/notifications to registered handlers.
// Notes:
//   - Implementations bind/listen in Start() and tear down in Stop().
//   - Handlers must be registered before Start().
//==========================================================================================================
class ITransportAcceptor {
public:
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    using ErrorHandler = std::function<void(const std::string& error)>;

    virtual ~ITransportAcceptor() = default;

    //==========================================================================================================
    // Starts the acceptor (binds/listens/spawns reader loops as needed).
    // Returns:
    //   Future that completes when the acceptor is serving; exceptional on bind/open failure.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops the acceptor and releases resources. Idempotent.
    // Returns:
    //   Future that completes when the acceptor has stopped.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    //==========================================================================================================
    // Registers the JSON-RPC request handler. Invoked per request, must return a response.
    //==========================================================================================================
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    // Registers the JSON-RPC notification handler (no response expected).
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    // Receives transport errors, including end of input on stream transports.
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    // Connected peers: 1 while a stream transport has an open input, open connections for HTTP.
    virtual std::size_t ActiveSessions() const = 0;
};

} // namespace transport
} // namespace toolhost

//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageRouter.h
// Purpose: Server-side JSON-RPC message classification and dispatch shared by all transports
//========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/transport/Transport.h"

namespace toolhost {
namespace transport {

enum class MessageKind {
    Request,
    Notification,
    Invalid
};

// A document with a string "method" is a request when it carries "id" and a notification otherwise.
MessageKind ClassifyMessage(const JSONValue& doc);

struct RouteResult {
    MessageKind kind{MessageKind::Invalid};
    // Serialized response to send back; empty for notifications.
    std::optional<std::string> response;
};

//==========================================================================================================
// RouteMessage
// Purpose: Parses one JSON-RPC payload and invokes the request or notification handler.
// Returns:
//   RouteResult with the serialized response for requests, ParseError for malformed JSON and
//   InvalidRequest for anything that is neither a request nor a notification.
// Notes:
//   Exceptions escaping a request handler become InternalError responses.
//==========================================================================================================
RouteResult RouteMessage(const std::string& payload,
                         const ITransportAcceptor::RequestHandler& requestHandler,
                         const ITransportAcceptor::NotificationHandler& notificationHandler);

} // namespace transport
} // namespace toolhost

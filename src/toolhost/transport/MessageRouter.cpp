//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageRouter.cpp
// Purpose: JSON-RPC routing implementation
//========================================================================================================

#include "toolhost/transport/MessageRouter.h"
#include "toolhost/JSONHelpers.h"
#include "logging/Logger.h"

namespace toolhost {
namespace transport {

MessageKind ClassifyMessage(const JSONValue& doc) {
    if (!doc.IsObject()) return MessageKind::Invalid;
    const JSONValue* method = json::Find(doc, "method");
    if (method == nullptr || !method->IsString()) return MessageKind::Invalid;
    return json::Has(doc, "id") ? MessageKind::Request : MessageKind::Notification;
}

RouteResult RouteMessage(const std::string& payload,
                         const ITransportAcceptor::RequestHandler& requestHandler,
                         const ITransportAcceptor::NotificationHandler& notificationHandler) {
    RouteResult out;
    JSONValue doc;
    try {
        doc = ParseJSON(payload);
    } catch (const std::exception& e) {
        LOG_WARN("Malformed JSON-RPC payload: {}", e.what());
        out.response = CreateErrorResponse(JSONRPCId{nullptr}, JSONRPCErrorCodes::ParseError, "Parse error")->Serialize();
        return out;
    }

    out.kind = ClassifyMessage(doc);
    switch (out.kind) {
        case MessageKind::Notification: {
            auto note = std::make_unique<JSONRPCNotification>();
            if (note->DeserializeValue(doc) && notificationHandler) {
                notificationHandler(std::move(note));
            }
            return out;
        }
        case MessageKind::Request: {
            JSONRPCRequest req;
            if (!req.DeserializeValue(doc)) {
                out.kind = MessageKind::Invalid;
                out.response = CreateErrorResponse(JSONRPCId{nullptr}, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize();
                return out;
            }
            std::unique_ptr<JSONRPCResponse> resp;
            try {
                if (requestHandler) {
                    resp = requestHandler(req);
                }
            } catch (const std::exception& e) {
                LOG_ERROR("Request handler for {} threw: {}", req.method, e.what());
                resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
            }
            if (!resp) {
                resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "No response produced");
            }
            out.response = resp->Serialize();
            return out;
        }
        case MessageKind::Invalid:
            break;
    }
    out.response = CreateErrorResponse(JSONRPCId{nullptr}, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize();
    return out;
}

} // namespace transport
} // namespace toolhost

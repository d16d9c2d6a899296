//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Message framing for stream transports (Content-Length headers or newline-delimited JSON)
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace toolhost {
namespace transport {

//==========================================================================================================
// IContentFramer
// Purpose: Splits a byte stream into JSON-RPC documents and wraps outgoing documents for the wire.
// Methods:
//   encode(payload): Returns the framed bytes for one document.
//   tryDecode(buffer): Removes and returns the next complete document, or nullopt when more input is
//                      needed. Malformed frames are dropped from the buffer.
//   tryDecodeEx(buffer): Inspects the buffer without modifying it and reports how many bytes the
//                        caller should drop.
//==========================================================================================================
class IContentFramer {
public:
    enum class DecodeStatus { Ok, Incomplete, InvalidHeader, BodyTooLarge };

    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // set only for Ok
        std::size_t bytesConsumed{0};
    };

    virtual ~IContentFramer() = default;

    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

// "Content-Length: N\r\n\r\n" + body. Bodies above maxContentLength are rejected.
std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 1024 * 1024);

// One JSON document per line. Blank lines are skipped; "\r\n" line ends are accepted.
std::unique_ptr<IContentFramer> MakeLineFramer(std::size_t maxLineLength = 1024 * 1024);

} // namespace transport
} // namespace toolhost

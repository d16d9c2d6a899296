//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.cpp
// Purpose: Content-Length and newline-delimited framers for the stdio transport
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "toolhost/transport/ContentFramer.h"

namespace toolhost {
namespace transport {

namespace {

std::string lowerCase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trimLeft(std::string s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch){ return !std::isspace(ch); }));
    return s;
}

// Shared buffer-consuming decode on top of tryDecodeEx.
std::optional<std::string> consumeFrame(IContentFramer& framer, std::string& buffer) {
    IContentFramer::DecodeResult r = framer.tryDecodeEx(buffer);
    if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
        buffer.erase(0, r.bytesConsumed);
    }
    if (r.status == IContentFramer::DecodeStatus::Ok) {
        return r.payload;
    }
    return std::nullopt;
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::string sep = "\r\n\r\n";
        const std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sep.size();

        std::optional<std::size_t> contentLength;
        std::size_t pos = 0;
        while (pos < headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            const std::string line = buffer.substr(pos, eol - pos);
            const auto colon = line.find(':');
            if (colon != std::string::npos && lowerCase(line.substr(0, colon)) == "content-length") {
                const std::string value = trimLeft(line.substr(colon + 1));
                unsigned long long v64 = 0;
                try {
                    std::size_t used = 0;
                    v64 = std::stoull(value, &used);
                    if (used == 0) throw std::invalid_argument(value);
                } catch (const std::logic_error&) {
                    LOG_WARN("Invalid Content-Length header: {}", value);
                    return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
                }
                if (v64 > maxContentLength) {
                    LOG_WARN("Content-Length {} exceeds limit {}", v64, maxContentLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
                }
                contentLength = static_cast<std::size_t>(v64);
            }
            pos = eol + 2;
        }

        if (!contentLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        const std::size_t frameTotal = headerAndSep + *contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        return { DecodeStatus::Ok, buffer.substr(headerAndSep, *contentLength), frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        return consumeFrame(*this, buffer);
    }

private:
    std::size_t maxContentLength;
};

class LineFramer : public IContentFramer {
public:
    explicit LineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        return payload + "\n";
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t start = 0;
        while (true) {
            const std::size_t nl = buffer.find('\n', start);
            if (nl == std::string::npos) {
                if (buffer.size() - start > maxLineLength) {
                    LOG_WARN("Unterminated line exceeds limit {}", maxLineLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
                }
                // Leading blank lines are dropped even when no full frame is available yet.
                return { DecodeStatus::Incomplete, std::nullopt, start };
            }
            std::size_t end = nl;
            if (end > start && buffer[end - 1] == '\r') --end;
            const bool blank = std::all_of(buffer.begin() + static_cast<std::ptrdiff_t>(start),
                                           buffer.begin() + static_cast<std::ptrdiff_t>(end),
                                           [](unsigned char c) { return std::isspace(c) != 0; });
            if (blank) {
                start = nl + 1;
                continue;
            }
            if (end - start > maxLineLength) {
                LOG_WARN("Line of {} bytes exceeds limit {}", end - start, maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, nl + 1 };
            }
            return { DecodeStatus::Ok, buffer.substr(start, end - start), nl + 1 };
        }
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        return consumeFrame(*this, buffer);
    }

private:
    std::size_t maxLineLength;
};

} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

std::unique_ptr<IContentFramer> MakeLineFramer(std::size_t maxLineLength) {
    return std::make_unique<LineFramer>(maxLineLength);
}

} // namespace transport
} // namespace toolhost

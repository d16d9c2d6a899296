//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: JSON-RPC acceptor over a pair of file descriptors (stdin/stdout by default)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <future>
#include <memory>

#include <unistd.h>

#include "toolhost/ServerConfig.h"
#include "toolhost/transport/Transport.h"

namespace toolhost {
namespace transport {

//==========================================================================================================
// StdioTransport
// Purpose: Reads framed JSON-RPC messages from an input descriptor and writes responses to an output
//          descriptor. Each request is served on its own worker thread; writes are serialized.
// Notes:
//   - End of input and read failures are reported through the error handler; the reader then exits.
//   - Malformed JSON is answered with a ParseError response (id null).
//==========================================================================================================
class StdioTransport : public ITransportAcceptor {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   inputFd/outputFd: Descriptors to read requests from and write responses to (not closed on Stop).
    //   framing: ndjson (one document per line) or content-length headers.
    //   maxMessageSize: Upper bound for one frame; larger frames are dropped with a warning.
    //==========================================================================================================
    struct Options {
        int inputFd{STDIN_FILENO};
        int outputFd{STDOUT_FILENO};
        StdioFraming framing{StdioFraming::Ndjson};
        std::size_t maxMessageSize{1024 * 1024};
    };

    StdioTransport();
    explicit StdioTransport(const Options& opts);
    ~StdioTransport() override;

    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the reader and waits for in-flight requests to finish writing their responses.
    //==========================================================================================================
    std::future<void> Stop() override;

    void SetRequestHandler(RequestHandler handler) override;
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    std::size_t ActiveSessions() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace transport
} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based acceptor implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <cstring>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "toolhost/transport/ContentFramer.h"
#include "toolhost/transport/MessageRouter.h"
#include "toolhost/transport/StdioTransport.hpp"

namespace toolhost {
namespace transport {

class StdioTransport::Impl {
public:
    explicit Impl(const Options& o) : opts(o) {
        if (opts.framing == StdioFraming::ContentLength) {
            framer = MakeContentLengthFramer(opts.maxMessageSize);
        } else {
            framer = MakeLineFramer(opts.maxMessageSize);
        }
    }

    ~Impl() {
        shutdown();
    }

    Options opts;
    std::unique_ptr<IContentFramer> framer;
    RequestHandler requestHandler;
    NotificationHandler notificationHandler;
    ErrorHandler errorHandler;

    std::atomic<bool> running{false};
    std::atomic<bool> inputOpen{false};
    int wakeEventFd{-1};
    std::thread readerThread;

    std::mutex writeMutex;

    // In-flight request workers; Stop() waits for them to drain.
    std::mutex workersMutex;
    std::condition_variable workersCv;
    std::size_t workersInFlight{0};

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void wake() {
        if (wakeEventFd < 0) return;
        uint64_t one = 1;
        ssize_t wr;
        do {
            wr = ::write(wakeEventFd, &one, sizeof(one));
        } while (wr < 0 && errno == EINTR);
        if (wr < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    void writeFrame(const std::string& payload) {
        const std::string frame = framer->encode(payload);
        std::lock_guard<std::mutex> lock(writeMutex);
        std::size_t off = 0;
        while (off < frame.size()) {
            ssize_t n = ::write(opts.outputFd, frame.data() + off, frame.size() - off);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    pollfd pfd{opts.outputFd, POLLOUT, 0};
                    (void)::poll(&pfd, 1, 100);
                    continue;
                }
                LOG_ERROR("StdioTransport: write failed (errno={} msg={})", errno, ::strerror(errno));
                return;
            }
            off += static_cast<std::size_t>(n);
        }
    }

    void dispatch(std::string payload) {
        {
            std::lock_guard<std::mutex> lock(workersMutex);
            ++workersInFlight;
        }
        std::thread([this, payload = std::move(payload)]() {
            RouteResult r = RouteMessage(payload, requestHandler, notificationHandler);
            if (r.response) {
                writeFrame(*r.response);
            }
            std::lock_guard<std::mutex> lock(workersMutex);
            --workersInFlight;
            workersCv.notify_all();
        }).detach();
    }

    void drainFrames(std::string& buffer) {
        while (!buffer.empty()) {
            IContentFramer::DecodeResult r = framer->tryDecodeEx(buffer);
            if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
                buffer.erase(0, r.bytesConsumed);
            }
            if (r.status == IContentFramer::DecodeStatus::Ok) {
                dispatch(std::move(*r.payload));
                continue;
            }
            if (r.status == IContentFramer::DecodeStatus::Incomplete) {
                return;
            }
            LOG_WARN("StdioTransport: dropped malformed frame ({})",
                     r.status == IContentFramer::DecodeStatus::BodyTooLarge ? "body too large" : "invalid header");
            if (r.bytesConsumed == 0) {
                buffer.clear();
            }
        }
    }

    void readerLoop() {
        std::string buffer;
        std::vector<char> tmp(4096);
        while (running) {
            pollfd fds[2];
            fds[0] = pollfd{opts.inputFd, POLLIN, 0};
            fds[1] = pollfd{wakeEventFd, POLLIN, 0};
            int rc = ::poll(fds, 2, 100);
            if (rc < 0) {
                if (errno == EINTR) continue;
                LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioTransport: poll failed");
                break;
            }
            if (rc == 0) continue;
            if ((fds[1].revents & POLLIN) != 0) break;
            if ((fds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

            ssize_t n = ::read(opts.inputFd, tmp.data(), tmp.size());
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                LOG_ERROR("StdioTransport: read failed (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioTransport: read failed");
                break;
            }
            if (n == 0) {
                // A final ndjson document may lack its trailing newline.
                if (opts.framing == StdioFraming::Ndjson && !buffer.empty()) {
                    buffer.push_back('\n');
                    drainFrames(buffer);
                }
                LOG_INFO("StdioTransport: EOF on input");
                inputOpen = false;
                reportError("StdioTransport: EOF on input");
                break;
            }
            buffer.append(tmp.data(), static_cast<std::size_t>(n));
            drainFrames(buffer);
        }
        inputOpen = false;
    }

    void shutdown() {
        const bool wasRunning = running.exchange(false);
        if (wasRunning) {
            wake();
        }
        if (readerThread.joinable()) {
            if (readerThread.get_id() == std::this_thread::get_id()) {
                readerThread.detach();
            } else {
                readerThread.join();
            }
        }
        {
            std::unique_lock<std::mutex> lock(workersMutex);
            workersCv.wait(lock, [this]() { return workersInFlight == 0; });
        }
        if (wakeEventFd >= 0) {
            ::close(wakeEventFd);
            wakeEventFd = -1;
        }
    }
};

StdioTransport::StdioTransport() : StdioTransport(Options{}) {}

StdioTransport::StdioTransport(const Options& opts) : pImpl(std::make_unique<Impl>(opts)) {}

StdioTransport::~StdioTransport() = default;

std::future<void> StdioTransport::Start() {
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->running) {
        ready.set_value();
        return fut;
    }
    pImpl->wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (pImpl->wakeEventFd < 0) {
        LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        ready.set_exception(std::make_exception_ptr(
            std::runtime_error(std::string("StdioTransport: eventfd failed: ") + ::strerror(errno))));
        return fut;
    }
    int flags = ::fcntl(pImpl->opts.inputFd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(pImpl->opts.inputFd, F_SETFL, flags | O_NONBLOCK);
    }
    pImpl->running = true;
    pImpl->inputOpen = true;
    pImpl->readerThread = std::thread([this]() { pImpl->readerLoop(); });
    LOG_INFO("StdioTransport: started (framing={})", toString(pImpl->opts.framing));
    ready.set_value();
    return fut;
}

std::future<void> StdioTransport::Stop() {
    pImpl->shutdown();
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

void StdioTransport::SetRequestHandler(RequestHandler handler) {
    pImpl->requestHandler = std::move(handler);
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) {
    pImpl->notificationHandler = std::move(handler);
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

std::size_t StdioTransport::ActiveSessions() const {
    return pImpl->inputOpen ? 1 : 0;
}

} // namespace transport
} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_transports.cpp
// Purpose: GoogleTests for the HTTP and stdio JSON-RPC acceptors
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

#include <poll.h>
#include <unistd.h>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "toolhost/JSONHelpers.h"
#include "toolhost/transport/HTTPServer.hpp"
#include "toolhost/transport/StdioTransport.hpp"

using namespace toolhost;
using namespace toolhost::transport;
using namespace std::chrono_literals;
namespace http = boost::beast::http;

namespace {

std::unique_ptr<JSONRPCResponse> echoHandler(const JSONRPCRequest& req) {
    return std::make_unique<JSONRPCResponse>(req.id, json::ObjectBuilder().Set("method", req.method).Build());
}

//==========================================================================================================
// httpRequest
// Purpose: Sends one HTTP request and reads the response synchronously.
//==========================================================================================================
http::response<http::string_body> httpRequest(unsigned short port, http::verb verb, const std::string& target,
                                              const std::string& body) {
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    tcp::socket socket{ioc};
    boost::asio::connect(socket, resolver.resolve("127.0.0.1", std::to_string(port)));

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "application/json");
    req.body() = body;
    req.prepare_payload();
    http::write(socket, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

// Pipe pair feeding a StdioTransport; the test writes requests and reads responses.
struct StdioPipes {
    int toServer[2]{-1, -1};
    int fromServer[2]{-1, -1};

    StdioPipes() {
        EXPECT_EQ(::pipe(toServer), 0);
        EXPECT_EQ(::pipe(fromServer), 0);
    }
    ~StdioPipes() {
        for (int fd : {toServer[0], toServer[1], fromServer[0], fromServer[1]}) {
            if (fd >= 0) ::close(fd);
        }
    }

    void send(const std::string& data) const {
        ASSERT_EQ(::write(toServer[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    }

    void closeInput() {
        ::close(toServer[1]);
        toServer[1] = -1;
    }

    // Reads until at least `lines` newline characters arrived or the timeout elapses.
    std::string readLines(int lines, std::chrono::milliseconds timeout) const {
        std::string out;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::count(out.begin(), out.end(), '\n') < lines && std::chrono::steady_clock::now() < deadline) {
            pollfd pfd{fromServer[0], POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            char buf[1024];
            ssize_t n = ::read(fromServer[0], buf, sizeof(buf));
            if (n <= 0) break;
            out.append(buf, static_cast<std::size_t>(n));
        }
        return out;
    }
};

} // namespace

TEST(HTTPServerTest, ServesJsonRpcOverPost) {
    HTTPServer server(HTTPServer::Options{});
    server.SetRequestHandler(echoHandler);
    std::atomic<int> notifications{0};
    server.SetNotificationHandler([&notifications](std::unique_ptr<JSONRPCNotification>) { ++notifications; });
    server.Start().get();
    const uint16_t port = server.BoundPort();
    ASSERT_NE(port, 0);

    auto res = httpRequest(port, http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(res.result_int(), 200u);
    JSONValue doc = ParseJSON(res.body());
    EXPECT_EQ(json::GetInt(doc, "id").value_or(0), 1);
    const JSONValue* result = json::Find(doc, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(json::GetString(*result, "method").value_or(""), "ping");

    auto accepted = httpRequest(port, http::verb::post, "/mcp",
                                R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    EXPECT_EQ(accepted.result_int(), 202u);
    EXPECT_TRUE(accepted.body().empty());
    EXPECT_EQ(notifications.load(), 1);

    auto malformed = httpRequest(port, http::verb::post, "/mcp", "{oops");
    EXPECT_EQ(malformed.result_int(), 200u);
    const JSONValue malformedDoc = ParseJSON(malformed.body());
    const JSONValue* err = json::Find(malformedDoc, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(json::GetInt(*err, "code").value_or(0), JSONRPCErrorCodes::ParseError);

    server.Stop().get();
}

TEST(HTTPServerTest, RejectsOtherMethodsAndPaths) {
    HTTPServer server(HTTPServer::Options{});
    server.SetRequestHandler(echoHandler);
    server.Start().get();
    const uint16_t port = server.BoundPort();

    auto wrongMethod = httpRequest(port, http::verb::get, "/mcp", "");
    EXPECT_EQ(wrongMethod.result_int(), 405u);
    EXPECT_EQ(std::string(wrongMethod[http::field::allow]), "POST");

    auto wrongPath = httpRequest(port, http::verb::post, "/elsewhere", "{}");
    EXPECT_EQ(wrongPath.result_int(), 404u);

    server.Stop().get();
    // Idempotent.
    server.Stop().get();
}

TEST(HTTPServerTest, BindFailureIsExceptionalFuture) {
    HTTPServer first(HTTPServer::Options{});
    first.Start().get();

    HTTPServer::Options taken;
    taken.port = first.BoundPort();
    HTTPServer second(taken);
    EXPECT_THROW(second.Start().get(), std::exception);
    first.Stop().get();
}

TEST(StdioTransportTest, AnswersNdjsonRequests) {
    StdioPipes pipes;
    StdioTransport::Options o;
    o.inputFd = pipes.toServer[0];
    o.outputFd = pipes.fromServer[1];
    StdioTransport t(o);
    t.SetRequestHandler(echoHandler);
    t.Start().get();
    EXPECT_EQ(t.ActiveSessions(), 1u);

    pipes.send("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n{not json}\n");
    const std::string out = pipes.readLines(2, 3000ms);
    EXPECT_NE(out.find("\"method\":\"ping\""), std::string::npos);
    EXPECT_NE(out.find("-32700"), std::string::npos);

    t.Stop().get();
}

TEST(StdioTransportTest, ContentLengthFraming) {
    StdioPipes pipes;
    StdioTransport::Options o;
    o.inputFd = pipes.toServer[0];
    o.outputFd = pipes.fromServer[1];
    o.framing = StdioFraming::ContentLength;
    StdioTransport t(o);
    t.SetRequestHandler(echoHandler);
    t.Start().get();

    const std::string body = R"({"jsonrpc":"2.0","id":"a","method":"tools/list"})";
    pipes.send("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
    const std::string out = pipes.readLines(2, 3000ms);
    EXPECT_EQ(out.rfind("Content-Length: ", 0), 0u);
    EXPECT_NE(out.find("tools/list"), std::string::npos);

    t.Stop().get();
}

TEST(StdioTransportTest, EndOfInputIsReported) {
    StdioPipes pipes;
    StdioTransport::Options o;
    o.inputFd = pipes.toServer[0];
    o.outputFd = pipes.fromServer[1];
    StdioTransport t(o);
    t.SetRequestHandler(echoHandler);

    std::mutex m;
    std::string error;
    t.SetErrorHandler([&](const std::string& msg) {
        std::lock_guard<std::mutex> lock(m);
        error = msg;
    });
    t.Start().get();

    // The last document has no trailing newline.
    pipes.send("{\"jsonrpc\":\"2.0\",\"id\":5,\"method\":\"last\"}");
    pipes.closeInput();
    const std::string out = pipes.readLines(1, 3000ms);
    EXPECT_NE(out.find("\"last\""), std::string::npos);

    for (int i = 0; i < 100; ++i) {
        {
            std::lock_guard<std::mutex> lock(m);
            if (!error.empty()) break;
        }
        std::this_thread::sleep_for(10ms);
    }
    {
        std::lock_guard<std::mutex> lock(m);
        EXPECT_NE(error.find("EOF"), std::string::npos);
    }
    EXPECT_EQ(t.ActiveSessions(), 0u);
    t.Stop().get();
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_sse.cpp
// Purpose: GoogleTests for the HTTP/SSE transport (streams, POST request/batch, admin routes)
//==========================================================================================================

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "memgate/HTTPServer.hpp"
#include "memgate/MethodRouter.h"

using namespace memgate;
using namespace std::chrono;
namespace net = boost::asio;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

//==========================================================================================================
// httpCall
// Purpose: Send a single HTTP request and capture the response (synchronously).
//==========================================================================================================
static http::response<http::string_body> httpCall(unsigned short port, http::verb verb, const std::string& target,
                                                  const std::string& body = std::string()) {
    net::io_context ioc;
    tcp::resolver resolver{ioc};
    auto r = resolver.resolve("127.0.0.1", std::to_string(port));
    tcp::socket socket{ioc};
    net::connect(socket, r);

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    if (!body.empty()) {
        req.set(http::field::content_type, "application/json");
    }
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

static http::response<http::string_body> httpPost(unsigned short port, const std::string& target, const std::string& body) {
    return httpCall(port, http::verb::post, target, body);
}

//==========================================================================================================
// SseClient
// Purpose: Raw-socket SSE reader. Every read is bounded by a deadline so a broken stream fails the test
//          instead of hanging it.
//==========================================================================================================
class SseClient {
public:
    SseClient(unsigned short port, const std::string& target) : sock(ioc) {
        sock.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
        const std::string req = "GET " + target + " HTTP/1.1\r\nHost: 127.0.0.1\r\nAccept: text/event-stream\r\n\r\n";
        net::write(sock, net::buffer(req));
    }

    bool WaitUntil(const std::function<bool(const SseClient&)>& pred, milliseconds timeout) {
        const auto deadline = steady_clock::now() + timeout;
        while (!pred(*this)) {
            if (eof || steady_clock::now() >= deadline) {
                return pred(*this);
            }
            readSome(deadline);
        }
        return true;
    }

    bool WaitFor(const std::string& needle, milliseconds timeout = milliseconds(3000)) {
        return WaitUntil([&needle](const SseClient& c) { return c.Raw().find(needle) != std::string::npos; }, timeout);
    }

    bool WaitForCount(const std::string& needle, std::size_t n, milliseconds timeout) {
        return WaitUntil([&](const SseClient& c) { return c.Count(needle) >= n; }, timeout);
    }

    // True once the server has closed the connection.
    bool WaitClosed(milliseconds timeout = milliseconds(3000)) {
        const auto deadline = steady_clock::now() + timeout;
        while (!eof && steady_clock::now() < deadline) {
            readSome(deadline);
        }
        return eof;
    }

    std::size_t Count(const std::string& needle) const {
        std::size_t n = 0;
        for (auto pos = data.find(needle); pos != std::string::npos; pos = data.find(needle, pos + needle.size())) {
            ++n;
        }
        return n;
    }

    const std::string& Raw() const { return data; }

    std::optional<std::string> Header(const std::string& name) const {
        const auto end = data.find("\r\n\r\n");
        const auto pos = data.find("\r\n" + name + ": ");
        if (end == std::string::npos || pos == std::string::npos || pos > end) {
            return std::nullopt;
        }
        const auto start = pos + name.size() + 4;
        return data.substr(start, data.find("\r\n", start) - start);
    }

    // JSON payloads of every complete "data:" frame received so far.
    std::vector<JSONValue> Events() const {
        std::vector<JSONValue> out;
        const auto headerEnd = data.find("\r\n\r\n");
        if (headerEnd == std::string::npos) return out;
        std::size_t pos = headerEnd + 4;
        for (auto end = data.find("\n\n", pos); end != std::string::npos; end = data.find("\n\n", pos)) {
            const std::string frame = data.substr(pos, end - pos);
            const auto d = frame.find("data: ");
            if (d != std::string::npos) {
                out.push_back(ParseJSON(frame.substr(d + 6)));
            }
            pos = end + 2;
        }
        return out;
    }

    bool HasResponseWithId(int64_t id) const {
        for (const auto& e : Events()) {
            if (GetIntMember(e, "id") == std::optional<int64_t>(id) && FindMember(e, "method") == nullptr) {
                return true;
            }
        }
        return false;
    }

    void Close() {
        boost::system::error_code ec;
        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }

private:
    void readSome(steady_clock::time_point deadline) {
        std::array<char, 4096> chunk{};
        boost::system::error_code ec;
        std::size_t n = 0;
        bool done = false;
        sock.async_read_some(net::buffer(chunk), [&](const boost::system::error_code& e, std::size_t len) {
            ec = e;
            n = len;
            done = true;
        });
        ioc.restart();
        ioc.run_until(deadline);
        if (!done) {
            boost::system::error_code ignored;
            sock.cancel(ignored);
            ioc.restart();
            ioc.run();
        }
        data.append(chunk.data(), n);
        if (ec && ec != net::error::operation_aborted) {
            eof = true;
        }
    }

    net::io_context ioc;
    tcp::socket sock;
    std::string data;
    bool eof{false};
};

static bool eventually(const std::function<bool()>& pred, milliseconds timeout = milliseconds(3000)) {
    const auto deadline = steady_clock::now() + timeout;
    while (steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(10));
    }
    return pred();
}

static int errorCodeOf(const JSONValue& v) {
    const JSONValue* e = FindMember(v, "error");
    return e ? static_cast<int>(GetIntMember(*e, "code").value_or(0)) : 0;
}

class HttpSseTest : public ::testing::Test {
protected:
    SessionRegistry sessions;
    InMemoryMemoryService memory;
    MemoryToolExecutor tools{memory};
    NotificationPump pump{sessions};
    MethodRouter router{sessions, tools, memory, pump, Implementation("memgate", "test")};
    std::unique_ptr<HTTPServer> server;
    unsigned short port{0};

    void StartServer(std::uint64_t heartbeatMs = 30000, bool namedEvents = false) {
        HTTPServer::Options opts;
        opts.port = "0";
        opts.heartbeatIntervalMs = heartbeatMs;
        opts.namedEvents = namedEvents;
        server = std::make_unique<HTTPServer>(opts, router, sessions, pump);
        ASSERT_NO_THROW({ server->Start().get(); });
        port = server->LocalPort();
        ASSERT_NE(port, 0);
    }

    void TearDown() override {
        if (server) {
            server->Stop().get();
        }
    }
};

const char* kPing = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

} // namespace

//==========================================================================================================
// Streams
//==========================================================================================================
TEST_F(HttpSseTest, StreamOpensWithSessionConnected) {
    StartServer();
    SseClient client(port, "/stream/abc");
    ASSERT_TRUE(client.WaitUntil([](const SseClient& c) { return !c.Events().empty(); }, milliseconds(3000)));
    EXPECT_NE(client.Raw().find("HTTP/1.1 200"), std::string::npos);
    EXPECT_EQ(client.Header("Content-Type").value_or(""), "text/event-stream");
    EXPECT_EQ(client.Header("X-Session-Id").value_or(""), "abc");

    auto events = client.Events();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(GetStringMember(events[0], "method").value_or(""), "session.connected");
    EXPECT_EQ(GetStringMember(*FindMember(events[0], "params"), "session_id").value_or(""), "abc");

    auto s = sessions.Get("abc");
    ASSERT_TRUE(s.has_value());
    EXPECT_TRUE(s->streamAttached);
    EXPECT_FALSE(s->IsInitialized());
}

TEST_F(HttpSseTest, StreamWithoutIdGetsGeneratedSession) {
    StartServer();
    SseClient client(port, "/stream");
    ASSERT_TRUE(client.WaitFor("session.connected"));
    const auto sid = client.Header("X-Session-Id");
    ASSERT_TRUE(sid.has_value());
    EXPECT_EQ(sid->size(), 36u);
    EXPECT_TRUE(sessions.Contains(*sid));
}

TEST_F(HttpSseTest, HeartbeatsKeepStreamOpen) {
    StartServer(100);
    SseClient client(port, "/stream/hb");
    ASSERT_TRUE(client.WaitFor("session.connected"));
    EXPECT_TRUE(client.WaitForCount("session.heartbeat", 2, milliseconds(3000)));
    EXPECT_TRUE(sessions.Contains("hb"));
    EXPECT_EQ(client.Count("session.disconnected"), 0u);
}

TEST_F(HttpSseTest, NamedEventsAddEventLines) {
    StartServer(30000, true);
    SseClient client(port, "/stream/named");
    ASSERT_TRUE(client.WaitFor("session.connected"));
    EXPECT_NE(client.Raw().find("event: session.connected\ndata: "), std::string::npos);

    httpPost(port, "/request/named", kPing);
    EXPECT_TRUE(client.WaitFor("event: message\ndata: "));
}

TEST_F(HttpSseTest, ClientDisconnectRemovesSession) {
    StartServer();
    {
        SseClient client(port, "/stream/gone");
        ASSERT_TRUE(client.WaitFor("session.connected"));
        ASSERT_TRUE(sessions.Contains("gone"));
        client.Close();
    }
    EXPECT_TRUE(eventually([&] { return !sessions.Contains("gone"); }));
}

TEST_F(HttpSseTest, ReconnectResetsSessionAndEndsOldStream) {
    StartServer();
    SseClient first(port, "/stream/dup");
    ASSERT_TRUE(first.WaitFor("session.connected"));
    ASSERT_EQ(httpPost(port, "/request/dup", R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})").result(),
              http::status::ok);
    ASSERT_TRUE(sessions.Get("dup")->IsInitialized());

    SseClient second(port, "/stream/dup");
    ASSERT_TRUE(second.WaitFor("session.connected"));
    EXPECT_TRUE(first.WaitClosed());

    auto s = sessions.Get("dup");
    ASSERT_TRUE(s.has_value());
    EXPECT_FALSE(s->IsInitialized());
    EXPECT_TRUE(s->streamAttached);

    // The surviving stream still receives mirrored responses
    httpPost(port, "/request/dup", kPing);
    EXPECT_TRUE(second.WaitUntil([](const SseClient& c) { return c.HasResponseWithId(1); }, milliseconds(3000)));
}

TEST_F(HttpSseTest, IdleReaperEndsAttachedStream) {
    StartServer();
    SseClient client(port, "/stream/idle");
    ASSERT_TRUE(client.WaitFor("session.connected"));
    std::this_thread::sleep_for(milliseconds(80));

    auto reaped = sessions.ReapIdle(milliseconds(50));
    ASSERT_EQ(reaped, (std::vector<std::string>{"idle"}));
    EXPECT_TRUE(client.WaitFor("session.disconnected"));
    EXPECT_TRUE(client.WaitClosed());
    EXPECT_FALSE(sessions.Contains("idle"));
}

TEST_F(HttpSseTest, StopClosesLiveStreamSessions) {
    StartServer();
    SseClient client(port, "/stream/live");
    ASSERT_TRUE(client.WaitFor("session.connected"));
    server->Stop().get();
    EXPECT_FALSE(sessions.Contains("live"));
}

//==========================================================================================================
// POST /request
//==========================================================================================================
TEST_F(HttpSseTest, PostRequestIsAnsweredAndMirrored) {
    StartServer();
    SseClient client(port, "/stream/s1");
    ASSERT_TRUE(client.WaitFor("session.connected"));

    auto res = httpPost(port, "/request/s1",
                        R"({"jsonrpc":"2.0","id":7,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})");
    ASSERT_EQ(res.result(), http::status::ok);
    JSONRPCResponse resp;
    ASSERT_TRUE(resp.Deserialize(res.body()));
    EXPECT_EQ(std::get<int64_t>(resp.id), 7);
    ASSERT_FALSE(resp.IsError());
    EXPECT_EQ(GetStringMember(*resp.result, "protocolVersion").value_or(""), "2024-11-05");

    EXPECT_TRUE(client.WaitUntil([](const SseClient& c) { return c.HasResponseWithId(7); }, milliseconds(3000)));
    EXPECT_TRUE(sessions.Get("s1")->IsInitialized());
}

TEST_F(HttpSseTest, UnknownSessionIs404SessionNotFound) {
    StartServer();
    auto res = httpPost(port, "/request/ghost", kPing);
    EXPECT_EQ(res.result(), http::status::not_found);
    JSONValue body = ParseJSON(res.body());
    EXPECT_EQ(errorCodeOf(body), JSONRPCErrorCodes::SessionNotFound);
    EXPECT_EQ(GetIntMember(body, "id").value_or(0), 1);
    const JSONValue* data = FindMember(*FindMember(body, "error"), "data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(GetStringMember(*data, "session_id").value_or(""), "ghost");
}

TEST_F(HttpSseTest, ClientResponseToUnknownSessionIs404) {
    StartServer();
    const char* reply = R"({"jsonrpc":"2.0","id":4,"result":{}})";
    auto res = httpPost(port, "/request/ghost", reply);
    EXPECT_EQ(res.result(), http::status::not_found);
    JSONValue body = ParseJSON(res.body());
    EXPECT_EQ(errorCodeOf(body), JSONRPCErrorCodes::SessionNotFound);
    EXPECT_EQ(GetIntMember(body, "id").value_or(0), 4);

    SseClient client(port, "/stream/known");
    ASSERT_TRUE(client.WaitFor("session.connected"));
    auto ok = httpPost(port, "/request/known", reply);
    EXPECT_EQ(ok.result(), http::status::accepted);
    EXPECT_TRUE(ok.body().empty());
}

TEST_F(HttpSseTest, UnknownMethodIsMethodNotFoundAndMirrored) {
    StartServer();
    SseClient client(port, "/stream/s1");
    ASSERT_TRUE(client.WaitFor("session.connected"));
    auto res = httpPost(port, "/request/s1", R"({"jsonrpc":"2.0","id":3,"method":"foo/bar"})");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(errorCodeOf(ParseJSON(res.body())), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_TRUE(client.WaitUntil([](const SseClient& c) { return c.HasResponseWithId(3); }, milliseconds(3000)));
}

TEST_F(HttpSseTest, MalformedBodyIs400ParseError) {
    StartServer();
    SseClient client(port, "/stream/s1");
    ASSERT_TRUE(client.WaitFor("session.connected"));
    auto res = httpPost(port, "/request/s1", "{\"jsonrpc\":");
    EXPECT_EQ(res.result(), http::status::bad_request);
    JSONValue body = ParseJSON(res.body());
    EXPECT_EQ(errorCodeOf(body), JSONRPCErrorCodes::ParseError);
    EXPECT_TRUE(FindMember(body, "id")->IsNull());
}

TEST_F(HttpSseTest, NotificationIsAccepted) {
    StartServer();
    SseClient client(port, "/stream/s1");
    ASSERT_TRUE(client.WaitFor("session.connected"));
    auto res = httpPost(port, "/request/s1", R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    EXPECT_EQ(res.result(), http::status::accepted);
    EXPECT_TRUE(res.body().empty());
}

TEST_F(HttpSseTest, ToolSideEffectsReachTheStream) {
    StartServer();
    SseClient client(port, "/stream/s1");
    ASSERT_TRUE(client.WaitFor("session.connected"));
    auto res = httpPost(port, "/request/s1",
                        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"memory_create","arguments":{"content":"hello [[World]]"}}})");
    ASSERT_EQ(res.result(), http::status::ok);
    EXPECT_TRUE(client.WaitFor("memory.created"));
    EXPECT_EQ(memory.List("default", 0, 10).size(), 1u);
}

//==========================================================================================================
// POST /batch
//==========================================================================================================
TEST_F(HttpSseTest, BatchAnswersEveryEntryInOrder) {
    StartServer();
    SseClient client(port, "/stream/s1");
    ASSERT_TRUE(client.WaitFor("session.connected"));
    auto res = httpPost(port, "/batch/s1",
                        R"([{"jsonrpc":"2.0","id":1,"method":"ping"},{"jsonrpc":"2.0","foo":1},{"jsonrpc":"2.0","id":2,"method":"tools/list"}])");
    ASSERT_EQ(res.result(), http::status::ok);
    JSONValue body = ParseJSON(res.body());
    ASSERT_TRUE(body.IsArray());
    const auto& arr = std::get<JSONValue::Array>(body.value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(GetIntMember(*arr[0], "id").value_or(0), 1);
    EXPECT_EQ(errorCodeOf(*arr[1]), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_TRUE(FindMember(*arr[1], "id")->IsNull());
    EXPECT_EQ(GetIntMember(*arr[2], "id").value_or(0), 2);
    EXPECT_NE(FindMember(*FindMember(*arr[2], "result"), "tools"), nullptr);
}

TEST_F(HttpSseTest, BatchForUnknownSessionAnswersEachEntry) {
    StartServer();
    auto res = httpPost(port, "/batch/ghost",
                        R"([{"jsonrpc":"2.0","id":1,"method":"ping"},{"jsonrpc":"2.0","id":2,"method":"ping"}])");
    EXPECT_EQ(res.result(), http::status::not_found);
    JSONValue body = ParseJSON(res.body());
    const auto& arr = std::get<JSONValue::Array>(body.value);
    ASSERT_EQ(arr.size(), 2u);
    EXPECT_EQ(errorCodeOf(*arr[0]), JSONRPCErrorCodes::SessionNotFound);
    EXPECT_EQ(errorCodeOf(*arr[1]), JSONRPCErrorCodes::SessionNotFound);
}

TEST_F(HttpSseTest, EmptyBatchIsInvalidRequest) {
    StartServer();
    SseClient client(port, "/stream/s1");
    ASSERT_TRUE(client.WaitFor("session.connected"));
    auto res = httpPost(port, "/batch/s1", "[]");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(errorCodeOf(ParseJSON(res.body())), JSONRPCErrorCodes::InvalidRequest);
}

//==========================================================================================================
// Admin routes and routing errors
//==========================================================================================================
TEST_F(HttpSseTest, SessionsListingAndAdminClose) {
    StartServer();
    SseClient client(port, "/stream/admin");
    ASSERT_TRUE(client.WaitFor("session.connected"));

    auto list = httpCall(port, http::verb::get, "/sessions");
    ASSERT_EQ(list.result(), http::status::ok);
    JSONValue body = ParseJSON(list.body());
    EXPECT_EQ(GetIntMember(body, "total").value_or(0), 1);
    const auto& arr = std::get<JSONValue::Array>(FindMember(body, "sessions")->value);
    ASSERT_EQ(arr.size(), 1u);
    EXPECT_EQ(GetStringMember(*arr[0], "session_id").value_or(""), "admin");
    EXPECT_EQ(GetStringMember(*arr[0], "state").value_or(""), "uninitialized");
    EXPECT_TRUE(GetBoolMember(*arr[0], "stream_attached").value_or(false));

    auto del = httpCall(port, http::verb::delete_, "/sessions/admin");
    ASSERT_EQ(del.result(), http::status::ok);
    EXPECT_EQ(GetStringMember(ParseJSON(del.body()), "status").value_or(""), "closed");
    EXPECT_TRUE(client.WaitFor("session.disconnected"));
    EXPECT_TRUE(client.WaitClosed());
    EXPECT_FALSE(sessions.Contains("admin"));

    auto again = httpCall(port, http::verb::delete_, "/sessions/admin");
    EXPECT_EQ(GetStringMember(ParseJSON(again.body()), "status").value_or(""), "not_found");
}

TEST_F(HttpSseTest, WrongVerbIs405AndUnknownPathIs404) {
    StartServer();
    auto wrong = httpCall(port, http::verb::get, "/request/s1");
    EXPECT_EQ(wrong.result(), http::status::method_not_allowed);
    auto allow = wrong.base().find(http::field::allow);
    ASSERT_NE(allow, wrong.base().end());
    EXPECT_EQ(std::string(allow->value()), "POST");

    auto streamPost = httpCall(port, http::verb::post, "/stream/s1", kPing);
    EXPECT_EQ(streamPost.result(), http::status::method_not_allowed);

    auto missing = httpCall(port, http::verb::get, "/nope");
    EXPECT_EQ(missing.result(), http::status::not_found);
    EXPECT_EQ(GetStringMember(ParseJSON(missing.body()), "error").value_or(""), "Not found");

    auto noId = httpCall(port, http::verb::post, "/request", kPing);
    EXPECT_EQ(noId.result(), http::status::not_found);
}

//==========================================================================================================
// Options and startup
//==========================================================================================================
TEST(HTTPServerOptions, FromUriParsesSchemeHostPortAndTls) {
    auto plain = HTTPServer::Options::FromUri("http://0.0.0.0:9000");
    EXPECT_EQ(plain.scheme, "http");
    EXPECT_EQ(plain.address, "0.0.0.0");
    EXPECT_EQ(plain.port, "9000");

    auto tls = HTTPServer::Options::FromUri("https://localhost:8443?cert=/tmp/c.pem&key=/tmp/k.pem");
    EXPECT_EQ(tls.scheme, "https");
    EXPECT_EQ(tls.address, "localhost");
    EXPECT_EQ(tls.certFile, "/tmp/c.pem");
    EXPECT_EQ(tls.keyFile, "/tmp/k.pem");

    auto v6 = HTTPServer::Options::FromUri("http://[::1]:7000");
    EXPECT_EQ(v6.address, "::1");
    EXPECT_EQ(v6.port, "7000");

    auto bare = HTTPServer::Options::FromUri("127.0.0.1");
    EXPECT_EQ(bare.scheme, "http");
    EXPECT_EQ(bare.port, "8080");
}

TEST(HTTPServerOptions, FromUriRejectsBadPorts) {
    EXPECT_THROW(HTTPServer::Options::FromUri("http://127.0.0.1:http"), std::invalid_argument);
    EXPECT_THROW(HTTPServer::Options::FromUri("http://127.0.0.1:70000"), std::invalid_argument);
}

TEST(HTTPServerOptions, HttpsWithoutCertificateFailsToStart) {
    SessionRegistry sessions;
    InMemoryMemoryService memory;
    MemoryToolExecutor tools(memory);
    NotificationPump pump(sessions);
    MethodRouter router(sessions, tools, memory, pump, Implementation("memgate", "test"));
    HTTPServer::Options opts;
    opts.scheme = "https";
    opts.port = "0";
    HTTPServer server(opts, router, sessions, pump);
    EXPECT_THROW(server.Start().get(), std::runtime_error);
}

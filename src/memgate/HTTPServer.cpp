//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/memgate/HTTPServer.cpp
// Purpose: HTTP/HTTPS SSE gateway using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"
#include "memgate/HTTPServer.hpp"
#include "memgate/MessageCodec.h"
#include "memgate/Protocol.h"

#include <openssl/ssl.h>

namespace memgate {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

using TlsStream = beast::ssl_stream<beast::tcp_stream>;
using StringRequest = http::request<http::string_body>;
using StringResponse = http::response<http::string_body>;

enum class RouteKind { Stream, Request, Batch, Sessions, Unknown };

struct Route {
    RouteKind kind{RouteKind::Unknown};
    std::string sessionId;
};

// Shared between a stream's consumer loop and its disconnect watcher; both run on the connection strand.
struct StreamState {
    bool disconnected{false};
};

unsigned short parsePort(const std::string& port) {
    if (port.empty()) {
        throw std::invalid_argument("HTTPServer invalid port: empty");
    }
    const bool allDigits = std::all_of(port.begin(), port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (!allDigits || port.size() > 5) {
        throw std::invalid_argument("HTTPServer invalid port: " + port);
    }
    const unsigned long value = std::stoul(port);
    if (value > 65535ul) {
        throw std::invalid_argument("HTTPServer invalid port (out of range): " + port);
    }
    return static_cast<unsigned short>(value);
}

Route parseRoute(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    auto segment = [&path](const std::string& prefix, Route& out, RouteKind kind, bool idRequired) {
        if (path == prefix) {
            if (idRequired) return false;
            out.kind = kind;
            return true;
        }
        const std::string withSlash = prefix + "/";
        if (path.rfind(withSlash, 0) != 0) return false;
        std::string id = path.substr(withSlash.size());
        if (id.empty() || id.find('/') != std::string::npos) return false;
        out.kind = kind;
        out.sessionId = std::move(id);
        return true;
    };
    Route r;
    if (segment("/stream", r, RouteKind::Stream, false)) return r;
    if (segment("/request", r, RouteKind::Request, true)) return r;
    if (segment("/batch", r, RouteKind::Batch, true)) return r;
    if (segment("/sessions", r, RouteKind::Sessions, false)) return r;
    return Route{};
}

StringResponse jsonResponse(http::status status, unsigned version, std::string body) {
    StringResponse res{status, version};
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(false);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

StringResponse acceptedResponse(unsigned version) {
    StringResponse res{http::status::accepted, version};
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(false);
    res.prepare_payload();
    return res;
}

std::unique_ptr<JSONRPCResponse> sessionNotFound(const JSONRPCId& id, const std::string& sessionId) {
    JSONValue::Object data;
    data["session_id"] = std::make_shared<JSONValue>(sessionId);
    return CreateErrorResponse(id, JSONRPCErrorCodes::SessionNotFound, "Session not found", JSONValue{data});
}

std::string generateSessionId() {
    boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

} // namespace

//==========================================================================================================
// HTTPServer::Options::FromUri
//==========================================================================================================
HTTPServer::Options HTTPServer::Options::FromUri(const std::string& uri) {
    Options opts;
    std::string cfg = uri;
    auto trim = [](std::string& s) {
        auto notSpace = [](unsigned char c) { return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx) { return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }
    std::string hostPort = hostPortPath.substr(0, hostPortPath.find('/'));
    trim(hostPort);

    if (!hostPort.empty()) {
        std::string port;
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb == std::string::npos) {
                throw std::invalid_argument("HTTPServer invalid address: " + hostPort);
            }
            opts.address = hostPort.substr(1, rb - 1);
            if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                port = hostPort.substr(rb + 2);
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(port);
        if (!port.empty()) {
            (void)parsePort(port);
            opts.port = port;
        }
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }
    return opts;
}

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    MethodRouter& router;
    SessionRegistry& sessions;
    NotificationPump& pump;

    auth::ITokenVerifier* verifier{nullptr};
    auth::RequireBearerTokenOptions bearerOpts;

    std::atomic<bool> running{false};
    std::atomic<unsigned short> localPort{0};

    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https; outlives pending TLS streams
    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::vector<std::thread> ioThreads;

    // Queues of streams currently served, so Stop can close their sessions.
    std::mutex streamsMutex;
    std::unordered_map<std::string, std::shared_ptr<OutboundQueue>> liveStreams;

    Impl(const HTTPServer::Options& o, MethodRouter& r, SessionRegistry& s, NotificationPump& p)
        : opts(o), router(r), sessions(s), pump(p) {}

    void initTls() {
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
        // TLS 1.3 only
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        try {
            sslCtx->use_certificate_chain_file(opts.certFile);
            sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
            throw;
        }
        sslCtx->set_options(
            ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
            ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
    }

    void bind() {
        (void)parsePort(opts.port);
        if (opts.scheme == "https") {
            if (opts.certFile.empty() || opts.keyFile.empty()) {
                throw std::invalid_argument("HTTPServer: https requires cert and key files");
            }
            initTls();
        } else if (opts.scheme != "http") {
            throw std::invalid_argument("HTTPServer: unsupported scheme " + opts.scheme);
        }
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        localPort.store(acceptor->local_endpoint().port());
    }

    void assignIdentity(const std::string& sessionId, const std::optional<auth::TokenInfo>& identity) {
        if (!identity.has_value()) {
            return;
        }
        const auto tenant = identity->TenantId();
        const auto user = identity->UserId();
        sessions.Update(sessionId, [&](Session& s) {
            if (tenant.has_value()) s.tenantId = tenant;
            if (user.has_value()) s.userId = user;
        });
    }

    //======================================================================================================
    // Request / batch handling
    //======================================================================================================

    // Reply for one POSTed entry, or nullptr when the entry is not answered (notifications, client responses).
    std::unique_ptr<JSONRPCResponse> handleEntry(const std::string& sessionId, bool sessionKnown,
                                                 const DecodeResult& entry) {
        if (std::holds_alternative<DecodeError>(entry)) {
            const auto& err = std::get<DecodeError>(entry);
            return sessionKnown ? MakeDecodeErrorResponse(err) : sessionNotFound(err.id, sessionId);
        }
        const Message& msg = std::get<Message>(entry);
        switch (KindOf(msg)) {
            case MessageKind::Response: {
                const auto& id = std::get<JSONRPCResponse>(msg).id;
                if (!sessionKnown) return sessionNotFound(id, sessionId);
                LOG_DEBUG("POST: ignoring response from client (id={})", IdToString(id));
                return nullptr;
            }
            case MessageKind::Notification: {
                if (!sessionKnown) return sessionNotFound(nullptr, sessionId);
                router.HandleNotification(sessionId, std::get<JSONRPCNotification>(msg));
                return nullptr;
            }
            case MessageKind::Request:
                break;
        }
        const auto& req = std::get<JSONRPCRequest>(msg);
        if (!sessionKnown) {
            return sessionNotFound(req.id, sessionId);
        }
        if (req.method.rfind(Methods::NotificationPrefix, 0) == 0) {
            router.HandleNotification(sessionId, JSONRPCNotification(req.method, req.params));
            return nullptr;
        }
        auto resp = router.Dispatch(sessionId, req);
        if (!IsNullId(req.id)) {
            if (!pump.PushResponse(sessionId, *resp)) {
                LOG_DEBUG("Session {} has no live stream; response {} not mirrored", sessionId, IdToString(req.id));
            }
        }
        return resp;
    }

    bool prepareSession(const std::string& sessionId, const std::optional<auth::TokenInfo>& identity) {
        if (!sessions.Touch(sessionId)) {
            LOG_WARN("POST for unknown session {}", sessionId);
            return false;
        }
        assignIdentity(sessionId, identity);
        return true;
    }

    StringResponse handleRequest(const StringRequest& req, const std::string& sessionId,
                                 const std::optional<auth::TokenInfo>& identity) {
        const bool known = prepareSession(sessionId, identity);
        auto decoded = DecodeMessage(req.body());
        if (known && std::holds_alternative<DecodeError>(decoded)) {
            auto err = MakeDecodeErrorResponse(std::get<DecodeError>(decoded));
            return jsonResponse(http::status::bad_request, req.version(), err->Serialize());
        }
        auto resp = handleEntry(sessionId, known, decoded);
        if (!resp) {
            return acceptedResponse(req.version());
        }
        return jsonResponse(known ? http::status::ok : http::status::not_found, req.version(), resp->Serialize());
    }

    StringResponse handleBatch(const StringRequest& req, const std::string& sessionId,
                               const std::optional<auth::TokenInfo>& identity) {
        const bool known = prepareSession(sessionId, identity);
        auto decoded = DecodeBatch(req.body());
        if (std::holds_alternative<DecodeError>(decoded)) {
            const auto& err = std::get<DecodeError>(decoded);
            if (!known) {
                return jsonResponse(http::status::not_found, req.version(), sessionNotFound(err.id, sessionId)->Serialize());
            }
            return jsonResponse(http::status::bad_request, req.version(), MakeDecodeErrorResponse(err)->Serialize());
        }
        const auto& batch = std::get<DecodedBatch>(decoded);
        std::string body = "[";
        std::size_t produced = 0;
        for (const auto& entry : batch.entries) {
            auto resp = handleEntry(sessionId, known, entry);
            if (!resp) continue;
            if (produced++ > 0) body += ",";
            body += resp->Serialize();
        }
        body += "]";
        if (produced == 0) {
            return acceptedResponse(req.version());
        }
        return jsonResponse(known ? http::status::ok : http::status::not_found, req.version(), std::move(body));
    }

    StringResponse listSessions(const StringRequest& req) {
        JSONValue::Array list;
        const auto snapshot = sessions.Snapshot();
        for (const auto& s : snapshot) {
            JSONValue::Object o;
            o["session_id"] = std::make_shared<JSONValue>(s.id);
            o["state"] = std::make_shared<JSONValue>(ToString(s.state));
            o["initialized"] = std::make_shared<JSONValue>(s.IsInitialized());
            o["created_at"] = std::make_shared<JSONValue>(FormatTimestamp(s.createdAt));
            o["last_activity"] = std::make_shared<JSONValue>(FormatTimestamp(s.lastActivity));
            o["stream_attached"] = std::make_shared<JSONValue>(s.streamAttached);
            if (s.tenantId.has_value()) {
                o["tenant_id"] = std::make_shared<JSONValue>(*s.tenantId);
            }
            list.push_back(std::make_shared<JSONValue>(std::move(o)));
        }
        JSONValue::Object root;
        root["sessions"] = std::make_shared<JSONValue>(std::move(list));
        root["total"] = std::make_shared<JSONValue>(static_cast<int64_t>(snapshot.size()));
        return jsonResponse(http::status::ok, req.version(), SerializeJSON(JSONValue{root}));
    }

    StringResponse closeSession(const StringRequest& req, const std::string& sessionId) {
        const bool closed = sessions.Close(sessionId);
        LOG_INFO("Admin close of session {}: {}", sessionId, closed ? "closed" : "not_found");
        JSONValue::Object o;
        o["status"] = std::make_shared<JSONValue>(closed ? "closed" : "not_found");
        o["session_id"] = std::make_shared<JSONValue>(sessionId);
        return jsonResponse(http::status::ok, req.version(), SerializeJSON(JSONValue{o}));
    }

    StringResponse methodNotAllowed(const StringRequest& req, const char* allow) {
        auto res = jsonResponse(http::status::method_not_allowed, req.version(),
                                std::string("{\"error\":\"Method not allowed\"}"));
        res.set(http::field::allow, allow);
        return res;
    }

    StringResponse unauthorized(const StringRequest& req, const auth::BearerCheckResult& check) {
        LOG_WARN("Rejected {} {}: {}", std::string(req.method_string()), std::string(req.target()), check.errorMessage);
        JSONValue::Object data;
        data["reason"] = std::make_shared<JSONValue>(check.errorMessage);
        auto body = CreateErrorResponse(nullptr, JSONRPCErrorCodes::Unauthorized, "Unauthorized", JSONValue{data});
        auto res = jsonResponse(static_cast<http::status>(check.httpStatus), req.version(), body->Serialize());
        if (check.includeWWWAuthenticate) {
            res.set(http::field::www_authenticate, auth::BuildWwwAuthenticate(check, bearerOpts));
        }
        return res;
    }

    StringResponse handle(const StringRequest& req, const Route& route, const std::optional<auth::TokenInfo>& identity) {
        const auto verb = req.method();
        switch (route.kind) {
            case RouteKind::Stream:
                return methodNotAllowed(req, "GET");
            case RouteKind::Request:
                if (verb != http::verb::post) return methodNotAllowed(req, "POST");
                return handleRequest(req, route.sessionId, identity);
            case RouteKind::Batch:
                if (verb != http::verb::post) return methodNotAllowed(req, "POST");
                return handleBatch(req, route.sessionId, identity);
            case RouteKind::Sessions:
                if (route.sessionId.empty()) {
                    if (verb != http::verb::get) return methodNotAllowed(req, "GET");
                    return listSessions(req);
                }
                if (verb != http::verb::delete_) return methodNotAllowed(req, "DELETE");
                return closeSession(req, route.sessionId);
            case RouteKind::Unknown:
                break;
        }
        return jsonResponse(http::status::not_found, req.version(), std::string("{\"error\":\"Not found\"}"));
    }

    //======================================================================================================
    // Connection handling
    //======================================================================================================

    net::awaitable<void> shutdownStream(beast::tcp_stream& stream) {
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        co_return;
    }

    net::awaitable<void> shutdownStream(TlsStream& stream) {
        boost::system::error_code ec;
        beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(5));
        co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    }

    template <class Stream>
    net::awaitable<void> writeAndClose(Stream& stream, StringResponse res) {
        boost::system::error_code ec;
        co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            LOG_DEBUG("HTTPServer write failed: {}", ec.message());
        }
        co_await shutdownStream(stream);
    }

    template <class Stream>
    static net::awaitable<bool> writeFrame(Stream& stream, const std::string& frame) {
        boost::system::error_code ec;
        co_await net::async_write(stream, net::buffer(frame), net::redirect_error(net::use_awaitable, ec));
        co_return !ec;
    }

    std::string sessionEventFrame(const char* method, const std::string& sessionId) const {
        const auto note = NotificationPump::MakeSessionEvent(method, sessionId);
        std::optional<std::string> eventType;
        if (opts.namedEvents) eventType = method;
        return NotificationPump::FormatSseFrame(note.Serialize(), eventType);
    }

    std::optional<std::string> queuedEventType() const {
        if (opts.namedEvents) return std::string("message");
        return std::nullopt;
    }

    // Reads until the peer goes away, then wakes the consumer loop.
    template <class Stream>
    net::awaitable<void> watchDisconnect(std::shared_ptr<Stream> stream, std::shared_ptr<StreamState> state,
                                         std::shared_ptr<net::steady_timer> timer) {
        std::array<char, 256> scratch{};
        boost::system::error_code ec;
        while (!ec) {
            co_await stream->async_read_some(net::buffer(scratch), net::redirect_error(net::use_awaitable, ec));
        }
        state->disconnected = true;
        timer->cancel();
    }

    //======================================================================================================
    // serveStream
    // Purpose: SSE consumer loop for one session. Drains the queue, and only when it is empty waits on the
    //          timer; a push (via the queue waker), a queue close or a disconnect cancels the wait, a timeout
    //          emits a heartbeat.
    //======================================================================================================
    template <class Stream>
    net::awaitable<void> serveStream(std::shared_ptr<Stream> stream, std::string sessionId, unsigned version,
                                     std::optional<auth::TokenInfo> identity) {
        if (sessionId.empty()) {
            sessionId = generateSessionId();
        }
        auto queue = sessions.Create(sessionId, true);
        sessions.Update(sessionId, [](Session& s) {
            s.streamAttached = true;
            s.metadata["transport"] = JSONValue("sse");
        });
        assignIdentity(sessionId, identity);
        {
            std::lock_guard<std::mutex> lk(streamsMutex);
            liveStreams[sessionId] = queue;
        }

        auto executor = co_await net::this_coro::executor;
        auto timer = std::make_shared<net::steady_timer>(executor);
        auto state = std::make_shared<StreamState>();
        std::weak_ptr<net::steady_timer> weakTimer = timer;
        queue->SetWaker([weakTimer] {
            if (auto t = weakTimer.lock()) {
                net::post(t->get_executor(), [t] { t->cancel(); });
            }
        });

        http::response<http::empty_body> res{http::status::ok, version};
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        res.set("X-Accel-Buffering", "no");
        res.set("X-Session-Id", sessionId);
        res.set(http::field::access_control_allow_origin, "*");
        res.keep_alive(false);
        http::response_serializer<http::empty_body> sr{res};
        boost::system::error_code ec;
        co_await http::async_write_header(*stream, sr, net::redirect_error(net::use_awaitable, ec));
        bool open = !ec;
        if (open) {
            LOG_INFO("SSE stream opened for session {}", sessionId);
            open = co_await writeFrame(*stream, sessionEventFrame(Notifications::SessionConnected, sessionId));
        }

        if (open) {
            net::co_spawn(executor, watchDisconnect(stream, state, timer), net::detached);
            const auto heartbeat = std::chrono::milliseconds(std::max<std::uint64_t>(opts.heartbeatIntervalMs, 1));
            for (;;) {
                auto pending = queue->Drain();
                if (!pending.empty()) {
                    for (const auto& msg : pending) {
                        if (!co_await writeFrame(*stream, NotificationPump::FormatSseFrame(msg, queuedEventType()))) {
                            state->disconnected = true;
                            break;
                        }
                    }
                    if (state->disconnected) break;
                    continue;
                }
                if (state->disconnected || queue->IsClosed()) {
                    break;
                }
                timer->expires_after(heartbeat);
                boost::system::error_code waitEc;
                co_await timer->async_wait(net::redirect_error(net::use_awaitable, waitEc));
                if (waitEc) {
                    continue; // woken by a push, a close or a disconnect
                }
                if (state->disconnected) break;
                if (!co_await writeFrame(*stream, sessionEventFrame(Notifications::SessionHeartbeat, sessionId))) {
                    state->disconnected = true;
                    break;
                }
                LOG_DEBUG("Heartbeat sent to session {}", sessionId);
            }
            // Best effort: fails silently when the peer is already gone.
            (void)co_await writeFrame(*stream, sessionEventFrame(Notifications::SessionDisconnected, sessionId));
        }

        queue->SetWaker(nullptr);
        const bool removed = sessions.Close(sessionId, queue);
        {
            std::lock_guard<std::mutex> lk(streamsMutex);
            auto it = liveStreams.find(sessionId);
            if (it != liveStreams.end() && it->second == queue) {
                liveStreams.erase(it);
            }
        }
        LOG_INFO("SSE stream closed for session {}{}", sessionId, removed ? "" : " (superseded by reconnect)");
        beast::error_code closeEc;
        beast::get_lowest_layer(*stream).socket().close(closeEc);
    }

    template <class Stream>
    net::awaitable<void> serve(std::shared_ptr<Stream> stream) {
        beast::flat_buffer buffer;
        StringRequest req;
        boost::system::error_code ec;
        co_await http::async_read(*stream, buffer, req, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (ec != http::error::end_of_stream) {
                LOG_DEBUG("HTTPServer read failed: {}", ec.message());
            }
            co_return;
        }

        std::optional<auth::TokenInfo> identity;
        if (verifier != nullptr) {
            auth::TokenInfo info;
            const auto check = auth::CheckBearerAuth(std::string(req[http::field::authorization]), *verifier,
                                                     bearerOpts, info);
            if (!check.ok) {
                co_await writeAndClose(*stream, unauthorized(req, check));
                co_return;
            }
            identity = std::move(info);
        }

        const Route route = parseRoute(std::string(req.target()));
        if (route.kind == RouteKind::Stream && req.method() == http::verb::get) {
            co_await serveStream(stream, route.sessionId, req.version(), std::move(identity));
            co_return;
        }

        StringResponse res;
        try {
            res = handle(req, route, identity);
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPServer handler failed for {}: {}", std::string(req.target()), e.what());
            res = jsonResponse(http::status::internal_server_error, req.version(),
                               CreateErrorResponse(nullptr, JSONRPCErrorCodes::InternalError, "Internal error",
                                                   JSONValue(std::string(e.what())))->Serialize());
        }
        co_await writeAndClose(*stream, std::move(res));
    }

    net::awaitable<void> servePlain(tcp::socket socket) {
        auto stream = std::make_shared<beast::tcp_stream>(std::move(socket));
        co_await serve(stream);
    }

    net::awaitable<void> serveTls(tcp::socket socket) {
        auto stream = std::make_shared<TlsStream>(std::move(socket), *sslCtx);
        boost::system::error_code ec;
        beast::get_lowest_layer(*stream).expires_after(std::chrono::seconds(30));
        co_await stream->async_handshake(ssl::stream_base::server, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            LOG_DEBUG("HTTPServer TLS handshake failed: {}", ec.message());
            co_return;
        }
        beast::get_lowest_layer(*stream).expires_never();
        co_await serve(stream);
    }

    net::awaitable<void> acceptLoop() {
        while (running.load()) {
            // One strand per connection.
            tcp::socket socket(net::make_strand(ioc));
            boost::system::error_code ec;
            co_await acceptor->async_accept(socket, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (!running.load() || ec == net::error::operation_aborted) {
                    break;
                }
                LOG_WARN("HTTPServer accept error: {}", ec.message());
                continue;
            }
            auto ex = socket.get_executor();
            if (sslCtx) {
                net::co_spawn(ex, serveTls(std::move(socket)), net::detached);
            } else {
                net::co_spawn(ex, servePlain(std::move(socket)), net::detached);
            }
        }
        co_return;
    }

    void stop() {
        running.store(false);
        ioc.stop();
        for (auto& t : ioThreads) {
            if (t.joinable()) t.join();
        }
        ioThreads.clear();
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
        std::unordered_map<std::string, std::shared_ptr<OutboundQueue>> streams;
        {
            std::lock_guard<std::mutex> lk(streamsMutex);
            streams.swap(liveStreams);
        }
        for (auto& [id, queue] : streams) {
            queue->SetWaker(nullptr);
            sessions.Close(id, queue);
        }
    }
};

HTTPServer::HTTPServer(const Options& opts, MethodRouter& router, SessionRegistry& sessions, NotificationPump& pump)
    : pImpl(std::make_unique<Impl>(opts, router, sessions, pump)) {}

HTTPServer::~HTTPServer() {
    if (!pImpl->ioThreads.empty()) {
        pImpl->stop();
    }
}

std::future<void> HTTPServer::Start() {
    std::promise<void> ready;
    auto fut = ready.get_future();
    try {
        pImpl->bind();
        pImpl->running.store(true);
        net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
        const unsigned int threads = std::max(1u, pImpl->opts.ioThreads);
        for (unsigned int i = 0; i < threads; ++i) {
            pImpl->ioThreads.emplace_back([this]() {
                try {
                    pImpl->ioc.run();
                } catch (const std::exception& e) {
                    LOG_ERROR("HTTPServer I/O thread terminated: {}", e.what());
                }
            });
        }
        LOG_INFO("HTTPServer listening on {}://{}:{}", pImpl->opts.scheme, pImpl->opts.address,
                 pImpl->localPort.load());
        ready.set_value();
    } catch (const std::exception& e) {
        LOG_ERROR("HTTPServer start failed: {}", e.what());
        pImpl->running.store(false);
        ready.set_exception(std::make_exception_ptr(std::runtime_error(std::string("HTTPServer start failed: ") + e.what())));
    }
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->stop();
    LOG_INFO("HTTPServer stopped");
    done.set_value();
    return fut;
}

unsigned short HTTPServer::LocalPort() const {
    return pImpl->localPort.load();
}

void HTTPServer::SetBearerAuth(auth::ITokenVerifier& verifier, const auth::RequireBearerTokenOptions& opts) {
    pImpl->verifier = &verifier;
    pImpl->bearerOpts = opts;
}

} // namespace memgate

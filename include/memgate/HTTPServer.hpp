//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS SSE gateway using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "memgate/MethodRouter.h"
#include "memgate/NotificationPump.h"
#include "memgate/SessionRegistry.h"
#include "memgate/auth/ServerAuth.hpp"

namespace memgate {

//==========================================================================================================
// HTTPServer
// Purpose: Server-Sent-Events transport. Clients hold GET /stream/{id} open to receive messages and send
//          requests with POST /request/{id} or POST /batch/{id}; responses come back synchronously and are
//          mirrored onto the stream.
//
// Routes:
//   GET    /stream[/{id}]     open (or reset) a session and stream its outbound queue
//   POST   /request/{id}      one JSON-RPC message
//   POST   /batch/{id}        JSON array of messages, answered with an array in submitted order
//   GET    /sessions          snapshot of live sessions
//   DELETE /sessions/{id}     close a session (ends its stream)
//   Unknown paths answer 404; a known path with the wrong verb answers 405.
//
// Threading:
//   The io_context runs on Options::ioThreads threads. Every accepted connection is bound to its own strand,
//   so a stream's consumer loop, its disconnect watcher and its queue waker never run concurrently.
//==========================================================================================================
class HTTPServer {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; "0" picks a free port (see LocalPort)
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   heartbeatIntervalMs: Idle time after which a stream emits session.heartbeat
    //   ioThreads: Number of threads running the io_context
    //   namedEvents: Emit "event:" lines (session events by method, queued messages as "message")
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8080"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::uint64_t heartbeatIntervalMs{30000};
        unsigned int ioThreads{2};
        bool namedEvents{false};

        //==========================================================================================================
        // FromUri
        // Purpose: Parses "http://<address>:<port>" or "https://<address>:<port>?cert=<pem>&key=<pem>".
        //          IPv6 addresses use the [addr]:port form. A missing scheme means http; a missing port keeps
        //          the default. Unknown query parameters are ignored.
        // Throws:
        //   std::invalid_argument when the port is not numeric or exceeds 65535.
        //==========================================================================================================
        static Options FromUri(const std::string& uri);
    };

    HTTPServer(const Options& opts, MethodRouter& router, SessionRegistry& sessions, NotificationPump& pump);
    ~HTTPServer();
    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Binds the listener and starts the I/O threads.
    // Returns:
    //   Future that is ready once the listener is bound. Carries std::runtime_error when the port is invalid,
    //   binding fails or the TLS files cannot be loaded.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stop
    // Purpose: Closes the listener, stops the I/O threads and closes the sessions of streams still open.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    // Port actually bound (useful with port "0"). Zero before Start.
    unsigned short LocalPort() const;

    //==========================================================================================================
    // SetBearerAuth
    // Purpose: Requires "Authorization: Bearer <token>" on every route.
    // Notes:
    //   - Non-owning reference; the verifier must outlive the server.
    //   - Failures answer 401/403 with a JSON-RPC Unauthorized (-32001) body and a WWW-Authenticate header.
    //   - tenant_id/user_id from the verified token are assigned to the session being streamed or called.
    //   - Must be called before Start.
    //==========================================================================================================
    void SetBearerAuth(auth::ITokenVerifier& verifier, const auth::RequireBearerTokenOptions& opts);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace memgate

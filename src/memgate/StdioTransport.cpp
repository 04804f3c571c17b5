//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Line-delimited stdio transport loop
//==========================================================================================================

#include "memgate/StdioTransport.hpp"

#include <istream>
#include <ostream>
#include <random>
#include <sstream>

#include "logging/Logger.h"
#include "memgate/MessageCodec.h"
#include "memgate/Protocol.h"

namespace memgate {

class StdioTransport::Impl {
public:
    MethodRouter& router;
    SessionRegistry& sessions;
    std::istream& in;
    std::ostream& out;
    Options options;
    std::string sessionId;

    Impl(MethodRouter& r, SessionRegistry& s, std::istream& i, std::ostream& o, const Options& opts)
        : router(r), sessions(s), in(i), out(o), options(opts) {
        if (options.sessionId.has_value() && !options.sessionId->empty()) {
            sessionId = *options.sessionId;
        } else {
            std::random_device rd;
            std::mt19937 gen(rd());
            std::uniform_int_distribution<> dis(1000, 9999);
            sessionId = "stdio-" + std::to_string(dis(gen));
        }
        (void)sessions.Create(sessionId, false);
        sessions.Update(sessionId, [](Session& sess) {
            sess.metadata["transport"] = JSONValue("stdio");
            sess.streamAttached = true;
            sess.reapExempt = true;
        });
    }

    // Returns the reply for one decoded entry, or nullptr when the entry must not be answered.
    // Invalid batch entries are always answered so the reply array lines up with the input.
    std::unique_ptr<JSONRPCResponse> handleEntry(const DecodeResult& entry, bool inBatch) {
        if (std::holds_alternative<DecodeError>(entry)) {
            const auto& err = std::get<DecodeError>(entry);
            if (inBatch || err.code == JSONRPCErrorCodes::ParseError || err.hasId) {
                return MakeDecodeErrorResponse(err);
            }
            LOG_DEBUG("stdio: dropping invalid message without id: {}", err.message);
            return nullptr;
        }
        const Message& msg = std::get<Message>(entry);
        switch (KindOf(msg)) {
            case MessageKind::Notification:
                router.HandleNotification(sessionId, std::get<JSONRPCNotification>(msg));
                return nullptr;
            case MessageKind::Response:
                LOG_DEBUG("stdio: ignoring response from client (id={})", IdToString(std::get<JSONRPCResponse>(msg).id));
                return nullptr;
            case MessageKind::Request:
                break;
        }
        const auto& req = std::get<JSONRPCRequest>(msg);
        if (req.method.rfind(Methods::NotificationPrefix, 0) == 0) {
            router.HandleNotification(sessionId, JSONRPCNotification(req.method, req.params));
            return nullptr;
        }
        sessions.Touch(sessionId);
        return router.Dispatch(sessionId, req);
    }

    std::optional<std::string> processLine(const std::string& rawLine) {
        std::string line = rawLine;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            return std::nullopt;
        }
        if (line.size() > options.maxLineBytes) {
            LOG_WARN("stdio: line of {} bytes exceeds limit {}", line.size(), options.maxLineBytes);
            return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Request too large")->Serialize();
        }

        auto decoded = DecodeBatch(line);
        if (std::holds_alternative<DecodeError>(decoded)) {
            return MakeDecodeErrorResponse(std::get<DecodeError>(decoded))->Serialize();
        }
        const auto& batch = std::get<DecodedBatch>(decoded);
        if (!batch.isArray) {
            auto resp = handleEntry(batch.entries.front(), false);
            if (!resp) {
                return std::nullopt;
            }
            return resp->Serialize();
        }

        std::ostringstream oss;
        std::size_t produced = 0;
        oss << '[';
        for (const auto& entry : batch.entries) {
            auto resp = handleEntry(entry, true);
            if (!resp) continue;
            if (produced++ > 0) oss << ',';
            oss << resp->Serialize();
        }
        oss << ']';
        if (produced == 0) {
            return std::nullopt;
        }
        return oss.str();
    }
};

StdioTransport::StdioTransport(MethodRouter& router, SessionRegistry& sessions, std::istream& in, std::ostream& out)
    : StdioTransport(router, sessions, in, out, Options{}) {}

StdioTransport::StdioTransport(MethodRouter& router, SessionRegistry& sessions, std::istream& in, std::ostream& out,
                               const Options& options)
    : pImpl(std::make_unique<Impl>(router, sessions, in, out, options)) {}

StdioTransport::~StdioTransport() {
    pImpl->sessions.Close(pImpl->sessionId);
}

std::size_t StdioTransport::Run() {
    FUNC_SCOPE();
    LOG_INFO("stdio transport serving session {}", pImpl->sessionId);
    std::size_t replies = 0;
    std::string line;
    while (std::getline(pImpl->in, line)) {
        auto reply = pImpl->processLine(line);
        if (!reply.has_value()) {
            continue;
        }
        pImpl->out << *reply << '\n';
        pImpl->out.flush();
        ++replies;
        if (!pImpl->out) {
            LOG_ERROR("stdio: output stream failed; stopping");
            break;
        }
    }
    LOG_INFO("stdio transport for session {} reached end of input", pImpl->sessionId);
    pImpl->sessions.Close(pImpl->sessionId);
    return replies;
}

std::optional<std::string> StdioTransport::ProcessLine(const std::string& line) {
    return pImpl->processLine(line);
}

std::string StdioTransport::GetSessionId() const {
    return pImpl->sessionId;
}

} // namespace memgate

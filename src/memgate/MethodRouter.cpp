//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodRouter.cpp
// Purpose: MCP method handlers and dispatch
//==========================================================================================================

#include "memgate/MethodRouter.h"

#include <limits>
#include <mutex>
#include <unordered_map>

#include "logging/Logger.h"
#include "memgate/WikiLinks.h"
#include "memgate/errors/Errors.h"
#include "memgate/typed/Content.h"
#include "memgate/typed/Params.h"

namespace memgate {

namespace {

constexpr const char* kResourceScheme = "memory://tenant/";

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

errors::McpException resourceNotFound(const std::string& uri) {
    JSONValue::Object data;
    data["uri"] = std::make_shared<JSONValue>(uri);
    return errors::McpException(JSONRPCErrorCodes::ResourceNotFound, "Resource not found: " + uri, JSONValue{data});
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t slash = path.find('/', start);
        parts.push_back(path.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return parts;
}

} // namespace

class MethodRouter::Impl {
public:
    using Handler = JSONValue (Impl::*)(const JSONRPCRequest&, const Session&);

    SessionRegistry& sessions;
    IToolExecutor& tools;
    IMemoryService& memory;
    NotificationPump& pump;
    Implementation serverInfo;
    ServerCapabilities capabilities;
    std::vector<Prompt> prompts;

    mutable std::mutex memoryMethodsMutex;
    std::unordered_map<std::string, MemoryMethodHandler> memoryMethods;

    Impl(SessionRegistry& s, IToolExecutor& t, IMemoryService& m, NotificationPump& p, Implementation info)
        : sessions(s), tools(t), memory(m), pump(p), serverInfo(std::move(info)) {
        capabilities.resources = ResourcesCapability{true};
        prompts.push_back(Prompt{"search_memories", "Template for searching memories",
                                 {PromptArgument{"query", "Search query", true}}});
        prompts.push_back(Prompt{"summarize_memories", "Template for summarizing memories about a topic",
                                 {PromptArgument{"topic", "Topic to summarize", false}}});
    }

    std::unique_ptr<JSONRPCResponse> dispatch(const std::string& sessionId, const JSONRPCRequest& req) {
        auto session = sessions.Get(sessionId);
        if (!session.has_value()) {
            JSONValue::Object data;
            data["session_id"] = std::make_shared<JSONValue>(sessionId);
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::SessionNotFound, "Session not found",
                                       JSONValue{data});
        }
        noteOrdering(*session, req.method);

        try {
            Handler handler = lookup(req.method);
            JSONValue result;
            if (handler) {
                result = (this->*handler)(req, *session);
            } else if (startsWith(req.method, Methods::MemoryPrefix)) {
                result = dispatchMemoryMethod(req, *session);
            } else {
                throw methodNotFound(req.method);
            }
            return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
        } catch (const errors::McpException& e) {
            LOG_DEBUG("Request {} ({}) failed: {} ({})", IdToString(req.id), req.method, e.what(), e.code());
            return errors::makeErrorResponse(req.id, e.error());
        } catch (const std::exception& e) {
            LOG_ERROR("Request {} ({}) raised: {}", IdToString(req.id), req.method, e.what());
            return CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, "Internal error",
                                       JSONValue(std::string(e.what())));
        }
    }

    Handler lookup(const std::string& method) const {
        if (method == Methods::Initialize) return &Impl::handleInitialize;
        if (method == Methods::Initialized) return &Impl::handleInitialized;
        if (method == Methods::Ping) return &Impl::handlePing;
        if (method == Methods::ListTools) return &Impl::handleToolsList;
        if (method == Methods::CallTool) return &Impl::handleToolsCall;
        if (method == Methods::ListResources) return &Impl::handleResourcesList;
        if (method == Methods::ReadResource) return &Impl::handleResourcesRead;
        if (method == Methods::ListPrompts) return &Impl::handlePromptsList;
        if (method == Methods::GetPrompt) return &Impl::handlePromptsGet;
        return nullptr;
    }

    static errors::McpException methodNotFound(const std::string& method) {
        JSONValue::Object data;
        data["method"] = std::make_shared<JSONValue>(method);
        return errors::McpException(JSONRPCErrorCodes::MethodNotFound, "Method not found: " + method, JSONValue{data});
    }

    void noteOrdering(const Session& session, const std::string& method) {
        if (session.IsInitialized() || method == Methods::Initialize || method == Methods::Ping) {
            return;
        }
        LOG_WARN("Session {}: '{}' received before initialize", session.id, method);
        sessions.Update(session.id, [](Session& s) { ++s.outOfOrderCalls; });
    }

    //////////////////////////////////////// Lifecycle ////////////////////////////////////////
    JSONValue handleInitialize(const JSONRPCRequest& req, const Session& session) {
        auto params = typed::parseInitializeParams(req.params);
        const bool updated = sessions.Update(session.id, [&](Session& s) {
            if (s.IsInitialized()) {
                LOG_INFO("Session {} re-initialized", s.id);
            }
            s.state = SessionState::Initialized;
            s.capabilities = params.capabilities;
            s.clientInfo = params.clientInfo;
            if (params.protocolVersion.has_value()) {
                s.metadata["protocolVersion"] = JSONValue(*params.protocolVersion);
            }
        });
        if (!updated) {
            JSONValue::Object data;
            data["session_id"] = std::make_shared<JSONValue>(session.id);
            throw errors::McpException(JSONRPCErrorCodes::SessionNotFound, "Session not found", JSONValue{data});
        }
        LOG_INFO("Session {} initialized (client: {}, protocol: {})", session.id,
                 params.clientInfo ? params.clientInfo->name : std::string("unknown"),
                 params.protocolVersion.value_or("unspecified"));

        JSONValue::Object result;
        result["protocolVersion"] = std::make_shared<JSONValue>(PROTOCOL_VERSION);
        result["capabilities"] = std::make_shared<JSONValue>(ToJSON(capabilities));
        result["serverInfo"] = std::make_shared<JSONValue>(ToJSON(serverInfo));
        return JSONValue{result};
    }

    JSONValue handleInitialized(const JSONRPCRequest&, const Session& session) {
        LOG_DEBUG("Session {} acknowledged initialization", session.id);
        JSONValue::Object result;
        result["status"] = std::make_shared<JSONValue>("acknowledged");
        return JSONValue{result};
    }

    JSONValue handlePing(const JSONRPCRequest&, const Session&) {
        return JSONValue{JSONValue::Object{}};
    }

    //////////////////////////////////////// Tools ////////////////////////////////////////
    JSONValue handleToolsList(const JSONRPCRequest&, const Session&) {
        JSONValue::Array arr;
        for (const auto& tool : tools.ListDescriptors()) {
            arr.push_back(std::make_shared<JSONValue>(ToJSON(tool)));
        }
        JSONValue::Object result;
        result["tools"] = std::make_shared<JSONValue>(arr);
        return JSONValue{result};
    }

    JSONValue handleToolsCall(const JSONRPCRequest& req, const Session& session) {
        auto params = typed::parseCallToolParams(req.params);
        ToolCallContext ctx{session.id, session.tenantId, session.userId};
        ToolResult out = tools.Execute(params.name, params.arguments, ctx);
        for (const auto& note : out.notifications) {
            // Dropped silently when the caller has no stream attached
            (void)pump.Push(session.id, note);
        }
        return ToJSON(out.result);
    }

    //////////////////////////////////////// Resources ////////////////////////////////////////
    JSONValue handleResourcesList(const JSONRPCRequest&, const Session& session) {
        const std::string tenant = session.tenantId.value_or(MemoryToolExecutor::DefaultTenant);
        Resource all(std::string(kResourceScheme) + tenant + "/all", "All Memories",
                     std::string("Access to all memories in the tenant"), std::string("application/json"));
        JSONValue::Array arr;
        arr.push_back(std::make_shared<JSONValue>(ToJSON(all)));
        JSONValue::Object result;
        result["resources"] = std::make_shared<JSONValue>(arr);
        return JSONValue{result};
    }

    JSONValue handleResourcesRead(const JSONRPCRequest& req, const Session& session) {
        const auto params = typed::parseReadResourceParams(req.params);
        const std::string& uri = params.uri;
        if (!startsWith(uri, kResourceScheme)) {
            throw resourceNotFound(uri);
        }
        const auto parts = splitPath(uri.substr(std::char_traits<char>::length(kResourceScheme)));
        if (parts.size() < 2 || parts[0].empty()) {
            throw resourceNotFound(uri);
        }
        const std::string& tenant = parts[0];
        if (session.tenantId.has_value() && *session.tenantId != tenant) {
            LOG_WARN("Session {} denied read of tenant {}", session.id, tenant);
            throw resourceNotFound(uri);
        }

        JSONValue::Array records;
        if (parts.size() == 2 && parts[1] == "all") {
            for (const auto& rec : memory.List(tenant, 0, std::numeric_limits<std::size_t>::max())) {
                records.push_back(std::make_shared<JSONValue>(ToJSON(rec)));
            }
        } else if (parts.size() == 3 && parts[1] == "memory" && !parts[2].empty()) {
            auto rec = memory.Get(parts[2]);
            if (!rec.has_value() || rec->tenantId != tenant) {
                throw resourceNotFound(uri);
            }
            records.push_back(std::make_shared<JSONValue>(ToJSON(*rec)));
        } else {
            throw resourceNotFound(uri);
        }

        return typed::makeJsonResourceResult(uri, JSONValue{records});
    }

    //////////////////////////////////////// Prompts ////////////////////////////////////////
    JSONValue handlePromptsList(const JSONRPCRequest&, const Session&) {
        JSONValue::Array arr;
        for (const auto& p : prompts) {
            arr.push_back(std::make_shared<JSONValue>(ToJSON(p)));
        }
        JSONValue::Object result;
        result["prompts"] = std::make_shared<JSONValue>(arr);
        return JSONValue{result};
    }

    JSONValue handlePromptsGet(const JSONRPCRequest& req, const Session&) {
        const auto params = typed::parseGetPromptParams(req.params);
        GetPromptResult out;
        if (params.name == "search_memories") {
            const auto query = typed::detail::optionalString(params.arguments, "query").value_or("your topic");
            out.description = "Search for relevant memories";
            out.messages.push_back(typed::makePromptMessage("user", "Search for memories related to: " + query));
        } else if (params.name == "summarize_memories") {
            const auto topic = typed::detail::optionalString(params.arguments, "topic").value_or("all topics");
            out.description = "Summarize stored memories";
            out.messages.push_back(typed::makePromptMessage("user", "Summarize what the stored memories say about: " + topic));
        } else {
            JSONValue::Object data;
            data["name"] = std::make_shared<JSONValue>(params.name);
            throw errors::invalidParams("Prompt not found: " + params.name, JSONValue{data});
        }
        return ToJSON(out);
    }

    //////////////////////////////////////// memory/ ////////////////////////////////////////
    JSONValue dispatchMemoryMethod(const JSONRPCRequest& req, const Session& session) {
        const std::string suffix = req.method.substr(std::char_traits<char>::length(Methods::MemoryPrefix));
        MemoryMethodHandler handler;
        {
            std::lock_guard<std::mutex> lock(memoryMethodsMutex);
            auto it = memoryMethods.find(suffix);
            if (it != memoryMethods.end()) {
                handler = it->second;
            }
        }
        if (!handler) {
            throw methodNotFound(req.method);
        }
        return handler(req.params, session);
    }

    void registerBuiltins() {
        memoryMethods["stats"] = [this](const std::optional<JSONValue>&, const Session& session) {
            const MemoryStats stats = memory.Stats();
            JSONValue::Object result;
            result["total_memories"] = std::make_shared<JSONValue>(static_cast<int64_t>(stats.totalMemories));
            result["tenant_count"] = std::make_shared<JSONValue>(static_cast<int64_t>(stats.tenantCount));
            result["session_id"] = std::make_shared<JSONValue>(session.id);
            return JSONValue{result};
        };
        memoryMethods["wiki_links"] = [](const std::optional<JSONValue>& params, const Session&) {
            const auto p = typed::parseWikiLinksParams(params);
            JSONValue::Array links;
            for (const auto& l : ExtractWikiLinks(p.text)) {
                links.push_back(std::make_shared<JSONValue>(l));
            }
            JSONValue::Object result;
            result["links"] = std::make_shared<JSONValue>(links);
            return JSONValue{result};
        };
    }
};

MethodRouter::MethodRouter(SessionRegistry& sessions, IToolExecutor& tools, IMemoryService& memory,
                           NotificationPump& pump, Implementation serverInfo)
    : pImpl(std::make_unique<Impl>(sessions, tools, memory, pump, std::move(serverInfo))) {
    pImpl->registerBuiltins();
}

MethodRouter::~MethodRouter() = default;

std::unique_ptr<JSONRPCResponse> MethodRouter::Dispatch(const std::string& sessionId, const JSONRPCRequest& request) {
    FUNC_SCOPE();
    return pImpl->dispatch(sessionId, request);
}

void MethodRouter::HandleNotification(const std::string& sessionId, const JSONRPCNotification& notification) {
    FUNC_SCOPE();
    if (!pImpl->sessions.Touch(sessionId)) {
        LOG_WARN("Notification {} for unknown session {} ignored", notification.method, sessionId);
        return;
    }
    if (notification.method == Methods::Initialized || notification.method == Methods::InitializedNotification) {
        LOG_DEBUG("Session {} sent {}", sessionId, notification.method);
        return;
    }
    LOG_DEBUG("Session {}: notification {} ignored", sessionId, notification.method);
}

void MethodRouter::RegisterMemoryMethod(const std::string& suffix, MemoryMethodHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->memoryMethodsMutex);
    pImpl->memoryMethods[suffix] = std::move(handler);
}

const Implementation& MethodRouter::GetServerInfo() const {
    return pImpl->serverInfo;
}

std::vector<Prompt> MethodRouter::ListPrompts() const {
    return pImpl->prompts;
}

} // namespace memgate

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Gateway.cpp
// Purpose: Composition root and idle session reaper
//==========================================================================================================

#include "memgate/Gateway.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "memgate/auth/ServerAuth.hpp"
#include "memgate/version.h"

namespace memgate {

GatewayConfig GatewayConfig::FromEnvironment() {
    GatewayConfig cfg;
    const std::string transport = GetEnvOrDefault("MEMGATE_TRANSPORT", "");
    if (!transport.empty()) {
        cfg.transport = ParseTransport(transport);
    }
    cfg.listenUri = GetEnvOrDefault("MEMGATE_LISTEN", cfg.listenUri);
    cfg.heartbeatMs = GetEnvUIntOrDefault("MEMGATE_HEARTBEAT_MS", cfg.heartbeatMs);
    if (cfg.heartbeatMs == 0) {
        cfg.heartbeatMs = 30000;
    }
    cfg.idleTimeoutMs = GetEnvUIntOrDefault("MEMGATE_SESSION_IDLE_TIMEOUT_MS", cfg.idleTimeoutMs);
    cfg.ioThreads = static_cast<unsigned int>(
        std::clamp<std::uint64_t>(GetEnvUIntOrDefault("MEMGATE_IO_THREADS", cfg.ioThreads), 1, 64));
    cfg.namedEvents = GetEnvBoolOrDefault("MEMGATE_SSE_NAMED_EVENTS", cfg.namedEvents);
    cfg.bearerToken = GetEnvOrDefault("MEMGATE_BEARER_TOKEN", "");
    cfg.bearerTenant = GetEnvOrDefault("MEMGATE_BEARER_TENANT", cfg.bearerTenant);
    cfg.bearerUser = GetEnvOrDefault("MEMGATE_BEARER_USER", cfg.bearerUser);
    return cfg;
}

GatewayConfig::Transport GatewayConfig::ParseTransport(const std::string& value) {
    std::string v;
    v.reserve(value.size());
    for (char c : value) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "stdio") return Transport::Stdio;
    if (v == "http" || v == "sse") return Transport::Http;
    throw std::invalid_argument("Unknown transport: " + value + " (expected stdio|http)");
}

class Gateway::Impl {
public:
    GatewayConfig config;
    SessionRegistry sessions;
    std::unique_ptr<IMemoryService> memory;
    MemoryToolExecutor tools;
    NotificationPump pump;
    MethodRouter router;
    auth::StaticTokenVerifier verifier;

    std::mutex reaperMutex;
    std::condition_variable_any reaperCv;
    std::jthread reaper;

    Impl(GatewayConfig cfg, std::unique_ptr<IMemoryService> mem)
        : config(std::move(cfg)),
          memory(std::move(mem)),
          tools(*memory),
          pump(sessions),
          router(sessions, tools, *memory, pump, serverImplementation()) {
        if (!config.bearerToken.empty()) {
            verifier.AddToken(config.bearerToken, config.bearerTenant, config.bearerUser);
        }
    }

    std::chrono::milliseconds reaperPeriod() const {
        const auto quarter = config.idleTimeoutMs / 4;
        return std::chrono::milliseconds(std::clamp<std::uint64_t>(quarter, 50, 60000));
    }

    void reapLoop(std::stop_token st) {
        LOG_INFO("Idle session reaper started (timeout {} ms)", config.idleTimeoutMs);
        while (!st.stop_requested()) {
            {
                std::unique_lock<std::mutex> lk(reaperMutex);
                reaperCv.wait_for(lk, st, reaperPeriod(), [&st] { return st.stop_requested(); });
            }
            if (st.stop_requested()) break;
            (void)reapOnce();
        }
        LOG_DEBUG("Idle session reaper stopped");
    }

    std::size_t reapOnce() {
        const auto reaped = sessions.ReapIdle(std::chrono::milliseconds(config.idleTimeoutMs));
        if (!reaped.empty()) {
            LOG_DEBUG("Reaper pass closed {} session(s); {} remain", reaped.size(), sessions.Size());
        }
        return reaped.size();
    }
};

Gateway::Gateway(GatewayConfig config)
    : Gateway(std::move(config), std::make_unique<InMemoryMemoryService>()) {}

Gateway::Gateway(GatewayConfig config, std::unique_ptr<IMemoryService> memory) {
    if (!memory) {
        throw std::invalid_argument("Gateway: memory service must not be null");
    }
    pImpl = std::make_unique<Impl>(std::move(config), std::move(memory));
}

Gateway::~Gateway() {
    Shutdown();
}

const GatewayConfig& Gateway::Config() const { return pImpl->config; }
SessionRegistry& Gateway::Sessions() { return pImpl->sessions; }
IMemoryService& Gateway::Memory() { return *pImpl->memory; }
NotificationPump& Gateway::Pump() { return pImpl->pump; }
MethodRouter& Gateway::Router() { return pImpl->router; }

std::unique_ptr<StdioTransport> Gateway::MakeStdioTransport(std::istream& in, std::ostream& out) {
    return std::make_unique<StdioTransport>(pImpl->router, pImpl->sessions, in, out);
}

std::unique_ptr<HTTPServer> Gateway::MakeHTTPServer() {
    auto opts = HTTPServer::Options::FromUri(pImpl->config.listenUri);
    opts.heartbeatIntervalMs = pImpl->config.heartbeatMs;
    opts.ioThreads = pImpl->config.ioThreads;
    opts.namedEvents = pImpl->config.namedEvents;
    auto server = std::make_unique<HTTPServer>(opts, pImpl->router, pImpl->sessions, pImpl->pump);
    if (!pImpl->config.bearerToken.empty()) {
        server->SetBearerAuth(pImpl->verifier, auth::RequireBearerTokenOptions{});
        LOG_INFO("HTTP bearer auth enabled (tenant={} user={})", pImpl->config.bearerTenant, pImpl->config.bearerUser);
    }
    return server;
}

void Gateway::StartReaper() {
    if (pImpl->config.idleTimeoutMs == 0 || pImpl->reaper.joinable()) {
        return;
    }
    pImpl->reaper = std::jthread([this](std::stop_token st) { pImpl->reapLoop(st); });
}

std::size_t Gateway::ReapIdleSessions() {
    if (pImpl->config.idleTimeoutMs == 0) {
        return 0;
    }
    return pImpl->reapOnce();
}

void Gateway::Shutdown() {
    if (pImpl->reaper.joinable()) {
        pImpl->reaper.request_stop();
        pImpl->reaper.join();
    }
    pImpl->sessions.CloseAll();
}

} // namespace memgate

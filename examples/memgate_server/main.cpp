//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: memgate server executable (stdio or HTTP/SSE transport)
//==========================================================================================================

#include <csignal>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "logging/Logger.h"
#include "memgate/Gateway.h"
#include "memgate/version.h"

using namespace memgate;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--transport")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static std::uint64_t parseMs(const std::string& key, const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos || value.size() > 12) {
        throw std::invalid_argument(key + " expects a non-negative integer, got '" + value + "'");
    }
    return std::stoull(value);
}

static void printUsage() {
    std::cout << "usage: memgate_server [--transport=stdio|http] [--listen=http(s)://host:port[?cert=..&key=..]]\n"
                 "                      [--heartbeat-ms=N] [--idle-timeout-ms=N] [--io-threads=N]\n"
                 "                      [--bearer-token=T] [--log-level=debug|info|warn|error] [--version]\n";
}

static void applyCliOverrides(int argc, char** argv, GatewayConfig& cfg) {
    if (auto v = getArgValue(argc, argv, "--transport")) cfg.transport = GatewayConfig::ParseTransport(*v);
    if (auto v = getArgValue(argc, argv, "--listen")) cfg.listenUri = *v;
    if (auto v = getArgValue(argc, argv, "--heartbeat-ms")) {
        cfg.heartbeatMs = parseMs("--heartbeat-ms", *v);
        if (cfg.heartbeatMs == 0) throw std::invalid_argument("--heartbeat-ms must be positive");
    }
    if (auto v = getArgValue(argc, argv, "--idle-timeout-ms")) cfg.idleTimeoutMs = parseMs("--idle-timeout-ms", *v);
    if (auto v = getArgValue(argc, argv, "--io-threads")) {
        const auto n = parseMs("--io-threads", *v);
        if (n == 0 || n > 64) throw std::invalid_argument("--io-threads must be between 1 and 64");
        cfg.ioThreads = static_cast<unsigned int>(n);
    }
    if (auto v = getArgValue(argc, argv, "--bearer-token")) cfg.bearerToken = *v;
}

static int runStdio(Gateway& gateway) {
    auto transport = gateway.MakeStdioTransport(std::cin, std::cout);
    const auto replies = transport->Run();
    LOG_INFO("stdio session {} finished after {} replies", transport->GetSessionId(), replies);
    return 0;
}

static int runHttp(Gateway& gateway) {
    auto server = gateway.MakeHTTPServer();
    server->Start().get();

    boost::asio::io_context signals;
    boost::asio::signal_set set(signals, SIGINT, SIGTERM);
    set.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}; shutting down", signo);
        }
    });
    signals.run();

    server->Stop().get();
    return 0;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    if (hasFlag(argc, argv, "--version")) {
        std::cout << "memgate " << getVersionString() << std::endl;
        return 0;
    }
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage();
        return 0;
    }

    Logger::initFromEnvironment();
    if (auto lvl = getArgValue(argc, argv, "--log-level")) {
        Logger::setLogLevel(*lvl);
    }

    GatewayConfig cfg;
    try {
        cfg = GatewayConfig::FromEnvironment();
        applyCliOverrides(argc, argv, cfg);
    } catch (const std::exception& e) {
        std::cerr << "memgate_server: " << e.what() << std::endl;
        printUsage();
        return 2;
    }

    if (cfg.transport == GatewayConfig::Transport::Stdio) {
        // Route logs away from stdout before the first log line.
        Logger::setUseStderr(true);
    }
    LOG_INFO("memgate {} starting with transport={}", getVersionString(),
             cfg.transport == GatewayConfig::Transport::Stdio ? "stdio" : "http");

    try {
        Gateway gateway(cfg);
        gateway.StartReaper();
        const int rc = (cfg.transport == GatewayConfig::Transport::Stdio) ? runStdio(gateway) : runHttp(gateway);
        gateway.Shutdown();
        return rc;
    } catch (const std::exception& e) {
        LOG_ERROR("memgate_server failed: {}", e.what());
        return 1;
    }
}

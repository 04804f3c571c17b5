//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Line-delimited JSON-RPC transport over a pair of streams (stdin/stdout by default)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include "memgate/MethodRouter.h"
#include "memgate/SessionRegistry.h"

namespace memgate {

//==========================================================================================================
// StdioTransport
// Purpose: Single-session synchronous loop: read one line, decode, dispatch, write at most one line.
//
// Behavior:
//   - Malformed JSON answers ParseError with a null id; the loop continues.
//   - Invalid requests carrying an id answer InvalidRequest with that id; without an id they are dropped,
//     except inside a batch where every invalid entry is answered.
//   - Notifications and requests whose method starts with "notifications/" are never answered.
//   - A JSON array is a batch answered with one array of the responses it produced (nothing if none).
//   - Blank lines are skipped; end of input ends Run() and closes the session.
//   - Lines longer than Options::maxLineBytes answer InvalidRequest with a null id.
//==========================================================================================================
class StdioTransport {
public:
    struct Options {
        std::optional<std::string> sessionId;           // default: "stdio-<random>"
        std::size_t maxLineBytes{1024 * 1024};          // 1 MiB
    };

    StdioTransport(MethodRouter& router, SessionRegistry& sessions, std::istream& in, std::ostream& out);
    StdioTransport(MethodRouter& router, SessionRegistry& sessions, std::istream& in, std::ostream& out,
                   const Options& options);
    ~StdioTransport();

    //==========================================================================================================
    // Run
    // Purpose: Serves the input stream until end of input, then closes the session.
    // Returns:
    //   Number of lines that produced a reply.
    //==========================================================================================================
    std::size_t Run();

    //==========================================================================================================
    // ProcessLine
    // Purpose: Handles a single input line without touching the streams.
    // Returns:
    //   Serialized reply line (without trailing newline), or nullopt when nothing must be written.
    //==========================================================================================================
    std::optional<std::string> ProcessLine(const std::string& line);

    std::string GetSessionId() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace memgate

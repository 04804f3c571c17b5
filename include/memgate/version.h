//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Gateway identity reported in serverInfo and by --version.
//==========================================================================================================
#pragma once

#include <string>

#include "memgate/Protocol.h"

namespace memgate {

inline constexpr const char* kServerName = "memgate";
inline constexpr int kVersionMajor = 0;
inline constexpr int kVersionMinor = 1;
inline constexpr int kVersionPatch = 0;

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

// serverInfo sent in the initialize result.
Implementation serverImplementation();

} // namespace memgate

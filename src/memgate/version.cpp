//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Gateway version string and serverInfo.
//==========================================================================================================
#include "memgate/version.h"

#include <format>

namespace memgate {

std::string getVersionString() {
    return std::format("{}.{}.{}", kVersionMajor, kVersionMinor, kVersionPatch);
}

Implementation serverImplementation() {
    return Implementation(kServerName, getVersionString());
}

} // namespace memgate

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version string and handshake identity
//==========================================================================================================
#include "mcphub/version.h"

#include <fmt/format.h>

namespace mcphub {

std::string getVersionString() {
    return fmt::format("{}.{}.{}", kVersionMajor, kVersionMinor, kVersionPatch);
}

Implementation getClientInfo() {
    return Implementation{kClientName, getVersionString()};
}

} // namespace mcphub

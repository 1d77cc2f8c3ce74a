//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Hub version and the clientInfo identity it presents to tool servers
//==========================================================================================================
#pragma once

#include <string>

#include "mcphub/Protocol.h"

namespace mcphub {

inline constexpr const char* kClientName = "mcphub";
inline constexpr int kVersionMajor = 0;
inline constexpr int kVersionMinor = 3;
inline constexpr int kVersionPatch = 0;

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

// clientInfo sent in every initialize request
Implementation getClientInfo();

} // namespace mcphub

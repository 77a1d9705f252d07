// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <cstdint>
#include <string>

namespace Envoy {

// formats the printf pattern with the chip id, e.g., "EnvoyBridge-%06X".
// the result is not truncated.
std::string formatDeviceName(char const* pattern, uint32_t chipId);

} // namespace Envoy

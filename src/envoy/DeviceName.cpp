// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/DeviceName.h>
#include <cstdio>
#include <vector>

namespace Envoy {

std::string formatDeviceName(char const* pattern, uint32_t chipId)
{
    int len = snprintf(nullptr, 0, pattern, static_cast<unsigned>(chipId));
    if (len <= 0) { return ""; }

    std::vector<char> buffer(len + 1);
    snprintf(buffer.data(), buffer.size(), pattern, static_cast<unsigned>(chipId));
    return std::string(buffer.data(), len);
}

} // namespace Envoy

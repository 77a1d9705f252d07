// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/Reading.h>
#include <cmath>

namespace Envoy {

GridFlow GridFlow::fromNetPower(float netPowerW)
{
    GridFlow res;
    res.MagnitudeW = std::fabs(netPowerW);
    res.Exporting = netPowerW < 0;
    return res;
}

} // namespace Envoy

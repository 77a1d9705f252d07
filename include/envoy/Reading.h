// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

namespace Envoy {

// values of the "eim" production entry, i.e., as measured by the gateway's
// revenue-grade meter rather than estimated from the inverters' reports.
struct ProductionMetrics {
    float PowerW = 0;
    double EnergyTodayWh = 0;
    double EnergyLastSevenDaysWh = 0;
    double EnergyLifetimeWh = 0;
};

struct ConsumptionMetrics {
    float PowerW = 0;
    double EnergyTodayWh = 0;
};

struct GridFlow {
    float MagnitudeW = 0;
    bool Exporting = false;

    // net power is negative if more power is produced than consumed, i.e.,
    // if the surplus is exported. zero is reported as importing.
    static GridFlow fromNetPower(float netPowerW);
};

struct Reading {
    ProductionMetrics Production;
    ConsumptionMetrics Consumption;
    GridFlow Grid;
};

} // namespace Envoy

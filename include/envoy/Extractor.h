// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <string>
#include <vector>
#include <ArduinoJson.h>
#include <envoy/Reading.h>

namespace Envoy::Extractor {

static constexpr char const MeteredProductionType[] = "eim";
static constexpr char const TotalConsumptionType[] = "total-consumption";
static constexpr char const NetConsumptionType[] = "net-consumption";

struct Result {
    ProductionMetrics Production;
    ConsumptionMetrics Consumption;

    // signed, never clamped. negative while exporting.
    float NetPowerW = 0;

    // entries and fields which were not found and hence default to zero,
    // e.g., "eim.whLifetime" or "net-consumption".
    std::vector<std::string> MissingFields;
};

// selects the first production entry of type "eim" and the first
// consumption entry of each of the "total-consumption" and
// "net-consumption" measurement types. production and consumption values
// are floored at zero.
Result extract(JsonDocument const& doc);

} // namespace Envoy::Extractor

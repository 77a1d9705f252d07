// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <cstdint>
#include <variant>

namespace Envoy {

enum class Component : uint8_t {
    Production,
    Consumption,
    Grid
};

enum class Attribute : uint8_t {
    Power,
    Energy,
    EnergyLastSevenDays,
    EnergyLifetime,
    Report,
    Exporting
};

char const* componentName(Component component);
char const* attributeName(Attribute attribute);

// the sub-fields besides power and energy are not measured by the gateway.
// they exist for sinks that expect a complete consumption report.
struct ConsumptionReport {
    float PowerW = 0;
    double EnergyWh = 0;
    double DeltaEnergyWh = 0;
    double EnergySavedWh = 0;
    double PersistedEnergyWh = 0;
};

struct Event {
    using value_t = std::variant<double, bool, ConsumptionReport>;

    Component Target;
    Attribute Kind;
    value_t Value;
    char const* Unit;
};

class Sink {
public:
    virtual ~Sink() { }

    // whether the sink declares the respective channel. optional channels
    // are only emitted if declared.
    virtual bool supports(Component target, Attribute kind) const = 0;

    // whether events can be delivered at all, e.g., if the connection to
    // the broker is established. no events are emitted otherwise.
    virtual bool isAvailable() const { return true; }

    // returns false if the sink rejected the event
    virtual bool emit(Event const& event) = 0;
};

} // namespace Envoy

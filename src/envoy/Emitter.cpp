// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/Emitter.h>

namespace Envoy {

char const* componentName(Component component)
{
    switch (component) {
        case Component::Production:
            return "production";
        case Component::Consumption:
            return "consumption";
        case Component::Grid:
            return "grid";
    }
    return "unknown";
}

char const* attributeName(Attribute attribute)
{
    switch (attribute) {
        case Attribute::Power:
            return "power";
        case Attribute::Energy:
            return "energy";
        case Attribute::EnergyLastSevenDays:
            return "energy_7d";
        case Attribute::EnergyLifetime:
            return "energy_lifetime";
        case Attribute::Report:
            return "report";
        case Attribute::Exporting:
            return "exporting";
    }
    return "unknown";
}

namespace Emitter {

namespace {

double toKiloWattHours(double wattHours)
{
    return wattHours / 1000;
}

class Publisher {
public:
    explicit Publisher(Sink& sink)
        : _sink(sink) { }

    void emit(Event const& event)
    {
        if (!_sink.emit(event)) { _rejected.push_back(event); }
    }

    // optional channels are skipped silently if not declared by the sink
    void emitIfSupported(Event const& event)
    {
        if (!_sink.supports(event.Target, event.Kind)) { return; }
        emit(event);
    }

    std::vector<Event> takeRejected() { return std::move(_rejected); }

private:
    Sink& _sink;
    std::vector<Event> _rejected;
};

} // namespace

std::vector<Event> emit(Reading const& reading, Sink& sink)
{
    Publisher pub(sink);

    auto const& prod = reading.Production;
    pub.emit({ Component::Production, Attribute::Power, static_cast<double>(prod.PowerW), "W" });
    pub.emit({ Component::Production, Attribute::Energy, toKiloWattHours(prod.EnergyTodayWh), "kWh" });
    pub.emitIfSupported({ Component::Production, Attribute::EnergyLastSevenDays,
            toKiloWattHours(prod.EnergyLastSevenDaysWh), "kWh" });
    pub.emitIfSupported({ Component::Production, Attribute::EnergyLifetime,
            toKiloWattHours(prod.EnergyLifetimeWh), "kWh" });

    auto const& cons = reading.Consumption;
    pub.emit({ Component::Consumption, Attribute::Power, static_cast<double>(cons.PowerW), "W" });
    pub.emit({ Component::Consumption, Attribute::Energy, toKiloWattHours(cons.EnergyTodayWh), "kWh" });

    ConsumptionReport report;
    report.PowerW = cons.PowerW;
    report.EnergyWh = cons.EnergyTodayWh;
    pub.emitIfSupported({ Component::Consumption, Attribute::Report, report, "Wh" });

    auto const& grid = reading.Grid;
    pub.emit({ Component::Grid, Attribute::Power, static_cast<double>(grid.MagnitudeW), "W" });
    pub.emit({ Component::Grid, Attribute::Exporting, grid.Exporting, "" });

    return pub.takeRejected();
}

} // namespace Emitter

} // namespace Envoy

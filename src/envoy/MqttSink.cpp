// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/MqttSink.h>
#include <ArduinoJson.h>
#include <MqttSettings.h>
#include <cstring>

namespace Envoy {

bool MqttSink::supports(Component target, Attribute kind) const
{
    switch (kind) {
        case Attribute::EnergyLastSevenDays:
        case Attribute::EnergyLifetime:
            return target == Component::Production && _publishLongTermEnergy;
        case Attribute::Report:
            return target == Component::Consumption && _publishConsumptionReport;
        case Attribute::Exporting:
            return target == Component::Grid;
        case Attribute::Power:
            return true;
        case Attribute::Energy:
            return target != Component::Grid;
    }
    return false;
}

bool MqttSink::isAvailable() const
{
    return MqttSettings.getConnected();
}

String MqttSink::getTopic(Component target, Attribute kind)
{
    String topic("envoy/");
    topic += componentName(target);
    topic += "/";
    topic += attributeName(kind);
    return topic;
}

String MqttSink::formatPayload(Event const& event)
{
    if (auto pOn = std::get_if<bool>(&event.Value)) {
        return *pOn ? "on" : "off";
    }

    if (auto pReport = std::get_if<ConsumptionReport>(&event.Value)) {
        JsonDocument doc;
        doc["power"] = pReport->PowerW;
        doc["energy"] = pReport->EnergyWh;
        doc["deltaEnergy"] = pReport->DeltaEnergyWh;
        doc["energySaved"] = pReport->EnergySavedWh;
        doc["persistedEnergy"] = pReport->PersistedEnergyWh;

        String res;
        serializeJson(doc, res);
        return res;
    }

    // energy in kWh needs more precision than power in W
    auto decimals = (strcmp(event.Unit, "kWh") == 0) ? 3 : 1;
    return String(std::get<double>(event.Value), decimals);
}

bool MqttSink::emit(Event const& event)
{
    if (!supports(event.Target, event.Kind)) { return false; }

    return MqttSettings.publish(getTopic(event.Target, event.Kind), formatPayload(event));
}

} // namespace Envoy

// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/HassIntegration.h>
#include <envoy/MqttSink.h>
#include <Configuration.h>
#include <MqttSettings.h>
#include <Utils.h>

namespace Envoy {

void HassIntegration::hassLoop()
{
    auto const& config = Configuration.get();
    if (!config.Mqtt.Hass.Enabled) { return; }

    if (!MqttSettings.getConnected()) {
        _publishSensors = true;
        return;
    }

    if (!_publishSensors) { return; }

    publishSensors();

    _publishSensors = false;
}

void HassIntegration::publishSensors() const
{
    auto const& cfg = Configuration.get().Envoy;

    publishSensor("Solar Power", "mdi:solar-power", Component::Production, Attribute::Power, "power", "measurement", "W");
    publishSensor("Solar Energy Today", "mdi:solar-power", Component::Production, Attribute::Energy, "energy", "total_increasing", "kWh");

    if (cfg.PublishLongTermEnergy) {
        publishSensor("Solar Energy Last Seven Days", "mdi:solar-power", Component::Production, Attribute::EnergyLastSevenDays, "energy", "total", "kWh");
        publishSensor("Solar Energy Lifetime", "mdi:solar-power", Component::Production, Attribute::EnergyLifetime, "energy", "total_increasing", "kWh");
    }

    publishSensor("Home Power", "mdi:home-lightning-bolt", Component::Consumption, Attribute::Power, "power", "measurement", "W");
    publishSensor("Home Energy Today", "mdi:home-lightning-bolt", Component::Consumption, Attribute::Energy, "energy", "total_increasing", "kWh");

    publishSensor("Grid Power", "mdi:transmission-tower", Component::Grid, Attribute::Power, "power", "measurement", "W");
    publishBinarySensor("Grid Exporting", "mdi:transmission-tower-export", Component::Grid, Attribute::Exporting, "on", "off");
}

String HassIntegration::getSensorId(const char* caption)
{
    String sensorId = caption;
    sensorId.replace(" ", "_");
    sensorId.replace(".", "");
    sensorId.replace("(", "");
    sensorId.replace(")", "");
    sensorId.replace(":", "");
    sensorId.toLowerCase();
    return sensorId;
}

void HassIntegration::publishSensor(const char* caption, const char* icon,
        Component target, Attribute kind, const char* deviceClass,
        const char* stateClass, const char* unitOfMeasurement) const
{
    String serial = String(Utils::getChipId(), HEX);
    String sensorId = getSensorId(caption);

    String configTopic = "sensor/envoy_" + serial
        + "/" + sensorId
        + "/config";

    JsonDocument root;
    root["name"] = caption;
    root["stat_t"] = MqttSettings.getPrefix() + MqttSink::getTopic(target, kind);
    root["uniq_id"] = "envoy_" + serial + "_" + sensorId;

    if (icon != nullptr) {
        root["icon"] = icon;
    }

    if (unitOfMeasurement != nullptr) {
        root["unit_of_meas"] = unitOfMeasurement;
    }

    JsonObject deviceObj = root["dev"].to<JsonObject>();
    createDeviceInfo(deviceObj);

    if (deviceClass != nullptr) {
        root["dev_cla"] = deviceClass;
    }
    if (stateClass != nullptr) {
        root["stat_cla"] = stateClass;
    }

    if (!Utils::checkJsonAlloc(root, __FUNCTION__, __LINE__)) {
        return;
    }

    String buffer;
    serializeJson(root, buffer);
    publish(configTopic, buffer);
}

void HassIntegration::publishBinarySensor(const char* caption, const char* icon,
        Component target, Attribute kind,
        const char* payload_on, const char* payload_off) const
{
    String serial = String(Utils::getChipId(), HEX);
    String sensorId = getSensorId(caption);

    String configTopic = "binary_sensor/envoy_" + serial
        + "/" + sensorId
        + "/config";

    JsonDocument root;
    root["name"] = caption;
    root["uniq_id"] = "envoy_" + serial + "_" + sensorId;
    root["stat_t"] = MqttSettings.getPrefix() + MqttSink::getTopic(target, kind);
    root["pl_on"] = payload_on;
    root["pl_off"] = payload_off;

    if (icon != nullptr) {
        root["icon"] = icon;
    }

    auto deviceObj = root["dev"].to<JsonObject>();
    createDeviceInfo(deviceObj);

    if (!Utils::checkJsonAlloc(root, __FUNCTION__, __LINE__)) {
        return;
    }

    String buffer;
    serializeJson(root, buffer);
    publish(configTopic, buffer);
}

void HassIntegration::createDeviceInfo(JsonObject& object) const
{
    object["name"] = "Envoy Gateway";
    object["ids"] = "envoy_" + String(Utils::getChipId(), HEX);
    object["mf"] = "Enphase";
    object["mdl"] = "IQ Gateway";
}

void HassIntegration::publish(const String& subtopic, const String& payload) const
{
    String topic = Configuration.get().Mqtt.Hass.Topic;
    topic += subtopic;
    MqttSettings.publishGeneric(topic, payload, Configuration.get().Mqtt.Hass.Retain);
}

} // namespace Envoy

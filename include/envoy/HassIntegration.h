// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <Arduino.h>
#include <ArduinoJson.h>
#include <envoy/Sink.h>

namespace Envoy {

class HassIntegration {
public:
    void hassLoop();

    // republishes the discovery messages on the next loop iteration
    void forceUpdate() { _publishSensors = true; }

private:
    void publish(const String& subtopic, const String& payload) const;
    void publishBinarySensor(const char* caption, const char* icon,
            Component target, Attribute kind,
            const char* payload_on, const char* payload_off) const;
    void publishSensor(const char* caption, const char* icon,
            Component target, Attribute kind,
            const char* deviceClass = nullptr,
            const char* stateClass = nullptr,
            const char* unitOfMeasurement = nullptr) const;
    void createDeviceInfo(JsonObject& object) const;
    static String getSensorId(const char* caption);

    void publishSensors() const;

    bool _publishSensors = true;
};

} // namespace Envoy

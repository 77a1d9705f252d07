// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <Arduino.h>
#include <TaskSchedulerDeclarations.h>
#include <espMqttClient.h>
#include <map>
#include <memory>
#include <mutex>

class MqttSettingsClass {
public:
    MqttSettingsClass();
    void init(Scheduler& scheduler);

    bool getConnected();

    // topic is prefixed with the configured base topic
    bool publish(const String& subTopic, const String& payload);
    bool publishGeneric(const String& topic, const String& payload, bool retain, uint8_t qos = 0);

    using OnMessageCallback = espMqttClientTypes::OnMessageCallback;
    void subscribe(const String& topic, uint8_t qos, const OnMessageCallback& cb);

    String getPrefix() const;

private:
    void loop();

    void onMqttConnect(bool sessionPresent);
    void onMqttDisconnect(espMqttClientTypes::DisconnectReason reason);
    void onMqttMessage(const espMqttClientTypes::MessageProperties& properties,
            const char* topic, const uint8_t* payload, size_t len,
            size_t index, size_t total);

    void createMqttClientObject();
    void performConnect();

    Task _loopTask;

    std::unique_ptr<espMqttClient> _mqttClient;
    std::mutex _clientLock;

    struct Subscription {
        uint8_t Qos;
        OnMessageCallback Callback;
    };
    std::map<String, Subscription> _subscriptions;
    std::mutex _subscriptionsLock;

    bool _connectRequested = false;
    uint32_t _lastConnectAttempt = 0;
};

extern MqttSettingsClass MqttSettings;

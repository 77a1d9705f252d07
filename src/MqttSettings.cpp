// SPDX-License-Identifier: GPL-2.0-or-later
#include "MqttSettings.h"
#include "Configuration.h"
#include "MessageOutput.h"
#include "NetworkSettings.h"

MqttSettingsClass::MqttSettingsClass()
    : _loopTask(TASK_SECOND, TASK_FOREVER, std::bind(&MqttSettingsClass::loop, this))
{
}

void MqttSettingsClass::init(Scheduler& scheduler)
{
    scheduler.addTask(_loopTask);
    _loopTask.enable();

    createMqttClientObject();
    _connectRequested = true;
}

void MqttSettingsClass::createMqttClientObject()
{
    std::lock_guard<std::mutex> lock(_clientLock);

    using std::placeholders::_1;
    using std::placeholders::_2;
    using std::placeholders::_3;
    using std::placeholders::_4;
    using std::placeholders::_5;
    using std::placeholders::_6;

    _mqttClient = std::make_unique<espMqttClient>();
    _mqttClient->onConnect(std::bind(&MqttSettingsClass::onMqttConnect, this, _1));
    _mqttClient->onDisconnect(std::bind(&MqttSettingsClass::onMqttDisconnect, this, _1));
    _mqttClient->onMessage(std::bind(&MqttSettingsClass::onMqttMessage, this, _1, _2, _3, _4, _5, _6));
}

void MqttSettingsClass::onMqttConnect(bool sessionPresent)
{
    auto const& config = Configuration.get();
    MessageOutput.printf("[MqttSettings] Connected to %s:%" PRIu32 "\r\n",
            config.Mqtt.Hostname, config.Mqtt.Port);

    std::lock_guard<std::mutex> lock(_subscriptionsLock);
    std::lock_guard<std::mutex> clientLock(_clientLock);
    if (!_mqttClient) { return; }

    for (auto const& s : _subscriptions) {
        _mqttClient->subscribe(s.first.c_str(), s.second.Qos);
    }
}

void MqttSettingsClass::onMqttDisconnect(espMqttClientTypes::DisconnectReason reason)
{
    MessageOutput.printf("[MqttSettings] Disconnected: %d\r\n", static_cast<int>(reason));
}

void MqttSettingsClass::onMqttMessage(const espMqttClientTypes::MessageProperties& properties,
        const char* topic, const uint8_t* payload, size_t len,
        size_t index, size_t total)
{
    OnMessageCallback cb;

    {
        std::lock_guard<std::mutex> lock(_subscriptionsLock);
        auto iter = _subscriptions.find(String(topic));
        if (iter == _subscriptions.end()) { return; }
        cb = iter->second.Callback;
    }

    cb(properties, topic, payload, len, index, total);
}

void MqttSettingsClass::performConnect()
{
    auto const& config = Configuration.get();

    if (!config.Mqtt.Enabled || !NetworkSettings.isConnected()) { return; }

    std::lock_guard<std::mutex> lock(_clientLock);
    if (!_mqttClient) { return; }

    MessageOutput.printf("[MqttSettings] Connecting to %s:%" PRIu32 "...\r\n",
            config.Mqtt.Hostname, config.Mqtt.Port);

    _mqttClient->setServer(config.Mqtt.Hostname, config.Mqtt.Port);
    _mqttClient->setCredentials(config.Mqtt.Username, config.Mqtt.Password);
    _mqttClient->setClientId(config.Mqtt.ClientId);
    _mqttClient->setCleanSession(config.Mqtt.CleanSession);
    _mqttClient->connect();

    _lastConnectAttempt = millis();
}

void MqttSettingsClass::loop()
{
    auto const& config = Configuration.get();
    if (!config.Mqtt.Enabled) { return; }

    if (getConnected()) { return; }

    if (!_connectRequested && (millis() - _lastConnectAttempt) < 10 * 1000) { return; }

    _connectRequested = false;
    performConnect();
}

bool MqttSettingsClass::getConnected()
{
    std::lock_guard<std::mutex> lock(_clientLock);
    if (!_mqttClient) { return false; }
    return _mqttClient->connected();
}

String MqttSettingsClass::getPrefix() const
{
    return Configuration.get().Mqtt.Topic;
}

bool MqttSettingsClass::publish(const String& subTopic, const String& payload)
{
    String topic = getPrefix();
    topic += subTopic;

    return publishGeneric(topic, payload, Configuration.get().Mqtt.Retain);
}

bool MqttSettingsClass::publishGeneric(const String& topic, const String& payload, bool retain, uint8_t qos)
{
    std::lock_guard<std::mutex> lock(_clientLock);
    if (!_mqttClient || !_mqttClient->connected()) { return false; }

    if (Configuration.get().Mqtt.VerboseLogging) {
        MessageOutput.printf("[MqttSettings] %s = %s\r\n", topic.c_str(), payload.c_str());
    }

    return _mqttClient->publish(topic.c_str(), qos, retain, payload.c_str()) != 0;
}

void MqttSettingsClass::subscribe(const String& topic, uint8_t qos, const OnMessageCallback& cb)
{
    std::lock_guard<std::mutex> lock(_subscriptionsLock);
    _subscriptions[topic] = { qos, cb };

    std::lock_guard<std::mutex> clientLock(_clientLock);
    if (!_mqttClient || !_mqttClient->connected()) { return; }
    _mqttClient->subscribe(topic.c_str(), qos);
}

MqttSettingsClass MqttSettings;

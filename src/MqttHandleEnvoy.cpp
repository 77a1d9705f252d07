// SPDX-License-Identifier: GPL-2.0-or-later
#include "MqttHandleEnvoy.h"
#include "MessageOutput.h"
#include "MqttSettings.h"
#include <envoy/Controller.h>

MqttHandleEnvoyClass MqttHandleEnvoy;

void MqttHandleEnvoyClass::init()
{
    subscribeTopics();
}

void MqttHandleEnvoyClass::subscribeTopics()
{
    String const& prefix = MqttSettings.getPrefix();

    auto subscribe = [&prefix, this](char const* subTopic, Topic t) {
        String fullTopic(prefix + _cmdtopic.data() + subTopic);
        MqttSettings.subscribe(fullTopic.c_str(), 0,
                std::bind(&MqttHandleEnvoyClass::onMqttMessage, this, t,
                    std::placeholders::_1, std::placeholders::_2,
                    std::placeholders::_3, std::placeholders::_4,
                    std::placeholders::_5, std::placeholders::_6));
    };

    for (auto const& s : _subscriptions) {
        subscribe(s.first.data(), s.second);
    }
}

void MqttHandleEnvoyClass::onMqttMessage(Topic t,
        const espMqttClientTypes::MessageProperties& properties,
        const char* topic, const uint8_t* payload, size_t len,
        size_t index, size_t total)
{
    switch (t) {
        case Topic::Refresh:
            if (!EnvoyGateway.isEnabled()) {
                MessageOutput.printf("[MqttHandleEnvoy] Ignoring refresh "
                        "command, gateway polling is disabled\r\n");
                return;
            }

            MessageOutput.printf("[MqttHandleEnvoy] Refresh requested via MQTT\r\n");
            EnvoyGateway.requestRefresh();
            break;
    }
}

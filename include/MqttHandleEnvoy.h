// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <espMqttClient.h>
#include <frozen/map.h>
#include <frozen/string.h>

class MqttHandleEnvoyClass {
public:
    void init();

private:
    void subscribeTopics();

    enum class Topic : unsigned {
        Refresh
    };

    static constexpr frozen::string _cmdtopic = "envoy/cmd/";
    static constexpr frozen::map<frozen::string, Topic, 1> _subscriptions = {
        { "refresh", Topic::Refresh },
    };

    void onMqttMessage(Topic t,
            const espMqttClientTypes::MessageProperties& properties,
            const char* topic, const uint8_t* payload, size_t len,
            size_t index, size_t total);
};

extern MqttHandleEnvoyClass MqttHandleEnvoy;

// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <Arduino.h>
#include <ArduinoJson.h>
#include <TaskSchedulerDeclarations.h>
#include <condition_variable>
#include <cstdint>
#include <mutex>

#define CONFIG_FILENAME "/config.json"
#define CONFIG_VERSION 0x00010000 // 0.1.0 // make sure to clean all after change

#define WIFI_MAX_SSID_STRLEN 32
#define WIFI_MAX_PASSWORD_STRLEN 64
#define WIFI_MAX_HOSTNAME_STRLEN 31

#define MQTT_MAX_HOSTNAME_STRLEN 128
#define MQTT_MAX_CLIENTID_STRLEN 64
#define MQTT_MAX_USERNAME_STRLEN 64
#define MQTT_MAX_PASSWORD_STRLEN 64
#define MQTT_MAX_TOPIC_STRLEN 32

#define AUTH_MAX_PASSWORD_STRLEN 64

#define ENVOY_MAX_ADDRESS_STRLEN 63

// the gateway's access token is a JWT of roughly 400 characters. it is
// stored in two parts, each of which is limited in length.
#define ENVOY_MAX_TOKEN_PART_STRLEN 511

struct MqttHassConfig {
    bool Enabled;
    bool Retain;
    char Topic[MQTT_MAX_TOPIC_STRLEN + 1];
};

struct EnvoyConfig {
    bool Enabled;
    bool VerboseLogging;
    char Address[ENVOY_MAX_ADDRESS_STRLEN + 1];
    char TokenPart1[ENVOY_MAX_TOKEN_PART_STRLEN + 1];
    char TokenPart2[ENVOY_MAX_TOKEN_PART_STRLEN + 1];
    uint32_t PollingInterval;
    uint32_t Timeout;
    bool PublishLongTermEnergy;
    bool PublishConsumptionReport;
};

struct CONFIG_T {
    struct {
        uint32_t Version;
        uint32_t SaveCount;
    } Cfg;

    struct {
        char Ssid[WIFI_MAX_SSID_STRLEN + 1];
        char Password[WIFI_MAX_PASSWORD_STRLEN + 1];
        char Hostname[WIFI_MAX_HOSTNAME_STRLEN + 1];
    } WiFi;

    struct {
        bool Enabled;
        bool VerboseLogging;
        char Hostname[MQTT_MAX_HOSTNAME_STRLEN + 1];
        uint32_t Port;
        char ClientId[MQTT_MAX_CLIENTID_STRLEN + 1];
        char Username[MQTT_MAX_USERNAME_STRLEN + 1];
        char Password[MQTT_MAX_PASSWORD_STRLEN + 1];
        char Topic[MQTT_MAX_TOPIC_STRLEN + 1];
        bool Retain;
        bool CleanSession;

        MqttHassConfig Hass;
    } Mqtt;

    struct {
        char Password[AUTH_MAX_PASSWORD_STRLEN + 1];
        bool AllowReadonly;
    } Security;

    EnvoyConfig Envoy;
};

class ConfigurationClass {
public:
    void init(Scheduler& scheduler);
    bool read();
    bool write();
    CONFIG_T const& get();

    class WriteGuard {
    public:
        WriteGuard();
        CONFIG_T& getConfig();
        ~WriteGuard();

    private:
        std::unique_lock<std::mutex> _lock;
    };

    WriteGuard getWriteGuard();

    static void serializeEnvoyConfig(EnvoyConfig const& source, JsonObject& target);
    static void deserializeEnvoyConfig(JsonObject const& source, EnvoyConfig& target);

private:
    void loop();

    Task _loopTask;
};

extern ConfigurationClass Configuration;

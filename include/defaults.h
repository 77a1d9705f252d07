// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#define SERIAL_BAUDRATE 115200

#define APP_HOSTNAME "EnvoyBridge-%06X"

#define HTTP_PORT 80

#define SECURITY_PASSWORD "envoybridge"
#define AUTH_USERNAME "admin"
#define SECURITY_ALLOW_READONLY true

#define WIFI_RECONNECT_TIMEOUT 15

#define WIFI_SSID ""
#define WIFI_PASSWORD ""

#define MQTT_ENABLED false
#define MQTT_HOST ""
#define MQTT_PORT 1883
#define MQTT_USER ""
#define MQTT_PASSWORD ""
#define MQTT_TOPIC "envoybridge/"
#define MQTT_RETAIN true
#define MQTT_CLEAN_SESSION true

#define MQTT_HASS_ENABLED false
#define MQTT_HASS_RETAIN true
#define MQTT_HASS_TOPIC "homeassistant/"

#define ENVOY_ENABLED false
#define ENVOY_POLLING_INTERVAL 300U
#define ENVOY_TIMEOUT_MS 10000U
#define ENVOY_PUBLISH_LONG_TERM_ENERGY true
#define ENVOY_PUBLISH_CONSUMPTION_REPORT true

#define VERBOSE_LOGGING false

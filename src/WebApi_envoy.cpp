// SPDX-License-Identifier: GPL-2.0-or-later
#include "WebApi_envoy.h"
#include "ArduinoJson.h"
#include "AsyncJson.h"
#include "Configuration.h"
#include "WebApi.h"
#include "WebApi_errors.h"
#include <envoy/Controller.h>
#include <envoy/Settings.h>

void WebApiEnvoyClass::init(AsyncWebServer& server, Scheduler& scheduler)
{
    using std::placeholders::_1;

    _server = &server;

    _server->on("/api/envoy/status", HTTP_GET, std::bind(&WebApiEnvoyClass::onStatus, this, _1));
    _server->on("/api/envoy/config", HTTP_GET, std::bind(&WebApiEnvoyClass::onAdminGet, this, _1));
    _server->on("/api/envoy/config", HTTP_POST, std::bind(&WebApiEnvoyClass::onAdminPost, this, _1));
    _server->on("/api/envoy/refresh", HTTP_POST, std::bind(&WebApiEnvoyClass::onRefreshPost, this, _1));
}

void WebApiEnvoyClass::onStatus(AsyncWebServerRequest* request)
{
    if (!WebApi.checkCredentialsReadonly(request)) {
        return;
    }

    AsyncJsonResponse* response = new AsyncJsonResponse();
    auto root = response->getRoot().as<JsonObject>();

    root["enabled"] = EnvoyGateway.isEnabled();

    auto oReading = EnvoyGateway.getLastReading();
    root["valid"] = oReading.has_value();
    if (!oReading) {
        WebApi.sendJsonResponse(request, response, __FUNCTION__, __LINE__);
        return;
    }

    root["data_age"] = (millis() - EnvoyGateway.getLastUpdate()) / 1000;

    auto const& production = oReading->Production;
    auto prod = root["production"].to<JsonObject>();
    prod["power"]["v"] = production.PowerW;
    prod["power"]["u"] = "W";
    prod["energy"]["v"] = production.EnergyTodayWh / 1000;
    prod["energy"]["u"] = "kWh";
    prod["energy_7d"]["v"] = production.EnergyLastSevenDaysWh / 1000;
    prod["energy_7d"]["u"] = "kWh";
    prod["energy_lifetime"]["v"] = production.EnergyLifetimeWh / 1000;
    prod["energy_lifetime"]["u"] = "kWh";

    auto const& consumption = oReading->Consumption;
    auto cons = root["consumption"].to<JsonObject>();
    cons["power"]["v"] = consumption.PowerW;
    cons["power"]["u"] = "W";
    cons["energy"]["v"] = consumption.EnergyTodayWh / 1000;
    cons["energy"]["u"] = "kWh";

    auto grid = root["grid"].to<JsonObject>();
    grid["power"]["v"] = oReading->Grid.MagnitudeW;
    grid["power"]["u"] = "W";
    grid["exporting"] = oReading->Grid.Exporting;

    WebApi.sendJsonResponse(request, response, __FUNCTION__, __LINE__);
}

void WebApiEnvoyClass::onAdminGet(AsyncWebServerRequest* request)
{
    if (!WebApi.checkCredentials(request)) {
        return;
    }

    AsyncJsonResponse* response = new AsyncJsonResponse();
    auto root = response->getRoot().as<JsonObject>();
    auto const& config = Configuration.get();

    ConfigurationClass::serializeEnvoyConfig(config.Envoy, root);

    WebApi.sendJsonResponse(request, response, __FUNCTION__, __LINE__);
}

void WebApiEnvoyClass::onAdminPost(AsyncWebServerRequest* request)
{
    if (!WebApi.checkCredentials(request)) {
        return;
    }

    AsyncJsonResponse* response = new AsyncJsonResponse();
    JsonDocument root;
    if (!WebApi.parseRequestData(request, response, root)) {
        return;
    }

    auto& retMsg = response->getRoot();

    if (!root["enabled"].is<bool>() ||
            !root["verbose_logging"].is<bool>() ||
            !root["address"].is<String>() ||
            !root["token_part1"].is<String>() ||
            !root["token_part2"].is<String>() ||
            !root["polling_interval"].is<uint32_t>() ||
            !root["timeout"].is<uint32_t>() ||
            !root["publish_long_term_energy"].is<bool>() ||
            !root["publish_consumption_report"].is<bool>()) {
        retMsg["message"] = "Values are missing!";
        retMsg["code"] = WebApiError::GenericValueMissing;
        WebApi.sendJsonResponse(request, response, __FUNCTION__, __LINE__);
        return;
    }

    if (root["address"].as<String>().length() > ENVOY_MAX_ADDRESS_STRLEN) {
        retMsg["message"] = String("Gateway address must not be longer than ") + ENVOY_MAX_ADDRESS_STRLEN + " characters!";
        retMsg["code"] = WebApiError::EnvoyAddressLength;
        retMsg["param"]["max"] = ENVOY_MAX_ADDRESS_STRLEN;
        WebApi.sendJsonResponse(request, response, __FUNCTION__, __LINE__);
        return;
    }

    if (root["token_part1"].as<String>().length() > ENVOY_MAX_TOKEN_PART_STRLEN ||
            root["token_part2"].as<String>().length() > ENVOY_MAX_TOKEN_PART_STRLEN) {
        retMsg["message"] = String("Token parts must not be longer than ") + ENVOY_MAX_TOKEN_PART_STRLEN + " characters!";
        retMsg["code"] = WebApiError::EnvoyTokenLength;
        retMsg["param"]["max"] = ENVOY_MAX_TOKEN_PART_STRLEN;
        WebApi.sendJsonResponse(request, response, __FUNCTION__, __LINE__);
        return;
    }

    auto pollingInterval = root["polling_interval"].as<uint32_t>();
    if (pollingInterval != Envoy::clampPollingInterval(pollingInterval)) {
        retMsg["message"] = String("Polling interval must be between ") + Envoy::MinPollingIntervalSeconds
            + " and " + Envoy::MaxPollingIntervalSeconds + " seconds!";
        retMsg["code"] = WebApiError::EnvoyPollingInterval;
        retMsg["param"]["min"] = Envoy::MinPollingIntervalSeconds;
        retMsg["param"]["max"] = Envoy::MaxPollingIntervalSeconds;
        WebApi.sendJsonResponse(request, response, __FUNCTION__, __LINE__);
        return;
    }

    auto timeout = root["timeout"].as<uint32_t>();
    if (timeout != Envoy::clampTimeout(timeout)) {
        retMsg["message"] = String("Timeout must be between ") + Envoy::MinTimeoutMillis
            + " and " + Envoy::MaxTimeoutMillis + " milliseconds!";
        retMsg["code"] = WebApiError::EnvoyTimeout;
        retMsg["param"]["min"] = Envoy::MinTimeoutMillis;
        retMsg["param"]["max"] = Envoy::MaxTimeoutMillis;
        WebApi.sendJsonResponse(request, response, __FUNCTION__, __LINE__);
        return;
    }

    {
        auto guard = Configuration.getWriteGuard();
        auto& config = guard.getConfig();
        ConfigurationClass::deserializeEnvoyConfig(root.as<JsonObject>(), config.Envoy);
    }

    WebApi.writeConfig(retMsg);

    WebApi.sendJsonResponse(request, response, __FUNCTION__, __LINE__);

    EnvoyGateway.updateSettings();
}

void WebApiEnvoyClass::onRefreshPost(AsyncWebServerRequest* request)
{
    if (!WebApi.checkCredentials(request)) {
        return;
    }

    AsyncJsonResponse* response = new AsyncJsonResponse();
    auto& retMsg = response->getRoot();

    if (!EnvoyGateway.isEnabled()) {
        retMsg["type"] = "warning";
        retMsg["message"] = "Gateway polling is disabled!";
        retMsg["code"] = WebApiError::EnvoyDisabled;
        WebApi.sendJsonResponse(request, response, __FUNCTION__, __LINE__);
        return;
    }

    EnvoyGateway.requestRefresh();

    retMsg["type"] = "success";
    retMsg["message"] = "Refresh requested!";
    retMsg["code"] = WebApiError::GenericSuccess;
    WebApi.sendJsonResponse(request, response, __FUNCTION__, __LINE__);
}

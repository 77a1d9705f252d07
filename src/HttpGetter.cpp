// SPDX-License-Identifier: GPL-2.0-or-later
#include "HttpGetter.h"
#include <HTTPClient.h>
#include <algorithm>

bool HttpGetter::init()
{
    if (!_url.startsWith("https://")) {
        logError("URL '%s' does not use https", _url.c_str());
        return false;
    }

    _upWiFiClient = std::make_unique<WiFiClientSecure>();
    _upWiFiClient->setInsecure();
    _upWiFiClient->setHandshakeTimeout(std::max<uint32_t>(_timeoutMs / 1000, 1));

    return true;
}

void HttpGetter::addHeader(char const* key, char const* value)
{
    _additionalHeaders.push_back({ key, value });
}

HttpRequestResult HttpGetter::performGetRequest()
{
    if (!_upWiFiClient) {
        logError("HTTP getter not initialized");
        return { false, 0 };
    }

    HTTPClient http;
    http.setReuse(false);
    http.useHTTP10(true);
    http.setConnectTimeout(_timeoutMs);
    http.setTimeout(std::min<uint32_t>(_timeoutMs, UINT16_MAX));

    if (!http.begin(*_upWiFiClient, _url)) {
        logError("Unable to start request to %s", _url.c_str());
        return { false, 0 };
    }

    for (auto const& header : _additionalHeaders) {
        http.addHeader(header.first, header.second);
    }

    int httpCode = http.GET();

    if (httpCode <= 0) {
        logError("HTTP request failed: %s", HTTPClient::errorToString(httpCode).c_str());
        http.end();
        return { false, httpCode };
    }

    if (httpCode != HTTP_CODE_OK) {
        logError("Bad HTTP code: %d", httpCode);
        http.end();
        return { false, httpCode };
    }

    String body = http.getString();
    http.end();

    return { true, httpCode, std::move(body) };
}

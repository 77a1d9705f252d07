// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <Arduino.h>
#include <WiFiClientSecure.h>
#include <memory>
#include <utility>
#include <vector>

class HttpRequestResult {
public:
    HttpRequestResult(bool success, int status, String body = String())
        : _success(success)
        , _status(status)
        , _body(std::move(body)) { }

    // HTTP status code or a negative HTTPClient error code
    int getStatus() const { return _status; }
    String const& getBody() const { return _body; }

    operator bool() const { return _success; }

private:
    bool _success;
    int _status;
    String _body;
};

// performs GET requests against a TLS server without validating its
// certificate. devices in the local network use self-signed certificates.
class HttpGetter {
public:
    HttpGetter(String const& url, uint32_t timeoutMs)
        : _url(url)
        , _timeoutMs(timeoutMs) { }

    bool init();
    void addHeader(char const* key, char const* value);
    HttpRequestResult performGetRequest();

    char const* getErrorText() const { return _errBuffer; }

private:
    template<typename... Args>
    void logError(char const* format, Args... args) {
        snprintf(_errBuffer, sizeof(_errBuffer), format, args...);
    }

    String _url;
    uint32_t _timeoutMs;
    char _errBuffer[256] = {};
    std::vector<std::pair<String, String>> _additionalHeaders;
    std::unique_ptr<WiFiClientSecure> _upWiFiClient;
};

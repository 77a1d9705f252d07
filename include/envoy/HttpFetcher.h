// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <cstdint>
#include <envoy/Fetcher.h>

namespace Envoy {

class HttpFetcher : public Fetcher {
public:
    explicit HttpFetcher(uint32_t timeoutMs)
        : _timeoutMs(timeoutMs) { }

    FetchResult get(std::string const& url, std::string const& bearerToken) final;

private:
    uint32_t const _timeoutMs;
};

} // namespace Envoy

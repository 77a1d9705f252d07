// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <string>

namespace Envoy {

struct FetchResult {
    // HTTP status code if a response was received, a negative, client
    // specific error code if the request failed on the transport level.
    int Status = 0;
    std::string Body;
    std::string ErrorText;

    bool ok() const { return Status == 200; }
};

class Fetcher {
public:
    virtual ~Fetcher() { }

    // performs a single authenticated GET request. implementations must
    // not retry and must enforce an upper bound on the request duration.
    virtual FetchResult get(std::string const& url, std::string const& bearerToken) = 0;
};

} // namespace Envoy

// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/HttpFetcher.h>
#include <HttpGetter.h>

namespace Envoy {

FetchResult HttpFetcher::get(std::string const& url, std::string const& bearerToken)
{
    FetchResult res;

    HttpGetter getter(String(url.c_str()), _timeoutMs);

    if (!getter.init()) {
        res.ErrorText = getter.getErrorText();
        return res;
    }

    String authorization("Bearer ");
    authorization += bearerToken.c_str();

    getter.addHeader("Accept", "application/json");
    getter.addHeader("Authorization", authorization.c_str());

    auto httpResult = getter.performGetRequest();
    res.Status = httpResult.getStatus();

    if (!httpResult) {
        res.ErrorText = getter.getErrorText();
        return res;
    }

    res.Body = httpResult.getBody().c_str();
    return res;
}

} // namespace Envoy

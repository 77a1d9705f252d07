// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/Credential.h>

namespace Envoy::Credential {

std::string assemble(std::string const& firstPart, std::string const& secondPart)
{
    static char const whitespace[] = " \t\r\n\v\f";

    std::string token = firstPart + secondPart;

    auto first = token.find_first_not_of(whitespace);
    if (first == std::string::npos) { return ""; }

    auto last = token.find_last_not_of(whitespace);
    return token.substr(first, last - first + 1);
}

} // namespace Envoy::Credential

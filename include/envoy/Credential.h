// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <string>

namespace Envoy::Credential {

// the bearer token is stored in two halves as a single preference value is
// too short to hold it. returns both halves concatenated, with leading and
// trailing whitespace removed. the token itself is not validated.
std::string assemble(std::string const& firstPart, std::string const& secondPart);

} // namespace Envoy::Credential

// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <optional>
#include <string>

namespace Envoy {

struct Preferences {
    std::string Address;
    std::string TokenPart1;
    std::string TokenPart2;

    bool operator==(Preferences const& other) const
    {
        return Address == other.Address
            && TokenPart1 == other.TokenPart1
            && TokenPart2 == other.TokenPart2;
    }

    bool operator!=(Preferences const& other) const { return !(*this == other); }
};

class PreferenceWatcher {
public:
    // returns true if any of the watched values differs from the previous
    // observation. the very first observation is not a change.
    bool observe(Preferences const& prefs)
    {
        bool changed = _previous.has_value() && *_previous != prefs;
        _previous = prefs;
        return changed;
    }

private:
    std::optional<Preferences> _previous;
};

} // namespace Envoy

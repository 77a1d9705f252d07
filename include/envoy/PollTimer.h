// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <cstdint>

namespace Envoy {

// decides when the next poll is due. not thread-safe, the owner must
// serialize access. timestamps are millis() values, wrap-around is fine.
class PollTimer {
public:
    explicit PollTimer(uint32_t intervalMillis)
        : _intervalMillis(intervalMillis) { }

    void setInterval(uint32_t intervalMillis) { _intervalMillis = intervalMillis; }
    uint32_t getInterval() const { return _intervalMillis; }

    // makes the next poll due immediately. multiple triggers before the
    // next poll result in a single poll.
    void trigger() { _triggered = true; }

    bool isDue(uint32_t now) const;

    // zero if a poll is due
    uint32_t millisUntilDue(uint32_t now) const;

    void markPolled(uint32_t now);

private:
    uint32_t _intervalMillis;
    uint32_t _lastPoll = 0;
    bool _polled = false;
    bool _triggered = false;
};

} // namespace Envoy

// SPDX-License-Identifier: GPL-2.0-or-later
#include <envoy/PollTimer.h>

namespace Envoy {

bool PollTimer::isDue(uint32_t now) const
{
    return millisUntilDue(now) == 0;
}

uint32_t PollTimer::millisUntilDue(uint32_t now) const
{
    if (!_polled || _triggered) { return 0; }

    uint32_t elapsed = now - _lastPoll;
    if (elapsed >= _intervalMillis) { return 0; }

    return _intervalMillis - elapsed;
}

void PollTimer::markPolled(uint32_t now)
{
    _lastPoll = now;
    _polled = true;
    _triggered = false;
}

} // namespace Envoy

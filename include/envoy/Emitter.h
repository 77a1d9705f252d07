// SPDX-License-Identifier: GPL-2.0-or-later
#pragma once

#include <vector>
#include <envoy/Reading.h>
#include <envoy/Sink.h>

namespace Envoy::Emitter {

// publishes the reading on the production, consumption and grid channels.
// an event rejected by the sink does not keep the remaining events from
// being emitted. returns the rejected events.
std::vector<Event> emit(Reading const& reading, Sink& sink);

} // namespace Envoy::Emitter

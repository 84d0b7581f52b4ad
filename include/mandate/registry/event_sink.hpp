#pragma once

#include <mandate/schema/delegation_event.hpp>
#include <functional>

namespace mandate::registry {

using event_sink_t =
    std::function<void(const mandate::schema::delegation_event_t& event)>;

}  // namespace mandate::registry

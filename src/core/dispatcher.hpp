#pragma once

#include <nlohmann/json.hpp>
#include "types.hpp"

namespace neo {

class Dispatcher {
public:
    virtual ~Dispatcher() = default;

    // Detached: queues the action and returns immediately. `context` describes why the
    // trigger fired. Returns false when the action could not be queued.
    virtual bool dispatch(const Trigger& trigger, const nlohmann::json& context) = 0;
};

} // namespace neo

#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace neo {

struct ExecutionResult {
    std::string execution_id;
    std::string status;
    nlohmann::json output;
};

// Runs user functions on behalf of fired triggers. Treated as slow and unreliable:
// implementations throw on failure and may block for as long as their own timeout allows.
class FunctionExecutor {
public:
    virtual ~FunctionExecutor() = default;
    virtual ExecutionResult execute(const std::string& function_id, const nlohmann::json& parameters) = 0;
};

} // namespace neo

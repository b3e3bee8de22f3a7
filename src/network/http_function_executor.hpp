#pragma once

#include <memory>
#include "rest_client.hpp"
#include "../core/function_executor.hpp"
#include "../utils/config_types.hpp"

namespace neo {

// Client for the remote function-execution service: POST {endpoint}/functions/{id}/execute
class HttpFunctionExecutor : public FunctionExecutor {
public:
    HttpFunctionExecutor(FunctionExecutorConfig config, std::shared_ptr<RestClient> client);

    // Throws ExecutionError
    ExecutionResult execute(const std::string& function_id, const nlohmann::json& parameters) override;

    std::string execute_url(const std::string& function_id) const;

    // Throws HttpStatusException on a non-2xx status, ExecutionError on an unreadable body
    // or a reported failure
    static ExecutionResult parse_response(const HttpResponse& response);

private:
    FunctionExecutorConfig config_;
    std::shared_ptr<RestClient> client_;
};

} // namespace neo

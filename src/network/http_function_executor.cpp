#include "http_function_executor.hpp"
#include "network_exception.hpp"
#include "../core/exceptions.hpp"
#include "../utils/logger.hpp"

namespace neo {

HttpFunctionExecutor::HttpFunctionExecutor(FunctionExecutorConfig config, std::shared_ptr<RestClient> client)
    : config_(std::move(config)), client_(std::move(client)) {
    while (!config_.endpoint.empty() && config_.endpoint.back() == '/') {
        config_.endpoint.pop_back();
    }
}

std::string HttpFunctionExecutor::execute_url(const std::string& function_id) const {
    return config_.endpoint + "/functions/" + RestClient::UrlEncode(function_id) + "/execute";
}

ExecutionResult HttpFunctionExecutor::execute(const std::string& function_id, const nlohmann::json& parameters) {
    HttpRequest request;
    request.url = execute_url(function_id);
    request.method = "POST";
    request.timeout_ms = config_.timeout_ms;
    request.body = nlohmann::json{{"parameters", parameters}}.dump();
    request.headers["Content-Type"] = "application/json";
    request.headers["Accept"] = "application/json";
    if (!config_.api_key.empty()) {
        request.headers["Authorization"] = "Bearer " + config_.api_key;
    }

    try {
        ExecutionResult result = parse_response(client_->Request(request));
        NEO_LOG_DEBUG("Function {} accepted by executor: execution {}", function_id, result.execution_id);
        return result;
    } catch (const NetworkException& e) {
        throw ExecutionError("function " + function_id + ": " + e.what());
    }
}

ExecutionResult HttpFunctionExecutor::parse_response(const HttpResponse& response) {
    nlohmann::json body;
    if (!response.body.empty()) {
        body = nlohmann::json::parse(response.body, nullptr, false);
    }

    if (!response.IsSuccess()) {
        std::string message = "executor returned an error";
        if (body.is_object() && body.contains("error") && body["error"].is_string()) {
            message = body["error"].get<std::string>();
        }
        throw HttpStatusException(response.status_code, message);
    }

    if (body.is_discarded() || !body.is_object()) {
        throw ExecutionError("executor response is not a JSON object");
    }

    ExecutionResult result;
    result.execution_id = body.value("execution_id", body.value("id", std::string()));
    result.status = body.value("status", std::string("success"));
    if (body.contains("output")) {
        result.output = body["output"];
    } else if (body.contains("result")) {
        result.output = body["result"];
    }

    if (result.status == "error" || result.status == "failed") {
        std::string message = "function reported status " + result.status;
        if (body.contains("error") && body["error"].is_string()) {
            message = body["error"].get<std::string>();
        }
        throw ExecutionError(message);
    }
    return result;
}

} // namespace neo

#include "config_types.hpp"
#include <cstdlib>

namespace neo {

std::string get_env_var(const std::string& key) {
    char* val = getenv(key.c_str());
    return val == NULL ? std::string("") : std::string(val);
}

void to_json(nlohmann::json& j, const SourceConfig& source) {
    j = nlohmann::json{
        {"name", source.name},
        {"endpoint", source.endpoint},
        {"price_path", source.price_path},
        {"headers", source.headers}
    };
    if (source.weight) {
        j["weight"] = *source.weight;
    }
}

void from_json(const nlohmann::json& j, SourceConfig& source) {
    source.name = j.value("name", std::string());
    source.endpoint = j.value("endpoint", std::string());
    source.price_path = j.value("price_path", std::string("/price"));
    source.headers = j.value("headers", std::map<std::string, std::string>());
    if (j.contains("weight") && !j["weight"].is_null()) {
        source.weight = j["weight"].get<double>();
    } else {
        source.weight.reset();
    }
}

} // namespace neo

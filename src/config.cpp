#include "config.hpp"

#include <fstream>
#include <stdexcept>
#include <utility>

namespace msgraph_sync {

namespace {

std::string requireString(const nlohmann::json& config, const char* key) {
    if (!config.contains(key)) {
        throw std::invalid_argument(std::string("Config missing required key '") +
                                    key + "'");
    }
    const auto& value = config[key];
    if (!value.is_string() || value.get_ref<const std::string&>().empty()) {
        throw std::invalid_argument(std::string("Config key '") + key +
                                    "' must be a non-empty string");
    }
    return value.get<std::string>();
}

} // namespace

ClientConfig ClientConfig::fromJson(const nlohmann::json& config) {
    if (!config.is_object()) {
        throw std::invalid_argument("Config must be a JSON object");
    }

    ClientConfig cfg;
    cfg.clientId     = requireString(config, "client_id");
    cfg.clientSecret = requireString(config, "client_secret");
    cfg.tenantId     = requireString(config, "tenant_id");

    if (config.contains("user_agent") && !config["user_agent"].is_null()) {
        if (!config["user_agent"].is_string()) {
            throw std::invalid_argument("Config key 'user_agent' must be a string");
        }
        auto ua = config["user_agent"].get<std::string>();
        if (!ua.empty()) {
            cfg.userAgent = std::move(ua);
        }
    }
    return cfg;
}

ClientConfig loadConfigFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json config;
    try {
        config = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " +
                                 e.what());
    }
    return ClientConfig::fromJson(config);
}

} // namespace msgraph_sync

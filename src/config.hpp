#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace msgraph_sync {

/// Application credentials for the client-credentials grant.
struct ClientConfig {
    std::string                clientId;
    std::string                clientSecret;
    std::string                tenantId;
    std::optional<std::string> userAgent;

    /// Keys: client_id, client_secret, tenant_id (required), user_agent.
    /// @throws std::invalid_argument naming the missing or invalid key.
    static ClientConfig fromJson(const nlohmann::json& config);
};

/// Read a JSON config file and apply ClientConfig::fromJson.
/// @throws std::runtime_error if the file cannot be read or parsed.
ClientConfig loadConfigFile(const std::string& path);

} // namespace msgraph_sync

#pragma once

#include <stdexcept>
#include <string>

namespace msgraph_sync {
namespace endpoints {

/// Token endpoint; "{tenant_id}" is substituted at login.
inline const std::string kTokenUrlTemplate =
    "https://login.microsoftonline.com/{tenant_id}/oauth2/v2.0/token";

inline const std::string kScope        = "https://graph.microsoft.com/.default";
inline const std::string kBaseGraphUrl = "https://graph.microsoft.com";

/// Refresh period in seconds, just under the one-hour token lifetime.
constexpr int kTokenExpirationPeriod = 3599;

/// Default $top page-size hint used by the CLI.
constexpr int kDefaultTopParam = 500;

} // namespace endpoints

enum class GraphVersion { Beta, V1 };

inline const char* toString(GraphVersion version) {
    return version == GraphVersion::Beta ? "beta" : "v1.0";
}

/// @throws std::invalid_argument for anything other than "beta" / "v1.0".
inline GraphVersion parseGraphVersion(const std::string& text) {
    if (text == "beta") return GraphVersion::Beta;
    if (text == "v1.0") return GraphVersion::V1;
    throw std::invalid_argument("Unknown Graph API version: " + text);
}

} // namespace msgraph_sync

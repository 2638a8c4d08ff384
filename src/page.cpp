#include "page.hpp"
#include "errors.hpp"

#include <string>

namespace msgraph_sync {

namespace {
const char* const kValueKey    = "value";
const char* const kNextLinkKey = "@odata.nextLink";
} // namespace

bool isEmptyPayload(const nlohmann::json& payload) {
    if (payload.is_null()) return true;
    if (payload.is_string()) return payload.get_ref<const std::string&>().empty();
    if (payload.is_object() || payload.is_array()) return payload.empty();
    if (payload.is_boolean()) return !payload.get<bool>();
    if (payload.is_number()) return payload.get<double>() == 0.0;
    return false;
}

PageResult parsePage(const nlohmann::json& payload) {
    PageResult result;

    if (!payload.is_object()) {
        throw FatalError("Malformed page: expected a JSON object, got " +
                         std::string(payload.type_name()));
    }

    // --- records ---
    if (payload.contains(kValueKey) && !payload[kValueKey].is_null()) {
        const auto& value = payload[kValueKey];
        if (!value.is_array()) {
            throw FatalError(std::string("Malformed page: '") + kValueKey +
                             "' is " + value.type_name() + ", expected array");
        }
        result.records.assign(value.begin(), value.end());
    }

    // --- cursor ---
    if (payload.contains(kNextLinkKey)) {
        const auto& link = payload[kNextLinkKey];
        if (link.is_string() && !link.get_ref<const std::string&>().empty()) {
            result.nextLink = link.get<std::string>();
        } else if (!link.is_null()) {
            throw FatalError(std::string("Malformed page: '") + kNextLinkKey +
                             "' is not a string");
        }
    }

    return result;
}

} // namespace msgraph_sync

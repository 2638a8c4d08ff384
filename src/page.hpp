#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace msgraph_sync {

/// One page of an OData collection response.
struct PageResult {
    std::vector<nlohmann::json> records;
    std::optional<std::string>  nextLink;
};

/// True for payloads that end pagination outright: null, {}, [], "",
/// false and 0.
bool isEmptyPayload(const nlohmann::json& payload);

/// Extract "value" records and "@odata.nextLink" from a page payload.
/// Missing "value" yields no records; a missing or null nextLink ends paging.
/// Throws FatalError if "value" is present but not an array.
PageResult parsePage(const nlohmann::json& payload);

} // namespace msgraph_sync

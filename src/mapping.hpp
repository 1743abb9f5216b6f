#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace issue_harvest {

/// Parse a search response body into a PageResult.
/// Throws FetchError(MalformedResponse) if the body is not JSON or lacks an
/// integer "total" or an array "issues".
PageResult parseSearchPage(const std::string& responseBody);

/// Same, for an already parsed document.
PageResult parseSearchPage(const nlohmann::json& responseBody);

/// Human-readable error messages from an error response body ("errorMessages"
/// array and "errors" object).  Empty if the body is not JSON or has none.
std::vector<std::string> extractErrorMessages(const std::string& responseBody);

} // namespace issue_harvest

#include "mapping.hpp"
#include "errors.hpp"

namespace issue_harvest {

PageResult parseSearchPage(const nlohmann::json& responseBody) {
    PageResult result;

    if (!responseBody.is_object()) {
        throw FetchError(ErrorCategory::MalformedResponse,
                         "Response is not a JSON object");
    }

    const auto total = responseBody.find("total");
    if (total == responseBody.end() || !total->is_number_integer()) {
        throw FetchError(ErrorCategory::MalformedResponse,
                         "Response missing integer 'total' field");
    }
    result.total = total->get<int64_t>();
    if (result.total < 0) {
        throw FetchError(ErrorCategory::MalformedResponse,
                         "Response has negative 'total'");
    }

    const auto issues = responseBody.find("issues");
    if (issues == responseBody.end() || !issues->is_array()) {
        throw FetchError(ErrorCategory::MalformedResponse,
                         "Response missing 'issues' array");
    }
    result.issues = *issues;

    return result;
}

PageResult parseSearchPage(const std::string& responseBody) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(responseBody);
    } catch (const nlohmann::json::parse_error& e) {
        throw FetchError(ErrorCategory::MalformedResponse,
                         std::string("Failed to parse JSON response: ") + e.what());
    }
    return parseSearchPage(doc);
}

std::vector<std::string> extractErrorMessages(const std::string& responseBody) {
    std::vector<std::string> errors;

    // Error pages from proxies are frequently HTML.
    const auto doc = nlohmann::json::parse(responseBody, nullptr,
                                           /*allow_exceptions=*/false);
    if (!doc.is_object()) {
        return errors;
    }

    if (doc.contains("errorMessages") && doc["errorMessages"].is_array()) {
        for (const auto& msg : doc["errorMessages"]) {
            if (msg.is_string()) {
                errors.push_back(msg.get<std::string>());
            }
        }
    }

    if (doc.contains("errors") && doc["errors"].is_object()) {
        for (const auto& [field, msg] : doc["errors"].items()) {
            errors.push_back(field + ": " +
                             (msg.is_string() ? msg.get<std::string>() : msg.dump()));
        }
    }
    return errors;
}

} // namespace issue_harvest

#include "queries.hpp"

namespace issue_harvest {
namespace queries {

QueryParams searchParams(const std::string& sourceKey,
                         const std::vector<std::string>& fields,
                         int64_t startAt,
                         int maxResults)
{
    std::string fieldList;
    for (const auto& field : fields) {
        if (!fieldList.empty()) fieldList += ',';
        fieldList += field;
    }

    return {
        {"jql",        "project=" + sourceKey},
        {"fields",     fieldList},
        {"startAt",    std::to_string(startAt)},
        {"maxResults", std::to_string(maxResults)},
        {"expand",     "comments"},
    };
}

} // namespace queries
} // namespace issue_harvest

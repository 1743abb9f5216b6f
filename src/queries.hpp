#pragma once

#include "util.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace issue_harvest {
namespace queries {

/// Search endpoint, relative to the API base URL.
inline const std::string kSearchPath = "/search";

/// Fields requested for every issue; "comment" carries the nested comments.
inline const std::vector<std::string> kDefaultFields = {
    "summary",
    "description",
    "status",
    "priority",
    "assignee",
    "reporter",
    "created",
    "updated",
    "resolutiondate",
    "labels",
    "comment",
};

/// Parameters of one page query over the collection "project = sourceKey".
/// Order: jql, fields, startAt, maxResults, expand.
QueryParams searchParams(const std::string& sourceKey,
                         const std::vector<std::string>& fields,
                         int64_t startAt,
                         int maxResults);

} // namespace queries
} // namespace issue_harvest

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace issue_harvest {

/// Numbered raw page files: <dir>/<KEY>_batch_<N>.json, each a JSON array of
/// issue objects.  The batch number is derived from the page's start offset,
/// so a resumed run rewrites the batch it resumes into and nothing earlier.
class BatchStore {
public:
    explicit BatchStore(std::filesystem::path dir, bool verbose = false);

    /// Persist one page atomically.  Throws FetchError(Storage) on failure.
    std::filesystem::path write(const std::string& sourceKey,
                                int64_t batchNumber,
                                const nlohmann::json& issues);

    /// All batch files of @p sourceKey ordered by batch number.
    std::vector<std::filesystem::path> list(const std::string& sourceKey) const;

    std::filesystem::path pathFor(const std::string& sourceKey,
                                  int64_t batchNumber) const;

    /// Batch number encoded in @p filename, if it is one of @p sourceKey's.
    static std::optional<int64_t> batchNumberOf(const std::string& sourceKey,
                                                const std::string& filename);

    const std::filesystem::path& directory() const { return mDir; }

private:
    std::filesystem::path mDir;
    bool                  mVerbose;
};

} // namespace issue_harvest

#include "batch_store.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace issue_harvest {

namespace {

const std::string kBatchInfix   = "_batch_";
const std::string kBatchSuffix  = ".json";

} // namespace

BatchStore::BatchStore(fs::path dir, bool verbose)
    : mDir(std::move(dir))
    , mVerbose(verbose) {}

fs::path BatchStore::pathFor(const std::string& sourceKey,
                             int64_t batchNumber) const
{
    return mDir / (sourceKey + kBatchInfix + std::to_string(batchNumber) +
                   kBatchSuffix);
}

fs::path BatchStore::write(const std::string& sourceKey,
                           int64_t batchNumber,
                           const nlohmann::json& issues)
{
    if (!issues.is_array()) {
        throw FetchError(ErrorCategory::Storage,
                         "Batch payload for " + sourceKey + " is not an array");
    }

    const fs::path target = pathFor(sourceKey, batchNumber);
    fs::path tmp = target;
    tmp += ".tmp";

    try {
        fs::create_directories(mDir);
        {
            std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
            if (!os) {
                throw FetchError(ErrorCategory::Storage,
                                 "Cannot open " + tmp.string() + " for writing");
            }
            // Issue text is stored as-is (UTF-8), only invalid sequences replaced.
            os << issues.dump(2, ' ', false,
                              nlohmann::json::error_handler_t::replace)
               << '\n';
            os.flush();
            if (!os) {
                std::error_code ec;
                fs::remove(tmp, ec);
                throw FetchError(ErrorCategory::Storage,
                                 "Write to " + tmp.string() + " failed");
            }
        }
        fs::rename(tmp, target);

    } catch (const fs::filesystem_error& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw FetchError(ErrorCategory::Storage,
                         std::string("Failed to persist batch: ") + e.what());
    }

    if (mVerbose) {
        std::cerr << "[BatchStore] Saved " << issues.size() << " issues to "
                  << target.string() << "\n";
    }
    return target;
}

std::optional<int64_t> BatchStore::batchNumberOf(const std::string& sourceKey,
                                                 const std::string& filename)
{
    const std::string prefix = sourceKey + kBatchInfix;
    if (filename.size() <= prefix.size() + kBatchSuffix.size()) return std::nullopt;
    if (filename.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    if (filename.compare(filename.size() - kBatchSuffix.size(),
                         kBatchSuffix.size(), kBatchSuffix) != 0) {
        return std::nullopt;
    }

    const std::string digits = filename.substr(
        prefix.size(), filename.size() - prefix.size() - kBatchSuffix.size());
    if (digits.size() > 18) return std::nullopt;
    if (!std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return std::stoll(digits);
}

std::vector<fs::path> BatchStore::list(const std::string& sourceKey) const {
    std::vector<std::pair<int64_t, fs::path>> numbered;

    std::error_code ec;
    if (!fs::is_directory(mDir, ec)) return {};

    for (const auto& entry : fs::directory_iterator(mDir, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        const auto n = batchNumberOf(sourceKey, entry.path().filename().string());
        if (n) {
            numbered.emplace_back(*n, entry.path());
        }
    }
    if (ec) {
        std::cerr << "[BatchStore] Warning: error listing " << mDir << ": "
                  << ec.message() << "\n";
    }

    std::sort(numbered.begin(), numbered.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<fs::path> files;
    files.reserve(numbered.size());
    for (auto& [n, path] : numbered) {
        files.push_back(std::move(path));
    }
    return files;
}

} // namespace issue_harvest

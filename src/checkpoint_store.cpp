#include "checkpoint_store.hpp"

#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace issue_harvest {

// ---------------------------------------------------------------------------
// JSON mapping
// ---------------------------------------------------------------------------

void to_json(nlohmann::json& j, const Checkpoint& cp) {
    j = nlohmann::json{
        {"source_key",    cp.sourceKey},
        {"last_offset",   cp.lastOffset},
        {"total_fetched", cp.totalFetched},
        {"total_known",   cp.totalKnown},
        {"next_batch",    cp.nextBatch},
        {"updated_at",    cp.updatedAt},
    };
}

void from_json(const nlohmann::json& j, Checkpoint& cp) {
    j.at("source_key").get_to(cp.sourceKey);
    j.at("last_offset").get_to(cp.lastOffset);
    j.at("total_fetched").get_to(cp.totalFetched);
    j.at("total_known").get_to(cp.totalKnown);
    j.at("updated_at").get_to(cp.updatedAt);
    cp.nextBatch = j.contains("next_batch") ? j.at("next_batch").get<int64_t>() : 0;
}

// ---------------------------------------------------------------------------
// CheckpointStore
// ---------------------------------------------------------------------------

CheckpointStore::CheckpointStore(fs::path dir, bool verbose)
    : mDir(std::move(dir))
    , mVerbose(verbose) {}

fs::path CheckpointStore::pathFor(const std::string& sourceKey) const {
    return mDir / (sourceKey + "_checkpoint.json");
}

bool CheckpointStore::save(const std::string& sourceKey,
                           const Checkpoint& checkpoint)
{
    const fs::path target = pathFor(sourceKey);
    fs::path tmp = target;
    tmp += ".tmp";

    try {
        fs::create_directories(mDir);

        const std::string text = nlohmann::json(checkpoint).dump(4);
        {
            std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
            if (!os) {
                std::cerr << "[Checkpoint] Error saving checkpoint for "
                          << sourceKey << ": cannot open " << tmp << "\n";
                return false;
            }
            os << text << '\n';
            os.flush();
            if (!os) {
                std::cerr << "[Checkpoint] Error saving checkpoint for "
                          << sourceKey << ": write to " << tmp << " failed\n";
                std::error_code ec;
                fs::remove(tmp, ec);
                return false;
            }
        }
        fs::rename(tmp, target);

    } catch (const fs::filesystem_error& e) {
        std::cerr << "[Checkpoint] Error saving checkpoint for " << sourceKey
                  << ": " << e.what() << "\n";
        std::error_code ec;
        fs::remove(tmp, ec);
        return false;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Checkpoint] Error serializing checkpoint for "
                  << sourceKey << ": " << e.what() << "\n";
        return false;
    }

    if (mVerbose) {
        std::cerr << "[Checkpoint] Saved " << sourceKey << " at offset "
                  << checkpoint.lastOffset << "\n";
    }
    return true;
}

std::optional<Checkpoint> CheckpointStore::load(const std::string& sourceKey) const {
    const fs::path file = pathFor(sourceKey);

    std::error_code ec;
    if (!fs::exists(file, ec)) {
        if (mVerbose) {
            std::cerr << "[Checkpoint] No checkpoint found for " << sourceKey
                      << "; starting fresh\n";
        }
        return std::nullopt;
    }

    std::ifstream is(file, std::ios::binary);
    if (!is) {
        std::cerr << "[Checkpoint] Warning: cannot open " << file
                  << "; starting fresh for " << sourceKey << "\n";
        return std::nullopt;
    }

    Checkpoint cp;
    try {
        cp = nlohmann::json::parse(is).get<Checkpoint>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[Checkpoint] Warning: corrupt checkpoint " << file
                  << " (" << e.what() << "); starting fresh for "
                  << sourceKey << "\n";
        return std::nullopt;
    }

    if (cp.lastOffset < 0 || cp.totalFetched < 0 || cp.totalKnown < 0 ||
        cp.nextBatch < 0 || cp.lastOffset != cp.totalFetched) {
        std::cerr << "[Checkpoint] Warning: inconsistent checkpoint " << file
                  << " (last_offset=" << cp.lastOffset
                  << ", total_fetched=" << cp.totalFetched
                  << "); starting fresh for " << sourceKey << "\n";
        return std::nullopt;
    }

    if (mVerbose) {
        std::cerr << "[Checkpoint] Loaded " << sourceKey << ": last position "
                  << cp.lastOffset << "\n";
    }
    return cp;
}

void CheckpointStore::remove(const std::string& sourceKey) {
    const fs::path file = pathFor(sourceKey);

    std::error_code ec;
    const bool removed = fs::remove(file, ec);
    if (ec) {
        std::cerr << "[Checkpoint] Error deleting " << file << ": "
                  << ec.message() << "\n";
        return;
    }
    if (mVerbose) {
        std::cerr << "[Checkpoint] "
                  << (removed ? "Deleted checkpoint for "
                              : "No checkpoint to delete for ")
                  << sourceKey << "\n";
    }
}

int64_t CheckpointStore::lastOffset(const std::string& sourceKey) const {
    const auto cp = load(sourceKey);
    return cp ? cp->lastOffset : 0;
}

} // namespace issue_harvest

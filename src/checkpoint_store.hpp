#pragma once

#include "models.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace issue_harvest {

/// One JSON checkpoint file per source key under a single directory.
///
/// Checkpoint I/O never throws: a failed save is logged and reported through
/// the return value, and an unreadable checkpoint loads as "no checkpoint".
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path dir, bool verbose = false);

    /// Overwrite the key's checkpoint (write to a temp file, then rename).
    /// Returns false if the write did not become durable.
    bool save(const std::string& sourceKey, const Checkpoint& checkpoint);

    /// std::nullopt on cold start or on a corrupt file.
    std::optional<Checkpoint> load(const std::string& sourceKey) const;

    /// Delete the checkpoint to force a fresh run.  Absent is not an error.
    void remove(const std::string& sourceKey);

    /// lastOffset of the stored checkpoint, 0 when none is loadable.
    int64_t lastOffset(const std::string& sourceKey) const;

    std::filesystem::path pathFor(const std::string& sourceKey) const;

    const std::filesystem::path& directory() const { return mDir; }

private:
    std::filesystem::path mDir;
    bool                  mVerbose;
};

} // namespace issue_harvest

#pragma once

#include "batch_store.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace issue_harvest {

/// One instruction-tuning record.
struct TrainingExample {
    std::string instruction;
    std::string input;
    std::string output;
    std::string taskType;   // "summarization", "classification_status", ...

    std::string issueKey;
    std::string project;
    std::string status;
    std::string priority;
};

void to_json(nlohmann::json& j, const TrainingExample& ex);

/// Strip HTML tags, collapse whitespace runs to one space, trim.
/// Runs in one pass; a '<' with no later '>' is kept as text.
std::string cleanText(const std::string& text);

/// "author: body" per non-empty comment of fields.comment.comments.
std::string extractComments(const nlohmann::json& issue);

/// fields.<name> rendered as text; "Unknown" if absent or null.  Objects use
/// @p nestedKey, arrays are joined with ", ".
std::string fieldValue(const nlohmann::json& issue,
                       const std::string& name,
                       const std::string& nestedKey = "");

/// Four examples (summarization, status and priority classification, QA)
/// for an issue with a summary or description; none otherwise.
std::vector<TrainingExample> transformIssue(const nlohmann::json& issue,
                                            const std::string& project);

/// Turns a source key's raw batch files into a JSONL training set.
class Transformer {
public:
    static constexpr std::size_t kPreviewCount = 10;

    Transformer(const BatchStore& batches,
                std::filesystem::path outputDir,
                bool verbose = false);

    /// Returns the number of examples written; 0 if there was nothing to do.
    /// Throws std::runtime_error if the output files cannot be written.
    std::size_t transformAll(const std::string& sourceKey);

    /// Examples from one batch file.  Unreadable files yield none.
    std::vector<TrainingExample> processBatchFile(const std::filesystem::path& file,
                                                  const std::string& sourceKey) const;

    std::filesystem::path outputPathFor(const std::string& sourceKey) const;
    std::filesystem::path previewPathFor(const std::string& sourceKey) const;

private:
    const BatchStore&     mBatches;
    std::filesystem::path mOutputDir;
    bool                  mVerbose;
};

} // namespace issue_harvest

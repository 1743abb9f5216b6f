#include "transformer.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace issue_harvest {

namespace {

const std::string kUnknown = "Unknown";

const nlohmann::json& fieldsOf(const nlohmann::json& issue) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (issue.is_object()) {
        const auto it = issue.find("fields");
        if (it != issue.end() && it->is_object()) return *it;
    }
    return kEmpty;
}

/// String field, "" when absent, null or not a string.
std::string textField(const nlohmann::json& fields, const char* name) {
    const auto it = fields.find(name);
    if (it == fields.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

std::string scalarText(const nlohmann::json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

TrainingExample withMetadata(const nlohmann::json& issue,
                             const std::string& project)
{
    TrainingExample ex;
    ex.issueKey = (issue.is_object() && issue.contains("key") && issue["key"].is_string())
                      ? issue["key"].get<std::string>() : kUnknown;
    ex.project  = project;
    ex.status   = fieldValue(issue, "status", "name");
    ex.priority = fieldValue(issue, "priority", "name");
    return ex;
}

} // namespace

void to_json(nlohmann::json& j, const TrainingExample& ex) {
    j = nlohmann::json{
        {"instruction", ex.instruction},
        {"input",       ex.input},
        {"output",      ex.output},
        {"task_type",   ex.taskType},
        {"metadata", {
            {"issue_key", ex.issueKey},
            {"project",   ex.project},
            {"status",    ex.status},
            {"priority",  ex.priority},
        }},
    };
}

// ---------------------------------------------------------------------------
// Field helpers
// ---------------------------------------------------------------------------

std::string cleanText(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    // Position of the next '>' at or after the scan point; npos once there
    // are none left, which leaves every later '<' as literal text.
    std::size_t nextClose = 0;
    bool pendingSpace = false;

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];

        if (c == '<') {
            if (nextClose != std::string::npos && nextClose <= i) {
                nextClose = text.find('>', i + 1);
            }
            // A tag needs at least one character between the brackets.
            if (nextClose != std::string::npos && nextClose > i + 1) {
                i = nextClose;
                continue;
            }
        }

        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

std::string extractComments(const nlohmann::json& issue) {
    const auto& fields = fieldsOf(issue);
    const auto comment = fields.find("comment");
    if (comment == fields.end() || !comment->is_object()) return "";

    const auto list = comment->find("comments");
    if (list == comment->end() || !list->is_array()) return "";

    std::string out;
    for (const auto& c : *list) {
        if (!c.is_object()) continue;
        const std::string body = textField(c, "body");
        if (body.empty()) continue;

        std::string author = kUnknown;
        const auto a = c.find("author");
        if (a != c.end() && a->is_object()) {
            const std::string name = textField(*a, "displayName");
            if (!name.empty()) author = name;
        }

        if (!out.empty()) out += '\n';
        out += author + ": " + cleanText(body);
    }
    return out;
}

std::string fieldValue(const nlohmann::json& issue,
                       const std::string& name,
                       const std::string& nestedKey)
{
    const auto& fields = fieldsOf(issue);
    const auto it = fields.find(name);
    if (it == fields.end() || it->is_null()) return kUnknown;

    if (it->is_object() && !nestedKey.empty()) {
        const auto nested = it->find(nestedKey);
        if (nested == it->end() || nested->is_null()) return kUnknown;
        return scalarText(*nested);
    }

    if (it->is_array()) {
        std::string joined;
        for (const auto& v : *it) {
            if (!joined.empty()) joined += ", ";
            joined += scalarText(v);
        }
        return joined;
    }

    return scalarText(*it);
}

// ---------------------------------------------------------------------------
// Task builders
// ---------------------------------------------------------------------------

std::vector<TrainingExample> transformIssue(const nlohmann::json& issue,
                                            const std::string& project)
{
    std::vector<TrainingExample> examples;

    const auto& fields = fieldsOf(issue);
    const std::string rawSummary     = textField(fields, "summary");
    const std::string rawDescription = textField(fields, "description");
    if (rawSummary.empty() && rawDescription.empty()) {
        return examples;
    }

    const std::string summary     = cleanText(rawSummary);
    const std::string description = cleanText(rawDescription);
    const std::string titled = "Title: " + summary + "\n\nDescription: " + description;

    // --- summarization ---
    TrainingExample summarize = withMetadata(issue, project);
    summarize.instruction = "Summarize the following Jira issue";
    summarize.input       = description;
    const std::string comments = extractComments(issue);
    if (!comments.empty()) {
        summarize.input += "\n\nComments:\n" + comments;
    }
    summarize.output   = summary;
    summarize.taskType = "summarization";
    examples.push_back(summarize);

    // --- classification ---
    TrainingExample byStatus = withMetadata(issue, project);
    byStatus.instruction = "Classify the status of this Jira issue "
                           "(e.g., Open, In Progress, Resolved, Closed)";
    byStatus.input    = titled;
    byStatus.output   = byStatus.status;
    byStatus.taskType = "classification_status";
    examples.push_back(byStatus);

    TrainingExample byPriority = withMetadata(issue, project);
    byPriority.instruction = "Classify the priority of this Jira issue "
                             "(e.g., Critical, Major, Minor, Trivial)";
    byPriority.input    = titled;
    byPriority.output   = byPriority.priority;
    byPriority.taskType = "classification_priority";
    examples.push_back(byPriority);

    // --- question answering ---
    TrainingExample qa = withMetadata(issue, project);
    qa.instruction = "Answer the following question about this Jira issue";
    qa.input       = titled + "\n\nQuestion: What is this issue about and "
                              "what problem does it address?";
    qa.output      = description.empty() ? summary : description;
    qa.taskType    = "qa";
    examples.push_back(qa);

    return examples;
}

// ---------------------------------------------------------------------------
// Transformer
// ---------------------------------------------------------------------------

Transformer::Transformer(const BatchStore& batches, fs::path outputDir, bool verbose)
    : mBatches(batches)
    , mOutputDir(std::move(outputDir))
    , mVerbose(verbose) {}

fs::path Transformer::outputPathFor(const std::string& sourceKey) const {
    return mOutputDir / (sourceKey + "_training_data.jsonl");
}

fs::path Transformer::previewPathFor(const std::string& sourceKey) const {
    return mOutputDir / (sourceKey + "_training_data_pretty.json");
}

std::vector<TrainingExample>
Transformer::processBatchFile(const fs::path& file, const std::string& sourceKey) const
{
    std::vector<TrainingExample> examples;

    std::ifstream is(file, std::ios::binary);
    if (!is) {
        std::cerr << "[Transformer] Cannot open " << file << "; skipping\n";
        return examples;
    }

    nlohmann::json issues;
    try {
        issues = nlohmann::json::parse(is);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[Transformer] Error parsing " << file << ": "
                  << e.what() << "; skipping\n";
        return examples;
    }
    if (!issues.is_array()) {
        std::cerr << "[Transformer] " << file << " is not a JSON array; skipping\n";
        return examples;
    }

    for (const auto& issue : issues) {
        auto produced = transformIssue(issue, sourceKey);
        examples.insert(examples.end(),
                        std::make_move_iterator(produced.begin()),
                        std::make_move_iterator(produced.end()));
    }

    if (mVerbose) {
        std::cerr << "[Transformer] " << file.filename().string() << ": "
                  << examples.size() << " examples from " << issues.size()
                  << " issues\n";
    }
    return examples;
}

std::size_t Transformer::transformAll(const std::string& sourceKey)
{
    const auto files = mBatches.list(sourceKey);
    std::cout << "Found " << files.size() << " batch files for "
              << sourceKey << "\n";
    if (files.empty()) {
        return 0;
    }

    std::vector<TrainingExample> all;
    for (const auto& file : files) {
        auto examples = processBatchFile(file, sourceKey);
        all.insert(all.end(),
                   std::make_move_iterator(examples.begin()),
                   std::make_move_iterator(examples.end()));
    }

    std::error_code ec;
    fs::create_directories(mOutputDir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create " + mOutputDir.string() +
                                 ": " + ec.message());
    }

    const fs::path output = outputPathFor(sourceKey);
    {
        std::ofstream os(output, std::ios::binary | std::ios::trunc);
        if (!os) {
            throw std::runtime_error("Cannot open " + output.string());
        }
        for (const auto& ex : all) {
            os << nlohmann::json(ex).dump(-1, ' ', false,
                                          nlohmann::json::error_handler_t::replace)
               << '\n';
        }
        if (!os.flush()) {
            throw std::runtime_error("Write to " + output.string() + " failed");
        }
    }

    const fs::path preview = previewPathFor(sourceKey);
    {
        nlohmann::json head = nlohmann::json::array();
        for (std::size_t i = 0; i < all.size() && i < kPreviewCount; ++i) {
            head.push_back(all[i]);
        }
        std::ofstream os(preview, std::ios::binary | std::ios::trunc);
        if (!os) {
            throw std::runtime_error("Cannot open " + preview.string());
        }
        os << head.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
           << '\n';
        if (!os.flush()) {
            throw std::runtime_error("Write to " + preview.string() + " failed");
        }
    }

    std::cout << "Saved " << all.size() << " training examples to "
              << output.string() << "\n";
    return all.size();
}

} // namespace issue_harvest

#pragma once

#include <fngrader/common/expected.hpp>
#include <fngrader/grading/result_record.hpp>

#include <cstddef>
#include <filesystem>
#include <string>

namespace fngrader {

/// The trusted run's results, the ground truth for grading.
///
/// The key is stored exactly as the trusted harness printed it, and is immutable once built,
/// so one key may be shared by any number of concurrent gradings.
class AnswerKey
{
public:
    /// Validates `text` as a sequence of results
    static Expected<AnswerKey, std::string> parse(std::string text);

    static Expected<AnswerKey, std::string> read(const std::filesystem::path& path);

    /// Writes `text()` verbatim
    Expected<void, std::string> write(const std::filesystem::path& path) const;

    const ResultRecords& records() const { return records_; }

    std::size_t size() const { return records_.size(); }

    const std::string& text() const { return text_; }

private:
    AnswerKey(std::string text, ResultRecords records);

    std::string text_;
    ResultRecords records_;
};

} // namespace fngrader

#include <fngrader/grading/answer_key.hpp>

#include <fngrader/common/error_types.hpp>
#include <fngrader/common/expected.hpp>
#include <fngrader/common/text_file.hpp>
#include <fngrader/grading/result_record.hpp>
#include <fngrader/logging.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <string>
#include <utility>

namespace fngrader {

AnswerKey::AnswerKey(std::string text, ResultRecords records)
    : text_{std::move(text)}
    , records_{std::move(records)} {}

Expected<AnswerKey, std::string> AnswerKey::parse(std::string text) {
    auto records = parse_result_records(text);

    if (!records) {
        return fmt::format("Malformed answer key: {}", records.error());
    }

    LOG_DEBUG("Parsed an answer key of {} results", records->size());

    return AnswerKey{std::move(text), std::move(records).value()};
}

Expected<AnswerKey, std::string> AnswerKey::read(const std::filesystem::path& path) {
    std::string text = TRY(read_text_file(path));

    auto res = parse(std::move(text));

    if (!res) {
        return fmt::format("{}: {}", path.string(), res.error());
    }

    return res;
}

Expected<void, std::string> AnswerKey::write(const std::filesystem::path& path) const {
    return write_text_file(path, text_);
}

} // namespace fngrader

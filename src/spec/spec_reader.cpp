#include <fngrader/spec/spec_reader.hpp>

#include <fngrader/common/error_types.hpp>
#include <fngrader/common/expected.hpp>
#include <fngrader/common/text_file.hpp>
#include <fngrader/generator/value_config.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/planner/test_call.hpp>
#include <fngrader/spec/test_spec.hpp>
#include <fngrader/value/literal.hpp>
#include <fngrader/value/value.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/contains.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace fngrader {

namespace {

using ReadResult = Expected<void, std::string>;

// Generous upper bound on any count or length; keeps a typo from exhausting memory
constexpr std::size_t MAX_COUNT = 1'000'000;

std::string describe_kind(const Value& value) {
    return std::string{kind_name(value.kind())};
}

std::string mismatch(const std::string& path, std::string_view expected, const Value& actual) {
    return fmt::format("{}: expected {}, got {}", path, expected, describe_kind(actual));
}

/// Walks the entries of a config mapping, tracking which keys were consumed
class FieldReader
{
public:
    FieldReader(const Value& mapping, std::string path)
        : mapping_{&mapping}
        , path_{std::move(path)} {}

    /// Returns nullptr when absent
    const Value* take(std::string_view key) {
        consumed_.emplace_back(key);
        return mapping_->find(Value{std::string{key}});
    }

    std::string path_of(std::string_view key) const { return fmt::format("{}.{}", path_, key); }

    /// Errors on the first key that was never taken
    ReadResult finish() const {
        for (const MappingEntry& entry : mapping_->as_mapping()) {
            if (!entry.key.is_text() || !ranges::contains(consumed_, entry.key.as_text())) {
                return fmt::format("{}: unknown key {}", path_, to_literal(entry.key));
            }
        }
        return {};
    }

private:
    const Value* mapping_;
    std::string path_;
    std::vector<std::string> consumed_;
};

Expected<std::size_t, std::string> read_count(const Value* field, const std::string& path, std::size_t default_value) {
    if (field == nullptr) {
        return default_value;
    }

    if (!field->is_integer()) {
        return {unexpected, mismatch(path, "a non-negative integer", *field)};
    }

    const Value::Integer& integer = field->as_integer();

    if (integer < 0) {
        return {unexpected, fmt::format("{}: must not be negative", path)};
    }
    if (integer > MAX_COUNT) {
        return {unexpected, fmt::format("{}: must be at most {}", path, MAX_COUNT)};
    }

    return integer.convert_to<std::size_t>();
}

Expected<bool, std::string> read_flag(const Value* field, const std::string& path, bool default_value) {
    if (field == nullptr) {
        return default_value;
    }

    if (!field->is_boolean()) {
        return {unexpected, mismatch(path, "true or false", *field)};
    }

    return field->as_boolean();
}

Expected<Value::Sequence, std::string> read_sequence(const Value* field, const std::string& path) {
    if (field == nullptr) {
        return Value::Sequence{};
    }

    if (!field->is_sequence()) {
        return {unexpected, mismatch(path, "a sequence", *field)};
    }

    return field->as_sequence();
}

ReadResult read_number_config(FieldReader& fields, NumberConfig& config) {
    if (const Value* lower = fields.take("lower")) {
        if (!lower->is_number()) {
            return mismatch(fields.path_of("lower"), "a number", *lower);
        }
        config.lower = *lower;
    }

    if (const Value* upper = fields.take("upper")) {
        if (!upper->is_number()) {
            return mismatch(fields.path_of("upper"), "a number", *upper);
        }
        config.upper = *upper;
    }

    if (const Value* decimal = fields.take("decimal"); decimal != nullptr && !decimal->is_null()) {
        if (!decimal->is_integer() || decimal->as_integer() < 0 || decimal->as_integer() > 17) { // NOLINT
            return mismatch(fields.path_of("decimal"), "null or a number of places in [0, 17]", *decimal);
        }
        config.decimal = decimal->as_integer().convert_to<int>();
    }

    config.exclude = TRY(read_sequence(fields.take("exclude"), fields.path_of("exclude")));

    if (config.lower.as_number() > config.upper.as_number()) {
        return fmt::format("{}: lower bound {} exceeds upper bound {}", fields.path_of("lower"), config.lower,
                           config.upper);
    }

    return {};
}

ReadResult read_text_config(FieldReader& fields, TextConfig& config) {
    config.lower_len = TRY(read_count(fields.take("lower_len"), fields.path_of("lower_len"), config.lower_len));
    config.upper_len = TRY(read_count(fields.take("upper_len"), fields.path_of("upper_len"), config.upper_len));

    if (config.lower_len > config.upper_len) {
        return fmt::format("{}: {} exceeds upper_len {}", fields.path_of("lower_len"), config.lower_len,
                           config.upper_len);
    }

    if (const Value* char_range = fields.take("char_range")) {
        const std::string path = fields.path_of("char_range");
        constexpr auto max_code = 0x10FFFF;

        auto is_code = [](const Value& val) {
            return val.is_integer() && val.as_integer() >= 0 && val.as_integer() <= max_code;
        };

        if (!char_range->is_sequence() || char_range->as_sequence().size() != 2 ||
            !ranges::all_of(char_range->as_sequence(), is_code)) {
            return fmt::format("{}: expected [min, max] code points in [0, {:#x}], got {}", path, max_code,
                               *char_range);
        }

        config.char_min = char_range->as_sequence()[0].as_integer().convert_to<char32_t>();
        config.char_max = char_range->as_sequence()[1].as_integer().convert_to<char32_t>();

        if (config.char_min > config.char_max) {
            return fmt::format("{}: empty code point range {}", path, *char_range);
        }
    }

    for (const Value& excl : TRY(read_sequence(fields.take("exclude"), fields.path_of("exclude")))) {
        if (!excl.is_text()) {
            return mismatch(fields.path_of("exclude"), "a sequence of text", excl);
        }
        config.exclude.push_back(excl.as_text());
    }

    if (const Value* case_field = fields.take("case"); case_field != nullptr && !case_field->is_null()) {
        const std::string path = fields.path_of("case");

        if (!case_field->is_text()) {
            return mismatch(path, "null, \"upper\", \"lower\" or \"random\"", *case_field);
        }

        const std::string& name = case_field->as_text();
        if (name == "upper") {
            config.case_transform = CaseTransform::Upper;
        } else if (name == "lower") {
            config.case_transform = CaseTransform::Lower;
        } else if (name == "random") {
            config.case_transform = CaseTransform::Random;
        } else {
            return fmt::format("{}: unknown case transform {:?}", path, name);
        }
    }

    return {};
}

ReadResult read_tristate_config(FieldReader& fields, TriStateConfig& config) {
    config.include_true = TRY(read_flag(fields.take("include_true"), fields.path_of("include_true"), true));
    config.include_false = TRY(read_flag(fields.take("include_false"), fields.path_of("include_false"), true));
    config.include_null = TRY(read_flag(fields.take("include_none"), fields.path_of("include_none"), true));
    return {};
}

Expected<ValueConfig, std::string> parse_config_impl(const Value& config, const std::string& path, bool nested);

Expected<std::vector<ValueConfig>, std::string> read_config_list(const Value* field, const std::string& path,
                                                                 bool keys_only) {
    if (field == nullptr) {
        return {unexpected, fmt::format("{}: required", path)};
    }

    if (!field->is_sequence()) {
        return {unexpected, mismatch(path, "a sequence of configs", *field)};
    }

    std::vector<ValueConfig> res;
    const Value::Sequence& entries = field->as_sequence();

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const std::string entry_path = fmt::format("{}[{}]", path, i);
        ValueConfig entry = TRY(parse_config_impl(entries[i], entry_path, /*nested=*/true));

        if (keys_only && (std::holds_alternative<SequenceConfig>(entry.type) ||
                          std::holds_alternative<MappingConfig>(entry.type))) {
            return {unexpected, fmt::format("{}: mapping keys cannot be sequences or mappings", entry_path)};
        }

        res.push_back(std::move(entry));
    }

    return res;
}

Expected<ValueConfig, std::string> parse_config_impl(const Value& config, const std::string& path, bool nested) {
    if (!config.is_mapping()) {
        return {unexpected, mismatch(path, "a config mapping", config)};
    }

    FieldReader fields{config, path};
    const Value* type_field = fields.take("type");

    if (type_field == nullptr || !type_field->is_text()) {
        return {unexpected, fmt::format("{}: expected a \"type\" of num, string, bool_or_none, array or dict", path)};
    }

    const std::string& type = type_field->as_text();
    ValueConfig res;

    if (type == "num") {
        NumberConfig cfg;
        TRY(read_number_config(fields, cfg));
        res.type = std::move(cfg);
    } else if (type == "string") {
        TextConfig cfg;
        TRY(read_text_config(fields, cfg));
        res.type = std::move(cfg);
    } else if (type == "bool_or_none") {
        TriStateConfig cfg;
        TRY(read_tristate_config(fields, cfg));
        res.type = cfg;
    } else if (type == "array") {
        res.type = SequenceConfig{
            .elements = TRY(read_config_list(fields.take("elements"), fields.path_of("elements"), false))};
    } else if (type == "dict") {
        MappingConfig cfg;
        cfg.keys = TRY(read_config_list(fields.take("keys"), fields.path_of("keys"), /*keys_only=*/true));
        cfg.values = TRY(read_config_list(fields.take("values"), fields.path_of("values"), false));
        res.type = std::move(cfg);
    } else {
        return {unexpected, fmt::format("{}: unknown type {:?}", fields.path_of("type"), type)};
    }

    // nested configs always produce exactly one value per containing value
    if (!nested) {
        res.total_tests = TRY(
            read_count(fields.take("total_tests"), fields.path_of("total_tests"), ValueConfig::DEFAULT_TOTAL_TESTS));
    }

    TRY(fields.finish());

    return res;
}

Expected<TestSpec, std::string> parse_test_spec(const Value& spec, const std::string& path) {
    if (!spec.is_mapping()) {
        return {unexpected, mismatch(path, "a test spec mapping", spec)};
    }

    FieldReader fields{spec, path};
    TestSpec res;

    const Value* method = fields.take("method");
    if (method == nullptr || !method->is_text() || !is_identifier(method->as_text())) {
        return {unexpected, fmt::format("{}: expected a function name", fields.path_of("method"))};
    }
    res.method = method->as_text();

    const Value* params = fields.take("params");
    if (params != nullptr && !params->is_mapping()) {
        return {unexpected, mismatch(fields.path_of("params"), "a mapping of parameter names", *params)};
    }

    if (params != nullptr) {
        for (const MappingEntry& entry : params->as_mapping()) {
            if (!entry.key.is_text() || !is_identifier(entry.key.as_text())) {
                return {unexpected, fmt::format("{}: parameter name {} is not an identifier", fields.path_of("params"),
                                                to_literal(entry.key))};
            }

            const std::string param_path = fmt::format("{}.{}", fields.path_of("params"), entry.key.as_text());

            if (!entry.value.is_sequence()) {
                return {unexpected, mismatch(param_path, "a sequence of values and configs", entry.value)};
            }

            Parameter param{.name = entry.key.as_text(), .entries = {}};
            const Value::Sequence& entries = entry.value.as_sequence();

            for (std::size_t i = 0; i < entries.size(); ++i) {
                if (is_value_config(entries[i])) {
                    param.entries.emplace_back(
                        TRY(parse_config_impl(entries[i], fmt::format("{}[{}]", param_path, i), false)));
                } else {
                    param.entries.emplace_back(entries[i]);
                }
            }

            res.params.push_back(std::move(param));
        }
    }

    for (const Value& name : TRY(read_sequence(fields.take("track"), fields.path_of("track")))) {
        const bool known = name.is_text() && ranges::any_of(res.params, [&name](const Parameter& param) {
                               return param.name == name.as_text();
                           });

        if (!known) {
            return {unexpected, fmt::format("{}: {} is not a parameter of {}", fields.path_of("track"),
                                            to_literal(name), res.method)};
        }

        if (!res.is_tracked(name.as_text())) {
            res.tracked.push_back(name.as_text());
        }
    }

    TRY(fields.finish());

    return res;
}

} // namespace

bool is_value_config(const Value& entry) {
    return entry.is_mapping() && entry.find(Value{"type"}) != nullptr;
}

Expected<ValueConfig, std::string> parse_value_config(const Value& config, const std::string& path) {
    return parse_config_impl(config, path, /*nested=*/false);
}

Expected<TestSuite, std::string> parse_test_suite(const Value& spec) {
    TestSuite res;

    if (!spec.is_sequence()) {
        res.push_back(TRY(parse_test_spec(spec, "$")));
        return res;
    }

    const Value::Sequence& specs = spec.as_sequence();
    for (std::size_t i = 0; i < specs.size(); ++i) {
        res.push_back(TRY(parse_test_spec(specs[i], fmt::format("$[{}]", i))));
    }

    LOG_DEBUG("Parsed a suite of {} test specs", res.size());

    return res;
}

Expected<TestSuite, std::string> parse_test_suite(std::string_view spec_text) {
    auto parsed = parse_literal(spec_text);

    if (!parsed) {
        return {unexpected, fmt::format("Malformed spec: {}", parsed.error())};
    }

    return parse_test_suite(parsed.value());
}

SpecReader::SpecReader(std::filesystem::path path)
    : path_{std::move(path)} {}

Expected<TestSuite, std::string> SpecReader::read() const {
    std::string text = TRY(read_text_file(path_));

    auto res = parse_test_suite(std::string_view{text});

    if (!res) {
        return {unexpected, fmt::format("{}: {}", path_.string(), res.error())};
    }

    return res;
}

} // namespace fngrader

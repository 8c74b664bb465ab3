#include <fngrader/generator/value_generator.hpp>

#include "value/utf8.hpp"

#include <fngrader/common/overloaded.hpp>
#include <fngrader/generator/value_config.hpp>
#include <fngrader/logging.hpp>
#include <fngrader/value/literal.hpp>
#include <fngrader/value/value.hpp>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/random/bernoulli_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/contains.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace fngrader {

namespace {

/// Bound conversion for integer mode; truncates toward zero
std::optional<Value::Integer> to_integer_bound(const Value& bound) {
    if (bound.is_integer()) {
        return bound.as_integer();
    }

    if (bound.is_decimal() && std::isfinite(bound.as_decimal())) {
        return Value::Integer{std::trunc(bound.as_decimal())};
    }

    return std::nullopt;
}

/// Round-half-even on the exact binary value, as Python's round(x, places) does
double round_to_places(double value, int places) {
    std::string text = fmt::format("{:.{}f}", value, places);

    double res{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), res);
    ASSERT(ec == std::errc{}, text);

    return res;
}

char ascii_upper(char chr) {
    return (chr >= 'a' && chr <= 'z') ? static_cast<char>(chr - 'a' + 'A') : chr;
}

char ascii_lower(char chr) {
    return (chr >= 'A' && chr <= 'Z') ? static_cast<char>(chr - 'A' + 'a') : chr;
}

void log_exhaustion(std::string_view what, std::size_t produced, std::size_t requested, std::size_t attempts) {
    if (produced < requested) {
        LOG_DEBUG("{} generation exhausted: produced {} of {} requested values after {} attempts", what, produced,
                  requested, attempts);
    }
}

} // namespace

ValueGenerator::ValueGenerator(std::uint32_t seed)
    : engine_{seed} {}

std::vector<Value> ValueGenerator::generate(const ValueConfig& config) {
    return generate(config, config.total_tests);
}

std::vector<Value> ValueGenerator::generate(const ValueConfig& config, std::size_t count) {
    return std::visit(Overloaded{
                          [&](const NumberConfig& cfg) { return generate_numbers(cfg, count); },
                          [&](const TextConfig& cfg) { return generate_texts(cfg, count); },
                          [&](const TriStateConfig& cfg) { return generate_tristates(cfg, count); },
                          [&](const SequenceConfig& cfg) { return generate_sequences(cfg, count); },
                          [&](const MappingConfig& cfg) { return generate_mappings(cfg, count); },
                      },
                      config.type);
}

std::optional<Value> ValueGenerator::generate_one(const ValueConfig& config) {
    std::vector<Value> res = generate(config, 1);

    if (res.empty()) {
        return std::nullopt;
    }

    return std::move(res.front());
}

std::vector<Value> ValueGenerator::generate_numbers(const NumberConfig& config, std::size_t count) {
    std::vector<Value> results;

    const std::size_t max_attempts = count * MAX_ATTEMPTS_FACTOR;
    std::size_t attempts = 0;

    auto accept = [&](Value candidate) {
        if (!ranges::contains(config.exclude, candidate) && !ranges::contains(results, candidate)) {
            results.push_back(std::move(candidate));
        }
    };

    if (!config.lower.is_number() || !config.upper.is_number()) {
        LOG_WARN("number bounds must be numbers, got {} and {}", config.lower, config.upper);
        return results;
    }

    if (config.decimal) {
        const double lower = config.lower.as_number();
        const double upper = config.upper.as_number();

        if (*config.decimal < 0 || !std::isfinite(lower) || !std::isfinite(upper) || lower > upper) {
            LOG_WARN("unusable decimal bounds [{}, {}] with {} places", lower, upper, *config.decimal);
            return results;
        }

        boost::random::uniform_real_distribution<double> dist{lower, upper};

        while (results.size() < count && attempts < max_attempts) {
            ++attempts;

            // Rounding can carry a draw past either bound
            const double rounded = round_to_places(dist(engine_), *config.decimal);
            if (rounded < lower || rounded > upper) {
                continue;
            }

            accept(Value{rounded});
        }
    } else {
        auto lower = to_integer_bound(config.lower);
        auto upper = to_integer_bound(config.upper);

        if (!lower || !upper || *lower > *upper) {
            LOG_WARN("unusable integer bounds [{}, {}]", config.lower, config.upper);
            return results;
        }

        boost::random::uniform_int_distribution<Value::Integer> dist{*lower, *upper};

        while (results.size() < count && attempts < max_attempts) {
            ++attempts;
            accept(Value{dist(engine_)});
        }
    }

    log_exhaustion("number", results.size(), count, attempts);

    return results;
}

std::string ValueGenerator::draw_text(const TextConfig& config) {
    boost::random::uniform_int_distribution<std::size_t> length_dist{config.lower_len, config.upper_len};
    boost::random::uniform_int_distribution<std::uint32_t> code_dist{config.char_min, config.char_max};

    const std::size_t length = length_dist(engine_);

    std::string res;
    for (std::size_t i = 0; i < length; ++i) {
        utf8::append(res, static_cast<char32_t>(code_dist(engine_)));
    }

    switch (config.case_transform) {
    case CaseTransform::None:
        break;
    case CaseTransform::Upper:
        ranges::transform(res, res.begin(), ascii_upper);
        break;
    case CaseTransform::Lower:
        ranges::transform(res, res.begin(), ascii_lower);
        break;
    case CaseTransform::Random: {
        boost::random::bernoulli_distribution<> coin{0.5}; // NOLINT(readability-magic-numbers)

        // one draw per code point, letters or not
        std::string transformed;
        for (std::size_t pos = 0; pos < res.size();) {
            const std::size_t start = pos;
            if (!utf8::decode(res, pos)) {
                ++pos;
            }
            const bool upper = coin(engine_);
            for (std::size_t i = start; i < pos; ++i) {
                transformed += upper ? ascii_upper(res[i]) : ascii_lower(res[i]);
            }
        }
        res = std::move(transformed);
        break;
    }
    }

    return res;
}

std::vector<Value> ValueGenerator::generate_texts(const TextConfig& config, std::size_t count) {
    std::vector<Value> results;

    if (config.lower_len > config.upper_len || config.char_min > config.char_max ||
        config.char_max > utf8::max_code_point) {
        LOG_WARN("unusable text constraints: length [{}, {}], code range [{}, {}]", config.lower_len,
                 config.upper_len, static_cast<std::uint32_t>(config.char_min),
                 static_cast<std::uint32_t>(config.char_max));
        return results;
    }

    const std::size_t max_attempts = count * MAX_ATTEMPTS_FACTOR;
    std::size_t attempts = 0;

    while (results.size() < count && attempts < max_attempts) {
        ++attempts;

        std::string candidate = draw_text(config);

        // equality implies containment, so one check covers both
        const bool excluded = ranges::any_of(config.exclude, [&candidate](const std::string& excl) {
            return candidate.find(excl) != std::string::npos;
        });

        if (excluded) {
            continue;
        }

        Value value{std::move(candidate)};
        if (!ranges::contains(results, value)) {
            results.push_back(std::move(value));
        }
    }

    log_exhaustion("text", results.size(), count, attempts);

    return results;
}

std::vector<Value> ValueGenerator::generate_tristates(const TriStateConfig& config, std::size_t count) {
    std::vector<Value> pool;

    if (config.include_true) {
        pool.emplace_back(true);
    }
    if (config.include_false) {
        pool.emplace_back(false);
    }
    if (config.include_null) {
        pool.emplace_back(Value::Null{});
    }

    std::vector<Value> results;

    if (pool.empty()) {
        LOG_DEBUG("tri-state generation has no enabled values");
        return results;
    }

    boost::random::uniform_int_distribution<std::size_t> dist{0, pool.size() - 1};

    results.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        results.push_back(pool[dist(engine_)]);
    }

    return results;
}

std::vector<Value> ValueGenerator::generate_sequences(const SequenceConfig& config, std::size_t count) {
    std::vector<Value> results;

    for (std::size_t i = 0; i < count; ++i) {
        Value::Sequence elems;
        bool complete = true;

        for (const ValueConfig& elem_config : config.elements) {
            auto elem = generate_one(elem_config);
            if (!elem) {
                complete = false;
                break;
            }
            elems.push_back(std::move(*elem));
        }

        if (!complete) {
            LOG_DEBUG("dropping sequence {}: an element could not be generated", i);
            continue;
        }

        results.emplace_back(std::move(elems));
    }

    return results;
}

std::vector<Value> ValueGenerator::generate_mappings(const MappingConfig& config, std::size_t count) {
    std::vector<Value> results;

    const std::size_t pairs = std::min(config.keys.size(), config.values.size());

    for (std::size_t i = 0; i < count; ++i) {
        Value mapping = Value::make_mapping();
        bool complete = true;

        for (std::size_t pair = 0; pair < pairs; ++pair) {
            auto key = generate_one(config.keys[pair]);
            if (!key || !key->is_hashable()) {
                complete = false;
                break;
            }

            auto value = generate_one(config.values[pair]);
            if (!value) {
                complete = false;
                break;
            }

            mapping.insert_or_assign(std::move(*key), std::move(*value));
        }

        if (!complete) {
            LOG_DEBUG("dropping mapping {}: a key or value could not be generated", i);
            continue;
        }

        results.push_back(std::move(mapping));
    }

    return results;
}

} // namespace fngrader

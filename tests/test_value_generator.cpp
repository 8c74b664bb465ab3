#include "catch2_custom.hpp"

#include <fngrader/generator/value_config.hpp>
#include <fngrader/generator/value_generator.hpp>
#include <fngrader/value/literal.hpp>
#include <fngrader/value/value.hpp>

#include <catch2/catch_test_macros.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/count.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

using namespace fngrader;

namespace {

bool all_unique(const std::vector<Value>& values) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        for (std::size_t j = i + 1; j < values.size(); ++j) {
            if (values[i] == values[j]) {
                return false;
            }
        }
    }
    return true;
}

ValueConfig make_config(auto type, std::size_t total_tests = ValueConfig::DEFAULT_TOTAL_TESTS) {
    return ValueConfig{.type = std::move(type), .total_tests = total_tests};
}

} // namespace

TEST_CASE("Integers are unique and within inclusive bounds") {
    ValueGenerator gen{1};

    auto values = gen.generate(make_config(NumberConfig{.lower = -5, .upper = 5, .decimal = {}, .exclude = {}}, 8));

    REQUIRE(values.size() == 8);
    CHECK(all_unique(values));
    CHECK(ranges::all_of(values, [](const Value& val) {
        return val.is_integer() && val.as_integer() >= -5 && val.as_integer() <= 5;
    }));
}

TEST_CASE("Decimal bounds are truncated in integer mode") {
    ValueGenerator gen{2};

    auto values = gen.generate_numbers(NumberConfig{.lower = 0.9, .upper = 3.7, .decimal = {}, .exclude = {}}, 10);

    // [0, 3] holds only four integers
    REQUIRE(values.size() == 4);
    CHECK(ranges::all_of(values, [](const Value& val) { return val.is_integer(); }));
    CHECK(ranges::count(values, Value{0}) == 1);
    CHECK(ranges::count(values, Value{3}) == 1);
}

TEST_CASE("Decimals are rounded to the requested places") {
    ValueGenerator gen{3};

    auto values = gen.generate_numbers(NumberConfig{.lower = 0, .upper = 10, .decimal = 2, .exclude = {}}, 20);

    REQUIRE(values.size() == 20);
    CHECK(all_unique(values));

    for (const Value& val : values) {
        CAPTURE(val);
        REQUIRE(val.is_decimal());
        CHECK(val.as_decimal() >= 0.0);
        CHECK(val.as_decimal() <= 10.0);

        std::string text = to_literal(val);
        auto point = text.find('.');
        REQUIRE(point != std::string::npos);
        CHECK(text.size() - point - 1 <= 2);
    }
}

TEST_CASE("Rounded decimals stay within the bounds") {
    ValueGenerator gen{31};

    // Draws from [0.05, 0.06] round up to 0.1, past the upper bound
    auto values = gen.generate_numbers(NumberConfig{.lower = 0, .upper = 0.06, .decimal = 1, .exclude = {}}, 5);

    REQUIRE(values.size() == 1);
    CHECK(values.front() == Value{0.0});

    SECTION("Negative bounds") {
        auto negatives =
            gen.generate_numbers(NumberConfig{.lower = -0.06, .upper = 0, .decimal = 1, .exclude = {}}, 5);

        REQUIRE(negatives.size() == 1);
        CHECK(negatives.front() == Value{0.0});
    }
}

TEST_CASE("Excluded numbers are never produced") {
    ValueGenerator gen{4};

    auto values =
        gen.generate_numbers(NumberConfig{.lower = 0, .upper = 5, .decimal = {}, .exclude = {0, 1, 2}}, 10);

    CHECK(values.size() == 3);
    CHECK(ranges::all_of(values, [](const Value& val) { return val.as_integer() >= 3; }));
}

TEST_CASE("Generation stops short when the value space is exhausted") {
    ValueGenerator gen{5};

    SECTION("Numbers") {
        auto values = gen.generate_numbers(NumberConfig{.lower = 7, .upper = 7, .decimal = {}, .exclude = {}}, 10);
        REQUIRE(values.size() == 1);
        CHECK(values.front() == Value{7});
    }

    SECTION("Text") {
        TextConfig config{.lower_len = 1, .upper_len = 1, .char_min = 'x', .char_max = 'y'};
        auto values = gen.generate_texts(config, 10);
        CHECK(values.size() == 2);
    }

    SECTION("Everything excluded") {
        auto values = gen.generate_numbers(NumberConfig{.lower = 0, .upper = 1, .decimal = {}, .exclude = {0, 1}}, 5);
        CHECK(values.empty());
    }
}

TEST_CASE("Unusable constraints yield nothing") {
    ValueGenerator gen{6};

    CHECK(gen.generate_numbers(NumberConfig{.lower = 5, .upper = 1, .decimal = {}, .exclude = {}}, 3).empty());
    CHECK(gen.generate_texts(TextConfig{.lower_len = 4, .upper_len = 2}, 3).empty());
    CHECK(gen.generate_texts(TextConfig{.char_min = 'z', .char_max = 'a'}, 3).empty());
}

TEST_CASE("Text honors length, range and substring exclusions") {
    ValueGenerator gen{7};

    TextConfig config{.lower_len = 2, .upper_len = 6, .char_min = 'a', .char_max = 'e', .exclude = {"a", "bb"}};

    auto values = gen.generate_texts(config, 15);

    REQUIRE_FALSE(values.empty());
    CHECK(all_unique(values));

    for (const Value& val : values) {
        const std::string& text = val.as_text();
        CAPTURE(text);

        CHECK(text.size() >= 2);
        CHECK(text.size() <= 6);
        CHECK(ranges::all_of(text, [](char chr) { return chr >= 'b' && chr <= 'e'; }));
        CHECK(text.find("bb") == std::string::npos);
    }
}

TEST_CASE("Case transforms only touch ASCII letters") {
    ValueGenerator gen{8};

    SECTION("Upper") {
        TextConfig config{.lower_len = 5, .upper_len = 5, .char_min = 'a', .char_max = 'z'};
        config.case_transform = CaseTransform::Upper;

        for (const Value& val : gen.generate_texts(config, 5)) {
            CHECK(ranges::all_of(val.as_text(), [](char chr) { return chr >= 'A' && chr <= 'Z'; }));
        }
    }

    SECTION("Lower") {
        TextConfig config{.lower_len = 5, .upper_len = 5, .char_min = '0', .char_max = 'Z'};
        config.case_transform = CaseTransform::Lower;

        for (const Value& val : gen.generate_texts(config, 5)) {
            CHECK(ranges::all_of(val.as_text(), [](char chr) { return !(chr >= 'A' && chr <= 'Z'); }));
        }
    }

    SECTION("Random") {
        TextConfig config{.lower_len = 8, .upper_len = 8, .char_min = 'a', .char_max = 'z'};
        config.case_transform = CaseTransform::Random;

        auto values = gen.generate_texts(config, 20);
        REQUIRE(values.size() == 20);
        CHECK(all_unique(values));

        std::string letters;
        for (const Value& val : values) {
            CHECK(val.as_text().size() == 8);
            letters += val.as_text();
        }

        CHECK(ranges::all_of(letters, [](char chr) { return (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z'); }));
        CHECK(ranges::any_of(letters, [](char chr) { return chr >= 'A' && chr <= 'Z'; }));
        CHECK(ranges::any_of(letters, [](char chr) { return chr >= 'a' && chr <= 'z'; }));

        ValueGenerator first{12};
        ValueGenerator second{12};
        CHECK(first.generate_texts(config, 5) == second.generate_texts(config, 5));
    }

    SECTION("Random leaves other characters alone") {
        TextConfig config{.lower_len = 6, .upper_len = 6, .char_min = '0', .char_max = '9'};
        config.case_transform = CaseTransform::Random;

        for (const Value& val : gen.generate_texts(config, 5)) {
            CHECK(ranges::all_of(val.as_text(), [](char chr) { return chr >= '0' && chr <= '9'; }));
        }
    }
}

TEST_CASE("Non-ASCII code points are encoded as UTF-8") {
    ValueGenerator gen{9};

    TextConfig config{.lower_len = 3, .upper_len = 3, .char_min = 0x4E00, .char_max = 0x4E10};

    for (const Value& val : gen.generate_texts(config, 5)) {
        // three code points, three bytes each
        CHECK(val.as_text().size() == 9);
        CHECK(lit(to_literal(val)) == val);
    }
}

TEST_CASE("Tri-state values are sampled with replacement") {
    ValueGenerator gen{10};

    SECTION("All enabled") {
        auto values = gen.generate_tristates(TriStateConfig{}, 30);

        REQUIRE(values.size() == 30);
        CHECK(ranges::all_of(values, [](const Value& val) { return val.is_tristate(); }));
        CHECK_FALSE(all_unique(values));
    }

    SECTION("Only true") {
        TriStateConfig config{.include_true = true, .include_false = false, .include_null = false};
        auto values = gen.generate_tristates(config, 4);

        REQUIRE(values.size() == 4);
        CHECK(ranges::all_of(values, [](const Value& val) { return val == Value{true}; }));
    }

    SECTION("None enabled") {
        CHECK(gen.generate_tristates(TriStateConfig{false, false, false}, 4).empty());
    }
}

TEST_CASE("Sequences hold one value per element config") {
    ValueGenerator gen{11};

    SequenceConfig config{.elements = {
                              make_config(NumberConfig{.lower = 0, .upper = 9, .decimal = {}, .exclude = {}}),
                              make_config(TextConfig{.lower_len = 1, .upper_len = 3}),
                              make_config(TriStateConfig{}),
                          }};

    auto values = gen.generate_sequences(config, 6);

    REQUIRE(values.size() == 6);

    for (const Value& val : values) {
        CAPTURE(val);
        REQUIRE(val.is_sequence());
        REQUIRE(val.as_sequence().size() == 3);
        CHECK(val.as_sequence()[0].is_integer());
        CHECK(val.as_sequence()[1].is_text());
        CHECK(val.as_sequence()[2].is_tristate());
    }
}

TEST_CASE("Sequences with an impossible element are dropped") {
    ValueGenerator gen{12};

    SequenceConfig config{.elements = {
                              make_config(NumberConfig{.lower = 0, .upper = 9, .decimal = {}, .exclude = {}}),
                              make_config(TriStateConfig{false, false, false}),
                          }};

    CHECK(gen.generate_sequences(config, 4).empty());
}

TEST_CASE("Mapping keys and values pair up to the shorter list") {
    ValueGenerator gen{13};

    MappingConfig config{
        .keys =
            {
                make_config(TextConfig{.lower_len = 3, .upper_len = 3, .char_min = 'a', .char_max = 'z'}),
                make_config(NumberConfig{.lower = 0, .upper = 9, .decimal = {}, .exclude = {}}),
            },
        .values = {make_config(TriStateConfig{})},
    };

    auto values = gen.generate_mappings(config, 5);

    REQUIRE(values.size() == 5);

    for (const Value& val : values) {
        REQUIRE(val.is_mapping());
        REQUIRE(val.as_mapping().size() == 1);
        CHECK(val.as_mapping().front().key.is_text());
        CHECK(val.as_mapping().front().value.is_tristate());
    }
}

TEST_CASE("Identical seeds yield identical values") {
    ValueConfig config = make_config(TextConfig{.lower_len = 0, .upper_len = 12}, 20);

    ValueGenerator first{99};
    ValueGenerator second{99};
    ValueGenerator other{100};

    auto first_values = first.generate(config);
    auto second_values = second.generate(config);

    CHECK(first_values == second_values);
    CHECK_FALSE(first_values == other.generate(config));
}

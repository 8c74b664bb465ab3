#pragma once

#include <fngrader/common/class_traits.hpp>
#include <fngrader/generator/value_config.hpp>
#include <fngrader/value/value.hpp>

#include <boost/random/mersenne_twister.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fngrader {

/// Produces distinct values from declarative constraints.
///
/// All randomness comes from the generator's own seeded engine, so an identical seed and an identical
/// sequence of calls always yield identical values, on every platform.
///
/// Generation is best-effort: numbers and text make at most 100x the requested count of attempts,
/// and return fewer values than requested when the unique-value space under the constraints is too
/// small. Tri-state values are sampled with replacement and are never short.
class ValueGenerator : NonCopyable
{
public:
    static constexpr std::size_t MAX_ATTEMPTS_FACTOR = 100;

    explicit ValueGenerator(std::uint32_t seed);

    /// Generates `config.total_tests` values
    std::vector<Value> generate(const ValueConfig& config);

    std::vector<Value> generate(const ValueConfig& config, std::size_t count);

    std::vector<Value> generate_numbers(const NumberConfig& config, std::size_t count);
    std::vector<Value> generate_texts(const TextConfig& config, std::size_t count);
    std::vector<Value> generate_tristates(const TriStateConfig& config, std::size_t count);

    /// A sequence is dropped entirely if any of its elements cannot be generated
    std::vector<Value> generate_sequences(const SequenceConfig& config, std::size_t count);

    /// A mapping is dropped entirely if any of its keys or values cannot be generated
    std::vector<Value> generate_mappings(const MappingConfig& config, std::size_t count);

private:
    std::optional<Value> generate_one(const ValueConfig& config);

    std::string draw_text(const TextConfig& config);

    boost::random::mt19937 engine_;
};

} // namespace fngrader

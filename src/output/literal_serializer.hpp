#pragma once

#include <fngrader/grading/grade_report.hpp>

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <string_view>

namespace fngrader {

/// Machine-readable output: each grade report as one line of literal text.
/// Warnings and errors go to the log rather than the sink, so the sink only ever holds literals.
class LiteralSerializer : public Serializer
{
public:
    using Serializer::Serializer;

    void on_grade_report(const GradeReport& report) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;
};

} // namespace fngrader

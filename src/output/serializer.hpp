#pragma once

#include <fngrader/common/class_traits.hpp>
#include <fngrader/grading/grade_report.hpp>

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <string_view>

namespace fngrader {

/// Renders grade reports and diagnostics to a sink
class Serializer : NonCopyable
{
public:
    explicit Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_grade_report(const GradeReport& report) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace fngrader

#include "output/literal_serializer.hpp"

#include <fngrader/grading/grade_report.hpp>
#include <fngrader/logging.hpp>

#include "output/verbosity.hpp"

#include <string>
#include <string_view>

namespace fngrader {

void LiteralSerializer::on_grade_report(const GradeReport& report) {
    if (verbosity_ == VerbosityLevel::Silent) {
        return;
    }

    sink_.write(serialize_grade_report(report) + "\n");
}

void LiteralSerializer::on_warning(std::string_view what) {
    LOG_WARN("{}", what);
}

void LiteralSerializer::on_error(std::string_view what) {
    LOG_ERROR("{}", what);
}

void LiteralSerializer::finalize() {
    sink_.flush();
}

} // namespace fngrader

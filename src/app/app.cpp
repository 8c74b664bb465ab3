#include "app/app.hpp"

#include <fngrader/common/text_file.hpp>
#include <fngrader/logging.hpp>

#include "app/build_key_app.hpp"
#include "app/grade_app.hpp"
#include "app/plan_app.hpp"
#include "output/stdout_sink.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string_view>
#include <utility>

namespace fngrader {

int App::write_artifact(std::string_view contents) const {
    if (!OPTS.output_path) {
        StdoutSink sink;
        sink.write(contents);
        sink.flush();

        return EXIT_SUCCESS;
    }

    if (auto written = write_text_file(*OPTS.output_path, contents); !written) {
        return fail(written.error());
    }

    LOG_INFO("Wrote {:?}", OPTS.output_path->string());

    return EXIT_SUCCESS;
}

int App::fail(std::string_view what) {
    fmt::print(stderr, "{}\n", fmt::styled(what, fmt::fg(fmt::color::red) | fmt::emphasis::bold));

    return EXIT_FAILURE;
}

std::unique_ptr<App> make_app(ProgramOptions opts) {
    using enum ProgramOptions::Command;

    switch (opts.command) {
    case Plan:
        return std::make_unique<PlanApp>(std::move(opts));
    case BuildKey:
        return std::make_unique<BuildKeyApp>(std::move(opts));
    case Grade:
        return std::make_unique<GradeApp>(std::move(opts));
    }

    UNREACHABLE(opts.command);
}

} // namespace fngrader

#include <fngrader/logging.hpp>

#include "app/app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <utility>

int main(int argc, const char* argv[]) {
    using namespace fngrader;

    init_loggers();

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    ProgramOptions options = parse_args_or_exit(args);

    std::unique_ptr<App> app = make_app(std::move(options));

    return app->run();
}

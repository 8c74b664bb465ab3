#include <fngrader/subprocess/run_result.hpp>

#include <chrono>

namespace fngrader {

RunResult::RunResult(Kind kind, int code, std::chrono::milliseconds elapsed)
    : kind_{kind}
    , code_{code}
    , elapsed_{elapsed} {}

RunResult RunResult::make_exited(int code, std::chrono::milliseconds elapsed) {
    return {Kind::Exited, code, elapsed};
}

RunResult RunResult::make_signaled(int signal, std::chrono::milliseconds elapsed) {
    return {Kind::Signaled, signal, elapsed};
}

RunResult RunResult::make_timed_out(std::chrono::milliseconds elapsed) {
    return {Kind::TimedOut, 0, elapsed};
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

std::chrono::milliseconds RunResult::get_elapsed() const {
    return elapsed_;
}

} // namespace fngrader

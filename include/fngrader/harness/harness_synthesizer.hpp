/// \file
/// Synthesis of the instrumented program that runs every planned call and reports the results
#pragma once

#include <fngrader/planner/call_planner.hpp>
#include <fngrader/planner/test_call.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace fngrader {

/// Name the harness binds a tracked argument to before call `call_index`
std::string tracked_binding_name(std::size_t call_index, std::string_view param_name);

/// The call expression, arguments written as Python, with each tracked argument replaced by its binding name.
///
/// Only the first textual occurrence of a tracked literal within the argument list is replaced, in
/// parameter order. When a tracked literal also occurs earlier as (part of) another argument, that
/// earlier occurrence is the one replaced.
std::string bound_call_expression(const TestCall& call, std::size_t call_index);

/// Builds one self-contained Python 3 program: `source` verbatim, then every call in order.
///
/// The source is embedded as bytes and compiled as a module of its own, so its future imports and
/// encoding declaration take effect. Names the harness defines are all prefixed with `_fngrader_`.
///
/// Run to completion, the program writes exactly one literal to stdout, a sequence holding one
/// `{"return_value": ..., "heap_param_values": {...}}` record per call, and nothing else. Anything
/// the source prints goes to stderr. Each record is serialized right after its call returns, so
/// later calls cannot alter it.
std::string synthesize_harness(std::string_view source, const CallPlan& calls);

} // namespace fngrader

#pragma once

#include <fngrader/common/error_types.hpp>             // IWYU pragma: export
#include <fngrader/common/expected.hpp>                // IWYU pragma: export
#include <fngrader/common/text_file.hpp>               // IWYU pragma: export
#include <fngrader/engine.hpp>                         // IWYU pragma: export
#include <fngrader/generator/value_config.hpp>         // IWYU pragma: export
#include <fngrader/generator/value_generator.hpp>      // IWYU pragma: export
#include <fngrader/grading/answer_key.hpp>             // IWYU pragma: export
#include <fngrader/grading/grade_report.hpp>           // IWYU pragma: export
#include <fngrader/grading/result_comparator.hpp>      // IWYU pragma: export
#include <fngrader/grading/result_record.hpp>          // IWYU pragma: export
#include <fngrader/harness/harness_synthesizer.hpp>    // IWYU pragma: export
#include <fngrader/logging.hpp>                        // IWYU pragma: export
#include <fngrader/planner/call_planner.hpp>           // IWYU pragma: export
#include <fngrader/planner/test_call.hpp>              // IWYU pragma: export
#include <fngrader/sandbox/execution_outcome.hpp>      // IWYU pragma: export
#include <fngrader/sandbox/executor.hpp>               // IWYU pragma: export
#include <fngrader/sandbox/limits.hpp>                 // IWYU pragma: export
#include <fngrader/sandbox/namespace_executor.hpp>     // IWYU pragma: export
#include <fngrader/sandbox/nsjail_executor.hpp>        // IWYU pragma: export
#include <fngrader/sandbox/scratch_area.hpp>           // IWYU pragma: export
#include <fngrader/spec/spec_reader.hpp>               // IWYU pragma: export
#include <fngrader/spec/test_spec.hpp>                 // IWYU pragma: export
#include <fngrader/value/literal.hpp>                  // IWYU pragma: export
#include <fngrader/value/value.hpp>                    // IWYU pragma: export

#include <fngrader/harness/harness_synthesizer.hpp>

#include <fngrader/logging.hpp>
#include <fngrader/planner/call_planner.hpp>
#include <fngrader/planner/test_call.hpp>
#include <fngrader/value/literal.hpp>
#include <fngrader/value/value.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace fngrader {

namespace {

// Rebinds stdout before any user code runs. Names are prefixed to stay clear of the source's globals.
constexpr std::string_view PRELUDE = R"py(import sys as _fngrader_sys
_fngrader_stdout = _fngrader_sys.stdout
_fngrader_sys.stdout = _fngrader_sys.stderr
_fngrader_inf = float("inf")
_fngrader_nan = float("nan")

)py";

// compile() applies the source's own future imports and encoding declaration, wherever it is embedded
constexpr std::string_view RUN_SOURCE = R"py(exec(compile(_fngrader_source, "<source>", "exec"), globals())
del _fngrader_source
)py";

// Serializes results in the literal grammar
constexpr std::string_view SUPPORT = R"py(

def _fngrader_text(value):
    out = ['"']
    for ch in value:
        code = ord(ch)
        if ch == '"':
            out.append('\\"')
        elif ch == '\\':
            out.append('\\\\')
        elif ch == '\n':
            out.append('\\n')
        elif ch == '\r':
            out.append('\\r')
        elif ch == '\t':
            out.append('\\t')
        elif code < 0x20 or code == 0x7f or 0xd800 <= code <= 0xdfff:
            out.append('\\u%04x' % code)
        else:
            out.append(ch)
    out.append('"')
    return ''.join(out)


def _fngrader_serialize(value):
    if value is None:
        return 'null'
    if value is True:
        return 'true'
    if value is False:
        return 'false'
    if isinstance(value, int):
        return str(int(value))
    if isinstance(value, float):
        if value != value:
            return 'nan'
        if value in (float('inf'), float('-inf')):
            return 'inf' if value > 0 else '-inf'
        return repr(float(value))
    if isinstance(value, str):
        return _fngrader_text(value)
    if isinstance(value, (list, tuple)):
        return '[' + ', '.join(_fngrader_serialize(elem) for elem in value) + ']'
    if isinstance(value, (set, frozenset)):
        return '[' + ', '.join(sorted(_fngrader_serialize(elem) for elem in value)) + ']'
    if isinstance(value, dict):
        return '{' + ', '.join(_fngrader_serialize(key) + ': ' + _fngrader_serialize(val)
                               for key, val in value.items()) + '}'
    raise TypeError('no literal form for a value of type ' + type(value).__name__)


def _fngrader_record(return_value, tracked):
    heap = ', '.join(_fngrader_text(name) + ': ' + _fngrader_serialize(val) for name, val in tracked)
    return '{"return_value": ' + _fngrader_serialize(return_value) + ', "heap_param_values": {' + heap + '}}'


_fngrader_results = []
)py";

constexpr std::string_view EPILOGUE = R"py(
_fngrader_sys.stdout.flush()
_fngrader_stdout.buffer.write(('[' + ', '.join(_fngrader_results) + ']').encode('utf-8', 'surrogatepass'))
_fngrader_stdout.flush()
)py";

/// A bytes literal of one line of source, escaped so that the harness itself stays ASCII
std::string bytes_literal(std::string_view line) {
    std::string res = "b'";

    for (char ch : line) {
        const auto byte = static_cast<unsigned char>(ch);

        if (ch == '\\' || ch == '\'') {
            res += '\\';
            res += ch;
        } else if (ch == '\n') {
            res += "\\n";
        } else if (byte >= 0x20 && byte < 0x7f) {
            res += ch;
        } else {
            res += fmt::format("\\x{:02x}", byte);
        }
    }

    res += '\'';
    return res;
}

/// `source` as the bytes it is, one literal per line
void append_source(std::string& out, std::string_view source) {
    out += "_fngrader_source = (\n";

    if (source.empty()) {
        out += "    b''\n";
    }

    while (!source.empty()) {
        const std::size_t line_end = source.find('\n');
        const std::size_t line_size = line_end == std::string_view::npos ? source.size() : line_end + 1;

        out += fmt::format("    {}\n", bytes_literal(source.substr(0, line_size)));
        source.remove_prefix(line_size);
    }

    out += ")\n";
    out += RUN_SOURCE;
}

/// Python expression for `value`. Special numbers refer to the harness's own names, so nothing the source
/// defines can change an argument.
std::string python_expression(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Null:
            return "None";
        case Value::Kind::Boolean:
            return value.as_boolean() ? "True" : "False";
        case Value::Kind::Decimal: {
            const double decimal = value.as_decimal();
            if (std::isnan(decimal)) {
                return "_fngrader_nan";
            }
            if (std::isinf(decimal)) {
                return decimal > 0 ? "_fngrader_inf" : "-_fngrader_inf";
            }
            return to_literal(value);
        }
        case Value::Kind::Integer:
        case Value::Kind::Text:
            return to_literal(value);
        case Value::Kind::Sequence: {
            std::string res = "[";
            for (const Value& elem : value.as_sequence()) {
                if (res.size() > 1) {
                    res += ", ";
                }
                res += python_expression(elem);
            }
            return res + "]";
        }
        case Value::Kind::Mapping: {
            std::string res = "{";
            for (const MappingEntry& entry : value.as_mapping()) {
                if (res.size() > 1) {
                    res += ", ";
                }
                res += fmt::format("{}: {}", python_expression(entry.key), python_expression(entry.value));
            }
            return res + "}";
        }
    }

    UNREACHABLE(value.kind());
}

void append_call(std::string& out, const TestCall& call, std::size_t call_index) {
    out += fmt::format("\n# call {}\n", call_index);

    for (const TrackedArgument& arg : call.tracked) {
        out += fmt::format("{} = {}\n", tracked_binding_name(call_index, arg.name), python_expression(arg.value));
    }

    out += fmt::format("_fngrader_return = {}\n", bound_call_expression(call, call_index));

    std::string tracked_pairs;
    for (const TrackedArgument& arg : call.tracked) {
        tracked_pairs += fmt::format("({}, {}), ", quote_text(arg.name), tracked_binding_name(call_index, arg.name));
    }

    out += fmt::format("_fngrader_results.append(_fngrader_record(_fngrader_return, ({})))\n", tracked_pairs);
}

} // namespace

std::string tracked_binding_name(std::size_t call_index, std::string_view param_name) {
    return fmt::format("_fngrader_t{}_{}", call_index, param_name);
}

std::string bound_call_expression(const TestCall& call, std::size_t call_index) {
    // Argument text is split into pieces; bound names are never searched again
    struct Piece
    {
        std::string text;
        bool bound;
    };

    std::string args_text;
    for (const Value& arg : call.arguments) {
        if (!args_text.empty()) {
            args_text += ", ";
        }
        args_text += python_expression(arg);
    }

    std::vector<Piece> pieces{Piece{.text = std::move(args_text), .bound = false}};

    for (const TrackedArgument& arg : call.tracked) {
        const std::string literal = python_expression(arg.value);
        bool replaced = false;

        for (std::size_t idx = 0; idx < pieces.size() && !replaced; ++idx) {
            if (pieces[idx].bound) {
                continue;
            }

            const std::size_t pos = pieces[idx].text.find(literal);
            if (pos == std::string::npos) {
                continue;
            }

            std::string before = pieces[idx].text.substr(0, pos);
            std::string after = pieces[idx].text.substr(pos + literal.size());

            auto iter = pieces.begin() + static_cast<std::ptrdiff_t>(idx);

            *iter = Piece{.text = tracked_binding_name(call_index, arg.name), .bound = true};
            iter = pieces.insert(iter + 1, Piece{.text = std::move(after), .bound = false});
            pieces.insert(iter - 1, Piece{.text = std::move(before), .bound = false});

            replaced = true;
        }

        if (!replaced) {
            LOG_WARN("tracked argument {} of call {} was not found in its call expression", arg.name, call_index);
        }
    }

    std::string res = call.method + "(";
    for (const Piece& piece : pieces) {
        res += piece.text;
    }
    res += ")";

    return res;
}

std::string synthesize_harness(std::string_view source, const CallPlan& calls) {
    std::string res{PRELUDE};

    append_source(res, source);

    res += SUPPORT;

    for (std::size_t idx = 0; idx < calls.size(); ++idx) {
        append_call(res, calls[idx], idx);
    }

    res += EPILOGUE;

    LOG_DEBUG("Synthesized a harness of {} bytes for {} calls", res.size(), calls.size());

    return res;
}

} // namespace fngrader

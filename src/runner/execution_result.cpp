#include "runner/execution_result.hpp"
#include <fmt/core.h>
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "config.hpp"

namespace ptyrun {
using namespace std;
using namespace nlohmann;

execution_result make_compilation_failed(const string &compiler_output) {
    return compilation_failed{utf8_replace_invalid(utf8_head(compiler_output, ERROR_EXCERPT_LIMIT))};
}

execution_result make_run_completed(const string &transcript, int exit_code, status session_status) {
    return run_completed{utf8_replace_invalid(utf8_tail(transcript, TRANSCRIPT_LIMIT)), exit_code, session_status};
}

execution_result make_system_failure(const string &message) {
    return system_failure{utf8_replace_invalid(utf8_head(message, ERROR_EXCERPT_LIMIT))};
}

string describe(const execution_result &result) {
    return visit(overloaded{
                     [](const compilation_failed &) -> string {
                         return "Compilation failed";
                     },
                     [](const unsupported_file &) -> string {
                         return "Unsupported file type";
                     },
                     [](const run_completed &r) -> string {
                         return fmt::format("{} (exit code {})", get_display_message(r.session_status), r.exit_code);
                     },
                     [](const system_failure &r) -> string {
                         return "System error: " + r.message;
                     }},
                 result);
}

void to_json(json &j, const compilation_failed &result) {
    j = {{"type", "compilation_failed"}, {"error_excerpt", result.error_excerpt}};
}

void to_json(json &j, const unsupported_file &) {
    j = {{"type", "unsupported_file"}};
}

void to_json(json &j, const run_completed &result) {
    j = {{"type", "completed"},
         {"transcript_excerpt", result.transcript_excerpt},
         {"exit_code", result.exit_code},
         {"status", get_status_key(result.session_status)}};
}

void to_json(json &j, const system_failure &result) {
    j = {{"type", "system_error"}, {"message", result.message}};
}

json result_to_json(const execution_result &result) {
    return visit([](const auto &r) { return json(r); }, result);
}

}  // namespace ptyrun

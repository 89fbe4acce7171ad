#include "runner/compiler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <set>
#include "common/utils.hpp"
#include "config.hpp"

namespace ptyrun {
using namespace std;
namespace fs = std::filesystem;

static const set<string> supported_extensions = {".c", ".cpp"};

bool is_supported_source(const fs::path &source) {
    return supported_extensions.count(source.extension().string()) > 0;
}

compilation_outcome compile_source(const fs::path &source, const fs::path &binary) {
    elapsed_time timer;
    auto result = call_process(COMPILE_TIME_LIMIT, COMPILER, COMPILER_STANDARD, "-o", binary, source);

    compilation_outcome outcome;
    if (result.timed_out) {
        outcome.log = fmt::format("compilation timed out after {} seconds\n{}", COMPILE_TIME_LIMIT.count(), result.output);
    } else {
        outcome.success = result.exit_code == 0;
        outcome.log = move(result.output);
    }

    LOG(INFO) << "Compiled " << source.filename() << " in " << timer.duration<chrono::milliseconds>().count()
              << "ms: " << (outcome.success ? "ok" : "failed");
    return outcome;
}

}  // namespace ptyrun

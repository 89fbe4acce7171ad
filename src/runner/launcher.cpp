#include "runner/launcher.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "runner/compiler.hpp"
#include "runner/workspace.hpp"

namespace ptyrun {
using namespace std;
namespace fs = std::filesystem;

process_launcher::process_launcher(const fs::path &sandbox_root, const session_options &options)
    : sandbox_root(sandbox_root), options(options) {}

execution_result process_launcher::execute(const fs::path &source_file, int timeout_seconds) {
    return execute(execution_request{source_file, timeout_seconds});
}

execution_result process_launcher::execute(const execution_request &request) {
    try {
        return compile_and_run(request);
    } catch (runner_exception &ex) {
        LOG(ERROR) << "execution of " << request.source_file.string() << " failed: " << ex;
        return make_system_failure(ex.what());
    } catch (exception &ex) {
        LOG(ERROR) << "execution of " << request.source_file.string() << " failed: " << ex.what();
        return make_system_failure(ex.what());
    }
}

execution_result process_launcher::compile_and_run(const execution_request &request) {
    if (request.timeout_seconds <= 0)
        throw runner_exception("timeout must be positive, got ") << request.timeout_seconds;

    sandbox_workspace workspace(sandbox_root);
    fs::path source = workspace.stage(request.source_file);

    if (!is_supported_source(source)) {
        LOG(INFO) << "unsupported file " << source.filename().string();
        return unsupported_file{};
    }

    fs::path binary = workspace.path() / "program";
    compilation_outcome compiled = compile_source(source, binary);
    if (!compiled.success)
        return make_compilation_failed(compiled.log);

    session_options session = options;
    session.timeout = chrono::seconds(request.timeout_seconds);
    session_multiplexer multiplexer(session);
    return multiplexer.run(binary, workspace.path());
}

}  // namespace ptyrun

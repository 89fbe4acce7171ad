#include "runner/workspace.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/erase.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"

namespace ptyrun {
using namespace std;
namespace fs = std::filesystem;

static string random_name() {
    string uuid = boost::lexical_cast<string>(boost::uuids::random_generator()());
    return "sandbox_" + boost::algorithm::erase_all_copy(uuid, "-");
}

sandbox_workspace::sandbox_workspace(const fs::path &root)
    : dir(root / random_name()) {
    error_code ec;
    fs::create_directories(root, ec);
    // create_directory reports false for an existing directory: never share one
    if (ec || !fs::create_directory(dir, ec) || ec) {
        throw workspace_error("unable to create sandbox directory " + dir.string() + ": " + ec.message());
    }
    DLOG(INFO) << "Created sandbox " << dir;
}

sandbox_workspace::~sandbox_workspace() {
    remove();
}

const fs::path &sandbox_workspace::path() const {
    return dir;
}

fs::path sandbox_workspace::stage(const fs::path &file) const {
    fs::path target = dir / file.filename();
    error_code ec;
    if (!fs::copy_file(file, target, fs::copy_options::overwrite_existing, ec) || ec) {
        throw workspace_error("unable to copy " + file.string() + " into sandbox: " + ec.message());
    }
    return target;
}

void sandbox_workspace::remove() noexcept {
    if (removed) return;
    removed = true;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        LOG(WARNING) << "Unable to delete sandbox " << dir << ": " << ec.message();
    } else {
        DLOG(INFO) << "Removed sandbox " << dir;
    }
}

}  // namespace ptyrun

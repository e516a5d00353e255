#include "judge/sandbox.hpp"
#include <glog/logging.h>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "config.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

sandbox::sandbox() : sandbox(fs::temp_directory_path()) {}

sandbox::sandbox(const fs::path &parent) {
    dir = parent / ("codejudge-sandbox-" + boost::uuids::to_string(boost::uuids::random_generator()()));
    fs::create_directories(dir / "input");
    fs::create_directories(dir / "output");
    LOG(INFO) << "Created sandbox " << dir;
}

sandbox::~sandbox() {
    cleanup();
}

bool sandbox::is_secure() const {
    error_code ec;
    return !removed && fs::is_directory(dir, ec);
}

const fs::path &sandbox::working_dir() const {
    return dir;
}

fs::path sandbox::input_dir() const {
    return dir / "input";
}

fs::path sandbox::output_dir() const {
    return dir / "output";
}

void sandbox::cleanup() noexcept {
    if (removed) return;
    removed = true;
    if (DEBUG) {
        LOG(INFO) << "Debug mode, keeping sandbox " << dir;
        return;
    }
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(WARNING) << "Unable to remove sandbox " << dir << ": " << ec.message();
}

}  // namespace codejudge

#include "common/utils.hpp"
#include <unistd.h>
#include <boost/algorithm/string.hpp>
#include <cstdlib>

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

static bool is_executable_file(const fs::path &path) {
    error_code ec;
    return fs::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

fs::path which(const string &program) {
    if (program.empty()) return {};
    if (program.find('/') != string::npos)
        return is_executable_file(program) ? fs::path(program) : fs::path();

    vector<string> dirs;
    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    boost::split(dirs, path, boost::is_any_of(":"));
    for (auto &dir : dirs) {
        fs::path candidate = fs::path(dir.empty() ? "." : dir) / program;
        if (is_executable_file(candidate))
            return candidate;
    }
    return {};
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

uint64_t elapsed_time::millis() const {
    return duration<chrono::milliseconds>().count();
}

}  // namespace codejudge

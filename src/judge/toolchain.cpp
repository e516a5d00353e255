#include "judge/toolchain.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/executor.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

optional<language> parse_language(const string &name) {
    string lower = boost::to_lower_copy(boost::trim_copy(name));
    if (lower == "c") return language::C;
    if (lower == "cpp" || lower == "c++") return language::CPP;
    return nullopt;
}

language_spec get_language_spec(language lang) {
    switch (lang) {
        case language::C:
            return {language::C, "c", C_COMPILER, {"-std=c99", "-O2", "-Wall", "-Wextra"}, "solution.c"};
        case language::CPP:
            return {language::CPP, "cpp", CXX_COMPILER, {"-std=c++17", "-O2", "-Wall", "-Wextra"}, "solution.cpp"};
    }
    throw invalid_argument("unknown language");
}

bool is_source_file(const fs::path &path) {
    string ext = boost::to_lower_copy(path.extension().string());
    return ext == ".c" || ext == ".cpp";
}

toolchain::~toolchain() = default;

execution_result native_toolchain::invoke(const vector<string> &argv, const fs::path &workdir, int time_limit) {
    if (argv.empty() || which(argv[0]).empty())
        throw environment_error(fmt::format("Compiler {} not found in PATH", argv.empty() ? string() : argv[0]));

    LOG(INFO) << "Invoking " << boost::join(argv, " ");
    executor exec(time_limit, 0, workdir);
    return exec.run(argv, "");
}

string native_toolchain::fingerprint(const language_spec &spec) {
    lock_guard<mutex> guard(mut);
    auto it = versions.find(spec.compiler);
    if (it != versions.end()) return it->second;

    string version = "unknown";
    if (!which(spec.compiler).empty()) {
        executor exec(COMPILE_TIME_LIMIT);
        auto result = exec.run({spec.compiler, "-dumpfullversion", "-dumpversion"}, "");
        if (result.success)
            version = boost::trim_copy(result.output);
    }
    string identity = spec.compiler + " " + version;
    versions[spec.compiler] = identity;
    return identity;
}

}  // namespace codejudge

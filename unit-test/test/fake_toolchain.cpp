#include "test/fake_toolchain.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include "judge/executor.hpp"
#include "test/environment.hpp"

namespace codejudge::mock {
using namespace std;
namespace fs = std::filesystem;

counting_toolchain::counting_toolchain(string program)
    : program(move(program)), identity("fake " + boost::uuids::to_string(boost::uuids::random_generator()())) {}

execution_result counting_toolchain::invoke(const vector<string> &argv, const fs::path &workdir, int /* time_limit */) {
    ++invocations;
    last_argv = argv;

    execution_result result;
    if (time_out) {
        result.error = TIME_LIMIT_EXCEEDED_MESSAGE;
        return result;
    }
    if (diagnostic) {
        result.exit_code = 1;
        result.error = *diagnostic;
        return result;
    }

    auto it = find(argv.begin(), argv.end(), "-o");
    if (it != argv.end() && next(it) != argv.end()) {
        fs::path output = *next(it);
        if (output.is_relative()) output = workdir / output;
        string body = program;
        if (padding > 0)
            body += "\n# " + string(padding, 'x');
        write_script(output, body);
    }
    result.success = true;
    result.exit_code = 0;
    return result;
}

string counting_toolchain::fingerprint(const language_spec &spec) {
    return identity + " " + spec.compiler;
}

}  // namespace codejudge::mock

#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace codejudge {
using namespace std;

// clang-format off
static const unordered_map<overall_status, const char *> status_string = boost::assign::map_list_of
    (overall_status::OK, "Ok")
    (overall_status::COMPILE_ERROR, "CompileError")
    (overall_status::RUNTIME_ERROR, "RuntimeError")
    (overall_status::TIMEOUT, "Timeout")
    (overall_status::UNSUPPORTED_LANGUAGE, "UnsupportedLanguage")
    (overall_status::ENV_ERROR, "EnvError");
// clang-format on

const char *get_display_message(overall_status stat) {
    return status_string.at(stat);
}

overall_status parse_overall_status(const string &name) {
    for (auto &[stat, str] : status_string)
        if (name == str)
            return stat;
    throw invalid_argument("unknown status " + name);
}

}  // namespace codejudge

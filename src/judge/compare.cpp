#include "judge/compare.hpp"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <vector>

namespace codejudge {
using namespace std;

string normalize_output(const string &output, const normalization_options &options) {
    string text = output;
    if (options.normalize_crlf)
        boost::replace_all(text, "\r\n", "\n");

    vector<string> lines;
    boost::split(lines, text, boost::is_any_of("\n"));
    for (auto &line : lines) {
        if (options.ignore_extra_whitespace) {
            vector<string> tokens;
            boost::split(tokens, line, boost::is_space(), boost::token_compress_on);
            tokens.erase(remove(tokens.begin(), tokens.end(), string()), tokens.end());
            line = boost::join(tokens, " ");
        } else {
            boost::trim(line);
        }
    }
    return boost::trim_copy(boost::join(lines, "\n"));
}

bool outputs_match(const string &actual, const string &expected, const normalization_options &options) {
    return normalize_output(actual, options) == normalize_output(expected, options);
}

}  // namespace codejudge

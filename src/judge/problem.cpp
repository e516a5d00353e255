#include "judge/problem.hpp"
#include <boost/algorithm/string.hpp>
#include <stdexcept>

namespace codejudge {
using namespace std;

const char *get_display_message(difficulty level) {
    switch (level) {
        case difficulty::EASY: return "Easy";
        case difficulty::MEDIUM: return "Medium";
        case difficulty::HARD: return "Hard";
    }
    throw invalid_argument("unknown difficulty");
}

difficulty parse_difficulty(const string &name) {
    if (boost::iequals(name, "easy")) return difficulty::EASY;
    if (boost::iequals(name, "medium")) return difficulty::MEDIUM;
    if (boost::iequals(name, "hard")) return difficulty::HARD;
    throw invalid_argument("unknown difficulty " + name);
}

}  // namespace codejudge

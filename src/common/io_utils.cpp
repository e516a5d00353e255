#include "common/io_utils.hpp"
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <utime.h>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(filesystem::path const &path) {
    ifstream fin(path.string(), ios::binary);
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());
    ofstream fout(path.string(), ios::binary | ios::trunc);
    if (!fout)
        throw system_error(errno, system_category(), "unable to open " + path.string() + " for writing");
    fout.write(content.data(), content.size());
    if (!fout)
        throw system_error(errno, system_category(), "unable to write " + path.string());
}

string assert_safe_path(const string &subpath) {
    fs::path path(subpath);
    if (subpath.empty() || path.is_absolute())
        throw invalid_argument("subpath is not safe " + subpath);
    for (auto &part : path)
        if (part == "..")
            throw invalid_argument("subpath is not safe " + subpath);
    return subpath;
}

time_t last_write_time(const fs::path &path) {
    struct stat attr;
    if (stat(path.c_str(), &attr) != 0)
        throw system_error(errno, system_category(), "error when reading modification time of path " + path.string());
    return attr.st_mtim.tv_sec;
}

void last_write_time(const fs::path &path, time_t timestamp) {
    struct utimbuf buf;
    buf.actime = chrono::system_clock::to_time_t(chrono::system_clock::now());
    buf.modtime = timestamp;
    if (utime(path.c_str(), &buf) == -1)
        throw system_error(errno, system_category(), "error when setting modification time of path " + path.string());
}

}  // namespace codejudge

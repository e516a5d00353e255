#include "judge/artifact_store.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <atomic>
#include "common/io_utils.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

static const string ARTIFACT_PREFIX = "run-";

static atomic<uint64_t> artifact_counter(0);

run_artifact_store::run_artifact_store(fs::path dir, chrono::seconds retention)
    : dir(fs::weakly_canonical(fs::absolute(dir))), retention(retention) {}

fs::path run_artifact_store::next_path() {
    fs::create_directories(dir);
    auto micros = chrono::duration_cast<chrono::microseconds>(chrono::system_clock::now().time_since_epoch()).count();
    return dir / fmt::format("{}{}-{}", ARTIFACT_PREFIX, micros, artifact_counter++);
}

size_t run_artifact_store::sweep() {
    error_code ec;
    if (!fs::is_directory(dir, ec)) return 0;

    time_t expire_before = chrono::system_clock::to_time_t(chrono::system_clock::now() - retention);
    size_t removed = 0;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const fs::path &path = it->path();
        if (!boost::starts_with(path.filename().string(), ARTIFACT_PREFIX)) continue;
        error_code file_ec;
        if (!it->is_regular_file(file_ec)) continue;
        try {
            if (codejudge::last_write_time(path) >= expire_before) continue;
        } catch (system_error &) {
            // 文件可能被其他进程同时删除
            continue;
        }
        if (fs::remove(path, file_ec)) {
            LOG(INFO) << "Removed expired run artifact " << path;
            ++removed;
        }
    }
    return removed;
}

const fs::path &run_artifact_store::directory() const {
    return dir;
}

}  // namespace codejudge

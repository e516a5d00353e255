#include "judge/compile_cache.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

// 缓存键所在的 UUID 命名空间
static const boost::uuids::uuid cache_namespace =
    boost::uuids::string_generator()("6f1c8a52-3c1e-4d8b-9a57-2f0e5b7c9d14");

compile_cache::compile_cache(fs::path dir) : dir(fs::weakly_canonical(fs::absolute(dir))) {}

string compile_cache::make_key(const string &source, const language_spec &spec, const string &toolchain_fingerprint) {
    string material = fmt::format("codejudge-cache-v{}\n{}\n{}\n{}\n",
                                  COMPILE_CACHE_VERSION, spec.name, toolchain_fingerprint, boost::join(spec.flags, " "));
    material += source;

    boost::uuids::name_generator_sha1 gen(cache_namespace);
    string hash = boost::uuids::to_string(gen(material.data(), material.size()));
    boost::erase_all(hash, "-");
    return hash + "_" + spec.name;
}

optional<fs::path> compile_cache::find(const string &key) const {
    fs::path path = dir / key;
    error_code ec;
    if (fs::is_regular_file(path, ec))
        return path;
    return nullopt;
}

bool compile_cache::store(const string &key, const fs::path &executable) const {
    fs::path target = dir / key;
    fs::path temp = dir / fmt::format(".{}.{}", key, boost::uuids::to_string(boost::uuids::random_generator()()));
    try {
        fs::create_directories(dir);
        fs::copy_file(executable, temp, fs::copy_options::overwrite_existing);
        fs::permissions(temp,
                        fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                        fs::perm_options::replace);
        // 同一个键的内容一定相同，并发写入时后完成的一方直接覆盖即可
        fs::rename(temp, target);
        LOG(INFO) << "Stored compiled executable in cache " << target;
        return true;
    } catch (fs::filesystem_error &ex) {
        LOG(WARNING) << "Unable to populate compile cache " << target << ": " << ex.what();
        error_code ec;
        fs::remove(temp, ec);
        return false;
    }
}

const fs::path &compile_cache::directory() const {
    return dir;
}

}  // namespace codejudge

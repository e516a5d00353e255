#include "judge/compiler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/executor.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

compilation_error::compilation_error(const string &what, const string &error_log)
    : judge_exception(what), error_log(error_log) {}

compilation_timeout_error::compilation_timeout_error(const string &what, const string &error_log)
    : compilation_error(what, error_log) {}

source_too_large_error::source_too_large_error(size_t size, size_t limit)
    : judge_exception(fmt::format("Source code too large: {} bytes exceeds limit of {} bytes", size, limit)), size(size), limit(limit) {}

executable_too_large_error::executable_too_large_error(uintmax_t size, uintmax_t limit)
    : judge_exception(fmt::format("Executable too large: {} bytes exceeds limit of {} bytes", size, limit)), size(size), limit(limit) {}

compiler::compiler(toolchain &chain, const compile_cache &cache, const fs::path &scratch_root)
    : chain(chain), cache(cache) {
    scratch = scratch_root / ("compile-" + boost::uuids::to_string(boost::uuids::random_generator()()));
}

compiler::~compiler() {
    error_code ec;
    fs::remove_all(scratch, ec);
    if (ec) LOG(WARNING) << "Unable to remove compile directory " << scratch << ": " << ec.message();
}

const fs::path &compiler::scratch_dir() const {
    return scratch;
}

compile_output compiler::compile(const string &code, language lang) {
    if (code.size() > SOURCE_SIZE_LIMIT)
        throw source_too_large_error(code.size(), SOURCE_SIZE_LIMIT);

    elapsed_time timer;
    language_spec spec = get_language_spec(lang);
    string key = compile_cache::make_key(code, spec, chain.fingerprint(spec));

    compile_output output;
    if (auto hit = cache.find(key)) {
        LOG(INFO) << "Compile cache hit " << key;
        output.executable = *hit;
        output.cached = true;
        output.compile_time = timer.millis();
        error_code ec;
        output.executable_size = fs::file_size(*hit, ec);
        if (ec) output.executable_size = 0;
        return output;
    }
    LOG(INFO) << "Compile cache miss " << key;

    fs::path source = scratch / spec.source_name;
    fs::path executable = scratch / key;
    write_file_content(source, code);

    vector<string> argv;
    to_string_list(argv, spec.compiler, "-o", executable, source, spec.flags);
    auto result = chain.invoke(argv, scratch, COMPILE_TIME_LIMIT);

    if (!result.success) {
        if (result.error && *result.error == TIME_LIMIT_EXCEEDED_MESSAGE) {
            LOG(INFO) << "Compilation of " << key << " timed out";
            throw compilation_timeout_error("Compilation timed out",
                                            fmt::format("Compilation exceeded time limit of {} ms", COMPILE_TIME_LIMIT));
        }
        throw compilation_error("Compilation failed", result.error.value_or("No compilation information"));
    }

    if (!fs::is_regular_file(executable))
        throw compilation_error("Compilation failed", "Compiler did not produce an executable");

    uintmax_t size = fs::file_size(executable);
    if (size > EXECUTABLE_SIZE_LIMIT) {
        error_code ec;
        fs::remove(executable, ec);
        throw executable_too_large_error(size, EXECUTABLE_SIZE_LIMIT);
    }

    cache.store(key, executable);

    output.executable = executable;
    output.compile_time = timer.millis();
    output.executable_size = size;
    return output;
}

void compiler::check_toolchain(toolchain &chain) {
    for (language lang : {language::C, language::CPP}) {
        language_spec spec = get_language_spec(lang);
        auto result = chain.invoke({spec.compiler, "--version"}, {}, COMPILE_TIME_LIMIT);
        if (!result.success)
            throw environment_error(fmt::format("{} compiler {} is not working: {}",
                                                spec.name, spec.compiler, result.error.value_or("unknown error")));
    }
}

}  // namespace codejudge

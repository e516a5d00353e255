#include "judge/interactive.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/compiler.hpp"
#include "judge/executor.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

string default_filename(const string &language_name) {
    auto lang = parse_language(language_name);
    if (!lang) throw unsupported_language_error(language_name);
    return *lang == language::CPP ? "main.cpp" : "main.c";
}

compile_result compile_files(const vector<code_file> &files, const string &language_name,
                             toolchain &chain, run_artifact_store &store,
                             const fs::path &scratch_root) {
    auto lang = parse_language(language_name);
    if (!lang) throw unsupported_language_error(language_name);
    language_spec spec = get_language_spec(*lang);

    size_t total_size = 0;
    vector<fs::path> sources;
    for (auto &file : files) {
        assert_safe_path(file.filename);
        total_size += file.content.size();
        if (is_source_file(file.filename))
            sources.push_back(fs::path(file.filename).lexically_normal());
    }
    if (sources.empty())
        throw invalid_argument("No source files found");
    if (total_size > SOURCE_SIZE_LIMIT)
        throw source_too_large_error(total_size, SOURCE_SIZE_LIMIT);

    elapsed_time timer;
    fs::path scratch = scratch_root / ("build-" + boost::uuids::to_string(boost::uuids::random_generator()()));
    defer {
        error_code ec;
        fs::remove_all(scratch, ec);
        if (ec) LOG(WARNING) << "Unable to remove build directory " << scratch << ": " << ec.message();
    };

    for (auto &file : files)
        write_file_content(scratch / file.filename, file.content);

    fs::path executable = scratch / "program";
    vector<string> argv;
    to_string_list(argv, spec.compiler, sources, "-o", executable, spec.flags);
    auto result = chain.invoke(argv, scratch, COMPILE_TIME_LIMIT);

    compile_result output;
    if (!result.success) {
        output.compile_time_ms = timer.millis();
        if (result.error && *result.error == TIME_LIMIT_EXCEEDED_MESSAGE)
            output.error = fmt::format("Compilation timed out after {} ms", COMPILE_TIME_LIMIT);
        else
            output.error = result.error.value_or("No compilation information");
        return output;
    }

    if (!fs::is_regular_file(executable)) {
        output.compile_time_ms = timer.millis();
        output.error = "Compiler did not produce an executable";
        return output;
    }

    uintmax_t size = fs::file_size(executable);
    if (size > EXECUTABLE_SIZE_LIMIT)
        throw executable_too_large_error(size, EXECUTABLE_SIZE_LIMIT);

    size_t expired = store.sweep();
    if (expired > 0)
        LOG(INFO) << "Removed " << expired << " expired run artifacts from " << store.directory();

    fs::path target = store.next_path();
    fs::copy_file(executable, target, fs::copy_options::overwrite_existing);
    fs::permissions(target,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec | fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace);

    output.success = true;
    output.executable_path = target.string();
    output.compile_time_ms = timer.millis();
    LOG(INFO) << fmt::format("Built {} source files into {} in {} ms", sources.size(), target.string(), output.compile_time_ms);
    return output;
}

}  // namespace codejudge

#include "judge/judger.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/compare.hpp"
#include "judge/compiler.hpp"
#include "judge/executor.hpp"

namespace codejudge {
using namespace std;

judger::judger(shared_ptr<toolchain> chain)
    : chain(move(chain)), box(), cache(CACHE_DIR) {
    if (!box.is_secure())
        throw internal_error(fmt::format("Sandbox {} is not available", box.working_dir().string()));
}

const sandbox &judger::get_sandbox() const {
    return box;
}

const compile_cache &judger::get_cache() const {
    return cache;
}

void judger::check_environment() {
    compiler::check_toolchain(*chain);
}

overall_status derive_overall_status(const vector<test_case_result> &results) {
    if (all_of(results.begin(), results.end(), [](const test_case_result &r) { return r.passed; }))
        return overall_status::OK;
    if (any_of(results.begin(), results.end(), [](const test_case_result &r) {
            return r.result.error == TIME_LIMIT_EXCEEDED_MESSAGE;
        }))
        return overall_status::TIMEOUT;
    if (any_of(results.begin(), results.end(), [](const test_case_result &r) {
            return !r.result.success && r.result.error && !r.result.error->empty();
        }))
        return overall_status::RUNTIME_ERROR;
    // 答案错误没有单独的评测结果，通过分数体现
    return overall_status::OK;
}

double compute_score(size_t passed, size_t total) {
    if (total == 0)
        throw invalid_argument("score is undefined without test cases");
    return static_cast<double>(passed) / total * 100.0;
}

judge_response judger::judge(const judge_request &request) {
    const problem &prob = request.problem;
    judge_response response;

    auto lang = parse_language(request.language);
    if (!lang) {
        LOG(INFO) << "Rejected submission for problem " << prob.id << " with unsupported language " << request.language;
        response.status = overall_status::UNSUPPORTED_LANGUAGE;
        response.error = unsupported_language_error(request.language).what();
        return response;
    }

    if (prob.test_cases.empty())
        throw invalid_argument(fmt::format("Problem {} has no test cases", prob.id));

    LOG(INFO) << fmt::format("Judging submission for problem {} in {} with {} test cases",
                             prob.id, request.language, prob.test_cases.size());

    compiler comp(*chain, cache, box.working_dir());
    compile_output compiled;
    try {
        compiled = comp.compile(request.code, *lang);
    } catch (compilation_error &ex) {
        LOG(INFO) << "Compilation failed for problem " << prob.id << ": " << ex.what();
        response.status = overall_status::COMPILE_ERROR;
        response.error = fmt::format("Compilation failed: {}", ex.error_log);
        return response;
    } catch (source_too_large_error &ex) {
        response.status = overall_status::COMPILE_ERROR;
        response.error = ex.what();
        return response;
    } catch (executable_too_large_error &ex) {
        response.status = overall_status::COMPILE_ERROR;
        response.error = ex.what();
        return response;
    } catch (environment_error &ex) {
        LOG(ERROR) << "Toolchain unavailable: " << ex.what();
        response.status = overall_status::ENV_ERROR;
        response.error = ex.what();
        return response;
    }

    submission_result result;
    result.problem_id = prob.id;
    result.total_test_cases = prob.test_cases.size();
    result.compilation_successful = true;
    result.compile_time_ms = compiled.compile_time;
    result.executable_size_bytes = compiled.executable_size;
    result.cached = compiled.cached;

    for (size_t i = 0; i < prob.test_cases.size(); ++i) {
        const test_case &tc = prob.test_cases[i];
        test_case_result tcr;
        tcr.test_case_id = i;
        tcr.expected_output = tc.expected_output;

        executor exec(prob.time_limit, prob.memory_limit, box.working_dir());
        try {
            tcr.result = exec.execute(compiled.executable, tc.input);
        } catch (exception &ex) {
            LOG(ERROR) << "Unable to execute test case " << i << " of problem " << prob.id << ": " << ex.what();
            tcr.result = execution_result();
            tcr.result.error = fmt::format("Execution error: {}", ex.what());
        }

        tcr.actual_output = tcr.result.output;
        tcr.passed = tcr.result.success && outputs_match(tcr.actual_output, tc.expected_output, request.normalization);
        if (tcr.passed) ++result.passed_test_cases;
        result.total_execution_time += tcr.result.execution_time;
        result.test_case_results.push_back(move(tcr));
    }

    result.score = compute_score(result.passed_test_cases, result.total_test_cases);
    response.status = derive_overall_status(result.test_case_results);
    response.success = true;

    LOG(INFO) << fmt::format("Problem {}: passed {}/{} test cases, score {:.1f}, status {}",
                             prob.id, result.passed_test_cases, result.total_test_cases,
                             result.score, get_display_message(response.status));
    response.result = move(result);
    return response;
}

}  // namespace codejudge

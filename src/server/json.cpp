#include "server/json.hpp"
#include "common/json_utils.hpp"

namespace codejudge {
using namespace std;
using nlohmann::json;

void from_json(const json &j, test_case &tc) {
    j.at("input").get_to(tc.input);
    j.at("expected_output").get_to(tc.expected_output);
    nlohmann::assign_optional(j, tc.is_hidden, "is_hidden");
}

void from_json(const json &j, problem &prob) {
    j.at("id").get_to(prob.id);
    nlohmann::assign_optional(j, prob.title, "title");
    nlohmann::assign_optional(j, prob.description, "description");
    if (nlohmann::exists(j, "difficulty"))
        prob.level = parse_difficulty(nlohmann::get_value<string>(j, "difficulty"));
    if (j.at("time_limit").is_number_integer() && !j.at("time_limit").is_number_unsigned())
        throw invalid_argument("time_limit must not be negative");
    j.at("time_limit").get_to(prob.time_limit);
    if (nlohmann::exists(j, "memory_limit") && j.at("memory_limit").is_number_integer() && !j.at("memory_limit").is_number_unsigned())
        throw invalid_argument("memory_limit must not be negative");
    nlohmann::assign_optional(j, prob.memory_limit, "memory_limit");
    j.at("test_cases").get_to(prob.test_cases);
    nlohmann::assign_optional(j, prob.tags, "tags");
}

void from_json(const json &j, normalization_options &options) {
    nlohmann::assign_optional(j, options.normalize_crlf, "normalize_crlf");
    nlohmann::assign_optional(j, options.ignore_extra_whitespace, "ignore_extra_whitespace");
}

void from_json(const json &j, judge_request &request) {
    j.at("code").get_to(request.code);
    j.at("language").get_to(request.language);
    j.at("problem").get_to(request.problem);
    nlohmann::assign_optional(j, request.normalization, "normalization");
}

void to_json(json &j, const execution_result &result) {
    j = {{"success", result.success},
         {"output", result.output},
         {"error", nlohmann::optional_to_json(result.error)},
         {"execution_time", result.execution_time},
         {"memory_usage", result.memory_usage},
         {"exit_code", result.exit_code},
         {"signal", result.signal}};
}

void to_json(json &j, const test_case_result &result) {
    j = {{"test_case_id", result.test_case_id},
         {"passed", result.passed},
         {"execution_result", result.result},
         {"expected_output", result.expected_output},
         {"actual_output", result.actual_output}};
}

void to_json(json &j, const submission_result &result) {
    j = {{"problem_id", result.problem_id},
         {"total_test_cases", result.total_test_cases},
         {"passed_test_cases", result.passed_test_cases},
         {"test_case_results", result.test_case_results},
         {"compilation_successful", result.compilation_successful},
         {"compilation_error", nlohmann::optional_to_json(result.compilation_error)},
         {"total_execution_time", result.total_execution_time},
         {"score", result.score},
         {"compile_time_ms", nlohmann::optional_to_json(result.compile_time_ms)},
         {"executable_size_bytes", nlohmann::optional_to_json(result.executable_size_bytes)},
         {"cached", result.cached}};
}

void to_json(json &j, const judge_response &response) {
    j = {{"success", response.success},
         {"result", nlohmann::optional_to_json(response.result)},
         {"error", nlohmann::optional_to_json(response.error)},
         {"status", get_display_message(response.status)}};
}

void from_json(const json &j, code_file &file) {
    j.at("filename").get_to(file.filename);
    j.at("content").get_to(file.content);
}

void to_json(json &j, const compile_result &result) {
    j = {{"success", result.success},
         {"executable_path", nlohmann::optional_to_json(result.executable_path)},
         {"error", nlohmann::optional_to_json(result.error)},
         {"compile_time_ms", result.compile_time_ms}};
}

string dump_json(const json &j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace codejudge

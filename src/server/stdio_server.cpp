#include "server/stdio_server.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <set>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"
#include "server/json.hpp"

namespace codejudge {
using namespace std;
using nlohmann::json;

static const set<string> actions = {"ping", "version", "env_check", "judge", "execute"};

json make_response(const json &id, bool success, const json &data, const optional<string> &error) {
    return {{"id", id},
            {"success", success},
            {"data", data},
            {"error", nlohmann::optional_to_json(error)}};
}

request_message parse_request(const string &line) {
    request_message message;
    try {
        json j = json::parse(line);
        if (!j.is_object())
            throw invalid_argument("request must be a JSON object");

        message.action = nlohmann::get_value<string>(j, "action");
        if (!actions.count(message.action))
            throw invalid_argument("unknown action " + message.action);
        message.id = nlohmann::access_optional(j, "id");

        if (message.action == "judge") {
            message.judge = nlohmann::access(j, "request").get<judge_request>();
        } else if (message.action == "execute") {
            message.language = nlohmann::get_value<string>(j, "language");
            nlohmann::assign_optional(j, message.code, "code");
            nlohmann::assign_optional(j, message.files, "files");
        }
    } catch (json::exception &ex) {
        throw invalid_argument(ex.what());
    }
    return message;
}

stdio_server::stdio_server(judger &judge, shared_ptr<toolchain> chain, run_artifact_store &artifacts)
    : judge(judge), chain(move(chain)), artifacts(artifacts), stopped(false) {}

optional<json> stdio_server::handle(const string &line) {
    if (boost::trim_copy(line).empty()) return nullopt;

    request_message request;
    try {
        request = parse_request(line);
    } catch (invalid_argument &ex) {
        LOG(WARNING) << "Malformed request: " << ex.what();
        return make_response(nullptr, false, nullptr, fmt::format("invalid request: {}", ex.what()));
    }

    try {
        return dispatch(request);
    } catch (exception &ex) {
        LOG(ERROR) << "Request " << request.action << " failed: " << ex.what();
        return make_response(request.id, false, nullptr, string(ex.what()));
    }
}

json stdio_server::dispatch(const request_message &request) {
    if (request.action == "ping") {
        return make_response(request.id, true, "pong", nullopt);
    } else if (request.action == "version") {
        return make_response(request.id, true, CODEJUDGE_VERSION, nullopt);
    } else if (request.action == "env_check") {
        try {
            judge.check_environment();
            return make_response(request.id, true, nullptr, nullopt);
        } catch (environment_error &ex) {
            return make_response(request.id, false, nullptr, string(ex.what()));
        }
    } else if (request.action == "judge") {
        judge_response response = judge.judge(*request.judge);
        return make_response(request.id, true, response, nullopt);
    } else {
        return execute(request);
    }
}

json stdio_server::execute(const request_message &request) {
    vector<code_file> files;
    if (request.files) {
        files = *request.files;
    } else if (request.code) {
        files.push_back({default_filename(request.language), *request.code});
    } else {
        return make_response(request.id, false, nullptr, string("Either 'code' or 'files' must be provided"));
    }

    compile_result result = compile_files(files, request.language, *chain, artifacts, judge.get_sandbox().working_dir());
    return make_response(request.id, true, result, nullopt);
}

void stdio_server::serve(istream &in, ostream &out) {
    string line;
    while (!stopped && getline(in, line)) {
        auto response = handle(line);
        if (!response) continue;
        out << dump_json(*response) << endl;
    }
    LOG(INFO) << "Stdio server stopped";
}

void stdio_server::stop() {
    stopped = true;
}

}  // namespace codejudge

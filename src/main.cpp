#include <glog/logging.h>
#include <signal.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/artifact_store.hpp"
#include "judge/judger.hpp"
#include "server/json.hpp"
#include "server/stdio_server.hpp"
using namespace std;

static codejudge::stdio_server *running_server = nullptr;

static void stop_handler(int /* signum */) {
    if (running_server) running_server->stop();
}

/**
 * @brief 安装 SIGINT 和 SIGTERM 的处理函数
 * 不设置 SA_RESTART，使阻塞在标准输入上的 getline 被信号打断，从而正常析构沙箱
 */
static void install_stop_handler() {
    struct sigaction action;
    action.sa_handler = stop_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

/**
 * @brief 演示用的题目：输出输入的两倍
 */
static codejudge::judge_request demo_request() {
    codejudge::judge_request request;
    request.language = "c";
    request.code = R"(#include <stdio.h>

int main() {
    int n;
    scanf("%d", &n);
    printf("%d\n", n * 2);
    return 0;
}
)";
    request.problem.id = "1";
    request.problem.title = "Double the Number";
    request.problem.description = "Read an integer n and print 2n.";
    request.problem.level = codejudge::difficulty::EASY;
    request.problem.time_limit = 1000;
    request.problem.memory_limit = 64;
    request.problem.test_cases = {{"5\n", "10\n", false}, {"10\n", "20\n", true}};
    request.problem.tags = {"math"};
    return request;
}

static int run_demo() {
    cout << "codejudge " << CODEJUDGE_VERSION << ": C/C++ code judging engine" << endl;

    codejudge::judger judge;
    try {
        judge.check_environment();
    } catch (codejudge::environment_error &ex) {
        cout << "Environment check failed: " << ex.what() << endl
             << "Please install gcc and g++ and make sure they can be found in PATH." << endl;
        return EXIT_SUCCESS;
    }
    cout << "Environment check passed" << endl;

    auto response = judge.judge(demo_request());
    cout << codejudge::dump_json(response, 2) << endl;
    return EXIT_SUCCESS;
}

static int run_stdio() {
    auto chain = make_shared<codejudge::native_toolchain>();
    codejudge::judger judge(chain);
    try {
        judge.check_environment();
    } catch (codejudge::environment_error &ex) {
        cerr << codejudge::dump_json(nlohmann::json{{"error", ex.what()}}) << endl;
        return EXIT_SUCCESS;
    }

    codejudge::run_artifact_store artifacts(codejudge::RUN_ARTIFACT_DIR, chrono::seconds(codejudge::RUN_ARTIFACT_RETENTION));
    codejudge::stdio_server server(judge, chain, artifacts);
    running_server = &server;
    install_stop_handler();

    LOG(INFO) << "Serving requests on stdio";
    server.serve(cin, cout);
    running_server = nullptr;
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    // 标准输出是协议通道，日志只能写到标准错误
    FLAGS_logtostderr = true;

    namespace po = boost::program_options;
    po::options_description desc("codejudge options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("stdio", "serve line-delimited JSON requests from stdin, write responses to stdout")
        ("cache-dir", po::value<string>(), "set the directory to store compiled executables, shared between processes. You can either pass it from environ CACHEDIR")
        ("artifact-dir", po::value<string>(), "set the directory to store executables built by execute requests. You can either pass it from environ ARTIFACTDIR")
        ("artifact-retention", po::value<int>(), "set how long in seconds executables built by execute requests are kept, default to 1800. You can either pass it from environ ARTIFACTRETENTION")
        ("source-size-limit", po::value<size_t>(), "set the maximum source size in bytes, default to 262144(256KB). You can either pass it from environ SOURCESIZELIMIT")
        ("executable-size-limit", po::value<size_t>(), "set the maximum executable size in bytes, default to 67108864(64MB). You can either pass it from environ EXECUTABLESIZELIMIT")
        ("compile-time-limit", po::value<int>(), "set time limit in milliseconds for compilers, default to 15000. You can either pass it from environ COMPILETIMELIMIT")
        ("output-limit", po::value<size_t>(), "set the maximum captured bytes of stdout and stderr of each run, default to 67108864(64MB)")
        ("memory-sample-interval", po::value<int>(), "set memory sampling interval in milliseconds, default to 30")
        ("enforce-memory-limit", "kill programs whose sampled memory exceeds the memory limit of the problem")
        ("cc", po::value<string>(), "set the C compiler, default to gcc. You can either pass it from environ CC")
        ("cxx", po::value<string>(), "set the C++ compiler, default to g++. You can either pass it from environ CXX")
        ("debug", "turn on the debug mode to keep sandbox directories for checking")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codejudge: compile C/C++ submissions, run them against test cases and report verdicts" << endl
             << "Without --stdio, judges a built-in example problem and prints the result" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codejudge " << CODEJUDGE_VERSION << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        codejudge::DEBUG = true;
    } else if (getenv("DEBUG")) {
        codejudge::DEBUG = true;
    }

    if (vm.count("cache-dir")) {
        codejudge::CACHE_DIR = filesystem::path(vm.at("cache-dir").as<string>());
    } else if (getenv("CACHEDIR")) {
        codejudge::CACHE_DIR = filesystem::path(getenv("CACHEDIR"));
    }
    codejudge::CACHE_DIR = filesystem::absolute(codejudge::CACHE_DIR);
    filesystem::create_directories(codejudge::CACHE_DIR);
    CHECK(filesystem::is_directory(codejudge::CACHE_DIR))
        << "Cache directory " << codejudge::CACHE_DIR << " does not exist";

    if (vm.count("artifact-dir")) {
        codejudge::RUN_ARTIFACT_DIR = filesystem::path(vm.at("artifact-dir").as<string>());
    } else if (getenv("ARTIFACTDIR")) {
        codejudge::RUN_ARTIFACT_DIR = filesystem::path(getenv("ARTIFACTDIR"));
    }
    codejudge::RUN_ARTIFACT_DIR = filesystem::absolute(codejudge::RUN_ARTIFACT_DIR);
    filesystem::create_directories(codejudge::RUN_ARTIFACT_DIR);
    CHECK(filesystem::is_directory(codejudge::RUN_ARTIFACT_DIR))
        << "Artifact directory " << codejudge::RUN_ARTIFACT_DIR << " does not exist";

    if (vm.count("artifact-retention")) {
        codejudge::RUN_ARTIFACT_RETENTION = vm["artifact-retention"].as<int>();
    } else if (getenv("ARTIFACTRETENTION")) {
        codejudge::RUN_ARTIFACT_RETENTION = boost::lexical_cast<int>(getenv("ARTIFACTRETENTION"));
    }

    if (vm.count("source-size-limit")) {
        codejudge::SOURCE_SIZE_LIMIT = vm["source-size-limit"].as<size_t>();
    } else if (getenv("SOURCESIZELIMIT")) {
        codejudge::SOURCE_SIZE_LIMIT = boost::lexical_cast<size_t>(getenv("SOURCESIZELIMIT"));
    }

    if (vm.count("executable-size-limit")) {
        codejudge::EXECUTABLE_SIZE_LIMIT = vm["executable-size-limit"].as<size_t>();
    } else if (getenv("EXECUTABLESIZELIMIT")) {
        codejudge::EXECUTABLE_SIZE_LIMIT = boost::lexical_cast<size_t>(getenv("EXECUTABLESIZELIMIT"));
    }

    if (vm.count("compile-time-limit")) {
        codejudge::COMPILE_TIME_LIMIT = vm["compile-time-limit"].as<int>();
    } else if (getenv("COMPILETIMELIMIT")) {
        codejudge::COMPILE_TIME_LIMIT = boost::lexical_cast<int>(getenv("COMPILETIMELIMIT"));
    }
    CHECK(codejudge::COMPILE_TIME_LIMIT > 0) << "Compile time limit should be positive";

    if (vm.count("output-limit"))
        codejudge::OUTPUT_LIMIT = vm["output-limit"].as<size_t>();

    if (vm.count("memory-sample-interval"))
        codejudge::MEMORY_SAMPLE_INTERVAL = vm["memory-sample-interval"].as<int>();
    CHECK(codejudge::MEMORY_SAMPLE_INTERVAL > 0) << "Memory sample interval should be positive";

    if (vm.count("enforce-memory-limit"))
        codejudge::ENFORCE_MEMORY_LIMIT = true;

    codejudge::C_COMPILER = vm.count("cc") ? vm["cc"].as<string>() : codejudge::get_env("CC", codejudge::C_COMPILER);
    codejudge::CXX_COMPILER = vm.count("cxx") ? vm["cxx"].as<string>() : codejudge::get_env("CXX", codejudge::CXX_COMPILER);

    try {
        if (vm.count("stdio"))
            return run_stdio();
        else
            return run_demo();
    } catch (codejudge::judge_exception& ex) {
        LOG(FATAL) << ex;
    } catch (exception& ex) {
        LOG(FATAL) << boost::diagnostic_information(ex);
    }
    return EXIT_FAILURE;
}

#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"
#include "execution/execution_pool.hpp"
#include "execution/execution_service.hpp"
#include "judge/comparison.hpp"
#include "judge/hints.hpp"
#include "judge/report.hpp"
#include "judge/validator.hpp"
#include "sandbox/docker_runtime.hpp"
using namespace std;
using nlohmann::json;

namespace po = boost::program_options;

enum exit_status {
    EXIT_OK = 0,
    EXIT_BAD_REQUEST = 1,
    EXIT_RUNTIME_UNAVAILABLE = 2
};

/**
 * @brief 命令行参数覆盖配置，只覆盖显式给出的参数
 */
template <typename T>
static void apply_option(const po::variables_map& vm, const char* name, T& value) {
    if (vm.count(name)) value = vm[name].as<T>();
}

static void apply_options(const po::variables_map& vm, coderun::execution_config& config) {
    apply_option(vm, "docker-image", config.docker_image);
    apply_option(vm, "docker-socket", config.docker_socket);
    apply_option(vm, "interpreter", config.interpreter);
    apply_option(vm, "timeout", config.container_timeout);
    apply_option(vm, "test-case-timeout", config.test_case_timeout);
    apply_option(vm, "max-execution-time", config.max_execution_time);
    apply_option(vm, "memory-limit", config.memory_limit);
    apply_option(vm, "cpu-limit", config.cpu_limit);
    apply_option(vm, "pids-limit", config.pids_limit);
    apply_option(vm, "scratch-size", config.scratch_size);
    if (vm.count("max-output-size")) {
        long long max_output_size = vm["max-output-size"].as<long long>();
        if (max_output_size < 0)
            throw coderun::precondition_error("--max-output-size must not be negative");
        config.max_output_size = static_cast<size_t>(max_output_size);
    }
    apply_option(vm, "max-concurrent", config.max_concurrent_executions);
    apply_option(vm, "network-disabled", config.network_disabled);
    apply_option(vm, "read-only-filesystem", config.read_only_filesystem);
    apply_option(vm, "no-new-privileges", config.no_new_privileges);
    apply_option(vm, "run-user", config.run_user);
    if (vm.count("work-dir"))
        config.work_dir = vm["work-dir"].as<string>();
}

static coderun::execution_request parse_execution_request(const json& j, const coderun::execution_config& config) {
    coderun::execution_request request;
    request.timeout_seconds = config.container_timeout;
    j.get_to(request);
    return request;
}

static vector<coderun::test_case> parse_test_cases(const json& j) {
    auto test_cases = nlohmann::get_value<vector<coderun::test_case>>(j, "test_cases");
    coderun::number_test_cases(test_cases);
    return test_cases;
}

static json run_command(const string& command, const json& request, coderun::execution_service& service) {
    const coderun::execution_config& config = service.config();
    if (command == "execute") {
        return service.execute(parse_execution_request(request, config));
    } else if (command == "validate") {
        auto source = nlohmann::get_value<string>(request, "code");
        auto result = coderun::validate(service, source, parse_test_cases(request));
        return coderun::make_submission_report(result);
    } else if (command == "compare") {
        auto source = nlohmann::get_value<string>(request, "code");
        auto reference = nlohmann::get_value_def<string>(request, "", "solution_code");
        auto result = coderun::compare(service, source, reference, parse_test_cases(request));
        return coderun::make_comparison_summary(result);
    } else if (command == "batch") {
        if (!request.is_array())
            throw coderun::precondition_error("batch request must be an array");
        coderun::execution_pool pool(service, (size_t)config.max_concurrent_executions);
        vector<future<coderun::execution_result>> futures;
        for (auto& item : request)
            futures.push_back(pool.submit(parse_execution_request(item, config)));
        json results = json::array();
        for (auto& f : futures)
            results.push_back(f.get());
        return results;
    } else if (command == "sweep") {
        return {{"removed", service.runtime().sweep()}};
    } else {
        throw coderun::precondition_error("Unrecognized command " + command);
    }
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    po::options_description desc("coderun options");
    po::options_description hidden;
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load configuration from given JSON file")
        ("input", po::value<string>()->default_value("-"), "read the JSON request from given file, - for stdin")
        ("docker-image", po::value<string>(), "set the base image to run code in, default to python:3.11-slim. You can either pass it from environ CODE_EXECUTION_DOCKER_IMAGE")
        ("docker-socket", po::value<string>(), "set the UNIX socket of the docker daemon, default to /var/run/docker.sock. You can either pass it from environ CODE_EXECUTION_DOCKER_SOCKET")
        ("interpreter", po::value<string>(), "set the interpreter command in the image, default to python. You can either pass it from environ CODE_EXECUTION_INTERPRETER")
        ("timeout", po::value<int>(), "set the default time limit in seconds for execute, default to 30. You can either pass it from environ CODE_EXECUTION_CONTAINER_TIMEOUT")
        ("test-case-timeout", po::value<int>(), "set time limit in seconds for each test case, default to 10. You can either pass it from environ CODE_EXECUTION_TEST_CASE_TIMEOUT")
        ("max-execution-time", po::value<int>(), "set the maximum time limit in seconds a request can ask for, default to 60. You can either pass it from environ CODE_EXECUTION_MAX_EXECUTION_TIME")
        ("memory-limit", po::value<string>(), "set memory limit of containers, default to 128m. You can either pass it from environ CODE_EXECUTION_MEMORY_LIMIT")
        ("cpu-limit", po::value<double>(), "set cpu cores a container can make use of, default to 0.5. You can either pass it from environ CODE_EXECUTION_CPU_LIMIT")
        ("pids-limit", po::value<int>(), "set the maximum number of processes in a container, default to 64. You can either pass it from environ CODE_EXECUTION_PIDS_LIMIT")
        ("scratch-size", po::value<string>(), "set size of the writable /tmp in containers, 0 to disable, default to 16m. You can either pass it from environ CODE_EXECUTION_SCRATCH_SIZE")
        ("max-output-size", po::value<long long>(), "set the maximum bytes of output to collect, default to 10240. You can either pass it from environ CODE_EXECUTION_MAX_OUTPUT_SIZE")
        ("max-concurrent", po::value<int>(), "set the number of containers batch runs at the same time, default to 10. You can either pass it from environ CODE_EXECUTION_MAX_CONCURRENT_EXECUTIONS")
        ("network-disabled", po::value<bool>(), "disable networking in containers, default to true. You can either pass it from environ CODE_EXECUTION_NETWORK_DISABLED")
        ("read-only-filesystem", po::value<bool>(), "mount root filesystem of containers read-only, default to true. You can either pass it from environ CODE_EXECUTION_READ_ONLY_FILESYSTEM")
        ("no-new-privileges", po::value<bool>(), "forbid privilege escalation in containers, default to true. You can either pass it from environ CODE_EXECUTION_NO_NEW_PRIVILEGES")
        ("run-user", po::value<string>(), "set the user to run code as, must not be root, default to nobody. You can either pass it from environ CODE_EXECUTION_RUN_USER")
        ("work-dir", po::value<string>(), "set the host directory to store source files, default to system temp directory. You can either pass it from environ CODE_EXECUTION_WORK_DIR")
        ("help", "display this help text")
        ("version", "display version of this application");
    hidden.add_options()
        ("command", po::value<string>(), "execute, validate, compare, hints, batch or sweep");
    // clang-format on
    positional.add("command", 1);

    po::options_description all;
    all.add(desc).add(hidden);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(all)
                      .positional(positional)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_BAD_REQUEST;
    }

    if (vm.count("help")) {
        cout << "coderun: Run untrusted code in docker containers, grade it against test cases" << endl
             << "Usage: " << argv[0] << " [options] <execute|validate|compare|hints|batch|sweep>" << endl
             << "The request is read as JSON from --input, and the result is printed as JSON to stdout" << endl;
        cout << desc << endl;
        return EXIT_OK;
    }

    if (vm.count("version")) {
        cout << "coderun 1.0" << endl;
        return EXIT_OK;
    }

    if (!vm.count("command")) {
        cerr << "A command should be specified" << endl
             << endl;
        cerr << desc << endl;
        return EXIT_BAD_REQUEST;
    }
    string command = vm["command"].as<string>();

    coderun::execution_config config;
    try {
        if (vm.count("config")) {
            filesystem::path config_file = vm["config"].as<string>();
            CHECK(filesystem::is_regular_file(config_file))
                << "Configuration file " << config_file << " does not exist";
            json::parse(coderun::read_file_content(config_file)).get_to(config);
        }
        coderun::apply_environment(config);
        apply_options(vm, config);
        coderun::check_config(config);
    } catch (std::exception& e) {
        LOG(ERROR) << "Configuration is malformed: " << e.what();
        cerr << e.what() << endl;
        return EXIT_BAD_REQUEST;
    }

    CHECK(filesystem::is_directory(config.work_dir))
        << "Work directory " << config.work_dir << " does not exist";

    try {
        json request;
        if (command == "hints") {
            request = json::parse(coderun::read_input(vm["input"].as<string>()));
            auto hints = nlohmann::get_value<vector<coderun::hint>>(request, "hints");
            int attempts = nlohmann::get_value_def<int>(request, 0, "attempts");
            size_t max_hints = nlohmann::get_value_def<size_t>(request, 0, "max_hints");
            cout << nlohmann::dump_lenient(coderun::resolve_hints(hints, attempts, max_hints)) << endl;
            return EXIT_OK;
        }
        if (command != "sweep")
            request = json::parse(coderun::read_input(vm["input"].as<string>()));

        auto runtime = make_shared<coderun::docker_runtime>(config.docker_socket, config.container());
        coderun::execution_service service(config, runtime);
        cout << nlohmann::dump_lenient(run_command(command, request, service)) << endl;
        return EXIT_OK;
    } catch (coderun::runtime_unavailable& e) {
        LOG(ERROR) << "Sandbox runtime is unavailable: " << e;
        cerr << e.what() << endl;
        return EXIT_RUNTIME_UNAVAILABLE;
    } catch (coderun::precondition_error& e) {
        cerr << e.what() << endl;
        return EXIT_BAD_REQUEST;
    } catch (json::exception& e) {
        cerr << "Malformed request: " << e.what() << endl;
        return EXIT_BAD_REQUEST;
    } catch (invalid_argument& e) {
        cerr << "Malformed request: " << e.what() << endl;
        return EXIT_BAD_REQUEST;
    } catch (std::exception& e) {
        LOG(ERROR) << "Unexpected failure: " << boost::diagnostic_information(e);
        cerr << e.what() << endl;
        return EXIT_BAD_REQUEST;
    }
}

#include "config.hpp"
#include <type_traits>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

resource_limits execution_config::limits() const {
    resource_limits limits;
    limits.memory_bytes = parse_memory_size(memory_limit);
    limits.cpus = cpu_limit;
    limits.pids_limit = pids_limit;
    limits.scratch_bytes = parse_memory_size(scratch_size);
    limits.max_output_bytes = max_output_size;
    limits.network_disabled = network_disabled;
    limits.read_only_filesystem = read_only_filesystem;
    limits.no_new_privileges = no_new_privileges;
    limits.run_user = run_user;
    return limits;
}

container_settings execution_config::container() const {
    container_settings settings;
    settings.image = docker_image;
    settings.interpreter = interpreter;
    settings.work_dir = work_dir;
    return settings;
}

void from_json(const json &j, execution_config &config) {
    assign_optional(j, config.docker_image, "docker_image");
    assign_optional(j, config.docker_socket, "docker_socket");
    assign_optional(j, config.interpreter, "interpreter");
    assign_optional(j, config.container_timeout, "container_timeout");
    assign_optional(j, config.test_case_timeout, "test_case_timeout");
    assign_optional(j, config.max_execution_time, "max_execution_time");
    assign_optional(j, config.memory_limit, "memory_limit");
    assign_optional(j, config.cpu_limit, "cpu_limit");
    assign_optional(j, config.pids_limit, "pids_limit");
    assign_optional(j, config.scratch_size, "scratch_size");
    if (exists(j, "max_output_size")) {
        long long max_output_size = get_value<long long>(j, "max_output_size");
        if (max_output_size < 0)
            throw precondition_error("max_output_size must not be negative");
        config.max_output_size = static_cast<size_t>(max_output_size);
    }
    assign_optional(j, config.max_concurrent_executions, "max_concurrent_executions");
    assign_optional(j, config.network_disabled, "network_disabled");
    assign_optional(j, config.read_only_filesystem, "read_only_filesystem");
    assign_optional(j, config.no_new_privileges, "no_new_privileges");
    assign_optional(j, config.run_user, "run_user");
    if (exists(j, "work_dir"))
        config.work_dir = get_value<string>(j, "work_dir");
}

void to_json(json &j, const execution_config &config) {
    j = {{"docker_image", config.docker_image},
         {"docker_socket", config.docker_socket},
         {"interpreter", config.interpreter},
         {"container_timeout", config.container_timeout},
         {"test_case_timeout", config.test_case_timeout},
         {"max_execution_time", config.max_execution_time},
         {"memory_limit", config.memory_limit},
         {"cpu_limit", config.cpu_limit},
         {"pids_limit", config.pids_limit},
         {"scratch_size", config.scratch_size},
         {"max_output_size", config.max_output_size},
         {"max_concurrent_executions", config.max_concurrent_executions},
         {"network_disabled", config.network_disabled},
         {"read_only_filesystem", config.read_only_filesystem},
         {"no_new_privileges", config.no_new_privileges},
         {"run_user", config.run_user},
         {"work_dir", config.work_dir.string()}};
}

static const string ENV_PREFIX = "CODE_EXECUTION_";

template <typename T>
static void env_value(const string &key, T &value) {
    string name = ENV_PREFIX + key;
    if (!has_env(name)) return;
    string text = get_env(name, "");
    // lexical_cast 把负数转换成无符号数时会回绕而不是失败
    if constexpr (is_unsigned_v<T>) {
        if (boost::algorithm::trim_copy(text).rfind('-', 0) == 0)
            throw precondition_error("environment variable " + name + " must not be negative");
    }
    try {
        value = boost::lexical_cast<T>(text);
    } catch (boost::bad_lexical_cast &) {
        throw precondition_error("environment variable " + name + " has malformed value " + text);
    }
}

template <>
void env_value<bool>(const string &key, bool &value) {
    string name = ENV_PREFIX + key;
    if (!has_env(name)) return;
    string text = boost::algorithm::to_lower_copy(get_env(name, ""));
    if (text == "1" || text == "true" || text == "yes" || text == "on")
        value = true;
    else if (text == "0" || text == "false" || text == "no" || text == "off")
        value = false;
    else
        throw precondition_error("environment variable " + name + " has malformed value " + text);
}

void apply_environment(execution_config &config) {
    env_value("DOCKER_IMAGE", config.docker_image);
    env_value("DOCKER_SOCKET", config.docker_socket);
    env_value("INTERPRETER", config.interpreter);
    env_value("CONTAINER_TIMEOUT", config.container_timeout);
    env_value("TEST_CASE_TIMEOUT", config.test_case_timeout);
    env_value("MAX_EXECUTION_TIME", config.max_execution_time);
    env_value("MEMORY_LIMIT", config.memory_limit);
    env_value("CPU_LIMIT", config.cpu_limit);
    env_value("PIDS_LIMIT", config.pids_limit);
    env_value("SCRATCH_SIZE", config.scratch_size);
    env_value("MAX_OUTPUT_SIZE", config.max_output_size);
    env_value("MAX_CONCURRENT_EXECUTIONS", config.max_concurrent_executions);
    env_value("NETWORK_DISABLED", config.network_disabled);
    env_value("READ_ONLY_FILESYSTEM", config.read_only_filesystem);
    env_value("NO_NEW_PRIVILEGES", config.no_new_privileges);
    env_value("RUN_USER", config.run_user);
    if (has_env(ENV_PREFIX + "WORK_DIR"))
        config.work_dir = get_env(ENV_PREFIX + "WORK_DIR", "");
}

void check_config(const execution_config &config) {
    if (config.docker_image.empty())
        throw precondition_error("docker_image must not be empty");
    if (config.interpreter.empty())
        throw precondition_error("interpreter must not be empty");
    if (config.container_timeout <= 0 || config.test_case_timeout <= 0 || config.max_execution_time <= 0)
        throw precondition_error("timeouts must be positive");
    if (config.test_case_timeout > config.container_timeout)
        throw precondition_error("test_case_timeout must not exceed container_timeout");
    if (config.container_timeout > config.max_execution_time)
        throw precondition_error("container_timeout must not exceed max_execution_time");
    if (config.cpu_limit <= 0)
        throw precondition_error("cpu_limit must be positive");
    if (config.max_concurrent_executions <= 0)
        throw precondition_error("max_concurrent_executions must be positive");
    if (config.max_output_size == 0)
        throw precondition_error("max_output_size must be positive");
    if (config.run_user.empty() || config.run_user == "root" || config.run_user == "0" || config.run_user.rfind("0:", 0) == 0)
        throw precondition_error("run_user must be an unprivileged user");
    if (parse_memory_size(config.memory_limit) == 0)
        throw precondition_error("memory_limit must be positive");
    parse_memory_size(config.scratch_size);
}

}  // namespace coderun

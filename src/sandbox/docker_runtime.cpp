#include "sandbox/docker_runtime.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "sandbox/log_stream.hpp"

namespace coderun {
using namespace std;
using nlohmann::json;
namespace fs = std::filesystem;

static const fs::perms READABLE_FILE = fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read;

json make_container_spec(const container_settings &settings, const resource_limits &limits, const fs::path &host_dir) {
    if (limits.run_user.empty() || limits.run_user == "root" || limits.run_user == "0" || limits.run_user.rfind("0:", 0) == 0)
        throw container_error("refusing to run untrusted code as root");

    string app_dir = CONTAINER_APP_DIR;
    string command = fmt::format("{0} {1}/code.py < {1}/input.txt", settings.interpreter, app_dir);

    json host_config = {
        {"Binds", json::array({host_dir.string() + ":" + app_dir + ":ro"})},
        {"Memory", limits.memory_bytes},
        {"MemorySwap", limits.memory_bytes},
        {"CpuPeriod", CPU_PERIOD},
        {"CpuQuota", cpu_quota(limits.cpus)},
        {"ReadonlyRootfs", limits.read_only_filesystem},
        {"CapDrop", json::array({"ALL"})},
        {"AutoRemove", false}};

    if (limits.pids_limit > 0)
        host_config["PidsLimit"] = limits.pids_limit;
    if (limits.no_new_privileges)
        host_config["SecurityOpt"] = json::array({"no-new-privileges:true"});
    if (limits.network_disabled)
        host_config["NetworkMode"] = "none";
    if (limits.scratch_bytes > 0)
        host_config["Tmpfs"] = json::object({{"/tmp", fmt::format("rw,noexec,nosuid,size={}", limits.scratch_bytes)}});

    return {
        {"Image", settings.image},
        {"Cmd", json::array({"sh", "-c", command})},
        {"User", limits.run_user},
        {"WorkingDir", app_dir},
        {"NetworkDisabled", limits.network_disabled},
        {"Tty", false},
        {"OpenStdin", false},
        {"AttachStdin", false},
        {"Labels", json::object({{MANAGED_LABEL, "true"}})},
        {"HostConfig", host_config}};
}

docker_runtime::docker_runtime(const string &socket_path, const container_settings &settings)
    : client(socket_path), settings(settings) {}

void docker_runtime::initialize() {
    try {
        client.ping();
        if (!client.image_exists(settings.image)) {
            LOG(INFO) << "Pulling docker image " << settings.image;
            client.pull_image(settings.image);
            LOG(INFO) << "Docker image " << settings.image << " pulled";
        }
    } catch (container_error &e) {
        LOG(ERROR) << "Failed to initialize docker runtime: " << e.what();
        throw runtime_unavailable(string("Docker initialization failed: ") + e.what());
    }
}

raw_run_result docker_runtime::run(const string &source, const string &input, chrono::seconds timeout, const resource_limits &limits) {
    raw_run_result result;

    scoped_directory workdir;
    try {
        workdir = scoped_directory(make_unique_directory(settings.work_dir, "coderun-"));
        write_file_content(workdir.path() / "code.py", source, READABLE_FILE);
        write_file_content(workdir.path() / "input.txt", input, READABLE_FILE);
    } catch (std::exception &e) {
        throw container_error(string("unable to prepare sandbox files: ") + e.what());
    }

    string id = client.create_container(make_container_spec(settings, limits, workdir.path()));
    DLOG(INFO) << "Container " << id << " created";
    defer {
        // 无论是否超时都强制删除容器，确保容器内不会残留任何进程
        client.remove_container(id, true);
        DLOG(INFO) << "Container " << id << " removed";
    };

    client.start_container(id);

    optional<int> status = client.wait_container(id, timeout);
    if (!status) {
        LOG(INFO) << "Container " << id << " exceeded time limit of " << timeout.count() << "s, killing";
        try {
            client.kill_container(id);
        } catch (container_error &e) {
            // 随后的强制删除同样会杀死容器
            LOG(WARNING) << "Unable to kill container " << id << ": " << e.what();
        }
        result.timed_out = true;
        return result;
    }

    container_state state = client.inspect_container(id);
    result.exit_code = *status;
    result.oom_killed = state.oom_killed;

    log_stream_decoder decoder(limits.max_output_bytes);
    client.container_logs(id, [&decoder](const char *data, size_t size) {
        decoder.feed(data, size);
        return !decoder.truncated();
    });
    decoder.finish();
    result.output = decoder.output();
    result.output_truncated = decoder.truncated();
    return result;
}

size_t docker_runtime::sweep() {
    size_t removed = 0;
    try {
        json filters = {
            {"label", json::array({string(MANAGED_LABEL) + "=true"})},
            {"status", json::array({"created", "exited", "dead"})}};
        for (auto &id : client.list_containers(filters)) {
            try {
                client.remove_container(id, true);
                ++removed;
            } catch (std::exception &e) {
                LOG(WARNING) << "Unable to remove leftover container " << id << ": " << e.what();
            }
        }
    } catch (std::exception &e) {
        LOG(WARNING) << "Unable to list leftover containers: " << e.what();
    }
    if (removed > 0) LOG(INFO) << "Removed " << removed << " leftover containers";
    return removed;
}

}  // namespace coderun

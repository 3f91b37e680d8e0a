#include "execution/execution_service.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace coderun {
using namespace std;

static string generate_execution_id() {
    // random_generator 不是线程安全的，每个线程各用一个
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

execution_service::execution_service(const execution_config &config, shared_ptr<sandbox_runtime> runtime)
    : cfg(config), limits(config.limits()), rt(move(runtime)) {
    if (!rt) throw precondition_error("execution_service requires a sandbox runtime");
}

void execution_service::ensure_initialized() {
    lock_guard<mutex> guard(init_mutex);
    if (initialized) return;
    try {
        rt->initialize();
    } catch (runtime_unavailable &ex) {
        LOG(ERROR) << "Unable to initialize sandbox runtime: " << ex.what();
        throw;
    }
    initialized = true;
    LOG(INFO) << "Sandbox runtime initialized with image " << cfg.docker_image;
}

execution_result execution_service::execute(const execution_request &request) {
    if (request.timeout_seconds < 1 || request.timeout_seconds > cfg.max_execution_time)
        throw precondition_error(fmt::format("timeout must be between 1 and {} seconds, got {}",
                                             cfg.max_execution_time, request.timeout_seconds));

    ensure_initialized();

    execution_result result;
    result.execution_id = generate_execution_id();
    result.success = false;
    result.exit_code = -1;

    elapsed_time timer;
    try {
        raw_run_result raw = rt->run(request.source, request.input.value_or(""),
                                     chrono::seconds(request.timeout_seconds), limits);

        if (raw.timed_out) {
            result.error = fmt::format("Code execution timed out after {} seconds", request.timeout_seconds);
            result.execution_time = request.timeout_seconds * 1000LL;
            DLOG(INFO) << "Execution " << result.execution_id << " timed out";
            return result;
        }

        result.execution_time = timer.milliseconds();
        result.exit_code = raw.exit_code;
        result.success = raw.exit_code == 0;
        result.output = move(raw.output);
        if (!result.success) {
            string error = result.output;
            if (raw.oom_killed) {
                if (!error.empty() && error.back() != '\n') error += '\n';
                error += "Memory limit exceeded";
            }
            result.error = move(error);
        }
        DLOG(INFO) << "Execution " << result.execution_id << " exited with " << result.exit_code
                   << " in " << result.execution_time << "ms";
    } catch (container_error &ex) {
        LOG(WARNING) << "Execution " << result.execution_id << " failed with container error: " << ex.what();
        result.output.clear();
        result.error = "Container error: "s + ex.what();
        result.exit_code = -1;
        result.success = false;
        result.execution_time = timer.milliseconds();
    } catch (runtime_unavailable &) {
        throw;
    } catch (precondition_error &) {
        throw;
    } catch (std::exception &ex) {
        LOG(WARNING) << "Execution " << result.execution_id << " failed: " << ex.what();
        result.output.clear();
        result.error = "Execution failed: "s + ex.what();
        result.exit_code = -1;
        result.success = false;
        result.execution_time = timer.milliseconds();
    }
    return result;
}

const execution_config &execution_service::config() const {
    return cfg;
}

sandbox_runtime &execution_service::runtime() const {
    return *rt;
}

}  // namespace coderun

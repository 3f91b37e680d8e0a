#include "execution/execution.hpp"
#include "common/json_utils.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, execution_request &request) {
    request.source = get_value<string>(j, "code");
    if (exists(j, "input_data"))
        request.input = get_value<string>(j, "input_data");
    else
        request.input.reset();
    assign_optional(j, request.timeout_seconds, "timeout");
}

void to_json(json &j, const execution_result &result) {
    j = {{"execution_id", result.execution_id},
         {"success", result.success},
         {"output", result.output},
         {"error", nullptr},
         {"execution_time", result.execution_time},
         {"exit_code", result.exit_code}};
    if (result.error) j["error"] = *result.error;
}

void from_json(const json &j, execution_result &result) {
    result.execution_id = get_value<string>(j, "execution_id");
    result.success = get_value<bool>(j, "success");
    result.output = get_value_def<string>(j, "", "output");
    if (exists(j, "error"))
        result.error = get_value<string>(j, "error");
    else
        result.error.reset();
    result.execution_time = get_value<long long>(j, "execution_time");
    result.exit_code = get_value<int>(j, "exit_code");
}

}  // namespace coderun

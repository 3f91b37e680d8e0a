#include "judge/validator.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <cmath>
#include "common/exceptions.hpp"

namespace coderun {
using namespace std;

bool outputs_match(const string &actual, const string &expected) {
    return boost::algorithm::trim_copy(actual) == boost::algorithm::trim_copy(expected);
}

static test_case_result judge_test_case(execution_service &service, const string &source, const test_case &tc, int ordinal) {
    execution_request request;
    request.source = source;
    request.input = tc.input;
    request.timeout_seconds = service.config().test_case_timeout;

    execution_result execution = service.execute(request);

    test_case_result result;
    result.ordinal = tc.ordinal > 0 ? tc.ordinal : ordinal;
    result.actual_output = boost::algorithm::trim_copy(execution.output);
    result.passed = execution.success && outputs_match(execution.output, tc.expected_output);
    result.execution_time = execution.execution_time;
    result.error = execution.error;
    result.is_hidden = tc.is_hidden;
    if (tc.is_hidden) {
        result.input = REDACTED_MARKER;
        result.expected_output = REDACTED_MARKER;
    } else {
        result.input = tc.input;
        result.expected_output = tc.expected_output;
    }
    return result;
}

validation_result validate(execution_service &service, const string &source, const vector<test_case> &test_cases) {
    if (test_cases.empty()) throw precondition_error("no test cases");

    validation_result result;
    result.total_tests = (int)test_cases.size();
    for (size_t i = 0; i < test_cases.size(); ++i) {
        test_case_result tc_result = judge_test_case(service, source, test_cases[i], (int)i + 1);
        if (tc_result.passed) ++result.passed_tests;
        result.total_execution_time += tc_result.execution_time;
        result.test_results.push_back(move(tc_result));
    }
    result.failed_tests = result.total_tests - result.passed_tests;
    result.overall_success = result.failed_tests == 0;
    result.score = (int)llround(result.passed_tests * 100.0 / result.total_tests);

    DLOG(INFO) << "Validated submission: " << result.passed_tests << "/" << result.total_tests
               << " passed, score " << result.score;
    return result;
}

optional<string> extract_error_message(const validation_result &result) {
    if (result.overall_success) return nullopt;
    for (auto &tc_result : result.test_results)
        if (!tc_result.passed && tc_result.error && !tc_result.error->empty())
            return tc_result.error;
    return fmt::format("Failed {} out of {} test cases", result.failed_tests, result.total_tests);
}

}  // namespace coderun

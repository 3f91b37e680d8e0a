#include "judge/report.hpp"

namespace coderun {
using namespace std;
using namespace nlohmann;

const string HIDDEN_ERROR_MESSAGE = "Error on hidden test case";

submission_report make_submission_report(const validation_result &result) {
    validation_result redacted = result;
    for (auto &tc_result : redacted.test_results) {
        if (!tc_result.is_hidden) continue;
        tc_result.input = REDACTED_MARKER;
        tc_result.expected_output = REDACTED_MARKER;
        tc_result.actual_output = REDACTED_MARKER;
        // 错误信息包含选手程序的输出，同样会泄露隐藏测试点的数据
        if (tc_result.error && !tc_result.error->empty())
            tc_result.error = HIDDEN_ERROR_MESSAGE;
    }

    submission_report report;
    report.is_correct = redacted.overall_success;
    report.score = redacted.score;
    report.total_tests = redacted.total_tests;
    report.passed_tests = redacted.passed_tests;
    report.failed_tests = redacted.failed_tests;
    report.execution_time = redacted.total_execution_time;
    report.error_message = extract_error_message(redacted);
    report.test_results = move(redacted.test_results);
    return report;
}

comparison_summary make_comparison_summary(const comparison_result &result) {
    comparison_summary summary;
    summary.matches_reference = result.matches_reference;
    summary.submitted_score = result.submitted.score;
    summary.reference_score = result.reference.score;
    summary.submitted_passed = result.submitted.passed_tests;
    summary.reference_passed = result.reference.passed_tests;
    summary.total_tests = result.submitted.total_tests;
    return summary;
}

void to_json(json &j, const submission_report &report) {
    j = {{"is_correct", report.is_correct},
         {"score", report.score},
         {"total_tests", report.total_tests},
         {"passed_tests", report.passed_tests},
         {"failed_tests", report.failed_tests},
         {"test_results", report.test_results},
         {"execution_time", report.execution_time},
         {"error_message", nullptr}};
    if (report.error_message) j["error_message"] = *report.error_message;
}

void to_json(json &j, const comparison_summary &summary) {
    j = {{"matches_reference", summary.matches_reference},
         {"submitted_score", summary.submitted_score},
         {"reference_score", summary.reference_score},
         {"submitted_passed", summary.submitted_passed},
         {"reference_passed", summary.reference_passed},
         {"total_tests", summary.total_tests}};
}

}  // namespace coderun

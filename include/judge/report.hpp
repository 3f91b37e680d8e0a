#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "judge/comparison.hpp"
#include "judge/validator.hpp"

namespace coderun {

/**
 * @brief 隐藏测试点出错时，报告中代替原始错误信息的文字
 */
extern const std::string HIDDEN_ERROR_MESSAGE;

/**
 * @brief 返回给选手的评测报告
 * 隐藏测试点的输入、标准输出和选手输出都被替换为 REDACTED_MARKER，
 * 错误信息被替换为 HIDDEN_ERROR_MESSAGE
 */
struct submission_report {
    bool is_correct = false;
    int score = 0;
    int total_tests = 0;
    int passed_tests = 0;
    int failed_tests = 0;
    std::vector<test_case_result> test_results;
    long long execution_time = 0;
    std::optional<std::string> error_message;
};

/**
 * @brief 与标准程序比较的摘要
 */
struct comparison_summary {
    bool matches_reference = false;
    int submitted_score = 0;
    int reference_score = 0;
    int submitted_passed = 0;
    int reference_passed = 0;
    int total_tests = 0;
};

submission_report make_submission_report(const validation_result &result);

comparison_summary make_comparison_summary(const comparison_result &result);

void to_json(nlohmann::json &j, const submission_report &report);

void to_json(nlohmann::json &j, const comparison_summary &summary);

}  // namespace coderun

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * 这个头文件包含评测相关的数据结构
 * 包含：
 * 1. test_case 类（表示一个测试点）
 * 2. test_case_result 类（表示一个测试点的评测结果）
 * 3. validation_result 类（表示一次提交的评测结果）
 */
namespace coderun {

/**
 * @brief 隐藏测试点的输入输出在结果中被替换成的字符串
 */
extern const std::string REDACTED_MARKER;

/**
 * @brief 表示一个测试点
 * 测试点在列表中的顺序就是评测顺序
 */
struct test_case {
    /**
     * @brief 测试点编号，从 1 开始
     */
    int ordinal = 0;

    /**
     * @brief 作为 stdin 的输入数据，没有输入时为空
     */
    std::string input;

    /**
     * @brief 标准输出
     */
    std::string expected_output;

    /**
     * @brief 是否为隐藏测试点
     * 隐藏测试点的输入和标准输出不会返回给选手
     */
    bool is_hidden = false;
};

/**
 * @brief 表示一个测试点的评测结果
 */
struct test_case_result {
    int ordinal = 0;

    bool passed = false;

    /**
     * @brief 测试点的输入，隐藏测试点为 REDACTED_MARKER
     */
    std::string input;

    /**
     * @brief 测试点的标准输出，隐藏测试点为 REDACTED_MARKER
     */
    std::string expected_output;

    /**
     * @brief 去掉首尾空白后的选手输出
     */
    std::string actual_output;

    /**
     * @brief 运行时间，单位为毫秒
     */
    long long execution_time = 0;

    std::optional<std::string> error;

    bool is_hidden = false;
};

/**
 * @brief 表示一次提交的评测结果
 */
struct validation_result {
    int total_tests = 0;
    int passed_tests = 0;
    int failed_tests = 0;
    bool overall_success = false;

    /**
     * @brief 得分，0 到 100 之间
     */
    int score = 0;

    std::vector<test_case_result> test_results;

    /**
     * @brief 所有测试点的运行时间之和，单位为毫秒
     */
    long long total_execution_time = 0;
};

/**
 * @brief 按顺序为测试点编号，从 1 开始
 */
void number_test_cases(std::vector<test_case> &test_cases);

void from_json(const nlohmann::json &j, test_case &tc);

void to_json(nlohmann::json &j, const test_case_result &result);

void to_json(nlohmann::json &j, const validation_result &result);

}  // namespace coderun

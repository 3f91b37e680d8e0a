#pragma once

#include <optional>
#include <string>
#include <vector>
#include "execution/execution_service.hpp"
#include "judge/test_case.hpp"

namespace coderun {

/**
 * @brief 评测一份提交
 * 按顺序在独立的容器中运行每个测试点，时间限制为 test_case_timeout。
 * 运行成功且去掉首尾空白后的输出与标准输出完全相同（区分大小写）时测试点通过。
 * 
 * 测试点严格按顺序依次运行。
 * 
 * @param service 运行调度器
 * @param source 选手提交的源代码
 * @param test_cases 测试点列表，不能为空
 * @throw precondition_error 测试点列表为空
 * @throw runtime_unavailable 隔离运行环境无法初始化
 */
validation_result validate(execution_service &service, const std::string &source, const std::vector<test_case> &test_cases);

/**
 * @brief 从评测结果中提取出给选手看的错误信息
 * @return 全部通过时返回 nullopt；否则返回第一个失败测试点的错误信息，
 * 都没有错误信息时返回 "Failed {failed} out of {total} test cases"
 */
std::optional<std::string> extract_error_message(const validation_result &result);

/**
 * @brief 比较两份输出是否一致
 * 只忽略首尾空白，区分大小写
 */
bool outputs_match(const std::string &actual, const std::string &expected);

}  // namespace coderun

#pragma once

#include <string>
#include <vector>
#include "judge/validator.hpp"

namespace coderun {

/**
 * @brief 选手程序与标准程序在同一组测试点上的评测结果
 */
struct comparison_result {
    validation_result submitted;
    validation_result reference;

    /**
     * @brief 两者都全部通过且得分相同
     */
    bool matches_reference = false;
};

/**
 * @brief 先后评测选手程序和标准程序
 * @throw precondition_error 标准程序为空，或者测试点列表为空
 * @throw runtime_unavailable 隔离运行环境无法初始化
 */
comparison_result compare(execution_service &service,
                          const std::string &submitted_source,
                          const std::string &reference_source,
                          const std::vector<test_case> &test_cases);

}  // namespace coderun

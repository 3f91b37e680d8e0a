#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace coderun {

/**
 * @brief 题目的一条提示
 * 第 i 条提示（从 1 开始）在提交次数超过 i - 1 后解锁
 */
struct hint {
    /**
     * @brief 存储的顺序号，0 表示未设置，此时使用提示在列表中的位置
     */
    int ordinal = 0;
    std::string text;
};

/**
 * @brief 某个选手看到的一条提示
 * 未解锁的提示 text 为占位文字
 */
struct hint_view {
    int ordinal = 0;
    std::string text;
    bool unlocked = false;
};

/**
 * @brief 根据提交次数计算每条提示是否解锁
 * @param hints 按顺序排列的提示
 * @param attempt_count 选手已经提交的次数，负数按 0 处理
 * @param max_hints 最多返回多少条提示，0 表示不限制
 */
std::vector<hint_view> resolve_hints(const std::vector<hint> &hints, int attempt_count, std::size_t max_hints = 0);

void from_json(const nlohmann::json &j, hint &h);

void to_json(nlohmann::json &j, const hint_view &view);

}  // namespace coderun

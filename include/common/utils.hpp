#pragma once

#include <chrono>
#include <string>

namespace coderun {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 判断环境变量是否存在
 */
bool has_env(const std::string &key);

/**
 * @brief 计时器，构造时开始计时
 * 使用 steady_clock，测得的时间不会因为系统时间被修改而变成负数
 */
struct elapsed_time {
    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的整毫秒数
     */
    long long milliseconds() const;

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace coderun

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

/**
 * 这个头文件包含一次代码运行的请求和结果
 */
namespace coderun {

/**
 * @brief 表示一次运行请求
 */
struct execution_request {
    /**
     * @brief 选手提交的源代码
     */
    std::string source;

    /**
     * @brief 作为 stdin 的输入数据，不存在时 stdin 为空
     */
    std::optional<std::string> input;

    /**
     * @brief 时钟时间限制，单位为秒
     * 必须在 [1, max_execution_time] 之间
     */
    int timeout_seconds = 30;
};

/**
 * @brief 表示一次运行的结果
 * 超时、非零退出码、崩溃、内存超限都是正常的运行结果，不会抛出异常
 */
struct execution_result {
    /**
     * @brief 本次运行的唯一标识，UUID 格式
     */
    std::string execution_id;

    /**
     * @brief 程序是否以 0 退出
     */
    bool success = false;

    /**
     * @brief 程序 stdout 和 stderr 合并后的输出
     * 失败时也可能非空
     */
    std::string output;

    /**
     * @brief 失败原因，成功时为空
     */
    std::optional<std::string> error;

    /**
     * @brief 运行时间，单位为毫秒
     */
    long long execution_time = 0;

    /**
     * @brief 程序的退出码，超时或者容器出错时为 -1
     */
    int exit_code = -1;
};

void from_json(const nlohmann::json &j, execution_request &request);

void to_json(nlohmann::json &j, const execution_result &result);

void from_json(const nlohmann::json &j, execution_result &result);

}  // namespace coderun

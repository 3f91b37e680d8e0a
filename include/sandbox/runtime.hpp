#pragma once

#include <chrono>
#include <string>
#include "sandbox/limits.hpp"

namespace coderun {

/**
 * @brief 一次隔离运行的原始结果
 * 不包含任何对错判断，只描述程序如何结束
 */
struct raw_run_result {
    /**
     * @brief 程序的退出码
     * 被信号杀死的程序按 shell 的惯例为 128 + 信号编号
     */
    int exit_code = -1;

    /**
     * @brief stdout 和 stderr 按到达顺序合并后的输出
     */
    std::string output;

    /**
     * @brief 是否因为超出时钟时间限制被强制杀死
     */
    bool timed_out = false;

    /**
     * @brief 是否因为超出内存限制被 OOM killer 杀死
     */
    bool oom_killed = false;

    /**
     * @brief 输出是否超过 max_output_bytes 而被截断
     */
    bool output_truncated = false;
};

/**
 * @brief 隔离运行环境
 * 每次调用 run 都会创建一个全新的隔离环境，运行结束后销毁，
 * 不同调用之间不共享任何状态、文件或者进程。
 * 实现必须可以被多个线程同时调用。
 */
struct sandbox_runtime {
    virtual ~sandbox_runtime();

    /**
     * @brief 连接容器引擎并准备好基础镜像
     * 可以重复调用
     * @throw runtime_unavailable 容器引擎不可用，或者基础镜像无法获取
     */
    virtual void initialize() = 0;

    /**
     * @brief 在隔离环境中运行源代码
     * 程序自身的失败（非零退出码、崩溃、超时、内存超限）都通过返回值表示
     * @param source 源代码，以只读方式提供给隔离环境
     * @param input 作为 stdin 的输入数据，可以为空
     * @param timeout 时钟时间限制，到期后强制杀死
     * @param limits 资源和权限限制
     * @throw container_error 容器引擎在本次运行中出错
     */
    virtual raw_run_result run(const std::string &source,
                               const std::string &input,
                               std::chrono::seconds timeout,
                               const resource_limits &limits) = 0;

    /**
     * @brief 清理之前崩溃遗留下来的隔离环境
     * 这是一个维护操作，不会抛出异常
     * @return 清理掉的隔离环境数量
     */
    virtual std::size_t sweep() = 0;
};

}  // namespace coderun

#pragma once

#include <cstdint>
#include <string>

namespace coderun {

/**
 * @brief 容器的资源与权限限制
 * 这些限制由进程级配置决定，单次请求只能修改时间限制
 */
struct resource_limits {
    /**
     * @brief 内存限制，单位为字节
     * 内存与内存+交换分区的限制设为一样，可以强制不发生交换，
     * 超出限制时由内核 OOM killer 杀死进程
     */
    int64_t memory_bytes = 128LL << 20;

    /**
     * @brief 可以使用的 CPU 核心数，可以是小数
     * 只限制调度配额，不限制时钟时间
     */
    double cpus = 0.5;

    /**
     * @brief 容器内最多能存在多少个进程，小于等于 0 表示不限制
     */
    int64_t pids_limit = 64;

    /**
     * @brief 可写的 /tmp 临时文件系统大小，单位为字节，0 表示不挂载
     */
    int64_t scratch_bytes = 16LL << 20;

    /**
     * @brief 最多收集多少字节的输出，超出部分被丢弃
     */
    std::size_t max_output_bytes = 10240;

    bool network_disabled = true;

    bool read_only_filesystem = true;

    bool no_new_privileges = true;

    /**
     * @brief 选手程序的运行用户，永远不能是 root
     */
    std::string run_user = "nobody";
};

/**
 * @brief 解析类似 docker 的内存大小写法，比如 "128m"、"1g"、"512k"、"4096"
 * 后缀不区分大小写，没有后缀时单位为字节
 * @return 字节数
 * @throw precondition_error 格式不正确或者数值为负数
 */
int64_t parse_memory_size(const std::string &text);

/**
 * @brief CFS 调度周期，单位为微秒
 */
constexpr int64_t CPU_PERIOD = 100000;

/**
 * @brief 根据 CPU 核心数计算 CFS 调度配额（单位为微秒）
 */
int64_t cpu_quota(double cpus);

}  // namespace coderun

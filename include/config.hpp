#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "sandbox/docker_runtime.hpp"
#include "sandbox/limits.hpp"

namespace coderun {

/**
 * @brief 执行引擎的进程级配置
 * 在进程启动时读取一次，之后不再修改。
 * 
 * 配置来源的优先级：命令行参数 > 环境变量 > 配置文件 > 默认值。
 * 环境变量统一使用 CODE_EXECUTION_ 前缀，比如 CODE_EXECUTION_MEMORY_LIMIT。
 */
struct execution_config {
    /**
     * @brief 运行选手代码的基础镜像
     */
    std::string docker_image = "python:3.11-slim";

    /**
     * @brief docker daemon 的 UNIX socket 路径
     */
    std::string docker_socket = "/var/run/docker.sock";

    /**
     * @brief 镜像中的解释器命令
     */
    std::string interpreter = "python";

    /**
     * @brief 自由运行代码时的默认时间限制，单位为秒
     */
    int container_timeout = 30;

    /**
     * @brief 评测单个测试点的时间限制，单位为秒
     * 一次评测可能包含很多测试点，因此比 container_timeout 更短
     */
    int test_case_timeout = 10;

    /**
     * @brief 调用方可以请求的最长时间限制，单位为秒
     */
    int max_execution_time = 60;

    /**
     * @brief 内存限制，比如 "128m"
     */
    std::string memory_limit = "128m";

    /**
     * @brief 可以使用的 CPU 核心数
     */
    double cpu_limit = 0.5;

    /**
     * @brief 容器内最大进程数
     */
    int pids_limit = 64;

    /**
     * @brief 容器内可写的 /tmp 大小，"0" 表示不挂载
     */
    std::string scratch_size = "16m";

    /**
     * @brief 最多收集多少字节的输出
     */
    std::size_t max_output_size = 10240;

    /**
     * @brief 最多同时运行多少个容器
     * 执行引擎本身不做并发控制，这个值提供给 execution_pool 使用
     */
    int max_concurrent_executions = 10;

    bool network_disabled = true;

    bool read_only_filesystem = true;

    bool no_new_privileges = true;

    /**
     * @brief 容器内运行选手程序的用户，不能是 root
     */
    std::string run_user = "nobody";

    /**
     * @brief 宿主机上存放源代码临时文件的文件夹
     */
    std::filesystem::path work_dir = std::filesystem::temp_directory_path();

    /**
     * @brief 根据配置生成容器的资源限制
     * @throw precondition_error 内存大小格式不正确
     */
    resource_limits limits() const;

    /**
     * @brief 根据配置生成容器的镜像和运行命令
     */
    container_settings container() const;
};

void from_json(const nlohmann::json &j, execution_config &config);

void to_json(nlohmann::json &j, const execution_config &config);

/**
 * @brief 用 CODE_EXECUTION_ 开头的环境变量覆盖配置
 * @throw precondition_error 环境变量的值无法解析
 */
void apply_environment(execution_config &config);

/**
 * @brief 检查配置是否自洽
 * @throw precondition_error 配置不合法
 */
void check_config(const execution_config &config);

}  // namespace coderun

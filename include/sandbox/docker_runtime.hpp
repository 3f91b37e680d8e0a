#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include "sandbox/docker_client.hpp"
#include "sandbox/runtime.hpp"

namespace coderun {

/**
 * @brief 容器使用的镜像和运行命令
 */
struct container_settings {
    /**
     * @brief 基础镜像，比如 python:3.11-slim
     */
    std::string image = "python:3.11-slim";

    /**
     * @brief 解释器命令，会以 "<interpreter> /app/code.py" 的形式执行
     */
    std::string interpreter = "python";

    /**
     * @brief 在宿主机上存放源代码和输入数据的文件夹
     * 每次运行都会在这里创建一个随机命名的子文件夹，只读挂载到容器的 /app。
     * docker daemon 必须能访问到这个路径。
     */
    std::filesystem::path work_dir = std::filesystem::temp_directory_path();
};

/**
 * @brief 容器内源代码所在的文件夹
 */
constexpr const char *CONTAINER_APP_DIR = "/app";

/**
 * @brief 本程序创建的所有容器都带有这个标签，清理时根据标签查找
 */
constexpr const char *MANAGED_LABEL = "coderun.managed";

/**
 * @brief 生成创建容器所需的配置
 * 
 * 容器运行 sh -c "<interpreter> /app/code.py < /app/input.txt"，
 * 以非 root 用户运行，去掉所有 capability，根据 limits 设置内存、CPU、进程数、
 * 网络、只读文件系统和 no-new-privileges。
 * 
 * @param settings 镜像和运行命令
 * @param limits 资源与权限限制
 * @param host_dir 宿主机上存放 code.py 和 input.txt 的文件夹
 * @return Docker Engine API ContainerCreate 的请求体
 */
nlohmann::json make_container_spec(const container_settings &settings, const resource_limits &limits, const std::filesystem::path &host_dir);

/**
 * @brief 基于 docker 的隔离运行环境
 * 每次运行都创建一个新容器，运行结束（包括出错和超时）后强制删除容器
 */
struct docker_runtime : public sandbox_runtime {
    docker_runtime(const std::string &socket_path, const container_settings &settings);

    void initialize() override;

    raw_run_result run(const std::string &source,
                       const std::string &input,
                       std::chrono::seconds timeout,
                       const resource_limits &limits) override;

    std::size_t sweep() override;

private:
    docker_client client;
    container_settings settings;
};

}  // namespace coderun

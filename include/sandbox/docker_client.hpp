#pragma once

#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace coderun {

/**
 * @brief 容器退出后 docker 报告的状态
 */
struct container_state {
    int exit_code = -1;

    /**
     * @brief 容器是否因为超出内存限制被 OOM killer 杀死
     */
    bool oom_killed = false;

    bool running = false;
};

/**
 * @brief Docker Engine API 客户端
 * 通过 docker daemon 的 UNIX socket 发送 HTTP 请求。
 * 
 * 每个请求都使用独立的 curl easy handle，因此同一个 docker_client
 * 可以被多个线程同时使用。
 * 
 * 除 wait_container 超时以外，所有失败（连接失败、HTTP 状态码 >= 400）
 * 都会抛出 container_error。
 */
struct docker_client {
    /**
     * @param socket_path docker daemon 的 UNIX socket 路径，比如 /var/run/docker.sock
     */
    explicit docker_client(const std::string &socket_path);

    /**
     * @brief 检查 docker daemon 是否可以连接
     */
    void ping() const;

    /**
     * @brief 检查本地是否已经存在镜像
     */
    bool image_exists(const std::string &image) const;

    /**
     * @brief 从镜像仓库拉取镜像，拉取完成前阻塞
     */
    void pull_image(const std::string &image) const;

    /**
     * @brief 创建容器（但不启动）
     * @param spec 容器配置，格式参考 Docker Engine API 的 ContainerCreate
     * @return 容器 id
     */
    std::string create_container(const nlohmann::json &spec) const;

    void start_container(const std::string &id) const;

    /**
     * @brief 等待容器结束运行
     * @param timeout 最长等待时间
     * @return 容器的退出码，若超时则返回 std::nullopt
     */
    std::optional<int> wait_container(const std::string &id, std::chrono::milliseconds timeout) const;

    /**
     * @brief 向容器发送信号，容器已经停止时什么也不做
     * @param signal 信号名，默认为 SIGKILL，不给容器任何清理的机会
     */
    void kill_container(const std::string &id, const std::string &signal = "SIGKILL") const;

    container_state inspect_container(const std::string &id) const;

    /**
     * @brief 读取容器的 stdout 和 stderr 日志
     * @param sink 接收日志原始数据（仍是 docker 的复用流格式），返回 false 时停止读取
     */
    void container_logs(const std::string &id, const std::function<bool(const char *, std::size_t)> &sink) const;

    /**
     * @brief 删除容器，容器不存在时什么也不做
     * @param force 为真时会先杀死正在运行的容器
     */
    void remove_container(const std::string &id, bool force) const;

    /**
     * @brief 列出容器
     * @param filters 过滤条件，比如 {"label": ["a=b"], "status": ["exited"]}
     * @return 容器 id 列表
     */
    std::vector<std::string> list_containers(const nlohmann::json &filters) const;

private:
    struct response {
        long status = 0;
        std::string body;
        bool timed_out = false;
        bool aborted = false;
    };

    response request(const std::string &method,
                     const std::string &path,
                     const std::optional<nlohmann::json> &body,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds::zero(),
                     const std::function<bool(const char *, std::size_t)> &sink = nullptr) const;

    void expect_success(const response &res, const std::string &what) const;

    std::string socket_path;
};

/**
 * @brief 对 URL 的查询参数进行转义
 */
std::string url_escape(const std::string &text);

/**
 * @brief 将镜像名拆分成仓库名和标签
 * 比如 "python:3.11-slim" 拆成 {"python", "3.11-slim"}，
 * "localhost:5000/python" 拆成 {"localhost:5000/python", "latest"}，
 * 带摘要的 "python@sha256:..." 标签为空
 */
std::pair<std::string, std::string> split_image_tag(const std::string &image);

}  // namespace coderun

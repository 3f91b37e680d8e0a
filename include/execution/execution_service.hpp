#pragma once

#include <memory>
#include <mutex>
#include "config.hpp"
#include "execution/execution.hpp"
#include "sandbox/runtime.hpp"

namespace coderun {

/**
 * @brief 运行调度器
 * 把一次运行请求交给隔离运行环境，并把原始结果整理成 execution_result。
 * 
 * execute 可以被多个线程同时调用：这个类只持有不变的配置、共享的
 * sandbox_runtime 以及初始化标记。调度器本身不做并发控制，需要限制
 * 同时运行的容器数量时使用 execution_pool。
 */
class execution_service {
public:
    /**
     * @param config 进程级配置，构造时会生成资源限制，格式错误时抛出 precondition_error
     * @param runtime 隔离运行环境，第一次 execute 时才会被初始化
     */
    execution_service(const execution_config &config, std::shared_ptr<sandbox_runtime> runtime);

    /**
     * @brief 运行一次代码
     * @throw precondition_error 时间限制不在 [1, max_execution_time] 之间
     * @throw runtime_unavailable 隔离运行环境无法初始化
     */
    execution_result execute(const execution_request &request);

    /**
     * @brief 确保隔离运行环境已经初始化
     * 初始化失败时下一次调用会重新尝试
     * @throw runtime_unavailable 隔离运行环境无法初始化
     */
    void ensure_initialized();

    const execution_config &config() const;

    sandbox_runtime &runtime() const;

private:
    execution_config cfg;
    resource_limits limits;
    std::shared_ptr<sandbox_runtime> rt;

    std::mutex init_mutex;
    bool initialized = false;
};

}  // namespace coderun

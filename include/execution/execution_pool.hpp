#pragma once

#include <future>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "execution/execution_service.hpp"

namespace coderun {

/**
 * @brief 固定大小的运行线程池
 * 调度器本身不限制并发，调用方通过线程池把同时运行的容器数量
 * 限制在 max_concurrent_executions 以内。
 * 
 * 每个 worker 线程从队列中取出任务并调用 execution_service::execute，
 * execute 抛出的异常会通过 future 传递给调用方。
 */
class execution_pool {
public:
    /**
     * @param service 运行调度器，必须比线程池活得更久
     * @param workers worker 线程数，必须大于 0
     */
    execution_pool(execution_service &service, std::size_t workers);

    ~execution_pool();

    execution_pool(const execution_pool &) = delete;
    execution_pool &operator=(const execution_pool &) = delete;

    /**
     * @brief 提交一个运行请求
     * @throw precondition_error 线程池已经关闭
     */
    std::future<execution_result> submit(execution_request request);

    /**
     * @brief 关闭线程池
     * 不再接受新请求，已经提交的请求会全部运行完，然后等待所有 worker 退出。
     * 可以重复调用。
     */
    void shutdown();

    std::size_t size() const;

private:
    using job = std::packaged_task<execution_result()>;

    void worker_loop(std::size_t worker_id);

    execution_service &service;
    concurrent_queue<job> jobs;
    std::vector<std::thread> threads;
};

}  // namespace coderun

#include "execution/execution_pool.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace coderun {
using namespace std;

execution_pool::execution_pool(execution_service &service, size_t workers) : service(service) {
    if (workers == 0) throw precondition_error("execution_pool requires at least one worker");
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back([this, i] { worker_loop(i); });
}

execution_pool::~execution_pool() {
    shutdown();
}

future<execution_result> execution_pool::submit(execution_request request) {
    job task([this, request = move(request)] { return service.execute(request); });
    future<execution_result> result = task.get_future();
    if (!jobs.push(move(task)))
        throw precondition_error("execution_pool has been shut down");
    return result;
}

void execution_pool::shutdown() {
    jobs.close();
    for (auto &thread : threads)
        if (thread.joinable()) thread.join();
}

size_t execution_pool::size() const {
    return threads.size();
}

void execution_pool::worker_loop(size_t worker_id) {
    DLOG(INFO) << "Execution worker " << worker_id << " started";
    job task;
    while (jobs.pop(task)) {
        // packaged_task 会把 execute 抛出的异常保存在 future 中
        task();
    }
    DLOG(INFO) << "Execution worker " << worker_id << " exited";
}

}  // namespace coderun

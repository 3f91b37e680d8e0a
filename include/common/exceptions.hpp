#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace coderun {

/**
 * @brief 执行引擎所有异常的基类
 * 构造时记录调用栈，便于在日志中定位抛出位置
 */
struct coderun_exception : std::exception {
    coderun_exception();
    explicit coderun_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const coderun_exception &ex);

    template <typename T>
    coderun_exception operator<<(const T &t) const {
        return coderun_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示容器引擎不可用
 * 比如 docker daemon 无法连接，或者基础镜像无法拉取。
 * 这类错误是部署问题而不是选手代码的问题，调用方应当返回 5xx 而不是判错。
 */
struct runtime_unavailable : public coderun_exception {
    runtime_unavailable();
    explicit runtime_unavailable(const std::string &message);
};

/**
 * @brief 表示调用方的请求不满足前置条件
 * 比如没有测试数据、没有标准程序、时间限制超出范围。
 */
struct precondition_error : public coderun_exception {
    precondition_error();
    explicit precondition_error(const std::string &message);
};

/**
 * @brief 单次运行中容器引擎返回的错误
 * 只在 sandbox 层内部抛出，由 execution_service 转换为失败的 execution_result
 */
struct container_error : public coderun_exception {
    container_error();
    explicit container_error(const std::string &message);
};

}  // namespace coderun

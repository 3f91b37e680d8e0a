#pragma once

#include <functional>
#include <map>
#include <mutex>
#include "gmock/gmock.h"
#include "sandbox/runtime.hpp"

namespace coderun::test {

struct mock_runtime : public sandbox_runtime {
    MOCK_METHOD(void, initialize, (), (override));
    MOCK_METHOD(raw_run_result, run, (const std::string &, const std::string &, std::chrono::seconds, const resource_limits &), (override));
    MOCK_METHOD(std::size_t, sweep, (), (override));
};

/**
 * @brief 不启动容器的运行环境
 * 根据源代码查表得到一个函数来模拟程序的运行，未登记的源代码以退出码 1 结束。
 * 用于测试评测逻辑本身。
 */
struct scripted_runtime : public sandbox_runtime {
    using program = std::function<raw_run_result(const std::string &input)>;

    void define(const std::string &source, program p) {
        programs[source] = std::move(p);
    }

    void initialize() override {}

    raw_run_result run(const std::string &source, const std::string &input, std::chrono::seconds timeout, const resource_limits &) override {
        {
            std::lock_guard<std::mutex> guard(mut);
            ++runs;
            timeouts.push_back(timeout);
            inputs.push_back(input);
        }
        auto it = programs.find(source);
        if (it == programs.end()) {
            raw_run_result result;
            result.exit_code = 1;
            result.output = "NameError: unknown program\n";
            return result;
        }
        return it->second(input);
    }

    std::size_t sweep() override { return 0; }

    std::map<std::string, program> programs;
    std::mutex mut;
    int runs = 0;
    std::vector<std::chrono::seconds> timeouts;
    std::vector<std::string> inputs;
};

/**
 * @brief 正常退出并输出 output 的程序
 */
inline raw_run_result exited(int exit_code, const std::string &output) {
    raw_run_result result;
    result.exit_code = exit_code;
    result.output = output;
    return result;
}

inline raw_run_result timed_out() {
    raw_run_result result;
    result.timed_out = true;
    return result;
}

}  // namespace coderun::test

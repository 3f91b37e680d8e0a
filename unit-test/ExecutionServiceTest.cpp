#include <atomic>
#include <thread>
#include "common/exceptions.hpp"
#include "execution/execution_service.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/mock_runtime.hpp"

using namespace std;
using namespace coderun;
using namespace coderun::test;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class ExecutionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime = make_shared<::testing::NiceMock<mock_runtime>>();
        service = make_unique<execution_service>(config, runtime);
    }

    execution_request request(const string &source, int timeout = 30) {
        execution_request req;
        req.source = source;
        req.timeout_seconds = timeout;
        return req;
    }

    execution_config config;
    shared_ptr<::testing::NiceMock<mock_runtime>> runtime;
    unique_ptr<execution_service> service;
};

TEST_F(ExecutionServiceTest, HelloWorld) {
    EXPECT_CALL(*runtime, run("print('Hello, World!')", "", chrono::seconds(30), _))
        .WillOnce(Return(exited(0, "Hello, World!\n")));

    execution_result result = service->execute(request("print('Hello, World!')"));
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output, "Hello, World!\n");
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_GE(result.execution_time, 0);
    EXPECT_EQ(result.execution_id.size(), 36u);
}

TEST_F(ExecutionServiceTest, InputIsPassedThrough) {
    EXPECT_CALL(*runtime, run(_, "3\n", _, _)).WillOnce(Return(exited(0, "9\n")));
    execution_request req = request("n = int(input())\nprint(n * n)");
    req.input = "3\n";
    EXPECT_EQ(service->execute(req).output, "9\n");
}

TEST_F(ExecutionServiceTest, ExecutionIdsAreUnique) {
    EXPECT_CALL(*runtime, run(_, _, _, _)).WillRepeatedly(Return(exited(0, "")));
    EXPECT_NE(service->execute(request("pass")).execution_id, service->execute(request("pass")).execution_id);
}

TEST_F(ExecutionServiceTest, NonZeroExitReportsOutputAsError) {
    EXPECT_CALL(*runtime, run(_, _, _, _))
        .WillOnce(Return(exited(1, "Traceback (most recent call last):\nZeroDivisionError: division by zero\n")));

    execution_result result = service->execute(request("1/0"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_THAT(*result.error, ::testing::HasSubstr("ZeroDivisionError"));
    EXPECT_EQ(result.output, *result.error);
}

TEST_F(ExecutionServiceTest, OomKilled) {
    raw_run_result raw = exited(137, "");
    raw.oom_killed = true;
    EXPECT_CALL(*runtime, run(_, _, _, _)).WillOnce(Return(raw));

    execution_result result = service->execute(request("x = 'a' * 10**10"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 137);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_THAT(*result.error, ::testing::HasSubstr("Memory limit exceeded"));
}

TEST_F(ExecutionServiceTest, Timeout) {
    EXPECT_CALL(*runtime, run(_, _, chrono::seconds(2), _)).WillOnce(Return(timed_out()));

    execution_result result = service->execute(request("while True: pass", 2));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_EQ(result.output, "");
    EXPECT_EQ(result.execution_time, 2000);
    EXPECT_EQ(result.error, optional<string>("Code execution timed out after 2 seconds"));
}

TEST_F(ExecutionServiceTest, ContainerErrorIsFolded) {
    EXPECT_CALL(*runtime, run(_, _, _, _)).WillOnce(Throw(container_error("connection reset")));

    execution_result result = service->execute(request("print(1)"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_EQ(result.output, "");
    EXPECT_EQ(result.error, optional<string>("Container error: connection reset"));
    EXPECT_GE(result.execution_time, 0);
}

TEST_F(ExecutionServiceTest, UnexpectedErrorIsFolded) {
    EXPECT_CALL(*runtime, run(_, _, _, _)).WillOnce(Throw(runtime_error("disk full")));

    execution_result result = service->execute(request("print(1)"));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, optional<string>("Execution failed: disk full"));
}

TEST_F(ExecutionServiceTest, TimeoutOutOfRange) {
    EXPECT_CALL(*runtime, run(_, _, _, _)).Times(0);
    EXPECT_THROW(service->execute(request("print(1)", 0)), precondition_error);
    EXPECT_THROW(service->execute(request("print(1)", 61)), precondition_error);
    EXPECT_CALL(*runtime, run(_, _, _, _)).WillOnce(Return(exited(0, "1\n")));
    EXPECT_NO_THROW(service->execute(request("print(1)", 60)));
}

TEST_F(ExecutionServiceTest, InitializesOnce) {
    EXPECT_CALL(*runtime, initialize()).Times(1);
    EXPECT_CALL(*runtime, run(_, _, _, _)).WillRepeatedly(Return(exited(0, "")));
    service->execute(request("pass"));
    service->execute(request("pass"));
}

TEST_F(ExecutionServiceTest, FailedInitializationIsRetried) {
    EXPECT_CALL(*runtime, initialize())
        .WillOnce(Throw(runtime_unavailable("daemon is down")))
        .WillOnce(Return());
    EXPECT_CALL(*runtime, run(_, _, _, _)).WillOnce(Return(exited(0, "ok\n")));

    EXPECT_THROW(service->execute(request("print('ok')")), runtime_unavailable);
    EXPECT_TRUE(service->execute(request("print('ok')")).success);
}

TEST_F(ExecutionServiceTest, LimitsComeFromConfig) {
    execution_config custom;
    custom.memory_limit = "64m";
    custom.cpu_limit = 1;
    auto rt = make_shared<::testing::NiceMock<mock_runtime>>();
    execution_service custom_service(custom, rt);

    EXPECT_CALL(*rt, run(_, _, _, ::testing::AllOf(
                                       ::testing::Field(&resource_limits::memory_bytes, 64LL << 20),
                                       ::testing::Field(&resource_limits::cpus, 1.0))))
        .WillOnce(Return(exited(0, "")));
    custom_service.execute(request("pass"));
}

/**
 * @brief 初始化很慢的运行环境，用来让多个线程同时进入初始化
 */
struct slow_init_runtime : public sandbox_runtime {
    void initialize() override {
        ++initializations;
        this_thread::sleep_for(chrono::milliseconds(100));
    }

    raw_run_result run(const string &, const string &, chrono::seconds, const resource_limits &) override {
        return exited(0, "ok\n");
    }

    size_t sweep() override { return 0; }

    atomic<int> initializations{0};
};

TEST(ExecutionServiceConcurrencyTest, ConcurrentFirstRequestsInitializeOnce) {
    execution_config config;
    auto runtime = make_shared<slow_init_runtime>();
    execution_service service(config, runtime);

    execution_request req;
    req.source = "print('ok')";
    req.timeout_seconds = 5;

    atomic<int> succeeded{0};
    vector<thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&] {
            if (service.execute(req).success) ++succeeded;
        });
    for (auto &th : threads) th.join();

    EXPECT_EQ(runtime->initializations.load(), 1);
    EXPECT_EQ(succeeded.load(), 8);
}

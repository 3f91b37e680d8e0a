#include <cstdlib>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace coderun;
using nlohmann::json;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (auto &name : names) unsetenv(name.c_str());
    }

    void set(const string &name, const string &value) {
        setenv(name.c_str(), value.c_str(), 1);
        names.push_back(name);
    }

    vector<string> names;
};

TEST_F(ConfigTest, Defaults) {
    execution_config config;
    EXPECT_EQ(config.docker_image, "python:3.11-slim");
    EXPECT_EQ(config.container_timeout, 30);
    EXPECT_EQ(config.test_case_timeout, 10);
    EXPECT_EQ(config.max_execution_time, 60);
    EXPECT_EQ(config.max_output_size, 10240u);
    EXPECT_NO_THROW(check_config(config));

    resource_limits limits = config.limits();
    EXPECT_EQ(limits.memory_bytes, 128LL << 20);
    EXPECT_EQ(limits.scratch_bytes, 16LL << 20);
    EXPECT_DOUBLE_EQ(limits.cpus, 0.5);
    EXPECT_EQ(limits.run_user, "nobody");
}

TEST_F(ConfigTest, FromJsonKeepsMissingKeys) {
    execution_config config;
    json::parse(R"({"memory_limit": "256m", "cpu_limit": 1.5, "network_disabled": false})").get_to(config);
    EXPECT_EQ(config.memory_limit, "256m");
    EXPECT_DOUBLE_EQ(config.cpu_limit, 1.5);
    EXPECT_FALSE(config.network_disabled);
    EXPECT_EQ(config.docker_image, "python:3.11-slim");
    EXPECT_EQ(config.container_timeout, 30);
}

TEST_F(ConfigTest, FromJsonRejectsWrongType) {
    execution_config config;
    EXPECT_THROW(json::parse(R"({"container_timeout": "long"})").get_to(config), invalid_argument);
}

TEST_F(ConfigTest, JsonRoundTripKeepsEveryKey) {
    execution_config config;
    config.run_user = "sandbox";
    json j = config;
    EXPECT_EQ(j.size(), 17u);
    execution_config parsed = j.get<execution_config>();
    EXPECT_EQ(parsed.run_user, "sandbox");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    execution_config config;
    json::parse(R"({"memory_limit": "256m", "test_case_timeout": 5})").get_to(config);
    set("CODE_EXECUTION_MEMORY_LIMIT", "64m");
    set("CODE_EXECUTION_NETWORK_DISABLED", "false");
    set("CODE_EXECUTION_CPU_LIMIT", "2");
    apply_environment(config);
    EXPECT_EQ(config.memory_limit, "64m");
    EXPECT_FALSE(config.network_disabled);
    EXPECT_DOUBLE_EQ(config.cpu_limit, 2.0);
    EXPECT_EQ(config.test_case_timeout, 5);
}

TEST_F(ConfigTest, MalformedEnvironmentValue) {
    execution_config config;
    set("CODE_EXECUTION_CONTAINER_TIMEOUT", "thirty");
    EXPECT_THROW(apply_environment(config), precondition_error);
    unsetenv("CODE_EXECUTION_CONTAINER_TIMEOUT");

    set("CODE_EXECUTION_READ_ONLY_FILESYSTEM", "maybe");
    EXPECT_THROW(apply_environment(config), precondition_error);
}

TEST_F(ConfigTest, CheckRejectsInconsistentValues) {
    {
        execution_config config;
        config.test_case_timeout = 0;
        EXPECT_THROW(check_config(config), precondition_error);
    }
    {
        execution_config config;
        config.test_case_timeout = 40;
        EXPECT_THROW(check_config(config), precondition_error);
    }
    {
        execution_config config;
        config.container_timeout = 90;
        EXPECT_THROW(check_config(config), precondition_error);
    }
    {
        execution_config config;
        config.run_user = "root";
        EXPECT_THROW(check_config(config), precondition_error);
    }
    {
        execution_config config;
        config.memory_limit = "lots";
        EXPECT_THROW(check_config(config), precondition_error);
    }
    {
        execution_config config;
        config.cpu_limit = 0;
        EXPECT_THROW(check_config(config), precondition_error);
    }
    {
        execution_config config;
        config.max_concurrent_executions = 0;
        EXPECT_THROW(check_config(config), precondition_error);
    }
}

TEST_F(ConfigTest, NegativeOutputSizeIsRejected) {
    execution_config config;
    set("CODE_EXECUTION_MAX_OUTPUT_SIZE", "-1");
    EXPECT_THROW(apply_environment(config), precondition_error);
    EXPECT_EQ(config.max_output_size, 10240u);

    EXPECT_THROW(json::parse(R"({"max_output_size": -1})").get_to(config), precondition_error);
    EXPECT_EQ(config.max_output_size, 10240u);
}

TEST_F(ConfigTest, OutputSizeFromEnvironment) {
    execution_config config;
    set("CODE_EXECUTION_MAX_OUTPUT_SIZE", "4096");
    apply_environment(config);
    EXPECT_EQ(config.max_output_size, 4096u);
}

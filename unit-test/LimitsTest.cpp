#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "sandbox/limits.hpp"

using namespace std;
using namespace coderun;

TEST(LimitsTest, ParseMemorySizeUnits) {
    EXPECT_EQ(parse_memory_size("128m"), 128LL << 20);
    EXPECT_EQ(parse_memory_size("128M"), 128LL << 20);
    EXPECT_EQ(parse_memory_size("1g"), 1LL << 30);
    EXPECT_EQ(parse_memory_size("512k"), 512LL << 10);
    EXPECT_EQ(parse_memory_size("100b"), 100);
    EXPECT_EQ(parse_memory_size("4096"), 4096);
    EXPECT_EQ(parse_memory_size("0"), 0);
    EXPECT_EQ(parse_memory_size(" 64m "), 64LL << 20);
}

TEST(LimitsTest, ParseMemorySizeRejectsMalformed) {
    EXPECT_THROW(parse_memory_size(""), precondition_error);
    EXPECT_THROW(parse_memory_size("m"), precondition_error);
    EXPECT_THROW(parse_memory_size("12x"), precondition_error);
    EXPECT_THROW(parse_memory_size("1.5g"), precondition_error);
    EXPECT_THROW(parse_memory_size("-5m"), precondition_error);
    EXPECT_THROW(parse_memory_size("99999999999999999g"), precondition_error);
}

TEST(LimitsTest, CpuQuota) {
    EXPECT_EQ(cpu_quota(0.5), 50000);
    EXPECT_EQ(cpu_quota(1), CPU_PERIOD);
    EXPECT_EQ(cpu_quota(2.25), 225000);
}

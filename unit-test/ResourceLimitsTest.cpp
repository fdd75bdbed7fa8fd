#include <nlohmann/json.hpp>
#include "gtest/gtest.h"
#include "sandbox/resource_limits.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace grader;

TEST(ResourceLimitsTest, DefaultValues) {
    resource_limits limits;
    EXPECT_EQ(limits.wall_clock_ms(), 2000);
    EXPECT_EQ(limits.cpu_time_ms(), 2000);
    EXPECT_EQ(limits.memory_mb(), 256);
    EXPECT_EQ(limits.stack_mb(), 64);
    EXPECT_EQ(limits.file_size_mb(), 10);
    EXPECT_EQ(limits.open_files(), 64);
    EXPECT_EQ(limits.processes(), 1);
}

TEST(ResourceLimitsTest, RejectsNonPositiveFields) {
    EXPECT_THROW(resource_limits(0, 2000, 256, 64, 10, 64, 1), invalid_argument);
    EXPECT_THROW(resource_limits(2000, -1, 256, 64, 10, 64, 1), invalid_argument);
    EXPECT_THROW(resource_limits(2000, 2000, 0, 64, 10, 64, 1), invalid_argument);
    EXPECT_THROW(resource_limits(2000, 2000, 256, 0, 10, 64, 1), invalid_argument);
    EXPECT_THROW(resource_limits(2000, 2000, 256, 64, -10, 64, 1), invalid_argument);
    EXPECT_THROW(resource_limits(2000, 2000, 256, 64, 10, 0, 1), invalid_argument);
    EXPECT_THROW(resource_limits(2000, 2000, 256, 64, 10, 64, 0), invalid_argument);
}

TEST(ResourceLimitsTest, ErrorNamesTheField) {
    try {
        resource_limits(2000, 2000, -5, 64, 10, 64, 1);
        FAIL() << "negative memory should be rejected";
    } catch (invalid_argument &e) {
        EXPECT_EQ(string(e.what()), "memory_mb must be positive, got -5");
    }
}

TEST(ResourceLimitsTest, RejectsOversizedFields) {
    // 2^44 MB 换算成字节会溢出 64 位整数
    EXPECT_THROW(resource_limits(2000, 2000, int64_t(1) << 44, 64, 10, 64, 1), invalid_argument);
    EXPECT_THROW(resource_limits(int64_t(1) << 53, 2000, 256, 64, 10, 64, 1), invalid_argument);
    EXPECT_THROW(resource_limits(2000, resource_limits::MAX_TIME_MS + 1, 256, 64, 10, 64, 1), invalid_argument);
    EXPECT_THROW(resource_limits(2000, 2000, 256, resource_limits::MAX_SIZE_MB + 1, 10, 64, 1), invalid_argument);
    EXPECT_THROW(resource_limits(2000, 2000, 256, 64, resource_limits::MAX_SIZE_MB + 1, 64, 1), invalid_argument);
    EXPECT_THROW(resource_limits(2000, 2000, 256, 64, 10, resource_limits::MAX_OPEN_FILES + 1, 1), invalid_argument);
    EXPECT_THROW(resource_limits(2000, 2000, 256, 64, 10, 64, resource_limits::MAX_PROCESSES + 1), invalid_argument);

    EXPECT_NO_THROW(resource_limits(resource_limits::MAX_TIME_MS, resource_limits::MAX_TIME_MS,
                                    resource_limits::MAX_SIZE_MB, resource_limits::MAX_SIZE_MB,
                                    resource_limits::MAX_SIZE_MB, resource_limits::MAX_OPEN_FILES,
                                    resource_limits::MAX_PROCESSES));

    try {
        resource_limits().apply(resource_limit_overrides{std::nullopt, std::nullopt, int64_t(1) << 44});
        FAIL() << "oversized memory should be rejected";
    } catch (invalid_argument &e) {
        EXPECT_EQ(string(e.what()), "memory_mb must not exceed 1048576, got 17592186044416");
    }
}

TEST(ResourceLimitsTest, ApplyOverrides) {
    resource_limits base;
    resource_limit_overrides overrides;
    overrides.wall_clock_ms = 5000;
    overrides.memory_mb = 512;

    resource_limits merged = base.apply(overrides);
    EXPECT_EQ(merged.wall_clock_ms(), 5000);
    EXPECT_EQ(merged.memory_mb(), 512);
    EXPECT_EQ(merged.cpu_time_ms(), base.cpu_time_ms());
    EXPECT_EQ(merged.processes(), base.processes());
    EXPECT_NE(merged, base);

    EXPECT_EQ(base.apply(resource_limit_overrides()), base);
}

TEST(ResourceLimitsTest, ApplyValidatesMergedValue) {
    resource_limit_overrides overrides;
    overrides.cpu_time_ms = 0;
    EXPECT_THROW(resource_limits().apply(overrides), invalid_argument);

    overrides.cpu_time_ms = -100;
    EXPECT_THROW(resource_limits().apply(overrides), invalid_argument);
}

TEST(ResourceLimitsTest, OverridesFromJson) {
    auto overrides = nlohmann::json::parse(R"({"wall_clock_ms": 100, "processes": 8})").get<resource_limit_overrides>();
    EXPECT_FALSE(overrides.empty());
    EXPECT_EQ(overrides.wall_clock_ms, 100);
    EXPECT_EQ(overrides.processes, 8);
    EXPECT_FALSE(overrides.memory_mb);

    EXPECT_TRUE(nlohmann::json::object().get<resource_limit_overrides>().empty());
    EXPECT_THROW(nlohmann::json::parse(R"({"time": 100})").get<resource_limit_overrides>(), invalid_argument);
    EXPECT_THROW(nlohmann::json::parse(R"({"memory_mb": "big"})").get<resource_limit_overrides>(), invalid_argument);
}

TEST(ResourceLimitsTest, ToJson) {
    nlohmann::json j = resource_limits(1000, 900, 128, 8, 1, 16, 2);
    EXPECT_JSON_EQ(j, nlohmann::json::parse(R"({
        "wall_clock_ms": 1000, "cpu_time_ms": 900, "memory_mb": 128, "stack_mb": 8,
        "file_size_mb": 1, "open_files": 16, "processes": 2
    })"));
}

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "common/defer.hpp"
#include "common/status.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace grader;

TEST(StatusTest, ShortNames) {
    EXPECT_STREQ(get_short_name(status::OK), "OK");
    EXPECT_STREQ(get_short_name(status::TIMEOUT), "TIMEOUT");
    EXPECT_STREQ(get_short_name(status::TIME_LIMIT_EXCEEDED), "TLE");
    EXPECT_STREQ(get_short_name(status::WRONG_ANSWER), "WA");
    EXPECT_EQ(parse_status("MLE"), status::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(parse_status("CE"), status::COMPILATION_ERROR);
    EXPECT_THROW(parse_status("AC"), invalid_argument);
}

TEST(StatusTest, FoldVerdict) {
    EXPECT_EQ(fold_verdict(status::TIMEOUT), status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(fold_verdict(status::RUNTIME_ERROR), status::RUNTIME_ERROR);
    EXPECT_TRUE(is_time_limit(status::TIMEOUT));
    EXPECT_TRUE(is_time_limit(status::TIME_LIMIT_EXCEEDED));
    EXPECT_FALSE(is_time_limit(status::OUTPUT_LIMIT_EXCEEDED));
}

TEST(UtilsTest, MakeCommand) {
    filesystem::path source("main.cpp");
    vector<string> extra = {"-lm", "-O2"};
    EXPECT_EQ(make_command("gcc", source, extra, 17), vector<string>({"gcc", "main.cpp", "-lm", "-O2", "17"}));
}

TEST(UtilsTest, Quote) {
    EXPECT_EQ(quote("abc"), "'abc'");
    EXPECT_EQ(quote("a\tb\n"), "'a\\tb\\n'");
    EXPECT_EQ(quote("it's"), "'it\\'s'");
    EXPECT_EQ(quote(string(1, '\x01')), "'\\x01'");
}

TEST(UtilsTest, FormatPercent) {
    EXPECT_EQ(format_percent(2.0 / 3), "66.7%");
    EXPECT_EQ(format_percent(1), "100.0%");
    EXPECT_EQ(format_percent(0), "0.0%");
}

TEST(DeferTest, RunsOnScopeExit) {
    int counter = 0;
    {
        defer { ++counter; };
        defer { counter *= 10; };
        EXPECT_EQ(counter, 0);
    }
    // 逆序执行
    EXPECT_EQ(counter, 1);
}

TEST(DeferTest, SwallowsCleanupException) {
    bool reached = false;
    EXPECT_NO_THROW({
        defer { reached = true; };
        defer { throw runtime_error("cleanup failed"); };
    });
    EXPECT_TRUE(reached);
}

TEST(ConcurrentQueueTest, DrainsAfterClose) {
    concurrent_queue<int> queue;
    for (int i = 0; i < 100; ++i) queue.push(i);
    queue.close();
    EXPECT_THROW(queue.push(100), logic_error);

    atomic<int> sum{0};
    vector<thread> threads;
    for (int t = 0; t < 4; ++t)
        threads.emplace_back([&] {
            int value;
            while (queue.pop(value)) sum += value;
        });
    for (auto &th : threads) th.join();
    EXPECT_EQ(sum.load(), 4950);

    int value = -1;
    EXPECT_FALSE(queue.try_pop(value));
    EXPECT_EQ(value, -1);
}

TEST(ConcurrentQueueTest, CloseWakesWaitingReaders) {
    concurrent_queue<int> queue;
    atomic<bool> finished{false};
    thread reader([&] {
        int value;
        EXPECT_FALSE(queue.pop(value));
        finished = true;
    });
    this_thread::sleep_for(chrono::milliseconds(50));
    EXPECT_FALSE(finished.load());
    queue.close();
    reader.join();
    EXPECT_TRUE(finished.load());
}

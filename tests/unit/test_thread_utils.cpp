#include <gtest/gtest.h>

#include <atomic>
#include <cstring>
#include <pthread.h>
#include <string>
#include <thread>
#include <vector>

#include "common/thread_utils.h"

using namespace Common;

namespace {

std::string currentThreadName() {
    char name[16]{};
    pthread_getname_np(pthread_self(), name, sizeof(name));
    return name;
}

} // namespace

TEST(ThreadUtilsTest, SetThreadNameOnCallingThread) {
    std::string observed;
    std::thread worker([&observed] {
        EXPECT_TRUE(setThreadName("sk-unit"));
        observed = currentThreadName();
    });
    worker.join();

    EXPECT_EQ(observed, "sk-unit");
}

TEST(ThreadUtilsTest, LongNamesAreTruncatedTo15Chars) {
    std::string observed;
    std::thread worker([&observed] {
        EXPECT_TRUE(setThreadName("strictkit-telemetry-sender"));
        observed = currentThreadName();
    });
    worker.join();

    EXPECT_EQ(observed, "strictkit-telem");
    EXPECT_EQ(observed.size(), 15u);
}

TEST(ThreadUtilsTest, CreateNamedThreadRunsFunctionWithArgs) {
    // === GIVEN ===
    std::atomic<int> sum{0};
    std::string observed;

    // === WHEN ===
    std::thread t = createNamedThread("sk-gate", [&](int a, int b) {
        sum.store(a + b);
        observed = currentThreadName();
    }, 40, 2);
    t.join();

    // === THEN ===
    EXPECT_EQ(sum.load(), 42);
    EXPECT_EQ(observed, "sk-gate");
}

TEST(ThreadUtilsTest, ManyNamedThreadsAllComplete) {
    constexpr int THREADS = 8;
    std::atomic<int> done{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < THREADS; ++i) {
        threads.push_back(createNamedThread("sk-worker", [&done] { done.fetch_add(1); }));
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(done.load(), THREADS);
}

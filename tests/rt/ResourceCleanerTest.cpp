#include "grace/rt/ResourceCleaner.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace grace;
using namespace grace::rt;
using namespace std::chrono_literals;

static Deadline generous() { return Deadline::after(5s); }

// Blocks an action until the test lets it go.
struct Gate {
    std::mutex mu;
    std::condition_variable cv;
    bool open = false;
    bool entered = false;

    void pass() {
        std::unique_lock<std::mutex> lk(mu);
        entered = true;
        cv.notify_all();
        cv.wait(lk, [this]{ return open; });
    }
    void release() {
        { std::lock_guard<std::mutex> lk(mu); open = true; }
        cv.notify_all();
    }
};

TEST(ResourceCleanerTest, EmptyRegistrySucceeds) {
    ResourceCleaner cleaner;
    EXPECT_TRUE(cleaner.cleanup(generous()).empty());
    EXPECT_TRUE(cleaner.consumed());
}

TEST(ResourceCleanerTest, AllSucceed) {
    ResourceCleaner cleaner;
    int ran = 0;
    cleaner.registerWithName("a", [&]{ ++ran; return Status{}; });
    cleaner.registerWithName("b", [&]{ ++ran; return Status{}; });
    EXPECT_EQ(cleaner.size(), 2u);
    EXPECT_TRUE(cleaner.cleanup(generous()).empty());
    EXPECT_EQ(ran, 2);
}

TEST(ResourceCleanerTest, MiddleFailureDoesNotStopTheRest) {
    ResourceCleaner cleaner;
    int a = 0, b = 0, c = 0;
    cleaner.registerWithName("A", [&]{ ++a; return Status{}; });
    cleaner.registerWithName("B", [&]{ ++b; return Status::failure("disk busy"); });
    cleaner.registerWithName("C", [&]{ ++c; return Status{}; });

    auto errs = cleaner.cleanup(generous());
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].path, "B");
    EXPECT_EQ(errs[0].message, "disk busy");
    EXPECT_EQ(a, 1);
    EXPECT_EQ(b, 1);
    EXPECT_EQ(c, 1);
}

TEST(ResourceCleanerTest, FailedSubsetReportedInRegistrationOrder) {
    ResourceCleaner cleaner;
    const std::set<int> failing{1, 4, 7, 9};
    std::vector<int> order;
    for (int i = 0; i < 10; ++i) {
        cleaner.registerWithName("r" + std::to_string(i), [&, i]{
            order.push_back(i);
            return failing.count(i) ? Status::failure("fail " + std::to_string(i)) : Status{};
        });
    }

    auto errs = cleaner.cleanup(generous());
    ASSERT_EQ(errs.size(), failing.size());
    std::size_t k = 0;
    for (int i : failing) {
        EXPECT_EQ(errs[k].path, "r" + std::to_string(i));
        EXPECT_EQ(errs[k].message, "fail " + std::to_string(i));
        ++k;
    }
    ASSERT_EQ(order.size(), 10u);
    for (int i = 0; i < 10; ++i) EXPECT_EQ(order[static_cast<std::size_t>(i)], i);
}

TEST(ResourceCleanerTest, ExceptionBecomesFailure) {
    ResourceCleaner cleaner;
    bool after = false;
    cleaner.registerWithName("thrower", []() -> Status { throw std::runtime_error("socket gone"); });
    cleaner.registerWithName("after", [&]{ after = true; return Status{}; });

    auto errs = cleaner.cleanup(generous());
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].path, "thrower");
    EXPECT_NE(errs[0].message.find("socket gone"), std::string::npos);
    EXPECT_TRUE(after);
}

TEST(ResourceCleanerTest, DuplicateNamesAreKept) {
    ResourceCleaner cleaner;
    int ran = 0;
    EXPECT_TRUE(cleaner.registerWithName("db", [&]{ ++ran; return Status{}; }));
    EXPECT_TRUE(cleaner.registerWithName("db", [&]{ ++ran; return Status::failure("second"); }));
    EXPECT_EQ(cleaner.size(), 2u);

    auto errs = cleaner.cleanup(generous());
    EXPECT_EQ(ran, 2);
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].path, "db");
}

TEST(ResourceCleanerTest, ConcurrentRegistrationLosesNothing) {
    ResourceCleaner cleaner;
    std::atomic<int> ran{0};
    std::atomic<int> accepted{0};
    const int threads = 8, perThread = 200;

    std::vector<std::thread> ts;
    for (int t = 0; t < threads; ++t) {
        ts.emplace_back([&, t]{
            for (int i = 0; i < perThread; ++i) {
                if (cleaner.registerWithName("t" + std::to_string(t) + "." + std::to_string(i),
                                             [&ran]{ ran++; return Status{}; })) {
                    accepted++;
                }
            }
        });
    }
    for (auto& t : ts) t.join();

    EXPECT_EQ(accepted.load(), threads * perThread);
    EXPECT_EQ(cleaner.size(), static_cast<std::size_t>(threads * perThread));
    EXPECT_TRUE(cleaner.cleanup(generous()).empty());
    EXPECT_EQ(ran.load(), threads * perThread);
}

TEST(ResourceCleanerTest, RegistrationAfterCleanupIsRejected) {
    ResourceCleaner cleaner;
    cleaner.cleanup(generous());
    bool ran = false;
    EXPECT_FALSE(cleaner.registerWithName("late", [&]{ ran = true; return Status{}; }));
    EXPECT_FALSE(ran);
}

TEST(ResourceCleanerTest, SecondCleanupNeverReinvokes) {
    ResourceCleaner cleaner;
    int ran = 0;
    cleaner.registerWithName("once", [&]{ ++ran; return Status{}; });
    EXPECT_TRUE(cleaner.cleanup(generous()).empty());

    auto again = cleaner.cleanup(generous());
    ASSERT_EQ(again.size(), 1u);
    EXPECT_NE(again[0].message.find("consumed"), std::string::npos);
    EXPECT_EQ(ran, 1);
}

TEST(ResourceCleanerTest, HungActionDoesNotHoldCallerPastDeadline) {
    ResourceCleaner cleaner;
    auto gate = std::make_shared<Gate>();
    auto lateRan = std::make_shared<std::atomic<bool>>(false);
    bool firstRan = false;

    cleaner.registerWithName("first", [&]{ firstRan = true; return Status{}; });
    cleaner.registerWithName("hung", [gate]{ gate->pass(); return Status{}; });
    cleaner.registerWithName("late", [lateRan]{ lateRan->store(true); return Status{}; });

    const auto t0 = std::chrono::steady_clock::now();
    auto errs = cleaner.cleanup(Deadline::after(100ms));
    const auto took = std::chrono::steady_clock::now() - t0;

    EXPECT_LT(took, 2s);
    EXPECT_TRUE(firstRan);
    ASSERT_EQ(errs.size(), 2u);
    EXPECT_EQ(errs[0].path, "hung");
    EXPECT_EQ(errs[0].message, "deadline exceeded");
    EXPECT_EQ(errs[1].path, "late");
    EXPECT_EQ(errs[1].message, "skipped: deadline exceeded");

    gate->release();
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(lateRan->load());
}

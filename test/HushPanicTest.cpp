#include <gtest/gtest.h>
#include <atomic>
#include <barrier>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "Fault.hpp"
#include "FaultHook.hpp"
#include "HushPanic.hpp"
#include "HushRegistry.hpp"

using namespace FaultHush;

// Installed in main() before anything hushes, so it is the reporter the
// interception hook forwards to for the whole run.
namespace {
    std::mutex g_mutex;
    std::vector<FaultReport> g_reports;

    void record_report(const FaultReport& report) {
        std::lock_guard<std::mutex> lock(g_mutex);
        g_reports.push_back(report);
    }

    std::vector<FaultReport> take_reports() {
        std::lock_guard<std::mutex> lock(g_mutex);
        return std::exchange(g_reports, {});
    }

    bool raise(const char* message) {
        return catch_fault([message] { fault(message); }).has_value();
    }
}

class HushPanicTest : public ::testing::Test {
  protected:
    void SetUp() override {
        unhush_panic();
        take_reports();
    }

    void TearDown() override {
        unhush_panic();
    }
};

TEST_F(HushPanicTest, UnhushOnNeverHushedThreadReturnsFalse) {
    bool result = true;

    std::thread t([&] { result = unhush_panic(); });
    t.join();

    EXPECT_FALSE(result);
}

TEST_F(HushPanicTest, UnhushReturnsPriorMembership) {
    hush_panic();
    EXPECT_TRUE(unhush_panic());
    EXPECT_FALSE(unhush_panic());
}

TEST_F(HushPanicTest, HushTwiceThenSingleUnhush) {
    hush_panic();
    hush_panic();
    EXPECT_TRUE(is_panic_hushed());

    ASSERT_TRUE(raise("hushed twice"));
    EXPECT_TRUE(take_reports().empty());

    EXPECT_TRUE(unhush_panic());
    EXPECT_FALSE(is_panic_hushed());

    ASSERT_TRUE(raise("after single unhush"));
    const auto reports = take_reports();
    ASSERT_EQ(reports.size(), 1U);
    EXPECT_EQ(reports.front().message, "after single unhush");
}

TEST_F(HushPanicTest, HushedThreadIsSilentOthersStillReport) {
    std::thread::id quiet_id;
    std::thread::id loud_id;
    std::barrier sync_point(2);

    std::thread quiet([&] {
        quiet_id = std::this_thread::get_id();
        hush_panic();
        sync_point.arrive_and_wait();
        EXPECT_TRUE(raise("quiet"));
        sync_point.arrive_and_wait();
        EXPECT_TRUE(unhush_panic());
    });

    std::thread loud([&] {
        loud_id = std::this_thread::get_id();
        sync_point.arrive_and_wait();
        EXPECT_TRUE(raise("loud"));
        sync_point.arrive_and_wait();
    });

    quiet.join();
    loud.join();

    const auto reports = take_reports();
    ASSERT_EQ(reports.size(), 1U);
    EXPECT_EQ(reports.front().message, "loud");
    EXPECT_EQ(reports.front().thread, loud_id);
    EXPECT_NE(reports.front().thread, quiet_id);
}

TEST_F(HushPanicTest, GuardSilencesOnlyItsScope) {
    {
        auto _hush = hush_this_test();
        EXPECT_TRUE(_hush);
        EXPECT_EQ(_hush.thread_id(), std::this_thread::get_id());
        ASSERT_TRUE(raise("inside guard"));
        EXPECT_TRUE(take_reports().empty());
    }

    EXPECT_FALSE(is_panic_hushed());
    ASSERT_TRUE(raise("after guard"));

    const auto reports = take_reports();
    ASSERT_EQ(reports.size(), 1U);
    EXPECT_EQ(reports.front().message, "after guard");
    EXPECT_EQ(reports.front().thread, std::this_thread::get_id());
}

TEST_F(HushPanicTest, GuardUnhushesWhenScopeUnwinds) {
    try {
        auto _hush = hush_this_test();
        fault("unwinding through guard");
    } catch (const Fault&) {
    }

    EXPECT_FALSE(is_panic_hushed());
    EXPECT_TRUE(take_reports().empty());
}

TEST_F(HushPanicTest, GuardRestoresUnhushedState) {
    ASSERT_FALSE(is_panic_hushed());
    {
        auto _hush = hush_this_test();
        EXPECT_TRUE(is_panic_hushed());
    }
    EXPECT_FALSE(is_panic_hushed());
}

TEST_F(HushPanicTest, GuardOverManualHushUnhushesOnDrop) {
    hush_panic();
    {
        auto _hush = hush_this_test();
        EXPECT_TRUE(is_panic_hushed());
    }
    EXPECT_FALSE(is_panic_hushed());
    EXPECT_FALSE(unhush_panic());

    ASSERT_TRUE(raise("after nested guard"));
    const auto reports = take_reports();
    ASSERT_EQ(reports.size(), 1U);
    EXPECT_EQ(reports.front().message, "after nested guard");
}

TEST_F(HushPanicTest, NestedGuardsUnhushOnInnerDrop) {
    auto outer = hush_this_test();
    {
        auto inner = hush_this_test();
    }
    EXPECT_FALSE(is_panic_hushed());
    EXPECT_FALSE(outer.release());
}

TEST_F(HushPanicTest, ReleaseUnhushesOnceAndDisengages) {
    auto hush = hush_this_test();

    EXPECT_TRUE(hush.release());
    EXPECT_FALSE(hush);
    EXPECT_FALSE(is_panic_hushed());

    hush_panic();
    EXPECT_FALSE(hush.release());
    EXPECT_TRUE(is_panic_hushed());
}

TEST_F(HushPanicTest, MovedFromGuardDoesNothing) {
    auto outer = hush_this_test();
    {
        HushGuard inner(std::move(outer));
        EXPECT_FALSE(outer);
        EXPECT_TRUE(inner);
        EXPECT_TRUE(is_panic_hushed());
    }
    EXPECT_FALSE(is_panic_hushed());

    hush_panic();
    outer = HushGuard();
    EXPECT_TRUE(is_panic_hushed());
}

TEST_F(HushPanicTest, GuardDroppedOnAnotherThreadUnhushesCreator) {
    const auto creator_id = std::this_thread::get_id();
    bool worker_hushed_after = false;
    bool creator_hushed_before_drop = false;

    auto hush = hush_this_test();

    std::thread worker([&, guard = std::move(hush)]() mutable {
        hush_panic();
        creator_hushed_before_drop = HushRegistry::instance().contains(creator_id);
        {
            HushGuard dropped(std::move(guard));
        }
        worker_hushed_after = is_panic_hushed();
        EXPECT_TRUE(unhush_panic());
    });
    worker.join();

    EXPECT_TRUE(creator_hushed_before_drop);
    EXPECT_TRUE(worker_hushed_after);
    EXPECT_FALSE(is_panic_hushed());
}

TEST_F(HushPanicTest, ConcurrentGuardedFaultsStaySilent) {
    constexpr size_t thread_count = 8;
    constexpr size_t faults_per_thread = 50;
    std::barrier sync_point(thread_count);
    std::atomic<size_t> raised{0};

    std::vector<std::thread> threads;
    threads.reserve(thread_count);

    for (size_t i = 0; i < thread_count; ++i) {
        threads.emplace_back([&] {
            sync_point.arrive_and_wait();
            auto _hush = hush_this_test();
            for (size_t j = 0; j < faults_per_thread; ++j) {
                if (raise("guarded")) {
                    raised.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(raised.load(), thread_count * faults_per_thread);
    EXPECT_TRUE(take_reports().empty());
    EXPECT_EQ(HushRegistry::instance().size(), 0U);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    FaultHook::instance().set_hook(&record_report);
    return RUN_ALL_TESTS();
}

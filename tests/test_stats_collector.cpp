// ---------------------------------------------------------------------------
// test_stats_collector.cpp
//
// StatsCollector 단위 테스트.
//
// [테스트 범위]
// - 초기 상태 검증 (all-zero)
// - try_open_connection: 무제한(0) / 한도 도달 시 거부 카운트
// - on_connection_close: active_sessions 감소 (언더플로우 방지 포함)
// - on_query: total_queries / failed_queries 증가
// - snapshot(): failure_rate 계산, qps 양수, total == 0 시 0.0
// - ConcurrentAccess: 동시 open 이 한도를 넘지 않음
//
// [알려진 한계]
// - qps 는 누적 평균이므로 테스트 실행 시간에 따라 절대값이 달라진다.
//   양수 여부(> 0.0)만 검증한다.
// ---------------------------------------------------------------------------

#include "stats/stats_collector.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// InitialState_AllZero
// ---------------------------------------------------------------------------
TEST(StatsCollector, InitialState_AllZero) {
    StatsCollector stats;
    const auto snap = stats.snapshot();

    EXPECT_EQ(snap.total_connections,    0u);
    EXPECT_EQ(snap.active_sessions,      0u);
    EXPECT_EQ(snap.rejected_connections, 0u);
    EXPECT_EQ(snap.total_queries,        0u);
    EXPECT_EQ(snap.failed_queries,       0u);
    EXPECT_NEAR(snap.failure_rate,       0.0, 1e-9);
}

// ---------------------------------------------------------------------------
// TryOpen_Unlimited
//   limit == 0 이면 항상 열린다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, TryOpen_Unlimited) {
    StatsCollector stats;

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(stats.try_open_connection(0));
    }

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_connections,    100u);
    EXPECT_EQ(snap.active_sessions,      100u);
    EXPECT_EQ(snap.rejected_connections, 0u);
}

// ---------------------------------------------------------------------------
// TryOpen_LimitReached_Rejects
//   한도에 도달하면 false, rejected 만 증가하고 active/total 은 그대로.
// ---------------------------------------------------------------------------
TEST(StatsCollector, TryOpen_LimitReached_Rejects) {
    StatsCollector stats;

    EXPECT_TRUE(stats.try_open_connection(2));
    EXPECT_TRUE(stats.try_open_connection(2));
    EXPECT_FALSE(stats.try_open_connection(2));
    EXPECT_FALSE(stats.try_open_connection(2));

    auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_connections,    2u);
    EXPECT_EQ(snap.active_sessions,      2u);
    EXPECT_EQ(snap.rejected_connections, 2u);

    // 하나가 닫히면 다시 열 수 있다
    stats.on_connection_close();
    EXPECT_TRUE(stats.try_open_connection(2));

    snap = stats.snapshot();
    EXPECT_EQ(snap.total_connections, 3u);
    EXPECT_EQ(snap.active_sessions,   2u);
}

// ---------------------------------------------------------------------------
// OnConnectionClose_DecrementsActive
//   total_connections 는 감소하지 않는다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnConnectionClose_DecrementsActive) {
    StatsCollector stats;

    ASSERT_TRUE(stats.try_open_connection(0));
    ASSERT_TRUE(stats.try_open_connection(0));
    stats.on_connection_close();

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_connections, 2u);
    EXPECT_EQ(snap.active_sessions,   1u);
}

// ---------------------------------------------------------------------------
// OnConnectionClose_NoUnderflow
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnConnectionClose_NoUnderflow) {
    StatsCollector stats;

    stats.on_connection_close();

    EXPECT_EQ(stats.snapshot().active_sessions, 0u)
        << "active_sessions must not underflow below 0";
}

// ---------------------------------------------------------------------------
// OnQuery_CountsFailures
// ---------------------------------------------------------------------------
TEST(StatsCollector, OnQuery_CountsFailures) {
    StatsCollector stats;

    stats.on_query(false);
    auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_queries,  1u);
    EXPECT_EQ(snap.failed_queries, 0u);

    stats.on_query(true);
    snap = stats.snapshot();
    EXPECT_EQ(snap.total_queries,  2u);
    EXPECT_EQ(snap.failed_queries, 1u);
}

// ---------------------------------------------------------------------------
// Snapshot_FailureRate_Calculation
//   성공 3건 + 실패 1건 → failure_rate == 0.25
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_FailureRate_Calculation) {
    StatsCollector stats;

    stats.on_query(false);
    stats.on_query(false);
    stats.on_query(false);
    stats.on_query(true);

    const auto snap = stats.snapshot();
    EXPECT_EQ(snap.total_queries,  4u);
    EXPECT_EQ(snap.failed_queries, 1u);
    EXPECT_NEAR(snap.failure_rate, 0.25, 1e-9);
}

// ---------------------------------------------------------------------------
// Snapshot_Qps_Positive
// ---------------------------------------------------------------------------
TEST(StatsCollector, Snapshot_Qps_Positive) {
    StatsCollector stats;

    stats.on_query(false);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    const auto snap = stats.snapshot();
    EXPECT_GT(snap.qps, 0.0);
    EXPECT_LE(snap.captured_at, std::chrono::system_clock::now());
}

// ---------------------------------------------------------------------------
// ConcurrentOpen_NeverExceedsLimit
//   여러 스레드가 동시에 열어도 active_sessions 가 한도를 넘지 않는다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, ConcurrentOpen_NeverExceedsLimit) {
    StatsCollector stats;

    constexpr int           kThreads  = 8;
    constexpr int           kAttempts = 1000;
    constexpr std::uint64_t kLimit    = 10;

    std::atomic<std::uint64_t> opened{0};
    std::vector<std::thread>   threads;
    threads.reserve(kThreads);

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < kAttempts; ++i) {
                if (stats.try_open_connection(kLimit)) {
                    opened.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    const auto snap = stats.snapshot();
    EXPECT_EQ(opened.load(), kLimit);
    EXPECT_EQ(snap.active_sessions, kLimit);
    EXPECT_EQ(snap.total_connections, kLimit);
    EXPECT_EQ(snap.rejected_connections,
              static_cast<std::uint64_t>(kThreads) * kAttempts - kLimit);
}

// ---------------------------------------------------------------------------
// ConcurrentAccess
//   open/close/query 를 동시에 호출해도 카운터가 일관된다.
// ---------------------------------------------------------------------------
TEST(StatsCollector, ConcurrentAccess) {
    StatsCollector stats;

    constexpr int kThreads    = 8;
    constexpr int kIterations = 1000;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&stats, t]() {
            for (int i = 0; i < kIterations; ++i) {
                if (stats.try_open_connection(0)) {
                    stats.on_query((t + i) % 2 == 0);
                    stats.on_connection_close();
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    const auto snap = stats.snapshot();
    constexpr std::uint64_t kTotal = static_cast<std::uint64_t>(kThreads) * kIterations;
    EXPECT_EQ(snap.total_connections, kTotal);
    EXPECT_EQ(snap.active_sessions,   0u);
    EXPECT_EQ(snap.total_queries,     kTotal);
    EXPECT_EQ(snap.failed_queries,    kTotal / 2);
    EXPECT_NEAR(snap.failure_rate,    0.5, 1e-9);
}

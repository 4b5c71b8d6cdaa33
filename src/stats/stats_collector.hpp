#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 서버 실시간 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - 갱신 메서드는 여러 워커 스레드의 세션 코루틴에서 동시에 호출된다.
// - snapshot() 은 갱신 경로와 mutex 없이 atomic 로드만으로 읽는다.
//
// [격리 원칙]
// - 통계 수집 실패가 세션 실패로 전파되지 않도록 모든 갱신 메서드는
//   noexcept 로 선언한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   qps          : 수집 시작 이후 평균 초당 쿼리 수
//   failure_rate : failed_queries / total_queries (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                              total_connections{0};
    std::uint64_t                              active_sessions{0};
    std::uint64_t                              rejected_connections{0};
    std::uint64_t                              total_queries{0};
    std::uint64_t                              failed_queries{0};
    double                                     qps{0.0};
    double                                     failure_rate{0.0};
    std::chrono::system_clock::time_point      captured_at{};
};

// ---------------------------------------------------------------------------
// StatsCollector
//   연결/쿼리 이벤트를 집계하고 StatsSnapshot 을 제공한다.
// ---------------------------------------------------------------------------
class StatsCollector {
public:
    StatsCollector() noexcept
        : total_connections_{0}
        , active_sessions_{0}
        , rejected_connections_{0}
        , total_queries_{0}
        , failed_queries_{0}
        , started_at_(std::chrono::system_clock::now())
    {}

    ~StatsCollector() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    // try_open_connection
    //   active_sessions < limit 이면 연결을 열고 true.
    //   limit == 0 은 무제한. 한도에 걸리면 rejected 를 올리고 false.
    //   비교와 증가가 하나의 CAS 로 이루어지므로 동시 accept 에도 한도를 넘지 않는다.
    [[nodiscard]] bool try_open_connection(std::uint64_t limit) noexcept {
        std::uint64_t current = active_sessions_.load(std::memory_order_relaxed);
        while (limit == 0 || current < limit) {
            if (active_sessions_.compare_exchange_weak(current, current + 1,
                                                       std::memory_order_acq_rel,
                                                       std::memory_order_relaxed)) {
                total_connections_.fetch_add(1, std::memory_order_relaxed);
                return true;
            }
        }
        rejected_connections_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    // on_connection_close
    //   try_open_connection 이 true 를 반환한 연결이 끝날 때 한 번 호출한다.
    void on_connection_close() noexcept {
        std::uint64_t current = active_sessions_.load(std::memory_order_relaxed);
        while (current > 0) {
            if (active_sessions_.compare_exchange_weak(current, current - 1,
                                                       std::memory_order_acq_rel,
                                                       std::memory_order_relaxed)) {
                return;
            }
        }
    }

    // on_query
    //   Query 커맨드 처리 완료 시 호출.
    //   failed: Error 로 응답했으면 true
    void on_query(bool failed) noexcept {
        total_queries_.fetch_add(1, std::memory_order_relaxed);
        if (failed) {
            failed_queries_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // snapshot
    //   현재 통계의 불변 스냅샷을 반환한다 (조회 경로).
    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now        = std::chrono::system_clock::now();
        const auto total_conn = total_connections_.load(std::memory_order_relaxed);
        const auto active     = active_sessions_.load(std::memory_order_relaxed);
        const auto rejected   = rejected_connections_.load(std::memory_order_relaxed);
        const auto total_q    = total_queries_.load(std::memory_order_relaxed);
        const auto failed_q   = failed_queries_.load(std::memory_order_relaxed);

        const double elapsed_sec = std::chrono::duration<double>(now - started_at_).count();

        double qps = 0.0;
        if (elapsed_sec > 0.0) {
            qps = static_cast<double>(total_q) / elapsed_sec;
        }

        double failure_rate = 0.0;
        if (total_q > 0) {
            failure_rate = static_cast<double>(failed_q) / static_cast<double>(total_q);
        }

        return StatsSnapshot{
            .total_connections    = total_conn,
            .active_sessions      = active,
            .rejected_connections = rejected,
            .total_queries        = total_q,
            .failed_queries       = failed_q,
            .qps                  = qps,
            .failure_rate         = failure_rate,
            .captured_at          = now,
        };
    }

private:
    std::atomic<std::uint64_t>                 total_connections_;
    std::atomic<std::uint64_t>                 active_sessions_;
    std::atomic<std::uint64_t>                 rejected_connections_;
    std::atomic<std::uint64_t>                 total_queries_;
    std::atomic<std::uint64_t>                 failed_queries_;

    const std::chrono::system_clock::time_point started_at_;
};

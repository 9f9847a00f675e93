#pragma once

// ---------------------------------------------------------------------------
// engine_stats.hpp
//
// 엔진 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_* 갱신 메서드: 여러 Review/Audit 호출에서 동시에 불려도 안전하다.
// - snapshot(): 갱신 경로와 mutex 없이 atomic 로드로 읽는다.
//
// [격리 원칙]
// 통계 갱신 실패가 질의 실패로 전파되지 않도록 갱신 메서드는 noexcept.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// EngineStatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   violation_rate: violations / (reviews + audits) (분모 0 이면 0.0)
// ---------------------------------------------------------------------------
struct EngineStatsSnapshot {
    std::uint64_t                         reviews{0};
    std::uint64_t                         audits{0};
    std::uint64_t                         violations{0};
    std::uint64_t                         auto_rejections{0};
    std::uint64_t                         query_errors{0};
    double                                violation_rate{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class EngineStats {
public:
    EngineStats() noexcept
        : reviews_{0}
        , audits_{0}
        , violations_{0}
        , auto_rejections_{0}
        , query_errors_{0}
    {}

    ~EngineStats() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    EngineStats(const EngineStats&)            = delete;
    EngineStats& operator=(const EngineStats&) = delete;
    EngineStats(EngineStats&&)                 = delete;
    EngineStats& operator=(EngineStats&&)      = delete;

    // on_review / on_audit
    //   violations     : 반환된 결과 수 (auto_rejections 포함)
    //   auto_rejections: match 실패로 만들어진 결과 수
    //   errors         : ErrorMap 항목 수
    void on_review(std::uint64_t violations, std::uint64_t auto_rejections,
                   std::uint64_t errors) noexcept {
        reviews_.fetch_add(1, std::memory_order_relaxed);
        record(violations, auto_rejections, errors);
    }

    void on_audit(std::uint64_t violations, std::uint64_t auto_rejections,
                  std::uint64_t errors) noexcept {
        audits_.fetch_add(1, std::memory_order_relaxed);
        record(violations, auto_rejections, errors);
    }

    [[nodiscard]] EngineStatsSnapshot snapshot() const noexcept {
        const auto reviews    = reviews_.load(std::memory_order_relaxed);
        const auto audits     = audits_.load(std::memory_order_relaxed);
        const auto violations = violations_.load(std::memory_order_relaxed);

        double rate = 0.0;
        if (reviews + audits > 0) {
            rate = static_cast<double>(violations) / static_cast<double>(reviews + audits);
        }

        return EngineStatsSnapshot{
            .reviews         = reviews,
            .audits          = audits,
            .violations      = violations,
            .auto_rejections = auto_rejections_.load(std::memory_order_relaxed),
            .query_errors    = query_errors_.load(std::memory_order_relaxed),
            .violation_rate  = rate,
            .captured_at     = std::chrono::system_clock::now(),
        };
    }

private:
    void record(std::uint64_t violations, std::uint64_t auto_rejections,
                std::uint64_t errors) noexcept {
        violations_.fetch_add(violations, std::memory_order_relaxed);
        auto_rejections_.fetch_add(auto_rejections, std::memory_order_relaxed);
        query_errors_.fetch_add(errors, std::memory_order_relaxed);
    }

    std::atomic<std::uint64_t> reviews_;
    std::atomic<std::uint64_t> audits_;
    std::atomic<std::uint64_t> violations_;
    std::atomic<std::uint64_t> auto_rejections_;
    std::atomic<std::uint64_t> query_errors_;
};

#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - ConstraintClient / Responses 를 include 하지 않는다.
//   호출자가 필요한 값만 복사해 채운다.
//
// [민감정보 취급 주의]
// - ViolationLog::message 는 드라이버가 만든 위반 메시지 원문이다.
//   객체 내용이 포함될 수 있으므로 운영 환경의 로그 보관 정책을 따를 것.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// TemplateLog
//   템플릿 등록/갱신/삭제 이벤트.
//   event : "template_add" | "template_remove"
//   status: "ok" | "unchanged" | "error"
// ---------------------------------------------------------------------------
struct TemplateLog {
    std::string                           event{};
    std::string                           name{};
    std::string                           kind{};
    std::string                           engine{};
    std::vector<std::string>              targets{};
    std::string                           status{};
    std::string                           error{};    // status == "error" 일 때만
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// ConstraintLog
//   constraint 등록/갱신/삭제 이벤트.
//   event : "constraint_add" | "constraint_remove"
// ---------------------------------------------------------------------------
struct ConstraintLog {
    std::string                           event{};
    std::string                           kind{};
    std::string                           name{};
    std::string                           enforcement_action{};
    std::string                           status{};
    std::string                           error{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// ReviewLog
//   Review / Audit 호출 하나에 대한 요약.
//   mode             : "review" | "audit"
//   enforcement_point: 요청된 enforcement point ("*" 포함)
//   object           : "<kind>/<namespace>/<name>" (audit 이면 빈 문자열)
// ---------------------------------------------------------------------------
struct ReviewLog {
    std::string                           mode{};
    std::string                           enforcement_point{};
    std::string                           object{};
    std::uint32_t                         targets{0};
    std::uint32_t                         results{0};
    std::uint32_t                         errors{0};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};

// ---------------------------------------------------------------------------
// ViolationLog
//   위반 결과 하나. auto_rejected 는 match 실패로 생성된 결과.
// ---------------------------------------------------------------------------
struct ViolationLog {
    std::string                           target{};
    std::string                           constraint_kind{};
    std::string                           constraint_name{};
    std::string                           enforcement_action{};
    std::vector<std::string>              scoped_actions{};
    std::string                           message{};
    bool                                  auto_rejected{false};
    std::chrono::system_clock::time_point timestamp{};
};

#pragma once

// ---------------------------------------------------------------------------
// responses.hpp
//
// Review / Audit / 변경 연산이 돌려주는 결과 타입.
//
// [결정성]
// Response::sort() 는 (constraint Kind, constraint name, msg, target) 순으로
// 안정 정렬한다. 같은 입력에 대한 두 번의 Review 는 같은 순서의 결과를
// 돌려주어야 한다 (webhook 응답 멱등성).
// ---------------------------------------------------------------------------

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "common/types.hpp"

// ---------------------------------------------------------------------------
// Stat / StatsEntry
//   드라이버가 질의 중 수집한 통계 (옵션으로 활성화).
//   scope    : "template" | "constraint" | "query" 등 드라이버 정의 범위
//   stats_for: 통계 대상 식별자 (예: constraint Kind)
// ---------------------------------------------------------------------------
struct Stat {
    std::string name{};
    double      value{0.0};
    std::string source{};  // 통계를 만든 엔진 이름
};

struct StatsEntry {
    std::string       scope{};
    std::string       stats_for{};
    std::vector<Stat> stats{};
};

// ---------------------------------------------------------------------------
// Result
//   constraint 하나에 대한 위반 결과.
//   constraint: 위반된 constraint 의 사본 (호출자 소유).
//   enforcement_action / scoped_enforcement_actions 는 드라이버가 아닌
//   클라이언트가 캐시된 constraint 설정으로부터 채운다.
// ---------------------------------------------------------------------------
struct Result {
    std::string              target{};
    std::string              msg{};
    YAML::Node               metadata{};    // 드라이버가 전달한 details 등
    YAML::Node               constraint{};
    std::string              enforcement_action{};
    std::vector<std::string> scoped_enforcement_actions{};
};

// ---------------------------------------------------------------------------
// Response
//   target 하나에 대한 결과 모음.
// ---------------------------------------------------------------------------
struct Response {
    std::string                target{};
    std::vector<Result>        results{};
    std::optional<std::string> trace{};

    // sort
    //   Kind → name → msg 순 안정 정렬.
    void sort();
};

// ---------------------------------------------------------------------------
// Responses
//   target 이름 → Response.
//   handled: 변경 연산(AddTemplate 등)에서 처리한 target 확인 맵.
// ---------------------------------------------------------------------------
struct Responses {
    std::map<std::string, Response> by_target{};
    std::map<std::string, bool>     handled{};
    std::vector<StatsEntry>         stats_entries{};

    // results
    //   모든 target 의 결과를 target 이름 순으로 이어 붙인다.
    [[nodiscard]] std::vector<Result> results() const;

    // trace_dump
    //   target 별 trace 를 사람이 읽을 수 있는 형태로 합친다.
    [[nodiscard]] std::string trace_dump() const;

    // 결과를 target 별 순서대로 정렬된 canonical 문자열로 직렬화 (로그/비교용).
    [[nodiscard]] std::string to_string() const;
};

// ---------------------------------------------------------------------------
// QueryOutcome
//   부분 실패가 가능한 배치 연산(Review/Audit/AddData/RemoveData) 결과.
//   errors 가 비어 있지 않아도 responses 에는 영향을 받지 않은 target 의
//   결과가 그대로 남아 있다. 부분 성공을 어떻게 다룰지는 호출자가 결정한다.
// ---------------------------------------------------------------------------
struct QueryOutcome {
    Responses responses{};
    ErrorMap  errors{};

    [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
};

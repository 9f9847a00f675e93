#pragma once

// ---------------------------------------------------------------------------
// driver.hpp
//
// 정책 실행 백엔드 인터페이스 (외부 구현체가 제공).
//
// Driver 는 엔진(언어) 하나에 대한 템플릿 컴파일, constraint 저장,
// 참조 데이터 저장, 질의 실행을 담당한다. 클라이언트는 드라이버를 이름으로
// 찾고, 템플릿별로 우선순위가 가장 높은 드라이버를 선택한다.
//
// [계약]
// - add_template / add_constraint: 이미 존재하면 교체한다.
// - remove_template / remove_constraint: 존재하지 않아도 성공이다.
// - 드라이버는 개별적으로 스레드 안전해야 한다. 클라이언트는 구조 변경 시
//   레지스트리 락을 잡은 채로, 질의 시 공유 락을 잡은 채로 호출한다.
// - CallContext 의 취소/deadline 처리는 드라이버 책임이다.
// ---------------------------------------------------------------------------

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "common/responses.hpp"
#include "common/types.hpp"
#include "template/constraint_template.hpp"

// ---------------------------------------------------------------------------
// QueryMode
//   kReview: 단일 review payload 평가
//   kAudit : review 없이 이미 적재된 모든 참조 데이터 평가
// ---------------------------------------------------------------------------
enum class QueryMode : std::uint8_t {
    kReview = 0,
    kAudit  = 1,
};

struct QueryOptions {
    QueryMode mode{QueryMode::kReview};
    bool      tracing{false};
    bool      stats{false};
};

// ---------------------------------------------------------------------------
// QueryResponse
//   results 의 constraint 필드는 질의에 전달된 constraint 를 가리켜야 한다
//   (클라이언트가 Kind/name 으로 집행 설정을 다시 찾는다).
// ---------------------------------------------------------------------------
struct QueryResponse {
    std::vector<Result>        results{};
    std::vector<StatsEntry>    stats{};
    std::optional<std::string> trace{};
};

class Driver {
public:
    virtual ~Driver() = default;

    // name
    //   엔진 이름. TemplateCode::engine 과 비교된다.
    [[nodiscard]] virtual std::string name() const = 0;

    // add_target_library
    //   target handler 의 library() 를 받는다. 클라이언트 생성 시 target 마다
    //   한 번씩 불리며, 실패하면 클라이언트를 만들지 않는다.
    [[nodiscard]] virtual std::expected<void, EngineError>
    add_target_library(const std::string& target, const std::string& library) = 0;

    [[nodiscard]] virtual std::expected<void, EngineError>
    add_template(const CallContext& ctx, const ConstraintTemplate& templ) = 0;

    [[nodiscard]] virtual std::expected<void, EngineError>
    remove_template(const CallContext& ctx, const ConstraintTemplate& templ) = 0;

    [[nodiscard]] virtual std::expected<void, EngineError>
    add_constraint(const CallContext& ctx, const YAML::Node& constraint) = 0;

    [[nodiscard]] virtual std::expected<void, EngineError>
    remove_constraint(const CallContext& ctx, const YAML::Node& constraint) = 0;

    // supports_referential_data
    //   add_data / remove_data 를 지원하면 true.
    //   하나도 없으면 AddData 는 NoReferentialDriver 로 실패한다 (설정에 따라 경고).
    [[nodiscard]] virtual bool supports_referential_data() const { return false; }

    [[nodiscard]] virtual std::expected<void, EngineError>
    add_data(const CallContext& ctx, const std::string& target,
             const std::string& key, const YAML::Node& value) = 0;

    [[nodiscard]] virtual std::expected<void, EngineError>
    remove_data(const CallContext& ctx, const std::string& target, const std::string& key) = 0;

    // query
    //   target 의 constraints 를 review 에 대해 실행한다.
    //   mode == kAudit 이면 review 는 Null 노드다.
    [[nodiscard]] virtual std::expected<QueryResponse, EngineError>
    query(const CallContext&             ctx,
          const std::string&             target,
          const std::vector<YAML::Node>& constraints,
          const YAML::Node&              review,
          const QueryOptions&            opts) = 0;

    // dump
    //   컴파일된 템플릿, constraint, 참조 데이터의 진단용 텍스트.
    [[nodiscard]] virtual std::expected<std::string, EngineError>
    dump(const CallContext& ctx) = 0;
};

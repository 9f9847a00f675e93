#pragma once

// ---------------------------------------------------------------------------
// target_handler.hpp
//
// target 도메인 어댑터 인터페이스 (외부 구현체가 제공).
//
// TargetHandler 는 임의의 입력 객체를 엔진 중립적인 review payload 로
// 변환하고, constraint 의 도메인 의미를 검증하며, constraint 별 Matcher 를
// 만든다. 엔진은 이름(name())으로 handler 를 찾는다.
//
// [스레드 안전성]
// 모든 메서드는 여러 Review 호출에서 동시에 불릴 수 있으므로 구현체는
// 내부 상태 없이 동작하거나 스스로 동기화해야 한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <string>

#include <yaml-cpp/yaml.h>

#include "common/responses.hpp"
#include "common/types.hpp"

// ---------------------------------------------------------------------------
// Matcher
//   constraint 하나의 spec.match 를 컴파일한 결과.
//   match() 실패(unexpected)는 "적용 여부를 알 수 없음" 을 뜻하며,
//   클라이언트는 이를 자동 거부 결과로 바꾼다 (fail-close).
// ---------------------------------------------------------------------------
class Matcher {
public:
    virtual ~Matcher() = default;

    [[nodiscard]] virtual std::expected<bool, EngineError>
    match(const YAML::Node& review) const = 0;
};

// ---------------------------------------------------------------------------
// DataCache
//   target 별 선택적 참조 데이터 캐시.
//   AddData 는 캐시 → 드라이버 순으로 기록하고, 드라이버 실패 시 캐시를
//   되돌린다. RemoveData 는 드라이버 → 캐시 순으로 제거한다.
// ---------------------------------------------------------------------------
class DataCache {
public:
    virtual ~DataCache() = default;

    [[nodiscard]] virtual std::expected<void, EngineError>
    add(const std::string& key, const YAML::Node& value) = 0;

    virtual void remove(const std::string& key) = 0;
};

// ---------------------------------------------------------------------------
// ProcessedData / HandledReview
//   handled == false 이면 해당 target 은 입력을 처리하지 않는다 (건너뜀).
// ---------------------------------------------------------------------------
struct ProcessedData {
    bool        handled{false};
    std::string key{};
    YAML::Node  value{};
};

struct HandledReview {
    bool       handled{false};
    YAML::Node review{};
};

// ---------------------------------------------------------------------------
// TargetHandler
// ---------------------------------------------------------------------------
class TargetHandler {
public:
    virtual ~TargetHandler() = default;

    // name
    //   ^[a-zA-Z][a-zA-Z0-9.]*$ 형식의 고유 이름.
    [[nodiscard]] virtual std::string name() const = 0;

    // match_schema
    //   constraint spec.match 필드의 구조 스키마 (OpenAPI v3 subset).
    [[nodiscard]] virtual YAML::Node match_schema() const = 0;

    // process_data
    //   참조 데이터 객체를 (key, value) 로 변환한다.
    [[nodiscard]] virtual std::expected<ProcessedData, EngineError>
    process_data(const YAML::Node& obj) const = 0;

    // handle_review
    //   입력 객체로부터 review payload 를 만든다.
    [[nodiscard]] virtual std::expected<HandledReview, EngineError>
    handle_review(const YAML::Node& obj) const = 0;

    // handle_violation
    //   드라이버가 돌려준 결과를 후처리한다 (result 를 직접 수정 가능).
    [[nodiscard]] virtual std::expected<void, EngineError>
    handle_violation(Result& result) const = 0;

    // validate_constraint
    //   스키마로 표현할 수 없는 도메인 의미 검증.
    [[nodiscard]] virtual std::expected<void, EngineError>
    validate_constraint(const YAML::Node& constraint) const = 0;

    // to_matcher
    //   constraint 의 spec.match 를 Matcher 로 컴파일한다.
    [[nodiscard]] virtual std::expected<std::shared_ptr<const Matcher>, EngineError>
    to_matcher(const YAML::Node& constraint) const = 0;

    // library
    //   이 target 의 정책 라이브러리 보일러플레이트.
    [[nodiscard]] virtual std::string library() const = 0;

    // cache
    //   선택적 참조 데이터 캐시. 없으면 nullptr (기본값).
    [[nodiscard]] virtual DataCache* cache() const { return nullptr; }
};

#pragma once

// ---------------------------------------------------------------------------
// constraint_template.hpp
//
// 선언적 정책 타입(ConstraintTemplate) 정의.
//
// [불변 조건]
// - name == to_lower(kind)
// - targets 는 정확히 하나 (다중 target 템플릿 미지원)
// - 각 target 은 (engine → source) 코드 쌍을 하나 이상 가진다
//
// 이 구조체 자체는 검증 로직을 포함하지 않는다. 검증은
// ConstraintClient::add_template 가 수행한다.
// ---------------------------------------------------------------------------

#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

// ---------------------------------------------------------------------------
// TemplateCode
//   엔진 하나에 대한 정책 소스 코드.
//   engine: 드라이버 이름과 일치해야 해당 드라이버로 라우팅된다 (예: "rego").
// ---------------------------------------------------------------------------
struct TemplateCode {
    std::string engine{};
    std::string source{};
};

// ---------------------------------------------------------------------------
// TemplateTarget
//   템플릿이 적용되는 target 도메인과 그 target 용 코드 목록.
//   libs: 소스와 함께 컴파일될 보조 라이브러리 모듈 (엔진 해석은 드라이버 몫).
// ---------------------------------------------------------------------------
struct TemplateTarget {
    std::string               target{};
    std::vector<TemplateCode> code{};
    std::vector<std::string>  libs{};
};

// ---------------------------------------------------------------------------
// ConstraintTemplate
//   parameters_schema: constraint 의 spec.parameters 에 대한 OpenAPI v3 스키마.
//                      정의되지 않았으면 파라미터는 자유 형식으로 취급한다.
// ---------------------------------------------------------------------------
struct ConstraintTemplate {
    std::string                 name{};
    std::string                 kind{};
    YAML::Node                  parameters_schema{};
    std::vector<TemplateTarget> targets{};

    // deep_copy
    //   parameters_schema 까지 복제한 독립 사본.
    [[nodiscard]] ConstraintTemplate deep_copy() const;

    // target_names
    //   선언된 target 이름 목록 (선언 순서).
    [[nodiscard]] std::vector<std::string> target_names() const;

    // engines
    //   선언된 모든 엔진 이름 (중복 제거, 선언 순서).
    [[nodiscard]] std::vector<std::string> engines() const;

    // code_for
    //   target/engine 조합의 코드. 없으면 nullptr.
    [[nodiscard]] const TemplateCode* code_for(const std::string& target,
                                               const std::string& engine) const;
};

// semantic_equal
//   이름, Kind, target/코드, 파라미터 스키마가 모두 같으면 true.
//   코드 목록 순서는 의미가 있으므로 순서까지 비교한다.
[[nodiscard]] bool semantic_equal(const ConstraintTemplate& a, const ConstraintTemplate& b);

// same_target_set
//   두 target 이름 목록이 순서 무관하게 같은 집합이면 true.
[[nodiscard]] bool same_target_set(std::vector<std::string> a, std::vector<std::string> b);

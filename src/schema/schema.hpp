#pragma once

// ---------------------------------------------------------------------------
// schema.hpp
//
// 템플릿 + target handler 로부터 constraint 의 구조 스키마를 생성하고,
// 스키마 자체와 constraint 인스턴스를 검증한다.
//
// [생성 규칙]
//   object
//   ├─ metadata : object { name: string }
//   ├─ spec     : object
//   │   ├─ match                    : handler.match_schema()
//   │   ├─ parameters               : template.parameters_schema
//   │   │                             (없으면 preserve-unknown object)
//   │   ├─ enforcementAction        : string
//   │   └─ scopedEnforcementActions : array<object{action, enforcementPoints[]}>
//   └─ status   : preserve-unknown object
//
// [지원하는 OpenAPI v3 subset]
// type(object/array/string/integer/number/boolean), properties, items,
// additionalProperties(bool|schema), required, enum, default,
// x-kubernetes-preserve-unknown-fields, x-kubernetes-int-or-string.
// 그 외 키워드(pattern, minimum 등)는 무시한다 (알려진 한계).
//
// [순수 함수]
// 모든 메서드는 상태가 없으며 동시 호출에 안전하다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "common/types.hpp"
#include "handler/target_handler.hpp"
#include "template/constraint_template.hpp"

// constraint 리소스의 고정 API 그룹.
inline constexpr std::string_view kConstraintsGroup = "constraints.gatekeeper.sh";

// constraint 리소스가 지원하는 버전. 첫 번째가 저장 버전.
inline const std::vector<std::string> kConstraintVersions = {"v1beta1", "v1alpha1"};

// ---------------------------------------------------------------------------
// GeneratedSchema
//   템플릿이 정의하는 constraint 리소스 타입의 스키마.
//   템플릿이 갱신될 때마다 다시 생성된다.
// ---------------------------------------------------------------------------
struct GeneratedSchema {
    std::string              kind{};
    std::string              list_kind{};
    std::string              plural{};
    std::string              group{};
    std::vector<std::string> versions{};
    std::string              scope{"Cluster"};
    YAML::Node               open_api_schema{};

    [[nodiscard]] GeneratedSchema deep_copy() const;
};

// ---------------------------------------------------------------------------
// SchemaGenerator
// ---------------------------------------------------------------------------
class SchemaGenerator {
public:
    // generate
    //   같은 (templ, target) 입력에 대해 항상 같은 스키마를 만든다.
    [[nodiscard]] static GeneratedSchema
    generate(const ConstraintTemplate& templ, const TargetHandler& target);
};

// ---------------------------------------------------------------------------
// SchemaValidator
// ---------------------------------------------------------------------------
class SchemaValidator {
public:
    // validate_structural
    //   생성된 스키마의 자기 검증. 실패 시 kInvalidConstraintTemplate.
    //   - Kind: ^[A-Za-z][A-Za-z0-9]*$, plural 은 DNS-1035 label
    //   - 모든 스키마 노드는 맵, type 은 지원 목록 중 하나
    //   - properties 는 object, items 는 array 에만 허용
    //   - properties 와 additionalProperties 동시 사용 금지
    //   - default 값은 해당 노드 스키마를 만족해야 한다
    [[nodiscard]] static std::expected<void, EngineError>
    validate_structural(const GeneratedSchema& schema);

    // validate_instance
    //   constraint 인스턴스 검증. 실패 시 kInvalidConstraint.
    //   이름(DNS-1123 subdomain), Kind 정확 일치, 그룹, 버전 검사 후
    //   가장 비용이 큰 스키마 검사를 마지막에 수행한다.
    [[nodiscard]] static std::expected<void, EngineError>
    validate_instance(const GeneratedSchema& schema, const YAML::Node& instance);

    // validate_value
    //   임의의 값을 스키마 노드에 대해 검사한다. 위반 목록을 돌려준다 (비어 있으면 통과).
    [[nodiscard]] static std::vector<std::string>
    validate_value(const YAML::Node& schema, const YAML::Node& value, const std::string& path);

    // apply_defaults
    //   스키마의 default 를 인스턴스에 채운다 (부모 객체가 존재하는 곳만).
    //   instance 를 직접 수정하므로 호출자는 사본을 넘겨야 한다.
    static void apply_defaults(const GeneratedSchema& schema, YAML::Node& instance);
};

#pragma once

// ---------------------------------------------------------------------------
// unstructured.hpp
//
// YAML::Node 를 "스키마 없는 객체" 로 다루기 위한 헬퍼 모음.
// constraint, review 입력, 참조 데이터는 모두 역직렬화된 YAML::Node 트리로
// 엔진에 전달된다.
//
// [YAML::Node 주의사항]
// - YAML::Node 는 참조 의미론이다. 복사해도 같은 트리를 가리킨다.
//   엔진 내부 캐시와 외부 호출자 사이에는 반드시 deep_copy() 를 사용한다.
// - non-const operator[] 는 없는 키를 생성한다. 조회는 항상 find_path()
//   또는 const 참조를 통해 수행한다.
// - 스칼라 노드에 operator[] 를 적용하면 예외가 발생한다. find_path() 는
//   각 단계에서 IsMap() 을 확인한다.
// ---------------------------------------------------------------------------

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

namespace unstructured {

// deep_copy
//   노드 전체를 복제한다. 정의되지 않은 노드는 빈(Null) 노드로 돌려준다.
[[nodiscard]] YAML::Node deep_copy(const YAML::Node& node);

// find_path
//   중첩 맵을 따라 내려가며 값을 찾는다. 중간 노드가 맵이 아니거나
//   키가 없으면 std::nullopt.
[[nodiscard]] std::optional<YAML::Node>
find_path(const YAML::Node& node, std::initializer_list<std::string_view> path);

// nested_string
//   스칼라 문자열을 찾는다. 값이 없거나 스칼라가 아니면 std::nullopt.
[[nodiscard]] std::optional<std::string>
nested_string(const YAML::Node& node, std::initializer_list<std::string_view> path);

// metadata.name / kind / apiVersion 접근자.
// 값이 없으면 빈 문자열.
[[nodiscard]] std::string get_name(const YAML::Node& obj);
[[nodiscard]] std::string get_namespace(const YAML::Node& obj);
[[nodiscard]] std::string get_kind(const YAML::Node& obj);
[[nodiscard]] std::string get_api_version(const YAML::Node& obj);

// apiVersion "group/version" 분해. core 그룹("v1")은 group 이 빈 문자열.
[[nodiscard]] std::string get_group(const YAML::Node& obj);
[[nodiscard]] std::string get_version(const YAML::Node& obj);

// semantic_equal
//   두 트리가 의미상 같은지 비교한다.
//   - 맵: 키 순서 무관, 키 집합과 각 값이 같아야 한다.
//   - 시퀀스: 순서 포함 비교.
//   - 스칼라: 문자열 표현 비교.
//   - 정의되지 않은 노드와 Null 노드는 같은 것으로 본다.
[[nodiscard]] bool semantic_equal(const YAML::Node& a, const YAML::Node& b);

// canonical_string
//   맵 키를 정렬한 compact JSON 형태의 문자열.
//   같은 의미의 트리는 항상 같은 문자열을 만든다 (결과 정렬/로그/덤프용).
[[nodiscard]] std::string canonical_string(const YAML::Node& node);

// to_lower: ASCII 소문자 변환.
[[nodiscard]] std::string to_lower(std::string_view s);

}  // namespace unstructured

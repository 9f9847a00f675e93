#pragma once

// ---------------------------------------------------------------------------
// k8s_validation_target.hpp
//
// Kubernetes admission 검증 target ("admission.k8s.gatekeeper.sh").
//
// [review payload 형식]
//   kind      : { group, version, kind }
//   name      : 객체 이름
//   namespace : 객체 namespace (cluster 범위 객체는 빈 문자열)
//   operation : admission 요청의 operation (원시 객체 입력이면 생략)
//   object    : 평가 대상 객체
//   oldObject : 갱신/삭제 요청의 이전 객체 (있을 때만)
//   _unstable : { namespace: <소속 Namespace 객체> } (호출자가 준 경우만)
//
// [입력 판별]
// - kind 가 맵이면 admission 요청으로, 스칼라면 원시 객체로 취급한다.
// - kind 없이 { object, namespace } 형태면 원시 객체 + 소속 Namespace 로 보고
//   namespace 를 _unstable.namespace 로 옮긴다. admission 요청은
//   _unstable.namespace 를 직접 실어 보낸다.
// - 그 외 맵이 아니거나 kind 가 없는 입력은 처리하지 않는다 (handled=false).
// - kind 는 있으나 apiVersion 이 없는 원시 객체는 kTargetError.
//
// [참조 데이터 키]
//   cluster/<group%2Fversion>/<kind>/<name>
//   namespace/<ns>/<group%2Fversion>/<kind>/<name>
// ---------------------------------------------------------------------------

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "handler/target_handler.hpp"

inline constexpr std::string_view kK8sValidationTargetName = "admission.k8s.gatekeeper.sh";

// ---------------------------------------------------------------------------
// LabelSelector
//   matchLabels 와 matchExpressions 는 모두 AND 로 결합된다.
//   operator: In | NotIn | Exists | DoesNotExist
// ---------------------------------------------------------------------------
struct LabelRequirement {
    std::string              key{};
    std::string              op{};
    std::vector<std::string> values{};
};

struct LabelSelector {
    std::map<std::string, std::string> match_labels{};
    std::vector<LabelRequirement>      match_expressions{};

    [[nodiscard]] bool matches(const std::map<std::string, std::string>& labels) const;
};

struct KindSelector {
    std::vector<std::string> api_groups{};
    std::vector<std::string> kinds{};
};

// ---------------------------------------------------------------------------
// K8sMatcher
//   constraint spec.match 를 컴파일한 결과.
//   - namespaces / excludedNamespaces 는 cluster 범위 객체에 적용되지 않는다.
//     Namespace 객체는 자기 이름을 namespace 로 본다.
//   - 이름/namespace 패턴은 접두(kube-*) 또는 접미(*-system) glob 을 지원한다.
//   - namespace_selector 는 Namespace 객체면 자기 label 에, namespaced 객체면
//     review 의 _unstable.namespace label 에 적용한다. 후자가 없으면 match
//     오류이다. 그 외 cluster 범위 객체는 통과한다.
// ---------------------------------------------------------------------------
class K8sMatcher final : public Matcher {
public:
    std::vector<KindSelector>    kinds{};
    std::vector<std::string>     namespaces{};
    std::vector<std::string>     excluded_namespaces{};
    std::optional<LabelSelector> label_selector{};
    std::optional<LabelSelector> namespace_selector{};
    std::optional<std::string>   name{};
    std::string                  scope{"*"};

    [[nodiscard]] std::expected<bool, EngineError>
    match(const YAML::Node& review) const override;
};

// ---------------------------------------------------------------------------
// K8sValidationTarget
//   상태가 없으므로 여러 클라이언트/스레드에서 공유해도 안전하다.
// ---------------------------------------------------------------------------
class K8sValidationTarget final : public TargetHandler {
public:
    [[nodiscard]] std::string name() const override;
    [[nodiscard]] YAML::Node  match_schema() const override;

    [[nodiscard]] std::expected<ProcessedData, EngineError>
    process_data(const YAML::Node& obj) const override;

    [[nodiscard]] std::expected<HandledReview, EngineError>
    handle_review(const YAML::Node& obj) const override;

    // handle_violation
    //   metadata 에 details 맵이 항상 존재하도록 정규화한다.
    [[nodiscard]] std::expected<void, EngineError>
    handle_violation(Result& result) const override;

    // validate_constraint
    //   labelSelector 연산자/값 조합과 namespace/name glob 형식을 검사한다.
    [[nodiscard]] std::expected<void, EngineError>
    validate_constraint(const YAML::Node& constraint) const override;

    [[nodiscard]] std::expected<std::shared_ptr<const Matcher>, EngineError>
    to_matcher(const YAML::Node& constraint) const override;

    [[nodiscard]] std::string library() const override;

private:
    [[nodiscard]] std::expected<HandledReview, EngineError>
    handle_augmented(const YAML::Node& obj) const;
};

// glob_match
//   "kube-*" (접두), "*-system" (접미), 그 외는 정확히 일치.
[[nodiscard]] bool glob_match(const std::string& pattern, const std::string& value);

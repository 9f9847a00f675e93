#pragma once

// ---------------------------------------------------------------------------
// template_entry.hpp
//
// 템플릿 레지스트리 항목과 constraint 저장소.
//
// [소유 관계]
//   ConstraintClient
//   └─ templates_ : name → TemplateEntry
//        ├─ templ / schema / handler / engine
//        ├─ active_drivers : 템플릿을 가진 드라이버 이름 (보통 하나)
//        └─ constraints    : name → ConstraintEntry
//
// [동기화]
// 이 파일의 타입은 자체 락을 갖지 않는다. ConstraintClient 의 레지스트리
// 락(std::shared_mutex) 아래에서만 접근한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "common/types.hpp"
#include "handler/target_handler.hpp"
#include "schema/schema.hpp"
#include "template/constraint_template.hpp"

// Review/Audit 의 enforcement point 필터 기본값. 모든 point 를 뜻한다.
inline constexpr std::string_view kAllEnforcementPoints = "*";

inline constexpr std::string_view kDefaultEnforcementAction = "deny";
inline constexpr std::string_view kScopedEnforcementAction  = "scoped";

// ---------------------------------------------------------------------------
// ConstraintEntry
//   constraint: status 를 제거하고 파라미터 기본값을 채운 사본.
//   scoped_actions: enforcement point → action 목록.
//                   enforcementAction 이 "scoped" 일 때만 채워진다.
//                   "*" 는 생성 시 설정된 point 전체로 펼쳐져 있다.
// ---------------------------------------------------------------------------
struct ConstraintEntry {
    YAML::Node                                            constraint{};
    std::string                                           enforcement_action{};
    std::map<std::string, std::vector<std::string>>       scoped_actions{};
    std::map<std::string, std::shared_ptr<const Matcher>> matchers{};

    [[nodiscard]] bool is_scoped() const;

    // actions_for
    //   enforcement point 에 대한 참여 여부와 scoped action 목록.
    //   - scoped 가 아니면 항상 참여하며 목록은 비어 있다.
    //   - ep == "*" 이면 모든 point 의 action 합집합 (비어 있으면 불참).
    //   - 그 외에는 해당 point 의 action (없으면 불참 = std::nullopt).
    [[nodiscard]] std::optional<std::vector<std::string>>
    actions_for(const std::string& enforcement_point) const;
};

// ---------------------------------------------------------------------------
// TemplateEntry
// ---------------------------------------------------------------------------
struct TemplateEntry {
    ConstraintTemplate                     templ{};
    GeneratedSchema                        schema{};
    std::shared_ptr<TargetHandler>         handler{};
    std::string                            engine{};
    std::vector<std::string>               active_drivers{};
    bool                                   needs_replay{false};
    std::map<std::string, ConstraintEntry> constraints{};

    // 이미 있으면 아무 일도 하지 않는다.
    void add_active_driver(const std::string& name);
    void remove_active_driver(const std::string& name);
    [[nodiscard]] bool has_active_driver(const std::string& name) const;

    [[nodiscard]] const std::string& target() const;
};

// build_enforcement
//   constraint 의 enforcementAction / scopedEnforcementActions 를 해석해
//   entry 의 집행 설정을 채운다. "scoped" 인데 scopedEnforcementActions 가
//   없거나 형식이 잘못되면 kInvalidConstraint.
[[nodiscard]] std::expected<void, EngineError>
build_enforcement(const YAML::Node&               constraint,
                  const std::vector<std::string>& enforcement_points,
                  ConstraintEntry&                entry);

#pragma once

// ---------------------------------------------------------------------------
// client.hpp
//
// ConstraintClient: 템플릿/constraint 레지스트리와 Review/Audit 질의 엔진.
//
// [동기화]
// - 구조 변경(add/remove template, add/remove constraint, reset):
//   레지스트리 배타 락을 드라이버 호출 동안에도 유지한다.
// - 조회(review, audit, get_*, validate_constraint, create_schema, dump):
//   공유 락.
// - 참조 데이터(add_data / remove_data): 레지스트리 락을 잡지 않는다.
//   드라이버/target 목록은 생성 후 불변이다.
// - 호출자는 구조 변경을 직렬화해야 한다 (coarse lock 외의 보장 없음).
//
// [오류 모델]
// - 구조 검증 실패는 호출 전체를 std::unexpected(EngineError) 로 실패시킨다.
// - Review/Audit/AddData/RemoveData 의 target 단위 실패는 QueryOutcome::errors
//   에 격리되고, 나머지 target 의 결과는 그대로 반환된다.
// - 재시도하지 않는다. 실패한 변경은 롤백하지 않으며, 다음 성공한 갱신이
//   남은 드라이버 항목을 정리한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "client/template_entry.hpp"
#include "common/responses.hpp"
#include "common/types.hpp"
#include "config/engine_config.hpp"
#include "driver/driver.hpp"
#include "handler/target_handler.hpp"
#include "logger/structured_logger.hpp"
#include "schema/schema.hpp"
#include "stats/engine_stats.hpp"
#include "template/constraint_template.hpp"

// ---------------------------------------------------------------------------
// ClientOptions
//   drivers: 우선순위 순서 (앞쪽이 높다). 이름은 고유해야 한다.
//   targets: 이름은 ^[a-zA-Z][a-zA-Z0-9.]*$ 형식이며 고유해야 한다.
//   logger / stats: 선택. 없으면 spdlog 진단 로그만 남긴다.
// ---------------------------------------------------------------------------
struct ClientOptions {
    std::vector<std::shared_ptr<TargetHandler>> targets{};
    std::vector<std::shared_ptr<Driver>>        drivers{};
    std::vector<std::string>                    enforcement_points{"audit", "webhook"};
    bool                                        ignore_no_referential_driver{false};
    std::shared_ptr<StructuredLogger>           logger{};
    std::shared_ptr<EngineStats>                stats{};

    // from_config
    //   drivers 를 config.engine.driver_priority 순으로 정렬한다.
    //   목록에 없는 드라이버는 전달된 순서대로 뒤에 붙는다.
    [[nodiscard]] static ClientOptions
    from_config(const EngineConfig&                         config,
                std::vector<std::shared_ptr<TargetHandler>> targets,
                std::vector<std::shared_ptr<Driver>>        drivers);
};

// ---------------------------------------------------------------------------
// ReviewOptions
//   enforcement_point: "*" 이면 모든 point. 특정 point 를 주면 그 point 에
//                      scoped action 이 없는 scoped constraint 는 제외된다.
// ---------------------------------------------------------------------------
struct ReviewOptions {
    std::string enforcement_point{kAllEnforcementPoints};
    bool        tracing{false};
    bool        stats{false};
};

class ConstraintClient {
public:
    // create
    //   옵션을 검증하고 클라이언트를 만든다. 실패 시 kInvalidConfig.
    //   각 target 의 library() 를 모든 드라이버에 전달한다. 드라이버가 거부하면
    //   그 드라이버 오류를 그대로 돌려준다.
    [[nodiscard]] static std::expected<std::unique_ptr<ConstraintClient>, EngineError>
    create(ClientOptions options);

    ~ConstraintClient() = default;

    // 복사/이동 금지 (shared_mutex 소유)
    ConstraintClient(const ConstraintClient&)            = delete;
    ConstraintClient& operator=(const ConstraintClient&) = delete;
    ConstraintClient(ConstraintClient&&)                 = delete;
    ConstraintClient& operator=(ConstraintClient&&)      = delete;

    // -----------------------------------------------------------------------
    // 템플릿
    // -----------------------------------------------------------------------

    // add_template
    //   검증 → 스키마 생성/검증 → 드라이버 선택 후, 캐시된 템플릿과 의미상
    //   다를 때만 드라이버에 반영한다. 엔진이 바뀌면 새 드라이버에 모든
    //   constraint 를 다시 적재한 뒤 이전 드라이버에서 제거한다.
    [[nodiscard]] std::expected<Responses, EngineError>
    add_template(const CallContext& ctx, const ConstraintTemplate& templ);

    // remove_template
    //   모든 active 드라이버에서 constraint 를 하나씩 제거한 뒤 템플릿을
    //   제거한다. 알 수 없는 템플릿이면 빈 응답.
    [[nodiscard]] std::expected<Responses, EngineError>
    remove_template(const CallContext& ctx, const ConstraintTemplate& templ);

    [[nodiscard]] std::expected<ConstraintTemplate, EngineError>
    get_template(const ConstraintTemplate& templ) const;

    // create_schema
    //   템플릿을 검증하고 생성된 스키마를 돌려준다. 레지스트리는 바꾸지 않는다.
    [[nodiscard]] std::expected<GeneratedSchema, EngineError>
    create_schema(const ConstraintTemplate& templ) const;

    // -----------------------------------------------------------------------
    // constraint
    // -----------------------------------------------------------------------
    [[nodiscard]] std::expected<Responses, EngineError>
    add_constraint(const CallContext& ctx, const YAML::Node& constraint);

    [[nodiscard]] std::expected<Responses, EngineError>
    remove_constraint(const CallContext& ctx, const YAML::Node& constraint);

    [[nodiscard]] std::expected<YAML::Node, EngineError>
    get_constraint(const YAML::Node& constraint) const;

    // validate_constraint
    //   add_constraint 와 같은 검증을 수행하되 아무것도 저장하지 않는다.
    [[nodiscard]] std::expected<void, EngineError>
    validate_constraint(const YAML::Node& constraint) const;

    // -----------------------------------------------------------------------
    // 참조 데이터
    // -----------------------------------------------------------------------
    [[nodiscard]] std::expected<QueryOutcome, EngineError>
    add_data(const CallContext& ctx, const YAML::Node& data);

    [[nodiscard]] std::expected<QueryOutcome, EngineError>
    remove_data(const CallContext& ctx, const YAML::Node& data);

    // -----------------------------------------------------------------------
    // 질의
    // -----------------------------------------------------------------------
    [[nodiscard]] QueryOutcome
    review(const CallContext& ctx, const YAML::Node& obj, const ReviewOptions& opts = {}) const;

    [[nodiscard]] QueryOutcome
    audit(const CallContext& ctx, const ReviewOptions& opts = {}) const;

    // -----------------------------------------------------------------------
    // 관리
    // -----------------------------------------------------------------------

    // reset
    //   모든 템플릿/constraint 를 모든 active 드라이버에서 제거하고
    //   레지스트리를 비운다.
    [[nodiscard]] std::expected<void, EngineError> reset(const CallContext& ctx);

    // dump
    //   드라이버 우선순위 순서로 Driver::dump 출력을 이어 붙인다.
    [[nodiscard]] std::expected<std::string, EngineError> dump(const CallContext& ctx) const;

    [[nodiscard]] const std::vector<std::string>& enforcement_points() const noexcept {
        return enforcement_points_;
    }

private:
    explicit ConstraintClient(ClientOptions options);

    // 템플릿 메타데이터 검증. 성공 시 target handler.
    [[nodiscard]] std::expected<std::shared_ptr<TargetHandler>, EngineError>
    validate_template(const ConstraintTemplate& templ) const;

    // 템플릿이 선언한 엔진 중 우선순위가 가장 높은 드라이버.
    [[nodiscard]] std::expected<std::shared_ptr<Driver>, EngineError>
    select_driver(const ConstraintTemplate& templ) const;

    [[nodiscard]] std::shared_ptr<Driver> driver_by_name(const std::string& name) const;

    // constraint 를 사본으로 정규화하고 (status 제거, 기본값 적용) 검증한 뒤
    // 집행 설정과 matcher 를 만든다. 레지스트리 락 안에서 호출한다.
    [[nodiscard]] std::expected<ConstraintEntry, EngineError>
    prepare_constraint(const TemplateEntry& entry, const YAML::Node& constraint) const;

    // 템플릿의 constraint 를 모두 제거한 뒤 템플릿을 제거한다.
    // 성공하면 driver 는 active 집합에서 빠진다.
    [[nodiscard]] std::expected<void, EngineError>
    purge_driver(const CallContext& ctx, TemplateEntry& entry, const std::string& driver_name);

    // Review/Audit 공통 경로. 레지스트리 공유 락 안에서 호출한다.
    void query_target(const CallContext&   ctx,
                      const std::string&   target_name,
                      const TargetHandler& handler,
                      const YAML::Node&    review,
                      QueryMode            mode,
                      const ReviewOptions& opts,
                      QueryOutcome&        outcome,
                      std::uint64_t&       auto_rejections) const;

    void record_query(QueryMode mode, const std::string& enforcement_point,
                      const std::string& object, const QueryOutcome& outcome,
                      std::uint64_t auto_rejections,
                      std::chrono::steady_clock::time_point started) const;

    std::vector<std::shared_ptr<Driver>>                  drivers_;
    std::map<std::string, std::shared_ptr<TargetHandler>> targets_;
    std::vector<std::string>                              enforcement_points_;
    bool                                                  ignore_no_referential_driver_;
    std::shared_ptr<StructuredLogger>                     logger_;
    std::shared_ptr<EngineStats>                          stats_;

    mutable std::shared_mutex                             mutex_;
    std::map<std::string, TemplateEntry>                  templates_;
};

#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 엔진 설정 파일과 ConstraintTemplate 매니페스트 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 부분적으로
//   파싱된 설정을 반환하지 않는다 (all-or-nothing).
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 않는다.
//
// [의존 방향]
// config_loader.hpp → engine_config.hpp, constraint_template.hpp (단방향만)
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include <yaml-cpp/yaml.h>

#include "config/engine_config.hpp"
#include "logger/log_types.hpp"
#include "template/constraint_template.hpp"

class ConfigLoader {
public:
    ConfigLoader()  = default;
    ~ConfigLoader() = default;

    ConfigLoader(const ConfigLoader&)            = default;
    ConfigLoader& operator=(const ConfigLoader&) = default;
    ConfigLoader(ConfigLoader&&)                 = default;
    ConfigLoader& operator=(ConfigLoader&&)      = default;

    // load
    //   지정된 경로의 YAML 파일을 읽어 EngineConfig 로 파싱한다.
    //   파일 없음, 파싱 오류, 검증 실패 모두 실패로 처리한다.
    //
    //   [검증]
    //   - engine.driver_priority: 비어 있지 않고, 빈 이름/중복 없음
    //   - engine.enforcement_points: 비어 있지 않고, 소문자, 중복 없음,
    //     "*" 는 설정할 수 없다
    //   - global.log_level: 알려진 레벨 이름
    [[nodiscard]] static std::expected<EngineConfig, std::string>
    load(const std::filesystem::path& config_path);

    // parse
    //   이미 읽은 YAML 루트 노드로부터 설정을 만든다 (load 의 본체).
    [[nodiscard]] static std::expected<EngineConfig, std::string>
    parse(const YAML::Node& root);

    // load_template
    //   ConstraintTemplate 매니페스트를 ConstraintTemplate 값으로 변환한다.
    //
    //   metadata.name                                   → name
    //   spec.crd.spec.names.kind                        → kind
    //   spec.crd.spec.validation.openAPIV3Schema        → parameters_schema
    //   spec.targets[].target                           → TemplateTarget::target
    //   spec.targets[].rego / spec.targets[].libs       → engine "rego" 코드
    //   spec.targets[].code[].{engine, source}          → 그 외 엔진 코드
    //
    //   code[].source 가 맵이면 canonical 문자열로 보관한다.
    //   여기서는 형태만 검사하며, 의미 검증은 ConstraintClient::add_template 가 한다.
    [[nodiscard]] static std::expected<ConstraintTemplate, std::string>
    load_template(const YAML::Node& manifest);

    // to_log_level
    //   "trace"/"debug" → kDebug, "info" → kInfo, "warn" → kWarn,
    //   "error"/"critical" → kError. 알 수 없는 이름은 kInfo.
    [[nodiscard]] static LogLevel to_log_level(const std::string& name) noexcept;
};

#pragma once

// ---------------------------------------------------------------------------
// engine_config.hpp
//
// 엔진 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/ctgate.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. 파일에 없는 키는 기본값을 쓴다.
// ---------------------------------------------------------------------------

#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level : "trace"|"debug"|"info"|"warn"|"error"|"critical"
//   log_format: "json" | "text"
//   log_path  : 구조화 로그 파일 경로 (비어 있으면 구조화 로그 비활성)
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_format{"json"};
    std::string log_path{};
};

// ---------------------------------------------------------------------------
// EngineSettings
//   driver_priority   : 엔진 이름 우선순위. 앞쪽이 높다.
//                       템플릿이 여러 엔진 코드를 가지면 가장 앞선 엔진을 쓴다.
//   enforcement_points: 설정된 enforcement point 목록.
//                       scopedEnforcementActions 의 "*" 는 이 목록 전체로 펼쳐진다.
//   ignore_no_referential_driver:
//                       참조 데이터를 받을 드라이버가 없을 때 오류 대신 경고.
// ---------------------------------------------------------------------------
struct EngineSettings {
    std::vector<std::string> driver_priority{"rego"};
    std::vector<std::string> enforcement_points{"audit", "webhook"};
    bool                     ignore_no_referential_driver{false};
};

// ---------------------------------------------------------------------------
// EngineConfig
//   ConfigLoader::load 가 반환하는 최종 결과물.
// ---------------------------------------------------------------------------
struct EngineConfig {
    GlobalConfig   global{};
    EngineSettings engine{};
};

// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 엔진 설정 파일을 로드하여 EngineConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱/검증 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 기본값(구조체 기본값)을 적용한다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [알려진 한계]
// - log_format 은 값만 보관한다. 구조화 로그는 항상 JSON 한 줄로 기록된다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <algorithm>
#include <array>
#include <set>
#include <string>

#include <spdlog/spdlog.h>

#include "common/unstructured.hpp"

namespace {

constexpr std::array<std::string_view, 6> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical"
};

// 레거시 spec.targets[].rego 필드가 매핑되는 엔진 이름.
constexpr std::string_view kLegacyRegoEngine = "rego";

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: GlobalConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] GlobalConfig parse_global(const YAML::Node& global_node) {
    GlobalConfig cfg{};
    if (!global_node || !global_node.IsMap()) {
        return cfg;
    }

    cfg.log_level  = read_string(global_node["log_level"],  cfg.log_level);
    cfg.log_format = read_string(global_node["log_format"], cfg.log_format);
    cfg.log_path   = read_string(global_node["log_path"],   cfg.log_path);
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: EngineSettings 파싱
//   driver_priority / enforcement_points 키가 있으면 목록 전체를 교체한다.
// ---------------------------------------------------------------------------
[[nodiscard]] EngineSettings parse_engine(const YAML::Node& engine_node) {
    EngineSettings cfg{};
    if (!engine_node || !engine_node.IsMap()) {
        return cfg;
    }

    if (engine_node["driver_priority"]) {
        cfg.driver_priority = read_string_sequence(engine_node["driver_priority"]);
    }
    if (engine_node["enforcement_points"]) {
        cfg.enforcement_points = read_string_sequence(engine_node["enforcement_points"]);
    }
    cfg.ignore_no_referential_driver =
        read_bool(engine_node["ignore_no_referential_driver"], cfg.ignore_no_referential_driver);
    return cfg;
}

[[nodiscard]] std::expected<void, std::string> validate(const EngineConfig& cfg) {
    if (std::find(kLogLevels.begin(), kLogLevels.end(), cfg.global.log_level) == kLogLevels.end()) {
        return std::unexpected(fmt::format(
            "config_loader: global.log_level '{}' is not a known level", cfg.global.log_level));
    }

    if (cfg.engine.driver_priority.empty()) {
        return std::unexpected(
            std::string("config_loader: engine.driver_priority must name at least one driver"));
    }
    std::set<std::string> seen;
    for (const auto& name : cfg.engine.driver_priority) {
        if (name.empty()) {
            return std::unexpected(
                std::string("config_loader: engine.driver_priority contains an empty name"));
        }
        if (!seen.insert(name).second) {
            return std::unexpected(fmt::format(
                "config_loader: engine.driver_priority lists '{}' more than once", name));
        }
    }

    if (cfg.engine.enforcement_points.empty()) {
        return std::unexpected(std::string(
            "config_loader: engine.enforcement_points must name at least one enforcement point"));
    }
    seen.clear();
    for (const auto& ep : cfg.engine.enforcement_points) {
        if (ep.empty() || ep == "*") {
            return std::unexpected(fmt::format(
                "config_loader: engine.enforcement_points entry '{}' is not a valid name", ep));
        }
        if (unstructured::to_lower(ep) != ep) {
            return std::unexpected(fmt::format(
                "config_loader: engine.enforcement_points entry '{}' must be lowercase", ep));
        }
        if (!seen.insert(ep).second) {
            return std::unexpected(fmt::format(
                "config_loader: engine.enforcement_points lists '{}' more than once", ep));
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 템플릿 target 하나 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<TemplateTarget, std::string>
parse_template_target(const YAML::Node& node, std::size_t index) {
    if (!node.IsMap()) {
        return std::unexpected(fmt::format("config_loader: spec.targets[{}] is not a map", index));
    }

    TemplateTarget target{};
    target.target = read_string(node["target"], "");
    target.libs   = read_string_sequence(node["libs"]);

    const std::string rego = read_string(node["rego"], "");
    if (!rego.empty()) {
        target.code.push_back(TemplateCode{
            .engine = std::string(kLegacyRegoEngine),
            .source = rego,
        });
    }

    const YAML::Node code = node["code"];
    if (code && !code.IsNull()) {
        if (!code.IsSequence()) {
            return std::unexpected(
                fmt::format("config_loader: spec.targets[{}].code is not a list", index));
        }
        for (std::size_t i = 0; i < code.size(); ++i) {
            const YAML::Node entry = code[i];
            if (!entry.IsMap()) {
                return std::unexpected(fmt::format(
                    "config_loader: spec.targets[{}].code[{}] is not a map", index, i));
            }
            TemplateCode tc{};
            tc.engine = read_string(entry["engine"], "");

            const YAML::Node source = entry["source"];
            if (source && source.IsScalar()) {
                tc.source = source.Scalar();
            } else if (source && source.IsMap() && source["rego"] && source["rego"].IsScalar()) {
                // {rego, libs} 형태의 소스는 libs 를 target 에 합친다.
                tc.source = source["rego"].Scalar();
                for (auto& lib : read_string_sequence(source["libs"])) {
                    target.libs.push_back(std::move(lib));
                }
            } else if (source && !source.IsNull()) {
                tc.source = unstructured::canonical_string(source);
            }
            target.code.push_back(std::move(tc));
        }
    }
    return target;
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<EngineConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading engine config from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    auto cfg = parse(root);
    if (!cfg) {
        spdlog::error("{}", cfg.error());
        return cfg;
    }

    spdlog::info(
        "config_loader: engine config loaded, drivers={}, enforcement_points={}, "
        "ignore_no_referential_driver={}",
        cfg->engine.driver_priority.size(),
        cfg->engine.enforcement_points.size(),
        cfg->engine.ignore_no_referential_driver
    );
    return cfg;
}

// ---------------------------------------------------------------------------
// ConfigLoader::parse
// ---------------------------------------------------------------------------
std::expected<EngineConfig, std::string> ConfigLoader::parse(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        return std::unexpected(std::string("config_loader: top-level YAML is not a map"));
    }

    EngineConfig cfg{};
    try {
        cfg.global = parse_global(root["global"]);
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "config_loader: error parsing 'global' section: {}", e.what()));
    }

    try {
        cfg.engine = parse_engine(root["engine"]);
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "config_loader: error parsing 'engine' section: {}", e.what()));
    }

    if (auto ok = validate(cfg); !ok) {
        return std::unexpected(ok.error());
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// ConfigLoader::load_template
// ---------------------------------------------------------------------------
std::expected<ConstraintTemplate, std::string>
ConfigLoader::load_template(const YAML::Node& manifest) {
    if (!manifest || !manifest.IsMap()) {
        return std::unexpected(std::string("config_loader: template manifest is not a map"));
    }

    ConstraintTemplate templ{};
    try {
        templ.name = unstructured::get_name(manifest);
        templ.kind = unstructured::nested_string(
            manifest, {"spec", "crd", "spec", "names", "kind"}).value_or("");

        if (const auto schema = unstructured::find_path(
                manifest, {"spec", "crd", "spec", "validation", "openAPIV3Schema"});
            schema.has_value() && !schema->IsNull()) {
            templ.parameters_schema.reset(unstructured::deep_copy(*schema));
        }

        const auto targets = unstructured::find_path(manifest, {"spec", "targets"});
        if (targets.has_value() && !targets->IsNull()) {
            if (!targets->IsSequence()) {
                return std::unexpected(std::string("config_loader: spec.targets is not a list"));
            }
            for (std::size_t i = 0; i < targets->size(); ++i) {
                auto target = parse_template_target((*targets)[i], i);
                if (!target) {
                    return std::unexpected(target.error());
                }
                templ.targets.push_back(std::move(*target));
            }
        }
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "config_loader: error parsing template '{}': {}", templ.name, e.what()));
    }

    spdlog::debug("config_loader: template manifest parsed name={} kind={} targets={}",
                  templ.name, templ.kind, templ.targets.size());
    return templ;
}

LogLevel ConfigLoader::to_log_level(const std::string& name) noexcept {
    if (name == "trace" || name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "warn") {
        return LogLevel::kWarn;
    }
    if (name == "error" || name == "critical") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

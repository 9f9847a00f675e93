// ---------------------------------------------------------------------------
// schema.cpp
//
// constraint 스키마 생성 / 구조 검증 / 인스턴스 검증 / 기본값 적용.
//
// [오류 보고]
// 스키마 위반은 모두 수집하여 "; " 로 이어 붙인 하나의 메시지로 돌려준다.
// 경로 표기: "spec.parameters.labels[0]"
//
// [알려진 한계]
// - YAML 스칼라는 타입이 없으므로 integer/number/boolean 검사는 문자열
//   파싱으로 수행한다. "1" 은 string 과 integer 를 모두 만족한다.
// - pattern, minimum, maxLength 등 값 제약 키워드는 검사하지 않는다.
// ---------------------------------------------------------------------------

#include "schema/schema.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <optional>
#include <regex>
#include <string>

#include <spdlog/spdlog.h>

#include "common/unstructured.hpp"

namespace {

constexpr std::array<std::string_view, 6> kValidTypes = {
    "object", "array", "string", "integer", "number", "boolean"
};

// 맵 노드의 자식 조회. 없으면 std::nullopt.
std::optional<YAML::Node> child(const YAML::Node& node, std::string_view key) {
    return unstructured::find_path(node, {key});
}

bool flag(const YAML::Node& node, std::string_view key) {
    const auto value = child(node, key);
    if (!value.has_value() || !value->IsScalar()) {
        return false;
    }
    return unstructured::to_lower(value->Scalar()) == "true";
}

std::string type_of(const YAML::Node& schema) {
    return unstructured::nested_string(schema, {"type"}).value_or("");
}

std::string join_path(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

bool is_integer(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    const char* begin = s.data();
    const char* end   = s.data() + s.size();
    if (*begin == '+') {
        ++begin;
    }
    long long value{0};
    auto [ptr, ec] = std::from_chars(begin, end, value);
    return ec == std::errc{} && ptr == end;
}

bool is_number(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    (void)std::strtod(s.c_str(), &end);
    return errno == 0 && end == s.c_str() + s.size();
}

bool is_boolean(const std::string& s) {
    const std::string lower = unstructured::to_lower(s);
    return lower == "true" || lower == "false";
}

bool matches(const std::string& value, const std::regex& re) {
    return std::regex_match(value, re);
}

const std::regex& dns1123_subdomain() {
    static const std::regex re(
        R"(^[a-z0-9]([-a-z0-9]*[a-z0-9])?(\.[a-z0-9]([-a-z0-9]*[a-z0-9])?)*$)");
    return re;
}

const std::regex& dns1035_label() {
    static const std::regex re(R"(^[a-z]([-a-z0-9]*[a-z0-9])?$)");
    return re;
}

const std::regex& kind_format() {
    static const std::regex re(R"(^[A-Za-z][A-Za-z0-9]*$)");
    return re;
}

// ---------------------------------------------------------------------------
// 스키마 노드 빌더
// ---------------------------------------------------------------------------
YAML::Node typed(std::string_view type) {
    YAML::Node n;
    n["type"] = std::string(type);
    return n;
}

YAML::Node preserve_unknown_object() {
    YAML::Node n = typed("object");
    n["x-kubernetes-preserve-unknown-fields"] = true;
    return n;
}

YAML::Node scoped_enforcement_actions_schema() {
    YAML::Node ep_item = typed("object");
    ep_item["properties"]["name"] = typed("string");

    YAML::Node eps = typed("array");
    eps["items"] = ep_item;

    YAML::Node item = typed("object");
    item["properties"]["action"]            = typed("string");
    item["properties"]["enforcementPoints"] = eps;

    YAML::Node arr = typed("array");
    arr["items"] = item;
    return arr;
}

YAML::Node parameters_schema(const ConstraintTemplate& templ) {
    if (!templ.parameters_schema.IsDefined() || templ.parameters_schema.IsNull()) {
        return preserve_unknown_object();
    }
    YAML::Node params = unstructured::deep_copy(templ.parameters_schema);
    // type 없이 properties 만 선언한 레거시 스키마는 object 로 간주한다.
    if (params.IsMap() && type_of(params).empty() && child(params, "properties").has_value()) {
        params["type"] = "object";
    }
    return params;
}

// ---------------------------------------------------------------------------
// 구조 검증 (재귀)
// ---------------------------------------------------------------------------
void check_structural(const YAML::Node& node, const std::string& path,
                      std::vector<std::string>& errors) {
    const std::string where = path.empty() ? "<root>" : path;
    if (!node.IsMap()) {
        errors.push_back(fmt::format("{}: schema must be a map", where));
        return;
    }

    const std::string type = type_of(node);
    if (const auto t = child(node, "type"); t.has_value()) {
        if (!t->IsScalar() ||
            std::find(kValidTypes.begin(), kValidTypes.end(), type) == kValidTypes.end()) {
            errors.push_back(fmt::format("{}: unsupported type '{}'", where, type));
        }
    }

    const auto props      = child(node, "properties");
    const auto items      = child(node, "items");
    const auto additional = child(node, "additionalProperties");

    if (props.has_value()) {
        if (!type.empty() && type != "object") {
            errors.push_back(fmt::format("{}: properties require type object, have '{}'",
                                         where, type));
        }
        if (!props->IsMap()) {
            errors.push_back(fmt::format("{}: properties must be a map", where));
        } else {
            for (const auto& kv : *props) {
                check_structural(kv.second, join_path(path, kv.first.Scalar()), errors);
            }
        }
        if (additional.has_value()) {
            errors.push_back(fmt::format(
                "{}: properties and additionalProperties are mutually exclusive", where));
        }
    }

    if (additional.has_value() && additional->IsMap()) {
        check_structural(*additional, join_path(path, "additionalProperties"), errors);
    }

    if (items.has_value()) {
        if (!type.empty() && type != "array") {
            errors.push_back(fmt::format("{}: items require type array, have '{}'", where, type));
        }
        check_structural(*items, path + "[]", errors);
    } else if (type == "array") {
        errors.push_back(fmt::format("{}: type array requires items", where));
    }

    if (const auto en = child(node, "enum"); en.has_value() && !en->IsSequence()) {
        errors.push_back(fmt::format("{}: enum must be a list", where));
    }

    if (const auto req = child(node, "required"); req.has_value()) {
        if (!req->IsSequence()) {
            errors.push_back(fmt::format("{}: required must be a list", where));
        } else {
            for (const auto& r : *req) {
                if (!r.IsScalar()) {
                    errors.push_back(fmt::format("{}: required entries must be strings", where));
                    continue;
                }
                if (props.has_value() && props->IsMap() && !child(*props, r.Scalar()).has_value()) {
                    errors.push_back(fmt::format("{}: required field '{}' is not declared",
                                                 where, r.Scalar()));
                }
            }
        }
    }

    if (const auto def = child(node, "default"); def.has_value()) {
        for (auto& e : SchemaValidator::validate_value(node, *def, path)) {
            errors.push_back(fmt::format("{}: invalid default: {}", where, e));
        }
    }
}

void validate_object(const YAML::Node& schema, const YAML::Node& value,
                     const std::string& path, std::vector<std::string>& errors) {
    const auto props      = child(schema, "properties");
    const auto additional = child(schema, "additionalProperties");
    const bool preserve   = flag(schema, "x-kubernetes-preserve-unknown-fields");

    if (const auto req = child(schema, "required"); req.has_value() && req->IsSequence()) {
        for (const auto& r : *req) {
            if (r.IsScalar() && !child(value, r.Scalar()).has_value()) {
                errors.push_back(fmt::format("{}: Required value", join_path(path, r.Scalar())));
            }
        }
    }

    for (const auto& kv : value) {
        const std::string key  = kv.first.IsScalar() ? kv.first.Scalar() : "";
        const std::string sub  = join_path(path, key);
        if (props.has_value() && props->IsMap()) {
            if (const auto prop = child(*props, key); prop.has_value()) {
                auto nested = SchemaValidator::validate_value(*prop, kv.second, sub);
                errors.insert(errors.end(), nested.begin(), nested.end());
                continue;
            }
        }
        if (additional.has_value()) {
            if (additional->IsMap()) {
                auto nested = SchemaValidator::validate_value(*additional, kv.second, sub);
                errors.insert(errors.end(), nested.begin(), nested.end());
            } else if (additional->IsScalar() && !preserve &&
                       unstructured::to_lower(additional->Scalar()) == "false") {
                errors.push_back(fmt::format("{}: unknown field", sub));
            }
        }
        // 선언되지 않은 필드는 허용한다 (구조 스키마의 pruning 대상).
    }
}

void default_node(const YAML::Node& schema, YAML::Node value) {
    if (!schema.IsMap() || !value.IsDefined()) {
        return;
    }

    if (value.IsMap()) {
        const auto props = child(schema, "properties");
        if (props.has_value() && props->IsMap()) {
            for (const auto& kv : *props) {
                const std::string key = kv.first.Scalar();
                if (!child(value, key).has_value()) {
                    const auto def = child(kv.second, "default");
                    if (!def.has_value()) {
                        continue;
                    }
                    value[key] = unstructured::deep_copy(*def);
                }
                YAML::Node sub = value[key];
                default_node(kv.second, sub);
            }
        }

        const auto additional = child(schema, "additionalProperties");
        if (additional.has_value() && additional->IsMap()) {
            std::vector<std::string> keys;
            for (const auto& kv : value) {
                keys.push_back(kv.first.Scalar());
            }
            for (const auto& key : keys) {
                YAML::Node sub = value[key];
                default_node(*additional, sub);
            }
        }
        return;
    }

    if (value.IsSequence()) {
        const auto items = child(schema, "items");
        if (!items.has_value()) {
            return;
        }
        for (std::size_t i = 0; i < value.size(); ++i) {
            YAML::Node element = value[i];
            default_node(*items, element);
        }
    }
}

EngineError invalid_constraint(std::string message, const YAML::Node& instance) {
    return EngineError{
        ErrorCode::kInvalidConstraint,
        std::move(message),
        fmt::format("{}/{}", unstructured::get_kind(instance), unstructured::get_name(instance))
    };
}

}  // namespace

GeneratedSchema GeneratedSchema::deep_copy() const {
    GeneratedSchema cpy = *this;
    cpy.open_api_schema.reset(unstructured::deep_copy(open_api_schema));
    return cpy;
}

// ---------------------------------------------------------------------------
// SchemaGenerator::generate
// ---------------------------------------------------------------------------
GeneratedSchema SchemaGenerator::generate(const ConstraintTemplate& templ,
                                          const TargetHandler& target) {
    YAML::Node spec = typed("object");
    spec["properties"]["match"]                    = target.match_schema();
    spec["properties"]["parameters"]               = parameters_schema(templ);
    spec["properties"]["enforcementAction"]        = typed("string");
    spec["properties"]["scopedEnforcementActions"] = scoped_enforcement_actions_schema();

    YAML::Node metadata = typed("object");
    metadata["properties"]["name"] = typed("string");

    YAML::Node root = typed("object");
    root["properties"]["metadata"] = metadata;
    root["properties"]["spec"]     = spec;
    root["properties"]["status"]   = preserve_unknown_object();

    GeneratedSchema schema{};
    schema.kind            = templ.kind;
    schema.list_kind       = templ.kind + "List";
    schema.plural          = unstructured::to_lower(templ.kind);
    schema.group           = std::string(kConstraintsGroup);
    schema.versions        = kConstraintVersions;
    schema.open_api_schema = root;
    return schema;
}

// ---------------------------------------------------------------------------
// SchemaValidator::validate_structural
// ---------------------------------------------------------------------------
std::expected<void, EngineError>
SchemaValidator::validate_structural(const GeneratedSchema& schema) {
    std::vector<std::string> errors;

    if (schema.kind.empty() || !matches(schema.kind, kind_format())) {
        errors.push_back(fmt::format("invalid kind '{}'", schema.kind));
    }
    if (schema.plural.size() > 63 || !matches(schema.plural, dns1035_label())) {
        errors.push_back(fmt::format("plural name '{}' is not a DNS-1035 label", schema.plural));
    }
    if (schema.versions.empty()) {
        errors.push_back("no versions defined");
    }
    if (!schema.open_api_schema.IsDefined() || schema.open_api_schema.IsNull()) {
        errors.push_back("missing OpenAPI schema");
    } else {
        check_structural(schema.open_api_schema, "", errors);
    }

    if (!errors.empty()) {
        std::string joined;
        for (std::size_t i = 0; i < errors.size(); ++i) {
            joined += (i == 0 ? "" : "; ") + errors[i];
        }
        spdlog::debug("schema: structural validation failed for kind '{}': {}", schema.kind, joined);
        return std::unexpected(EngineError{
            ErrorCode::kInvalidConstraintTemplate,
            fmt::format("generated schema is invalid: {}", joined),
            schema.kind
        });
    }
    return {};
}

// ---------------------------------------------------------------------------
// SchemaValidator::validate_instance
// ---------------------------------------------------------------------------
std::expected<void, EngineError>
SchemaValidator::validate_instance(const GeneratedSchema& schema, const YAML::Node& instance) {
    if (!instance.IsDefined() || !instance.IsMap()) {
        return std::unexpected(invalid_constraint("constraint must be an object", instance));
    }

    const std::string name = unstructured::get_name(instance);
    if (name.empty() || name.size() > 253 || !matches(name, dns1123_subdomain())) {
        return std::unexpected(invalid_constraint(
            fmt::format("invalid name '{}': must be a DNS-1123 subdomain", name), instance));
    }

    const std::string kind = unstructured::get_kind(instance);
    if (kind != schema.kind) {
        return std::unexpected(invalid_constraint(
            fmt::format("wrong kind '{}' for constraint '{}'; want '{}'", kind, name, schema.kind),
            instance));
    }

    const std::string group = unstructured::get_group(instance);
    if (group != schema.group) {
        return std::unexpected(invalid_constraint(
            fmt::format("unsupported group '{}' for constraint '{}'; allowed group: '{}'",
                        group, name, schema.group),
            instance));
    }

    const std::string version = unstructured::get_version(instance);
    if (std::find(schema.versions.begin(), schema.versions.end(), version) == schema.versions.end()) {
        return std::unexpected(invalid_constraint(
            fmt::format("unsupported version '{}' for constraint '{}'", version, name), instance));
    }

    // 스키마 검사는 가장 비용이 크므로 마지막에 수행한다.
    const auto errors = validate_value(schema.open_api_schema, instance, "");
    if (!errors.empty()) {
        std::string joined;
        for (std::size_t i = 0; i < errors.size(); ++i) {
            joined += (i == 0 ? "" : "; ") + errors[i];
        }
        return std::unexpected(invalid_constraint(
            fmt::format("schema validation failed: {}", joined), instance));
    }
    return {};
}

// ---------------------------------------------------------------------------
// SchemaValidator::validate_value
// ---------------------------------------------------------------------------
std::vector<std::string>
SchemaValidator::validate_value(const YAML::Node& schema, const YAML::Node& value,
                                const std::string& path) {
    std::vector<std::string> errors;
    if (!schema.IsMap() || !value.IsDefined() || value.IsNull()) {
        return errors;
    }
    const std::string where = path.empty() ? "<root>" : path;

    if (const auto en = child(schema, "enum"); en.has_value() && en->IsSequence()) {
        const std::string actual = unstructured::canonical_string(value);
        bool found = false;
        for (const auto& candidate : *en) {
            if (unstructured::canonical_string(candidate) == actual) {
                found = true;
                break;
            }
        }
        if (!found) {
            errors.push_back(fmt::format("{}: Unsupported value {}", where, actual));
        }
    }

    if (flag(schema, "x-kubernetes-int-or-string")) {
        if (!value.IsScalar()) {
            errors.push_back(fmt::format("{}: must be an integer or string", where));
        }
        return errors;
    }

    const std::string type = type_of(schema);
    if (type == "object") {
        if (!value.IsMap()) {
            errors.push_back(fmt::format("{}: Invalid value: must be of type object", where));
            return errors;
        }
        validate_object(schema, value, path, errors);
    } else if (type == "array") {
        if (!value.IsSequence()) {
            errors.push_back(fmt::format("{}: Invalid value: must be of type array", where));
            return errors;
        }
        if (const auto items = child(schema, "items"); items.has_value()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                auto nested = validate_value(*items, value[i], fmt::format("{}[{}]", path, i));
                errors.insert(errors.end(), nested.begin(), nested.end());
            }
        }
    } else if (type == "string") {
        if (!value.IsScalar()) {
            errors.push_back(fmt::format("{}: Invalid value: must be of type string", where));
        }
    } else if (type == "integer") {
        if (!value.IsScalar() || !is_integer(value.Scalar())) {
            errors.push_back(fmt::format("{}: Invalid value: must be of type integer", where));
        }
    } else if (type == "number") {
        if (!value.IsScalar() || !is_number(value.Scalar())) {
            errors.push_back(fmt::format("{}: Invalid value: must be of type number", where));
        }
    } else if (type == "boolean") {
        if (!value.IsScalar() || !is_boolean(value.Scalar())) {
            errors.push_back(fmt::format("{}: Invalid value: must be of type boolean", where));
        }
    } else if (value.IsMap()) {
        // type 이 없는 노드: 선언된 properties 만 검사한다.
        validate_object(schema, value, path, errors);
    }

    return errors;
}

// ---------------------------------------------------------------------------
// SchemaValidator::apply_defaults
// ---------------------------------------------------------------------------
void SchemaValidator::apply_defaults(const GeneratedSchema& schema, YAML::Node& instance) {
    default_node(schema.open_api_schema, instance);
}

// ---------------------------------------------------------------------------
// k8s_validation_target.cpp
//
// [match 판정 순서]
// 1. kinds          : (apiGroups, kinds) 쌍 중 하나라도 일치
// 2. scope          : "*" | "Cluster" | "Namespaced"
// 3. namespaces     : namespaced 객체(와 Namespace 자신)에만 적용
// 4. excludedNamespaces
// 5. name           : glob
// 6. labelSelector  : object(삭제 요청이면 oldObject)의 metadata.labels
// 모든 조건은 AND 로 결합되며, 선언되지 않은 조건은 통과로 본다.
// ---------------------------------------------------------------------------

#include "handler/k8s_validation_target.hpp"

#include <algorithm>
#include <regex>

#include <spdlog/spdlog.h>

#include "common/unstructured.hpp"

namespace {

// namespace/name glob 허용 형식: 접두 또는 접미 와일드카드 하나.
const std::regex& wildcard_pattern() {
    static const std::regex re(
        R"(^(\*|\*-)?[a-z0-9]([-a-z0-9]*[a-z0-9])?$|^[a-z0-9]([-a-z0-9]*[a-z0-9])?(\*|-\*)?$)");
    return re;
}

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

EngineError invalid(std::string message, const YAML::Node& constraint) {
    return EngineError{
        ErrorCode::kInvalidConstraint,
        std::move(message),
        fmt::format("{}/{}", unstructured::get_kind(constraint), unstructured::get_name(constraint))
    };
}

// 문자열 목록을 읽는다. null 항목은 빈 문자열로 읽는다 (apiGroups: [""]).
std::expected<std::vector<std::string>, std::string>
read_string_list(const YAML::Node& node, const std::string& field) {
    std::vector<std::string> result;
    if (!node.IsDefined() || node.IsNull()) {
        return result;
    }
    if (!node.IsSequence()) {
        return std::unexpected(fmt::format("{} must be a list of strings", field));
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsNull()) {
            result.emplace_back();
        } else if (item.IsScalar()) {
            result.push_back(item.Scalar());
        } else {
            return std::unexpected(fmt::format("{} must be a list of strings", field));
        }
    }
    return result;
}

std::map<std::string, std::string> labels_of(const YAML::Node& object) {
    std::map<std::string, std::string> labels;
    const auto node = unstructured::find_path(object, {"metadata", "labels"});
    if (!node.has_value() || !node->IsMap()) {
        return labels;
    }
    for (const auto& kv : *node) {
        if (kv.first.IsScalar() && kv.second.IsScalar()) {
            labels.emplace(kv.first.Scalar(), kv.second.Scalar());
        }
    }
    return labels;
}

// ---------------------------------------------------------------------------
// parse_label_selector
//   matchExpressions 의 연산자/값 조합까지 검증한다.
// ---------------------------------------------------------------------------
std::expected<LabelSelector, std::string>
parse_label_selector(const YAML::Node& node, const std::string& field) {
    LabelSelector selector{};
    if (!node.IsMap()) {
        return std::unexpected(fmt::format("{} must be an object", field));
    }

    if (const auto labels = unstructured::find_path(node, {"matchLabels"});
        labels.has_value() && !labels->IsNull()) {
        if (!labels->IsMap()) {
            return std::unexpected(fmt::format("{}.matchLabels must be an object", field));
        }
        for (const auto& kv : *labels) {
            if (!kv.second.IsScalar()) {
                return std::unexpected(fmt::format("{}.matchLabels[{}] must be a string",
                                                   field, kv.first.Scalar()));
            }
            selector.match_labels.emplace(kv.first.Scalar(), kv.second.Scalar());
        }
    }

    const auto exprs = unstructured::find_path(node, {"matchExpressions"});
    if (!exprs.has_value() || exprs->IsNull()) {
        return selector;
    }
    if (!exprs->IsSequence()) {
        return std::unexpected(fmt::format("{}.matchExpressions must be a list", field));
    }

    for (std::size_t i = 0; i < exprs->size(); ++i) {
        const YAML::Node expr = (*exprs)[i];
        const std::string where = fmt::format("{}.matchExpressions[{}]", field, i);
        if (!expr.IsMap()) {
            return std::unexpected(fmt::format("{} must be an object", where));
        }

        LabelRequirement req{};
        req.key = unstructured::nested_string(expr, {"key"}).value_or("");
        req.op  = unstructured::nested_string(expr, {"operator"}).value_or("");
        auto values = read_string_list(
            unstructured::find_path(expr, {"values"}).value_or(YAML::Node{}), where + ".values");
        if (!values) {
            return std::unexpected(values.error());
        }
        req.values = std::move(*values);

        if (req.key.empty()) {
            return std::unexpected(fmt::format("{}.key: Required value", where));
        }
        if (req.op == "In" || req.op == "NotIn") {
            if (req.values.empty()) {
                return std::unexpected(fmt::format(
                    "{}.values: must be specified when `operator` is 'In' or 'NotIn'", where));
            }
        } else if (req.op == "Exists" || req.op == "DoesNotExist") {
            if (!req.values.empty()) {
                return std::unexpected(fmt::format(
                    "{}.values: may not be specified when `operator` is 'Exists' or 'DoesNotExist'",
                    where));
            }
        } else {
            return std::unexpected(fmt::format("{}.operator: not a valid selector operator '{}'",
                                               where, req.op));
        }
        selector.match_expressions.push_back(std::move(req));
    }
    return selector;
}

std::expected<void, std::string>
check_wildcards(const std::vector<std::string>& values, const std::string& field) {
    for (const auto& v : values) {
        if (!std::regex_match(v, wildcard_pattern())) {
            return std::unexpected(fmt::format(
                "{}: '{}' is not a valid name or prefix/suffix glob", field, v));
        }
    }
    return {};
}

// ---------------------------------------------------------------------------
// 스키마 노드 빌더
// ---------------------------------------------------------------------------
YAML::Node typed(std::string_view type) {
    YAML::Node n;
    n["type"] = std::string(type);
    return n;
}

YAML::Node string_list() {
    YAML::Node n = typed("array");
    n["items"] = typed("string");
    return n;
}

YAML::Node label_selector_schema() {
    YAML::Node match_labels = typed("object");
    match_labels["additionalProperties"] = typed("string");

    YAML::Node op = typed("string");
    op["enum"].push_back("In");
    op["enum"].push_back("NotIn");
    op["enum"].push_back("Exists");
    op["enum"].push_back("DoesNotExist");

    YAML::Node expr = typed("object");
    expr["properties"]["key"]      = typed("string");
    expr["properties"]["operator"] = op;
    expr["properties"]["values"]   = string_list();

    YAML::Node exprs = typed("array");
    exprs["items"] = expr;

    YAML::Node selector = typed("object");
    selector["properties"]["matchLabels"]      = match_labels;
    selector["properties"]["matchExpressions"] = exprs;
    return selector;
}

std::string path_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 4);
    for (char ch : s) {
        if (ch == '/') {
            out += "%2F";
        } else {
            out += ch;
        }
    }
    return out;
}

}  // namespace

bool glob_match(const std::string& pattern, const std::string& value) {
    if (!pattern.empty() && pattern.back() == '*') {
        return value.starts_with(std::string_view(pattern).substr(0, pattern.size() - 1));
    }
    if (!pattern.empty() && pattern.front() == '*') {
        return value.ends_with(std::string_view(pattern).substr(1));
    }
    return pattern == value;
}

// ---------------------------------------------------------------------------
// LabelSelector::matches
// ---------------------------------------------------------------------------
bool LabelSelector::matches(const std::map<std::string, std::string>& labels) const {
    for (const auto& [key, value] : match_labels) {
        const auto it = labels.find(key);
        if (it == labels.end() || it->second != value) {
            return false;
        }
    }

    for (const auto& req : match_expressions) {
        const auto it  = labels.find(req.key);
        const bool has = it != labels.end();
        if (req.op == "In") {
            if (!has || !contains(req.values, it->second)) {
                return false;
            }
        } else if (req.op == "NotIn") {
            if (has && contains(req.values, it->second)) {
                return false;
            }
        } else if (req.op == "Exists") {
            if (!has) {
                return false;
            }
        } else if (req.op == "DoesNotExist") {
            if (has) {
                return false;
            }
        } else {
            return false;
        }
    }
    return true;
}

// ---------------------------------------------------------------------------
// K8sMatcher::match
// ---------------------------------------------------------------------------
std::expected<bool, EngineError> K8sMatcher::match(const YAML::Node& review) const {
    const auto kind = unstructured::nested_string(review, {"kind", "kind"});
    if (!kind.has_value() || kind->empty()) {
        return std::unexpected(EngineError{
            ErrorCode::kTargetError,
            "review has no kind information",
            std::string(kK8sValidationTargetName)
        });
    }
    const std::string group = unstructured::nested_string(review, {"kind", "group"}).value_or("");

    YAML::Node object;
    if (const auto obj = unstructured::find_path(review, {"object"}); obj.has_value() && obj->IsMap()) {
        object.reset(*obj);
    } else if (const auto old = unstructured::find_path(review, {"oldObject"});
               old.has_value() && old->IsMap()) {
        object.reset(*old);
    }

    std::string ns = unstructured::nested_string(review, {"namespace"}).value_or("");
    if (ns.empty() && object.IsDefined()) {
        ns = unstructured::get_namespace(object);
    }
    std::string obj_name = unstructured::nested_string(review, {"name"}).value_or("");
    if (obj_name.empty() && object.IsDefined()) {
        obj_name = unstructured::get_name(object);
    }

    const bool is_namespace   = group.empty() && *kind == "Namespace";
    const bool cluster_scoped = ns.empty();

    if (!kinds.empty()) {
        const bool any = std::any_of(kinds.begin(), kinds.end(), [&](const KindSelector& ks) {
            const bool group_ok = ks.api_groups.empty() || contains(ks.api_groups, "*") ||
                                  contains(ks.api_groups, group);
            const bool kind_ok  = ks.kinds.empty() || contains(ks.kinds, "*") ||
                                  contains(ks.kinds, *kind);
            return group_ok && kind_ok;
        });
        if (!any) {
            return false;
        }
    }

    if ((scope == "Cluster" && !cluster_scoped) || (scope == "Namespaced" && cluster_scoped)) {
        return false;
    }

    if (!cluster_scoped || is_namespace) {
        const std::string& effective_ns = is_namespace ? obj_name : ns;
        const auto hit = [&](const std::string& pattern) { return glob_match(pattern, effective_ns); };
        if (!namespaces.empty() && std::none_of(namespaces.begin(), namespaces.end(), hit)) {
            return false;
        }
        if (std::any_of(excluded_namespaces.begin(), excluded_namespaces.end(), hit)) {
            return false;
        }
    }

    if (namespace_selector.has_value()) {
        if (is_namespace) {
            if (!namespace_selector->matches(labels_of(object))) {
                return false;
            }
        } else if (!cluster_scoped) {
            const auto ns_obj = unstructured::find_path(review, {"_unstable", "namespace"});
            if (!ns_obj.has_value() || !ns_obj->IsMap()) {
                return std::unexpected(EngineError{
                    ErrorCode::kTargetError,
                    fmt::format("namespace selector for namespace-scoped object but missing Namespace {}", ns),
                    std::string(kK8sValidationTargetName)
                });
            }
            if (!namespace_selector->matches(labels_of(*ns_obj))) {
                return false;
            }
        }
    }

    if (name.has_value() && !glob_match(*name, obj_name)) {
        return false;
    }

    if (label_selector.has_value() && !label_selector->matches(labels_of(object))) {
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// K8sValidationTarget
// ---------------------------------------------------------------------------
std::string K8sValidationTarget::name() const {
    return std::string(kK8sValidationTargetName);
}

YAML::Node K8sValidationTarget::match_schema() const {
    YAML::Node kind_item = typed("object");
    kind_item["properties"]["apiGroups"] = string_list();
    kind_item["properties"]["kinds"]     = string_list();

    YAML::Node kinds = typed("array");
    kinds["items"] = kind_item;

    YAML::Node scope = typed("string");
    scope["enum"].push_back("*");
    scope["enum"].push_back("Cluster");
    scope["enum"].push_back("Namespaced");

    YAML::Node match = typed("object");
    match["properties"]["kinds"]              = kinds;
    match["properties"]["namespaces"]         = string_list();
    match["properties"]["excludedNamespaces"] = string_list();
    match["properties"]["labelSelector"]      = label_selector_schema();
    match["properties"]["namespaceSelector"]  = label_selector_schema();
    match["properties"]["scope"]              = scope;
    match["properties"]["name"]               = typed("string");
    return match;
}

std::expected<ProcessedData, EngineError>
K8sValidationTarget::process_data(const YAML::Node& obj) const {
    if (!obj.IsDefined() || !obj.IsMap() || !unstructured::find_path(obj, {"kind"}).has_value()) {
        return ProcessedData{};
    }

    const std::string obj_name = unstructured::get_name(obj);
    const std::string kind     = unstructured::get_kind(obj);
    if (unstructured::get_version(obj).empty()) {
        return std::unexpected(EngineError{
            ErrorCode::kTargetError, fmt::format("resource {} has no version", obj_name), name()});
    }
    if (kind.empty()) {
        return std::unexpected(EngineError{
            ErrorCode::kTargetError, fmt::format("resource {} has no kind", obj_name), name()});
    }

    const std::string gv = path_escape(unstructured::get_api_version(obj));
    const std::string ns = unstructured::get_namespace(obj);

    ProcessedData data{};
    data.handled = true;
    data.key     = ns.empty() ? fmt::format("cluster/{}/{}/{}", gv, kind, obj_name)
                              : fmt::format("namespace/{}/{}/{}/{}", ns, gv, kind, obj_name);
    data.value.reset(unstructured::deep_copy(obj));
    return data;
}

std::expected<HandledReview, EngineError>
K8sValidationTarget::handle_review(const YAML::Node& obj) const {
    if (!obj.IsDefined() || !obj.IsMap()) {
        return HandledReview{};
    }
    const auto kind_node = unstructured::find_path(obj, {"kind"});
    if (!kind_node.has_value()) {
        return handle_augmented(obj);
    }

    HandledReview handled{};
    handled.handled = true;

    // admission 요청
    if (kind_node->IsMap()) {
        if (unstructured::nested_string(*kind_node, {"kind"}).value_or("").empty()) {
            return std::unexpected(EngineError{
                ErrorCode::kTargetError, "admission request has no kind.kind", name()});
        }
        YAML::Node review = unstructured::deep_copy(obj);

        YAML::Node object;
        if (const auto o = unstructured::find_path(obj, {"object"}); o.has_value() && o->IsMap()) {
            object.reset(*o);
        } else if (const auto old = unstructured::find_path(obj, {"oldObject"});
                   old.has_value() && old->IsMap()) {
            object.reset(*old);
        }
        if (object.IsDefined()) {
            if (!unstructured::find_path(review, {"name"}).has_value()) {
                review["name"] = unstructured::get_name(object);
            }
            if (!unstructured::find_path(review, {"namespace"}).has_value()) {
                review["namespace"] = unstructured::get_namespace(object);
            }
        }
        handled.review.reset(review);
        return handled;
    }

    // 원시 객체
    if (!kind_node->IsScalar() || kind_node->Scalar().empty()) {
        return HandledReview{};
    }
    if (unstructured::get_api_version(obj).empty()) {
        return std::unexpected(EngineError{
            ErrorCode::kTargetError,
            fmt::format("resource {} has no apiVersion", unstructured::get_name(obj)),
            name()
        });
    }

    YAML::Node gvk;
    gvk["group"]   = unstructured::get_group(obj);
    gvk["version"] = unstructured::get_version(obj);
    gvk["kind"]    = kind_node->Scalar();

    YAML::Node review;
    review["kind"]      = gvk;
    review["name"]      = unstructured::get_name(obj);
    review["namespace"] = unstructured::get_namespace(obj);
    review["object"]    = unstructured::deep_copy(obj);
    handled.review.reset(review);
    return handled;
}

// { object, namespace } 입력. namespace 는 object 가 속한 Namespace 객체이다.
std::expected<HandledReview, EngineError>
K8sValidationTarget::handle_augmented(const YAML::Node& obj) const {
    const auto inner = unstructured::find_path(obj, {"object"});
    if (!inner.has_value() || !inner->IsMap() ||
        !unstructured::find_path(*inner, {"kind"}).has_value()) {
        return HandledReview{};
    }

    auto handled = handle_review(*inner);
    if (!handled || !handled->handled) {
        return handled;
    }
    if (const auto ns = unstructured::find_path(obj, {"namespace"}); ns.has_value() && ns->IsMap()) {
        handled->review["_unstable"]["namespace"] = unstructured::deep_copy(*ns);
    }
    return handled;
}

std::expected<void, EngineError> K8sValidationTarget::handle_violation(Result& result) const {
    if (!result.metadata.IsDefined() || result.metadata.IsNull()) {
        YAML::Node metadata(YAML::NodeType::Map);
        metadata["details"] = YAML::Node(YAML::NodeType::Map);
        result.metadata.reset(metadata);
        return {};
    }
    if (!result.metadata.IsMap()) {
        return std::unexpected(EngineError{
            ErrorCode::kTargetError,
            fmt::format("violation metadata is not an object: {}",
                        unstructured::canonical_string(result.metadata)),
            name()
        });
    }
    if (!unstructured::find_path(result.metadata, {"details"}).has_value()) {
        result.metadata["details"] = YAML::Node(YAML::NodeType::Map);
    }
    return {};
}

std::expected<void, EngineError>
K8sValidationTarget::validate_constraint(const YAML::Node& constraint) const {
    const auto match = unstructured::find_path(constraint, {"spec", "match"});
    if (!match.has_value() || match->IsNull()) {
        return {};
    }
    if (!match->IsMap()) {
        return std::unexpected(invalid("spec.match must be an object", constraint));
    }

    for (const char* field : {"labelSelector", "namespaceSelector"}) {
        const auto sel = unstructured::find_path(*match, {field});
        if (!sel.has_value() || sel->IsNull()) {
            continue;
        }
        if (auto parsed = parse_label_selector(*sel, fmt::format("spec.match.{}", field)); !parsed) {
            return std::unexpected(invalid(parsed.error(), constraint));
        }
    }

    for (const char* field : {"namespaces", "excludedNamespaces"}) {
        const std::string where = fmt::format("spec.match.{}", field);
        auto list = read_string_list(
            unstructured::find_path(*match, {field}).value_or(YAML::Node{}), where);
        if (!list) {
            return std::unexpected(invalid(list.error(), constraint));
        }
        if (auto ok = check_wildcards(*list, where); !ok) {
            return std::unexpected(invalid(ok.error(), constraint));
        }
    }

    if (const auto n = unstructured::nested_string(*match, {"name"}); n.has_value()) {
        if (auto ok = check_wildcards({*n}, "spec.match.name"); !ok) {
            return std::unexpected(invalid(ok.error(), constraint));
        }
    }
    return {};
}

std::expected<std::shared_ptr<const Matcher>, EngineError>
K8sValidationTarget::to_matcher(const YAML::Node& constraint) const {
    auto matcher = std::make_shared<K8sMatcher>();

    const auto match = unstructured::find_path(constraint, {"spec", "match"});
    if (!match.has_value() || match->IsNull()) {
        return matcher;
    }
    if (!match->IsMap()) {
        return std::unexpected(invalid("spec.match must be an object", constraint));
    }

    if (const auto kinds = unstructured::find_path(*match, {"kinds"});
        kinds.has_value() && !kinds->IsNull()) {
        if (!kinds->IsSequence()) {
            return std::unexpected(invalid("spec.match.kinds must be a list", constraint));
        }
        for (std::size_t i = 0; i < kinds->size(); ++i) {
            const YAML::Node entry = (*kinds)[i];
            const std::string where = fmt::format("spec.match.kinds[{}]", i);
            auto groups = read_string_list(
                unstructured::find_path(entry, {"apiGroups"}).value_or(YAML::Node{}),
                where + ".apiGroups");
            auto names = read_string_list(
                unstructured::find_path(entry, {"kinds"}).value_or(YAML::Node{}),
                where + ".kinds");
            if (!groups) {
                return std::unexpected(invalid(groups.error(), constraint));
            }
            if (!names) {
                return std::unexpected(invalid(names.error(), constraint));
            }
            matcher->kinds.push_back(KindSelector{
                .api_groups = std::move(*groups),
                .kinds      = std::move(*names),
            });
        }
    }

    auto namespaces = read_string_list(
        unstructured::find_path(*match, {"namespaces"}).value_or(YAML::Node{}),
        "spec.match.namespaces");
    auto excluded = read_string_list(
        unstructured::find_path(*match, {"excludedNamespaces"}).value_or(YAML::Node{}),
        "spec.match.excludedNamespaces");
    if (!namespaces) {
        return std::unexpected(invalid(namespaces.error(), constraint));
    }
    if (!excluded) {
        return std::unexpected(invalid(excluded.error(), constraint));
    }
    matcher->namespaces          = std::move(*namespaces);
    matcher->excluded_namespaces = std::move(*excluded);

    if (const auto sel = unstructured::find_path(*match, {"labelSelector"});
        sel.has_value() && !sel->IsNull()) {
        auto parsed = parse_label_selector(*sel, "spec.match.labelSelector");
        if (!parsed) {
            return std::unexpected(invalid(parsed.error(), constraint));
        }
        matcher->label_selector = std::move(*parsed);
    }

    if (const auto sel = unstructured::find_path(*match, {"namespaceSelector"});
        sel.has_value() && !sel->IsNull()) {
        auto parsed = parse_label_selector(*sel, "spec.match.namespaceSelector");
        if (!parsed) {
            return std::unexpected(invalid(parsed.error(), constraint));
        }
        matcher->namespace_selector = std::move(*parsed);
    }

    matcher->name  = unstructured::nested_string(*match, {"name"});
    matcher->scope = unstructured::nested_string(*match, {"scope"}).value_or("*");

    spdlog::debug("k8s_target: matcher built constraint={}/{} kinds={} namespaces={} excluded={}",
                  unstructured::get_kind(constraint), unstructured::get_name(constraint),
                  matcher->kinds.size(), matcher->namespaces.size(),
                  matcher->excluded_namespaces.size());
    return matcher;
}

std::string K8sValidationTarget::library() const {
    return R"(package target

matching_constraints[constraint] {
  constraint := data.constraints[_][_]
  input.review.kind.kind != ""
}

matching_reviews_and_constraints[[review, constraint]] {
  obj := data.inventory[_][_][_][_]
  review := make_review(obj)
  constraint := data.constraints[_][_]
}

make_review(obj) = review {
  review := {
    "kind": {"kind": obj.kind, "version": obj.apiVersion},
    "name": obj.metadata.name,
    "object": obj,
  }
}
)";
}

// ---------------------------------------------------------------------------
// unstructured.cpp
//
// YAML::Node 기반 스키마 없는 객체 헬퍼 구현.
//
// [알려진 한계]
// - YAML 스칼라는 타입 정보가 없으므로 "1" 과 1 은 같은 값으로 취급된다.
//   semantic_equal / canonical_string 모두 스칼라를 문자열로 비교한다.
// - 맵 키가 스칼라가 아닌 경우 canonical_string(key) 를 키로 사용한다.
// ---------------------------------------------------------------------------

#include "common/unstructured.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <map>
#include <utility>

namespace unstructured {

namespace {

std::string escape_json(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 8);
    for (unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }
    return result;
}

// 맵 노드를 "정렬된 키 → 값" 으로 펼친다.
std::map<std::string, YAML::Node> sorted_entries(const YAML::Node& map_node) {
    std::map<std::string, YAML::Node> entries;
    for (const auto& kv : map_node) {
        const std::string key = kv.first.IsScalar() ? kv.first.Scalar()
                                                    : canonical_string(kv.first);
        entries.emplace(key, kv.second);
    }
    return entries;
}

bool is_empty_value(const YAML::Node& node) {
    return !node.IsDefined() || node.IsNull();
}

}  // namespace

YAML::Node deep_copy(const YAML::Node& node) {
    if (!node.IsDefined()) {
        return YAML::Node(YAML::NodeType::Null);
    }
    return YAML::Clone(node);
}

std::optional<YAML::Node>
find_path(const YAML::Node& node, std::initializer_list<std::string_view> path) {
    if (!node.IsDefined()) {
        return std::nullopt;
    }

    YAML::Node current(node);
    for (const auto key : path) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node& parent = current;
        const YAML::Node  next   = parent[std::string(key)];
        if (!next.IsDefined()) {
            return std::nullopt;
        }
        // operator= 는 참조 대상의 내용을 덮어쓰므로 reset() 으로 재바인딩한다.
        current.reset(next);
    }
    return current;
}

std::optional<std::string>
nested_string(const YAML::Node& node, std::initializer_list<std::string_view> path) {
    const auto value = find_path(node, path);
    if (!value.has_value() || !value->IsScalar()) {
        return std::nullopt;
    }
    return value->Scalar();
}

std::string get_name(const YAML::Node& obj) {
    return nested_string(obj, {"metadata", "name"}).value_or("");
}

std::string get_namespace(const YAML::Node& obj) {
    return nested_string(obj, {"metadata", "namespace"}).value_or("");
}

std::string get_kind(const YAML::Node& obj) {
    return nested_string(obj, {"kind"}).value_or("");
}

std::string get_api_version(const YAML::Node& obj) {
    return nested_string(obj, {"apiVersion"}).value_or("");
}

std::string get_group(const YAML::Node& obj) {
    const std::string api_version = get_api_version(obj);
    const auto slash = api_version.find('/');
    if (slash == std::string::npos) {
        return "";
    }
    return api_version.substr(0, slash);
}

std::string get_version(const YAML::Node& obj) {
    const std::string api_version = get_api_version(obj);
    const auto slash = api_version.find('/');
    if (slash == std::string::npos) {
        return api_version;
    }
    return api_version.substr(slash + 1);
}

bool semantic_equal(const YAML::Node& a, const YAML::Node& b) {
    if (is_empty_value(a) || is_empty_value(b)) {
        return is_empty_value(a) && is_empty_value(b);
    }
    if (a.Type() != b.Type()) {
        return false;
    }

    switch (a.Type()) {
        case YAML::NodeType::Scalar:
            return a.Scalar() == b.Scalar();

        case YAML::NodeType::Sequence: {
            if (a.size() != b.size()) {
                return false;
            }
            for (std::size_t i = 0; i < a.size(); ++i) {
                if (!semantic_equal(a[i], b[i])) {
                    return false;
                }
            }
            return true;
        }

        case YAML::NodeType::Map: {
            const auto lhs = sorted_entries(a);
            const auto rhs = sorted_entries(b);
            if (lhs.size() != rhs.size()) {
                return false;
            }
            auto rit = rhs.begin();
            for (auto lit = lhs.begin(); lit != lhs.end(); ++lit, ++rit) {
                if (lit->first != rit->first || !semantic_equal(lit->second, rit->second)) {
                    return false;
                }
            }
            return true;
        }

        default:
            return true;
    }
}

std::string canonical_string(const YAML::Node& node) {
    if (is_empty_value(node)) {
        return "null";
    }

    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return "\"" + escape_json(node.Scalar()) + "\"";

        case YAML::NodeType::Sequence: {
            std::string out = "[";
            for (std::size_t i = 0; i < node.size(); ++i) {
                if (i > 0) {
                    out += ',';
                }
                out += canonical_string(node[i]);
            }
            out += ']';
            return out;
        }

        case YAML::NodeType::Map: {
            std::string out = "{";
            bool first = true;
            for (const auto& [key, value] : sorted_entries(node)) {
                if (!first) {
                    out += ',';
                }
                first = false;
                out += "\"" + escape_json(key) + "\":" + canonical_string(value);
            }
            out += '}';
            return out;
        }

        default:
            return "null";
    }
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace unstructured

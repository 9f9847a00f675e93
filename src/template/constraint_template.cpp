// ---------------------------------------------------------------------------
// constraint_template.cpp
// ---------------------------------------------------------------------------

#include "template/constraint_template.hpp"

#include <algorithm>

#include "common/unstructured.hpp"

ConstraintTemplate ConstraintTemplate::deep_copy() const {
    ConstraintTemplate cpy{};
    cpy.name    = name;
    cpy.kind    = kind;
    cpy.targets = targets;
    if (parameters_schema.IsDefined() && !parameters_schema.IsNull()) {
        cpy.parameters_schema = unstructured::deep_copy(parameters_schema);
    }
    return cpy;
}

std::vector<std::string> ConstraintTemplate::target_names() const {
    std::vector<std::string> names;
    names.reserve(targets.size());
    for (const auto& t : targets) {
        names.push_back(t.target);
    }
    return names;
}

std::vector<std::string> ConstraintTemplate::engines() const {
    std::vector<std::string> result;
    for (const auto& t : targets) {
        for (const auto& c : t.code) {
            if (std::find(result.begin(), result.end(), c.engine) == result.end()) {
                result.push_back(c.engine);
            }
        }
    }
    return result;
}

const TemplateCode* ConstraintTemplate::code_for(const std::string& target,
                                                 const std::string& engine) const {
    for (const auto& t : targets) {
        if (t.target != target) {
            continue;
        }
        for (const auto& c : t.code) {
            if (c.engine == engine) {
                return &c;
            }
        }
    }
    return nullptr;
}

static bool code_equal(const TemplateCode& a, const TemplateCode& b) {
    return a.engine == b.engine && a.source == b.source;
}

static bool target_equal(const TemplateTarget& a, const TemplateTarget& b) {
    if (a.target != b.target || a.libs != b.libs || a.code.size() != b.code.size()) {
        return false;
    }
    return std::equal(a.code.begin(), a.code.end(), b.code.begin(), code_equal);
}

bool semantic_equal(const ConstraintTemplate& a, const ConstraintTemplate& b) {
    if (a.name != b.name || a.kind != b.kind || a.targets.size() != b.targets.size()) {
        return false;
    }
    if (!std::equal(a.targets.begin(), a.targets.end(), b.targets.begin(), target_equal)) {
        return false;
    }
    return unstructured::semantic_equal(a.parameters_schema, b.parameters_schema);
}

bool same_target_set(std::vector<std::string> a, std::vector<std::string> b) {
    std::sort(a.begin(), a.end());
    a.erase(std::unique(a.begin(), a.end()), a.end());
    std::sort(b.begin(), b.end());
    b.erase(std::unique(b.begin(), b.end()), b.end());
    return a == b;
}

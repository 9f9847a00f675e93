// ---------------------------------------------------------------------------
// template_entry.cpp
// ---------------------------------------------------------------------------

#include "client/template_entry.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "common/unstructured.hpp"

namespace {

void push_unique(std::vector<std::string>& list, const std::string& value) {
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

EngineError invalid(std::string message, const YAML::Node& constraint) {
    return EngineError{
        ErrorCode::kInvalidConstraint,
        std::move(message),
        fmt::format("{}/{}", unstructured::get_kind(constraint), unstructured::get_name(constraint))
    };
}

}  // namespace

// ---------------------------------------------------------------------------
// ConstraintEntry
// ---------------------------------------------------------------------------
bool ConstraintEntry::is_scoped() const {
    return unstructured::to_lower(enforcement_action) == kScopedEnforcementAction;
}

std::optional<std::vector<std::string>>
ConstraintEntry::actions_for(const std::string& enforcement_point) const {
    if (!is_scoped()) {
        return std::vector<std::string>{};
    }

    if (enforcement_point == kAllEnforcementPoints) {
        std::vector<std::string> all;
        for (const auto& [ep, actions] : scoped_actions) {
            for (const auto& a : actions) {
                push_unique(all, a);
            }
        }
        if (all.empty()) {
            return std::nullopt;
        }
        return all;
    }

    const auto it = scoped_actions.find(enforcement_point);
    if (it == scoped_actions.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

// ---------------------------------------------------------------------------
// TemplateEntry
// ---------------------------------------------------------------------------
void TemplateEntry::add_active_driver(const std::string& name) {
    push_unique(active_drivers, name);
}

void TemplateEntry::remove_active_driver(const std::string& name) {
    active_drivers.erase(std::remove(active_drivers.begin(), active_drivers.end(), name),
                         active_drivers.end());
}

bool TemplateEntry::has_active_driver(const std::string& name) const {
    return std::find(active_drivers.begin(), active_drivers.end(), name) != active_drivers.end();
}

const std::string& TemplateEntry::target() const {
    static const std::string kNone;
    return templ.targets.empty() ? kNone : templ.targets.front().target;
}

// ---------------------------------------------------------------------------
// build_enforcement
// ---------------------------------------------------------------------------
std::expected<void, EngineError>
build_enforcement(const YAML::Node&               constraint,
                  const std::vector<std::string>& enforcement_points,
                  ConstraintEntry&                entry) {
    std::string action =
        unstructured::nested_string(constraint, {"spec", "enforcementAction"}).value_or("");
    if (action.empty()) {
        action = std::string(kDefaultEnforcementAction);
    }
    entry.enforcement_action = action;
    entry.scoped_actions.clear();

    if (!entry.is_scoped()) {
        return {};
    }

    const auto list = unstructured::find_path(constraint, {"spec", "scopedEnforcementActions"});
    if (!list.has_value() || !list->IsSequence() || list->size() == 0) {
        return std::unexpected(invalid(
            "scopedEnforcementActions is required when enforcementAction is 'scoped'", constraint));
    }

    for (std::size_t i = 0; i < list->size(); ++i) {
        const YAML::Node item = (*list)[i];
        const std::string where = fmt::format("spec.scopedEnforcementActions[{}]", i);

        const std::string scoped_action = unstructured::nested_string(item, {"action"}).value_or("");
        if (scoped_action.empty()) {
            return std::unexpected(invalid(where + ".action: Required value", constraint));
        }

        const auto eps = unstructured::find_path(item, {"enforcementPoints"});
        if (!eps.has_value() || !eps->IsSequence() || eps->size() == 0) {
            return std::unexpected(invalid(where + ".enforcementPoints: Required value", constraint));
        }

        for (std::size_t j = 0; j < eps->size(); ++j) {
            const std::string ep = unstructured::nested_string((*eps)[j], {"name"}).value_or("");
            if (ep.empty()) {
                return std::unexpected(invalid(
                    fmt::format("{}.enforcementPoints[{}].name: Required value", where, j),
                    constraint));
            }
            if (ep == kAllEnforcementPoints) {
                for (const auto& configured : enforcement_points) {
                    push_unique(entry.scoped_actions[configured], scoped_action);
                }
                continue;
            }
            if (std::find(enforcement_points.begin(), enforcement_points.end(), ep) ==
                enforcement_points.end()) {
                spdlog::warn("client: constraint {}/{} names enforcement point '{}' that is not "
                             "configured",
                             unstructured::get_kind(constraint), unstructured::get_name(constraint),
                             ep);
            }
            push_unique(entry.scoped_actions[ep], scoped_action);
        }
    }
    return {};
}

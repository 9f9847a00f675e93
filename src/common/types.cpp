// ---------------------------------------------------------------------------
// types.cpp
//
// ErrorCode / EngineError / ErrorMap 문자열 변환.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <utility>

#include <spdlog/spdlog.h>

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kInvalidConstraintTemplate: return "InvalidConstraintTemplate";
        case ErrorCode::kChangeTargets:             return "ChangeTargets";
        case ErrorCode::kNoDriver:                  return "NoDriver";
        case ErrorCode::kMissingConstraintTemplate: return "MissingConstraintTemplate";
        case ErrorCode::kInvalidConstraint:         return "InvalidConstraint";
        case ErrorCode::kMissingConstraint:         return "MissingConstraint";
        case ErrorCode::kNoReferentialDriver:       return "NoReferentialDriver";
        case ErrorCode::kDriverError:               return "DriverError";
        case ErrorCode::kTargetError:               return "TargetError";
        case ErrorCode::kInvalidConfig:             return "InvalidConfig";
        default:                                    return "Unknown";
    }
}

std::string EngineError::to_string() const {
    if (context.empty()) {
        return fmt::format("{}: {}", ::to_string(code), message);
    }
    return fmt::format("{}: {} ({})", ::to_string(code), message, context);
}

void ErrorMap::add(const std::string& key, EngineError error) {
    errors_[key].push_back(std::move(error));
}

std::string ErrorMap::to_string() const {
    std::string out;
    for (const auto& [key, list] : errors_) {
        for (const auto& error : list) {
            out += fmt::format("{}: {}\n", key, error.to_string());
        }
    }
    return out;
}

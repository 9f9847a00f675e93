#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// 엔진 이벤트(템플릿/constraint 변경, Review/Audit, 위반)를 JSON 한 줄씩
// 기록하는 spdlog 로거.
//
// [주입]
// 전역 인스턴스를 두지 않는다. ConstraintClient 가 ClientOptions::logger 로
// shared_ptr 를 받아 공유한다.
//
// [레벨]
// TemplateLog / ConstraintLog / ReviewLog 는 info, ViolationLog 는 warn.
// min_level 보다 낮은 이벤트는 직렬화하지 않고 버린다.
//
// [키]
// 구조체 필드 이름을 그대로 snake_case 키로 쓴다. ReviewLog::mode 는 "event",
// ReviewLog::duration 은 "duration_us" 로 기록된다.
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

class StructuredLogger {
public:
    // log_path 의 상위 디렉터리가 없으면 만든다.
    // sink 생성에 실패하면 std::runtime_error.
    StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path);

    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    void log_template(const TemplateLog& entry);
    void log_constraint(const ConstraintLog& entry);
    void log_review(const ReviewLog& entry);

    // Review 결과마다 한 번씩 불린다.
    void log_violation(const ViolationLog& entry);

    // 진단 메시지 (JSON 이 아닌 일반 텍스트)
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    void flush();

private:
    [[nodiscard]] bool accepts(LogLevel level) const noexcept {
        return logger_ && static_cast<int>(level) >= static_cast<int>(min_level_);
    }

    LogLevel                        min_level_;
    std::string                     logger_name_;
    std::shared_ptr<spdlog::logger> logger_;
};

// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// [로거 이름]
// 인스턴스마다 "ctgate-<n>" 으로 등록한다. 한 프로세스에서 여러 클라이언트
// (테스트 포함)가 각자 로거를 가질 수 있도록 이름이 겹치지 않게 한다.
//
// [sink]
// stdout + rotating file (100MB x 3). 패턴은 "%v" 로 두고 JSON 본문만 쓴다.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iterator>
#include <stdexcept>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

std::atomic<std::uint64_t> g_logger_seq{0};

constexpr std::size_t kMaxFileBytes = 100 * 1024 * 1024;
constexpr std::size_t kMaxFiles     = 3;

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

// 2026-01-31T12:00:00.123Z
std::string utc_timestamp(std::chrono::system_clock::time_point tp) {
    const auto        since_epoch = tp.time_since_epoch();
    const auto        ms = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch) % 1000;
    const std::time_t secs = std::chrono::system_clock::to_time_t(tp);

    std::tm utc{};
    gmtime_r(&secs, &utc);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                       utc.tm_hour, utc.tm_min, utc.tm_sec, ms.count());
}

// ---------------------------------------------------------------------------
// JsonLine
//   평평한 JSON 객체 한 줄을 만든다. 키는 호출 순서대로 기록된다.
// ---------------------------------------------------------------------------
class JsonLine {
public:
    JsonLine& text(std::string_view key, std::string_view value) {
        begin_field(key);
        quoted(value);
        return *this;
    }

    JsonLine& text_if(std::string_view key, std::string_view value) {
        return value.empty() ? *this : text(key, value);
    }

    JsonLine& texts(std::string_view key, const std::vector<std::string>& values) {
        begin_field(key);
        out_ += '[';
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                out_ += ',';
            }
            quoted(values[i]);
        }
        out_ += ']';
        return *this;
    }

    JsonLine& number(std::string_view key, std::int64_t value) {
        begin_field(key);
        fmt::format_to(std::back_inserter(out_), "{}", value);
        return *this;
    }

    JsonLine& flag(std::string_view key, bool value) {
        begin_field(key);
        out_ += value ? "true" : "false";
        return *this;
    }

    JsonLine& time(std::string_view key, std::chrono::system_clock::time_point tp) {
        return text(key, utc_timestamp(tp));
    }

    [[nodiscard]] std::string str() const { return out_ + '}'; }

private:
    void begin_field(std::string_view key) {
        if (out_.size() > 1) {
            out_ += ',';
        }
        quoted(key);
        out_ += ':';
    }

    void quoted(std::string_view value) {
        out_ += '"';
        for (const char c : value) {
            switch (c) {
                case '"':  out_ += "\\\""; break;
                case '\\': out_ += "\\\\"; break;
                case '\n': out_ += "\\n";  break;
                case '\r': out_ += "\\r";  break;
                case '\t': out_ += "\\t";  break;
                case '\b': out_ += "\\b";  break;
                case '\f': out_ += "\\f";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        fmt::format_to(std::back_inserter(out_), "\\u{:04x}",
                                       static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    } else {
                        out_ += c;
                    }
                    break;
            }
        }
        out_ += '"';
    }

    std::string out_{"{"};
};

}  // namespace

StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , logger_name_(fmt::format("ctgate-{}", g_logger_seq.fetch_add(1)))
{
    try {
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks{
            std::make_shared<spdlog::sinks::stdout_sink_mt>(),
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_path.string(), kMaxFileBytes,
                                                                   kMaxFiles),
        };

        logger_ = std::make_shared<spdlog::logger>(logger_name_, sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog(min_level));
        logger_->set_pattern("%v");
        logger_->flush_on(spdlog::level::trace);
        spdlog::register_logger(logger_);
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(fmt::format("structured logger {}: {}", log_path.string(), ex.what()));
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(fmt::format("structured logger {}: {}", log_path.string(), ex.what()));
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(logger_name_);
    }
}

void StructuredLogger::log_template(const TemplateLog& entry) {
    if (!accepts(LogLevel::kInfo)) {
        return;
    }
    logger_->info(JsonLine{}
                      .text("event", entry.event)
                      .text("name", entry.name)
                      .text("kind", entry.kind)
                      .text("engine", entry.engine)
                      .texts("targets", entry.targets)
                      .text("status", entry.status)
                      .text_if("error", entry.error)
                      .time("timestamp", entry.timestamp)
                      .str());
}

void StructuredLogger::log_constraint(const ConstraintLog& entry) {
    if (!accepts(LogLevel::kInfo)) {
        return;
    }
    logger_->info(JsonLine{}
                      .text("event", entry.event)
                      .text("kind", entry.kind)
                      .text("name", entry.name)
                      .text("enforcement_action", entry.enforcement_action)
                      .text("status", entry.status)
                      .text_if("error", entry.error)
                      .time("timestamp", entry.timestamp)
                      .str());
}

void StructuredLogger::log_review(const ReviewLog& entry) {
    if (!accepts(LogLevel::kInfo)) {
        return;
    }
    logger_->info(JsonLine{}
                      .text("event", entry.mode)
                      .text("enforcement_point", entry.enforcement_point)
                      .text("object", entry.object)
                      .number("targets", entry.targets)
                      .number("results", entry.results)
                      .number("errors", entry.errors)
                      .time("timestamp", entry.timestamp)
                      .number("duration_us", entry.duration.count())
                      .str());
}

void StructuredLogger::log_violation(const ViolationLog& entry) {
    if (!accepts(LogLevel::kWarn)) {
        return;
    }
    logger_->warn(JsonLine{}
                      .text("event", "violation")
                      .text("target", entry.target)
                      .text("constraint_kind", entry.constraint_kind)
                      .text("constraint_name", entry.constraint_name)
                      .text("enforcement_action", entry.enforcement_action)
                      .texts("scoped_actions", entry.scoped_actions)
                      .text("message", entry.message)
                      .flag("auto_rejected", entry.auto_rejected)
                      .time("timestamp", entry.timestamp)
                      .str());
}

void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// client.cpp
//
// ConstraintClient 구현.
//
// [드라이버 교체 순서]
// 1. 새 드라이버를 active 집합에 넣고 add_template
// 2. 캐시된 모든 constraint 를 이름 순으로 새 드라이버에 재적재
// 3. 나머지 active 드라이버에서 constraint → 템플릿 순으로 제거
// 중간에 실패하면 그대로 오류를 돌려준다. needs_replay 와 active 집합이
// 남아 있으므로 다음 add_template 이 이어서 정리한다.
//
// [Review 결과 조립]
// target(이름 순) → 템플릿 → constraint 순으로 matcher 를 평가하고,
// 드라이버별로 묶어 (target, driver) 당 한 번 질의한다. match 실패는
// 자동 거부 결과로 바뀌어 드라이버 결과 뒤에 붙는다.
// ---------------------------------------------------------------------------

#include "client/client.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>
#include <regex>
#include <set>
#include <utility>

#include <spdlog/spdlog.h>

#include "common/unstructured.hpp"

namespace {

const std::regex& target_name_format() {
    static const std::regex re(R"(^[a-zA-Z][a-zA-Z0-9.]*$)");
    return re;
}

EngineError invalid_config(std::string message) {
    return EngineError{ErrorCode::kInvalidConfig, std::move(message), "client"};
}

std::string constraint_id(const YAML::Node& constraint) {
    return fmt::format("{}/{}", unstructured::get_kind(constraint), unstructured::get_name(constraint));
}

// ---------------------------------------------------------------------------
// guarded
//   외부 구현체(handler/driver) 호출 중 발생한 yaml-cpp 예외를 EngineError 로
//   바꾼다. 공개 API 밖으로 예외가 새지 않게 한다.
// ---------------------------------------------------------------------------
template <typename Fn>
auto guarded(ErrorCode code, const std::string& context, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const YAML::Exception& e) {
        return std::unexpected(EngineError{code, e.what(), context});
    }
}

// metadata.name, apiVersion(group/version), kind 검사.
std::expected<void, EngineError> validate_constraint_metadata(const YAML::Node& constraint) {
    if (!constraint.IsDefined() || !constraint.IsMap()) {
        return std::unexpected(EngineError{
            ErrorCode::kInvalidConstraint, "constraint must be an object", ""});
    }
    const std::string id = constraint_id(constraint);

    if (unstructured::get_name(constraint).empty()) {
        return std::unexpected(EngineError{
            ErrorCode::kInvalidConstraint, "constraint has no name", id});
    }
    if (unstructured::get_kind(constraint).empty()) {
        return std::unexpected(EngineError{
            ErrorCode::kInvalidConstraint, "constraint has no kind", id});
    }

    const std::string group = unstructured::get_group(constraint);
    if (group != kConstraintsGroup) {
        return std::unexpected(EngineError{
            ErrorCode::kInvalidConstraint,
            fmt::format("wrong API Group for Constraint: got '{}', want '{}'", group,
                        kConstraintsGroup),
            id
        });
    }

    const std::string version = unstructured::get_version(constraint);
    if (std::find(kConstraintVersions.begin(), kConstraintVersions.end(), version) ==
        kConstraintVersions.end()) {
        return std::unexpected(EngineError{
            ErrorCode::kInvalidConstraint,
            fmt::format("unsupported API Version for Constraint: '{}'", version),
            id
        });
    }
    return {};
}

// status 를 제거하고 파라미터 기본값을 채운 사본.
YAML::Node normalize_constraint(const GeneratedSchema& schema, const YAML::Node& constraint) {
    YAML::Node copy = unstructured::deep_copy(constraint);
    if (copy.IsMap() && copy["status"]) {
        copy.remove("status");
    }
    SchemaValidator::apply_defaults(schema, copy);
    return copy;
}

Result copy_result(const Result& r) {
    Result cpy = r;
    cpy.metadata.reset(unstructured::deep_copy(r.metadata));
    cpy.constraint.reset(unstructured::deep_copy(r.constraint));
    return cpy;
}

std::string describe_object(const YAML::Node& obj) {
    if (!obj.IsDefined() || !obj.IsMap()) {
        return "";
    }
    if (const auto request_kind = unstructured::nested_string(obj, {"kind", "kind"});
        request_kind.has_value()) {
        return fmt::format("{}/{}/{}", *request_kind,
                           unstructured::nested_string(obj, {"namespace"}).value_or(""),
                           unstructured::nested_string(obj, {"name"}).value_or(""));
    }
    if (!unstructured::find_path(obj, {"kind"}).has_value()) {
        // { object, namespace } 입력
        if (const auto inner = unstructured::find_path(obj, {"object"}); inner.has_value()) {
            return describe_object(*inner);
        }
    }
    return fmt::format("{}/{}/{}", unstructured::get_kind(obj), unstructured::get_namespace(obj),
                       unstructured::get_name(obj));
}

Responses handled_ack(const std::string& target) {
    Responses ack{};
    ack.handled[target] = true;
    return ack;
}

}  // namespace

// ---------------------------------------------------------------------------
// ClientOptions::from_config
// ---------------------------------------------------------------------------
ClientOptions ClientOptions::from_config(const EngineConfig&                         config,
                                         std::vector<std::shared_ptr<TargetHandler>> targets,
                                         std::vector<std::shared_ptr<Driver>>        drivers) {
    const auto& priority = config.engine.driver_priority;
    const auto  rank     = [&priority](const std::shared_ptr<Driver>& d) {
        if (!d) {
            return priority.size();
        }
        const auto it = std::find(priority.begin(), priority.end(), d->name());
        return static_cast<std::size_t>(std::distance(priority.begin(), it));
    };
    std::stable_sort(drivers.begin(), drivers.end(),
                     [&rank](const auto& a, const auto& b) { return rank(a) < rank(b); });

    ClientOptions opts{};
    opts.targets                      = std::move(targets);
    opts.drivers                      = std::move(drivers);
    opts.enforcement_points           = config.engine.enforcement_points;
    opts.ignore_no_referential_driver = config.engine.ignore_no_referential_driver;
    return opts;
}

// ---------------------------------------------------------------------------
// 생성
// ---------------------------------------------------------------------------
std::expected<std::unique_ptr<ConstraintClient>, EngineError>
ConstraintClient::create(ClientOptions options) {
    if (options.targets.empty()) {
        return std::unexpected(invalid_config("at least one target is required"));
    }
    std::set<std::string> target_names;
    for (const auto& t : options.targets) {
        if (!t) {
            return std::unexpected(invalid_config("target handler must not be null"));
        }
        const std::string name = t->name();
        if (!std::regex_match(name, target_name_format())) {
            return std::unexpected(invalid_config(fmt::format(
                "target name '{}' is not of the form ^[a-zA-Z][a-zA-Z0-9.]*$", name)));
        }
        if (!target_names.insert(name).second) {
            return std::unexpected(invalid_config(fmt::format("duplicate target name '{}'", name)));
        }
    }

    if (options.drivers.empty()) {
        return std::unexpected(invalid_config("at least one driver is required"));
    }
    std::set<std::string> driver_names;
    for (const auto& d : options.drivers) {
        if (!d) {
            return std::unexpected(invalid_config("driver must not be null"));
        }
        const std::string name = d->name();
        if (name.empty()) {
            return std::unexpected(invalid_config("driver name must not be empty"));
        }
        if (!driver_names.insert(name).second) {
            return std::unexpected(invalid_config(fmt::format("duplicate driver name '{}'", name)));
        }
    }

    std::set<std::string> points;
    for (const auto& ep : options.enforcement_points) {
        if (ep.empty() || ep == kAllEnforcementPoints) {
            return std::unexpected(invalid_config(
                fmt::format("enforcement point '{}' is not a valid name", ep)));
        }
        if (!points.insert(ep).second) {
            return std::unexpected(invalid_config(
                fmt::format("duplicate enforcement point '{}'", ep)));
        }
    }

    for (const auto& t : options.targets) {
        const std::string target_name = t->name();
        const std::string library     = t->library();
        if (library.empty()) {
            return std::unexpected(invalid_config(
                fmt::format("target '{}' has no library", target_name)));
        }
        for (const auto& d : options.drivers) {
            auto installed = guarded(ErrorCode::kDriverError, target_name,
                                     [&] { return d->add_target_library(target_name, library); });
            if (!installed) {
                spdlog::error("client: driver {} rejected library of target {}: {}", d->name(),
                              target_name, installed.error().to_string());
                return std::unexpected(installed.error());
            }
        }
    }

    spdlog::info("client: created targets={} drivers={} enforcement_points={}",
                 options.targets.size(), options.drivers.size(), options.enforcement_points.size());
    // 생성자가 private 이므로 make_unique 대신 직접 new 한다.
    return std::unique_ptr<ConstraintClient>(new ConstraintClient(std::move(options)));
}

ConstraintClient::ConstraintClient(ClientOptions options)
    : drivers_(std::move(options.drivers))
    , enforcement_points_(std::move(options.enforcement_points))
    , ignore_no_referential_driver_(options.ignore_no_referential_driver)
    , logger_(std::move(options.logger))
    , stats_(std::move(options.stats))
{
    for (auto& t : options.targets) {
        const std::string name = t->name();
        targets_.emplace(name, std::move(t));
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼
// ---------------------------------------------------------------------------
std::expected<std::shared_ptr<TargetHandler>, EngineError>
ConstraintClient::validate_template(const ConstraintTemplate& templ) const {
    const auto fail = [&templ](std::string message) {
        return std::unexpected(EngineError{
            ErrorCode::kInvalidConstraintTemplate, std::move(message), templ.name});
    };

    if (templ.name.empty()) {
        return fail("template has no name");
    }
    if (templ.name != unstructured::to_lower(templ.kind)) {
        return fail(fmt::format("template's name {} is not equal to the lowercase of CRD's Kind: {}",
                                templ.name, unstructured::to_lower(templ.kind)));
    }
    if (templ.targets.size() != 1) {
        return fail(fmt::format("expected exactly 1 item in targets, got {}", templ.targets.size()));
    }

    const auto& target = templ.targets.front();
    const auto  it     = targets_.find(target.target);
    if (it == targets_.end()) {
        return fail(fmt::format("target {} not recognized", target.target));
    }
    if (target.code.empty()) {
        return fail(fmt::format("target {} declares no code", target.target));
    }
    for (const auto& code : target.code) {
        if (code.engine.empty()) {
            return fail(fmt::format("target {} has a code entry without engine", target.target));
        }
    }
    return it->second;
}

std::expected<std::shared_ptr<Driver>, EngineError>
ConstraintClient::select_driver(const ConstraintTemplate& templ) const {
    const auto engines = templ.engines();
    for (const auto& d : drivers_) {
        if (std::find(engines.begin(), engines.end(), d->name()) != engines.end()) {
            return d;
        }
    }

    std::string joined;
    for (std::size_t i = 0; i < engines.size(); ++i) {
        joined += (i == 0 ? "" : ", ") + engines[i];
    }
    return std::unexpected(EngineError{
        ErrorCode::kNoDriver,
        fmt::format("no driver available for engines [{}]", joined),
        templ.name
    });
}

std::shared_ptr<Driver> ConstraintClient::driver_by_name(const std::string& name) const {
    for (const auto& d : drivers_) {
        if (d->name() == name) {
            return d;
        }
    }
    return nullptr;
}

std::expected<ConstraintEntry, EngineError>
ConstraintClient::prepare_constraint(const TemplateEntry& entry, const YAML::Node& constraint) const {
    ConstraintEntry prepared{};
    prepared.constraint.reset(normalize_constraint(entry.schema, constraint));

    if (auto ok = entry.handler->validate_constraint(prepared.constraint); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = SchemaValidator::validate_instance(entry.schema, prepared.constraint); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = build_enforcement(prepared.constraint, enforcement_points_, prepared); !ok) {
        return std::unexpected(ok.error());
    }

    auto matcher = entry.handler->to_matcher(prepared.constraint);
    if (!matcher) {
        return std::unexpected(matcher.error());
    }
    prepared.matchers.emplace(entry.target(), std::move(*matcher));
    return prepared;
}

std::expected<void, EngineError>
ConstraintClient::purge_driver(const CallContext& ctx, TemplateEntry& entry,
                               const std::string& driver_name) {
    const auto driver = driver_by_name(driver_name);
    if (!driver) {
        entry.remove_active_driver(driver_name);
        return {};
    }

    for (const auto& [name, c] : entry.constraints) {
        if (auto ok = driver->remove_constraint(ctx, c.constraint); !ok) {
            spdlog::error("client: remove constraint {} from driver {} failed: {}",
                          constraint_id(c.constraint), driver_name, ok.error().to_string());
            return ok;
        }
    }
    if (auto ok = driver->remove_template(ctx, entry.templ); !ok) {
        spdlog::error("client: remove template {} from driver {} failed: {}",
                      entry.templ.name, driver_name, ok.error().to_string());
        return ok;
    }
    entry.remove_active_driver(driver_name);
    return {};
}

// ---------------------------------------------------------------------------
// add_template
// ---------------------------------------------------------------------------
std::expected<Responses, EngineError>
ConstraintClient::add_template(const CallContext& ctx, const ConstraintTemplate& templ) {
    TemplateLog log{
        .event     = "template_add",
        .name      = templ.name,
        .kind      = templ.kind,
        .targets   = templ.target_names(),
        .timestamp = std::chrono::system_clock::now(),
    };
    const auto finish = [this, &log](std::expected<Responses, EngineError> r) {
        log.status = r ? (log.status.empty() ? "ok" : log.status) : "error";
        if (!r) {
            log.error = r.error().to_string();
        }
        if (logger_) {
            logger_->log_template(log);
        }
        return r;
    };

    auto handler = validate_template(templ);
    if (!handler) {
        return finish(std::unexpected(handler.error()));
    }

    GeneratedSchema schema = SchemaGenerator::generate(templ, **handler);
    if (auto ok = SchemaValidator::validate_structural(schema); !ok) {
        return finish(std::unexpected(ok.error()));
    }

    auto driver = select_driver(templ);
    if (!driver) {
        return finish(std::unexpected(driver.error()));
    }
    const std::string engine = (*driver)->name();
    log.engine = engine;

    std::unique_lock lock(mutex_);

    const auto existing = templates_.find(templ.name);
    const bool is_new   = existing == templates_.end();

    if (!is_new) {
        TemplateEntry& cached = existing->second;
        if (!cached.constraints.empty() &&
            !same_target_set(cached.templ.target_names(), templ.target_names())) {
            return finish(std::unexpected(EngineError{
                ErrorCode::kChangeTargets,
                fmt::format("cannot change targets of template {} while it has {} constraint(s)",
                            templ.name, cached.constraints.size()),
                templ.name
            }));
        }
        if (semantic_equal(cached.templ, templ) && !cached.needs_replay &&
            cached.engine == engine && cached.active_drivers == std::vector<std::string>{engine}) {
            spdlog::debug("client: template {} unchanged", templ.name);
            log.status = "unchanged";
            return finish(handled_ack(templ.targets.front().target));
        }
    }

    TemplateEntry& entry = is_new ? templates_[templ.name] : existing->second;
    if (!is_new && entry.engine != engine) {
        spdlog::info("client: template {} moves from engine {} to {}", templ.name, entry.engine,
                     engine);
        entry.needs_replay = true;
    }

    entry.add_active_driver(engine);
    if (auto ok = (*driver)->add_template(ctx, templ); !ok) {
        spdlog::error("client: driver {} rejected template {}: {}", engine, templ.name,
                      ok.error().to_string());
        if (is_new) {
            templates_.erase(templ.name);
        }
        return finish(std::unexpected(ok.error()));
    }

    entry.templ   = templ.deep_copy();
    entry.schema  = schema;
    entry.handler = *handler;
    entry.engine  = engine;

    if (entry.needs_replay) {
        for (const auto& [name, c] : entry.constraints) {
            if (auto ok = (*driver)->add_constraint(ctx, c.constraint); !ok) {
                spdlog::error("client: replay of constraint {} onto driver {} failed: {}",
                              constraint_id(c.constraint), engine, ok.error().to_string());
                return finish(std::unexpected(ok.error()));
            }
        }
        entry.needs_replay = false;
    }

    const std::vector<std::string> stale = entry.active_drivers;
    for (const auto& name : stale) {
        if (name == engine) {
            continue;
        }
        if (auto ok = purge_driver(ctx, entry, name); !ok) {
            return finish(std::unexpected(ok.error()));
        }
    }

    spdlog::info("client: template {} registered engine={} constraints={}", templ.name, engine,
                 entry.constraints.size());
    return finish(handled_ack(entry.target()));
}

// ---------------------------------------------------------------------------
// remove_template
// ---------------------------------------------------------------------------
std::expected<Responses, EngineError>
ConstraintClient::remove_template(const CallContext& ctx, const ConstraintTemplate& templ) {
    std::unique_lock lock(mutex_);

    const auto it = templates_.find(templ.name);
    if (it == templates_.end()) {
        return Responses{};
    }

    TemplateEntry& entry = it->second;
    TemplateLog log{
        .event     = "template_remove",
        .name      = entry.templ.name,
        .kind      = entry.templ.kind,
        .engine    = entry.engine,
        .targets   = entry.templ.target_names(),
        .timestamp = std::chrono::system_clock::now(),
    };

    const std::vector<std::string> drivers = entry.active_drivers;
    for (const auto& name : drivers) {
        if (auto ok = purge_driver(ctx, entry, name); !ok) {
            log.status = "error";
            log.error  = ok.error().to_string();
            if (logger_) {
                logger_->log_template(log);
            }
            return std::unexpected(ok.error());
        }
    }

    Responses ack = handled_ack(entry.target());
    spdlog::info("client: template {} removed constraints={}", entry.templ.name,
                 entry.constraints.size());
    templates_.erase(it);

    log.status = "ok";
    if (logger_) {
        logger_->log_template(log);
    }
    return ack;
}

std::expected<ConstraintTemplate, EngineError>
ConstraintClient::get_template(const ConstraintTemplate& templ) const {
    std::shared_lock lock(mutex_);
    const auto it = templates_.find(templ.name);
    if (it == templates_.end()) {
        return std::unexpected(EngineError{
            ErrorCode::kMissingConstraintTemplate,
            fmt::format("template {} is not registered", templ.name),
            templ.name
        });
    }
    return it->second.templ.deep_copy();
}

std::expected<GeneratedSchema, EngineError>
ConstraintClient::create_schema(const ConstraintTemplate& templ) const {
    std::shared_lock lock(mutex_);
    auto handler = validate_template(templ);
    if (!handler) {
        return std::unexpected(handler.error());
    }
    GeneratedSchema schema = SchemaGenerator::generate(templ, **handler);
    if (auto ok = SchemaValidator::validate_structural(schema); !ok) {
        return std::unexpected(ok.error());
    }
    return schema;
}

// ---------------------------------------------------------------------------
// add_constraint
// ---------------------------------------------------------------------------
std::expected<Responses, EngineError>
ConstraintClient::add_constraint(const CallContext& ctx, const YAML::Node& constraint) {
    if (auto ok = validate_constraint_metadata(constraint); !ok) {
        return std::unexpected(ok.error());
    }
    const std::string kind = unstructured::get_kind(constraint);
    const std::string name = unstructured::get_name(constraint);

    ConstraintLog log{
        .event     = "constraint_add",
        .kind      = kind,
        .name      = name,
        .timestamp = std::chrono::system_clock::now(),
    };
    const auto fail = [this, &log](EngineError err) -> std::expected<Responses, EngineError> {
        log.status = "error";
        log.error  = err.to_string();
        if (logger_) {
            logger_->log_constraint(log);
        }
        return std::unexpected(std::move(err));
    };

    std::unique_lock lock(mutex_);

    const auto it = templates_.find(unstructured::to_lower(kind));
    if (it == templates_.end()) {
        return fail(EngineError{
            ErrorCode::kMissingConstraintTemplate,
            fmt::format("no template registered for constraint kind {}", kind),
            constraint_id(constraint)
        });
    }
    TemplateEntry& entry = it->second;

    const YAML::Node normalized = normalize_constraint(entry.schema, constraint);
    if (const auto cached = entry.constraints.find(name);
        cached != entry.constraints.end() &&
        unstructured::semantic_equal(cached->second.constraint, normalized)) {
        spdlog::debug("client: constraint {}/{} unchanged", kind, name);
        return handled_ack(entry.target());
    }

    auto prepared = prepare_constraint(entry, normalized);
    if (!prepared) {
        return fail(prepared.error());
    }

    const auto driver = driver_by_name(entry.engine);
    if (!driver) {
        return fail(EngineError{
            ErrorCode::kNoDriver,
            fmt::format("driver {} for template {} is not registered", entry.engine, entry.templ.name),
            constraint_id(constraint)
        });
    }
    if (auto ok = driver->add_constraint(ctx, prepared->constraint); !ok) {
        return fail(ok.error());
    }

    log.enforcement_action = prepared->enforcement_action;
    log.status             = "ok";
    entry.constraints.insert_or_assign(name, std::move(*prepared));

    spdlog::info("client: constraint {}/{} added template={}", kind, name, entry.templ.name);
    if (logger_) {
        logger_->log_constraint(log);
    }
    return handled_ack(entry.target());
}

// ---------------------------------------------------------------------------
// remove_constraint
// ---------------------------------------------------------------------------
std::expected<Responses, EngineError>
ConstraintClient::remove_constraint(const CallContext& ctx, const YAML::Node& constraint) {
    if (auto ok = validate_constraint_metadata(constraint); !ok) {
        return std::unexpected(ok.error());
    }
    const std::string kind = unstructured::get_kind(constraint);
    const std::string name = unstructured::get_name(constraint);

    std::unique_lock lock(mutex_);

    const auto it = templates_.find(unstructured::to_lower(kind));
    if (it == templates_.end()) {
        return Responses{};
    }
    TemplateEntry& entry = it->second;

    const auto cached = entry.constraints.find(name);
    const YAML::Node& target_constraint =
        cached != entry.constraints.end() ? cached->second.constraint : constraint;

    for (const auto& driver_name : entry.active_drivers) {
        const auto driver = driver_by_name(driver_name);
        if (!driver) {
            continue;
        }
        if (auto ok = driver->remove_constraint(ctx, target_constraint); !ok) {
            if (logger_) {
                logger_->log_constraint(ConstraintLog{
                    .event     = "constraint_remove",
                    .kind      = kind,
                    .name      = name,
                    .status    = "error",
                    .error     = ok.error().to_string(),
                    .timestamp = std::chrono::system_clock::now(),
                });
            }
            return std::unexpected(ok.error());
        }
    }

    if (cached != entry.constraints.end()) {
        entry.constraints.erase(cached);
        spdlog::info("client: constraint {}/{} removed", kind, name);
        if (logger_) {
            logger_->log_constraint(ConstraintLog{
                .event     = "constraint_remove",
                .kind      = kind,
                .name      = name,
                .status    = "ok",
                .timestamp = std::chrono::system_clock::now(),
            });
        }
    }
    return handled_ack(entry.target());
}

std::expected<YAML::Node, EngineError>
ConstraintClient::get_constraint(const YAML::Node& constraint) const {
    if (auto ok = validate_constraint_metadata(constraint); !ok) {
        return std::unexpected(ok.error());
    }
    const std::string kind = unstructured::get_kind(constraint);
    const std::string name = unstructured::get_name(constraint);

    std::shared_lock lock(mutex_);
    const auto it = templates_.find(unstructured::to_lower(kind));
    if (it == templates_.end()) {
        return std::unexpected(EngineError{
            ErrorCode::kMissingConstraintTemplate,
            fmt::format("no template registered for constraint kind {}", kind),
            constraint_id(constraint)
        });
    }
    const auto cached = it->second.constraints.find(name);
    if (cached == it->second.constraints.end()) {
        return std::unexpected(EngineError{
            ErrorCode::kMissingConstraint,
            fmt::format("constraint {} of kind {} is not registered", name, kind),
            constraint_id(constraint)
        });
    }
    return unstructured::deep_copy(cached->second.constraint);
}

std::expected<void, EngineError>
ConstraintClient::validate_constraint(const YAML::Node& constraint) const {
    if (auto ok = validate_constraint_metadata(constraint); !ok) {
        return ok;
    }
    const std::string kind = unstructured::get_kind(constraint);

    std::shared_lock lock(mutex_);
    const auto it = templates_.find(unstructured::to_lower(kind));
    if (it == templates_.end()) {
        return std::unexpected(EngineError{
            ErrorCode::kMissingConstraintTemplate,
            fmt::format("no template registered for constraint kind {}", kind),
            constraint_id(constraint)
        });
    }
    if (auto prepared = prepare_constraint(it->second, constraint); !prepared) {
        return std::unexpected(prepared.error());
    }
    return {};
}

// ---------------------------------------------------------------------------
// add_data / remove_data
// ---------------------------------------------------------------------------
std::expected<QueryOutcome, EngineError>
ConstraintClient::add_data(const CallContext& ctx, const YAML::Node& data) {
    std::vector<std::shared_ptr<Driver>> capable;
    std::copy_if(drivers_.begin(), drivers_.end(), std::back_inserter(capable),
                 [](const auto& d) { return d->supports_referential_data(); });
    if (capable.empty()) {
        if (ignore_no_referential_driver_) {
            spdlog::warn("client: no driver supports referential data, add_data ignored");
            return QueryOutcome{};
        }
        return std::unexpected(EngineError{
            ErrorCode::kNoReferentialDriver, "no driver supports referential data", "add_data"});
    }

    QueryOutcome outcome{};
    for (const auto& [target_name, handler] : targets_) {
        auto processed = guarded(ErrorCode::kTargetError, target_name,
                                 [&] { return handler->process_data(data); });
        if (!processed) {
            outcome.errors.add(target_name, processed.error());
            continue;
        }
        if (!processed->handled) {
            continue;
        }

        DataCache* cache = handler->cache();
        if (cache != nullptr) {
            if (auto ok = cache->add(processed->key, processed->value); !ok) {
                outcome.errors.add(target_name, ok.error());
                continue;
            }
        }

        bool failed = false;
        for (const auto& d : capable) {
            auto ok = guarded(ErrorCode::kDriverError, target_name, [&] {
                return d->add_data(ctx, target_name, processed->key, processed->value);
            });
            if (!ok) {
                spdlog::warn("client: driver {} add_data key={} failed: {}", d->name(),
                             processed->key, ok.error().to_string());
                outcome.errors.add(target_name, ok.error());
                failed = true;
                break;
            }
        }

        if (failed) {
            if (cache != nullptr) {
                cache->remove(processed->key);
            }
            continue;
        }
        outcome.responses.handled[target_name] = true;
    }
    return outcome;
}

std::expected<QueryOutcome, EngineError>
ConstraintClient::remove_data(const CallContext& ctx, const YAML::Node& data) {
    std::vector<std::shared_ptr<Driver>> capable;
    std::copy_if(drivers_.begin(), drivers_.end(), std::back_inserter(capable),
                 [](const auto& d) { return d->supports_referential_data(); });
    if (capable.empty()) {
        if (ignore_no_referential_driver_) {
            spdlog::warn("client: no driver supports referential data, remove_data ignored");
            return QueryOutcome{};
        }
        return std::unexpected(EngineError{
            ErrorCode::kNoReferentialDriver, "no driver supports referential data", "remove_data"});
    }

    QueryOutcome outcome{};
    for (const auto& [target_name, handler] : targets_) {
        auto processed = guarded(ErrorCode::kTargetError, target_name,
                                 [&] { return handler->process_data(data); });
        if (!processed) {
            outcome.errors.add(target_name, processed.error());
            continue;
        }
        if (!processed->handled) {
            continue;
        }

        bool failed = false;
        for (const auto& d : capable) {
            auto ok = guarded(ErrorCode::kDriverError, target_name, [&] {
                return d->remove_data(ctx, target_name, processed->key);
            });
            if (!ok) {
                outcome.errors.add(target_name, ok.error());
                failed = true;
                break;
            }
        }
        if (failed) {
            continue;
        }

        if (DataCache* cache = handler->cache(); cache != nullptr) {
            cache->remove(processed->key);
        }
        outcome.responses.handled[target_name] = true;
    }
    return outcome;
}

// ---------------------------------------------------------------------------
// query_target
// ---------------------------------------------------------------------------
void ConstraintClient::query_target(const CallContext&   ctx,
                                    const std::string&   target_name,
                                    const TargetHandler& handler,
                                    const YAML::Node&    review,
                                    QueryMode            mode,
                                    const ReviewOptions& opts,
                                    QueryOutcome&        outcome,
                                    std::uint64_t&       auto_rejections) const {
    struct Applied {
        const ConstraintEntry*   entry{nullptr};
        std::vector<std::string> scoped_actions{};
    };

    std::map<std::string, std::vector<YAML::Node>>        batches;   // engine → constraints
    std::map<std::pair<std::string, std::string>, Applied> applied;  // (kind, name)
    std::vector<Result>                                    rejected;

    for (const auto& [templ_name, entry] : templates_) {
        if (entry.target() != target_name) {
            continue;
        }
        for (const auto& [name, c] : entry.constraints) {
            auto actions = c.actions_for(opts.enforcement_point);
            if (!actions.has_value()) {
                continue;
            }

            if (mode == QueryMode::kReview) {
                const auto m = c.matchers.find(target_name);
                std::expected<bool, EngineError> matched =
                    m == c.matchers.end()
                        ? std::expected<bool, EngineError>(std::unexpected(EngineError{
                              ErrorCode::kTargetError, "no matcher for target", target_name}))
                        : guarded(ErrorCode::kTargetError, target_name,
                                  [&] { return m->second->match(review); });
                if (!matched) {
                    // 적용 여부를 알 수 없으면 거부한다.
                    Result r{};
                    r.target             = target_name;
                    r.msg                = fmt::format("unable to match constraints: {}",
                                                       matched.error().message);
                    r.metadata           = YAML::Node(YAML::NodeType::Map);
                    r.metadata["details"] = YAML::Node(YAML::NodeType::Map);
                    r.constraint         = unstructured::deep_copy(c.constraint);
                    r.enforcement_action = c.enforcement_action;
                    r.scoped_enforcement_actions = std::move(*actions);
                    rejected.push_back(std::move(r));
                    continue;
                }
                if (!*matched) {
                    continue;
                }
            }

            batches[entry.engine].push_back(unstructured::deep_copy(c.constraint));
            applied[{unstructured::get_kind(c.constraint), name}] =
                Applied{.entry = &c, .scoped_actions = std::move(*actions)};
        }
    }

    Response response{};
    response.target = target_name;

    for (const auto& driver : drivers_) {
        const auto batch = batches.find(driver->name());
        if (batch == batches.end()) {
            continue;
        }

        const QueryOptions qopts{.mode = mode, .tracing = opts.tracing, .stats = opts.stats};
        auto queried = guarded(ErrorCode::kDriverError, target_name, [&] {
            return driver->query(ctx, target_name, batch->second, review, qopts);
        });
        if (!queried) {
            spdlog::warn("client: driver {} query for target {} failed: {}", driver->name(),
                         target_name, queried.error().to_string());
            outcome.errors.add(target_name, queried.error());
            continue;
        }

        for (const auto& raw : queried->results) {
            Result r = copy_result(raw);
            const auto key = std::make_pair(unstructured::get_kind(r.constraint),
                                            unstructured::get_name(r.constraint));
            const auto hit = applied.find(key);
            if (hit == applied.end()) {
                outcome.errors.add(target_name, EngineError{
                    ErrorCode::kDriverError,
                    fmt::format("driver {} returned a result for unknown constraint {}/{}",
                                driver->name(), key.first, key.second),
                    target_name
                });
                continue;
            }

            r.target = target_name;
            r.constraint.reset(unstructured::deep_copy(hit->second.entry->constraint));
            r.enforcement_action         = hit->second.entry->enforcement_action;
            r.scoped_enforcement_actions = hit->second.scoped_actions;

            auto handled = guarded(ErrorCode::kTargetError, target_name,
                                   [&] { return handler.handle_violation(r); });
            if (!handled) {
                outcome.errors.add(target_name, handled.error());
                return;
            }
            response.results.push_back(std::move(r));
        }

        outcome.responses.stats_entries.insert(outcome.responses.stats_entries.end(),
                                               queried->stats.begin(), queried->stats.end());
        if (queried->trace.has_value()) {
            response.trace = response.trace.value_or("") + *queried->trace;
        }
    }

    auto_rejections += rejected.size();
    for (auto& r : rejected) {
        response.results.push_back(std::move(r));
    }
    response.sort();
    outcome.responses.by_target[target_name] = std::move(response);
}

void ConstraintClient::record_query(QueryMode mode, const std::string& enforcement_point,
                                    const std::string& object, const QueryOutcome& outcome,
                                    std::uint64_t auto_rejections,
                                    std::chrono::steady_clock::time_point started) const {
    const auto results = outcome.responses.results();

    if (stats_) {
        if (mode == QueryMode::kReview) {
            stats_->on_review(results.size(), auto_rejections, outcome.errors.size());
        } else {
            stats_->on_audit(results.size(), auto_rejections, outcome.errors.size());
        }
    }

    if (!logger_) {
        return;
    }
    const auto now = std::chrono::system_clock::now();
    for (const auto& r : results) {
        logger_->log_violation(ViolationLog{
            .target             = r.target,
            .constraint_kind    = unstructured::get_kind(r.constraint),
            .constraint_name    = unstructured::get_name(r.constraint),
            .enforcement_action = r.enforcement_action,
            .scoped_actions     = r.scoped_enforcement_actions,
            .message            = r.msg,
            .auto_rejected      = r.msg.starts_with("unable to match constraints"),
            .timestamp          = now,
        });
    }
    logger_->log_review(ReviewLog{
        .mode              = mode == QueryMode::kReview ? "review" : "audit",
        .enforcement_point = enforcement_point,
        .object            = object,
        .targets           = static_cast<std::uint32_t>(outcome.responses.by_target.size()),
        .results           = static_cast<std::uint32_t>(results.size()),
        .errors            = static_cast<std::uint32_t>(outcome.errors.size()),
        .timestamp         = now,
        .duration          = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started),
    });
}

// ---------------------------------------------------------------------------
// review / audit
// ---------------------------------------------------------------------------
QueryOutcome ConstraintClient::review(const CallContext& ctx, const YAML::Node& obj,
                                      const ReviewOptions& opts) const {
    const auto started = std::chrono::steady_clock::now();
    QueryOutcome  outcome{};
    std::uint64_t auto_rejections{0};

    std::shared_lock lock(mutex_);
    for (const auto& [target_name, handler] : targets_) {
        auto handled = guarded(ErrorCode::kTargetError, target_name,
                               [&] { return handler->handle_review(obj); });
        if (!handled) {
            spdlog::warn("client: target {} could not handle review: {}", target_name,
                         handled.error().to_string());
            outcome.errors.add(target_name, handled.error());
            continue;
        }
        if (!handled->handled) {
            continue;
        }
        query_target(ctx, target_name, *handler, handled->review, QueryMode::kReview, opts,
                     outcome, auto_rejections);
    }

    record_query(QueryMode::kReview, opts.enforcement_point, describe_object(obj), outcome,
                 auto_rejections, started);
    return outcome;
}

QueryOutcome ConstraintClient::audit(const CallContext& ctx, const ReviewOptions& opts) const {
    const auto started = std::chrono::steady_clock::now();
    QueryOutcome  outcome{};
    std::uint64_t auto_rejections{0};
    const YAML::Node no_review(YAML::NodeType::Null);

    std::shared_lock lock(mutex_);
    for (const auto& [target_name, handler] : targets_) {
        query_target(ctx, target_name, *handler, no_review, QueryMode::kAudit, opts, outcome,
                     auto_rejections);
    }

    record_query(QueryMode::kAudit, opts.enforcement_point, "", outcome, auto_rejections, started);
    return outcome;
}

// ---------------------------------------------------------------------------
// reset / dump
// ---------------------------------------------------------------------------
std::expected<void, EngineError> ConstraintClient::reset(const CallContext& ctx) {
    std::unique_lock lock(mutex_);

    for (auto it = templates_.begin(); it != templates_.end();) {
        const std::vector<std::string> drivers = it->second.active_drivers;
        for (const auto& name : drivers) {
            if (auto ok = purge_driver(ctx, it->second, name); !ok) {
                return ok;
            }
        }
        it = templates_.erase(it);
    }

    spdlog::info("client: registry reset");
    return {};
}

std::expected<std::string, EngineError> ConstraintClient::dump(const CallContext& ctx) const {
    std::shared_lock lock(mutex_);

    std::string out;
    for (const auto& driver : drivers_) {
        auto dumped = driver->dump(ctx);
        if (!dumped) {
            return std::unexpected(dumped.error());
        }
        out += fmt::format("--- driver: {} ---\n{}\n", driver->name(), *dumped);
    }
    return out;
}

// ---------------------------------------------------------------------------
// test_client_templates.cpp
//
// ConstraintClient 생성 / 템플릿 레지스트리 / reset / dump 테스트.
//
// [테스트 범위]
// - create(): target/driver/enforcement point 설정 검증, target library 전달
// - add_template(): 메타데이터 검증, 드라이버 선택, 멱등성
// - 엔진 교체: 새 드라이버에 constraint 재적재 후 이전 드라이버 정리
// - target 변경 금지 (라이브 constraint 가 있을 때)
// - remove_template(): constraint 를 하나씩 제거한 뒤 템플릿 제거
// - get_template(): 호출자 소유 사본
// - create_schema(): 레지스트리 불변
// ---------------------------------------------------------------------------

#include "fakes/client_fixture.hpp"

#include "common/unstructured.hpp"

#include <gtest/gtest.h>

using fakes::ClientFixture;
using fakes::kFakeTarget;
using fakes::kK8sTarget;

namespace {

ClientOptions minimal_options() {
    ClientOptions opts{};
    opts.targets = {std::make_shared<fakes::FakeTarget>()};
    opts.drivers = {std::make_shared<fakes::FakeDriver>("rego")};
    return opts;
}

void expect_invalid_config(ClientOptions opts) {
    const auto created = ConstraintClient::create(std::move(opts));
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, ErrorCode::kInvalidConfig) << created.error().to_string();
}

}  // namespace

// ---------------------------------------------------------------------------
// create
// ---------------------------------------------------------------------------
TEST(ClientCreate, AcceptsMinimalOptions) {
    const auto created = ConstraintClient::create(minimal_options());
    ASSERT_TRUE(created.has_value()) << created.error().to_string();
    EXPECT_EQ((*created)->enforcement_points(), (std::vector<std::string>{"audit", "webhook"}));
}

TEST(ClientCreate, RejectsMissingTargetsOrDrivers) {
    auto no_targets    = minimal_options();
    no_targets.targets = {};
    expect_invalid_config(std::move(no_targets));

    auto no_drivers    = minimal_options();
    no_drivers.drivers = {};
    expect_invalid_config(std::move(no_drivers));
}

TEST(ClientCreate, RejectsBadTargetNames) {
    auto bad_name    = minimal_options();
    bad_name.targets = {std::make_shared<fakes::FakeTarget>("1bad")};
    expect_invalid_config(std::move(bad_name));

    auto dup_name    = minimal_options();
    dup_name.targets = {std::make_shared<fakes::FakeTarget>("a.target"),
                        std::make_shared<fakes::FakeTarget>("a.target")};
    expect_invalid_config(std::move(dup_name));
}

TEST(ClientCreate, RejectsDuplicateDrivers) {
    auto opts    = minimal_options();
    opts.drivers = {std::make_shared<fakes::FakeDriver>("rego"),
                    std::make_shared<fakes::FakeDriver>("rego")};
    expect_invalid_config(std::move(opts));
}

TEST(ClientCreate, RejectsBadEnforcementPoints) {
    auto wildcard               = minimal_options();
    wildcard.enforcement_points = {"*"};
    expect_invalid_config(std::move(wildcard));

    auto dup               = minimal_options();
    dup.enforcement_points = {"audit", "audit"};
    expect_invalid_config(std::move(dup));
}

TEST(ClientCreate, DeliversTargetLibrariesToEveryDriver) {
    auto k8s  = std::make_shared<K8sValidationTarget>();
    auto fake = std::make_shared<fakes::FakeTarget>();
    auto rego = std::make_shared<fakes::FakeDriver>("rego");
    auto cel  = std::make_shared<fakes::FakeDriver>("cel");

    ClientOptions opts{};
    opts.targets = {k8s, fake};
    opts.drivers = {cel, rego};
    ASSERT_TRUE(ConstraintClient::create(std::move(opts)).has_value());

    for (const auto& driver : {cel, rego}) {
        EXPECT_EQ(driver->calls(),
                  (std::vector<std::string>{"add_target_library:" + kK8sTarget,
                                            "add_target_library:" + kFakeTarget}))
            << driver->name();
        EXPECT_EQ(driver->library_of(kK8sTarget), k8s->library());
        EXPECT_EQ(driver->library_of(kFakeTarget), "package fake");
    }
}

TEST(ClientCreate, RejectsTargetWithoutLibrary) {
    auto fake          = std::make_shared<fakes::FakeTarget>();
    fake->library_text = "";
    auto rego          = std::make_shared<fakes::FakeDriver>("rego");

    ClientOptions opts{};
    opts.targets = {fake};
    opts.drivers = {rego};
    expect_invalid_config(std::move(opts));
    EXPECT_TRUE(rego->calls().empty());
}

TEST(ClientCreate, FailsWhenDriverRejectsLibrary) {
    auto rego = std::make_shared<fakes::FakeDriver>("rego");
    rego->fail_on("add_target_library");

    auto opts    = minimal_options();
    opts.drivers = {rego};
    const auto created = ConstraintClient::create(std::move(opts));
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code, ErrorCode::kDriverError);
    EXPECT_EQ(created.error().message, "injected add_target_library failure");
}

// ---------------------------------------------------------------------------
// add_template: 검증
// ---------------------------------------------------------------------------
TEST_F(ClientFixture, AddTemplate_RejectsNameKindMismatch) {
    auto templ = fakes::make_template("K8sDenyAll");
    templ.name = "denyall";

    const auto r = client_->add_template(ctx_, templ);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::kInvalidConstraintTemplate);
    EXPECT_NE(r.error().message.find("lowercase of CRD's Kind"), std::string::npos);
    EXPECT_EQ(rego_->count_calls("add_template"), 0u);
}

TEST_F(ClientFixture, AddTemplate_RequiresExactlyOneTarget) {
    auto none = fakes::make_template("K8sDenyAll");
    none.targets.clear();
    ASSERT_FALSE(client_->add_template(ctx_, none).has_value());

    auto two = fakes::make_template("K8sDenyAll");
    two.targets.push_back(fakes::make_template("K8sDenyAll", {{"rego", "deny_all"}}, kFakeTarget)
                              .targets.front());
    const auto r = client_->add_template(ctx_, two);
    ASSERT_FALSE(r.has_value());
    EXPECT_NE(r.error().message.find("expected exactly 1 item in targets, got 2"), std::string::npos);
}

TEST_F(ClientFixture, AddTemplate_RejectsUnknownTarget) {
    const auto r = client_->add_template(
        ctx_, fakes::make_template("K8sDenyAll", {{"rego", "deny_all"}}, "unknown.target"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::kInvalidConstraintTemplate);
    EXPECT_NE(r.error().message.find("not recognized"), std::string::npos);
}

TEST_F(ClientFixture, AddTemplate_NoDriverForEngine) {
    const auto r = client_->add_template(ctx_, fakes::make_template("K8sDenyAll", {{"wasm", "x"}}));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::kNoDriver);
    EXPECT_NE(r.error().message.find("wasm"), std::string::npos);
}

TEST_F(ClientFixture, AddTemplate_RejectsStructurallyInvalidSchema) {
    const auto r = client_->add_template(
        ctx_, fakes::make_template("K8sBadType", {{"rego", "deny_all"}}, kK8sTarget,
                                   "type: object\nproperties: {size: {type: float}}"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::kInvalidConstraintTemplate);
}

// ---------------------------------------------------------------------------
// add_template: 드라이버 선택과 멱등성
// ---------------------------------------------------------------------------
TEST_F(ClientFixture, AddTemplate_UsesHighestPriorityDeclaredEngine) {
    const auto r = client_->add_template(ctx_, fakes::make_required_labels_template());
    ASSERT_TRUE(r.has_value()) << r.error().to_string();
    EXPECT_TRUE(r->handled.at(kK8sTarget));

    EXPECT_TRUE(rego_->has_template("k8srequiredlabels"));
    EXPECT_FALSE(cel_->has_template("k8srequiredlabels"));

    ASSERT_NO_FATAL_FAILURE(add_template_ok(
        fakes::make_template("K8sBoth", {{"rego", "deny_all"}, {"cel", "deny_all"}})));
    EXPECT_TRUE(cel_->has_template("k8sboth")) << "cel is ahead of rego in driver priority";
    EXPECT_FALSE(rego_->has_template("k8sboth"));
}

TEST_F(ClientFixture, AddTemplate_UnchangedTemplateIsNotResent) {
    const auto templ = fakes::make_required_labels_template();
    ASSERT_NO_FATAL_FAILURE(add_template_ok(templ));
    const auto again = client_->add_template(ctx_, templ);
    ASSERT_TRUE(again.has_value());
    EXPECT_TRUE(again->handled.at(kK8sTarget));
    EXPECT_EQ(rego_->count_calls("add_template"), 1u);

    auto changed = fakes::make_required_labels_template();
    changed.targets.front().code.front().source = "required_labels v2";
    ASSERT_NO_FATAL_FAILURE(add_template_ok(changed));
    EXPECT_EQ(rego_->count_calls("add_template"), 2u);
}

TEST_F(ClientFixture, AddTemplate_NewTemplateRejectedByDriverIsNotCached) {
    rego_->fail_on("add_template");
    const auto templ = fakes::make_template("K8sDenyAll");
    const auto r     = client_->add_template(ctx_, templ);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::kDriverError);

    const auto got = client_->get_template(templ);
    ASSERT_FALSE(got.has_value());
    EXPECT_EQ(got.error().code, ErrorCode::kMissingConstraintTemplate);
}

// ---------------------------------------------------------------------------
// 엔진 교체
// ---------------------------------------------------------------------------
TEST_F(ClientFixture, AddTemplate_EngineChangeReplaysConstraintsThenPurgesOldDriver) {
    ASSERT_NO_FATAL_FAILURE(add_template_ok(fakes::make_template("K8sDenyAll")));
    ASSERT_NO_FATAL_FAILURE(add_constraint_ok(fakes::make_constraint("K8sDenyAll", "c1")));
    ASSERT_TRUE(rego_->has_constraint("K8sDenyAll", "c1"));
    rego_->clear_calls();

    ASSERT_NO_FATAL_FAILURE(add_template_ok(
        fakes::make_template("K8sDenyAll", {{"cel", "deny_all"}, {"rego", "deny_all"}})));

    EXPECT_EQ(cel_->calls(),
              (std::vector<std::string>{"add_template:k8sdenyall", "add_constraint:K8sDenyAll/c1"}));
    EXPECT_EQ(rego_->calls(),
              (std::vector<std::string>{"remove_constraint:K8sDenyAll/c1",
                                        "remove_template:k8sdenyall"}));
    EXPECT_TRUE(cel_->has_constraint("K8sDenyAll", "c1"));
    EXPECT_FALSE(rego_->has_template("k8sdenyall"));
    EXPECT_EQ(rego_->constraint_count(), 0u);
}

TEST_F(ClientFixture, AddTemplate_FailedReplayIsCompletedByNextUpdate) {
    ASSERT_NO_FATAL_FAILURE(add_template_ok(fakes::make_template("K8sDenyAll")));
    ASSERT_NO_FATAL_FAILURE(add_constraint_ok(fakes::make_constraint("K8sDenyAll", "c1")));

    const auto moved = fakes::make_template("K8sDenyAll", {{"cel", "deny_all"}, {"rego", "deny_all"}});

    cel_->fail_on("add_constraint");
    const auto failed = client_->add_template(ctx_, moved);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::kDriverError);
    EXPECT_TRUE(rego_->has_constraint("K8sDenyAll", "c1")) << "old driver keeps serving until replay succeeds";

    cel_->clear_failures();
    ASSERT_NO_FATAL_FAILURE(add_template_ok(moved));
    EXPECT_TRUE(cel_->has_constraint("K8sDenyAll", "c1"));
    EXPECT_FALSE(rego_->has_template("k8sdenyall"));
    EXPECT_FALSE(rego_->has_constraint("K8sDenyAll", "c1"));

    // 정리가 끝났으므로 같은 템플릿은 더 이상 드라이버로 전달되지 않는다.
    cel_->clear_calls();
    ASSERT_NO_FATAL_FAILURE(add_template_ok(moved));
    EXPECT_EQ(cel_->count_calls("add_template"), 0u);
}

// ---------------------------------------------------------------------------
// target 변경
// ---------------------------------------------------------------------------
TEST_F(ClientFixture, AddTemplate_CannotChangeTargetsWithLiveConstraints) {
    ASSERT_NO_FATAL_FAILURE(add_template_ok(fakes::make_template("K8sDenyAll")));
    ASSERT_NO_FATAL_FAILURE(add_constraint_ok(fakes::make_constraint("K8sDenyAll", "c1")));

    const auto r = client_->add_template(
        ctx_, fakes::make_template("K8sDenyAll", {{"rego", "deny_all"}}, kFakeTarget));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::kChangeTargets);
}

TEST_F(ClientFixture, AddTemplate_CanChangeTargetsWithoutConstraints) {
    ASSERT_NO_FATAL_FAILURE(add_template_ok(fakes::make_template("K8sDenyAll")));

    const auto r = client_->add_template(
        ctx_, fakes::make_template("K8sDenyAll", {{"rego", "deny_all"}}, kFakeTarget));
    ASSERT_TRUE(r.has_value()) << r.error().to_string();
    EXPECT_TRUE(r->handled.at(kFakeTarget));
}

// ---------------------------------------------------------------------------
// remove_template
// ---------------------------------------------------------------------------
TEST_F(ClientFixture, RemoveTemplate_RemovesConstraintsBeforeTemplate) {
    const auto templ = fakes::make_required_labels_template();
    ASSERT_NO_FATAL_FAILURE(add_template_ok(templ));
    ASSERT_NO_FATAL_FAILURE(add_constraint_ok(fakes::make_constraint(
        "K8sRequiredLabels", "must-have-owner", "parameters: {labels: [owner]}")));
    rego_->clear_calls();

    const auto r = client_->remove_template(ctx_, templ);
    ASSERT_TRUE(r.has_value()) << r.error().to_string();
    EXPECT_TRUE(r->handled.at(kK8sTarget));
    EXPECT_EQ(rego_->calls(),
              (std::vector<std::string>{"remove_constraint:K8sRequiredLabels/must-have-owner",
                                        "remove_template:k8srequiredlabels"}));

    const auto lookup = client_->get_constraint(
        fakes::make_constraint("K8sRequiredLabels", "must-have-owner"));
    ASSERT_FALSE(lookup.has_value());
    EXPECT_EQ(lookup.error().code, ErrorCode::kMissingConstraintTemplate);
}

TEST_F(ClientFixture, RemoveTemplate_UnknownTemplateIsNoop) {
    const auto r = client_->remove_template(ctx_, fakes::make_template("K8sNeverAdded"));
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->handled.empty());
    EXPECT_TRUE(rego_->calls().empty());
}

TEST_F(ClientFixture, RemoveTemplate_DriverFailureKeepsTemplate) {
    const auto templ = fakes::make_template("K8sDenyAll");
    ASSERT_NO_FATAL_FAILURE(add_template_ok(templ));

    rego_->fail_on("remove_template");
    ASSERT_FALSE(client_->remove_template(ctx_, templ).has_value());
    EXPECT_TRUE(client_->get_template(templ).has_value());

    rego_->clear_failures();
    ASSERT_TRUE(client_->remove_template(ctx_, templ).has_value());
    EXPECT_FALSE(client_->get_template(templ).has_value());
}

// ---------------------------------------------------------------------------
// get_template / create_schema
// ---------------------------------------------------------------------------
TEST_F(ClientFixture, GetTemplate_ReturnsIndependentCopy) {
    const auto templ = fakes::make_required_labels_template();
    ASSERT_NO_FATAL_FAILURE(add_template_ok(templ));

    auto first = client_->get_template(templ);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->kind, "K8sRequiredLabels");
    first->parameters_schema["properties"]["injected"]["type"] = "string";
    first->targets.front().code.front().source = "tampered";

    const auto second = client_->get_template(templ);
    ASSERT_TRUE(second.has_value());
    EXPECT_FALSE(unstructured::find_path(second->parameters_schema, {"properties", "injected"})
                     .has_value());
    EXPECT_EQ(second->targets.front().code.front().source, "required_labels");
}

TEST_F(ClientFixture, CreateSchema_DoesNotRegisterTemplate) {
    const auto templ  = fakes::make_required_labels_template();
    const auto schema = client_->create_schema(templ);
    ASSERT_TRUE(schema.has_value()) << schema.error().to_string();
    EXPECT_EQ(schema->kind, "K8sRequiredLabels");
    EXPECT_EQ(schema->group, "constraints.gatekeeper.sh");

    EXPECT_FALSE(client_->get_template(templ).has_value());
    EXPECT_TRUE(rego_->calls().empty());

    const auto bad = client_->create_schema(fakes::make_template("K8sDenyAll", {{"rego", "x"}},
                                                                 "unknown.target"));
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::kInvalidConstraintTemplate);
}

// ---------------------------------------------------------------------------
// reset / dump
// ---------------------------------------------------------------------------
TEST_F(ClientFixture, Reset_ClearsRegistryAndDrivers) {
    const auto labels = fakes::make_required_labels_template();
    ASSERT_NO_FATAL_FAILURE(add_template_ok(labels));
    ASSERT_NO_FATAL_FAILURE(add_template_ok(
        fakes::make_template("FakeDenyAll", {{"cel", "deny_all"}}, kFakeTarget)));
    ASSERT_NO_FATAL_FAILURE(add_constraint_ok(fakes::make_constraint(
        "K8sRequiredLabels", "must-have-owner", "parameters: {labels: [owner]}")));

    const auto r = client_->reset(ctx_);
    ASSERT_TRUE(r.has_value()) << r.error().to_string();

    EXPECT_FALSE(client_->get_template(labels).has_value());
    EXPECT_FALSE(rego_->has_template("k8srequiredlabels"));
    EXPECT_FALSE(cel_->has_template("fakedenyall"));
    EXPECT_EQ(rego_->constraint_count(), 0u);
}

TEST_F(ClientFixture, Dump_ConcatenatesDriversInPriorityOrder) {
    ASSERT_NO_FATAL_FAILURE(add_template_ok(fakes::make_template("K8sDenyAll")));

    const auto dumped = client_->dump(ctx_);
    ASSERT_TRUE(dumped.has_value()) << dumped.error().to_string();

    const auto cel_pos  = dumped->find("--- driver: cel ---");
    const auto rego_pos = dumped->find("--- driver: rego ---");
    ASSERT_NE(cel_pos, std::string::npos);
    ASSERT_NE(rego_pos, std::string::npos);
    EXPECT_LT(cel_pos, rego_pos);
    EXPECT_NE(dumped->find("templates: k8sdenyall", rego_pos), std::string::npos);

    rego_->fail_on("dump");
    const auto failed = client_->dump(ctx_);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::kDriverError);
}

TEST_F(ClientFixture, CancelledContextIsPassedToDrivers) {
    CallContext cancelled;
    cancelled.cancel();

    const auto r = client_->add_template(cancelled, fakes::make_template("K8sDenyAll"));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "context expired");
}

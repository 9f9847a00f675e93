// ---------------------------------------------------------------------------
// test_client_review.cpp
//
// ConstraintClient Review / Audit 테스트.
//
// [테스트 범위]
// - must-have-owner 시나리오: 라벨 누락 Pod 은 위반, owner 라벨이 있으면 통과
// - 결과 결정성: (Kind, name, msg) 정렬
// - namespaceSelector: 포함 Namespace 라벨로 매칭
// - target 단위 오류 격리: handle_review / 드라이버 query / handle_violation
// - enforcement point 필터와 scoped action
// - match 실패 → 자동 거부 결과
// - tracing / stats 옵션
// - Audit: 적재된 참조 데이터 평가
// - 동시 Review/Audit 와 constraint 등록
// - StructuredLogger / EngineStats 연동
// ---------------------------------------------------------------------------

#include "fakes/client_fixture.hpp"

#include "common/unstructured.hpp"
#include "logger/structured_logger.hpp"
#include "stats/engine_stats.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

using fakes::ClientFixture;
using fakes::kFakeTarget;
using fakes::kK8sTarget;

namespace {

const char* const kOwnerOnPods = R"(
match:
  kinds:
    - apiGroups: [""]
      kinds: [Pod]
parameters:
  labels: [owner]
)";

class ReviewTest : public ClientFixture {
protected:
    void SetUp() override {
        ClientFixture::SetUp();
        ASSERT_NO_FATAL_FAILURE(add_template_ok(fakes::make_required_labels_template()));
        ASSERT_NO_FATAL_FAILURE(add_constraint_ok(
            fakes::make_constraint("K8sRequiredLabels", "must-have-owner", kOwnerOnPods)));
    }

    // k8s target 과 test.target 양쪽이 모두 처리하는 Pod.
    static YAML::Node dual_object() {
        YAML::Node obj = fakes::make_object("Pod", "web", "prod");
        obj["fake"]    = true;
        obj["name"]    = "web";
        return obj;
    }

    void add_fake_template_on_cel() {
        ASSERT_NO_FATAL_FAILURE(add_template_ok(
            fakes::make_template("FakeDenyAll", {{"cel", "deny_all"}}, kFakeTarget)));
        ASSERT_NO_FATAL_FAILURE(add_constraint_ok(fakes::make_constraint("FakeDenyAll", "fake-deny")));
    }
};

std::vector<std::string> names_of(const std::vector<Result>& results) {
    std::vector<std::string> out;
    for (const auto& r : results) {
        out.push_back(unstructured::get_kind(r.constraint) + "/" + unstructured::get_name(r.constraint));
    }
    return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// must-have-owner
// ---------------------------------------------------------------------------
TEST_F(ReviewTest, UnlabeledPodViolatesRequiredLabels) {
    const auto outcome =
        client_->review(ctx_, fakes::make_admission_request(fakes::make_object("Pod", "web", "prod")));
    ASSERT_TRUE(outcome.ok()) << outcome.errors.to_string();

    const auto results = outcome.responses.results();
    ASSERT_EQ(results.size(), 1u);
    const Result& r = results.front();
    EXPECT_EQ(r.target, kK8sTarget);
    EXPECT_EQ(r.msg, "you must provide labels: owner");
    EXPECT_EQ(r.enforcement_action, "deny");
    EXPECT_TRUE(r.scoped_enforcement_actions.empty());
    EXPECT_EQ(unstructured::get_name(r.constraint), "must-have-owner");
    EXPECT_EQ(r.metadata["details"]["missing_labels"][0].as<std::string>(), "owner");
}

TEST_F(ReviewTest, OwnerLabelPasses) {
    const auto pod = fakes::make_object("Pod", "web", "prod", {{"owner", "alice"}});
    const auto outcome = client_->review(ctx_, fakes::make_admission_request(pod));
    ASSERT_TRUE(outcome.ok()) << outcome.errors.to_string();
    EXPECT_TRUE(outcome.responses.results().empty());
    EXPECT_TRUE(outcome.responses.by_target.contains(kK8sTarget));
}

TEST_F(ReviewTest, RawObjectIsReviewedToo) {
    const auto outcome = client_->review(ctx_, fakes::make_object("Pod", "web", "prod"));
    ASSERT_TRUE(outcome.ok()) << outcome.errors.to_string();
    EXPECT_EQ(outcome.responses.results().size(), 1u);
}

TEST_F(ReviewTest, UnmatchedKindSkipsDriver) {
    rego_->clear_calls();
    const auto outcome =
        client_->review(ctx_, fakes::make_admission_request(fakes::make_object("Service", "svc", "prod")));
    ASSERT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.responses.results().empty());
    EXPECT_EQ(rego_->count_calls("query"), 0u);
}

TEST_F(ReviewTest, UnhandledInputProducesNoResponses) {
    const auto outcome = client_->review(ctx_, YAML::Load("{just: data}"));
    EXPECT_TRUE(outcome.ok());
    EXPECT_TRUE(outcome.responses.by_target.empty());
}

TEST_F(ReviewTest, ResultsAreCallerOwnedCopies) {
    auto outcome =
        client_->review(ctx_, fakes::make_admission_request(fakes::make_object("Pod", "web", "prod")));
    ASSERT_EQ(outcome.responses.by_target[kK8sTarget].results.size(), 1u);
    outcome.responses.by_target[kK8sTarget].results[0].constraint["spec"]["parameters"]["labels"]
        .push_back("tampered");

    const auto stored =
        client_->get_constraint(fakes::make_constraint("K8sRequiredLabels", "must-have-owner"));
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ((*stored)["spec"]["parameters"]["labels"].size(), 1u);
}

// ---------------------------------------------------------------------------
// 결정성
// ---------------------------------------------------------------------------
TEST_F(ReviewTest, ResultOrderIsDeterministic) {
    ASSERT_NO_FATAL_FAILURE(add_template_ok(fakes::make_template("K8sDenyAll")));
    ASSERT_NO_FATAL_FAILURE(add_constraint_ok(fakes::make_constraint("K8sDenyAll", "zeta")));
    ASSERT_NO_FATAL_FAILURE(add_constraint_ok(fakes::make_constraint("K8sDenyAll", "alpha")));

    const auto request = fakes::make_admission_request(fakes::make_object("Pod", "web", "prod"));
    const auto first   = client_->review(ctx_, request);
    const auto second  = client_->review(ctx_, request);

    EXPECT_EQ(names_of(first.responses.results()),
              (std::vector<std::string>{"K8sDenyAll/alpha", "K8sDenyAll/zeta",
                                        "K8sRequiredLabels/must-have-owner"}));
    EXPECT_EQ(first.responses.to_string(), second.responses.to_string());
}

TEST_F(ReviewTest, NamespaceSelectorFollowsContainingNamespace) {
    ASSERT_NO_FATAL_FAILURE(add_template_ok(fakes::make_template("K8sDenyAll")));
    ASSERT_NO_FATAL_FAILURE(add_constraint_ok(fakes::make_constraint("K8sDenyAll", "prod-only", R"(
match:
  namespaceSelector:
    matchLabels: {env: prod}
)")));

    const auto review_in = [this](const std::string& ns, const std::string& env) {
        YAML::Node input;
        input["object"]    = fakes::make_object("Pod", "web", ns, {{"owner", "alice"}});
        input["namespace"] = fakes::make_object("Namespace", ns, "", {{"env", env}});
        return client_->review(ctx_, input);
    };

    const auto dev = review_in("dev", "dev");
    ASSERT_TRUE(dev.ok()) << dev.errors.to_string();
    EXPECT_TRUE(dev.responses.results().empty());

    const auto prod = review_in("prod", "prod");
    ASSERT_TRUE(prod.ok()) << prod.errors.to_string();
    EXPECT_EQ(names_of(prod.responses.results()), (std::vector<std::string>{"K8sDenyAll/prod-only"}));
}

// ---------------------------------------------------------------------------
// target 단위 오류 격리
// ---------------------------------------------------------------------------
TEST_F(ReviewTest, HandleReviewFailureIsIsolatedToTarget) {
    ASSERT_NO_FATAL_FAILURE(add_fake_template_on_cel());
    fake_->fail_review = true;

    const auto outcome = client_->review(ctx_, dual_object());
    ASSERT_EQ(outcome.errors.size(), 1u);
    EXPECT_EQ(outcome.errors.at(kFakeTarget).code, ErrorCode::kTargetError);
    EXPECT_FALSE(outcome.responses.by_target.contains(kFakeTarget));
    EXPECT_EQ(outcome.responses.by_target.at(kK8sTarget).results.size(), 1u);
}

TEST_F(ReviewTest, DriverQueryFailureIsIsolatedToTarget) {
    ASSERT_NO_FATAL_FAILURE(add_fake_template_on_cel());
    rego_->fail_on("query");

    const auto outcome = client_->review(ctx_, dual_object());
    ASSERT_TRUE(outcome.errors.contains(kK8sTarget));
    EXPECT_EQ(outcome.errors.at(kK8sTarget).code, ErrorCode::kDriverError);
    EXPECT_FALSE(outcome.errors.contains(kFakeTarget));

    const auto& fake_results = outcome.responses.by_target.at(kFakeTarget).results;
    ASSERT_EQ(fake_results.size(), 1u);
    EXPECT_EQ(fake_results[0].msg, "denied by fake-deny");
    EXPECT_EQ(fake_results[0].metadata["handled_by"].as<std::string>(), kFakeTarget);
}

TEST_F(ReviewTest, EveryFailingDriverIsReportedForTarget) {
    ASSERT_NO_FATAL_FAILURE(add_template_ok(fakes::make_template("K8sDenyAll", {{"cel", "deny_all"}})));
    ASSERT_NO_FATAL_FAILURE(add_constraint_ok(fakes::make_constraint("K8sDenyAll", "deny-everything")));
    rego_->fail_on("query");
    cel_->fail_on("query");

    const auto outcome =
        client_->review(ctx_, fakes::make_admission_request(fakes::make_object("Pod", "web", "prod")));
    ASSERT_EQ(outcome.errors.size(), 1u);

    // 드라이버 우선순위 순서 (cel, rego)
    const auto& errors = outcome.errors.all(kK8sTarget);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].context, "cel");
    EXPECT_EQ(errors[1].context, "rego");
    EXPECT_EQ(errors[1].message, "injected query failure");
    EXPECT_TRUE(outcome.responses.results().empty());
}

TEST_F(ReviewTest, HandleViolationFailureDropsTargetResponse) {
    ASSERT_NO_FATAL_FAILURE(add_fake_template_on_cel());
    fake_->fail_violation = true;

    const auto outcome = client_->review(ctx_, dual_object());
    ASSERT_TRUE(outcome.errors.contains(kFakeTarget));
    EXPECT_EQ(outcome.errors.at(kFakeTarget).message, "violation rejected");
    EXPECT_FALSE(outcome.responses.by_target.contains(kFakeTarget));
    EXPECT_EQ(outcome.responses.by_target.at(kK8sTarget).results.size(), 1u);
}

TEST_F(ReviewTest, CancelledContextReportsDriverError) {
    CallContext cancelled;
    cancelled.cancel();

    const auto outcome = client_->review(
        cancelled, fakes::make_admission_request(fakes::make_object("Pod", "web", "prod")));
    ASSERT_TRUE(outcome.errors.contains(kK8sTarget));
    EXPECT_EQ(outcome.errors.at(kK8sTarget).message, "context expired");
}

// ---------------------------------------------------------------------------
// enforcement point
// ---------------------------------------------------------------------------
TEST_F(ReviewTest, ScopedConstraintOnlyAppliesAtItsEnforcementPoints) {
    ASSERT_NO_FATAL_FAILURE(add_template_ok(fakes::make_template("K8sDenyAll")));
    ASSERT_NO_FATAL_FAILURE(add_constraint_ok(fakes::make_constraint("K8sDenyAll", "webhook-warn", R"(
enforcementAction: scoped
scopedEnforcementActions:
  - action: warn
    enforcementPoints: [{name: webhook}]
)")));
    ASSERT_NO_FATAL_FAILURE(add_constraint_ok(fakes::make_constraint("K8sDenyAll", "everywhere-dryrun", R"(
enforcementAction: scoped
scopedEnforcementActions:
  - action: dryrun
    enforcementPoints: [{name: "*"}]
)")));

    const auto request = fakes::make_admission_request(fakes::make_object("Pod", "web", "prod"));
    const auto review_at = [&](const std::string& ep) {
        ReviewOptions opts{};
        opts.enforcement_point = ep;
        return client_->review(ctx_, request, opts).responses.results();
    };

    const auto audit = review_at("audit");
    EXPECT_EQ(names_of(audit),
              (std::vector<std::string>{"K8sDenyAll/everywhere-dryrun",
                                        "K8sRequiredLabels/must-have-owner"}))
        << "webhook-only constraint must not participate at audit";

    const auto webhook = review_at("webhook");
    ASSERT_EQ(webhook.size(), 3u);
    const auto scoped = std::find_if(webhook.begin(), webhook.end(), [](const Result& r) {
        return unstructured::get_name(r.constraint) == "webhook-warn";
    });
    ASSERT_NE(scoped, webhook.end());
    EXPECT_EQ(scoped->enforcement_action, "scoped");
    EXPECT_EQ(scoped->scoped_enforcement_actions, (std::vector<std::string>{"warn"}));

    EXPECT_EQ(review_at("*").size(), 3u);
    EXPECT_EQ(review_at("gator").size(), 1u) << "only the unscoped constraint remains";
}

// ---------------------------------------------------------------------------
// 자동 거부
// ---------------------------------------------------------------------------
TEST_F(ReviewTest, MatchFailureBecomesAutoRejection) {
    ASSERT_NO_FATAL_FAILURE(add_fake_template_on_cel());
    cel_->clear_calls();

    const auto outcome = client_->review(ctx_, fakes::make_fake_object("broken", true));
    ASSERT_TRUE(outcome.ok()) << outcome.errors.to_string();

    const auto& results = outcome.responses.by_target.at(kFakeTarget).results;
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].msg, "unable to match constraints: object cannot be matched");
    EXPECT_EQ(results[0].enforcement_action, "deny");
    EXPECT_EQ(unstructured::get_name(results[0].constraint), "fake-deny");
    ASSERT_TRUE(results[0].metadata["details"].IsMap());
    EXPECT_EQ(results[0].metadata["details"].size(), 0u);
    EXPECT_EQ(cel_->count_calls("query"), 0u) << "auto-rejected constraints are not sent to the driver";
}

// ---------------------------------------------------------------------------
// tracing / stats
// ---------------------------------------------------------------------------
TEST_F(ReviewTest, TracingAndStatsAreOptIn) {
    const auto request = fakes::make_admission_request(fakes::make_object("Pod", "web", "prod"));

    const auto plain = client_->review(ctx_, request);
    EXPECT_FALSE(plain.responses.by_target.at(kK8sTarget).trace.has_value());
    EXPECT_TRUE(plain.responses.stats_entries.empty());

    ReviewOptions opts{};
    opts.tracing = true;
    opts.stats   = true;
    const auto traced = client_->review(ctx_, request, opts);

    const auto& trace = traced.responses.by_target.at(kK8sTarget).trace;
    ASSERT_TRUE(trace.has_value());
    EXPECT_NE(trace->find("rego: evaluated 1 constraint(s)"), std::string::npos);
    EXPECT_NE(traced.responses.trace_dump().find(kK8sTarget), std::string::npos);

    ASSERT_EQ(traced.responses.stats_entries.size(), 1u);
    const auto& entry = traced.responses.stats_entries.front();
    EXPECT_EQ(entry.scope, "query");
    EXPECT_EQ(entry.stats_for, kK8sTarget);
    ASSERT_EQ(entry.stats.size(), 1u);
    EXPECT_DOUBLE_EQ(entry.stats[0].value, 1.0);
    EXPECT_EQ(entry.stats[0].source, "rego");
}

// ---------------------------------------------------------------------------
// Audit
// ---------------------------------------------------------------------------
TEST_F(ReviewTest, AuditEvaluatesCachedData) {
    ASSERT_TRUE(client_->add_data(ctx_, fakes::make_object("Pod", "unlabeled", "prod")).has_value());
    ASSERT_TRUE(client_->add_data(ctx_, fakes::make_object("Pod", "owned", "prod", {{"owner", "bob"}}))
                    .has_value());
    rego_->clear_calls();

    const auto outcome = client_->audit(ctx_);
    ASSERT_TRUE(outcome.ok()) << outcome.errors.to_string();

    const auto results = outcome.responses.results();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].msg, "you must provide labels: owner");
    EXPECT_EQ(rego_->calls(),
              (std::vector<std::string>{std::string("query:") + kK8sTarget + ":1"}));
}

// ---------------------------------------------------------------------------
// ConcurrentReviewsAndAudits
//   reader 는 shared 락, add_constraint 는 exclusive 락을 잡는다.
//   도중에 추가되는 constraint 는 fake target 용이고 fake target 에는 review
//   입력도 참조 데이터도 없으므로 결과는 처음과 같아야 한다.
// ---------------------------------------------------------------------------
TEST_F(ReviewTest, ConcurrentReviewsAndAudits) {
    ASSERT_NO_FATAL_FAILURE(add_template_ok(
        fakes::make_template("FakeDenyAll", {{"cel", "deny_all"}}, kFakeTarget)));
    ASSERT_TRUE(client_->add_data(ctx_, fakes::make_object("Pod", "unlabeled", "prod")).has_value());

    const auto make_request = [] {
        return fakes::make_admission_request(fakes::make_object("Pod", "web", "prod"));
    };
    const std::string review_baseline = client_->review(ctx_, make_request()).responses.to_string();
    const std::string audit_baseline  = client_->audit(ctx_).responses.to_string();
    ASSERT_NE(review_baseline.find("must-have-owner"), std::string::npos);
    ASSERT_NE(audit_baseline.find("must-have-owner"), std::string::npos);

    constexpr int kReaderThreads  = 4;
    constexpr int kRoundsPerThread = 50;

    std::atomic<int> mismatches{0};
    std::atomic<int> failures{0};

    std::vector<std::thread> readers;
    readers.reserve(static_cast<std::size_t>(kReaderThreads));
    for (int i = 0; i < kReaderThreads; ++i) {
        readers.emplace_back([&, i]() {
            const auto request = make_request();
            for (int j = 0; j < kRoundsPerThread; ++j) {
                const bool review  = (i + j) % 2 == 0;
                const auto outcome = review ? client_->review(ctx_, request) : client_->audit(ctx_);
                if (!outcome.ok()) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                }
                if (outcome.responses.to_string() != (review ? review_baseline : audit_baseline)) {
                    mismatches.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }

    std::thread writer([&]() {
        const auto added = client_->add_constraint(ctx_, fakes::make_constraint("FakeDenyAll", "fake-deny"));
        if (!added.has_value()) {
            failures.fetch_add(1, std::memory_order_relaxed);
        }
    });

    for (auto& t : readers) { t.join(); }
    writer.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_TRUE(cel_->has_constraint("FakeDenyAll", "fake-deny"));
    EXPECT_EQ(client_->review(ctx_, make_request()).responses.to_string(), review_baseline);
}

// ---------------------------------------------------------------------------
// logger / stats 연동
// ---------------------------------------------------------------------------
TEST_F(ClientFixture, ReviewIsRecordedInLoggerAndStats) {
    const fs::path dir = fs::temp_directory_path() / "ctgate_test_client_review";
    fs::create_directories(dir);
    const fs::path log_path = dir / "review.log";
    fs::remove(log_path);

    auto logger = std::make_shared<StructuredLogger>(LogLevel::kInfo, log_path);
    auto stats  = std::make_shared<EngineStats>();
    client_ = build([&](ClientOptions& opts) {
        opts.logger = logger;
        opts.stats  = stats;
    });
    ASSERT_NE(client_, nullptr);

    ASSERT_NO_FATAL_FAILURE(add_template_ok(fakes::make_required_labels_template()));
    ASSERT_NO_FATAL_FAILURE(add_constraint_ok(
        fakes::make_constraint("K8sRequiredLabels", "must-have-owner", kOwnerOnPods)));

    const auto outcome = client_->review(
        ctx_, fakes::make_admission_request(fakes::make_object("Pod", "web", "prod")));
    ASSERT_EQ(outcome.responses.results().size(), 1u);
    (void)client_->audit(ctx_);
    logger->flush();

    const auto snap = stats->snapshot();
    EXPECT_EQ(snap.reviews, 1u);
    EXPECT_EQ(snap.audits, 1u);
    EXPECT_EQ(snap.violations, 1u);
    EXPECT_EQ(snap.auto_rejections, 0u);

    std::ifstream in(log_path);
    std::stringstream buf;
    buf << in.rdbuf();
    const std::string content = buf.str();
    EXPECT_NE(content.find(R"("event":"template_add")"), std::string::npos);
    EXPECT_NE(content.find(R"("event":"constraint_add")"), std::string::npos);
    EXPECT_NE(content.find(R"("event":"violation")"), std::string::npos);
    EXPECT_NE(content.find(R"("event":"review")"), std::string::npos);
    EXPECT_NE(content.find(R"("event":"audit")"), std::string::npos);
    EXPECT_NE(content.find(R"("constraint_name":"must-have-owner")"), std::string::npos);

    client_.reset();
    logger.reset();
    fs::remove_all(dir);
}

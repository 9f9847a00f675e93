#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// CallContext
//   드라이버 호출 하나에 전달되는 실행 컨텍스트.
//   클라이언트는 이 값을 드라이버까지 그대로 전달만 하며, 취소/타임아웃
//   판단은 전적으로 드라이버 구현의 책임이다.
//
//   복사본끼리 취소 플래그를 공유한다 (shared_ptr<atomic<bool>>).
// ---------------------------------------------------------------------------
class CallContext {
public:
    CallContext()
        : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    explicit CallContext(std::chrono::steady_clock::time_point deadline)
        : cancelled_(std::make_shared<std::atomic<bool>>(false))
        , deadline_(deadline) {}

    // cancel
    //   이 컨텍스트와 모든 복사본을 취소 상태로 만든다.
    void cancel() noexcept { cancelled_->store(true, std::memory_order_release); }

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_->load(std::memory_order_acquire);
    }

    [[nodiscard]] const std::optional<std::chrono::steady_clock::time_point>&
    deadline() const noexcept { return deadline_; }

    // expired
    //   취소되었거나 deadline 이 지났으면 true.
    [[nodiscard]] bool expired() const noexcept {
        if (cancelled()) {
            return true;
        }
        return deadline_.has_value() && std::chrono::steady_clock::now() >= *deadline_;
    }

private:
    std::shared_ptr<std::atomic<bool>>                    cancelled_;
    std::optional<std::chrono::steady_clock::time_point>  deadline_{};
};

// ---------------------------------------------------------------------------
// ErrorCode
//   엔진이 반환하는 오류 분류.
//   구조 검증 오류는 호출 전체를 즉시 실패시키고, 질의 시점 오류는
//   ErrorMap 으로 target/driver 단위로 격리된다.
// ---------------------------------------------------------------------------
enum class ErrorCode : std::uint8_t {
    kInvalidConstraintTemplate = 0,  // 템플릿 메타데이터/target 선언 오류
    kChangeTargets             = 1,  // 라이브 constraint 가 있는 템플릿의 target 변경
    kNoDriver                  = 2,  // 템플릿 엔진을 처리할 드라이버 없음
    kMissingConstraintTemplate = 3,  // 등록되지 않은 템플릿 이름/Kind
    kInvalidConstraint         = 4,  // constraint 메타데이터/group/스키마 오류
    kMissingConstraint         = 5,  // 알 수 없는 constraint 조회
    kNoReferentialDriver       = 6,  // 참조 데이터를 저장할 드라이버 없음
    kDriverError               = 7,  // 드라이버가 보고한 실패
    kTargetError               = 8,  // target handler 가 보고한 실패
    kInvalidConfig             = 9,  // 클라이언트/엔진 설정 오류
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// EngineError
//   실패 시 반환되는 오류 정보.
//   std::expected<T, EngineError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct EngineError {
    ErrorCode   code{ErrorCode::kDriverError};
    std::string message{};  // 사람이 읽을 수 있는 오류 설명
    std::string context{};  // 오류가 발생한 대상 (템플릿/constraint/target 이름 등)

    // "<code>: <message>" 형식. context 가 있으면 " (<context>)" 를 덧붙인다.
    [[nodiscard]] std::string to_string() const;
};

// ---------------------------------------------------------------------------
// ErrorMap
//   한 번의 Review/Audit/AddData/RemoveData 호출에서 발생한 독립적인
//   target/driver 단위 오류 모음.
//   키는 target 이름. 드라이버 실패도 질의한 target 이름으로 기록된다.
//   한 target 에 여러 오류(예: 드라이버 둘 다 실패)가 나면 들어온 순서대로
//   모두 보관한다. at() 은 첫 번째 오류를 돌려준다.
// ---------------------------------------------------------------------------
class ErrorMap {
public:
    void add(const std::string& key, EngineError error);

    // 오류가 있는 키(target) 수
    [[nodiscard]] bool empty() const noexcept { return errors_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return errors_.size(); }
    [[nodiscard]] bool contains(const std::string& key) const {
        return errors_.find(key) != errors_.end();
    }

    // at: 키가 없으면 std::out_of_range.
    [[nodiscard]] const EngineError& at(const std::string& key) const {
        return errors_.at(key).front();
    }
    [[nodiscard]] const std::vector<EngineError>& all(const std::string& key) const {
        return errors_.at(key);
    }

    [[nodiscard]] const std::map<std::string, std::vector<EngineError>>& entries() const noexcept {
        return errors_;
    }

    // 키 순서로 정렬된 "key: error\n" 나열. 같은 키는 들어온 순서.
    [[nodiscard]] std::string to_string() const;

private:
    std::map<std::string, std::vector<EngineError>> errors_;
};

#pragma once

// ---------------------------------------------------------------------------
// decision.hpp
//
// AST 노드 하나에 대한 판정 결과와 판정 조합 규칙.
//
// [설계 원칙]
// - Action 은 순서가 있는 열거형이다. kAllow < kAsk < kDeny.
//   조합은 최댓값을 취하고, 이긴 수준의 사유를 모두 ", " 로 잇는다.
// - children 은 추적용이다. 조합에 참여한 하위 판정을 그대로 보관한다.
// - 빈 집합의 조합은 Allow("empty").
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

enum class Action : std::uint8_t {
    kAllow = 0,
    kAsk   = 1,
    kDeny  = 2,
};

// "allow" | "ask" | "deny"
[[nodiscard]] std::string_view action_name(Action action) noexcept;

struct Decision {
    Action                action{Action::kAsk};
    std::string           reason{};
    std::vector<Decision> children{};

    [[nodiscard]] static Decision allow(std::string reason) {
        return Decision{Action::kAllow, std::move(reason), {}};
    }
    [[nodiscard]] static Decision ask(std::string reason) {
        return Decision{Action::kAsk, std::move(reason), {}};
    }
    [[nodiscard]] static Decision deny(std::string reason) {
        return Decision{Action::kDeny, std::move(reason), {}};
    }

    [[nodiscard]] bool allowed() const noexcept { return action == Action::kAllow; }
};

// 가장 제한적인 판정이 이긴다. 같은 수준의 사유는 모두 모은다.
[[nodiscard]] Decision combine(std::vector<Decision> decisions);

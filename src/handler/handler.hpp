#pragma once

// ---------------------------------------------------------------------------
// handler.hpp
//
// 명령별 핸들러 인터페이스와 분류 결과 타입.
//
// [설계 원칙]
// - 핸들러는 따옴표가 제거된 토큰 목록만 본다. 셸 구문(치환, 리다이렉트)
//   은 DecisionEngine 이 이미 처리한 뒤다.
// - 핸들러는 Deny 를 내지 않는다. 결과는 Allow / Ask / Delegate 셋 중 하나.
//   Deny 는 운영자 규칙에서만 나온다.
// - 핸들러는 상태를 갖지 않으며 classify() 는 const 다. 레지스트리는
//   프로세스 시작 시 한 번 만들어지고 이후 읽기 전용이다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// HandlerAction
//   kDelegate: inner_command 를 엔진이 다시 분석한다 (bash -c, env, xargs).
// ---------------------------------------------------------------------------
enum class HandlerAction : std::uint8_t {
    kAllow    = 0,
    kAsk      = 1,
    kDelegate = 2,
};

// ---------------------------------------------------------------------------
// Classification
//   redirect_targets: 핸들러가 파일에 쓰는 대상 (tee 의 파일 인자 등).
//                     엔진이 redirect_rules 로 다시 확인한다.
// ---------------------------------------------------------------------------
struct Classification {
    HandlerAction                           action{HandlerAction::kAsk};
    std::string                             description{};
    std::optional<std::string>              inner_command{};
    std::optional<std::vector<std::string>> redirect_targets{};

    [[nodiscard]] static Classification allow(std::string desc) {
        return Classification{HandlerAction::kAllow, std::move(desc), std::nullopt, std::nullopt};
    }
    [[nodiscard]] static Classification ask(std::string desc) {
        return Classification{HandlerAction::kAsk, std::move(desc), std::nullopt, std::nullopt};
    }
    [[nodiscard]] static Classification delegate(std::string inner, std::string desc = {}) {
        return Classification{HandlerAction::kDelegate, std::move(desc), std::move(inner),
                              std::nullopt};
    }
};

// ---------------------------------------------------------------------------
// HandlerContext
//   tokens[0] 은 명령 이름 (별칭 해석 전 원래 이름).
// ---------------------------------------------------------------------------
struct HandlerContext {
    std::vector<std::string> tokens{};
    std::filesystem::path    cwd{};
};

// 앞의 두 토큰을 공백으로 이은 설명 ("git status", "docker ps")
[[nodiscard]] std::string default_description(const std::vector<std::string>& tokens);

// ---------------------------------------------------------------------------
// CommandHandler
//   명령 하나(또는 같은 문법을 공유하는 명령군)를 분류한다.
//   classify() 는 예외를 던질 수 있으며 엔진이 Ask 로 변환한다.
// ---------------------------------------------------------------------------
class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // 이 핸들러가 담당하는 명령 이름들
    [[nodiscard]] virtual std::vector<std::string> names() const = 0;

    [[nodiscard]] virtual Classification classify(const HandlerContext& ctx) const = 0;

    [[nodiscard]] virtual std::string describe(const std::vector<std::string>& tokens) const {
        return default_description(tokens);
    }
};

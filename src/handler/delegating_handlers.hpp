#pragma once

// ---------------------------------------------------------------------------
// delegating_handlers.hpp
//
// 다른 명령을 실행하는 래퍼 명령. 내부 명령을 찾아 kDelegate 로 돌려주고
// 실제 판정은 엔진이 내부 명령을 다시 분석해서 내린다.
//
// - ShellHandler  : bash sh zsh dash ksh fish. -c (결합형 -lc 포함) 의 다음
//                   토큰이 내부 명령이다. -c 가 없으면 대화형 셸로 Ask.
// - EnvHandler    : 플래그와 VAR=value 를 건너뛴 나머지. 인자 없으면 Allow.
// - XargsHandler  : 대화형 플래그(-p, -o) 는 Ask. 플래그를 건너뛴 나머지를
//                   다시 따옴표 처리해 위임한다.
//
// [알려진 한계]
// - xargs 가 stdin 에서 덧붙이는 인자는 알 수 없다. 위임되는 명령은
//   고정 인자만 가진 형태로 분석된다.
// ---------------------------------------------------------------------------

#include "handler/handler.hpp"

class ShellHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override {
        return {"bash", "sh", "zsh", "dash", "ksh", "fish"};
    }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};

class EnvHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"env"}; }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};

class XargsHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"xargs"}; }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};

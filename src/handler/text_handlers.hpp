#pragma once

// ---------------------------------------------------------------------------
// text_handlers.hpp
//
// 기본적으로 읽기만 하지만 특정 플래그로 파일을 쓰거나 명령을 실행하는
// 텍스트/파일 도구.
//
// - FindHandler : -exec -execdir -ok -okdir -delete 가 있으면 Ask.
// - SedHandler  : -i / --in-place (접미사 결합형 포함) 가 있으면 Ask.
// - SortHandler : -o / --output (결합형 포함) 이 있으면 Ask.
// - TeeHandler  : 항상 Allow. 파일 인자를 redirect_targets 로 넘겨
//                 엔진이 redirect_rules 로 다시 판정하게 한다.
// ---------------------------------------------------------------------------

#include "handler/handler.hpp"

class FindHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"find"}; }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};

class SedHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"sed"}; }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};

class SortHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"sort"}; }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};

class TeeHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"tee"}; }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};

#pragma once

// ---------------------------------------------------------------------------
// git_handler.hpp
//
// 읽기 전용 git 동작은 허용하고, 저장소/원격 상태를 바꾸는 동작은 묻는다.
//
// [판정 흐름]
// 1. 전역 플래그(-C <dir>, -c k=v, --git-dir=... 등)를 건너뛰어 action 을 찾는다.
//    알 수 없는 플래그를 만나면 action 을 찾지 못한 것으로 보고 Ask.
// 2. branch/tag/remote/stash/config 등 하위 명령이 있는 action 은 전용 검사.
// 3. 나머지는 안전 action 목록에 있으면 Allow, 없으면 Ask.
//
// [오탐/미탐 트레이드오프]
// - fetch 는 원격에서 내려받기만 하므로 허용한다 (작업 트리 불변).
// - submodule foreach 는 허용 목록에 있지만 내부 명령을 분석하지 않는다.
// ---------------------------------------------------------------------------

#include "handler/handler.hpp"

class GitHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"git"}; }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
    [[nodiscard]] std::string describe(const std::vector<std::string>& tokens) const override;
};

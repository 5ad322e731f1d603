#pragma once

// ---------------------------------------------------------------------------
// container_handlers.hpp
//
// 컨테이너/오케스트레이션 CLI. action 표와 action 별 하위 명령 표로 판정한다.
//
// - DockerHandler  : docker, docker-compose, podman, podman-compose.
//                    image save / export / save 에 -o 가 붙으면 파일 쓰기라 Ask.
//                    compose 계열은 ps logs config images ls top version port
//                    events 만 허용.
// - KubectlHandler : kubectl. get/describe/logs 등 조회와 config view,
//                    auth can-i, rollout status 같은 하위 명령만 허용.
//
// [오탐/미탐 트레이드오프]
// - 표에 없는 action 은 모두 Ask (default-closed). 새 CLI 버전의 조회
//   명령은 오탐이 된다.
// ---------------------------------------------------------------------------

#include "handler/handler.hpp"

class DockerHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override {
        return {"docker", "docker-compose", "podman", "podman-compose"};
    }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};

class KubectlHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"kubectl"}; }
    [[nodiscard]] Classification classify(const HandlerContext& ctx) const override;
};

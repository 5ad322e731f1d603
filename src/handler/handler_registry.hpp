#pragma once

// ---------------------------------------------------------------------------
// handler_registry.hpp
//
// 명령 이름 -> CommandHandler 정적 맵.
//
// [설계 원칙]
// - builtin() 은 함수 지역 static 으로 한 번만 만들어진다 (스레드 안전 초기화).
//   이후 변경 API 가 없으므로 읽기 전용이다.
// - 테스트나 임베딩 용도로 빈 레지스트리를 만들어 직접 채울 수도 있다.
// - 같은 이름을 두 핸들러가 등록하면 나중 것이 이긴다 (경고 로그).
// ---------------------------------------------------------------------------

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "handler/handler.hpp"

class HandlerRegistry {
public:
    HandlerRegistry()  = default;
    ~HandlerRegistry() = default;

    HandlerRegistry(const HandlerRegistry&)            = delete;
    HandlerRegistry& operator=(const HandlerRegistry&) = delete;
    HandlerRegistry(HandlerRegistry&&)                 = default;
    HandlerRegistry& operator=(HandlerRegistry&&)      = default;

    // 내장 핸들러 전체가 등록된 전역 레지스트리
    [[nodiscard]] static const HandlerRegistry& builtin();

    void add(std::unique_ptr<CommandHandler> handler);

    // 이름으로 찾는다. 없으면 nullptr.
    [[nodiscard]] const CommandHandler* find(std::string_view name) const;

    // 별칭을 한 단계 해석한 뒤 찾는다 (k -> kubectl).
    [[nodiscard]] const CommandHandler* find(std::string_view                          name,
                                             const std::map<std::string, std::string>& aliases) const;

    [[nodiscard]] std::size_t size() const noexcept { return by_name_.size(); }

private:
    std::vector<std::unique_ptr<CommandHandler>>          handlers_{};
    std::map<std::string, const CommandHandler*, std::less<>> by_name_{};
};

#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 규칙 파일을 로드하고 여러 범위(전역/프로젝트/명시 파일)의 설정을
// 하나의 RuleConfig 로 병합하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 부분적으로 파싱된
//   설정을 반환하지 않는다 (all-or-nothing).
// - 스키마는 엄격하다. 모르는 키, 판정 키가 0개 또는 2개 이상인 규칙,
//   컴파일되지 않는 re: 패턴, 지원하지 않는 version 은 모두 오류다.
//
// [범위 병합 순서]
//   1. 전역:     $XDG_CONFIG_HOME/cmdgate/config.yaml
//                (미설정 시 ~/.config/cmdgate/config.yaml)
//   2. 프로젝트: cwd 에서 위로 올라가며 찾은 첫 .cmdgate.yaml
//   3. 명시:     $CMDGATE_CONFIG
//   규칙 목록은 이어 붙이고, aliases 는 덮어쓰고, global 스칼라는
//   값이 있을 때만 덮어쓴다.
//
// [보안 고려사항]
// - 파싱 실패 원인은 로깅하되 YAML 파일 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "rule.hpp"  // RuleConfig

inline constexpr std::string_view kProjectConfigName = ".cmdgate.yaml";

class PolicyLoader {
public:
    PolicyLoader()  = default;
    ~PolicyLoader() = default;

    PolicyLoader(const PolicyLoader&)            = default;
    PolicyLoader& operator=(const PolicyLoader&) = default;
    PolicyLoader(PolicyLoader&&)                 = default;
    PolicyLoader& operator=(PolicyLoader&&)      = default;

    // load
    //   지정된 경로의 YAML 파일 하나를 읽어 RuleConfig 로 파싱한다.
    //   파일 없음, 파싱 오류, 스키마 위반 모두 실패로 처리한다.
    [[nodiscard]] static std::expected<RuleConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_string
    //   이미 메모리에 있는 YAML 텍스트를 파싱한다.
    //   source_name 은 오류 메시지와 Rule::source 에 쓰인다.
    [[nodiscard]] static std::expected<RuleConfig, std::string>
    load_string(std::string_view yaml_text, std::string_view source_name);

    // load_scopes
    //   세 범위를 순서대로 로드해 병합한다. 존재하지 않는 범위는 건너뛴다.
    //   $CMDGATE_CONFIG 가 지정됐는데 파일이 없으면 오류다.
    [[nodiscard]] static std::expected<RuleConfig, std::string>
    load_scopes(const std::filesystem::path& cwd);

    // merge
    //   overlay 를 base 위에 병합한다.
    static void merge(RuleConfig& base, RuleConfig overlay);

    // find_project_config
    //   cwd 와 그 조상 디렉토리에서 .cmdgate.yaml 을 찾는다.
    [[nodiscard]] static std::optional<std::filesystem::path>
    find_project_config(const std::filesystem::path& cwd);

    // global_config_path
    //   XDG_CONFIG_HOME, HOME 모두 없으면 std::nullopt.
    [[nodiscard]] static std::optional<std::filesystem::path> global_config_path();
};

// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 규칙 파일을 로드하여 RuleConfig 구조체로 파싱하고, 범위별 설정을
// 병합한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 엄격한 스키마: 모르는 키는 오류. 섹션 누락은 빈 값으로 처리한다.
// - re: 패턴은 로드 시점에 컴파일해 본다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [알려진 한계]
// - 정규식 문법은 std::regex ECMAScript 다. 운영자가 PCRE 전용 문법
//   (lookbehind, possessive quantifier 등)을 쓰면 로드 오류가 된다.
// - 빈 파일은 오류가 아니라 빈 설정으로 취급한다.
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <initializer_list>
#include <regex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

// 스키마 위반. 섹션 단위 try-catch 에서 YAML::Exception 과 함께 처리된다.
class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr std::array<std::string_view, 4> kLogLevels = {"debug", "info", "warn", "error"};

// ---------------------------------------------------------------------------
// 내부 헬퍼: map 노드의 키가 허용 목록 안에 있는지 검사한다.
// ---------------------------------------------------------------------------
void check_keys(const YAML::Node&                        map_node,
                std::initializer_list<std::string_view>  allowed,
                std::string_view                         where) {
    for (const auto& kv : map_node) {
        const auto key = kv.first.as<std::string>();
        if (std::find(allowed.begin(), allowed.end(), key) == allowed.end()) {
            throw SchemaError(fmt::format("unknown key '{}' in {}", key, where));
        }
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스칼라 노드를 문자열로 읽는다. 스칼라가 아니면 스키마 위반.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_scalar(const YAML::Node& node, std::string_view where) {
    if (!node.IsScalar()) {
        throw SchemaError(fmt::format("{} must be a string", where));
    }
    return node.as<std::string>();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: "re:" 패턴을 미리 컴파일해 본다.
// ---------------------------------------------------------------------------
void validate_regex(const std::string& pattern, std::string_view where) {
    if (!pattern.starts_with("re:")) {
        return;
    }
    try {
        std::regex re(pattern.substr(3), std::regex_constants::ECMAScript);
        (void)re;  // 컴파일만 확인
    } catch (const std::regex_error& e) {
        throw SchemaError(fmt::format("invalid regex in {}: '{}': {}", where, pattern, e.what()));
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 규칙 하나 파싱
//   - allow: "git push"
//     message: "..."        (선택)
// ---------------------------------------------------------------------------
[[nodiscard]] Rule parse_rule(const YAML::Node& node,
                              std::string_view  section,
                              std::size_t       index,
                              std::string_view  source) {
    const std::string where = fmt::format("{}[{}]", section, index);
    if (!node.IsMap()) {
        throw SchemaError(fmt::format("{} must be a map", where));
    }
    check_keys(node, {"allow", "ask", "deny", "message"}, where);

    Rule rule{};
    rule.source = std::string{source};

    int action_count = 0;
    const std::array<std::pair<const char*, RuleAction>, 3> actions = {{
        {"allow", RuleAction::kAllow},
        {"ask",   RuleAction::kAsk},
        {"deny",  RuleAction::kDeny},
    }};
    for (const auto& [key, action] : actions) {
        if (node[key]) {
            ++action_count;
            rule.action  = action;
            rule.pattern = read_scalar(node[key], fmt::format("{}.{}", where, key));
        }
    }
    if (action_count != 1) {
        throw SchemaError(fmt::format("{} must have exactly one of allow/ask/deny", where));
    }
    if (rule.pattern.empty()) {
        throw SchemaError(fmt::format("{} has an empty pattern", where));
    }
    validate_regex(rule.pattern, where);

    if (node["message"]) {
        rule.message = read_scalar(node["message"], fmt::format("{}.message", where));
    }
    return rule;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: rules / redirect_rules 섹션 파싱. 없거나 null 이면 빈 목록.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<Rule> parse_rule_list(const YAML::Node& node,
                                                std::string_view  section,
                                                std::string_view  source) {
    std::vector<Rule> rules;
    if (!node || node.IsNull()) {
        return rules;
    }
    if (!node.IsSequence()) {
        throw SchemaError(fmt::format("'{}' must be a sequence", section));
    }
    rules.reserve(node.size());
    std::size_t index = 0;
    for (const auto& item : node) {
        rules.push_back(parse_rule(item, section, index, source));
        ++index;
    }
    return rules;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: GlobalConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] GlobalConfig parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw SchemaError("'global' must be a map");
    }
    check_keys(node, {"log_level", "log_path"}, "global");

    if (node["log_level"]) {
        cfg.log_level = read_scalar(node["log_level"], "global.log_level");
        if (std::find(kLogLevels.begin(), kLogLevels.end(), cfg.log_level) == kLogLevels.end()) {
            throw SchemaError(fmt::format(
                "global.log_level '{}' is not one of debug|info|warn|error", cfg.log_level));
        }
    }
    if (node["log_path"]) {
        cfg.log_path = read_scalar(node["log_path"], "global.log_path");
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: aliases 파싱 (이름 -> 핸들러 이름)
// ---------------------------------------------------------------------------
[[nodiscard]] std::map<std::string, std::string> parse_aliases(const YAML::Node& node) {
    std::map<std::string, std::string> aliases;
    if (!node || node.IsNull()) {
        return aliases;
    }
    if (!node.IsMap()) {
        throw SchemaError("'aliases' must be a map");
    }
    for (const auto& kv : node) {
        const auto name   = kv.first.as<std::string>();
        const auto target = read_scalar(kv.second, fmt::format("aliases.{}", name));
        if (name.empty() || target.empty()) {
            throw SchemaError("aliases entries must be non-empty");
        }
        aliases.insert_or_assign(name, target);
    }
    return aliases;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: version 검사. 누락은 1 로 간주한다.
// ---------------------------------------------------------------------------
void check_version(const YAML::Node& node) {
    if (!node) {
        return;
    }
    const auto raw = read_scalar(node, "version");
    if (raw != "1") {
        throw SchemaError(fmt::format("unsupported config version '{}'", raw));
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 섹션 파싱 오류를 로그로 남기고 unexpected 로 변환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::unexpected<std::string> section_error(std::string_view source,
                                                         std::string_view section,
                                                         std::string_view what) {
    std::string err = fmt::format(
        "policy_loader: {}: error parsing '{}' section: {}", source, section, what);
    spdlog::error("{}", err);
    return std::unexpected(std::move(err));
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 루트 노드 -> RuleConfig
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<RuleConfig, std::string>
parse_root(const YAML::Node& root, std::string_view source) {
    RuleConfig cfg{};
    cfg.sources.emplace_back(std::string{source});

    // 빈 파일
    if (!root || root.IsNull()) {
        return cfg;
    }
    if (!root.IsMap()) {
        const std::string err = fmt::format(
            "policy_loader: '{}' is not a valid YAML map (top-level)", source);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        check_keys(root, {"version", "global", "rules", "redirect_rules", "aliases"},
                   "top-level");
        check_version(root["version"]);
    } catch (const YAML::Exception& e) {
        return section_error(source, "top-level", e.what());
    } catch (const SchemaError& e) {
        return section_error(source, "top-level", e.what());
    }

    try {
        cfg.global = parse_global(root["global"]);
    } catch (const YAML::Exception& e) {
        return section_error(source, "global", e.what());
    } catch (const SchemaError& e) {
        return section_error(source, "global", e.what());
    }

    try {
        cfg.rules = parse_rule_list(root["rules"], "rules", source);
    } catch (const YAML::Exception& e) {
        return section_error(source, "rules", e.what());
    } catch (const SchemaError& e) {
        return section_error(source, "rules", e.what());
    }

    try {
        cfg.redirect_rules = parse_rule_list(root["redirect_rules"], "redirect_rules", source);
    } catch (const YAML::Exception& e) {
        return section_error(source, "redirect_rules", e.what());
    } catch (const SchemaError& e) {
        return section_error(source, "redirect_rules", e.what());
    }

    try {
        cfg.aliases = parse_aliases(root["aliases"]);
    } catch (const YAML::Exception& e) {
        return section_error(source, "aliases", e.what());
    } catch (const SchemaError& e) {
        return section_error(source, "aliases", e.what());
    }

    spdlog::debug("policy_loader: '{}': {} rules, {} redirect rules, {} aliases",
                  source, cfg.rules.size(), cfg.redirect_rules.size(), cfg.aliases.size());
    return cfg;
}

[[nodiscard]] std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value != nullptr ? std::string{value} : std::string{};
}

}  // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<RuleConfig, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("policy_loader: loading rules from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "policy_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 섹션 파싱
    return parse_root(root, canonical_path.string());
}

// ---------------------------------------------------------------------------
// PolicyLoader::load_string 구현
// ---------------------------------------------------------------------------
std::expected<RuleConfig, std::string>
PolicyLoader::load_string(std::string_view yaml_text, std::string_view source_name) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{yaml_text});
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            source_name, e.mark.line + 1, e.mark.column + 1, e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}", source_name, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return parse_root(root, source_name);
}

// ---------------------------------------------------------------------------
// PolicyLoader::merge 구현
// ---------------------------------------------------------------------------
void PolicyLoader::merge(RuleConfig& base, RuleConfig overlay) {
    base.rules.insert(base.rules.end(),
                      std::make_move_iterator(overlay.rules.begin()),
                      std::make_move_iterator(overlay.rules.end()));
    base.redirect_rules.insert(base.redirect_rules.end(),
                               std::make_move_iterator(overlay.redirect_rules.begin()),
                               std::make_move_iterator(overlay.redirect_rules.end()));
    for (auto& [name, target] : overlay.aliases) {
        base.aliases.insert_or_assign(name, std::move(target));
    }
    if (!overlay.global.log_level.empty()) {
        base.global.log_level = std::move(overlay.global.log_level);
    }
    if (!overlay.global.log_path.empty()) {
        base.global.log_path = std::move(overlay.global.log_path);
    }
    if (!overlay.project_root.empty()) {
        base.project_root = std::move(overlay.project_root);
    }
    base.sources.insert(base.sources.end(), overlay.sources.begin(), overlay.sources.end());
}

// ---------------------------------------------------------------------------
// PolicyLoader::find_project_config 구현
// ---------------------------------------------------------------------------
std::optional<std::filesystem::path>
PolicyLoader::find_project_config(const std::filesystem::path& cwd) {
    std::error_code ec;
    auto dir = std::filesystem::absolute(cwd, ec);
    if (ec) {
        spdlog::debug("policy_loader: cannot make '{}' absolute: {}", cwd.string(), ec.message());
        return std::nullopt;
    }
    dir = dir.lexically_normal();

    while (true) {
        const auto candidate = dir / kProjectConfigName;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
        const auto parent = dir.parent_path();
        if (parent == dir || parent.empty()) {
            break;
        }
        dir = parent;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// PolicyLoader::global_config_path 구현
// ---------------------------------------------------------------------------
std::optional<std::filesystem::path> PolicyLoader::global_config_path() {
    const auto xdg = env_or_empty("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        return std::filesystem::path{xdg} / "cmdgate" / "config.yaml";
    }
    const auto home = env_or_empty("HOME");
    if (!home.empty()) {
        return std::filesystem::path{home} / ".config" / "cmdgate" / "config.yaml";
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// PolicyLoader::load_scopes 구현
// ---------------------------------------------------------------------------
std::expected<RuleConfig, std::string>
PolicyLoader::load_scopes(const std::filesystem::path& cwd) {
    RuleConfig merged{};
    std::error_code ec;

    // 1. 전역 범위 (없으면 건너뜀)
    if (const auto global_path = global_config_path();
        global_path && std::filesystem::is_regular_file(*global_path, ec)) {
        auto loaded = load(*global_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        merge(merged, std::move(*loaded));
    }

    // 2. 프로젝트 범위. 파일이 있는 디렉토리가 project_root 가 된다.
    if (const auto project_path = find_project_config(cwd)) {
        auto loaded = load(*project_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        loaded->project_root = project_path->parent_path();
        merge(merged, std::move(*loaded));
    }

    // 3. 명시 파일. 지정했는데 없으면 load() 가 오류를 돌려준다.
    if (const auto explicit_path = env_or_empty("CMDGATE_CONFIG"); !explicit_path.empty()) {
        auto loaded = load(explicit_path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        merge(merged, std::move(*loaded));
    }

    spdlog::debug("policy_loader: merged {} scope(s), {} rules, {} redirect rules",
                  merged.sources.size(), merged.rules.size(), merged.redirect_rules.size());
    return merged;
}

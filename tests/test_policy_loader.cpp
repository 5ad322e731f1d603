// ---------------------------------------------------------------------------
// test_policy_loader.cpp
//
// PolicyLoader 단위 테스트.
//
// [테스트 범위]
// - 정상 YAML → RuleConfig (rules, redirect_rules, aliases, global)
// - 빈 문서 → 빈 설정
// - 스키마 위반: 모르는 키, 규칙 action 0개/2개, 빈 패턴, 잘못된 정규식,
//   지원하지 않는 version, 잘못된 log_level, 타입 불일치
// - 파일 로드: 없는 파일, YAML 문법 오류
// - 범위 병합: 전역(XDG_CONFIG_HOME) → 프로젝트(.cmdgate.yaml) → CMDGATE_CONFIG
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {

// 테스트 동안 환경 변수를 바꾸고 끝나면 되돌린다
class ScopedEnv {
public:
    ScopedEnv(const char* name, const std::string& value)
        : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = std::string{old};
        }
        ::setenv(name, value.c_str(), 1);
    }

    ~ScopedEnv() {
        if (old_) {
            ::setenv(name_, old_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

    ScopedEnv(const ScopedEnv&)            = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char*                name_;
    std::optional<std::string> old_{};
};

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

}  // namespace

// ---------------------------------------------------------------------------
// load_string: 정상 입력
// ---------------------------------------------------------------------------
TEST(PolicyLoader, ParsesFullDocument) {
    const auto cfg = PolicyLoader::load_string(R"(
version: 1
global:
  log_level: info
  log_path: /tmp/cmdgate/decisions.log
rules:
  - allow: "make test"
  - ask: "git push --force"
    message: "force push rewrites history"
  - deny: "re:^rm -rf /"
    message: "never"
redirect_rules:
  - allow: "/tmp/*"
  - deny: "~/.ssh/*"
    message: "ssh keys are off limits"
aliases:
  k: kubectl
)", "inline");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    ASSERT_EQ(cfg->rules.size(), 3U);
    EXPECT_EQ(cfg->rules[0].action, RuleAction::kAllow);
    EXPECT_EQ(cfg->rules[0].pattern, "make test");
    EXPECT_TRUE(cfg->rules[0].message.empty());
    EXPECT_EQ(cfg->rules[0].source, "inline");
    EXPECT_EQ(cfg->rules[1].action, RuleAction::kAsk);
    EXPECT_EQ(cfg->rules[1].message, "force push rewrites history");
    EXPECT_EQ(cfg->rules[2].action, RuleAction::kDeny);
    EXPECT_EQ(cfg->rules[2].pattern, "re:^rm -rf /");

    ASSERT_EQ(cfg->redirect_rules.size(), 2U);
    EXPECT_EQ(cfg->redirect_rules[1].action, RuleAction::kDeny);
    EXPECT_EQ(cfg->redirect_rules[1].pattern, "~/.ssh/*");

    ASSERT_EQ(cfg->aliases.size(), 1U);
    EXPECT_EQ(cfg->aliases.at("k"), "kubectl");

    EXPECT_EQ(cfg->global.log_level, "info");
    EXPECT_EQ(cfg->global.log_path, "/tmp/cmdgate/decisions.log");
}

TEST(PolicyLoader, EmptyDocumentIsEmptyConfig) {
    const auto cfg = PolicyLoader::load_string("", "empty");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_TRUE(cfg->rules.empty());
    EXPECT_TRUE(cfg->redirect_rules.empty());
    EXPECT_TRUE(cfg->aliases.empty());
    ASSERT_EQ(cfg->sources.size(), 1U);
}

TEST(PolicyLoader, MissingVersionIsAccepted) {
    const auto cfg = PolicyLoader::load_string("rules:\n  - allow: ls\n", "noversion");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->rules.size(), 1U);
}

TEST(PolicyLoader, NullSectionsAreEmpty) {
    const auto cfg = PolicyLoader::load_string("rules:\nredirect_rules:\naliases:\n", "nulls");
    ASSERT_TRUE(cfg.has_value());
    EXPECT_TRUE(cfg->rules.empty());
}

// ---------------------------------------------------------------------------
// load_string: 스키마 위반
// ---------------------------------------------------------------------------
TEST(PolicyLoader, UnknownTopLevelKey) {
    const auto cfg = PolicyLoader::load_string("version: 1\npolicies: []\n", "bad");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("unknown key 'policies' in top-level"), std::string::npos);
    EXPECT_NE(cfg.error().find("'top-level' section"), std::string::npos);
}

TEST(PolicyLoader, UnknownRuleKey) {
    const auto cfg = PolicyLoader::load_string("rules:\n  - allow: ls\n    why: x\n", "bad");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("unknown key 'why' in rules[0]"), std::string::npos);
}

TEST(PolicyLoader, RuleWithoutAction) {
    const auto cfg = PolicyLoader::load_string("rules:\n  - message: hi\n", "bad");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("rules[0] must have exactly one of allow/ask/deny"),
              std::string::npos);
}

TEST(PolicyLoader, RuleWithTwoActions) {
    const auto cfg = PolicyLoader::load_string("rules:\n  - allow: ls\n    deny: ls\n", "bad");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("exactly one of allow/ask/deny"), std::string::npos);
}

TEST(PolicyLoader, EmptyPattern) {
    const auto cfg = PolicyLoader::load_string("rules:\n  - allow: \"\"\n", "bad");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("has an empty pattern"), std::string::npos);
}

TEST(PolicyLoader, InvalidRegexIsRejectedAtLoad) {
    const auto cfg = PolicyLoader::load_string("redirect_rules:\n  - deny: \"re:([\"\n", "bad");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("invalid regex in redirect_rules[0]"), std::string::npos);
}

TEST(PolicyLoader, UnsupportedVersion) {
    const auto cfg = PolicyLoader::load_string("version: 2\n", "bad");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("unsupported config version '2'"), std::string::npos);
}

TEST(PolicyLoader, InvalidLogLevel) {
    const auto cfg = PolicyLoader::load_string("global:\n  log_level: verbose\n", "bad");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("'global' section"), std::string::npos);
}

TEST(PolicyLoader, RulesMustBeSequence) {
    const auto cfg = PolicyLoader::load_string("rules:\n  allow: ls\n", "bad");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("'rules' must be a sequence"), std::string::npos);
}

TEST(PolicyLoader, PatternMustBeScalar) {
    const auto cfg = PolicyLoader::load_string("rules:\n  - allow: [a, b]\n", "bad");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("rules[0].allow must be a string"), std::string::npos);
}

TEST(PolicyLoader, TopLevelMustBeMap) {
    const auto cfg = PolicyLoader::load_string("- a\n- b\n", "bad");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("not a valid YAML map"), std::string::npos);
}

TEST(PolicyLoader, YamlSyntaxError) {
    const auto cfg = PolicyLoader::load_string("rules: [\n", "broken");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("YAML parse error in 'broken'"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Fixture: 임시 디렉터리에 설정 파일 배치
// ---------------------------------------------------------------------------
class PolicyLoaderFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root_ = fs::temp_directory_path() / "cmdgate_test_policy" /
                (std::string(info->test_suite_name()) + "_" + info->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override { fs::remove_all(root_); }

    fs::path root_;
};

TEST_F(PolicyLoaderFileTest, LoadMissingFile) {
    const auto cfg = PolicyLoader::load(root_ / "missing.yaml");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("cannot resolve config path"), std::string::npos);
}

TEST_F(PolicyLoaderFileTest, LoadFileRecordsSource) {
    const auto path = root_ / "rules.yaml";
    write_file(path, "rules:\n  - allow: ls\n");
    const auto cfg = PolicyLoader::load(path);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    ASSERT_EQ(cfg->sources.size(), 1U);
    EXPECT_EQ(cfg->sources[0], fs::canonical(path));
    EXPECT_EQ(cfg->rules[0].source, fs::canonical(path).string());
}

TEST_F(PolicyLoaderFileTest, FindProjectConfigWalksUp) {
    write_file(root_ / "proj" / ".cmdgate.yaml", "rules: []\n");
    fs::create_directories(root_ / "proj" / "a" / "b");

    const auto found = PolicyLoader::find_project_config(root_ / "proj" / "a" / "b");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, (root_ / "proj" / ".cmdgate.yaml").lexically_normal());
}

TEST_F(PolicyLoaderFileTest, GlobalPathPrefersXdg) {
    const ScopedEnv xdg("XDG_CONFIG_HOME", (root_ / "xdg").string());
    const auto path = PolicyLoader::global_config_path();
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(*path, root_ / "xdg" / "cmdgate" / "config.yaml");
}

TEST_F(PolicyLoaderFileTest, ScopesMergeInOrder) {
    write_file(root_ / "xdg" / "cmdgate" / "config.yaml",
               "global:\n  log_level: warn\nrules:\n  - allow: ls\naliases:\n  k: kubectl\n");
    write_file(root_ / "proj" / ".cmdgate.yaml",
               "global:\n  log_level: debug\nrules:\n  - ask: make\naliases:\n  k: docker\n");
    write_file(root_ / "explicit.yaml", "redirect_rules:\n  - allow: \"/tmp/*\"\n");
    fs::create_directories(root_ / "proj" / "src");

    const ScopedEnv xdg("XDG_CONFIG_HOME", (root_ / "xdg").string());
    const ScopedEnv explicit_cfg("CMDGATE_CONFIG", (root_ / "explicit.yaml").string());

    const auto cfg = PolicyLoader::load_scopes(root_ / "proj" / "src");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    ASSERT_EQ(cfg->rules.size(), 2U);
    EXPECT_EQ(cfg->rules[0].pattern, "ls");
    EXPECT_EQ(cfg->rules[1].pattern, "make");
    EXPECT_EQ(cfg->redirect_rules.size(), 1U);
    EXPECT_EQ(cfg->aliases.at("k"), "docker");
    EXPECT_EQ(cfg->global.log_level, "debug");
    EXPECT_EQ(cfg->sources.size(), 3U);
    EXPECT_EQ(cfg->project_root, (root_ / "proj").lexically_normal());
}

TEST_F(PolicyLoaderFileTest, ExplicitConfigMissingIsError) {
    const ScopedEnv xdg("XDG_CONFIG_HOME", (root_ / "xdg").string());
    const ScopedEnv explicit_cfg("CMDGATE_CONFIG", (root_ / "nope.yaml").string());
    const auto cfg = PolicyLoader::load_scopes(root_);
    EXPECT_FALSE(cfg.has_value());
}

TEST_F(PolicyLoaderFileTest, BrokenProjectConfigFailsWholeLoad) {
    write_file(root_ / "proj" / ".cmdgate.yaml", "rules:\n  - allow: ls\n    deny: rm\n");
    const ScopedEnv xdg("XDG_CONFIG_HOME", (root_ / "xdg").string());
    const auto cfg = PolicyLoader::load_scopes(root_ / "proj");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("exactly one of allow/ask/deny"), std::string::npos);
}

// ---------------------------------------------------------------------------
// merge
// ---------------------------------------------------------------------------
TEST(PolicyLoaderMerge, EmptyOverlayKeepsBaseScalars) {
    RuleConfig base{};
    base.global.log_level = "info";
    base.global.log_path  = "/var/log/cmdgate.log";

    PolicyLoader::merge(base, RuleConfig{});
    EXPECT_EQ(base.global.log_level, "info");
    EXPECT_EQ(base.global.log_path, "/var/log/cmdgate.log");
}

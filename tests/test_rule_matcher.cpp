// ---------------------------------------------------------------------------
// test_rule_matcher.cpp
//
// match_command / match_redirect / resolve_user_path 단위 테스트.
//
// [테스트 범위]
// - 토큰 접두 매칭, 토큰별 glob
// - re: 패턴 (명령: 시작 고정, 리다이렉트: 부분 매칭)
// - 스크립트 경로 패턴과 project_root
// - 리다이렉트 glob ('~', 상대 경로, 디렉토리 경계)
// - 우선순위 deny > ask > allow, 같은 수준은 먼저 나온 규칙
// ---------------------------------------------------------------------------

#include "policy/rule_matcher.hpp"

#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

Rule make_rule(RuleAction action, std::string pattern, std::string message = {}) {
    Rule rule{};
    rule.action  = action;
    rule.pattern = std::move(pattern);
    rule.message = std::move(message);
    return rule;
}

const std::filesystem::path kCwd{"/work/repo"};

}  // namespace

// ---------------------------------------------------------------------------
// 명령 패턴
// ---------------------------------------------------------------------------
TEST(CommandPattern, TokenPrefix) {
    const std::vector<std::string> tokens{"git", "push", "--force", "origin"};
    EXPECT_TRUE(command_pattern_matches("git push", tokens, {}, kCwd));
    EXPECT_TRUE(command_pattern_matches("git push --force", tokens, {}, kCwd));
    EXPECT_FALSE(command_pattern_matches("git pull", tokens, {}, kCwd));
    EXPECT_FALSE(command_pattern_matches("git push --force origin main", tokens, {}, kCwd));
}

TEST(CommandPattern, PrefixIsTokenWiseNotCharacterWise) {
    EXPECT_FALSE(command_pattern_matches("git", {"gitk"}, {}, kCwd));
}

TEST(CommandPattern, GlobPerToken) {
    EXPECT_TRUE(command_pattern_matches("npm run test*", {"npm", "run", "test:unit"}, {}, kCwd));
    EXPECT_TRUE(command_pattern_matches("kubectl * pods", {"kubectl", "get", "pods"}, {}, kCwd));
    EXPECT_FALSE(command_pattern_matches("npm run test*", {"npm", "run", "lint"}, {}, kCwd));
}

TEST(CommandPattern, RegexIsAnchoredAtStart) {
    const std::vector<std::string> tokens{"rm", "-rf", "/"};
    EXPECT_TRUE(command_pattern_matches("re:rm -rf", tokens, {}, kCwd));
    EXPECT_FALSE(command_pattern_matches("re:-rf", tokens, {}, kCwd));
}

TEST(CommandPattern, EmptyInputsNeverMatch) {
    EXPECT_FALSE(command_pattern_matches("", {"ls"}, {}, kCwd));
    EXPECT_FALSE(command_pattern_matches("ls", {}, {}, kCwd));
}

TEST(CommandPattern, ScriptPathRelativeToProjectRoot) {
    const std::filesystem::path root{"/work/repo"};
    EXPECT_TRUE(command_pattern_matches("scripts/deploy.sh", {"./scripts/deploy.sh", "prod"},
                                        root, "/work/repo"));
    EXPECT_TRUE(command_pattern_matches("scripts/deploy.sh", {"../scripts/deploy.sh"}, root,
                                        "/work/repo/src"));
    EXPECT_FALSE(command_pattern_matches("scripts/deploy.sh", {"./deploy.sh"}, root,
                                         "/work/repo"));
}

TEST(CommandPattern, RelativeScriptPatternNeedsProjectRoot) {
    EXPECT_FALSE(command_pattern_matches("deploy.sh", {"./deploy.sh"}, {}, kCwd));
    EXPECT_TRUE(command_pattern_matches("/opt/tools/*.sh", {"/opt/tools/sync.sh"}, {}, kCwd));
}

TEST(CommandPattern, ScriptGlobDoesNotCrossDirectories) {
    EXPECT_FALSE(command_pattern_matches("/opt/tools/*.sh", {"/opt/tools/sub/sync.sh"}, {},
                                         kCwd));
}

// ---------------------------------------------------------------------------
// match_command 우선순위
// ---------------------------------------------------------------------------
TEST(MatchCommand, DenyBeatsAskBeatsAllow) {
    RuleConfig cfg{};
    cfg.rules = {
        make_rule(RuleAction::kAllow, "git"),
        make_rule(RuleAction::kAsk, "git push"),
        make_rule(RuleAction::kDeny, "git push --force", "no force push"),
    };

    const auto deny = match_command({"git", "push", "--force"}, cfg, kCwd);
    ASSERT_TRUE(deny.has_value());
    EXPECT_EQ(deny->action, RuleAction::kDeny);
    EXPECT_EQ(deny->display(), "no force push");

    const auto ask = match_command({"git", "push", "origin"}, cfg, kCwd);
    ASSERT_TRUE(ask.has_value());
    EXPECT_EQ(ask->action, RuleAction::kAsk);
    EXPECT_EQ(ask->display(), "git push");

    const auto allow = match_command({"git", "log"}, cfg, kCwd);
    ASSERT_TRUE(allow.has_value());
    EXPECT_EQ(allow->action, RuleAction::kAllow);
}

TEST(MatchCommand, OrderDoesNotChangeStrength) {
    RuleConfig cfg{};
    cfg.rules = {
        make_rule(RuleAction::kDeny, "make clean"),
        make_rule(RuleAction::kAllow, "make"),
    };
    const auto m = match_command({"make", "clean"}, cfg, kCwd);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->action, RuleAction::kDeny);
}

TEST(MatchCommand, FirstRuleWinsWithinLevel) {
    RuleConfig cfg{};
    cfg.rules = {
        make_rule(RuleAction::kAsk, "docker", "first"),
        make_rule(RuleAction::kAsk, "docker run", "second"),
    };
    const auto m = match_command({"docker", "run", "alpine"}, cfg, kCwd);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->display(), "first");
}

TEST(MatchCommand, NoRulesNoMatch) {
    EXPECT_FALSE(match_command({"ls"}, RuleConfig{}, kCwd).has_value());
}

// ---------------------------------------------------------------------------
// match_redirect
// ---------------------------------------------------------------------------
TEST(MatchRedirect, GlobCrossesDirectories) {
    RuleConfig cfg{};
    cfg.redirect_rules = {make_rule(RuleAction::kAllow, "/tmp/*")};
    EXPECT_TRUE(match_redirect("/tmp/out.txt", cfg, kCwd).has_value());
    EXPECT_TRUE(match_redirect("/tmp/a/b/c.log", cfg, kCwd).has_value());
    EXPECT_FALSE(match_redirect("/var/tmp/out.txt", cfg, kCwd).has_value());
}

TEST(MatchRedirect, RelativeTargetResolvesAgainstCwd) {
    RuleConfig cfg{};
    cfg.redirect_rules = {make_rule(RuleAction::kAllow, "/work/repo/build/*")};
    EXPECT_TRUE(match_redirect("build/log.txt", cfg, kCwd).has_value());
    EXPECT_TRUE(match_redirect("./build/../build/log.txt", cfg, kCwd).has_value());
    EXPECT_FALSE(match_redirect("../build/log.txt", cfg, kCwd).has_value());
}

TEST(MatchRedirect, RelativePatternUsesProjectRoot) {
    RuleConfig cfg{};
    cfg.project_root   = "/work/repo";
    cfg.redirect_rules = {make_rule(RuleAction::kAllow, "dist/*")};
    EXPECT_TRUE(match_redirect("/work/repo/dist/app.js", cfg, "/elsewhere").has_value());
    EXPECT_FALSE(match_redirect("dist/app.js", cfg, "/elsewhere").has_value());
}

TEST(MatchRedirect, RegexIsUnanchored) {
    RuleConfig cfg{};
    cfg.redirect_rules = {make_rule(RuleAction::kDeny, "re:\\.env$", "secrets")};
    const auto m = match_redirect("config/.env", cfg, kCwd);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->action, RuleAction::kDeny);
    EXPECT_EQ(m->display(), "secrets");
    EXPECT_FALSE(match_redirect("config/.env.example", cfg, kCwd).has_value());
}

TEST(MatchRedirect, DenyOverridesAllow) {
    RuleConfig cfg{};
    cfg.redirect_rules = {
        make_rule(RuleAction::kAllow, "/work/repo/*"),
        make_rule(RuleAction::kDeny, "/work/repo/.git/*"),
    };
    const auto m = match_redirect(".git/config", cfg, kCwd);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->action, RuleAction::kDeny);
}

// ---------------------------------------------------------------------------
// resolve_user_path
// ---------------------------------------------------------------------------
TEST(ResolveUserPath, RelativeAndNormalized) {
    EXPECT_EQ(resolve_user_path("a/../b/./c", "/base"), std::filesystem::path{"/base/b/c"});
    EXPECT_EQ(resolve_user_path("/abs/x", "/base"), std::filesystem::path{"/abs/x"});
}

TEST(ResolveUserPath, TildeExpandsHome) {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        GTEST_SKIP() << "HOME not set";
    }
    EXPECT_EQ(resolve_user_path("~/notes.txt", "/base"),
              (std::filesystem::path{home} / "notes.txt").lexically_normal());
}

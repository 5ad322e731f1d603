// ---------------------------------------------------------------------------
// test_decision_engine.cpp
//
// DecisionEngine 통합 테스트. 실제 파서, 내장 핸들러, 규칙 매처를 함께 쓴다.
//
// [테스트 범위]
// - 단순 명령: 안전 목록, 핸들러, 핸들러 없음, help/version, 래퍼, 환경 변수
// - 대입 단어 판별, 래퍼 중첩 한계
// - 복합 명령: 산술 for, (( )), case, select, 함수, time / ! / coproc
// - 조합: 파이프라인, 목록, deny > ask > allow
// - 치환: 명령/프로세스 치환, 인젝션 위험, heredoc
// - 리다이렉트: 무시 대상, fd 복제, redirect_rules, tee, >& &>> >|, 대상 안의 치환
// - 핸들러가 쓰는 파일: curl -o, git --output, find -fprint
// - 운영자 규칙: allow/ask/deny, 스크립트 경로, cd 목록, 별칭
// - 위임: bash -c, xargs, env
// - 실패 경로: 빈 입력, 파싱 오류, 중첩 한계, 핸들러 예외
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "engine/decision_engine.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

const std::filesystem::path kCwd{"/work"};

Rule make_rule(RuleAction action, std::string pattern, std::string message = {}) {
    Rule rule{};
    rule.action  = action;
    rule.pattern = std::move(pattern);
    rule.message = std::move(message);
    return rule;
}

// 규칙 없는 기본 엔진
class DecisionEngineTest : public ::testing::Test {
protected:
    [[nodiscard]] Decision run(std::string_view command) const {
        return engine_.analyze(command, kCwd);
    }

    [[nodiscard]] Decision run_with(const RuleConfig& config, std::string_view command,
                                    const std::filesystem::path& cwd = kCwd) const {
        return analyze(command, config, cwd);
    }

    DecisionEngine engine_{nullptr};
};

// classify() 가 항상 예외를 던지는 핸들러
class ThrowingHandler final : public CommandHandler {
public:
    [[nodiscard]] std::vector<std::string> names() const override { return {"boom"}; }
    [[nodiscard]] Classification classify(const HandlerContext&) const override {
        throw std::runtime_error("exploded");
    }
};

}  // namespace

// ---------------------------------------------------------------------------
// 단순 명령
// ---------------------------------------------------------------------------
TEST_F(DecisionEngineTest, SimpleSafeCommand) {
    const auto d = run("ls -la");
    EXPECT_EQ(d.action, Action::kAllow);
    EXPECT_EQ(d.reason, "ls");
}

TEST_F(DecisionEngineTest, HandlerAllows) {
    const auto d = run("git status");
    EXPECT_EQ(d.action, Action::kAllow);
    EXPECT_EQ(d.reason, "git status");
}

TEST_F(DecisionEngineTest, HandlerAsks) {
    const auto d = run("git push origin main");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason, "git push");
}

TEST_F(DecisionEngineTest, UnknownCommandAsks) {
    const auto d = run("npm install left-pad");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason, "npm install");
}

TEST_F(DecisionEngineTest, UnsafePatternIsNoted) {
    const auto d = run("rm -rf build");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason, "rm -rf (unsafe pattern)");
}

TEST_F(DecisionEngineTest, HelpAndVersion) {
    EXPECT_EQ(run("cargo --version").reason, "cargo --help");
    EXPECT_TRUE(run("cargo --version").allowed());
    EXPECT_TRUE(run("npm install --help").allowed());
}

TEST_F(DecisionEngineTest, WrappersAreUnwrapped) {
    const auto d = run("timeout 30s git log");
    EXPECT_EQ(d.action, Action::kAllow);
    EXPECT_EQ(d.reason, "git log");
    EXPECT_TRUE(run("nice -n 10 grep x file").allowed());
    EXPECT_EQ(run("nohup npm start").action, Action::kAsk);
    EXPECT_EQ(run("command -v git").reason, "command -v");
}

TEST_F(DecisionEngineTest, LeadingAssignmentsAreSkipped) {
    EXPECT_EQ(run("LANG=C git status").reason, "git status");
    const auto d = run("FOO=1 BAR=2");
    EXPECT_EQ(d.action, Action::kAllow);
    EXPECT_EQ(d.reason, "env assignment");
}

TEST_F(DecisionEngineTest, ConditionalTest) {
    EXPECT_EQ(run("test -f Makefile").reason, "conditional test");
    EXPECT_TRUE(run("[ -d build ] && ls build").allowed());
}

TEST_F(DecisionEngineTest, CommentOnly) {
    const auto d = run("# nothing");
    EXPECT_EQ(d.action, Action::kAllow);
    EXPECT_EQ(d.reason, "comment");
}

// ---------------------------------------------------------------------------
// 조합
// ---------------------------------------------------------------------------
TEST_F(DecisionEngineTest, PipelineAndListOfSafeCommands) {
    const auto d = run("ls | grep foo && pwd");
    EXPECT_EQ(d.action, Action::kAllow);
}

TEST_F(DecisionEngineTest, OneUnsafeMemberMakesListAsk) {
    const auto d = run("git status && git push");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason, "git push");
}

TEST_F(DecisionEngineTest, MultipleTopLevelCommands) {
    const auto d = run("ls\nnpm test\nmake");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason, "npm test, make");
}

TEST_F(DecisionEngineTest, CompoundCommands) {
    EXPECT_TRUE(run("for f in a b; do wc -l $f; done").allowed());
    EXPECT_EQ(run("if true; then rm -rf x; fi").action, Action::kAsk);
    EXPECT_TRUE(run("while true; do sleep 1; done").allowed());
    EXPECT_EQ(run("(cd /tmp && make)").action, Action::kAsk);
    EXPECT_TRUE(run("{ ls; pwd; }").allowed());
}

// ---------------------------------------------------------------------------
// 치환
// ---------------------------------------------------------------------------
TEST_F(DecisionEngineTest, UnsafeCommandSubstitution) {
    const auto d = run("echo $(rm -rf /)");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason.rfind("command substitution: ", 0), 0U) << d.reason;
}

TEST_F(DecisionEngineTest, SafeCommandSubstitution) {
    EXPECT_TRUE(run("echo $(date)").allowed());
    EXPECT_TRUE(run("ls $(pwd)").allowed());
    EXPECT_TRUE(run("echo \"branch: $(git rev-parse --abbrev-ref HEAD)\"").allowed());
}

TEST_F(DecisionEngineTest, SubstitutedHandlerArgumentIsInjectionRisk) {
    const auto d = run("git $(echo push)");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason, "cmdsub injection risk: echo push");
}

TEST_F(DecisionEngineTest, ProcessSubstitution) {
    EXPECT_TRUE(run("diff <(ls a) <(ls b)").allowed());
    const auto d = run("cat <(rm -rf x)");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason.rfind("process substitution <(...): ", 0), 0U) << d.reason;
}

TEST_F(DecisionEngineTest, UnquotedHeredocBodyIsScanned) {
    const auto d = run("cat <<EOF\n$(rm -rf /)\nEOF\n");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason.rfind("cmdsub: ", 0), 0U) << d.reason;
}

TEST_F(DecisionEngineTest, QuotedHeredocBodyIsLiteral) {
    EXPECT_TRUE(run("cat <<'EOF'\n$(rm -rf /)\nEOF\n").allowed());
}

TEST_F(DecisionEngineTest, SubstitutionInConditional) {
    EXPECT_EQ(run("[[ -f $(rm -rf x) ]]").action, Action::kAsk);
    EXPECT_TRUE(run("[[ -f $(which ls) ]]").allowed());
}

// ---------------------------------------------------------------------------
// 리다이렉트
// ---------------------------------------------------------------------------
TEST_F(DecisionEngineTest, OutputRedirectAsksWithoutRule) {
    const auto d = run("echo hi > out.txt");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason, "redirect to out.txt");
}

TEST_F(DecisionEngineTest, IgnoredRedirectTargets) {
    EXPECT_TRUE(run("ls > /dev/null").allowed());
    EXPECT_TRUE(run("ls 2>&1").allowed());
    EXPECT_TRUE(run("ls 2> /dev/stderr").allowed());
    EXPECT_TRUE(run("grep x < input.txt").allowed());
}

TEST_F(DecisionEngineTest, RedirectRules) {
    RuleConfig cfg{};
    cfg.redirect_rules = {
        make_rule(RuleAction::kAllow, "/tmp/*"),
        make_rule(RuleAction::kAsk, "/work/logs/*", "log directory"),
        make_rule(RuleAction::kDeny, "/etc/*", "system config"),
    };
    EXPECT_TRUE(run_with(cfg, "echo hi > /tmp/x.txt").allowed());

    const auto ask = run_with(cfg, "echo hi >> logs/app.log");
    EXPECT_EQ(ask.action, Action::kAsk);
    EXPECT_EQ(ask.reason, "redirect to logs/app.log: log directory");

    const auto deny = run_with(cfg, "echo x > /etc/hosts");
    EXPECT_EQ(deny.action, Action::kDeny);
    EXPECT_EQ(deny.reason, "redirect to /etc/hosts: system config");
}

TEST_F(DecisionEngineTest, TeeTargetsFollowRedirectRules) {
    EXPECT_EQ(run("ls | tee out.txt").action, Action::kAsk);

    RuleConfig cfg{};
    cfg.redirect_rules = {
        make_rule(RuleAction::kAllow, "/work/*"),
        make_rule(RuleAction::kDeny, "/work/.env", "secrets"),
    };
    EXPECT_TRUE(run_with(cfg, "ls | tee out.txt").allowed());

    const auto deny = run_with(cfg, "echo k | tee .env");
    EXPECT_EQ(deny.action, Action::kDeny);
    EXPECT_EQ(deny.reason, "tee .env: secrets");
}

// ---------------------------------------------------------------------------
// 운영자 규칙
// ---------------------------------------------------------------------------
TEST_F(DecisionEngineTest, CommandRules) {
    RuleConfig cfg{};
    cfg.rules = {
        make_rule(RuleAction::kAllow, "make test"),
        make_rule(RuleAction::kDeny, "git push --force", "no force pushes"),
        make_rule(RuleAction::kAsk, "cat"),
    };

    const auto allow = run_with(cfg, "make test");
    EXPECT_EQ(allow.action, Action::kAllow);
    EXPECT_EQ(allow.reason, "make (make test)");

    const auto deny = run_with(cfg, "git push --force origin");
    EXPECT_EQ(deny.action, Action::kDeny);
    EXPECT_EQ(deny.reason, "git: no force pushes");

    // 운영자 규칙이 안전 목록보다 먼저다
    const auto ask = run_with(cfg, "cat /etc/passwd");
    EXPECT_EQ(ask.action, Action::kAsk);
    EXPECT_EQ(ask.reason, "cat: cat");
}

TEST_F(DecisionEngineTest, DenyAnywhereDeniesWhole) {
    RuleConfig cfg{};
    cfg.rules = {make_rule(RuleAction::kDeny, "re:rm -rf /$", "root wipe")};
    EXPECT_EQ(run_with(cfg, "ls && rm -rf /").action, Action::kDeny);
    EXPECT_EQ(run_with(cfg, "echo $(rm -rf /)").action, Action::kDeny);
    EXPECT_EQ(run_with(cfg, "bash -c 'rm -rf /'").action, Action::kDeny);
}

TEST_F(DecisionEngineTest, ScriptRuleWithCdList) {
    RuleConfig cfg{};
    cfg.project_root = "/work";
    cfg.rules        = {make_rule(RuleAction::kAllow, "tools/run.sh")};

    EXPECT_TRUE(run_with(cfg, "./tools/run.sh").allowed());
    EXPECT_EQ(run_with(cfg, "./run.sh").action, Action::kAsk);
    EXPECT_TRUE(run_with(cfg, "cd tools && ./run.sh").allowed());
}

TEST_F(DecisionEngineTest, AliasesRouteToHandler) {
    RuleConfig cfg{};
    cfg.aliases = {{"g", "git"}};
    const auto d = run_with(cfg, "g status");
    EXPECT_EQ(d.action, Action::kAllow);
    EXPECT_EQ(d.reason, "git status");
}

// ---------------------------------------------------------------------------
// 위임
// ---------------------------------------------------------------------------
TEST_F(DecisionEngineTest, ShellDashCIsAnalyzed) {
    const auto safe = run("bash -c 'git status && ls'");
    EXPECT_EQ(safe.action, Action::kAllow);

    const auto unsafe = run("sh -c 'rm -rf /'");
    EXPECT_EQ(unsafe.action, Action::kAsk);

    EXPECT_TRUE(run("bash -c \"sh -c 'pwd'\"").allowed());
}

TEST_F(DecisionEngineTest, XargsAndEnvDelegate) {
    EXPECT_TRUE(run("find . -name '*.log' | xargs grep -l ERROR").allowed());
    EXPECT_EQ(run("find . -name '*.o' | xargs rm").action, Action::kAsk);
    EXPECT_TRUE(run("env FOO=1 git log").allowed());
}

TEST_F(DecisionEngineTest, SqlAndPythonThroughHandlers) {
    EXPECT_TRUE(run("sqlite3 app.db 'SELECT count(*) FROM users'").allowed());
    EXPECT_EQ(run("sqlite3 app.db 'DROP TABLE users'").action, Action::kAsk);
    EXPECT_TRUE(run("psql -c 'SELECT 1'").allowed());
    EXPECT_EQ(run("python3 -c 'import os'").action, Action::kAsk);
}

// ---------------------------------------------------------------------------
// 대입 단어 판별
// ---------------------------------------------------------------------------
TEST_F(DecisionEngineTest, PathWithEqualsIsNotAnAssignment) {
    const auto evil = run("./evil=1");
    EXPECT_EQ(evil.action, Action::kAsk);
    EXPECT_EQ(evil.reason, "./evil=1");

    const auto after_assignment = run("FOO=1 ./run=me");
    EXPECT_EQ(after_assignment.action, Action::kAsk);
    EXPECT_EQ(after_assignment.reason, "./run=me");
}

TEST_F(DecisionEngineTest, QuotedNameIsNotAnAssignment) {
    const auto d = run("\"FOO\"=1 ls");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason, "FOO=1 ls");
}

TEST_F(DecisionEngineTest, SubscriptAndAppendAssignments) {
    const auto d = run("A[0]=x B+=y C_2=");
    EXPECT_EQ(d.action, Action::kAllow);
    EXPECT_EQ(d.reason, "env assignment");
    EXPECT_EQ(run("A[1]=x rm -rf build").action, Action::kAsk);
}

// ---------------------------------------------------------------------------
// 래퍼 중첩
// ---------------------------------------------------------------------------
TEST_F(DecisionEngineTest, LongWrapperChainHitsCeiling) {
    std::string command;
    for (int i = 0; i < 5000; ++i) {
        command += "nice ";
    }
    command += "ls";
    const auto d = run(command);
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason, "nesting too deep");
}

TEST_F(DecisionEngineTest, ShortWrapperChainIsUnwrapped) {
    const auto d = run("nice -n 5 timeout 10 nohup ls");
    EXPECT_EQ(d.action, Action::kAllow);
    EXPECT_EQ(d.reason, "ls");
    EXPECT_EQ(run("nice nice nice rm -rf /").reason, "rm -rf (unsafe pattern)");
}

// ---------------------------------------------------------------------------
// 복합 명령 안의 치환
// ---------------------------------------------------------------------------
TEST_F(DecisionEngineTest, ArithmeticForClauses) {
    const auto d = run("for ((i=$(rm x); i<3; i++)); do echo $i; done");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason.rfind("cmdsub: rm x", 0), 0U) << d.reason;
    EXPECT_TRUE(run("for ((i=0; i<3; i++)); do echo $i; done").allowed());
}

TEST_F(DecisionEngineTest, ArithmeticCommand) {
    const auto d = run("(( $(rm y) ))");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason.rfind("arithmetic cmdsub: rm y", 0), 0U) << d.reason;

    const auto plain = run("(( x + 1 ))");
    EXPECT_EQ(plain.action, Action::kAllow);
    EXPECT_EQ(plain.reason, "arithmetic");
}

TEST_F(DecisionEngineTest, CaseWordAndBodies) {
    const auto word = run("case $(rm x) in a) echo a;; esac");
    EXPECT_EQ(word.action, Action::kAsk);
    EXPECT_EQ(word.reason.rfind("cmdsub: rm x", 0), 0U) << word.reason;

    const auto body = run("case $1 in a) ls;; b) rm -rf /;; esac");
    EXPECT_EQ(body.action, Action::kAsk);
    EXPECT_EQ(body.reason, "rm -rf (unsafe pattern)");

    EXPECT_TRUE(run("case $1 in a) ls;; *) pwd;; esac").allowed());
}

TEST_F(DecisionEngineTest, SelectWords) {
    const auto d = run("select x in $(rm x); do echo $x; done");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason.rfind("cmdsub: rm x", 0), 0U) << d.reason;
    EXPECT_TRUE(run("select x in a b; do echo $x; done").allowed());
}

TEST_F(DecisionEngineTest, FunctionBodyIsAnalyzed) {
    const auto d = run("f() { rm -rf /; }");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason, "rm -rf (unsafe pattern)");
    EXPECT_TRUE(run("f() { ls; }").allowed());
}

TEST_F(DecisionEngineTest, TimeNegationCoprocWrapTheirCommand) {
    EXPECT_EQ(run("time git push").reason, "git push");
    EXPECT_EQ(run("time git push").action, Action::kAsk);
    EXPECT_TRUE(run("time ls").allowed());

    EXPECT_EQ(run("! git push").action, Action::kAsk);
    EXPECT_TRUE(run("! grep -q x file").allowed());

    EXPECT_EQ(run("coproc rm -rf build").action, Action::kAsk);
    EXPECT_TRUE(run("coproc ls").allowed());
}

TEST_F(DecisionEngineTest, GroupRedirectTargetSubstitution) {
    const auto brace = run("{ ls; } > $(rm z)");
    EXPECT_EQ(brace.action, Action::kAsk);
    EXPECT_EQ(brace.reason.rfind("cmdsub: rm z", 0), 0U) << brace.reason;
    EXPECT_EQ(brace.reason.find("redirect to"), std::string::npos) << brace.reason;

    const auto subshell = run("(ls) > $(rm z)");
    EXPECT_EQ(subshell.action, Action::kAsk);
    EXPECT_EQ(subshell.reason.find("redirect to"), std::string::npos) << subshell.reason;
}

TEST_F(DecisionEngineTest, SafeTargetSubstitutionStillChecksRedirect) {
    const auto d = run("ls > $(echo out.txt)");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_NE(d.reason.find("redirect to"), std::string::npos) << d.reason;
}

TEST_F(DecisionEngineTest, OtherOutputRedirectForms) {
    EXPECT_EQ(run("ls >&out.txt").reason, "redirect to out.txt");
    EXPECT_EQ(run("ls &>> all.log").reason, "redirect to all.log");
    EXPECT_EQ(run("ls >| forced.txt").reason, "redirect to forced.txt");
    EXPECT_EQ(run("ls &> both.log").reason, "redirect to both.log");
    EXPECT_EQ(run("ls 2>> err.log").reason, "redirect to err.log");
    EXPECT_TRUE(run("ls >&2").allowed());
    EXPECT_TRUE(run("ls 2>&-").allowed());
}

// ---------------------------------------------------------------------------
// 핸들러 옵션 해석
// ---------------------------------------------------------------------------
TEST_F(DecisionEngineTest, HandlerOptionsThatRunOrWrite) {
    EXPECT_EQ(run("env -S 'rm -rf /'").action, Action::kAsk);
    EXPECT_EQ(run("bash ./evil.sh -c ls").reason, "bash ./evil.sh");
    EXPECT_EQ(run("git -c core.pager='touch /tmp/pwn' log").reason, "git -c core.pager");
    EXPECT_EQ(run("curl -o /etc/x http://a").reason, "curl");
    EXPECT_EQ(run("curl -o /etc/x http://a").action, Action::kAsk);
    EXPECT_EQ(run("git diff --output=/etc/x").action, Action::kAsk);
    EXPECT_EQ(run("find . -fprint out").action, Action::kAsk);
    EXPECT_TRUE(run("env -S 'git status'").allowed());
}

TEST_F(DecisionEngineTest, HandlerOutputFilesFollowRedirectRules) {
    RuleConfig cfg{};
    cfg.redirect_rules = {
        make_rule(RuleAction::kAllow, "/tmp/*"),
        make_rule(RuleAction::kDeny, "/etc/*", "system config"),
    };
    EXPECT_TRUE(run_with(cfg, "curl -sSo /tmp/page.html https://example.com").allowed());

    const auto deny = run_with(cfg, "curl -o /etc/x http://a");
    EXPECT_EQ(deny.action, Action::kDeny);
    EXPECT_EQ(deny.reason, "curl: system config");

    EXPECT_EQ(run_with(cfg, "git diff --output=/etc/x").action, Action::kDeny);
    EXPECT_TRUE(run_with(cfg, "find . -fprint /tmp/list").allowed());
}

// ---------------------------------------------------------------------------
// 실패 경로
// ---------------------------------------------------------------------------
TEST_F(DecisionEngineTest, EmptyInput) {
    EXPECT_EQ(run("").reason, "empty command");
    EXPECT_EQ(run("  \n\t ").action, Action::kAsk);
}

TEST_F(DecisionEngineTest, ParseErrorAsks) {
    const auto d = run("echo 'unterminated");
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason.rfind("parse error: ", 0), 0U) << d.reason;
}

TEST_F(DecisionEngineTest, DeepNestingAsks) {
    std::string command = "echo ";
    for (int i = 0; i < kMaxNestingDepth + 10; ++i) {
        command += "$(echo ";
    }
    command += "x";
    for (int i = 0; i < kMaxNestingDepth + 10; ++i) {
        command += ")";
    }
    EXPECT_EQ(run(command).action, Action::kAsk);
}

TEST_F(DecisionEngineTest, AnalysisIsDeterministic) {
    const std::string command = "ls | grep x && git push; echo $(date) > out.txt";
    const auto first  = run(command);
    const auto second = run(command);
    EXPECT_EQ(first.action, second.action);
    EXPECT_EQ(first.reason, second.reason);
}

TEST(DecisionEngineRegistry, HandlerExceptionBecomesAsk) {
    HandlerRegistry registry;
    registry.add(std::make_unique<ThrowingHandler>());
    const DecisionEngine engine{nullptr, registry};

    const auto d = engine.analyze("boom now", kCwd);
    EXPECT_EQ(d.action, Action::kAsk);
    EXPECT_EQ(d.reason, "boom: handler error");
}

TEST(DecisionEngineRegistry, EmptyRegistryFallsBackToAsk) {
    const HandlerRegistry registry{};
    const DecisionEngine  engine{nullptr, registry};
    EXPECT_EQ(engine.analyze("git status", kCwd).action, Action::kAsk);
    EXPECT_TRUE(engine.analyze("ls", kCwd).allowed());
}

// ---------------------------------------------------------------------------
// test_handlers.cpp
//
// 명령별 CommandHandler 와 HandlerRegistry 단위 테스트.
//
// [테스트 범위]
// - git: 전역 플래그 건너뛰기, 읽기 action, 인자에 따라 갈리는 action
// - bash -c / env / xargs: 내부 명령 위임
// - find / sed / sort / tee: 쓰기 플래그, tee 의 리다이렉트 대상
// - curl: 데이터 전송 플래그, 메서드
// - docker / kubectl: 하위 명령 표
// - sqlite3 / psql / mysql: SQL 분류기 연동
// - python: 버전/모듈/스크립트 정적 분석
// - 레지스트리: 이름 조회, 별칭
// ---------------------------------------------------------------------------

#include "handler/container_handlers.hpp"
#include "handler/curl_handler.hpp"
#include "handler/delegating_handlers.hpp"
#include "handler/git_handler.hpp"
#include "handler/handler_registry.hpp"
#include "handler/python_handler.hpp"
#include "handler/sql_handlers.hpp"
#include "handler/text_handlers.hpp"
#include "shell/shell_quote.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

Classification run(const CommandHandler& handler, std::vector<std::string> tokens,
                   const fs::path& cwd = "/work") {
    return handler.classify(HandlerContext{std::move(tokens), cwd});
}

void expect_allow(const Classification& c, const std::string& desc) {
    EXPECT_EQ(c.action, HandlerAction::kAllow) << c.description;
    EXPECT_EQ(c.description, desc);
}

void expect_ask(const Classification& c, const std::string& desc) {
    EXPECT_EQ(c.action, HandlerAction::kAsk) << c.description;
    EXPECT_EQ(c.description, desc);
}

}  // namespace

// ---------------------------------------------------------------------------
// git
// ---------------------------------------------------------------------------
TEST(GitHandler, ReadOnlyActions) {
    const GitHandler git{};
    expect_allow(run(git, {"git", "status"}), "git status");
    expect_allow(run(git, {"git", "log", "--oneline", "-5"}), "git log");
    expect_allow(run(git, {"git", "diff", "HEAD~1"}), "git diff");
}

TEST(GitHandler, GlobalFlagsAreSkipped) {
    const GitHandler git{};
    expect_allow(run(git, {"git", "-C", "/repo", "status"}), "git status");
    expect_allow(run(git, {"git", "--no-pager", "log"}), "git log");
    expect_allow(run(git, {"git", "--git-dir=/repo/.git", "show"}), "git show");
}

TEST(GitHandler, WriteActionsAsk) {
    const GitHandler git{};
    expect_ask(run(git, {"git", "push"}), "git push");
    expect_ask(run(git, {"git", "commit", "-m", "msg"}), "git commit");
    expect_ask(run(git, {"git", "reset", "--hard"}), "git reset");
}

TEST(GitHandler, UnclearActionsGetContext) {
    const GitHandler git{};
    expect_ask(run(git, {"git", "gc"}), "git gc (garbage collect)");
    expect_ask(run(git, {"git", "filter-branch"}), "git filter-branch (rewrite history)");
}

TEST(GitHandler, ArgumentDependentActions) {
    const GitHandler git{};
    expect_allow(run(git, {"git", "branch"}), "git branch");
    expect_allow(run(git, {"git", "branch", "--list", "feat*"}), "git branch");
    expect_ask(run(git, {"git", "branch", "feature"}), "git branch");
    expect_ask(run(git, {"git", "branch", "-D", "old"}), "git branch");

    expect_ask(run(git, {"git", "stash"}), "git stash");
    expect_allow(run(git, {"git", "stash", "list"}), "git stash");

    expect_allow(run(git, {"git", "config", "user.name"}), "git config");
    expect_ask(run(git, {"git", "config", "user.name", "someone"}), "git config");
    expect_allow(run(git, {"git", "config", "--get", "core.editor"}), "git config");

    expect_allow(run(git, {"git", "remote", "-v"}), "git remote");
    expect_ask(run(git, {"git", "remote", "add", "up", "url"}), "git remote");
}

TEST(GitHandler, BareGitAsks) {
    const GitHandler git{};
    expect_ask(run(git, {"git"}), "git");
    expect_ask(run(git, {"git", "--unknown-flag", "status"}), "git");
}

TEST(GitHandler, ConfigOverridesThatRunCommandsAsk) {
    const GitHandler git{};
    expect_ask(run(git, {"git", "-c", "core.pager=touch /tmp/pwn", "log"}), "git -c core.pager");
    expect_ask(run(git, {"git", "-c", "alias.st=!rm -rf .", "status"}), "git -c alias.st");
    expect_ask(run(git, {"git", "-c", "core.sshCommand=evil", "fetch"}), "git -c core.sshCommand");
    expect_ask(run(git, {"git", "--config-env=core.pager=PAGER", "log"}), "git --config-env");
    expect_allow(run(git, {"git", "-c", "color.ui=never", "log"}), "git log");
    expect_allow(run(git, {"git", "-c", "core.quotePath=false", "status"}), "git status");
}

TEST(GitHandler, OutputFilesBecomeRedirectTargets) {
    const GitHandler git{};
    const auto diff = run(git, {"git", "diff", "--output=/etc/x"});
    expect_allow(diff, "git diff");
    ASSERT_TRUE(diff.redirect_targets.has_value());
    EXPECT_EQ(*diff.redirect_targets, (std::vector<std::string>{"/etc/x"}));

    const auto log = run(git, {"git", "log", "-p", "--output", "log.txt"});
    ASSERT_TRUE(log.redirect_targets.has_value());
    EXPECT_EQ(*log.redirect_targets, (std::vector<std::string>{"log.txt"}));

    const auto archive = run(git, {"git", "archive", "-o", "out.tar", "HEAD"});
    ASSERT_TRUE(archive.redirect_targets.has_value());
    EXPECT_EQ(*archive.redirect_targets, (std::vector<std::string>{"out.tar"}));

    EXPECT_FALSE(run(git, {"git", "log", "--oneline"}).redirect_targets.has_value());
}

// ---------------------------------------------------------------------------
// 위임 핸들러
// ---------------------------------------------------------------------------
TEST(ShellHandler, DashCDelegates) {
    const ShellHandler sh{};
    const auto c = run(sh, {"bash", "-c", "ls -la"});
    EXPECT_EQ(c.action, HandlerAction::kDelegate);
    ASSERT_TRUE(c.inner_command.has_value());
    EXPECT_EQ(*c.inner_command, "ls -la");
    EXPECT_EQ(c.description, "bash -c");
}

TEST(ShellHandler, CombinedShortFlags) {
    const ShellHandler sh{};
    const auto c = run(sh, {"sh", "-lc", "pwd"});
    EXPECT_EQ(c.action, HandlerAction::kDelegate);
    EXPECT_EQ(c.inner_command.value_or(""), "pwd");
}

TEST(ShellHandler, NoCommandAsks) {
    const ShellHandler sh{};
    expect_ask(run(sh, {"bash"}), "bash interactive");
    expect_ask(run(sh, {"bash", "-c"}), "bash -c (no command)");
}

TEST(ShellHandler, DashCAfterScriptIsScriptArgument) {
    const ShellHandler sh{};
    expect_ask(run(sh, {"bash", "./evil.sh", "-c", "ls"}), "bash ./evil.sh");
    expect_ask(run(sh, {"sh", "--", "run.sh", "-c", "ls"}), "sh run.sh");
}

TEST(ShellHandler, OptionsBeforeDashC) {
    const ShellHandler sh{};
    const auto c = run(sh, {"bash", "-o", "pipefail", "--norc", "-c", "ls"});
    EXPECT_EQ(c.action, HandlerAction::kDelegate);
    EXPECT_EQ(c.inner_command.value_or(""), "ls");
}

TEST(EnvHandler, StripsAssignmentsAndDelegates) {
    const EnvHandler env{};
    const auto c = run(env, {"env", "-u", "HOME", "FOO=1", "ls", "-la"});
    EXPECT_EQ(c.action, HandlerAction::kDelegate);
    EXPECT_EQ(c.inner_command.value_or(""), "ls -la");
}

TEST(EnvHandler, BareEnvPrints) {
    const EnvHandler env{};
    expect_allow(run(env, {"env"}), "env");
    expect_allow(run(env, {"env", "A=1"}), "env");
}

TEST(EnvHandler, SplitStringIsTheCommand) {
    const EnvHandler env{};
    const auto c = run(env, {"env", "-S", "rm -rf /"});
    EXPECT_EQ(c.action, HandlerAction::kDelegate);
    EXPECT_EQ(c.inner_command.value_or(""), "rm -rf /");
    EXPECT_EQ(c.description, "env -S");

    EXPECT_EQ(run(env, {"env", "--split-string=ls -la"}).inner_command.value_or(""), "ls -la");
    EXPECT_EQ(run(env, {"env", "-S", "ls", "-l"}).inner_command.value_or(""), "ls -l");
    EXPECT_EQ(run(env, {"env", "-Sgrep x"}).inner_command.value_or(""), "grep x");
    expect_ask(run(env, {"env", "-S"}), "env -S (no command)");
}

TEST(XargsHandler, DelegatesInnerCommand) {
    const XargsHandler xargs{};
    const auto c = run(xargs, {"xargs", "-n", "1", "grep", "-l", "TODO"});
    EXPECT_EQ(c.action, HandlerAction::kDelegate);
    EXPECT_EQ(c.inner_command.value_or(""), "grep -l TODO");

    const auto attached = run(xargs, {"xargs", "-n1", "rm"});
    EXPECT_EQ(attached.inner_command.value_or(""), "rm");
}

TEST(XargsHandler, InteractiveFlagsAsk) {
    const XargsHandler xargs{};
    expect_ask(run(xargs, {"xargs", "-p", "rm"}), "xargs -p (prompt before execute)");
    expect_ask(run(xargs, {"xargs", "--interactive", "rm"}), "xargs --interactive");
    expect_ask(run(xargs, {"xargs"}), "xargs (no command)");
}

// ---------------------------------------------------------------------------
// 텍스트 도구
// ---------------------------------------------------------------------------
TEST(TextHandlers, FindExecAndDelete) {
    const FindHandler find{};
    expect_allow(run(find, {"find", ".", "-name", "*.cpp"}), "find");
    expect_ask(run(find, {"find", ".", "-delete"}), "find -delete");
    expect_ask(run(find, {"find", ".", "-exec", "rm", "{}", ";"}), "find -exec");
}

TEST(TextHandlers, FindFileOutputsBecomeRedirectTargets) {
    const FindHandler find{};
    const auto c = run(find, {"find", ".", "-name", "*.o", "-fprint", "out"});
    expect_allow(c, "find");
    ASSERT_TRUE(c.redirect_targets.has_value());
    EXPECT_EQ(*c.redirect_targets, (std::vector<std::string>{"out"}));

    const auto fmt_out = run(find, {"find", ".", "-fprintf", "list.txt", "%p\\n", "-fls", "ls.txt"});
    ASSERT_TRUE(fmt_out.redirect_targets.has_value());
    EXPECT_EQ(*fmt_out.redirect_targets, (std::vector<std::string>{"list.txt", "ls.txt"}));

    expect_ask(run(find, {"find", ".", "-fprint"}), "find -fprint");
    EXPECT_FALSE(run(find, {"find", "."}).redirect_targets.has_value());
}

TEST(TextHandlers, SedInPlace) {
    const SedHandler sed{};
    expect_allow(run(sed, {"sed", "-n", "1,5p", "file"}), "sed");
    expect_ask(run(sed, {"sed", "-i", "s/a/b/", "file"}), "sed -i (in-place edit)");
    expect_ask(run(sed, {"sed", "-i.bak", "s/a/b/", "file"}), "sed -i (in-place edit)");
    expect_ask(run(sed, {"sed", "--in-place", "s/a/b/", "file"}), "sed -i (in-place edit)");
}

TEST(TextHandlers, SortOutput) {
    const SortHandler sort{};
    expect_allow(run(sort, {"sort", "-u", "file"}), "sort");
    expect_ask(run(sort, {"sort", "-o", "out", "file"}), "sort -o (write file)");
}

TEST(TextHandlers, TeeReportsTargets) {
    const TeeHandler tee{};
    expect_allow(run(tee, {"tee"}), "tee");

    const auto one = run(tee, {"tee", "-a", "log.txt"});
    expect_allow(one, "tee log.txt");
    ASSERT_TRUE(one.redirect_targets.has_value());
    EXPECT_EQ(*one.redirect_targets, (std::vector<std::string>{"log.txt"}));

    const auto two = run(tee, {"tee", "a", "b"});
    expect_allow(two, "tee 2 files");
    ASSERT_TRUE(two.redirect_targets.has_value());
    EXPECT_EQ(two.redirect_targets->size(), 2U);
}

// ---------------------------------------------------------------------------
// curl
// ---------------------------------------------------------------------------
TEST(CurlHandler, PlainGetIsAllowed) {
    const CurlHandler curl{};
    expect_allow(run(curl, {"curl", "-sSL", "https://example.com"}), "curl");
    expect_allow(run(curl, {"curl", "-X", "GET", "https://example.com"}), "curl");
    expect_allow(run(curl, {"curl", "-I", "https://example.com"}), "curl");
}

TEST(CurlHandler, SendingDataAsks) {
    const CurlHandler curl{};
    expect_ask(run(curl, {"curl", "-d", "a=1", "https://example.com"}), "curl -d");
    expect_ask(run(curl, {"curl", "--data=a", "https://example.com"}), "curl --data");
    expect_ask(run(curl, {"curl", "-X", "post", "https://example.com"}), "curl -X POST");
    expect_ask(run(curl, {"curl", "-XDELETE", "https://example.com"}), "curl -X DELETE");
    expect_ask(run(curl, {"curl", "-K", "cfg"}), "curl -K");
}

TEST(CurlHandler, OutputFilesBecomeRedirectTargets) {
    const CurlHandler curl{};
    const auto c = run(curl, {"curl", "-o", "/etc/x", "http://a"});
    expect_allow(c, "curl");
    ASSERT_TRUE(c.redirect_targets.has_value());
    EXPECT_EQ(*c.redirect_targets, (std::vector<std::string>{"/etc/x"}));

    const auto bundled = run(curl, {"curl", "-sSLo", "page.html", "https://example.com"});
    ASSERT_TRUE(bundled.redirect_targets.has_value());
    EXPECT_EQ(*bundled.redirect_targets, (std::vector<std::string>{"page.html"}));

    const auto assigned =
        run(curl, {"curl", "--output=a.bin", "-D", "headers.txt", "https://example.com"});
    ASSERT_TRUE(assigned.redirect_targets.has_value());
    EXPECT_EQ(*assigned.redirect_targets, (std::vector<std::string>{"a.bin", "headers.txt"}));

    EXPECT_FALSE(run(curl, {"curl", "-o", "-", "https://example.com"}).redirect_targets.has_value());
    EXPECT_FALSE(run(curl, {"curl", "-H", "X-Out: o", "https://example.com"})
                     .redirect_targets.has_value());
}

TEST(CurlHandler, RemoteNameAsks) {
    const CurlHandler curl{};
    expect_ask(run(curl, {"curl", "-O", "https://example.com/a.tgz"}),
               "curl -O (save under remote name)");
    expect_ask(run(curl, {"curl", "-sLO", "https://example.com/a.tgz"}),
               "curl -O (save under remote name)");
}

// ---------------------------------------------------------------------------
// docker / kubectl
// ---------------------------------------------------------------------------
TEST(DockerHandler, ActionsAndSubcommands) {
    const DockerHandler docker{};
    expect_allow(run(docker, {"docker", "ps", "-a"}), "docker ps");
    expect_ask(run(docker, {"docker", "run", "alpine"}), "docker run");
    expect_allow(run(docker, {"docker", "image", "ls"}), "docker image ls");
    expect_ask(run(docker, {"docker", "image", "rm", "x"}), "docker image rm");
    expect_allow(run(docker, {"docker", "--context", "prod", "ps"}), "docker ps");
    expect_ask(run(docker, {"docker", "save", "-o", "img.tar", "x"}),
               "docker save -o (write file)");
}

TEST(DockerHandler, Compose) {
    const DockerHandler docker{};
    expect_allow(run(docker, {"docker", "compose", "ps"}), "docker compose ps");
    expect_ask(run(docker, {"docker", "compose", "-f", "dev.yml", "up"}), "docker compose up");
    expect_allow(run(docker, {"docker-compose", "logs"}), "docker-compose logs");
}

TEST(KubectlHandler, ReadVersusWrite) {
    const KubectlHandler kubectl{};
    expect_allow(run(kubectl, {"kubectl", "get", "pods"}), "kubectl get");
    expect_allow(run(kubectl, {"kubectl", "-n", "prod", "describe", "pod", "x"}),
                 "kubectl describe");
    expect_ask(run(kubectl, {"kubectl", "delete", "pod", "x"}), "kubectl delete");
    expect_allow(run(kubectl, {"kubectl", "config", "view"}), "kubectl config view");
    expect_ask(run(kubectl, {"kubectl", "config", "use-context", "prod"}),
               "kubectl config use-context");
    expect_allow(run(kubectl, {"kubectl", "rollout", "status", "deploy/x"}),
                 "kubectl rollout status");
    expect_ask(run(kubectl, {"kubectl", "rollout", "undo", "deploy/x"}), "kubectl rollout undo");
}

// ---------------------------------------------------------------------------
// SQL 클라이언트
// ---------------------------------------------------------------------------
TEST(SqlHandlers, Sqlite3) {
    const Sqlite3Handler sqlite{};
    expect_allow(run(sqlite, {"sqlite3", "app.db", "SELECT * FROM users"}),
                 "sqlite3 (read-only query)");
    expect_ask(run(sqlite, {"sqlite3", "app.db", "DELETE FROM users"}), "sqlite3 (write query)");
    expect_ask(run(sqlite, {"sqlite3", "app.db", "PRAGMA journal_mode = WAL"}),
               "sqlite3 (write query)");
    expect_ask(run(sqlite, {"sqlite3", "app.db"}), "sqlite3 (interactive)");
    expect_allow(run(sqlite, {"sqlite3", "-readonly", "app.db", "DELETE FROM t"}),
                 "sqlite3 (read-only mode)");
    expect_ask(run(sqlite, {"sqlite3", "-json", "app.db", ".tables"}),
               "sqlite3 (unknown query)");
}

TEST(SqlHandlers, Psql) {
    const PsqlHandler psql{};
    expect_allow(run(psql, {"psql", "-c", "SELECT 1"}), "psql (read-only query)");
    expect_allow(run(psql, {"psql", "--command=SELECT 1"}), "psql (read-only query)");
    expect_ask(run(psql, {"psql", "-c", "SELECT 1", "-c", "DROP TABLE t"}), "psql (write query)");
    expect_ask(run(psql, {"psql", "-c", "VACUUM"}), "psql (write query)");
    expect_ask(run(psql, {"psql", "-f", "setup.sql"}), "psql (file input)");
    expect_ask(run(psql, {"psql", "mydb"}), "psql (interactive)");
    expect_allow(run(psql, {"psql", "-l"}), "psql --list");
}

TEST(SqlHandlers, Mysql) {
    const MysqlHandler mysql{};
    expect_allow(run(mysql, {"mysql", "-e", "SHOW TABLES"}), "mysql (read-only query)");
    expect_ask(run(mysql, {"mysql", "-eDELETE FROM t"}), "mysql (write query)");
    expect_ask(run(mysql, {"mysql", "--execute=VACUUM"}), "mysql (unknown query)");
    expect_ask(run(mysql, {"mysql", "db"}), "mysql (interactive)");
}

// ---------------------------------------------------------------------------
// python
// ---------------------------------------------------------------------------
class PythonHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "cmdgate_test_handler" /
               (std::string(info->test_suite_name()) + "_" + info->name());
        fs::create_directories(dir_);
    }

    void TearDown() override { fs::remove_all(dir_); }

    void write(const std::string& name, const std::string& content) const {
        std::ofstream out(dir_ / name);
        out << content;
    }

    fs::path      dir_;
    PythonHandler python_{};
};

TEST_F(PythonHandlerTest, VersionAndHelp) {
    expect_allow(run(python_, {"python3", "--version"}, dir_), "python3 --version");
    expect_allow(run(python_, {"python", "-h"}, dir_), "python -h");
}

TEST_F(PythonHandlerTest, InlineCodeAndModulesAsk) {
    expect_ask(run(python_, {"python3", "-c", "print(1)"}, dir_), "python3 -c");
    expect_ask(run(python_, {"python3", "-m", "http.server"}, dir_), "python3 -m http.server");
    expect_allow(run(python_, {"python3", "-m", "calendar"}, dir_), "python3 -m calendar");
    expect_ask(run(python_, {"python3"}, dir_), "python3 interactive");
}

TEST_F(PythonHandlerTest, SafeScriptIsAnalyzed) {
    write("stats.py", "import statistics\nprint(statistics.mean([1, 2, 3]))\n");
    expect_allow(run(python_, {"python3", "stats.py"}, dir_), "python3 stats.py (analyzed)");
}

TEST_F(PythonHandlerTest, UnsafeScriptAsksWithReason) {
    write("clean.py", "import shutil\nshutil.rmtree('/tmp/x')\n");
    expect_ask(run(python_, {"python3", "clean.py"}, dir_),
               "python3 clean.py: import: dangerous module: shutil (line 1)");
}

TEST_F(PythonHandlerTest, MissingScriptAsks) {
    const auto c = run(python_, {"python3", "nope.py"}, dir_);
    EXPECT_EQ(c.action, HandlerAction::kAsk);
    EXPECT_NE(c.description.find("file not found"), std::string::npos);
}

TEST_F(PythonHandlerTest, FlagsAfterScriptBelongToScript) {
    write("evil.py", "import shutil\nshutil.rmtree('/')\n");
    expect_ask(run(python_, {"python3", "evil.py", "--version"}, dir_),
               "python3 evil.py: import: dangerous module: shutil (line 1)");
    expect_ask(run(python_, {"python3", "evil.py", "-c", "x"}, dir_),
               "python3 evil.py: import: dangerous module: shutil (line 1)");
}

TEST_F(PythonHandlerTest, BundledShortOptions) {
    expect_ask(run(python_, {"python3", "-Bc", "print(1)"}, dir_), "python3 -c");
    write("stats.py", "import statistics\n");
    expect_allow(run(python_, {"python3", "-W", "ignore", "-B", "stats.py"}, dir_),
                 "python3 stats.py (analyzed)");
}

// ---------------------------------------------------------------------------
// 레지스트리
// ---------------------------------------------------------------------------
TEST(HandlerRegistry, BuiltinFindsEveryFamily) {
    const auto& registry = HandlerRegistry::builtin();
    for (const char* name : {"git", "bash", "sh", "env", "xargs", "find", "sed", "sort", "tee",
                             "curl", "docker", "podman", "kubectl", "sqlite3", "psql", "mysql",
                             "python", "python3", "python3.12"}) {
        EXPECT_NE(registry.find(name), nullptr) << name;
    }
    EXPECT_EQ(registry.find("ls"), nullptr);
    EXPECT_EQ(registry.find("rm"), nullptr);
}

TEST(HandlerRegistry, AliasResolvesToTarget) {
    const auto& registry = HandlerRegistry::builtin();
    const std::map<std::string, std::string> aliases{{"k", "kubectl"}, {"git", "docker"}};
    EXPECT_EQ(registry.find("k", aliases), registry.find("kubectl"));
    EXPECT_EQ(registry.find("git", aliases), registry.find("docker"));
    EXPECT_EQ(registry.find("curl", aliases), registry.find("curl"));
}

TEST(HandlerRegistry, EmptyRegistry) {
    HandlerRegistry registry;
    EXPECT_EQ(registry.size(), 0U);
    registry.add(std::make_unique<CurlHandler>());
    EXPECT_EQ(registry.size(), 1U);
    EXPECT_NE(registry.find("curl"), nullptr);
    registry.add(nullptr);
    EXPECT_EQ(registry.size(), 1U);
}

TEST(DefaultDescription, FirstTwoTokens) {
    EXPECT_EQ(default_description({}), "unknown");
    EXPECT_EQ(default_description({"ls"}), "ls");
    EXPECT_EQ(default_description({"npm", "install", "left-pad"}), "npm install");
}

// ---------------------------------------------------------------------------
// bash_quote
// ---------------------------------------------------------------------------
TEST(ShellQuote, QuotesOnlyWhenNeeded) {
    EXPECT_EQ(bash_quote("ls"), "ls");
    EXPECT_EQ(bash_quote("a b"), "'a b'");
    EXPECT_EQ(bash_quote(""), "''");
    EXPECT_EQ(bash_quote("it's"), "'it'\"'\"'s'");
    EXPECT_EQ(bash_join({"echo", "$HOME"}), "echo '$HOME'");
}

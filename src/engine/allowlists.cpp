#include "engine/allowlists.hpp"

#include <array>
#include <cctype>
#include <regex>
#include <unordered_set>

namespace {

using NameSet = std::unordered_set<std::string_view>;

const NameSet kSimpleSafe = {
    // 파일 내용 보기
    "cat", "head", "tail", "less", "more", "bat", "tac", "od", "hexdump", "ldd", "nm", "objdump",
    "otool", "readelf", "size", "strings",
    // 디렉토리 목록
    "ls", "ll", "la", "tree", "exa", "eza", "dir", "vdir",
    // 파일/디스크 정보
    "stat", "file", "wc", "du", "df",
    // 경로
    "basename", "dirname", "pwd", "cd", "readlink", "realpath",
    // 검색
    "grep", "rg", "ripgrep", "ag", "ack", "locate",
    // 텍스트 처리
    "uniq", "cut", "col", "colrm", "column", "comm", "cmp", "diff", "expand", "bc", "dc",
    "expr", "fmt", "fold", "join", "nl", "paste", "rev", "seq", "tr", "tsort", "unexpand",
    // 구조화 데이터
    "jq", "yq", "xq",
    // 인코딩/해시
    "base64", "md5sum", "sha1sum", "sha256sum", "sha512sum", "b2sum", "cksum", "md5", "shasum",
    "sum",
    // 사용자/시스템 정보
    "whoami", "hostname", "uname", "sw_vers", "id", "groups", "last", "locale", "w", "who",
    // 날짜/시간
    "date", "cal", "uptime",
    // 프로세스/자원 모니터링
    "dmesg", "iostat", "ps", "pgrep", "top", "htop", "free", "fuser", "lsof", "nettop",
    "ioreg", "powermetrics", "system_profiler", "vm_stat", "vmstat",
    // 출력
    "printenv", "echo", "printf",
    // 네트워크 진단
    "ping", "host", "dig", "nslookup", "traceroute", "mtr", "netstat", "ss", "arp", "route",
    "whois",
    // 명령 조회/도움말
    "which", "whereis", "type", "command", "hash", "man", "help", "info",
    // 린터
    "mypy", "black", "isort", "flake8", "pre-commit",
    // 셸 내장
    "true", "false", "sleep", "read",
    // 터미널
    "clear", "reset", "tput", "tty",
};

const NameSet kWrappers = {
    "time", "timeout", "nice", "nohup", "strace", "ltrace", "command", "builtin",
};

const NameSet kHelpSecondToken = {"help", "version", "--version", "--help", "-h"};

// 핸들러 없는 명령에서 찾는 위험 패턴
const std::vector<std::regex>& unsafe_patterns() {
    static const std::vector<std::regex> patterns = [] {
        constexpr std::array<const char*, 7> kSources = {
            R"(\brm\s+\S)", R"(\bmv\s+)",    R"(\bcp\s+)", R"(\bchmod\s+)",
            R"(\bchown\s+)", R"(\bsudo\s+)", R"(\bdd\s+)",
        };
        std::vector<std::regex> out;
        out.reserve(kSources.size());
        for (const char* src : kSources) {
            out.emplace_back(src, std::regex_constants::ECMAScript);
        }
        return out;
    }();
    return patterns;
}

}  // namespace

bool is_simple_safe(std::string_view command) noexcept {
    return kSimpleSafe.contains(command);
}

bool is_wrapper(std::string_view command) noexcept {
    return kWrappers.contains(command);
}

bool is_numeric_argument(std::string_view token) noexcept {
    if (token.empty()) {
        return false;
    }
    // timeout 의 단위 접미사 (30s, 5m, 1h, 2d)
    const char last = token.back();
    if (token.size() > 1 && (last == 's' || last == 'm' || last == 'h' || last == 'd')) {
        token.remove_suffix(1);
    }
    bool digit_seen = false;
    for (const char c : token) {
        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            digit_seen = true;
        } else if (c != '.') {
            return false;
        }
    }
    return digit_seen;
}

bool is_version_or_help(const std::vector<std::string>& tokens) {
    if (tokens.size() < 2) {
        return false;
    }
    if (tokens.size() == 2 && kHelpSecondToken.contains(tokens[1])) {
        return true;
    }
    return tokens.size() <= 4 && (tokens.back() == "--help" || tokens.back() == "-h");
}

bool matches_unsafe_pattern(const std::string& command_text) {
    for (const auto& re : unsafe_patterns()) {
        if (std::regex_search(command_text, re)) {
            return true;
        }
    }
    return false;
}

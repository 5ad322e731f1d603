#include "handler/curl_handler.hpp"

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "handler/token_scan.hpp"

namespace {

const TokenSet kDataFlags = {
    "-d", "--data", "--data-binary", "--data-raw", "--data-ascii", "--data-urlencode",
    "-F", "--form", "--form-string", "-T", "--upload-file", "--json",
};

const TokenSet kUnsafeFlags = {
    "-K", "--config", "--ftp-create-dirs", "--mail-from", "--mail-rcpt",
};

// 파일 이름을 인자로 받아 그 파일에 쓰는 플래그
const TokenSet kFileOutputFlags = {
    "-o", "--output", "-D", "--dump-header", "-c", "--cookie-jar", "--trace", "--trace-ascii",
    "--stderr", "--libcurl", "--etag-save",
};

// 원격 이름으로 현재 디렉토리에 저장
const TokenSet kRemoteNameFlags = {"-O", "--remote-name", "--remote-name-all", "-J",
                                   "--remote-header-name"};

// 인자를 받는 짧은 플래그. -sSo out 처럼 묶였을 때 인자 위치를 찾는 데 쓴다.
constexpr std::string_view kShortWithArg = "AbcCdDeEFHKmoPQrtTuUwxXyYz";

// 쓰기 대상 파일을 받는 짧은 플래그
constexpr std::string_view kShortFileOutput = "oDc";

const TokenSet kSafeMethods = {"GET", "HEAD", "OPTIONS", "TRACE"};

const TokenSet kSafeFtpCommands = {
    "PWD", "LIST", "NLST", "STAT", "SIZE", "MDTM", "NOOP", "HELP", "SYST", "TYPE", "PASV", "CWD",
    "CDUP", "FEAT",
};

[[nodiscard]] bool safe_method(std::string_view method) {
    return kSafeMethods.contains(to_upper_ascii(method));
}

// -Q "LIST /" 의 첫 단어
[[nodiscard]] bool safe_ftp_command(const std::string& quoted) {
    std::istringstream in{quoted};
    std::string        word;
    in >> word;
    return !word.empty() && kSafeFtpCommands.contains(to_upper_ascii(word));
}

// 첫 번째 문제 플래그. 없으면 빈 문자열.
[[nodiscard]] std::string find_unsafe(const std::vector<std::string>& tokens) {
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto& t    = tokens[i];
        const bool  next = i + 1 < tokens.size();

        if (kUnsafeFlags.contains(t) || kDataFlags.contains(t) || is_assigned_flag(t, kDataFlags)) {
            return t.substr(0, t.find('='));
        }
        if ((t == "-X" || t == "--request") && next && !safe_method(tokens[i + 1])) {
            return t + " " + to_upper_ascii(tokens[i + 1]);
        }
        if (t.starts_with("--request=") && !safe_method(t.substr(10))) {
            return "--request " + to_upper_ascii(t.substr(10));
        }
        if (t.starts_with("-X") && t.size() > 2 && t[2] != '=' && !safe_method(t.substr(2))) {
            return "-X " + to_upper_ascii(t.substr(2));
        }
        if ((t == "-Q" || t == "--quote") && next && !safe_ftp_command(tokens[i + 1])) {
            return t;
        }
    }
    return {};
}

struct OutputScan {
    std::vector<std::string> targets{};
    bool                     remote_name{false};
};

// 쓰기 대상 파일 수집. "-" 는 stdout.
[[nodiscard]] OutputScan scan_outputs(const std::vector<std::string>& tokens) {
    OutputScan scan;
    auto add = [&scan](const std::string& target) {
        if (!target.empty() && target != "-") {
            scan.targets.push_back(target);
        }
    };

    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto& t    = tokens[i];
        const bool  next = i + 1 < tokens.size();

        if (kRemoteNameFlags.contains(t)) {
            scan.remote_name = true;
            continue;
        }
        if (t.starts_with("--")) {
            if (kFileOutputFlags.contains(t) && next) {
                add(tokens[++i]);
            } else if (is_assigned_flag(t, kFileOutputFlags)) {
                add(t.substr(t.find('=') + 1));
            }
            continue;
        }
        if (!t.starts_with('-') || t.size() < 2) {
            continue;
        }
        // 짧은 플래그 묶음
        for (std::size_t k = 1; k < t.size(); ++k) {
            const char flag = t[k];
            if (flag == 'O' || flag == 'J') {
                scan.remote_name = true;
                continue;
            }
            if (kShortWithArg.find(flag) == std::string_view::npos) {
                continue;
            }
            const bool  attached = k + 1 < t.size();
            std::string arg;
            if (attached) {
                arg = t.substr(k + 1);
            } else if (next) {
                arg = tokens[++i];
            }
            if (kShortFileOutput.find(flag) != std::string_view::npos) {
                add(arg);
            }
            break;
        }
    }
    return scan;
}

}  // namespace

Classification CurlHandler::classify(const HandlerContext& ctx) const {
    const auto unsafe = find_unsafe(ctx.tokens);
    if (!unsafe.empty()) {
        return Classification::ask("curl " + unsafe);
    }

    auto scan = scan_outputs(ctx.tokens);
    if (scan.remote_name) {
        return Classification::ask("curl -O (save under remote name)");
    }
    auto result = Classification::allow("curl");
    if (!scan.targets.empty()) {
        result.redirect_targets = std::move(scan.targets);
    }
    return result;
}

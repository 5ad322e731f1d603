#include "python/python_analyzer.hpp"

#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "python/py_parser.hpp"

namespace {

using NameSet = std::unordered_set<std::string_view>;

// I/O, 코드 실행, 외부 상태 변경이 불가능한 모듈만 둔다.
const NameSet kSafeModules = {
    // 자료구조
    "collections", "collections.abc", "dataclasses", "typing", "typing_extensions", "types",
    "enum", "array",
    // 수학/알고리즘
    "math", "cmath", "statistics", "decimal", "fractions", "random", "itertools", "functools",
    "operator", "bisect", "heapq", "graphlib",
    // 텍스트
    "re", "string", "textwrap", "difflib", "unicodedata",
    // 메모리 내 데이터 형식
    "json", "csv", "tomllib",
    // 해시/인코딩
    "hashlib", "hmac", "base64", "binascii", "quopri", "uu", "zlib",
    // 날짜/시간
    "datetime", "time", "calendar", "zoneinfo",
    // 구문 도구 (소스 파일 읽기 제외)
    "ast", "dis", "tokenize", "token", "keyword", "symtable",
    // 기타
    "copy", "pprint", "reprlib", "abc", "numbers", "contextlib", "warnings", "traceback",
    "struct", "html", "html.parser", "html.entities",
};

const NameSet kDangerousModules = {
    // 코드 실행
    "subprocess", "os", "sys", "shutil", "runpy", "compileall", "py_compile", "importlib",
    "pkgutil", "popen2", "commands",
    // 파일 I/O
    "pathlib", "io", "fileinput", "tempfile", "glob", "fnmatch", "codecs", "linecache",
    "inspect", "configparser", "gzip", "bz2", "lzma", "tarfile", "zipfile",
    // 네트워크
    "socket", "ssl", "http", "http.client", "http.server", "urllib", "urllib.request",
    "urllib.parse", "ftplib", "smtplib", "poplib", "imaplib", "nntplib", "telnetlib",
    "socketserver", "xmlrpc", "ipaddress",
    // XML (XXE)
    "xml", "xml.etree", "xml.etree.ElementTree", "xml.etree.cElementTree", "xml.sax", "xml.dom",
    "xml.dom.minidom", "xml.dom.pulldom", "xml.dom.expatbuilder", "xml.parsers",
    "xml.parsers.expat",
    // 프로세스/스레드
    "multiprocessing", "threading", "concurrent", "concurrent.futures", "asyncio", "signal",
    "mmap",
    // 시스템
    "ctypes", "platform", "sysconfig", "resource", "pty", "tty", "termios", "fcntl", "grp",
    "pwd", "spwd", "crypt",
    // 역직렬화
    "pickle", "cPickle", "dill", "shelve", "marshal", "jsonpickle",
    // 데이터베이스
    "dbm", "sqlite3",
    // 코드 조작
    "code", "codeop", "gc",
    // 기타
    "webbrowser", "cmd", "shlex", "getpass", "getopt", "argparse", "logging", "atexit", "cgi",
    "cgitb", "wsgiref.handlers",
};

const NameSet kDangerousBuiltins = {
    "eval",    "exec",    "compile", "__import__", "open",       "input",
    "print",   "globals", "locals",  "vars",       "dir",        "setattr",
    "delattr", "getattr", "memoryview", "breakpoint",
};

// 호출 대상 속성 이름. 이름만 일치해도 위반이다.
const NameSet kDangerousAttrs = {
    // 파일
    "write", "writelines", "truncate", "flush", "close", "read", "readline", "readlines",
    "read_text", "read_bytes", "write_text", "write_bytes", "open",
    // OS/프로세스
    "remove", "unlink", "rmdir", "rmtree", "mkdir", "makedirs", "rename", "replace", "chmod",
    "chown", "chroot", "link", "symlink", "system", "popen", "popen2", "popen3", "popen4",
    "spawn", "spawnl", "spawnle", "spawnlp", "spawnlpe", "spawnv", "spawnve", "spawnvp",
    "spawnvpe", "startfile", "fork", "forkpty", "exec", "execl", "execle", "execlp", "execlpe",
    "execv", "execve", "execvp", "execvpe", "kill", "killpg", "terminate", "wait", "waitpid",
    "wait3", "wait4",
    // subprocess
    "call", "check_call", "check_output", "run", "Popen", "getoutput", "getstatusoutput",
    // 네트워크
    "connect", "bind", "listen", "accept", "send", "sendall", "sendto", "sendmsg", "recv",
    "recvfrom", "recvmsg", "request", "urlopen", "urlretrieve",
    // 역직렬화
    "Unpickler",
    // 리플렉션
    "__dict__", "__class__", "__bases__", "__mro__", "__subclasses__", "__globals__", "__code__",
    "__closure__", "__reduce__", "__reduce_ex__", "__getstate__", "__setstate__", "tb_frame",
    "tb_next", "f_back", "f_builtins", "f_code", "f_globals", "f_locals", "f_trace", "co_code",
    "gi_frame", "gi_code", "gi_yieldfrom", "cr_await", "cr_frame", "cr_code",
    // 모듈 조작
    "__import__", "__loader__", "__spec__", "__builtins__",
};

// 호출하지 않고 읽기만 해도 위반인 속성 (프레임/코드 객체 탈출 경로)
const NameSet kReflectionAttrs = {
    "__globals__", "__code__", "__closure__", "__dict__", "__class__", "__bases__", "__mro__",
    "__subclasses__", "__reduce__", "__reduce_ex__", "__builtins__", "tb_frame", "tb_next",
    "f_back", "f_builtins", "f_code", "f_globals", "f_locals", "f_trace", "co_code", "gi_frame",
    "gi_code", "gi_yieldfrom", "cr_await", "cr_frame", "cr_code",
};

const NameSet kDangerousNames = {"__builtins__", "__loader__", "__spec__"};

std::string_view root_package(std::string_view module) {
    return module.substr(0, module.find('.'));
}

// ---------------------------------------------------------------------------
// SafetyVisitor
//   부모 노드를 먼저 검사하고 자식을 소스 순서대로 방문한다.
// ---------------------------------------------------------------------------
class SafetyVisitor {
public:
    explicit SafetyVisitor(bool allow_print)
        : allow_print_(allow_print) {}

    void visit(const PyNode& node) {
        check(node);
        for (const auto& child : node.children) {
            visit(child);
        }
    }

    std::vector<Violation> take() { return std::move(violations_); }

private:
    void add(const PyNode& node, std::string_view kind, std::string detail) {
        violations_.push_back(Violation{node.line, node.col, std::string(kind), std::move(detail)});
    }

    void check_module(const PyNode& node, std::string_view module) {
        const auto root = root_package(module);
        if (kDangerousModules.contains(module) || kDangerousModules.contains(root)) {
            add(node, "import", fmt::format("dangerous module: {}", module));
        } else if (!kSafeModules.contains(module) && !kSafeModules.contains(root)) {
            add(node, "import", fmt::format("unknown module: {}", module));
        }
    }

    void check(const PyNode& node) {
        switch (node.kind) {
            case PyNodeKind::kImport:
                for (const auto& name : node.names) {
                    check_module(node, name);
                }
                break;

            case PyNodeKind::kImportFrom:
                if (node.text.empty()) {
                    add(node, "import", "relative import without module");
                } else {
                    check_module(node, node.text);
                }
                break;

            case PyNodeKind::kCall: {
                const PyNode& func = node.children.front();
                if (func.kind == PyNodeKind::kName) {
                    if (kDangerousBuiltins.contains(func.text)
                        && !(func.text == "print" && allow_print_)) {
                        add(node, "builtin", fmt::format("dangerous builtin: {}", func.text));
                    }
                } else if (func.kind == PyNodeKind::kAttribute) {
                    if (kDangerousAttrs.contains(func.text)) {
                        add(node, "method", fmt::format("dangerous method: {}", func.text));
                    }
                }
                break;
            }

            case PyNodeKind::kAttribute:
                if (kReflectionAttrs.contains(node.text)) {
                    add(node, "reflection", fmt::format("dangerous attribute: {}", node.text));
                }
                break;

            case PyNodeKind::kName:
                if (kDangerousNames.contains(node.text)) {
                    add(node, "reflection", fmt::format("dangerous name: {}", node.text));
                }
                break;

            case PyNodeKind::kAsyncFunctionDef:
            case PyNodeKind::kAsyncFor:
                add(node, "async", "async functions require asyncio");
                break;

            case PyNodeKind::kAsyncWith:
                add(node, "async", "async functions require asyncio");
                check_with_items(node);
                break;

            case PyNodeKind::kComprehension:
                if (node.level == 1) {
                    add(node, "async", "async functions require asyncio");
                }
                break;

            case PyNodeKind::kAwait:
                add(node, "async", "await requires asyncio");
                break;

            case PyNodeKind::kWith:
                check_with_items(node);
                break;

            default:
                break;
        }
    }

    // with open(...): 호출 자체의 builtin 위반과 별개로 기록한다
    void check_with_items(const PyNode& node) {
        for (const auto& item : node.children) {
            if (item.kind != PyNodeKind::kWithItem || item.children.empty()) {
                continue;
            }
            const PyNode& ctx = item.children.front();
            if (ctx.kind == PyNodeKind::kCall && ctx.children.front().kind == PyNodeKind::kName
                && ctx.children.front().text == "open") {
                add(node, "io", "file open in with statement");
            }
        }
    }

    bool                   allow_print_;
    std::vector<Violation> violations_{};
};

// 잘못된 UTF-8 이면 false (CPython 은 디코딩 단계에서 거부한다)
bool is_valid_utf8(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        std::size_t extra = 0;
        if (c < 0x80) {
            extra = 0;
        } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
        } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
            extra = 3;
        } else {
            return false;
        }
        if (i + extra >= s.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
                return false;
            }
        }
        i += extra + 1;
    }
    return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// analyze_python_source
// ---------------------------------------------------------------------------
std::vector<Violation> analyze_python_source(std::string_view source, bool allow_print) {
    const PyParser parser;
    auto           tree = parser.parse(source);
    if (!tree) {
        const auto& err = tree.error();
        return {Violation{err.line, err.column, "syntax", err.message}};
    }

    SafetyVisitor visitor(allow_print);
    visitor.visit(*tree);
    return visitor.take();
}

// ---------------------------------------------------------------------------
// analyze_python_file
// ---------------------------------------------------------------------------
FileVerdict analyze_python_file(const std::filesystem::path& path) {
    namespace fs = std::filesystem;

    // 1. 존재 / 정규 파일 여부
    std::error_code ec;
    const auto      status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return {false, fmt::format("file not found: {}", path.string())};
    }
    if (!fs::is_regular_file(status)) {
        return {false, fmt::format("not a file: {}", path.string())};
    }

    // 2. 확장자
    const auto ext = path.extension().string();
    if (ext != ".py" && ext != ".pyw") {
        return {false, fmt::format("not a Python file: {}", ext)};
    }

    // 3. 크기 상한
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return {false, fmt::format("cannot stat file: {}", ec.message())};
    }
    if (size > kMaxPythonFileSize) {
        return {false, "file too large to analyze"};
    }

    // 4. 읽기
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return {false, fmt::format("cannot read file: {}", std::error_code(errno, std::generic_category()).message())};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const std::string source = buffer.str();
    if (!is_valid_utf8(source)) {
        return {false, "cannot read file: invalid UTF-8"};
    }

    // 5. 분석
    const auto violations = analyze_python_source(source);
    if (!violations.empty()) {
        const auto& v = violations.front();
        spdlog::debug("python_analyzer: {} has {} violation(s)", path.string(), violations.size());
        return {false, fmt::format("{}: {} (line {})", v.kind, v.detail, v.line)};
    }
    return {true, "static analysis passed"};
}

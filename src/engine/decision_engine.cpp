// ---------------------------------------------------------------------------
// decision_engine.cpp
//
// DecisionEngine 구현. 실제 순회는 익명 네임스페이스의 Walker 가 맡는다.
// Walker 는 분석 호출 하나 동안만 존재하며 config/registry 를 참조만 한다.
//
// [깊이 계산]
// - 치환 안쪽, 위임된 내부 명령, 복합 명령 본문으로 내려갈 때 +1.
// - Pipeline/List 의 구성원과 Time/Negation/Coproc 래핑은 같은 깊이.
// ---------------------------------------------------------------------------

#include "engine/decision_engine.hpp"

#include <algorithm>
#include <exception>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "common/types.hpp"
#include "engine/allowlists.hpp"
#include "policy/rule_matcher.hpp"
#include "shell/shell_parser.hpp"

namespace {

namespace fs = std::filesystem;

using Decisions = std::vector<Decision>;

[[nodiscard]] std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

[[nodiscard]] bool is_name_start(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

[[nodiscard]] bool is_name_char(char c) noexcept {
    return is_name_start(c) || (c >= '0' && c <= '9');
}

// 셸 대입 단어 판별. 원문 표기 기준으로 NAME[=], NAME[sub]=, NAME+= 형태만.
// "./evil=1", "FOO"=1 처럼 '=' 앞이 식별자가 아니면 명령 이름이다.
[[nodiscard]] bool is_assignment_word(const Word& word) {
    const std::string_view text = word.text;
    if (text.empty() || !is_name_start(text.front())) {
        return false;
    }
    std::size_t i = 1;
    while (i < text.size() && is_name_char(text[i])) {
        ++i;
    }
    if (i < text.size() && text[i] == '[') {
        const auto close = text.find(']', i + 1);
        if (close == std::string_view::npos) {
            return false;
        }
        i = close + 1;
    }
    if (i < text.size() && text[i] == '+') {
        ++i;
    }
    return i < text.size() && text[i] == '=';
}

// 앞쪽 대입 단어를 건너뛴 명령 이름 위치
[[nodiscard]] std::size_t first_command_index(const std::vector<Word>& words) {
    std::size_t i = 0;
    while (i < words.size() && is_assignment_word(words[i])) {
        ++i;
    }
    return i;
}

// 하위 판정에 사유 접두어를 붙여 감싼다
[[nodiscard]] Decision wrap(Decision inner, std::string_view prefix) {
    Decision out{inner.action, fmt::format("{}{}", prefix, inner.reason), {}};
    out.children.push_back(std::move(inner));
    return out;
}

void append(Decisions& into, Decisions&& from) {
    for (auto& d : from) {
        into.push_back(std::move(d));
    }
}

// "$(rm -rf /)" -> "rm -rf /"
[[nodiscard]] std::string substitution_text(const Word& word) {
    std::string_view v = word.value;
    if (v.starts_with("$(") && v.ends_with(')')) {
        v = v.substr(2, v.size() - 3);
    } else if (v.size() >= 2 && v.starts_with('`') && v.ends_with('`')) {
        v = v.substr(1, v.size() - 2);
    }
    return std::string{trim(v)};
}

// 2>&1, >&-, 1>&2- 처럼 fd 복제/닫기 대상
[[nodiscard]] bool is_descriptor_target(std::string_view target) {
    if (target == "-") {
        return true;
    }
    if (target.ends_with('-')) {
        target.remove_suffix(1);
    }
    if (target.empty()) {
        return false;
    }
    for (const char c : target) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

[[nodiscard]] bool is_ignored_target(std::string_view target) {
    return target == "/dev/null" || target == "/dev/stdout" || target == "/dev/stderr" ||
           target.starts_with('&');
}

// `cd <리터럴>` 이면 대상 문자열
[[nodiscard]] std::optional<std::string> literal_cd_target(const Node& node) {
    const auto* cmd = std::get_if<Command>(&node.value);
    if (cmd == nullptr || cmd->words.size() != 2 || !cmd->redirects.empty()) {
        return std::nullopt;
    }
    if (cmd->words[0].value != "cd") {
        return std::nullopt;
    }
    const auto& target = cmd->words[1];
    if (target.has_substitution() || target.value.empty() || target.value == "-" ||
        target.text.find_first_of("$`") != std::string::npos) {
        return std::nullopt;
    }
    return target.value;
}

[[nodiscard]] Action to_action(RuleAction action) noexcept {
    switch (action) {
        case RuleAction::kAllow: return Action::kAllow;
        case RuleAction::kAsk:   return Action::kAsk;
        case RuleAction::kDeny:  return Action::kDeny;
    }
    return Action::kAsk;
}

// ---------------------------------------------------------------------------
// Walker
// ---------------------------------------------------------------------------
class Walker {
public:
    Walker(const RuleConfig& config, const HandlerRegistry& registry)
        : config_(config), registry_(registry) {}

    [[nodiscard]] Decision analyze_text(std::string_view command, const fs::path& cwd,
                                        int depth) const {
        if (depth > kMaxNestingDepth) {
            return Decision::ask("nesting too deep");
        }
        const auto text = trim(command);
        if (text.empty()) {
            return Decision::ask("empty command");
        }

        const ShellParser parser;
        auto parsed = parser.parse(text);
        if (!parsed) {
            return Decision::ask("parse error: " + parsed.error().message);
        }
        if (parsed->empty()) {
            return Decision::ask("empty command");
        }

        Decisions decisions;
        decisions.reserve(parsed->size());
        for (const auto& node : *parsed) {
            decisions.push_back(walk_node(node, cwd, depth));
        }
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk_node(const Node& node, const fs::path& cwd, int depth) const {
        if (depth > kMaxNestingDepth) {
            return Decision::ask("nesting too deep");
        }
        return std::visit([&](const auto& n) { return walk(n, cwd, depth); }, node.value);
    }

private:
    [[nodiscard]] Decision walk_child(const NodePtr& child, const fs::path& cwd,
                                      int depth) const {
        if (!child) {
            return Decision::allow("empty");
        }
        return walk_node(*child, cwd, depth + 1);
    }

    // -----------------------------------------------------------------------
    // 단순 명령
    // -----------------------------------------------------------------------
    [[nodiscard]] Decision walk(const Command& cmd, const fs::path& cwd, int depth) const {
        std::vector<std::string> words;
        words.reserve(cmd.words.size());
        for (const auto& w : cmd.words) {
            words.push_back(w.value);
        }

        const auto base_idx    = first_command_index(cmd.words);
        const std::string base = base_idx < words.size() ? words[base_idx] : std::string{};
        const bool has_handler =
            !base.empty() && registry_.find(base, config_.aliases) != nullptr;
        const bool simple_safe = is_simple_safe(base);

        Decisions decisions;

        // 1. 단어 안의 치환
        for (std::size_t pos = 0; pos < cmd.words.size(); ++pos) {
            const auto& word = cmd.words[pos];
            for (const auto& part : word.parts) {
                if (const auto* proc = std::get_if<ProcSubPart>(&part.value)) {
                    auto inner = walk_child(proc->command, cwd, depth);
                    if (!inner.allowed()) {
                        return wrap(std::move(inner),
                                    fmt::format("process substitution {}(...): ", proc->direction));
                    }
                    decisions.push_back(std::move(inner));
                } else if (const auto* sub = std::get_if<CmdSubPart>(&part.value)) {
                    auto inner = walk_child(sub->command, cwd, depth);
                    if (!inner.allowed()) {
                        return wrap(std::move(inner), "command substitution: ");
                    }
                    decisions.push_back(std::move(inner));

                    // 규칙 표는 리터럴 토큰을 본다. 동적으로 계산된 인자는
                    // 하위 명령 이름 검사를 우회할 수 있다.
                    if (word.is_pure_substitution() && has_handler && !simple_safe &&
                        pos > base_idx) {
                        return Decision::ask("cmdsub injection risk: " + substitution_text(word));
                    }
                }
            }
        }

        // 2. 리다이렉트
        for (auto& d : redirect_decisions(cmd.redirects, cwd, depth)) {
            if (!d.allowed()) {
                return std::move(d);
            }
            decisions.push_back(std::move(d));
        }

        // 3. 명령 자체
        if (words.empty()) {
            decisions.push_back(Decision::allow("empty command"));
            return combine(std::move(decisions));
        }
        if (base_idx >= words.size()) {
            decisions.push_back(Decision::allow("env assignment"));
            return combine(std::move(decisions));
        }
        if (base == "[" || base == "test") {
            decisions.push_back(Decision::allow("conditional test"));
            return combine(std::move(decisions));
        }
        words.erase(words.begin(), words.begin() + static_cast<std::ptrdiff_t>(base_idx));
        decisions.push_back(classify_words(std::move(words), cwd, depth));
        return combine(std::move(decisions));
    }

    // -----------------------------------------------------------------------
    // 목록/파이프라인
    // -----------------------------------------------------------------------
    [[nodiscard]] Decision walk(const Pipeline& pipeline, const fs::path& cwd, int depth) const {
        Decisions decisions;
        for (const auto& member : pipeline.commands) {
            decisions.push_back(walk_node(member, cwd, depth));
        }
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk(const List& list, const fs::path& cwd, int depth) const {
        fs::path effective_cwd = cwd;
        if (!list.parts.empty()) {
            if (const auto target = literal_cd_target(list.parts.front())) {
                effective_cwd = resolve_user_path(*target, cwd);
                spdlog::debug("decision_engine: list cwd -> '{}'", effective_cwd.string());
            }
        }
        Decisions decisions;
        for (const auto& part : list.parts) {
            decisions.push_back(walk_node(part, effective_cwd, depth));
        }
        return combine(std::move(decisions));
    }

    // -----------------------------------------------------------------------
    // 복합 명령
    // -----------------------------------------------------------------------
    [[nodiscard]] Decision walk(const If& node, const fs::path& cwd, int depth) const {
        Decisions decisions;
        decisions.push_back(walk_child(node.condition, cwd, depth));
        decisions.push_back(walk_child(node.then_body, cwd, depth));
        if (node.else_body) {
            decisions.push_back(walk_child(node.else_body, cwd, depth));
        }
        append(decisions, redirect_decisions(node.redirects, cwd, depth));
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk(const WhileLoop& node, const fs::path& cwd, int depth) const {
        Decisions decisions;
        decisions.push_back(walk_child(node.condition, cwd, depth));
        decisions.push_back(walk_child(node.body, cwd, depth));
        append(decisions, redirect_decisions(node.redirects, cwd, depth));
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk(const For& node, const fs::path& cwd, int depth) const {
        Decisions decisions;
        decisions.push_back(walk_child(node.body, cwd, depth));
        for (const auto& word : node.words) {
            append(decisions, word_substitutions(word, cwd, depth));
        }
        append(decisions, redirect_decisions(node.redirects, cwd, depth));
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk(const ForArith& node, const fs::path& cwd, int depth) const {
        Decisions decisions;
        decisions.push_back(walk_child(node.body, cwd, depth));
        for (const Word* expr : {&node.init, &node.cond, &node.incr}) {
            append(decisions, word_substitutions(*expr, cwd, depth));
        }
        append(decisions, redirect_decisions(node.redirects, cwd, depth));
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk(const Select& node, const fs::path& cwd, int depth) const {
        Decisions decisions;
        decisions.push_back(walk_child(node.body, cwd, depth));
        for (const auto& word : node.words) {
            append(decisions, word_substitutions(word, cwd, depth));
        }
        append(decisions, redirect_decisions(node.redirects, cwd, depth));
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk(const Case& node, const fs::path& cwd, int depth) const {
        Decisions decisions = word_substitutions(node.word, cwd, depth);
        for (const auto& item : node.items) {
            for (const auto& pattern : item.patterns) {
                append(decisions, word_substitutions(pattern, cwd, depth));
            }
            if (item.body) {
                decisions.push_back(walk_child(item.body, cwd, depth));
            }
        }
        append(decisions, redirect_decisions(node.redirects, cwd, depth));
        if (node.items.empty() && decisions.empty()) {
            return Decision::allow("empty case");
        }
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk(const Function& node, const fs::path& cwd, int depth) const {
        Decisions decisions;
        decisions.push_back(walk_child(node.body, cwd, depth));
        append(decisions, redirect_decisions(node.redirects, cwd, depth));
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk(const Subshell& node, const fs::path& cwd, int depth) const {
        Decisions decisions;
        decisions.push_back(walk_child(node.body, cwd, depth));
        append(decisions, redirect_decisions(node.redirects, cwd, depth));
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk(const BraceGroup& node, const fs::path& cwd, int depth) const {
        Decisions decisions;
        decisions.push_back(walk_child(node.body, cwd, depth));
        append(decisions, redirect_decisions(node.redirects, cwd, depth));
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk(const Time& node, const fs::path& cwd, int depth) const {
        return node.pipeline ? walk_node(*node.pipeline, cwd, depth) : Decision::allow("empty");
    }

    [[nodiscard]] Decision walk(const Negation& node, const fs::path& cwd, int depth) const {
        return node.pipeline ? walk_node(*node.pipeline, cwd, depth) : Decision::allow("empty");
    }

    [[nodiscard]] Decision walk(const Coproc& node, const fs::path& cwd, int depth) const {
        return node.command ? walk_node(*node.command, cwd, depth) : Decision::allow("empty");
    }

    [[nodiscard]] Decision walk(const CondExpr& node, const fs::path& cwd, int depth) const {
        Decisions decisions = cond_substitutions(node.body.get(), cwd, depth);
        append(decisions, redirect_decisions(node.redirects, cwd, depth));
        if (decisions.empty()) {
            return Decision::allow("conditional");
        }
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk(const ArithCmd& node, const fs::path& cwd, int depth) const {
        Decisions decisions;
        for (const auto& part : node.expression.parts) {
            const NodePtr* inner_node = nullptr;
            if (const auto* sub = std::get_if<CmdSubPart>(&part.value)) {
                inner_node = &sub->command;
            } else if (const auto* proc = std::get_if<ProcSubPart>(&part.value)) {
                inner_node = &proc->command;
            }
            if (inner_node == nullptr) {
                continue;
            }
            auto inner = walk_child(*inner_node, cwd, depth);
            decisions.push_back(inner.allowed() ? std::move(inner)
                                                : wrap(std::move(inner), "arithmetic cmdsub: "));
        }
        append(decisions, redirect_decisions(node.redirects, cwd, depth));
        if (decisions.empty()) {
            return Decision::allow("arithmetic");
        }
        return combine(std::move(decisions));
    }

    [[nodiscard]] Decision walk(const Comment&, const fs::path&, int) const {
        return Decision::allow("comment");
    }

    [[nodiscard]] Decision walk(const Empty&, const fs::path&, int) const {
        return Decision::allow("empty");
    }

    // -----------------------------------------------------------------------
    // 치환 탐색
    // -----------------------------------------------------------------------
    [[nodiscard]] Decisions word_substitutions(const Word& word, const fs::path& cwd,
                                               int depth) const {
        Decisions decisions;
        for (const auto& part : word.parts) {
            if (const auto* sub = std::get_if<CmdSubPart>(&part.value)) {
                auto inner = walk_child(sub->command, cwd, depth);
                decisions.push_back(inner.allowed() ? std::move(inner)
                                                    : wrap(std::move(inner), "cmdsub: "));
            } else if (const auto* proc = std::get_if<ProcSubPart>(&part.value)) {
                auto inner = walk_child(proc->command, cwd, depth);
                decisions.push_back(
                    inner.allowed()
                        ? std::move(inner)
                        : wrap(std::move(inner), fmt::format("procsub {}(...): ", proc->direction)));
            }
        }
        return decisions;
    }

    [[nodiscard]] Decisions cond_substitutions(const CondTerm* term, const fs::path& cwd,
                                               int depth) const {
        Decisions decisions;
        if (term == nullptr) {
            return decisions;
        }
        if (const auto* unary = std::get_if<UnaryTest>(&term->value)) {
            return word_substitutions(unary->operand, cwd, depth);
        }
        if (const auto* binary = std::get_if<BinaryTest>(&term->value)) {
            decisions = word_substitutions(binary->left, cwd, depth);
            append(decisions, word_substitutions(binary->right, cwd, depth));
            return decisions;
        }
        if (const auto* both = std::get_if<CondAnd>(&term->value)) {
            decisions = cond_substitutions(both->left.get(), cwd, depth);
            append(decisions, cond_substitutions(both->right.get(), cwd, depth));
            return decisions;
        }
        if (const auto* either = std::get_if<CondOr>(&term->value)) {
            decisions = cond_substitutions(either->left.get(), cwd, depth);
            append(decisions, cond_substitutions(either->right.get(), cwd, depth));
            return decisions;
        }
        if (const auto* negated = std::get_if<CondNot>(&term->value)) {
            return cond_substitutions(negated->operand.get(), cwd, depth);
        }
        if (const auto* paren = std::get_if<CondParen>(&term->value)) {
            return cond_substitutions(paren->inner.get(), cwd, depth);
        }
        return decisions;
    }

    // 따옴표 없는 heredoc 본문의 $(...) / `...`
    [[nodiscard]] Decisions text_substitutions(std::string_view text, const fs::path& cwd,
                                               int depth) const {
        Decisions decisions;
        auto push_inner = [&](std::string_view inner_text) {
            auto inner = analyze_text(inner_text, cwd, depth + 1);
            decisions.push_back(inner.allowed() ? std::move(inner)
                                                : wrap(std::move(inner), "cmdsub: "));
        };

        std::size_t i = 0;
        while (i < text.size()) {
            const char c = text[i];
            if (c == '\\') {
                i += 2;
                continue;
            }
            // $(( 산술 )) 은 건너뛴다. 안쪽 $( 는 다음 반복에서 찾는다.
            if (text.compare(i, 3, "$((") == 0) {
                i += 3;
                continue;
            }
            if (text.compare(i, 2, "$(") == 0) {
                int         level = 1;
                std::size_t j     = i + 2;
                while (j < text.size() && level > 0) {
                    if (text[j] == '(') {
                        ++level;
                    } else if (text[j] == ')') {
                        --level;
                    }
                    ++j;
                }
                if (level == 0) {
                    push_inner(text.substr(i + 2, j - 1 - (i + 2)));
                    i = j;
                } else {
                    ++i;
                }
                continue;
            }
            if (c == '`') {
                const auto close = text.find('`', i + 1);
                if (close != std::string_view::npos) {
                    push_inner(text.substr(i + 1, close - i - 1));
                    i = close + 1;
                } else {
                    ++i;
                }
                continue;
            }
            ++i;
        }
        return decisions;
    }

    // -----------------------------------------------------------------------
    // 리다이렉트
    // -----------------------------------------------------------------------
    [[nodiscard]] Decisions redirect_decisions(const std::vector<Redirect>& redirects,
                                               const fs::path& cwd, int depth) const {
        Decisions decisions;
        for (const auto& r : redirects) {
            if (r.kind == RedirectKind::kHereDoc) {
                if (!r.heredoc_quoted && r.heredoc_body) {
                    append(decisions, text_substitutions(*r.heredoc_body, cwd, depth));
                }
                continue;
            }

            // 대상 안의 치환이 이미 허용되지 않으면 파일 쓰기 판정은 생략
            auto       target_subs = word_substitutions(r.target, cwd, depth);
            const bool sub_blocked = std::any_of(target_subs.begin(), target_subs.end(),
                                                 [](const Decision& d) { return !d.allowed(); });
            append(decisions, std::move(target_subs));
            if (sub_blocked) {
                continue;
            }
            const auto& target = r.target.value;

            switch (r.kind) {
                case RedirectKind::kInput:
                case RedirectKind::kDupInput:
                case RedirectKind::kHereString:
                case RedirectKind::kHereDoc:
                    break;
                case RedirectKind::kDupOutput:
                    if (is_descriptor_target(target)) {
                        break;
                    }
                    [[fallthrough]];
                case RedirectKind::kOutput:
                case RedirectKind::kAppend:
                case RedirectKind::kClobber:
                case RedirectKind::kReadWrite:
                case RedirectKind::kOutputBoth:
                case RedirectKind::kAppendBoth:
                    if (!is_ignored_target(target)) {
                        decisions.push_back(output_redirect(target, cwd));
                    }
                    break;
                default:
                    decisions.push_back(
                        Decision::ask(fmt::format("unrecognized construct: redirect {}", r.op)));
                    break;
            }
        }
        return decisions;
    }

    [[nodiscard]] Decision output_redirect(const std::string& target, const fs::path& cwd) const {
        const auto match = match_redirect(target, config_, cwd);
        if (!match) {
            return Decision::ask("redirect to " + target);
        }
        if (match->action == RuleAction::kAllow) {
            return Decision::allow("redirect to " + target);
        }
        return Decision{to_action(match->action),
                        fmt::format("redirect to {}: {}", target, match->display()), {}};
    }

    // -----------------------------------------------------------------------
    // 단어 목록 분류
    // -----------------------------------------------------------------------
    // tokens 는 대입 단어를 제거한 명령 단어들. 래퍼는 벗길 때마다 깊이 1 로 센다.
    [[nodiscard]] Decision classify_words(std::vector<std::string> tokens, const fs::path& cwd,
                                          int depth) const {
        for (int level = depth;; ++level) {
            if (level > kMaxNestingDepth) {
                return Decision::ask("nesting too deep");
            }
            const auto& base = tokens.front();

            // 1. 운영자 규칙
            if (const auto match = match_command(tokens, config_, cwd)) {
                if (match->action == RuleAction::kAllow) {
                    return Decision::allow(fmt::format("{} ({})", base, match->pattern));
                }
                return Decision{to_action(match->action),
                                fmt::format("{}: {}", base, match->display()), {}};
            }

            // 2. 투명 래퍼
            if (!is_wrapper(base) || tokens.size() < 2) {
                return classify_base(tokens, cwd, level);
            }
            if (base == "command" && (tokens[1] == "-v" || tokens[1] == "-V")) {
                return Decision::allow("command -v");
            }
            std::size_t j = 1;
            while (j < tokens.size()) {
                const auto& t = tokens[j];
                if (t == "--") {
                    ++j;
                    break;
                }
                if (is_numeric_argument(t) || t.starts_with('-')) {
                    ++j;
                    continue;
                }
                break;
            }
            if (j >= tokens.size()) {
                return Decision::ask(base);
            }
            tokens.erase(tokens.begin(), tokens.begin() + static_cast<std::ptrdiff_t>(j));
        }
    }

    [[nodiscard]] Decision classify_base(const std::vector<std::string>& tokens,
                                         const fs::path& cwd, int depth) const {
        const auto& base = tokens.front();

        // 3. 무조건 안전
        if (is_simple_safe(base)) {
            return Decision::allow(base);
        }

        // 4. help / version
        if (is_version_or_help(tokens)) {
            return Decision::allow(base + " --help");
        }

        // 5. 명령별 핸들러
        if (const auto* handler = registry_.find(base, config_.aliases)) {
            return classify_with_handler(*handler, tokens, cwd, depth);
        }

        // 6. 핸들러 없음
        const auto desc = default_description(tokens);
        std::string joined;
        for (const auto& t : tokens) {
            if (!joined.empty()) {
                joined += ' ';
            }
            joined += t;
        }
        if (matches_unsafe_pattern(joined)) {
            return Decision::ask(desc + " (unsafe pattern)");
        }
        return Decision::ask(desc);
    }

    [[nodiscard]] Decision classify_with_handler(const CommandHandler&           handler,
                                                 const std::vector<std::string>& tokens,
                                                 const fs::path& cwd, int depth) const {
        const auto& base = tokens.front();
        Classification result;
        std::string desc;
        try {
            result = handler.classify(HandlerContext{tokens, cwd});
            desc   = result.description.empty() ? handler.describe(tokens) : result.description;
        } catch (const std::exception& e) {
            spdlog::warn("decision_engine: handler for '{}' failed: {}", base, e.what());
            return Decision::ask(base + ": handler error");
        }

        // 핸들러가 파일에 쓰는 대상. deny 가 하나라도 있으면 deny.
        if (result.redirect_targets) {
            std::optional<Decision> pending;
            for (const auto& target : *result.redirect_targets) {
                const auto match = match_redirect(target, config_, cwd);
                if (!match) {
                    if (!pending) {
                        pending = Decision::ask(desc);
                    }
                    continue;
                }
                if (match->action == RuleAction::kDeny) {
                    return Decision::deny(fmt::format("{}: {}", desc, match->display()));
                }
                if (match->action == RuleAction::kAsk && !pending) {
                    pending = Decision::ask(fmt::format("{}: {}", desc, match->display()));
                }
            }
            if (pending) {
                return std::move(*pending);
            }
        }

        switch (result.action) {
            case HandlerAction::kAllow:
                return Decision::allow(desc);
            case HandlerAction::kDelegate:
                if (result.inner_command) {
                    return analyze_text(*result.inner_command, cwd, depth + 1);
                }
                return Decision::ask(desc);
            case HandlerAction::kAsk:
                break;
        }
        return Decision::ask(desc);
    }

    const RuleConfig&      config_;
    const HandlerRegistry& registry_;
};

}  // namespace

// ---------------------------------------------------------------------------
// DecisionEngine
// ---------------------------------------------------------------------------
DecisionEngine::DecisionEngine(std::shared_ptr<const RuleConfig> config,
                               const HandlerRegistry&            registry)
    : config_(config ? std::move(config) : std::make_shared<const RuleConfig>()),
      registry_(&registry) {}

Decision DecisionEngine::analyze(std::string_view command, const fs::path& cwd) const {
    try {
        const Walker walker{*config_, *registry_};
        auto decision = walker.analyze_text(command, cwd, 0);
        spdlog::debug("decision_engine: {} ({})", action_name(decision.action), decision.reason);
        return decision;
    } catch (const std::exception& e) {
        spdlog::error("decision_engine: internal error: {}", e.what());
        return Decision::ask(fmt::format("internal error: {}", e.what()));
    }
}

Decision analyze(std::string_view command, const RuleConfig& config, const fs::path& cwd) {
    const DecisionEngine engine{std::make_shared<const RuleConfig>(config)};
    return engine.analyze(command, cwd);
}

#include "handler/text_handlers.hpp"

#include "handler/token_scan.hpp"

namespace {

const TokenSet kFindUnsafe = {"-exec", "-execdir", "-ok", "-okdir", "-delete"};

// 다음 인자 파일에 결과를 쓰는 action
const TokenSet kFindFileOutput = {"-fprint", "-fprint0", "-fprintf", "-fls"};

// tokens[1..] 중 short 또는 long 으로 시작하는 토큰
[[nodiscard]] const std::string* find_prefixed(const std::vector<std::string>& tokens,
                                               std::string_view short_flag,
                                               std::string_view long_flag) {
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto& t = tokens[i];
        if (t.starts_with(long_flag)) {
            return &t;
        }
        if (!t.starts_with("--") && t.starts_with(short_flag)) {
            return &t;
        }
    }
    return nullptr;
}

}  // namespace

Classification FindHandler::classify(const HandlerContext& ctx) const {
    const auto& tokens = ctx.tokens;
    std::vector<std::string> targets;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        if (kFindUnsafe.contains(tokens[i])) {
            return Classification::ask("find " + tokens[i]);
        }
        if (kFindFileOutput.contains(tokens[i])) {
            if (i + 1 >= tokens.size()) {
                return Classification::ask("find " + tokens[i]);
            }
            targets.push_back(tokens[++i]);
        }
    }
    auto result = Classification::allow("find");
    if (!targets.empty()) {
        result.redirect_targets = std::move(targets);
    }
    return result;
}

Classification SedHandler::classify(const HandlerContext& ctx) const {
    if (find_prefixed(ctx.tokens, "-i", "--in-place") != nullptr) {
        return Classification::ask("sed -i (in-place edit)");
    }
    return Classification::allow("sed");
}

Classification SortHandler::classify(const HandlerContext& ctx) const {
    if (find_prefixed(ctx.tokens, "-o", "--output") != nullptr) {
        return Classification::ask("sort -o (write file)");
    }
    return Classification::allow("sort");
}

Classification TeeHandler::classify(const HandlerContext& ctx) const {
    const auto& tokens = ctx.tokens;
    std::vector<std::string> targets;
    for (std::size_t i = 1; i < tokens.size(); ++i) {
        const auto& t = tokens[i];
        if (t == "--") {
            targets.insert(targets.end(), tokens.begin() + static_cast<std::ptrdiff_t>(i) + 1,
                           tokens.end());
            break;
        }
        if (t.starts_with('-')) {
            continue;
        }
        targets.push_back(t);
    }

    // 파일 없는 tee 는 stdin 을 stdout 으로 복사만 한다
    if (targets.empty()) {
        return Classification::allow("tee");
    }
    auto result = Classification::allow(
        targets.size() == 1 ? "tee " + targets.front()
                            : "tee " + std::to_string(targets.size()) + " files");
    result.redirect_targets = std::move(targets);
    return result;
}

#include "handler/container_handlers.hpp"

#include <map>

#include "handler/token_scan.hpp"

namespace {

using SubcommandTable = std::map<std::string_view, TokenSet>;

// ---------------------------------------------------------------------------
// docker / podman
// ---------------------------------------------------------------------------
const TokenSet kDockerSafeActions = {
    "version", "help", "info", "ps", "images", "image", "inspect", "logs", "stats", "top",
    "port", "diff", "history", "search", "events", "system", "network", "volume", "config",
    "context", "export", "save",
};

const SubcommandTable kDockerSafeSub = {
    {"image",     {"ls", "list", "inspect", "history", "save"}},
    {"container", {"ls", "list", "inspect", "logs", "stats", "top", "port", "diff", "export"}},
    {"network",   {"ls", "list", "inspect"}},
    {"volume",    {"ls", "list", "inspect"}},
    {"system",    {"df", "info", "events"}},
    {"context",   {"ls", "list", "inspect", "show"}},
    {"config",    {"ls", "inspect"}},
    {"secret",    {"ls", "inspect"}},
    {"service",   {"ls", "list", "inspect", "logs", "ps"}},
    {"stack",     {"ls", "ps", "services"}},
    {"node",      {"ls", "inspect", "ps"}},
    {"plugin",    {"ls", "list", "inspect"}},
    {"buildx",    {"ls", "inspect", "du", "version"}},
    {"manifest",  {"inspect"}},
    {"trust",     {"inspect"}},
};

const SubcommandTable kDockerUnsafeSub = {
    {"image",     {"rm", "prune", "build", "push", "pull", "tag", "import", "load"}},
    {"container", {"rm", "prune", "create", "start", "stop", "restart", "kill", "exec"}},
    {"network",   {"create", "rm", "prune", "connect", "disconnect"}},
    {"volume",    {"create", "rm", "prune"}},
    {"system",    {"prune"}},
    {"context",   {"create", "update", "use", "rm", "import"}},
    {"config",    {"create", "rm"}},
    {"secret",    {"create", "rm"}},
    {"service",   {"create", "rm", "scale", "update", "rollback"}},
    {"stack",     {"deploy", "rm"}},
    {"node",      {"update", "rm", "promote", "demote"}},
    {"plugin",    {"install", "enable", "disable", "rm", "upgrade", "create", "push"}},
    {"buildx",    {"build", "bake", "create", "rm", "use", "prune"}},
    {"manifest",  {"create", "push", "annotate", "rm"}},
    {"trust",     {"sign", "revoke"}},
    {"swarm",     {"init", "join", "join-token", "leave", "update", "ca", "unlock", "unlock-key"}},
};

const TokenSet kDockerGlobalFlagsWithArg = {
    "-H", "--host", "-c", "--context", "-l", "--log-level", "--config", "--tlscacert",
    "--tlscert", "--tlskey",
};

const TokenSet kComposeFlagsWithArg = {
    "-f", "--file", "-p", "--project-name", "--project-directory", "--env-file", "--profile",
    "--ansi",
};

const TokenSet kComposeSafe = {
    "ps", "logs", "config", "images", "ls", "top", "version", "port", "events",
};

// 플래그(값 포함)를 건너뛴 첫 위치 인자
[[nodiscard]] std::optional<std::size_t> skip_flags(const std::vector<std::string>& tokens,
                                                    std::size_t                     from,
                                                    const TokenSet&                 with_arg) {
    std::size_t i = from;
    while (i < tokens.size()) {
        const auto& token = tokens[i];
        if (!token.starts_with('-')) {
            return i;
        }
        i += (with_arg.contains(token) && i + 1 < tokens.size()) ? 2 : 1;
    }
    return std::nullopt;
}

[[nodiscard]] bool has_output_flag(const std::vector<std::string>& tokens, std::size_t from) {
    for (std::size_t i = from; i < tokens.size(); ++i) {
        const auto& t = tokens[i];
        if (t == "--output" || t.starts_with("--output=") ||
            (t.starts_with("-o") && !t.starts_with("--"))) {
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// kubectl
// ---------------------------------------------------------------------------
const TokenSet kKubectlSafeActions = {
    "get", "describe", "explain", "logs", "top", "cluster-info", "version", "api-resources",
    "api-versions", "config", "auth", "wait", "diff", "plugin", "completion", "kustomize",
};

const SubcommandTable kKubectlSafeSub = {
    {"config",  {"view", "get-contexts", "get-clusters", "current-context", "get-users"}},
    {"auth",    {"can-i", "whoami"}},
    {"rollout", {"status", "history"}},
};

const SubcommandTable kKubectlUnsafeSub = {
    {"config",  {"set", "set-context", "set-cluster", "set-credentials", "delete-context",
                 "delete-cluster", "delete-user", "use-context", "use", "rename-context"}},
    {"rollout", {"restart", "pause", "resume", "undo"}},
};

const TokenSet kKubectlFlagsWithArg = {
    "-n", "--namespace", "-l", "--selector", "-o", "--output", "--context", "--cluster",
    "-f", "--filename",
};

[[nodiscard]] bool table_has(const SubcommandTable& table, std::string_view action,
                             std::string_view sub) {
    const auto it = table.find(action);
    return it != table.end() && it->second.contains(sub);
}

}  // namespace

// ---------------------------------------------------------------------------
// DockerHandler
// ---------------------------------------------------------------------------
Classification DockerHandler::classify(const HandlerContext& ctx) const {
    const auto& tokens = ctx.tokens;
    const auto& base   = tokens.front();
    if (tokens.size() < 2) {
        return Classification::ask(base);
    }

    // 1. compose 계열
    const bool compose_binary = base == "docker-compose" || base == "podman-compose";
    const auto action_idx =
        compose_binary ? std::optional<std::size_t>{0}
                       : skip_flags(tokens, 1, kDockerGlobalFlagsWithArg);
    if (!action_idx) {
        return Classification::ask(base);
    }
    const auto& action = tokens[*action_idx];

    if (compose_binary || action == "compose") {
        const auto sub = skip_flags(tokens, *action_idx + 1, kComposeFlagsWithArg);
        if (!sub) {
            return Classification::ask(base + " compose");
        }
        const auto desc = compose_binary ? base + " " + tokens[*sub]
                                         : base + " compose " + tokens[*sub];
        return kComposeSafe.contains(tokens[*sub]) ? Classification::allow(desc)
                                                   : Classification::ask(desc);
    }

    const auto desc = base + " " + action;

    // 2. 하위 명령 표
    if (kDockerSafeSub.contains(action) || kDockerUnsafeSub.contains(action)) {
        if (const auto sub = first_positional(tokens, *action_idx + 1)) {
            const auto& name     = tokens[*sub];
            const auto  sub_desc = desc + " " + name;

            if (action == "buildx" && name == "imagetools") {
                const auto inner = first_positional(tokens, *sub + 1);
                return (inner && tokens[*inner] == "inspect")
                           ? Classification::allow(sub_desc + " inspect")
                           : Classification::ask(sub_desc);
            }
            if (table_has(kDockerSafeSub, action, name)) {
                if (action == "image" && name == "save" && has_output_flag(tokens, *sub + 1)) {
                    return Classification::ask(sub_desc + " -o (write file)");
                }
                return Classification::allow(sub_desc);
            }
            if (table_has(kDockerUnsafeSub, action, name)) {
                return Classification::ask(sub_desc);
            }
        }
    }

    // 3. 단순 action
    if (kDockerSafeActions.contains(action)) {
        if ((action == "export" || action == "save") && has_output_flag(tokens, *action_idx + 1)) {
            return Classification::ask(desc + " -o (write file)");
        }
        return Classification::allow(desc);
    }
    return Classification::ask(desc);
}

// ---------------------------------------------------------------------------
// KubectlHandler
// ---------------------------------------------------------------------------
Classification KubectlHandler::classify(const HandlerContext& ctx) const {
    const auto& tokens = ctx.tokens;
    const auto& base   = tokens.front();
    if (tokens.size() < 2) {
        return Classification::ask(base);
    }

    const auto action_idx = skip_flags(tokens, 1, kKubectlFlagsWithArg);
    if (!action_idx) {
        return Classification::ask(base);
    }
    const auto& action = tokens[*action_idx];
    const auto  desc   = base + " " + action;

    if (const auto sub = first_positional(tokens, *action_idx + 1)) {
        const auto& name = tokens[*sub];
        if (table_has(kKubectlSafeSub, action, name)) {
            return Classification::allow(desc + " " + name);
        }
        if (table_has(kKubectlUnsafeSub, action, name)) {
            return Classification::ask(desc + " " + name);
        }
    }

    if (kKubectlSafeActions.contains(action)) {
        return Classification::allow(desc);
    }
    return Classification::ask(desc);
}

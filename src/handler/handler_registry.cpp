#include "handler/handler_registry.hpp"

#include <spdlog/spdlog.h>

#include "handler/container_handlers.hpp"
#include "handler/curl_handler.hpp"
#include "handler/delegating_handlers.hpp"
#include "handler/git_handler.hpp"
#include "handler/python_handler.hpp"
#include "handler/sql_handlers.hpp"
#include "handler/text_handlers.hpp"

std::string default_description(const std::vector<std::string>& tokens) {
    if (tokens.empty()) {
        return "unknown";
    }
    if (tokens.size() == 1) {
        return tokens.front();
    }
    return tokens[0] + " " + tokens[1];
}

const HandlerRegistry& HandlerRegistry::builtin() {
    static const HandlerRegistry registry = [] {
        HandlerRegistry r;
        r.add(std::make_unique<GitHandler>());
        r.add(std::make_unique<ShellHandler>());
        r.add(std::make_unique<EnvHandler>());
        r.add(std::make_unique<XargsHandler>());
        r.add(std::make_unique<FindHandler>());
        r.add(std::make_unique<SedHandler>());
        r.add(std::make_unique<SortHandler>());
        r.add(std::make_unique<TeeHandler>());
        r.add(std::make_unique<CurlHandler>());
        r.add(std::make_unique<DockerHandler>());
        r.add(std::make_unique<KubectlHandler>());
        r.add(std::make_unique<Sqlite3Handler>());
        r.add(std::make_unique<PsqlHandler>());
        r.add(std::make_unique<MysqlHandler>());
        r.add(std::make_unique<PythonHandler>());
        spdlog::debug("handler_registry: {} command names registered", r.size());
        return r;
    }();
    return registry;
}

void HandlerRegistry::add(std::unique_ptr<CommandHandler> handler) {
    if (!handler) {
        return;
    }
    for (auto& name : handler->names()) {
        if (by_name_.contains(name)) {
            spdlog::warn("handler_registry: '{}' registered twice, replacing", name);
        }
        by_name_.insert_or_assign(std::move(name), handler.get());
    }
    handlers_.push_back(std::move(handler));
}

const CommandHandler* HandlerRegistry::find(std::string_view name) const {
    const auto it = by_name_.find(name);
    return it == by_name_.end() ? nullptr : it->second;
}

const CommandHandler* HandlerRegistry::find(
    std::string_view name, const std::map<std::string, std::string>& aliases) const {
    // 운영자 별칭이 내장 이름보다 우선한다
    if (const auto alias = aliases.find(std::string{name}); alias != aliases.end()) {
        return find(alias->second);
    }
    return find(name);
}

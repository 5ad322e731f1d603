#include "engine/decision.hpp"

#include <algorithm>

std::string_view action_name(Action action) noexcept {
    switch (action) {
        case Action::kAllow: return "allow";
        case Action::kAsk:   return "ask";
        case Action::kDeny:  return "deny";
    }
    return "ask";
}

Decision combine(std::vector<Decision> decisions) {
    if (decisions.empty()) {
        return Decision::allow("empty");
    }

    Action winner = Action::kAllow;
    for (const auto& d : decisions) {
        winner = std::max(winner, d.action);
    }

    std::string reason;
    for (const auto& d : decisions) {
        if (d.action != winner) {
            continue;
        }
        if (!reason.empty()) {
            reason += ", ";
        }
        reason += d.reason;
    }
    return Decision{winner, std::move(reason), std::move(decisions)};
}

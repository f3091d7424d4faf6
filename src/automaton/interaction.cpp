#include "automaton/interaction.hpp"

#include "util/result.hpp"

#include <cassert>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

InteractionStep makeStep(ActionToken token) {
    return InteractionStep{ .token = token, .payload = std::nullopt };
}

InteractionStep makeStep(ActionToken token, std::size_t index) {
    return InteractionStep{ .token = token, .payload = StepPayload{ index } };
}

InteractionStep makeStep(ActionToken token, const std::string& identifier) {
    return InteractionStep{ .token = token, .payload = StepPayload{ identifier } };
}

std::string getActionTokenName(ActionToken token) {
    switch (token) {
        case ActionToken::SelectCard:
            return "SelectCard";
        case ActionToken::SelectPlayer:
            return "SelectPlayer";
        case ActionToken::SelectPlayableStack:
            return "SelectPlayableStack";
        case ActionToken::SelectDrawableStack:
            return "SelectDrawableStack";
        case ActionToken::SelectDiscardableStack:
            return "SelectDiscardableStack";
        case ActionToken::SelectRule:
            return "SelectRule";
        case ActionToken::DoAction:
            return "DoAction";
        default:
            assert(false);
            return "Unknown";
    }
}

Result<void> checkInteractionTokens(const std::vector<InteractionStep>& steps, const std::vector<ActionToken>& expected) {
    if (steps.size() != expected.size()) {
        return Error{
            ErrorCode::InvalidInteraction,
            "Expected " + std::to_string(expected.size()) + " interaction steps, got " + std::to_string(steps.size())
        };
    }

    for (std::size_t i = 0; i < steps.size(); ++i) {
        if (steps[i].token != expected[i]) {
            return Error{
                ErrorCode::InvalidInteraction,
                "Interaction step " + std::to_string(i) + " is " + getActionTokenName(steps[i].token) + ", expected " + getActionTokenName(expected[i])
            };
        }
    }

    return {};
}

std::optional<std::size_t> getOptionalStepIndex(const InteractionStep& step) {
    if (!step.payload || !std::holds_alternative<std::size_t>(*step.payload)) {
        return std::nullopt;
    }
    return std::get<std::size_t>(*step.payload);
}

Result<std::size_t> getStepIndex(const InteractionStep& step) {
    std::optional<std::size_t> index = getOptionalStepIndex(step);
    if (!index) {
        return Error{ ErrorCode::InvalidInteraction, getActionTokenName(step.token) + " step is missing its index" };
    }
    return *index;
}

Result<std::string> getStepIdentifier(const InteractionStep& step) {
    if (!step.payload || !std::holds_alternative<std::string>(*step.payload)) {
        return Error{ ErrorCode::InvalidInteraction, getActionTokenName(step.token) + " step is missing its identifier" };
    }
    return std::get<std::string>(*step.payload);
}

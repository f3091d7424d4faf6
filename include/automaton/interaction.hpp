#ifndef INTERACTION_HPP
#define INTERACTION_HPP

#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class ActionToken : std::uint8_t {
    SelectCard,
    SelectPlayer,
    SelectPlayableStack,
    SelectDrawableStack,
    SelectDiscardableStack,
    SelectRule,
    DoAction
};

// Either an index (card, player, stack, rule) or an opaque identifier
using StepPayload = std::variant<std::size_t, std::string>;

struct InteractionStep {
    ActionToken token;
    std::optional<StepPayload> payload;
};

InteractionStep makeStep(ActionToken token);
InteractionStep makeStep(ActionToken token, std::size_t index);
InteractionStep makeStep(ActionToken token, const std::string& identifier);

std::string getActionTokenName(ActionToken token);

// Checks that the steps carry exactly the expected tokens, in order
Result<void> checkInteractionTokens(const std::vector<InteractionStep>& steps, const std::vector<ActionToken>& expected);
Result<std::size_t> getStepIndex(const InteractionStep& step);
std::optional<std::size_t> getOptionalStepIndex(const InteractionStep& step);
Result<std::string> getStepIdentifier(const InteractionStep& step);

#endif // INTERACTION_HPP

#include "game/interactions.hpp"

#include "automaton/automaton.hpp"
#include "automaton/interaction.hpp"
#include "event/violation.hpp"
#include "game/game_core.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

Result<std::vector<Violation>> playInteraction(GameCore& core, std::size_t playerIndex, const std::vector<InteractionStep>& steps) {
    Result<void> tokensResult = checkInteractionTokens(steps, { ActionToken::SelectCard, ActionToken::SelectPlayableStack });
    if (tokensResult.isError()) {
        return tokensResult.getError();
    }

    Result<std::size_t> cardIndexResult = getStepIndex(steps[0]);
    if (cardIndexResult.isError()) {
        return cardIndexResult.getError();
    }

    // No stack index starts a new playable stack
    std::optional<std::size_t> stackIndex = getOptionalStepIndex(steps[1]);
    return core.playCard(playerIndex, cardIndexResult.getValue(), stackIndex);
}

Result<std::vector<Violation>> drawInteraction(GameCore& core, std::size_t playerIndex, const std::vector<InteractionStep>& steps) {
    Result<void> tokensResult = checkInteractionTokens(steps, { ActionToken::SelectDrawableStack });
    if (tokensResult.isError()) {
        return tokensResult.getError();
    }

    Result<std::size_t> stackIndexResult = getStepIndex(steps[0]);
    if (stackIndexResult.isError()) {
        return stackIndexResult.getError();
    }

    return core.drawCard(playerIndex, stackIndexResult.getValue());
}

Result<std::vector<Violation>> discardInteraction(GameCore& core, std::size_t playerIndex, const std::vector<InteractionStep>& steps) {
    Result<void> tokensResult = checkInteractionTokens(steps, { ActionToken::SelectCard, ActionToken::SelectDiscardableStack });
    if (tokensResult.isError()) {
        return tokensResult.getError();
    }

    Result<std::size_t> cardIndexResult = getStepIndex(steps[0]);
    if (cardIndexResult.isError()) {
        return cardIndexResult.getError();
    }

    Result<std::size_t> stackIndexResult = getStepIndex(steps[1]);
    if (stackIndexResult.isError()) {
        return stackIndexResult.getError();
    }

    return core.discardCard(playerIndex, cardIndexResult.getValue(), stackIndexResult.getValue());
}

Result<std::vector<Violation>> physicalInteraction(GameCore& core, std::size_t playerIndex, const std::vector<InteractionStep>& steps) {
    Result<void> tokensResult = checkInteractionTokens(steps, { ActionToken::SelectPlayer, ActionToken::DoAction });
    if (tokensResult.isError()) {
        return tokensResult.getError();
    }

    Result<std::string> actionNameResult = getStepIdentifier(steps[1]);
    if (actionNameResult.isError()) {
        return actionNameResult.getError();
    }

    return core.performPhysicalAction(playerIndex, actionNameResult.getValue());
}

std::vector<ActionPath> getBuiltinActionPaths() {
    return {
        { makeBranch(ActionToken::SelectCard), makeLeaf(ActionToken::SelectPlayableStack, playInteraction) },
        { makeLeaf(ActionToken::SelectDrawableStack, drawInteraction) },
        { makeBranch(ActionToken::SelectCard), makeLeaf(ActionToken::SelectDiscardableStack, discardInteraction) },
        { makeBranch(ActionToken::SelectPlayer), makeLeaf(ActionToken::DoAction, physicalInteraction) }
    };
}

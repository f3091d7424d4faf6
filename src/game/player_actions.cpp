#include "game/game_core.hpp"

#include "automaton/automaton.hpp"
#include "event/occurrence.hpp"
#include "event/verdict.hpp"
#include "event/violation.hpp"
#include "game/card.hpp"
#include "game/player.hpp"
#include "game/stack.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

Result<std::vector<Violation>> GameCore::executeInteraction(std::size_t playerIndex, const InteractionResult& interaction) {
    if (interaction.type != InteractionResultType::Leaf || interaction.handler == nullptr) {
        return Error{ ErrorCode::InvalidInteraction, "Only a completed interaction can be executed" };
    }

    Result<void> playerResult = checkPlayerIndex(playerIndex);
    if (playerResult.isError()) {
        return playerResult.getError();
    }

    return interaction.handler(*this, playerIndex, interaction.steps);
}

Result<std::vector<Violation>> GameCore::playCard(std::size_t playerIndex, std::size_t cardIndex, std::optional<std::size_t> stackIndex) {
    Result<void> playerResult = checkPlayerIndex(playerIndex);
    if (playerResult.isError()) {
        return playerResult.getError();
    }

    const Player& player = m_players[playerIndex];
    if (!player.hasCard(cardIndex)) {
        return Error{ ErrorCode::InvalidCardIndex, player.getPseudo() + " has no card at index " + std::to_string(cardIndex) };
    }

    if (stackIndex) {
        Result<void> stackResult = checkStackIndex(*stackIndex, StackType::Playable);
        if (stackResult.isError()) {
            return stackResult.getError();
        }
    }

    Occurrence occurrence = Occurrence::cardPlayed(CardEvent{
        .card = player.getHand()[cardIndex],
        .cardIndex = cardIndex,
        .playerIndex = playerIndex,
        .stackIndex = stackIndex
    });
    std::vector<Verdict> verdicts = onEvent(occurrence);
    return propagateAndExecute(playerIndex, occurrence, verdicts);
}

Result<std::vector<Violation>> GameCore::drawCard(std::size_t playerIndex, std::size_t stackIndex) {
    Result<void> playerResult = checkPlayerIndex(playerIndex);
    if (playerResult.isError()) {
        return playerResult.getError();
    }

    Result<void> stackResult = checkStackIndex(stackIndex, StackType::Drawable);
    if (stackResult.isError()) {
        return stackResult.getError();
    }

    if (m_stacks[stackIndex].isEmpty()) {
        Result<void> refillResult = refillDrawableStacks(stackIndex, true);
        if (refillResult.isError()) {
            return refillResult.getError();
        }

        if (m_stacks[stackIndex].isEmpty()) {
            return Error{ ErrorCode::NotEnoughCards, "Stack " + std::to_string(stackIndex) + " is empty, even after refilling" };
        }
    }

    const Stack& stack = m_stacks[stackIndex];
    Occurrence occurrence = Occurrence::cardDrawn(CardEvent{
        .card = *stack.getTopCard(),
        .cardIndex = stack.size() - 1,
        .playerIndex = playerIndex,
        .stackIndex = stackIndex
    });
    std::vector<Verdict> verdicts = onEvent(occurrence);
    return propagateAndExecute(playerIndex, occurrence, verdicts);
}

Result<std::vector<Violation>> GameCore::discardCard(std::size_t playerIndex, std::size_t cardIndex, std::size_t stackIndex) {
    Result<void> playerResult = checkPlayerIndex(playerIndex);
    if (playerResult.isError()) {
        return playerResult.getError();
    }

    const Player& player = m_players[playerIndex];
    if (!player.hasCard(cardIndex)) {
        return Error{ ErrorCode::InvalidCardIndex, player.getPseudo() + " has no card at index " + std::to_string(cardIndex) };
    }

    Result<void> stackResult = checkStackIndex(stackIndex, StackType::Discardable);
    if (stackResult.isError()) {
        return stackResult.getError();
    }

    Occurrence occurrence = Occurrence::cardDiscarded(CardEvent{
        .card = player.getHand()[cardIndex],
        .cardIndex = cardIndex,
        .playerIndex = playerIndex,
        .stackIndex = stackIndex
    });
    std::vector<Verdict> verdicts = onEvent(occurrence);
    return propagateAndExecute(playerIndex, occurrence, verdicts);
}

Result<std::vector<Violation>> GameCore::sayPhrase(std::size_t playerIndex, const std::string& message) {
    Result<void> playerResult = checkPlayerIndex(playerIndex);
    if (playerResult.isError()) {
        return playerResult.getError();
    }

    Occurrence occurrence = Occurrence::playerSaid(playerIndex, message);
    std::vector<Verdict> verdicts = onEvent(occurrence);
    return propagateAndExecute(playerIndex, occurrence, verdicts);
}

Result<std::vector<Violation>> GameCore::performPhysicalAction(std::size_t playerIndex, const std::string& actionName) {
    Result<void> playerResult = checkPlayerIndex(playerIndex);
    if (playerResult.isError()) {
        return playerResult.getError();
    }

    Occurrence occurrence = Occurrence::physicalAction(playerIndex, actionName);
    std::vector<Verdict> verdicts = onEvent(occurrence);
    return propagateAndExecute(playerIndex, occurrence, verdicts);
}

Result<void> GameCore::penalizePlayer(std::size_t playerIndex) {
    Result<void> playerResult = checkPlayerIndex(playerIndex);
    if (playerResult.isError()) {
        return playerResult;
    }

    // A rule reacting to the penalty replaces the common one
    std::vector<Verdict> verdicts = onEvent(Occurrence::playerPenalty(playerIndex));
    if (areAllIgnored(verdicts)) {
        return applyCommonPenalty(playerIndex);
    }
    return runRuleReactions(playerIndex, verdicts);
}

Result<void> GameCore::applyCommonPenalty(std::size_t playerIndex) {
    Result<void> playerResult = checkPlayerIndex(playerIndex);
    if (playerResult.isError()) {
        return playerResult;
    }

    Result<std::vector<Card>> cardsResult = drawMultipleCards(1);
    if (cardsResult.isError()) {
        return cardsResult.getError();
    }

    m_players[playerIndex].addCards(cardsResult.getValue());
    return {};
}

LegalityResult GameCore::canPlay(std::size_t playerIndex, const Card& card, std::optional<std::size_t> stackIndex) const {
    if (playerIndex != m_turn.getPlayerTurn()) {
        return LegalityResult::WrongTurn;
    }

    if (!stackIndex) {
        return m_settings.canPlayOnNewStack ? LegalityResult::CanPlay : LegalityResult::Other;
    }

    if (*stackIndex >= m_stacks.size()) {
        return LegalityResult::Other;
    }

    const Card* topCard = m_stacks[*stackIndex].getTopCard();
    if (topCard == nullptr) {
        return LegalityResult::CanPlay;
    }

    bool sameValue = (card.value == topCard->value);
    CardColor color = getCardColor(card);
    bool sameColor = (color != CardColor::Undefined && color == getCardColor(*topCard));
    if (!sameValue && !sameColor) {
        return LegalityResult::CannotPlaceThisCard;
    }

    return LegalityResult::CanPlay;
}

Result<void> GameCore::commitPlayedCard(const CardEvent& cardEvent) {
    Result<void> playerResult = checkPlayerIndex(cardEvent.playerIndex);
    if (playerResult.isError()) {
        return playerResult;
    }

    if (cardEvent.stackIndex) {
        Result<void> stackResult = checkStackIndex(*cardEvent.stackIndex, StackType::Playable);
        if (stackResult.isError()) {
            return stackResult;
        }
    }

    Player& player = m_players[cardEvent.playerIndex];
    if (!player.hasCard(cardEvent.cardIndex) || player.getHand()[cardEvent.cardIndex] != cardEvent.card) {
        return Error{ ErrorCode::InvalidCardIndex, player.getPseudo() + " no longer holds " + getCardName(cardEvent.card) };
    }

    Result<Card> cardResult = player.removeCard(cardEvent.cardIndex);
    if (cardResult.isError()) {
        return cardResult.getError();
    }

    if (cardEvent.stackIndex) {
        m_stacks[*cardEvent.stackIndex].pushCard(cardResult.getValue());
    }
    else {
        m_stacks.emplace_back(std::vector<Card>{ cardResult.getValue() }, true, std::vector<StackType>{ StackType::Playable });
    }
    return {};
}

Result<void> GameCore::commitDrawnCard(const CardEvent& cardEvent) {
    Result<void> playerResult = checkPlayerIndex(cardEvent.playerIndex);
    if (playerResult.isError()) {
        return playerResult;
    }

    if (!cardEvent.stackIndex) {
        return Error{ ErrorCode::InvalidStackIndex, "A drawn card needs a stack" };
    }

    Result<void> stackResult = checkStackIndex(*cardEvent.stackIndex, StackType::Drawable);
    if (stackResult.isError()) {
        return stackResult;
    }

    Stack& stack = m_stacks[*cardEvent.stackIndex];
    if (stack.isEmpty()) {
        return Error{ ErrorCode::NotEnoughCards, "Stack " + std::to_string(*cardEvent.stackIndex) + " is empty" };
    }
    if (*stack.getTopCard() != cardEvent.card) {
        return Error{ ErrorCode::InvalidCardIndex, "Stack " + std::to_string(*cardEvent.stackIndex) + " no longer has " + getCardName(cardEvent.card) + " on top" };
    }

    std::optional<Card> card = stack.drawCard();

    m_players[cardEvent.playerIndex].addCard(*card);
    return {};
}

Result<void> GameCore::commitDiscardedCard(const CardEvent& cardEvent) {
    Result<void> playerResult = checkPlayerIndex(cardEvent.playerIndex);
    if (playerResult.isError()) {
        return playerResult;
    }

    if (!cardEvent.stackIndex) {
        return Error{ ErrorCode::InvalidStackIndex, "A discarded card needs a stack" };
    }

    Result<void> stackResult = checkStackIndex(*cardEvent.stackIndex, StackType::Discardable);
    if (stackResult.isError()) {
        return stackResult;
    }

    Player& player = m_players[cardEvent.playerIndex];
    if (!player.hasCard(cardEvent.cardIndex) || player.getHand()[cardEvent.cardIndex] != cardEvent.card) {
        return Error{ ErrorCode::InvalidCardIndex, player.getPseudo() + " no longer holds " + getCardName(cardEvent.card) };
    }

    Result<Card> cardResult = player.removeCard(cardEvent.cardIndex);
    if (cardResult.isError()) {
        return cardResult.getError();
    }

    m_stacks[*cardEvent.stackIndex].pushCard(cardResult.getValue());
    return {};
}

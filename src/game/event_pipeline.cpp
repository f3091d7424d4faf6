#include "game/game_core.hpp"

#include "event/occurrence.hpp"
#include "event/verdict.hpp"
#include "event/violation.hpp"
#include "game/card.hpp"
#include "game/card_effects.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
const std::string CardEffectsRuleName = "Card Effects";

void appendViolations(std::vector<Violation>& violations, const std::vector<Violation>& additional) {
    violations.insert(violations.end(), additional.begin(), additional.end());
}

bool containsPhrase(const std::string& message, const std::string& phrase, bool caseSensitive) {
    if (caseSensitive) {
        return message.find(phrase) != std::string::npos;
    }
    return toLower(message).find(toLower(phrase)) != std::string::npos;
}

bool hasSaid(const std::vector<Occurrence>& events, std::size_t playerIndex, const PhraseRequirement& requirement, bool caseSensitive) {
    return std::any_of(events.begin(), events.end(), [&](const Occurrence& event) {
        if (event.getType() != OccurrenceType::PlayerSaid || event.getPlayerIndex() != playerIndex) {
            return false;
        }

        return std::any_of(requirement.alternatives.begin(), requirement.alternatives.end(), [&](const std::string& phrase) {
            return containsPhrase(event.getText(), phrase, caseSensitive);
        });
    });
}

bool hasPerformed(const std::vector<Occurrence>& events, std::size_t playerIndex, const std::string& actionName) {
    return std::any_of(events.begin(), events.end(), [&](const Occurrence& event) {
        return event.getType() == OccurrenceType::PhysicalAction && event.getPlayerIndex() == playerIndex && event.getText() == actionName;
    });
}
} // namespace

std::vector<Verdict> GameCore::onEvent(const Occurrence& occurrence) {
    if (occurrence.isRecordable()) {
        m_playerEvents.push_back(occurrence);
    }

    // A rule may change the activated rules while it runs
    std::vector<std::size_t> activatedRules = m_activatedRules;

    std::vector<Verdict> verdicts;
    verdicts.reserve(activatedRules.size());
    for (std::size_t ruleIndex : activatedRules) {
        verdicts.push_back(m_availableRules[ruleIndex].module->onEvent(occurrence, *this));
    }
    return verdicts;
}

Result<std::vector<Violation>> GameCore::propagateAndExecute(std::size_t playerIndex, const Occurrence& occurrence, const std::vector<Verdict>& verdicts) {
    if (areAllIgnored(verdicts)) {
        return applyDefaultBehavior(playerIndex, occurrence);
    }

    std::vector<Violation> violations;
    std::vector<const Verdict*> deferred;
    for (const Verdict& verdict : verdicts) {
        if (verdict.isViolation()) {
            violations.push_back(verdict.toViolation());
            Result<void> penaltyResult = applyPenalty(playerIndex, verdict.penalty);
            if (penaltyResult.isError()) {
                return penaltyResult.getError();
            }
        }
        else if (verdict.isDeferred()) {
            deferred.push_back(&verdict);
        }
    }

    // Each callback adds at most one verdict, so the pointers stay valid
    std::vector<Verdict> crossRuleVerdicts;
    crossRuleVerdicts.reserve(verdicts.size());
    for (const Verdict& verdict : verdicts) {
        if (!verdict.crossRuleCallback) {
            continue;
        }

        std::optional<Verdict> additional = verdict.crossRuleCallback(*this, occurrence, deferred);
        if (additional && additional->isDeferred()) {
            crossRuleVerdicts.push_back(std::move(*additional));
            deferred.push_back(&crossRuleVerdicts.back());
        }
    }

    Result<void> beforeResult = runHooks(playerIndex, deferred, VerdictType::ExecuteBeforeTurnChange);
    if (beforeResult.isError()) {
        return beforeResult.getError();
    }

    bool isOverridden = std::any_of(deferred.begin(), deferred.end(), [](const Verdict* verdict) {
        return verdict->type == VerdictType::OverrideBasicRule;
    });

    if (isOverridden) {
        Result<void> overrideResult = runHooks(playerIndex, deferred, VerdictType::OverrideBasicRule);
        if (overrideResult.isError()) {
            return overrideResult.getError();
        }
    }
    else {
        Result<std::vector<Violation>> advanceResult = applyTurnAdvance(playerIndex, occurrence, !violations.empty());
        if (advanceResult.isError()) {
            return advanceResult.getError();
        }
        appendViolations(violations, advanceResult.getValue());
    }

    Result<void> afterResult = runHooks(playerIndex, deferred, VerdictType::ExecuteAfterTurnChange);
    if (afterResult.isError()) {
        return afterResult.getError();
    }

    return violations;
}

Result<std::vector<Violation>> GameCore::onTurnEnds(bool wrongInteraction) {
    // A violating action never counted
    if (wrongInteraction && !m_playerEvents.empty()) {
        m_playerEvents.pop_back();
    }

    // Otherwise the action closing the turn is the last entry and belongs to the next turn
    std::size_t scanEnd = m_playerEvents.size();
    if (!wrongInteraction && scanEnd > 0) {
        --scanEnd;
    }

    std::optional<std::size_t> delimiter;
    for (std::size_t i = scanEnd; i-- > 0;) {
        if (m_playerEvents[i].isTurnChanging()) {
            delimiter = i;
            break;
        }
    }

    // Leftovers from other players are carried over, those of the current player stay logged
    std::size_t currentPlayer = m_turn.getPlayerTurn();
    std::size_t leftoverStart = delimiter ? *delimiter + 1 : 0;
    std::vector<Occurrence> closedTurn;
    std::vector<Occurrence> remainingEvents;
    for (std::size_t i = 0; i < m_playerEvents.size(); ++i) {
        const Occurrence& event = m_playerEvents[i];
        if (i < leftoverStart || (i < scanEnd && event.getPlayerIndex() != currentPlayer)) {
            closedTurn.push_back(event);
        }
        else {
            remainingEvents.push_back(event);
        }
    }
    m_playerEvents = std::move(remainingEvents);

    if (closedTurn.empty()) {
        return std::vector<Violation>{};
    }

    std::size_t closingPlayer = delimiter
        ? closedTurn[*delimiter].getPlayerIndex().value_or(currentPlayer)
        : m_previousPlayerTurn.value_or(currentPlayer);

    Occurrence endOfTurn = Occurrence::endPlayerTurn(closedTurn);
    std::vector<Verdict> verdicts = onEvent(endOfTurn);
    Result<std::vector<Violation>> pipelineResult = propagateAndExecute(closingPlayer, endOfTurn, verdicts);
    if (pipelineResult.isError()) {
        return pipelineResult.getError();
    }

    std::vector<Violation> violations = std::move(pipelineResult.getValue());

    Result<std::vector<Violation>> requirementsResult = checkCardRequirements(closedTurn);
    if (requirementsResult.isError()) {
        return requirementsResult.getError();
    }
    appendViolations(violations, requirementsResult.getValue());

    return violations;
}

Result<std::vector<Violation>> GameCore::checkCardRequirements(const std::vector<Occurrence>& closedTurn) {
    std::vector<Violation> violations;
    std::vector<std::size_t> penalizedPlayers;

    auto addViolation = [&violations, &penalizedPlayers](std::size_t playerIndex, const std::string& message) {
        violations.push_back(Violation{
            .type = ViolationType::ForgotSomething,
            .rule = CardEffectsRuleName,
            .message = message,
            .legality = std::nullopt
        });
        penalizedPlayers.push_back(playerIndex);
    };

    for (const Occurrence& event : closedTurn) {
        if (event.getType() != OccurrenceType::CardPlayed) {
            continue;
        }

        const CardEvent& cardEvent = event.getCardEvent();
        std::size_t playerIndex = cardEvent.playerIndex;
        std::string pseudo = (playerIndex < m_players.size()) ? m_players[playerIndex].getPseudo() : "Player " + std::to_string(playerIndex);

        for (const CardEffect& effect : getCardEffects(cardEvent.card)) {
            if (effect.type == CardEffectType::Say) {
                for (const PhraseRequirement& requirement : effect.phrases) {
                    if (!hasSaid(closedTurn, playerIndex, requirement, m_settings.caseSensitiveSay)) {
                        addViolation(playerIndex, pseudo + " forgot to say \"" + join(requirement.alternatives, "\" or \"") + "\" after playing " + getCardName(cardEvent.card));
                    }
                }
            }
            else if (effect.type == CardEffectType::Physical) {
                if (!hasPerformed(closedTurn, playerIndex, effect.physicalAction)) {
                    addViolation(playerIndex, pseudo + " forgot to do \"" + effect.physicalAction + "\" after playing " + getCardName(cardEvent.card));
                }
            }
        }
    }

    for (std::size_t playerIndex : penalizedPlayers) {
        Result<void> penaltyResult = penalizePlayer(playerIndex);
        if (penaltyResult.isError()) {
            return penaltyResult.getError();
        }
    }

    return violations;
}

Result<std::vector<Violation>> GameCore::applyDefaultBehavior(std::size_t playerIndex, const Occurrence& occurrence) {
    if (occurrence.getType() != OccurrenceType::CardPlayed) {
        return applyTurnAdvance(playerIndex, occurrence, false);
    }

    const CardEvent& cardEvent = occurrence.getCardEvent();
    LegalityResult legality = canPlay(playerIndex, cardEvent.card, cardEvent.stackIndex);
    if (legality == LegalityResult::CanPlay) {
        return applyTurnAdvance(playerIndex, occurrence, false);
    }

    std::string message;
    switch (legality) {
        case LegalityResult::WrongTurn:
            message = "It is not the turn of " + m_players[playerIndex].getPseudo();
            break;
        case LegalityResult::CannotPlaceThisCard:
            message = getCardName(cardEvent.card) + " cannot be placed on " + getCardName(*m_stacks[*cardEvent.stackIndex].getTopCard());
            break;
        default:
            message = "A new stack cannot be started";
            break;
    }

    std::vector<Violation> violations = {
        Violation{ .type = ViolationType::Disallow, .rule = BasicRulesName, .message = message, .legality = legality }
    };

    Result<void> penaltyResult = penalizePlayer(playerIndex);
    if (penaltyResult.isError()) {
        return penaltyResult.getError();
    }

    Result<std::vector<Violation>> advanceResult = applyTurnAdvance(playerIndex, occurrence, true);
    if (advanceResult.isError()) {
        return advanceResult.getError();
    }
    appendViolations(violations, advanceResult.getValue());

    return violations;
}

Result<std::vector<Violation>> GameCore::applyTurnAdvance(std::size_t playerIndex, const Occurrence& occurrence, bool hadViolation) {
    std::vector<Violation> violations;

    switch (occurrence.getType()) {
        case OccurrenceType::CardPlayed:
        case OccurrenceType::CardDrawn: {
            // The announced card moves before end-of-turn penalties draw from the same stacks
            if (!hadViolation) {
                const CardEvent& cardEvent = occurrence.getCardEvent();
                Result<void> commitResult = (occurrence.getType() == OccurrenceType::CardPlayed) ? commitPlayedCard(cardEvent) : commitDrawnCard(cardEvent);
                if (commitResult.isError()) {
                    return commitResult.getError();
                }
            }

            bool isPlayerTurn = (playerIndex == m_turn.getPlayerTurn());
            if (isPlayerTurn) {
                Result<std::vector<Violation>> turnEndResult = onTurnEnds(hadViolation);
                if (turnEndResult.isError()) {
                    return turnEndResult.getError();
                }
                violations = std::move(turnEndResult.getValue());
            }
            else if (hadViolation && !m_playerEvents.empty()) {
                m_playerEvents.pop_back();
            }

            nextPlayer(playerIndex, occurrence, hadViolation);
            return violations;
        }
        case OccurrenceType::CardDiscarded: {
            if (hadViolation) {
                if (!m_playerEvents.empty()) {
                    m_playerEvents.pop_back();
                }
                return violations;
            }

            Result<void> commitResult = commitDiscardedCard(occurrence.getCardEvent());
            if (commitResult.isError()) {
                return commitResult.getError();
            }
            return violations;
        }
        default:
            return violations;
    }
}

void GameCore::nextPlayer(std::size_t playerIndex, const Occurrence& occurrence, bool tookPenalty) {
    if (!occurrence.isTurnChanging() || playerIndex != m_turn.getPlayerTurn()) {
        return;
    }

    m_previousPlayerTurn = m_turn.getPlayerTurn();

    std::vector<PlayerTurnChange> changes;
    if (occurrence.getType() == OccurrenceType::CardPlayed && !tookPenalty) {
        changes = m_settings.cardEffects.getTurnChanges(occurrence.getCardEvent().card);
    }
    if (changes.empty()) {
        changes.push_back(makeTurnUpdate(TurnUpdaterKind::Step, 1));
    }

    for (const PlayerTurnChange& change : changes) {
        updateTurn(change);
    }
}

void GameCore::updateTurn(const PlayerTurnChange& change) {
    m_turn.update(change, m_players.size());
}

std::vector<CardEffect> GameCore::getCardEffects(const Card& card) const {
    return m_settings.cardEffects.getCardEffects(card);
}

Result<void> GameCore::applyPenalty(std::size_t playerIndex, const PenaltyHook& penalty) {
    if (penalty) {
        return penalty(*this, playerIndex);
    }
    return penalizePlayer(playerIndex);
}

Result<void> GameCore::runHooks(std::size_t playerIndex, const std::vector<const Verdict*>& verdicts, VerdictType type) {
    for (const Verdict* verdict : verdicts) {
        if (verdict->type != type || !verdict->hook) {
            continue;
        }

        TurnHook hook = verdict->hook;
        Result<void> hookResult = hook(*this, playerIndex);
        if (hookResult.isError()) {
            return hookResult;
        }
    }
    return {};
}

Result<void> GameCore::runRuleReactions(std::size_t playerIndex, const std::vector<Verdict>& verdicts) {
    std::vector<const Verdict*> deferred;
    for (const Verdict& verdict : verdicts) {
        if (verdict.isDeferred()) {
            deferred.push_back(&verdict);
        }
    }

    for (VerdictType type : { VerdictType::ExecuteBeforeTurnChange, VerdictType::OverrideBasicRule, VerdictType::ExecuteAfterTurnChange }) {
        Result<void> hookResult = runHooks(playerIndex, deferred, type);
        if (hookResult.isError()) {
            return hookResult;
        }
    }
    return {};
}

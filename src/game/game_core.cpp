#include "game/game_core.hpp"

#include "automaton/automaton.hpp"
#include "config/game_config.hpp"
#include "event/occurrence.hpp"
#include "event/verdict.hpp"
#include "game/card.hpp"
#include "game/interactions.hpp"
#include "game/player.hpp"
#include "game/stack.hpp"
#include "rule/rule_loader.hpp"
#include "rule/rule_module.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace {
std::mt19937 createRandomEngine(const std::optional<unsigned int>& seed) {
    if (seed) {
        return std::mt19937{ *seed };
    }
    std::random_device device;
    return std::mt19937{ device() };
}

// Leaves are tagged with the rule that declares them
std::vector<ActionPath> tagRulePaths(const RuleData& ruleData) {
    std::vector<ActionPath> paths = ruleData.automatonPaths;
    for (ActionPath& path : paths) {
        if (!path.empty() && !path.back().rule) {
            path.back().rule = ruleData.name;
        }
    }
    return paths;
}
} // namespace

GameCore::GameCore(std::vector<LoadedRule> availableRules, GameSettings settings)
    : m_availableRules{ std::move(availableRules) },
    m_dealer{ 0 },
    m_settings{ std::move(settings) },
    m_automaton{ getBuiltinActionPaths() },
    m_rng{ createRandomEngine(m_settings.seed) } {
}

Result<std::unique_ptr<GameCore>> GameCore::fromConfig(const GameConfig& config, IRuleLoader& loader) {
    Result<std::vector<LoadedRule>> rulesResult = loadRulesFromDirectory(config.rulesDirectory, loader);
    if (rulesResult.isError()) {
        return rulesResult.getError();
    }

    std::unique_ptr<GameCore> core = std::make_unique<GameCore>(std::move(rulesResult.getValue()), config.settings);

    Result<void> verifyResult = core->verifyRules();
    if (verifyResult.isError()) {
        return verifyResult.getError();
    }

    return core;
}

Result<void> GameCore::checkPlayerIndex(std::size_t playerIndex) const {
    if (playerIndex >= m_players.size()) {
        return Error{
            ErrorCode::InvalidPlayerIndex,
            "Player index " + std::to_string(playerIndex) + " is out of range (" + std::to_string(m_players.size()) + " players)"
        };
    }
    return {};
}

Result<void> GameCore::checkStackIndex(std::size_t stackIndex, StackType type) const {
    if (stackIndex >= m_stacks.size()) {
        return Error{
            ErrorCode::InvalidStackIndex,
            "Stack index " + std::to_string(stackIndex) + " is out of range (" + std::to_string(m_stacks.size()) + " stacks)"
        };
    }

    if (!m_stacks[stackIndex].hasType(type)) {
        return Error{
            ErrorCode::InvalidStackIndex,
            "Stack " + std::to_string(stackIndex) + " is not " + getStackTypeName(type)
        };
    }

    return {};
}

Result<void> GameCore::checkRuleIndex(std::size_t ruleIndex) const {
    if (ruleIndex >= m_availableRules.size()) {
        return Error{
            ErrorCode::InvalidRuleIndex,
            "Rule index " + std::to_string(ruleIndex) + " is out of range (" + std::to_string(m_availableRules.size()) + " rules)"
        };
    }
    return {};
}

Result<void> GameCore::refillDrawableStacks(std::optional<std::size_t> emptyStackIndex, bool checkRules) {
    std::vector<std::size_t> drawableStacks = getStackIndices(StackType::Drawable);
    if (drawableStacks.empty()) {
        return Error{ ErrorCode::NoStackAvailable, "There is no drawable stack to refill" };
    }

    std::size_t targetIndex = drawableStacks.front();
    if (emptyStackIndex) {
        Result<void> stackResult = checkStackIndex(*emptyStackIndex, StackType::Drawable);
        if (stackResult.isError()) {
            return stackResult;
        }
        targetIndex = *emptyStackIndex;
    }

    if (checkRules) {
        std::vector<Verdict> verdicts = onEvent(Occurrence::stackRunsOut(targetIndex));
        if (!areAllIgnored(verdicts)) {
            return runRuleReactions(m_turn.getPlayerTurn(), verdicts);
        }
    }

    // Playable stacks keep their top card, discardable stacks are emptied
    std::vector<Card> collected;
    for (std::size_t i = 0; i < m_stacks.size(); ++i) {
        if (i == targetIndex) {
            continue;
        }

        std::vector<Card>& cards = m_stacks[i].getCards();
        if (m_stacks[i].hasType(StackType::Playable)) {
            if (cards.size() > 1) {
                collected.insert(collected.end(), cards.begin(), cards.end() - 1);
                cards.erase(cards.begin(), cards.end() - 1);
            }
        }
        else if (m_stacks[i].hasType(StackType::Discardable)) {
            collected.insert(collected.end(), cards.begin(), cards.end());
            cards.clear();
        }
    }

    std::shuffle(collected.begin(), collected.end(), m_rng);
    std::vector<Card>& targetCards = m_stacks[targetIndex].getCards();
    targetCards.insert(targetCards.begin(), collected.begin(), collected.end());
    return {};
}

void GameCore::returnCardsToDrawableStack(const std::vector<Card>& cards) {
    std::vector<std::size_t> drawableStacks = getStackIndices(StackType::Drawable);
    if (drawableStacks.empty()) {
        return;
    }

    Stack& stack = m_stacks[drawableStacks.front()];
    for (auto it = cards.rbegin(); it != cards.rend(); ++it) {
        stack.pushCard(*it);
    }
}

Result<std::vector<Card>> GameCore::drawMultipleCards(std::size_t count) {
    std::vector<Card> cards;
    bool refilled = false;

    while (cards.size() < count) {
        for (std::size_t stackIndex : getStackIndices(StackType::Drawable)) {
            Stack& stack = m_stacks[stackIndex];
            while (cards.size() < count && !stack.isEmpty()) {
                cards.push_back(*stack.drawCard());
            }
        }

        if (cards.size() == count) {
            break;
        }

        if (refilled) {
            returnCardsToDrawableStack(cards);
            return Error{
                ErrorCode::NotEnoughCards,
                "Not enough cards to draw " + std::to_string(count) + " card(s), even after refilling"
            };
        }

        Result<void> refillResult = refillDrawableStacks(std::nullopt, true);
        if (refillResult.isError()) {
            returnCardsToDrawableStack(cards);
            return refillResult.getError();
        }
        refilled = true;
    }

    return cards;
}

Result<void> GameCore::initNewGame(const std::vector<std::string>& pseudos, std::size_t cardsPerPlayer) {
    if (pseudos.empty()) {
        return Error{ ErrorCode::InvalidConfig, "A game needs at least one player" };
    }

    std::vector<Card> deck = generateStandardDeck();
    std::shuffle(deck.begin(), deck.end(), m_rng);
    Card firstCard = deck.back();
    deck.pop_back();

    m_stacks = {
        Stack(std::move(deck), false, { StackType::Drawable }),
        Stack({ firstCard }, true, { StackType::Playable }),
        Stack({}, true, { StackType::Discardable })
    };

    m_players.clear();
    for (const std::string& pseudo : pseudos) {
        m_players.emplace_back(pseudo);
    }

    m_playerEvents.clear();
    m_previousPlayerTurn = std::nullopt;
    m_automaton.reset();

    for (Player& player : m_players) {
        Result<std::vector<Card>> cardsResult = drawMultipleCards(cardsPerPlayer);
        if (cardsResult.isError()) {
            return cardsResult.getError();
        }
        player.addCards(cardsResult.getValue());
    }

    // The player after the dealer starts, the next game is dealt by the following player
    m_turn.reset((m_dealer + 1) % m_players.size());
    m_dealer = (m_dealer + 1) % m_players.size();

    std::vector<Verdict> verdicts = onEvent(Occurrence::gameStart());
    return runRuleReactions(m_turn.getPlayerTurn(), verdicts);
}

Result<void> GameCore::activateRuleByIndex(std::size_t ruleIndex) {
    Result<void> indexResult = checkRuleIndex(ruleIndex);
    if (indexResult.isError()) {
        return indexResult;
    }

    RuleData ruleData = getRuleData(ruleIndex);
    if (isRuleActivated(ruleIndex)) {
        return Error{ ErrorCode::RuleAlreadyActivated, "Rule " + ruleData.name + " is already activated" };
    }

    m_automaton.extend(tagRulePaths(ruleData));
    m_settings.cardEffects.merge(ruleData.cardEffects, ruleData.name);
    m_activatedRules.push_back(ruleIndex);
    return {};
}

Result<void> GameCore::deactivateRuleByIndex(std::size_t ruleIndex) {
    Result<void> indexResult = checkRuleIndex(ruleIndex);
    if (indexResult.isError()) {
        return indexResult;
    }

    RuleData ruleData = getRuleData(ruleIndex);
    if (!isRuleActivated(ruleIndex)) {
        return Error{ ErrorCode::RuleNotActivated, "Rule " + ruleData.name + " is not activated" };
    }

    m_automaton.removePaths(tagRulePaths(ruleData));
    m_settings.cardEffects.removeRuleEffects(ruleData.name);
    m_activatedRules.erase(std::find(m_activatedRules.begin(), m_activatedRules.end(), ruleIndex));
    return m_availableRules[ruleIndex].module->removeCardEffects(*this);
}

Result<void> GameCore::activateRule(const std::string& ruleName) {
    for (std::size_t i = 0; i < m_availableRules.size(); ++i) {
        if (getRuleData(i).name == ruleName) {
            return activateRuleByIndex(i);
        }
    }
    return Error{ ErrorCode::RuleNotFound, "No rule named " + ruleName };
}

Result<void> GameCore::verifyRules() {
    std::vector<std::string> failures;
    for (LoadedRule& rule : m_availableRules) {
        Verdict verdict = rule.module->onEvent(Occurrence::verifyRule(), *this);
        if (verdict.type == VerdictType::Disallow) {
            failures.push_back(rule.module->getRuleData().name + ": " + verdict.message);
        }
    }

    if (!failures.empty()) {
        return Error{ ErrorCode::RuleNotValid, "Invalid rule(s):\n" + join(failures, "\n") };
    }
    return {};
}

std::size_t GameCore::getNumberOfRules() const {
    return m_availableRules.size();
}

RuleData GameCore::getRuleData(std::size_t ruleIndex) const {
    assert(ruleIndex < m_availableRules.size());
    return m_availableRules[ruleIndex].module->getRuleData();
}

bool GameCore::isRuleActivated(std::size_t ruleIndex) const {
    return std::find(m_activatedRules.begin(), m_activatedRules.end(), ruleIndex) != m_activatedRules.end();
}

const std::vector<std::size_t>& GameCore::getActivatedRules() const {
    return m_activatedRules;
}

std::size_t GameCore::getPlayerTurn() const {
    return m_turn.getPlayerTurn();
}

int GameCore::getDirection() const {
    return m_turn.getDirection();
}

std::optional<std::size_t> GameCore::getPreviousPlayerTurn() const {
    return m_previousPlayerTurn;
}

void GameCore::resetTurn(std::size_t playerTurn) {
    m_turn.reset(playerTurn);
    m_previousPlayerTurn = std::nullopt;
}

const std::vector<Player>& GameCore::getPlayers() const {
    return m_players;
}

std::vector<Player>& GameCore::getPlayers() {
    return m_players;
}

const std::vector<Stack>& GameCore::getStacks() const {
    return m_stacks;
}

std::vector<Stack>& GameCore::getStacks() {
    return m_stacks;
}

std::vector<std::size_t> GameCore::getStackIndices(StackType type) const {
    std::vector<std::size_t> indices;
    for (std::size_t i = 0; i < m_stacks.size(); ++i) {
        if (m_stacks[i].hasType(type)) {
            indices.push_back(i);
        }
    }
    return indices;
}

const std::vector<Occurrence>& GameCore::getPlayerEvents() const {
    return m_playerEvents;
}

const GameSettings& GameCore::getSettings() const {
    return m_settings;
}

Automaton& GameCore::getAutomaton() {
    return m_automaton;
}

const Automaton& GameCore::getAutomaton() const {
    return m_automaton;
}

nlohmann::ordered_json& GameCore::getRuleStorage(const std::string& ruleName) {
    return m_ruleStorage[ruleName];
}

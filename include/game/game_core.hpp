#ifndef GAME_CORE_HPP
#define GAME_CORE_HPP

#include "automaton/automaton.hpp"
#include "automaton/interaction.hpp"
#include "event/occurrence.hpp"
#include "event/verdict.hpp"
#include "event/violation.hpp"
#include "game/card.hpp"
#include "game/card_effects.hpp"
#include "game/game_settings.hpp"
#include "game/player.hpp"
#include "game/stack.hpp"
#include "game/turn_tracker.hpp"
#include "rule/rule_loader.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

struct GameConfig;

class GameCore {
public:
    GameCore(std::vector<LoadedRule> availableRules, GameSettings settings);
    GameCore(const GameCore&) = delete;
    GameCore& operator=(const GameCore&) = delete;

    static Result<std::unique_ptr<GameCore>> fromConfig(const GameConfig& config, IRuleLoader& loader);

    // Event pipeline
    std::vector<Verdict> onEvent(const Occurrence& occurrence);
    Result<std::vector<Violation>> propagateAndExecute(std::size_t playerIndex, const Occurrence& occurrence, const std::vector<Verdict>& verdicts);
    Result<std::vector<Violation>> onTurnEnds(bool wrongInteraction);
    void updateTurn(const PlayerTurnChange& change);
    std::vector<CardEffect> getCardEffects(const Card& card) const;

    // Player actions
    Result<std::vector<Violation>> executeInteraction(std::size_t playerIndex, const InteractionResult& interaction);
    Result<std::vector<Violation>> playCard(std::size_t playerIndex, std::size_t cardIndex, std::optional<std::size_t> stackIndex);
    Result<std::vector<Violation>> drawCard(std::size_t playerIndex, std::size_t stackIndex);
    Result<std::vector<Violation>> discardCard(std::size_t playerIndex, std::size_t cardIndex, std::size_t stackIndex);
    Result<std::vector<Violation>> sayPhrase(std::size_t playerIndex, const std::string& message);
    Result<std::vector<Violation>> performPhysicalAction(std::size_t playerIndex, const std::string& actionName);
    Result<void> penalizePlayer(std::size_t playerIndex);
    Result<void> applyCommonPenalty(std::size_t playerIndex);
    LegalityResult canPlay(std::size_t playerIndex, const Card& card, std::optional<std::size_t> stackIndex) const;

    // Stacks and game setup
    Result<void> refillDrawableStacks(std::optional<std::size_t> emptyStackIndex, bool checkRules);
    Result<std::vector<Card>> drawMultipleCards(std::size_t count);
    Result<void> initNewGame(const std::vector<std::string>& pseudos, std::size_t cardsPerPlayer);

    // Rules
    Result<void> activateRuleByIndex(std::size_t ruleIndex);
    Result<void> deactivateRuleByIndex(std::size_t ruleIndex);
    Result<void> activateRule(const std::string& ruleName);
    Result<void> verifyRules();
    std::size_t getNumberOfRules() const;
    RuleData getRuleData(std::size_t ruleIndex) const;
    bool isRuleActivated(std::size_t ruleIndex) const;
    const std::vector<std::size_t>& getActivatedRules() const;

    // Queries
    std::size_t getPlayerTurn() const;
    int getDirection() const;
    std::optional<std::size_t> getPreviousPlayerTurn() const;
    void resetTurn(std::size_t playerTurn);
    const std::vector<Player>& getPlayers() const;
    std::vector<Player>& getPlayers();
    const std::vector<Stack>& getStacks() const;
    std::vector<Stack>& getStacks();
    std::vector<std::size_t> getStackIndices(StackType type) const;
    const std::vector<Occurrence>& getPlayerEvents() const;
    const GameSettings& getSettings() const;
    Automaton& getAutomaton();
    const Automaton& getAutomaton() const;

    // Private storage of a rule, kept between its calls
    nlohmann::ordered_json& getRuleStorage(const std::string& ruleName);

private:
    Result<std::vector<Violation>> applyDefaultBehavior(std::size_t playerIndex, const Occurrence& occurrence);
    Result<std::vector<Violation>> applyTurnAdvance(std::size_t playerIndex, const Occurrence& occurrence, bool hadViolation);
    Result<std::vector<Violation>> checkCardRequirements(const std::vector<Occurrence>& closedTurn);
    Result<void> applyPenalty(std::size_t playerIndex, const PenaltyHook& penalty);
    Result<void> runHooks(std::size_t playerIndex, const std::vector<const Verdict*>& verdicts, VerdictType type);
    Result<void> runRuleReactions(std::size_t playerIndex, const std::vector<Verdict>& verdicts);
    Result<void> commitPlayedCard(const CardEvent& cardEvent);
    Result<void> commitDrawnCard(const CardEvent& cardEvent);
    Result<void> commitDiscardedCard(const CardEvent& cardEvent);
    void nextPlayer(std::size_t playerIndex, const Occurrence& occurrence, bool tookPenalty);
    void returnCardsToDrawableStack(const std::vector<Card>& cards);

    Result<void> checkPlayerIndex(std::size_t playerIndex) const;
    Result<void> checkStackIndex(std::size_t stackIndex, StackType type) const;
    Result<void> checkRuleIndex(std::size_t ruleIndex) const;

    std::vector<LoadedRule> m_availableRules;
    std::vector<std::size_t> m_activatedRules;
    std::vector<Stack> m_stacks;
    std::vector<Player> m_players;
    TurnTracker m_turn;
    std::optional<std::size_t> m_previousPlayerTurn;
    std::size_t m_dealer;
    std::vector<Occurrence> m_playerEvents;
    GameSettings m_settings;
    Automaton m_automaton;
    std::map<std::string, nlohmann::ordered_json> m_ruleStorage;
    std::mt19937 m_rng;
};

#endif // GAME_CORE_HPP

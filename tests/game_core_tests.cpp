#include <gtest/gtest.h>

#include "automaton/automaton.hpp"
#include "automaton/interaction.hpp"
#include "event/occurrence.hpp"
#include "event/verdict.hpp"
#include "event/violation.hpp"
#include "game/card.hpp"
#include "game/card_effects.hpp"
#include "game/game_core.hpp"
#include "game/player.hpp"
#include "game/stack.hpp"
#include "test_helpers.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
Result<std::vector<Violation>> bowInteraction(GameCore& core, std::size_t playerIndex, const std::vector<InteractionStep>&) {
    return core.performPhysicalAction(playerIndex, "bow");
}

RuleData makeBowingRuleData() {
    RuleData ruleData = makeRuleData("Bowing");
    ruleData.automatonPaths = { { makeBranch(ActionToken::SelectRule), makeLeaf(ActionToken::DoAction, bowInteraction) } };
    ruleData.cardEffects.addEffect(makeValueKey(makeNumberValue(13)), makePhysicalEffect("bow"));
    return ruleData;
}

std::size_t countCards(const GameCore& core) {
    std::size_t count = 0;
    for (const Player& player : core.getPlayers()) {
        count += player.getHand().size();
    }
    for (const Stack& stack : core.getStacks()) {
        count += stack.size();
    }
    return count;
}
} // namespace

TEST(GameCoreTest, NewGameDealsCards) {
    std::vector<OccurrenceType> seen;
    std::vector<LoadedRule> rules;
    rules.push_back(makeRecordingRule("Recorder", seen));

    std::unique_ptr<GameCore> core = makeGameCore(std::move(rules));
    ASSERT_TRUE(core->activateRuleByIndex(0).isValue());
    ASSERT_TRUE(core->initNewGame({ "alice", "bob", "carol" }, 7).isValue());

    ASSERT_EQ(core->getPlayers().size(), 3);
    for (const Player& player : core->getPlayers()) {
        EXPECT_EQ(player.getHand().size(), 7);
    }

    ASSERT_EQ(core->getStacks().size(), 3);
    EXPECT_EQ(core->getStacks()[0].size(), 52 - 1 - 3 * 7);
    EXPECT_FALSE(core->getStacks()[0].isVisible());
    EXPECT_EQ(core->getStacks()[1].size(), 1);
    EXPECT_TRUE(core->getStacks()[1].isVisible());
    EXPECT_TRUE(core->getStacks()[2].isEmpty());
    EXPECT_EQ(countCards(*core), 52);

    EXPECT_EQ(core->getPlayerTurn(), 1);
    EXPECT_EQ(countOccurrences(seen, OccurrenceType::GameStart), 1);
    EXPECT_TRUE(core->getPlayerEvents().empty());
}

TEST(GameCoreTest, DealerRotatesBetweenGames) {
    std::unique_ptr<GameCore> core = makeGameCore();
    ASSERT_TRUE(core->initNewGame({ "alice", "bob", "carol" }, 2).isValue());
    EXPECT_EQ(core->getPlayerTurn(), 1);

    ASSERT_TRUE(core->initNewGame({ "alice", "bob", "carol" }, 2).isValue());
    EXPECT_EQ(core->getPlayerTurn(), 2);
}

TEST(GameCoreTest, SameSeedDealsSameCards) {
    std::unique_ptr<GameCore> first = makeGameCore();
    std::unique_ptr<GameCore> second = makeGameCore();
    ASSERT_TRUE(first->initNewGame({ "alice", "bob" }, 5).isValue());
    ASSERT_TRUE(second->initNewGame({ "alice", "bob" }, 5).isValue());

    EXPECT_EQ(first->getPlayers()[0].getHand(), second->getPlayers()[0].getHand());
    EXPECT_EQ(first->getStacks()[1].getCards(), second->getStacks()[1].getCards());
}

TEST(GameCoreTest, NewGameRejectsImpossibleDeals) {
    std::unique_ptr<GameCore> core = makeGameCore();
    EXPECT_EQ(core->initNewGame({}, 7).getError().code, ErrorCode::InvalidConfig);
    EXPECT_EQ(core->initNewGame({ "alice", "bob" }, 30).getError().code, ErrorCode::NotEnoughCards);
}

TEST(GameCoreTest, RefillKeepsTopOfPlayableStacks) {
    std::unique_ptr<GameCore> core = makeGameCore();
    setUpTable(*core, { {}, {} }, {}, makeCard(2, Suit::Heart));
    core->getStacks()[1].pushCard(makeCard(3, Suit::Heart));
    core->getStacks()[1].pushCard(makeCard(4, Suit::Heart));
    core->getStacks()[2].pushCard(makeCard(5, Suit::Spade));

    ASSERT_TRUE(core->refillDrawableStacks(0, true).isValue());

    EXPECT_EQ(core->getStacks()[0].size(), 3);
    ASSERT_EQ(core->getStacks()[1].size(), 1);
    EXPECT_EQ(*core->getStacks()[1].getTopCard(), makeCard(4, Suit::Heart));
    EXPECT_TRUE(core->getStacks()[2].isEmpty());
}

TEST(GameCoreTest, StackRunsOutReactionReplacesRefill) {
    std::size_t reactions = 0;
    std::vector<LoadedRule> rules;
    rules.push_back(makeScriptedRule("Endless", [&reactions](const Occurrence& occurrence, GameCore&) {
        if (occurrence.getType() != OccurrenceType::StackRunsOut) {
            return Verdict::ignored();
        }
        EXPECT_EQ(occurrence.getStackIndex(), 0u);
        return Verdict::executeAfterTurnChange("Endless", [&reactions](GameCore&, std::size_t) -> Result<void> {
            ++reactions;
            return {};
        });
    }));

    std::unique_ptr<GameCore> core = makeGameCore(std::move(rules));
    ASSERT_TRUE(core->activateRuleByIndex(0).isValue());
    setUpTable(*core, { {}, {} }, {}, makeCard(2, Suit::Heart));
    core->getStacks()[2].pushCard(makeCard(5, Suit::Spade));

    ASSERT_TRUE(core->refillDrawableStacks(std::nullopt, true).isValue());
    EXPECT_EQ(reactions, 1);
    EXPECT_TRUE(core->getStacks()[0].isEmpty());
    EXPECT_EQ(core->getStacks()[2].size(), 1);

    // Without rule checks the refill always happens
    ASSERT_TRUE(core->refillDrawableStacks(std::nullopt, false).isValue());
    EXPECT_EQ(reactions, 1);
    EXPECT_EQ(core->getStacks()[0].size(), 1);
}

TEST(GameCoreTest, RefillNeedsDrawableStack) {
    std::unique_ptr<GameCore> core = makeGameCore();
    setUpTable(*core, { {} }, {}, makeCard(2, Suit::Heart));
    core->getStacks().erase(core->getStacks().begin());

    EXPECT_EQ(core->refillDrawableStacks(std::nullopt, true).getError().code, ErrorCode::NoStackAvailable);
    EXPECT_EQ(core->drawMultipleCards(1).getError().code, ErrorCode::NoStackAvailable);
}

TEST(GameCoreTest, DrawMultipleCardsRefillsOnce) {
    std::unique_ptr<GameCore> core = makeGameCore();
    setUpTable(*core, { {} }, { makeCard(1, Suit::Club), makeCard(2, Suit::Club) }, makeCard(9, Suit::Heart));
    core->getStacks()[1].getCards().insert(core->getStacks()[1].getCards().begin(), { makeCard(6, Suit::Heart), makeCard(7, Suit::Heart), makeCard(8, Suit::Heart) });

    Result<std::vector<Card>> result = core->drawMultipleCards(4);
    ASSERT_TRUE(result.isValue());
    ASSERT_EQ(result.getValue().size(), 4);
    EXPECT_EQ(result.getValue()[0], makeCard(2, Suit::Club));
    EXPECT_EQ(result.getValue()[1], makeCard(1, Suit::Club));
    EXPECT_EQ(core->getStacks()[0].size(), 1);
    EXPECT_EQ(*core->getStacks()[1].getTopCard(), makeCard(9, Suit::Heart));
}

TEST(GameCoreTest, DrawMultipleCardsRestoresCardsWhenShort) {
    std::unique_ptr<GameCore> core = makeGameCore();
    setUpTable(*core, { {} }, { makeCard(1, Suit::Club), makeCard(2, Suit::Club) }, makeCard(9, Suit::Heart));
    core->getStacks()[2].pushCard(makeCard(5, Suit::Spade));

    Result<std::vector<Card>> result = core->drawMultipleCards(10);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.getError().code, ErrorCode::NotEnoughCards);

    EXPECT_EQ(core->getStacks()[0].size(), 3);
    EXPECT_EQ(*core->getStacks()[0].getTopCard(), makeCard(2, Suit::Club));
    EXPECT_EQ(countCards(*core), 4);
}

TEST(GameCoreTest, DrawingFromEmptyStackRefillsFirst) {
    std::unique_ptr<GameCore> core = makeGameCore();
    setUpTable(*core, { {}, {} }, {}, makeCard(9, Suit::Heart));
    core->getStacks()[2].pushCard(makeCard(5, Suit::Spade));

    Result<std::vector<Violation>> result = core->drawCard(0, 0);
    ASSERT_TRUE(result.isValue());
    ASSERT_EQ(core->getPlayers()[0].getHand().size(), 1);
    EXPECT_EQ(core->getPlayers()[0].getHand()[0], makeCard(5, Suit::Spade));

    Result<std::vector<Violation>> empty = core->drawCard(1, 0);
    ASSERT_TRUE(empty.isError());
    EXPECT_EQ(empty.getError().code, ErrorCode::NotEnoughCards);
}

TEST(GameCoreTest, ActivationExtendsAutomatonAndEffects) {
    std::vector<LoadedRule> rules;
    rules.push_back(makeScriptedRule(makeBowingRuleData()));
    std::unique_ptr<GameCore> core = makeGameCore(std::move(rules));
    Automaton builtin = core->getAutomaton();

    EXPECT_FALSE(core->getAutomaton().pathExists({ ActionToken::SelectRule, ActionToken::DoAction }));
    EXPECT_TRUE(core->getCardEffects(makeCard(13, Suit::Club)).empty());

    ASSERT_TRUE(core->activateRule("Bowing").isValue());
    EXPECT_TRUE(core->isRuleActivated(0));
    EXPECT_TRUE(core->getAutomaton().pathExists({ ActionToken::SelectRule, ActionToken::DoAction }));

    std::vector<CardEffect> effects = core->getCardEffects(makeCard(13, Suit::Club));
    ASSERT_EQ(effects.size(), 1);
    EXPECT_EQ(effects[0].sourceRule, "Bowing");

    ASSERT_TRUE(core->deactivateRuleByIndex(0).isValue());
    EXPECT_FALSE(core->isRuleActivated(0));
    EXPECT_TRUE(core->getAutomaton() == builtin);
    EXPECT_TRUE(core->getCardEffects(makeCard(13, Suit::Club)).empty());
}

TEST(GameCoreTest, ActivationErrors) {
    std::vector<LoadedRule> rules;
    rules.push_back(makeScriptedRule("Bowing"));
    std::unique_ptr<GameCore> core = makeGameCore(std::move(rules));

    EXPECT_EQ(core->deactivateRuleByIndex(0).getError().code, ErrorCode::RuleNotActivated);
    ASSERT_TRUE(core->activateRuleByIndex(0).isValue());
    EXPECT_EQ(core->activateRuleByIndex(0).getError().code, ErrorCode::RuleAlreadyActivated);
    EXPECT_EQ(core->activateRule("Bowing").getError().code, ErrorCode::RuleAlreadyActivated);
    EXPECT_EQ(core->activateRule("Dancing").getError().code, ErrorCode::RuleNotFound);
    EXPECT_EQ(core->activateRuleByIndex(1).getError().code, ErrorCode::InvalidRuleIndex);
    EXPECT_EQ(core->deactivateRuleByIndex(1).getError().code, ErrorCode::InvalidRuleIndex);
    EXPECT_EQ(core->getActivatedRules(), std::vector<std::size_t>{ 0 });
}

TEST(GameCoreTest, VerifyRulesReportsDisallowingRules) {
    std::vector<LoadedRule> rules;
    rules.push_back(makeScriptedRule("Fine"));
    rules.push_back(makeScriptedRule("Picky", [](const Occurrence& occurrence, GameCore&) {
        if (occurrence.getType() == OccurrenceType::VerifyRule) {
            return Verdict::disallow("Picky", "needs another rule");
        }
        return Verdict::ignored();
    }));
    std::unique_ptr<GameCore> core = makeGameCore(std::move(rules));

    Result<void> result = core->verifyRules();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.getError().code, ErrorCode::RuleNotValid);
    EXPECT_NE(result.getError().message.find("Picky: needs another rule"), std::string::npos);
    EXPECT_EQ(result.getError().message.find("Fine"), std::string::npos);
}

TEST(GameCoreTest, AutomatonDrivesBuiltinActions) {
    std::unique_ptr<GameCore> core = makeGameCore();
    setUpTable(*core, { { makeCard(9, Suit::Heart) }, {} }, { makeCard(1, Suit::Club) }, makeCard(9, Suit::Spade));

    Automaton& automaton = core->getAutomaton();
    EXPECT_EQ(automaton.onAction(makeStep(ActionToken::SelectCard, 0)).type, InteractionResultType::AdvancedNextState);

    InteractionResult leaf = automaton.onAction(makeStep(ActionToken::SelectPlayableStack, 1));
    ASSERT_EQ(leaf.type, InteractionResultType::Leaf);

    Result<std::vector<Violation>> result = core->executeInteraction(0, leaf);
    ASSERT_TRUE(result.isValue());
    EXPECT_TRUE(result.getValue().empty());
    EXPECT_EQ(*core->getStacks()[1].getTopCard(), makeCard(9, Suit::Heart));
    EXPECT_EQ(core->getPlayerTurn(), 1);

    InteractionResult draw = automaton.onAction(makeStep(ActionToken::SelectDrawableStack, 0));
    ASSERT_EQ(draw.type, InteractionResultType::Leaf);
    ASSERT_TRUE(core->executeInteraction(1, draw).isValue());
    EXPECT_EQ(core->getPlayers()[1].getHand().size(), 1);
}

TEST(GameCoreTest, RuleInteractionsReachTheirHandler) {
    std::vector<OccurrenceType> seen;
    std::vector<LoadedRule> rules;
    rules.push_back(makeScriptedRule(makeBowingRuleData()));
    rules.push_back(makeRecordingRule("Recorder", seen));
    std::unique_ptr<GameCore> core = makeGameCore(std::move(rules));
    ASSERT_TRUE(core->activateRuleByIndex(0).isValue());
    ASSERT_TRUE(core->activateRuleByIndex(1).isValue());
    setUpTable(*core, { {}, {} }, { makeCard(1, Suit::Club) }, makeCard(9, Suit::Spade));

    Automaton& automaton = core->getAutomaton();
    ASSERT_EQ(automaton.onAction(makeStep(ActionToken::SelectRule, 0)).type, InteractionResultType::AdvancedNextState);
    InteractionResult leaf = automaton.onAction(makeStep(ActionToken::DoAction, "bow"));
    ASSERT_EQ(leaf.type, InteractionResultType::Leaf);
    EXPECT_EQ(leaf.rule, "Bowing");

    ASSERT_TRUE(core->executeInteraction(1, leaf).isValue());
    EXPECT_EQ(countOccurrences(seen, OccurrenceType::PhysicalAction), 1);
    ASSERT_EQ(core->getPlayerEvents().size(), 1);
    EXPECT_EQ(core->getPlayerEvents()[0].getText(), "bow");
}

TEST(GameCoreTest, OnlyLeavesCanBeExecuted) {
    std::unique_ptr<GameCore> core = makeGameCore();
    setUpTable(*core, { { makeCard(9, Suit::Heart) } }, {}, makeCard(9, Suit::Spade));

    InteractionResult partial = core->getAutomaton().onAction(makeStep(ActionToken::SelectCard, 0));
    Result<std::vector<Violation>> result = core->executeInteraction(0, partial);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.getError().code, ErrorCode::InvalidInteraction);

    core->getAutomaton().reset();
    InteractionResult leaf = core->getAutomaton().onAction(makeStep(ActionToken::SelectDrawableStack, 0));
    EXPECT_EQ(core->executeInteraction(4, leaf).getError().code, ErrorCode::InvalidPlayerIndex);
}

TEST(GameCoreTest, MalformedStepsAreRejectedByHandlers) {
    std::unique_ptr<GameCore> core = makeGameCore();
    setUpTable(*core, { { makeCard(9, Suit::Heart) } }, { makeCard(1, Suit::Club) }, makeCard(9, Suit::Spade));

    // A card selected by name instead of index
    core->getAutomaton().onAction(makeStep(ActionToken::SelectCard, "nine"));
    InteractionResult leaf = core->getAutomaton().onAction(makeStep(ActionToken::SelectPlayableStack, 1));
    ASSERT_EQ(leaf.type, InteractionResultType::Leaf);

    Result<std::vector<Violation>> result = core->executeInteraction(0, leaf);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.getError().code, ErrorCode::InvalidInteraction);
    EXPECT_EQ(core->getPlayers()[0].getHand().size(), 1);
}

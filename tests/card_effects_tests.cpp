#include <gtest/gtest.h>

#include "game/card.hpp"
#include "game/card_effects.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace {
bool containsEffect(const std::vector<CardEffect>& effects, const CardEffect& effect) {
    return std::find(effects.begin(), effects.end(), effect) != effects.end();
}
} // namespace

TEST(CardEffectsTest, LookupUnionsValueAndTypeKeys) {
    CardEffect skip = makeTurnChangeEffect(makeTurnUpdate(TurnUpdaterKind::Step, 1));
    CardEffect greeting = makeSayEffect({ PhraseRequirement{ .alternatives = { "have a nice day" } } });
    CardEffect knock = makePhysicalEffect("knock");

    CardEffectsTable table;
    table.addEffect(makeValueKey(makeNumberValue(7)), skip);
    table.addEffect(makeTypeKey(makeCommonType(Suit::Heart)), greeting);
    table.addEffect(makeValueTypeKey(makeNumberValue(7), makeCommonType(Suit::Heart)), knock);

    std::vector<CardEffect> sevenOfHeart = table.getCardEffects(makeCard(7, Suit::Heart));
    EXPECT_EQ(sevenOfHeart.size(), 3);
    EXPECT_TRUE(containsEffect(sevenOfHeart, skip));
    EXPECT_TRUE(containsEffect(sevenOfHeart, greeting));
    EXPECT_TRUE(containsEffect(sevenOfHeart, knock));

    std::vector<CardEffect> sevenOfClub = table.getCardEffects(makeCard(7, Suit::Club));
    ASSERT_EQ(sevenOfClub.size(), 1);
    EXPECT_EQ(sevenOfClub[0], skip);

    std::vector<CardEffect> twoOfHeart = table.getCardEffects(makeCard(2, Suit::Heart));
    ASSERT_EQ(twoOfHeart.size(), 1);
    EXPECT_EQ(twoOfHeart[0], greeting);

    EXPECT_TRUE(table.getCardEffects(makeCard(2, Suit::Spade)).empty());
}

TEST(CardEffectsTest, OverlappingKeysKeepEveryEffect) {
    CardEffect step = makeTurnChangeEffect(makeTurnUpdate(TurnUpdaterKind::Step, 1));
    CardEffect greeting = makeSayEffect({ PhraseRequirement{ .alternatives = { "hello" } } });

    CardEffectsTable table;
    table.addEffect(makeValueKey(makeNumberValue(7)), step);
    table.addEffect(makeTypeKey(makeCommonType(Suit::Heart)), step);
    table.addEffect(makeValueKey(makeNumberValue(7)), greeting);
    table.addEffect(makeValueTypeKey(makeNumberValue(7), makeCommonType(Suit::Heart)), greeting);

    std::vector<PlayerTurnChange> changes = table.getTurnChanges(makeCard(7, Suit::Heart));
    ASSERT_EQ(changes.size(), 2);
    EXPECT_EQ(changes[0], makeTurnUpdate(TurnUpdaterKind::Step, 1));
    EXPECT_EQ(changes[1], makeTurnUpdate(TurnUpdaterKind::Step, 1));

    std::vector<CardEffect> effects = table.getCardEffects(makeCard(7, Suit::Heart));
    EXPECT_EQ(std::count(effects.begin(), effects.end(), step), 2);
    EXPECT_EQ(std::count(effects.begin(), effects.end(), greeting), 2);

    EXPECT_EQ(table.getTurnChanges(makeCard(7, Suit::Club)).size(), 1);
}

TEST(CardEffectsTest, TurnChangesKeepDeclarationOrder) {
    CardEffectsTable table;
    table.addEffect(makeValueKey(makeNumberValue(1)), makeTurnChangeEffect(makeTurnRotation(TurnUpdaterKind::Step, 0)));
    table.addEffect(makeValueKey(makeNumberValue(1)), makeTurnChangeEffect(makeTurnUpdate(TurnUpdaterKind::Step, 2)));
    table.addEffect(makeTypeKey(makeCommonType(Suit::Spade)), makePhysicalEffect("knock"));

    std::vector<PlayerTurnChange> changes = table.getTurnChanges(makeCard(1, Suit::Spade));
    ASSERT_EQ(changes.size(), 2);
    EXPECT_EQ(changes[0], makeTurnRotation(TurnUpdaterKind::Step, 0));
    EXPECT_EQ(changes[1], makeTurnUpdate(TurnUpdaterKind::Step, 2));
}

TEST(CardEffectsTest, MergedEffectsAreRemovedByRule) {
    CardEffectsTable rule;
    rule.addEffect(makeValueKey(makeNumberValue(8)), makePhysicalEffect("bow"));

    CardEffectsTable table;
    table.addEffect(makeValueKey(makeNumberValue(8)), makePhysicalEffect("knock"));
    table.merge(rule, "Bowing");

    std::vector<CardEffect> merged = table.getCardEffects(makeCard(8, Suit::Diamond));
    ASSERT_EQ(merged.size(), 2);
    EXPECT_FALSE(merged[0].sourceRule.has_value());
    EXPECT_EQ(merged[1].sourceRule, "Bowing");

    table.removeRuleEffects("Bowing");
    std::vector<CardEffect> remaining = table.getCardEffects(makeCard(8, Suit::Diamond));
    ASSERT_EQ(remaining.size(), 1);
    EXPECT_EQ(remaining[0].physicalAction, "knock");

    table.removeRuleEffects("knock");
    EXPECT_FALSE(table.isEmpty());
}

TEST(CardEffectsTest, ParsesTurnChanges) {
    Result<PlayerTurnChange> step = parsePlayerTurnChange("up_up_1");
    ASSERT_TRUE(step.isValue());
    EXPECT_EQ(step.getValue(), makeTurnUpdate(TurnUpdaterKind::Step, 1));

    Result<PlayerTurnChange> rotation = parsePlayerTurnChange("ro_set_0");
    ASSERT_TRUE(rotation.isValue());
    EXPECT_EQ(rotation.getValue(), makeTurnRotation(TurnUpdaterKind::Set, 0));

    Result<PlayerTurnChange> backwards = parsePlayerTurnChange("up_up_-2");
    ASSERT_TRUE(backwards.isValue());
    EXPECT_EQ(backwards.getValue().value, -2);

    EXPECT_EQ(formatPlayerTurnChange(rotation.getValue()), "ro_set_0");
}

TEST(CardEffectsTest, RejectsMalformedTurnChanges) {
    for (const std::string& input : { "up_up", "side_up_1", "up_down_1", "up_up_x", "up_up_1_2", "up_set_-1", "up_up_1x" }) {
        Result<PlayerTurnChange> result = parsePlayerTurnChange(input);
        ASSERT_TRUE(result.isError()) << input;
        EXPECT_EQ(result.getError().code, ErrorCode::InvalidConfig);
    }
}

TEST(CardTest, ColorsFollowSuits) {
    EXPECT_EQ(getCardColor(makeCard(1, Suit::Heart)), CardColor::Red);
    EXPECT_EQ(getCardColor(makeCard(1, Suit::Diamond)), CardColor::Red);
    EXPECT_EQ(getCardColor(makeCard(1, Suit::Spade)), CardColor::Black);
    EXPECT_EQ(getCardColor(makeCard(1, Suit::Club)), CardColor::Black);

    Card joker{ .value = makePlusInfinityValue(), .type = makeJokerType("red", CardColor::Red), .rule = std::nullopt };
    EXPECT_EQ(getCardColor(joker), CardColor::Red);

    Card ruleCard{ .value = makeNumberValue(1), .type = makeRuleType(), .rule = "Bowing" };
    EXPECT_EQ(getCardColor(ruleCard), CardColor::Undefined);
}

TEST(CardTest, StandardDeckHasEveryCardOnce) {
    std::vector<Card> deck = generateStandardDeck();
    ASSERT_EQ(deck.size(), 52);

    for (std::size_t i = 0; i < deck.size(); ++i) {
        for (std::size_t j = i + 1; j < deck.size(); ++j) {
            EXPECT_FALSE(deck[i] == deck[j]);
        }
    }
}

TEST(CardTest, ParsesValuesAndTypes) {
    ASSERT_TRUE(parseCardValue("12").isValue());
    EXPECT_EQ(parseCardValue("12").getValue(), makeNumberValue(12));
    EXPECT_EQ(parseCardValue("plus_infinity").getValue(), makePlusInfinityValue());
    EXPECT_TRUE(parseCardValue("twelve").isError());

    ASSERT_TRUE(parseCardType("club").isValue());
    EXPECT_EQ(parseCardType("club").getValue(), makeCommonType(Suit::Club));
    EXPECT_EQ(parseCardType("rule").getValue(), makeRuleType());
    EXPECT_TRUE(parseCardType("star").isError());
}

#include "game/card.hpp"

#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cassert>
#include <optional>
#include <string>
#include <vector>

namespace {
const std::vector<Suit> AllSuits = { Suit::Spade, Suit::Diamond, Suit::Club, Suit::Heart };

std::string getSuitName(Suit suit) {
    switch (suit) {
        case Suit::Spade:
            return "spade";
        case Suit::Diamond:
            return "diamond";
        case Suit::Club:
            return "club";
        case Suit::Heart:
            return "heart";
        default:
            assert(false);
            return "unknown";
    }
}
} // namespace

CardValue makeNumberValue(int number) {
    return CardValue{ .kind = CardValueKind::Number, .number = number };
}

CardValue makeMinusInfinityValue() {
    return CardValue{ .kind = CardValueKind::MinusInfinity, .number = 0 };
}

CardValue makePlusInfinityValue() {
    return CardValue{ .kind = CardValueKind::PlusInfinity, .number = 0 };
}

CardType makeCommonType(Suit suit) {
    return CardType{ .kind = CardTypeKind::Common, .suit = suit, .jokerColor = CardColor::Undefined, .description = "" };
}

CardType makeRuleType() {
    return CardType{ .kind = CardTypeKind::Rule, .suit = Suit::Spade, .jokerColor = CardColor::Undefined, .description = "" };
}

CardType makeJokerType(const std::string& description, CardColor color) {
    return CardType{ .kind = CardTypeKind::Joker, .suit = Suit::Spade, .jokerColor = color, .description = description };
}

Card makeCard(int number, Suit suit) {
    return Card{ .value = makeNumberValue(number), .type = makeCommonType(suit), .rule = std::nullopt };
}

CardColor getCardColor(const Card& card) {
    switch (card.type.kind) {
        case CardTypeKind::Common:
            return (card.type.suit == Suit::Heart || card.type.suit == Suit::Diamond) ? CardColor::Red : CardColor::Black;
        case CardTypeKind::Joker:
            return card.type.jokerColor;
        case CardTypeKind::Rule:
        default:
            return CardColor::Undefined;
    }
}

std::string getCardValueName(const CardValue& value) {
    switch (value.kind) {
        case CardValueKind::Number:
            return std::to_string(value.number);
        case CardValueKind::MinusInfinity:
            return "minus_infinity";
        case CardValueKind::PlusInfinity:
            return "plus_infinity";
        default:
            assert(false);
            return "unknown";
    }
}

std::string getCardTypeName(const CardType& type) {
    switch (type.kind) {
        case CardTypeKind::Common:
            return getSuitName(type.suit);
        case CardTypeKind::Rule:
            return "rule";
        case CardTypeKind::Joker:
            return type.description.empty() ? "joker" : "joker(" + type.description + ")";
        default:
            assert(false);
            return "unknown";
    }
}

std::string getCardColorName(CardColor color) {
    switch (color) {
        case CardColor::Red:
            return "red";
        case CardColor::Black:
            return "black";
        case CardColor::Undefined:
        default:
            return "undefined";
    }
}

std::string getCardName(const Card& card) {
    std::string name = getCardValueName(card.value) + " of " + getCardTypeName(card.type);
    if (card.rule) {
        name += " [" + *card.rule + "]";
    }
    return name;
}

Result<CardValue> parseCardValue(const std::string& input) {
    std::string trimmed = trim(input);
    if (trimmed == "minus_infinity") {
        return makeMinusInfinityValue();
    }
    if (trimmed == "plus_infinity") {
        return makePlusInfinityValue();
    }

    std::optional<int> number = parseInt(trimmed);
    if (!number || std::to_string(*number) != trimmed) {
        return Error{ ErrorCode::InvalidConfig, "Invalid card value: " + input };
    }
    return makeNumberValue(*number);
}

Result<CardType> parseCardType(const std::string& input) {
    std::string trimmed = trim(input);
    for (Suit suit : AllSuits) {
        if (trimmed == getSuitName(suit)) {
            return makeCommonType(suit);
        }
    }

    if (trimmed == "rule") {
        return makeRuleType();
    }
    if (trimmed == "joker") {
        return makeJokerType("", CardColor::Undefined);
    }

    return Error{ ErrorCode::InvalidConfig, "Invalid card type: " + input };
}

std::vector<Card> generateStandardDeck() {
    std::vector<Card> deck;
    deck.reserve(AllSuits.size() * MaxCardNumber);
    for (int number = MinCardNumber; number <= MaxCardNumber; ++number) {
        for (Suit suit : AllSuits) {
            deck.push_back(makeCard(number, suit));
        }
    }
    return deck;
}

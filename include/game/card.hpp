#ifndef CARD_HPP
#define CARD_HPP

#include "util/result.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class Suit : std::uint8_t {
    Spade,
    Diamond,
    Club,
    Heart
};

enum class CardColor : std::uint8_t {
    Red,
    Black,
    Undefined
};

enum class CardValueKind : std::uint8_t {
    Number,
    MinusInfinity,
    PlusInfinity
};

enum class CardTypeKind : std::uint8_t {
    Common,
    Rule,
    Joker
};

struct CardValue {
    CardValueKind kind;
    int number;

    auto operator<=>(const CardValue&) const = default;
};

struct CardType {
    CardTypeKind kind;
    Suit suit;
    CardColor jokerColor;
    std::string description;

    auto operator<=>(const CardType&) const = default;
};

struct Card {
    CardValue value;
    CardType type;
    std::optional<std::string> rule;

    bool operator==(const Card&) const = default;
};

constexpr int MinCardNumber = 1;
constexpr int MaxCardNumber = 13;

CardValue makeNumberValue(int number);
CardValue makeMinusInfinityValue();
CardValue makePlusInfinityValue();
CardType makeCommonType(Suit suit);
CardType makeRuleType();
CardType makeJokerType(const std::string& description, CardColor color);
Card makeCard(int number, Suit suit);

CardColor getCardColor(const Card& card);
std::string getCardValueName(const CardValue& value);
std::string getCardTypeName(const CardType& type);
std::string getCardColorName(CardColor color);
std::string getCardName(const Card& card);

Result<CardValue> parseCardValue(const std::string& input);
Result<CardType> parseCardType(const std::string& input);

// Values 1 to 13 in the four suits, in a fixed order
std::vector<Card> generateStandardDeck();

#endif // CARD_HPP

#ifndef CARD_EFFECTS_HPP
#define CARD_EFFECTS_HPP

#include "game/card.hpp"
#include "util/result.hpp"

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class TurnChangeScope : std::uint8_t {
    Update,
    Rotate
};

enum class TurnUpdaterKind : std::uint8_t {
    Set,
    Step
};

struct PlayerTurnChange {
    TurnChangeScope scope;
    TurnUpdaterKind updater;
    int value;

    bool operator==(const PlayerTurnChange&) const = default;
};

PlayerTurnChange makeTurnUpdate(TurnUpdaterKind updater, int value);
PlayerTurnChange makeTurnRotation(TurnUpdaterKind updater, int value);

// Format: <up|ro>_<set|up>_<n>, for example "up_up_1" or "ro_set_0"
Result<PlayerTurnChange> parsePlayerTurnChange(const std::string& input);
std::string formatPlayerTurnChange(const PlayerTurnChange& change);

// Satisfied when any one of the alternatives is said
struct PhraseRequirement {
    std::vector<std::string> alternatives;

    bool operator==(const PhraseRequirement&) const = default;
};

enum class CardEffectType : std::uint8_t {
    TurnChange,
    Say,
    Physical
};

struct CardEffect {
    CardEffectType type;
    PlayerTurnChange turnChange;
    std::vector<PhraseRequirement> phrases;
    std::string physicalAction;
    std::optional<std::string> sourceRule;

    bool operator==(const CardEffect&) const = default;
};

CardEffect makeTurnChangeEffect(const PlayerTurnChange& change);
CardEffect makeSayEffect(const std::vector<PhraseRequirement>& phrases);
CardEffect makePhysicalEffect(const std::string& actionName);
std::string describeCardEffect(const CardEffect& effect);

// Selects cards by value, by type, or by both
struct CardEffectsKey {
    std::optional<CardValue> value;
    std::optional<CardType> type;

    auto operator<=>(const CardEffectsKey&) const = default;
};

CardEffectsKey makeValueKey(const CardValue& value);
CardEffectsKey makeTypeKey(const CardType& type);
CardEffectsKey makeValueTypeKey(const CardValue& value, const CardType& type);

class CardEffectsTable {
public:
    void addEffect(const CardEffectsKey& key, const CardEffect& effect);
    void merge(const CardEffectsTable& other, const std::optional<std::string>& sourceRule);
    void removeRuleEffects(const std::string& ruleName);

    std::vector<CardEffect> getCardEffects(const Card& card) const;
    std::vector<PlayerTurnChange> getTurnChanges(const Card& card) const;
    const std::map<CardEffectsKey, std::vector<CardEffect>>& getEntries() const;
    bool isEmpty() const;

private:
    std::map<CardEffectsKey, std::vector<CardEffect>> m_effects;
};

#endif // CARD_EFFECTS_HPP

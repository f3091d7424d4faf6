#include "game/card_effects.hpp"

#include "game/card.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <cassert>
#include <map>
#include <optional>
#include <string>
#include <vector>

PlayerTurnChange makeTurnUpdate(TurnUpdaterKind updater, int value) {
    return PlayerTurnChange{ .scope = TurnChangeScope::Update, .updater = updater, .value = value };
}

PlayerTurnChange makeTurnRotation(TurnUpdaterKind updater, int value) {
    return PlayerTurnChange{ .scope = TurnChangeScope::Rotate, .updater = updater, .value = value };
}

Result<PlayerTurnChange> parsePlayerTurnChange(const std::string& input) {
    std::vector<std::string> tokens = parseTokens(input, '_');
    if (tokens.size() != 3) {
        return Error{ ErrorCode::InvalidConfig, "Invalid turn change \"" + input + "\", expected <up|ro>_<set|up>_<n>" };
    }

    PlayerTurnChange change{};

    if (tokens[0] == "up") {
        change.scope = TurnChangeScope::Update;
    }
    else if (tokens[0] == "ro") {
        change.scope = TurnChangeScope::Rotate;
    }
    else {
        return Error{ ErrorCode::InvalidConfig, "Invalid turn change scope \"" + tokens[0] + "\" in \"" + input + "\"" };
    }

    if (tokens[1] == "set") {
        change.updater = TurnUpdaterKind::Set;
    }
    else if (tokens[1] == "up") {
        change.updater = TurnUpdaterKind::Step;
    }
    else {
        return Error{ ErrorCode::InvalidConfig, "Invalid turn updater \"" + tokens[1] + "\" in \"" + input + "\"" };
    }

    std::optional<int> value = parseInt(tokens[2]);
    if (!value) {
        return Error{ ErrorCode::InvalidConfig, "Invalid turn change amount \"" + tokens[2] + "\" in \"" + input + "\"" };
    }
    if (change.updater == TurnUpdaterKind::Set && *value < 0) {
        return Error{ ErrorCode::InvalidConfig, "Player index must not be negative in \"" + input + "\"" };
    }
    change.value = *value;

    return change;
}

std::string formatPlayerTurnChange(const PlayerTurnChange& change) {
    std::string scope = (change.scope == TurnChangeScope::Update) ? "up" : "ro";
    std::string updater = (change.updater == TurnUpdaterKind::Set) ? "set" : "up";
    return scope + "_" + updater + "_" + std::to_string(change.value);
}

CardEffect makeTurnChangeEffect(const PlayerTurnChange& change) {
    return CardEffect{ .type = CardEffectType::TurnChange, .turnChange = change, .phrases = {}, .physicalAction = "", .sourceRule = std::nullopt };
}

CardEffect makeSayEffect(const std::vector<PhraseRequirement>& phrases) {
    return CardEffect{ .type = CardEffectType::Say, .turnChange = {}, .phrases = phrases, .physicalAction = "", .sourceRule = std::nullopt };
}

CardEffect makePhysicalEffect(const std::string& actionName) {
    return CardEffect{ .type = CardEffectType::Physical, .turnChange = {}, .phrases = {}, .physicalAction = actionName, .sourceRule = std::nullopt };
}

std::string describeCardEffect(const CardEffect& effect) {
    switch (effect.type) {
        case CardEffectType::TurnChange:
            return "turn change " + formatPlayerTurnChange(effect.turnChange);
        case CardEffectType::Say: {
            std::vector<std::string> phrases;
            for (const PhraseRequirement& requirement : effect.phrases) {
                phrases.push_back("\"" + join(requirement.alternatives, "\" or \"") + "\"");
            }
            return "say " + join(phrases, ", ");
        }
        case CardEffectType::Physical:
            return "physical action \"" + effect.physicalAction + "\"";
        default:
            assert(false);
            return "unknown";
    }
}

CardEffectsKey makeValueKey(const CardValue& value) {
    return CardEffectsKey{ .value = value, .type = std::nullopt };
}

CardEffectsKey makeTypeKey(const CardType& type) {
    return CardEffectsKey{ .value = std::nullopt, .type = type };
}

CardEffectsKey makeValueTypeKey(const CardValue& value, const CardType& type) {
    return CardEffectsKey{ .value = value, .type = type };
}

void CardEffectsTable::addEffect(const CardEffectsKey& key, const CardEffect& effect) {
    m_effects[key].push_back(effect);
}

void CardEffectsTable::merge(const CardEffectsTable& other, const std::optional<std::string>& sourceRule) {
    for (const auto& [key, effects] : other.m_effects) {
        for (CardEffect effect : effects) {
            effect.sourceRule = sourceRule;
            addEffect(key, effect);
        }
    }
}

void CardEffectsTable::removeRuleEffects(const std::string& ruleName) {
    for (auto it = m_effects.begin(); it != m_effects.end();) {
        std::vector<CardEffect>& effects = it->second;
        effects.erase(std::remove_if(effects.begin(), effects.end(), [&ruleName](const CardEffect& effect) {
            return effect.sourceRule == ruleName;
        }), effects.end());

        if (effects.empty()) {
            it = m_effects.erase(it);
        }
        else {
            ++it;
        }
    }
}

std::vector<CardEffect> CardEffectsTable::getCardEffects(const Card& card) const {
    std::vector<CardEffect> result;

    // A card can match a value key and a type key at the same time, each match counts
    for (const CardEffectsKey& key : { makeValueKey(card.value), makeTypeKey(card.type), makeValueTypeKey(card.value, card.type) }) {
        auto it = m_effects.find(key);
        if (it != m_effects.end()) {
            result.insert(result.end(), it->second.begin(), it->second.end());
        }
    }

    return result;
}

std::vector<PlayerTurnChange> CardEffectsTable::getTurnChanges(const Card& card) const {
    std::vector<PlayerTurnChange> changes;
    for (const CardEffect& effect : getCardEffects(card)) {
        if (effect.type == CardEffectType::TurnChange) {
            changes.push_back(effect.turnChange);
        }
    }
    return changes;
}

const std::map<CardEffectsKey, std::vector<CardEffect>>& CardEffectsTable::getEntries() const {
    return m_effects;
}

bool CardEffectsTable::isEmpty() const {
    return m_effects.empty();
}

#include "config/game_config.hpp"

#include "game/card.hpp"
#include "game/card_effects.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace {
enum class FieldStatus : std::uint8_t {
    Loaded,
    Missing,
    Invalid
};

template <typename T>
FieldStatus loadField(T& field, const YAML::Node& node, const std::vector<std::string>& indices, std::size_t depth) {
    if (!node.IsDefined() || node.IsNull()) {
        return FieldStatus::Missing;
    }

    if (depth == indices.size()) {
        try {
            field = node.as<T>();
            return FieldStatus::Loaded;
        }
        catch (const YAML::Exception&) {
            return FieldStatus::Invalid;
        }
    }

    if (!node.IsMap()) {
        return FieldStatus::Invalid;
    }

    return loadField(field, node[indices[depth]], indices, depth + 1);
}

Error makeFieldError(const std::vector<std::string>& indices, const std::string& reason) {
    return Error{ ErrorCode::InvalidConfig, "Field " + join(indices, "::") + " " + reason };
}

template <typename T>
Result<void> loadFieldRequired(T& field, const YAML::Node& root, const std::vector<std::string>& indices) {
    switch (loadField(field, root, indices, 0)) {
        case FieldStatus::Loaded:
            return {};
        case FieldStatus::Missing:
            return makeFieldError(indices, "is required");
        default:
            return makeFieldError(indices, "has an invalid value");
    }
}

template <typename T>
Result<void> loadFieldOptional(T& field, const YAML::Node& root, const std::vector<std::string>& indices, const T& defaultValue) {
    switch (loadField(field, root, indices, 0)) {
        case FieldStatus::Loaded:
            return {};
        case FieldStatus::Missing:
            field = defaultValue;
            return {};
        default:
            return makeFieldError(indices, "has an invalid value");
    }
}

// Keys of the value_type section look like "1_spade" or "plus_infinity_heart"
Result<CardEffectsKey> parseCardEffectsKey(const std::string& section, const std::string& key) {
    if (section == "value") {
        Result<CardValue> valueResult = parseCardValue(key);
        if (valueResult.isError()) {
            return valueResult.getError();
        }
        return makeValueKey(valueResult.getValue());
    }

    if (section == "type") {
        Result<CardType> typeResult = parseCardType(key);
        if (typeResult.isError()) {
            return typeResult.getError();
        }
        return makeTypeKey(typeResult.getValue());
    }

    if (section == "value_type") {
        std::size_t separator = key.rfind('_');
        if (separator == std::string::npos) {
            return Error{ ErrorCode::InvalidConfig, "Invalid value_type key \"" + key + "\", expected <value>_<type>" };
        }

        Result<CardValue> valueResult = parseCardValue(key.substr(0, separator));
        if (valueResult.isError()) {
            return valueResult.getError();
        }

        Result<CardType> typeResult = parseCardType(key.substr(separator + 1));
        if (typeResult.isError()) {
            return typeResult.getError();
        }

        return makeValueTypeKey(valueResult.getValue(), typeResult.getValue());
    }

    return Error{ ErrorCode::InvalidConfig, "Unknown card effects section \"" + section + "\", expected value, type or value_type" };
}

Result<PhraseRequirement> parsePhraseRequirement(const YAML::Node& node) {
    PhraseRequirement requirement;

    if (node.IsScalar()) {
        requirement.alternatives.push_back(node.as<std::string>());
    }
    else if (node.IsSequence()) {
        for (const YAML::Node& alternative : node) {
            if (!alternative.IsScalar()) {
                return Error{ ErrorCode::InvalidConfig, "Alternative phrases must be strings" };
            }
            requirement.alternatives.push_back(alternative.as<std::string>());
        }
    }

    if (requirement.alternatives.empty()) {
        return Error{ ErrorCode::InvalidConfig, "A phrase requirement needs at least one phrase" };
    }
    return requirement;
}

Result<CardEffect> parseSayEffect(const YAML::Node& node) {
    std::vector<PhraseRequirement> phrases;

    if (node.IsScalar()) {
        phrases.push_back(PhraseRequirement{ .alternatives = { node.as<std::string>() } });
    }
    else if (node.IsSequence()) {
        for (const YAML::Node& element : node) {
            Result<PhraseRequirement> requirementResult = parsePhraseRequirement(element);
            if (requirementResult.isError()) {
                return requirementResult.getError();
            }
            phrases.push_back(requirementResult.getValue());
        }
    }

    if (phrases.empty()) {
        return Error{ ErrorCode::InvalidConfig, "A say effect needs at least one phrase" };
    }
    return makeSayEffect(phrases);
}

Result<CardEffect> parseTurnChangeEffect(const YAML::Node& node) {
    if (!node.IsScalar()) {
        return Error{ ErrorCode::InvalidConfig, "A turn change must be a string" };
    }

    Result<PlayerTurnChange> changeResult = parsePlayerTurnChange(node.as<std::string>());
    if (changeResult.isError()) {
        return changeResult.getError();
    }
    return makeTurnChangeEffect(changeResult.getValue());
}

Result<CardEffect> parseCardEffect(const YAML::Node& node) {
    if (node.IsScalar()) {
        return parseTurnChangeEffect(node);
    }

    if (!node.IsMap() || node.size() != 1) {
        return Error{ ErrorCode::InvalidConfig, "A card effect must be a turn change string or a map with one of say, physical or turn" };
    }

    if (node["say"]) {
        return parseSayEffect(node["say"]);
    }

    if (node["physical"]) {
        const YAML::Node& action = node["physical"];
        if (!action.IsScalar() || action.as<std::string>().empty()) {
            return Error{ ErrorCode::InvalidConfig, "A physical effect needs an action name" };
        }
        return makePhysicalEffect(action.as<std::string>());
    }

    if (node["turn"]) {
        return parseTurnChangeEffect(node["turn"]);
    }

    return Error{ ErrorCode::InvalidConfig, "Unknown card effect, expected say, physical or turn" };
}
} // namespace

Result<CardEffectsTable> parseCardEffects(const YAML::Node& node) {
    CardEffectsTable table;
    if (!node.IsDefined() || node.IsNull()) {
        return table;
    }

    if (!node.IsMap()) {
        return Error{ ErrorCode::InvalidConfig, "Field card-effects must be a map" };
    }

    try {
        for (const auto& section : node) {
            std::string sectionName = section.first.as<std::string>();
            if (!section.second.IsMap()) {
                return Error{ ErrorCode::InvalidConfig, "Field card-effects::" + sectionName + " must be a map" };
            }

            for (const auto& entry : section.second) {
                std::string keyName = entry.first.as<std::string>();
                std::string fieldPath = "card-effects::" + sectionName + "::" + keyName;

                Result<CardEffectsKey> keyResult = parseCardEffectsKey(sectionName, keyName);
                if (keyResult.isError()) {
                    return Error{ ErrorCode::InvalidConfig, fieldPath + ": " + keyResult.getError().message };
                }

                // A single effect may be written without a list
                std::vector<YAML::Node> effectNodes;
                if (entry.second.IsSequence()) {
                    for (const YAML::Node& effectNode : entry.second) {
                        effectNodes.push_back(effectNode);
                    }
                }
                else {
                    effectNodes.push_back(entry.second);
                }

                for (const YAML::Node& effectNode : effectNodes) {
                    Result<CardEffect> effectResult = parseCardEffect(effectNode);
                    if (effectResult.isError()) {
                        return Error{ ErrorCode::InvalidConfig, fieldPath + ": " + effectResult.getError().message };
                    }
                    table.addEffect(keyResult.getValue(), effectResult.getValue());
                }
            }
        }
    }
    catch (const YAML::Exception& e) {
        return Error{ ErrorCode::InvalidConfig, "Could not parse card-effects: " + std::string(e.what()) };
    }

    return table;
}

Result<GameConfig> parseGameConfig(const YAML::Node& root) {
    if (!root.IsMap()) {
        return Error{ ErrorCode::InvalidConfig, "Settings must be a map" };
    }

    GameConfig config;

    std::string rulesDirectory;
    Result<void> directoryResult = loadFieldRequired(rulesDirectory, root, { "rules-directory" });
    if (directoryResult.isError()) {
        return directoryResult.getError();
    }
    config.rulesDirectory = rulesDirectory;

    Result<void> playersResult = loadFieldOptional(config.players, root, { "players" }, std::vector<std::string>{ "player1", "player2" });
    if (playersResult.isError()) {
        return playersResult.getError();
    }
    if (config.players.empty()) {
        return makeFieldError({ "players" }, "must name at least one player");
    }

    Result<void> cardsResult = loadFieldOptional(config.cardsPerPlayer, root, { "cards-per-player" }, DefaultCardsPerPlayer);
    if (cardsResult.isError()) {
        return cardsResult.getError();
    }

    Result<void> newStackResult = loadFieldOptional(config.settings.canPlayOnNewStack, root, { "can-play-on-new-stack" }, false);
    if (newStackResult.isError()) {
        return newStackResult.getError();
    }

    Result<void> caseResult = loadFieldOptional(config.settings.caseSensitiveSay, root, { "case-sensitive-say" }, true);
    if (caseResult.isError()) {
        return caseResult.getError();
    }

    unsigned int seed = 0;
    switch (loadField(seed, root, { "seed" }, 0)) {
        case FieldStatus::Loaded:
            config.settings.seed = seed;
            break;
        case FieldStatus::Missing:
            config.settings.seed = std::nullopt;
            break;
        default:
            return makeFieldError({ "seed" }, "has an invalid value");
    }

    Result<CardEffectsTable> effectsResult = parseCardEffects(root["card-effects"]);
    if (effectsResult.isError()) {
        return effectsResult.getError();
    }
    config.settings.cardEffects = effectsResult.getValue();

    return config;
}

Result<GameConfig> loadGameConfig(const std::filesystem::path& path) {
    YAML::Node input;

    try {
        input = YAML::LoadFile(path.string());
    }
    catch (const YAML::Exception& e) {
        return Error{ ErrorCode::InvalidConfig, "Could not load settings file " + path.string() + ". " + e.what() };
    }

    Result<GameConfig> configResult = parseGameConfig(input);
    if (configResult.isError()) {
        return configResult.getError();
    }

    GameConfig config = configResult.getValue();
    if (config.rulesDirectory.is_relative()) {
        config.rulesDirectory = path.parent_path() / config.rulesDirectory;
    }
    return config;
}

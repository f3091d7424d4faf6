#ifndef GAME_CONFIG_HPP
#define GAME_CONFIG_HPP

#include "game/card_effects.hpp"
#include "game/game_settings.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <yaml-cpp/yaml.h>

constexpr std::size_t DefaultCardsPerPlayer = 7;

struct GameConfig {
    std::filesystem::path rulesDirectory;
    std::vector<std::string> players;
    std::size_t cardsPerPlayer = DefaultCardsPerPlayer;
    GameSettings settings;
};

Result<GameConfig> parseGameConfig(const YAML::Node& root);

// Relative rule directories are resolved against the directory of the settings file
Result<GameConfig> loadGameConfig(const std::filesystem::path& path);

Result<CardEffectsTable> parseCardEffects(const YAML::Node& node);

#endif // GAME_CONFIG_HPP

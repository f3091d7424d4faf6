#ifndef GAME_SETTINGS_HPP
#define GAME_SETTINGS_HPP

#include "game/card_effects.hpp"

#include <optional>

struct GameSettings {
    bool canPlayOnNewStack = false;
    bool caseSensitiveSay = true;
    std::optional<unsigned int> seed;
    CardEffectsTable cardEffects;
};

#endif // GAME_SETTINGS_HPP

#ifndef MAO_COMMANDS_HPP
#define MAO_COMMANDS_HPP

#include "automaton/interaction.hpp"
#include "cli/cli_dispatcher.hpp"
#include "config/game_config.hpp"
#include "game/game_core.hpp"
#include "rule/rule_loader.hpp"

#include <cstddef>
#include <memory>
#include <optional>

struct MaoContext {
    std::unique_ptr<IRuleLoader> loader;
    std::optional<GameConfig> config;
    std::unique_ptr<GameCore> core;
    std::size_t actingPlayer = 0;

    // Step waiting for "choose" when several interactions match it
    std::optional<InteractionStep> pendingStep;
};

bool registerAllCommands(CliDispatcher& dispatcher, MaoContext& context);

#endif // MAO_COMMANDS_HPP

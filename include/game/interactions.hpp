#ifndef INTERACTIONS_HPP
#define INTERACTIONS_HPP

#include "automaton/automaton.hpp"
#include "automaton/interaction.hpp"
#include "event/violation.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <vector>

class GameCore;

// Handlers bound to the built-in automaton leaves
Result<std::vector<Violation>> playInteraction(GameCore& core, std::size_t playerIndex, const std::vector<InteractionStep>& steps);
Result<std::vector<Violation>> drawInteraction(GameCore& core, std::size_t playerIndex, const std::vector<InteractionStep>& steps);
Result<std::vector<Violation>> discardInteraction(GameCore& core, std::size_t playerIndex, const std::vector<InteractionStep>& steps);
Result<std::vector<Violation>> physicalInteraction(GameCore& core, std::size_t playerIndex, const std::vector<InteractionStep>& steps);

std::vector<ActionPath> getBuiltinActionPaths();

#endif // INTERACTIONS_HPP

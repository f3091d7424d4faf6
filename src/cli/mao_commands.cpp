#include "cli/mao_commands.hpp"

#include "automaton/automaton.hpp"
#include "automaton/interaction.hpp"
#include "cli/cli_dispatcher.hpp"
#include "config/game_config.hpp"
#include "event/violation.hpp"
#include "game/card.hpp"
#include "game/card_effects.hpp"
#include "game/game_core.hpp"
#include "game/player.hpp"
#include "game/stack.hpp"
#include "io/output.hpp"
#include "rule/rule_module.hpp"
#include "util/result.hpp"
#include "util/string_utils.hpp"

#include <cassert>
#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {
bool isConfigLoaded(const MaoContext& context) {
    return context.core != nullptr && context.config.has_value();
}

void printNotLoadedError() {
    std::cerr << "Error: Game settings not loaded. Please run \"load <file>\" first.\n";
}

void printNoGameError() {
    std::cerr << "Error: No game in progress. Please run \"new-game\" first.\n";
}

bool isGameStarted(const MaoContext& context) {
    return isConfigLoaded(context) && !context.core->getPlayers().empty();
}

void printError(const Error& error) {
    std::cerr << "Error: " << formatError(error) << "\n";
}

std::optional<std::size_t> parseIndex(const std::string& argument) {
    std::optional<int> value = parseInt(argument);
    if (!value || *value < 0) {
        std::cerr << "Error: \"" << argument << "\" is not a valid index.\n";
        return std::nullopt;
    }
    return static_cast<std::size_t>(*value);
}

void printViolations(const std::vector<Violation>& violations) {
    if (violations.empty()) {
        std::cout << "Done.\n";
        return;
    }

    for (const Violation& violation : violations) {
        std::cout << formatViolation(violation) << "\n";
    }
}

bool reportActionResult(const Result<std::vector<Violation>>& result) {
    if (result.isError()) {
        printError(result.getError());
        return false;
    }

    printViolations(result.getValue());
    return true;
}

std::string describeNodeState(const NodeState& state) {
    std::string description = getActionTokenName(state.step.token);
    if (state.isLeaf()) {
        description += " (" + state.rule.value_or("basic") + ")";
    }
    return description;
}

bool handleInteractionResult(MaoContext& context, const InteractionStep& step, const InteractionResult& result) {
    switch (result.type) {
        case InteractionResultType::NoInteractionFound:
            std::cerr << "Error: No interaction expects " << getActionTokenName(step.token) << " here.\n";
            return false;
        case InteractionResultType::AdvancedNextState: {
            std::vector<std::string> next;
            for (const NodeState& state : context.core->getAutomaton().getAvailableActions()) {
                next.push_back(describeNodeState(state));
            }
            std::cout << "Selected " << getActionTokenName(step.token) << ". Next: " << join(next, ", ") << "\n";
            return true;
        }
        case InteractionResultType::Candidates:
            context.pendingStep = step;
            std::cout << "Several interactions match, use \"choose <index>\":\n";
            for (std::size_t i = 0; i < result.candidates.size(); ++i) {
                std::cout << "  " << i << ": " << describeNodeState(result.candidates[i]) << "\n";
            }
            return true;
        case InteractionResultType::Leaf:
            return reportActionResult(context.core->executeInteraction(context.actingPlayer, result));
        default:
            assert(false);
            return false;
    }
}

bool feedStep(MaoContext& context, const InteractionStep& step) {
    if (!isGameStarted(context)) {
        printNoGameError();
        return false;
    }

    context.pendingStep = std::nullopt;
    InteractionResult result = context.core->getAutomaton().onAction(step);
    return handleInteractionResult(context, step, result);
}

bool feedIndexedStep(MaoContext& context, ActionToken token, const std::string& argument) {
    std::optional<std::size_t> index = parseIndex(argument);
    if (!index) {
        return false;
    }
    return feedStep(context, makeStep(token, *index));
}

bool handleLoad(MaoContext& context, const std::string& argument) {
    Result<GameConfig> configResult = loadGameConfig(argument);
    if (configResult.isError()) {
        printError(configResult.getError());
        return false;
    }

    Result<std::unique_ptr<GameCore>> coreResult = GameCore::fromConfig(configResult.getValue(), *context.loader);
    if (coreResult.isError()) {
        printError(coreResult.getError());
        return false;
    }

    context.config = configResult.getValue();
    context.core = std::move(coreResult.getValue());
    context.actingPlayer = 0;
    context.pendingStep = std::nullopt;

    std::cout << "Loaded " << context.core->getNumberOfRules() << " rule(s) from " << context.config->rulesDirectory.string() << ".\n";
    return true;
}

bool handleNewGame(MaoContext& context) {
    if (!isConfigLoaded(context)) {
        printNotLoadedError();
        return false;
    }

    Result<void> gameResult = context.core->initNewGame(context.config->players, context.config->cardsPerPlayer);
    if (gameResult.isError()) {
        printError(gameResult.getError());
        return false;
    }

    context.actingPlayer = context.core->getPlayerTurn();
    context.pendingStep = std::nullopt;
    std::cout << "New game started, " << context.core->getPlayers()[context.actingPlayer].getPseudo() << " plays first.\n";
    return true;
}

bool handleState(MaoContext& context) {
    if (!isGameStarted(context)) {
        printNoGameError();
        return false;
    }

    const GameCore& core = *context.core;
    const std::vector<Player>& players = core.getPlayers();

    std::cout << "Turn: " << players[core.getPlayerTurn()].getPseudo() << " (direction " << core.getDirection() << ")\n";

    std::cout << "Players:\n";
    for (std::size_t i = 0; i < players.size(); ++i) {
        std::cout << "  " << i << ": " << players[i].getPseudo() << ", " << players[i].getHand().size() << " card(s)";
        if (i == context.actingPlayer) {
            std::cout << " (acting)";
        }
        std::cout << "\n";
    }

    std::cout << "Hand of " << players[context.actingPlayer].getPseudo() << ":\n";
    const std::vector<Card>& hand = players[context.actingPlayer].getHand();
    for (std::size_t i = 0; i < hand.size(); ++i) {
        std::cout << "  " << i << ": " << getCardName(hand[i]) << "\n";
    }

    std::cout << "Stacks:\n";
    const std::vector<Stack>& stacks = core.getStacks();
    for (std::size_t i = 0; i < stacks.size(); ++i) {
        std::vector<std::string> typeNames;
        for (StackType type : stacks[i].getTypes()) {
            typeNames.push_back(getStackTypeName(type));
        }

        std::cout << "  " << i << ": " << join(typeNames, "/") << ", " << stacks[i].size() << " card(s)";
        const Card* topCard = stacks[i].getTopCard();
        if (stacks[i].isVisible() && topCard != nullptr) {
            std::cout << ", top: " << getCardName(*topCard);
        }
        std::cout << "\n";
    }

    std::vector<std::string> actions;
    for (const NodeState& state : core.getAutomaton().getAvailableActions()) {
        actions.push_back(describeNodeState(state));
    }
    std::cout << "Available interactions: " << join(actions, ", ") << "\n";
    return true;
}

bool handleSave(MaoContext& context, const std::string& argument) {
    if (!isGameStarted(context)) {
        printNoGameError();
        return false;
    }

    if (!outputSnapshotToJSON(*context.core, argument)) {
        std::cerr << "Error: Could not write " << argument << "\n";
        return false;
    }

    std::cout << "Saved game state to " << argument << ".\n";
    return true;
}

bool handleRules(MaoContext& context) {
    if (!isConfigLoaded(context)) {
        printNotLoadedError();
        return false;
    }

    for (std::size_t i = 0; i < context.core->getNumberOfRules(); ++i) {
        RuleData ruleData = context.core->getRuleData(i);
        std::cout << i << ": " << ruleData.name;
        if (ruleData.author) {
            std::cout << " by " << *ruleData.author;
        }
        if (context.core->isRuleActivated(i)) {
            std::cout << " [activated]";
        }
        std::cout << "\n";

        if (ruleData.description) {
            std::cout << "   " << *ruleData.description << "\n";
        }
    }
    return true;
}

bool handleEffects(MaoContext& context) {
    if (!isConfigLoaded(context)) {
        printNotLoadedError();
        return false;
    }

    for (const auto& [key, effects] : context.core->getSettings().cardEffects.getEntries()) {
        std::string keyName;
        if (key.value) {
            keyName = getCardValueName(*key.value);
        }
        if (key.type) {
            keyName += (keyName.empty() ? "" : " of ") + getCardTypeName(*key.type);
        }

        for (const CardEffect& effect : effects) {
            std::cout << keyName << ": " << describeCardEffect(effect);
            if (effect.sourceRule) {
                std::cout << " [" << *effect.sourceRule << "]";
            }
            std::cout << "\n";
        }
    }
    return true;
}

bool handleSetRuleActivation(MaoContext& context, const std::string& argument, bool activate) {
    if (!isConfigLoaded(context)) {
        printNotLoadedError();
        return false;
    }

    std::optional<std::size_t> index = parseIndex(argument);
    if (!index) {
        return false;
    }

    Result<void> result = activate ? context.core->activateRuleByIndex(*index) : context.core->deactivateRuleByIndex(*index);
    if (result.isError()) {
        printError(result.getError());
        return false;
    }

    std::cout << (activate ? "Activated " : "Deactivated ") << context.core->getRuleData(*index).name << ".\n";
    return true;
}

bool handleSetPlayer(MaoContext& context, const std::string& argument) {
    if (!isGameStarted(context)) {
        printNoGameError();
        return false;
    }

    std::optional<std::size_t> index = parseIndex(argument);
    if (!index) {
        return false;
    }

    if (*index >= context.core->getPlayers().size()) {
        std::cerr << "Error: There is no player " << *index << ".\n";
        return false;
    }

    // An interaction is never shared between two players
    context.actingPlayer = *index;
    context.pendingStep = std::nullopt;
    context.core->getAutomaton().reset();
    std::cout << "Acting as " << context.core->getPlayers()[*index].getPseudo() << ".\n";
    return true;
}

bool handlePlayable(MaoContext& context, const std::string& argument) {
    if (argument == "new") {
        return feedStep(context, makeStep(ActionToken::SelectPlayableStack));
    }
    return feedIndexedStep(context, ActionToken::SelectPlayableStack, argument);
}

bool handleChoose(MaoContext& context, const std::string& argument) {
    if (!isGameStarted(context)) {
        printNoGameError();
        return false;
    }

    if (!context.pendingStep) {
        std::cerr << "Error: There is nothing to choose.\n";
        return false;
    }

    std::optional<std::size_t> index = parseIndex(argument);
    if (!index) {
        return false;
    }

    InteractionStep step = *context.pendingStep;
    Result<InteractionResult> result = context.core->getAutomaton().onActionIndexed(step, *index);
    if (result.isError()) {
        printError(result.getError());
        return false;
    }

    context.pendingStep = std::nullopt;
    return handleInteractionResult(context, step, result.getValue());
}

bool handleCancel(MaoContext& context) {
    if (!isGameStarted(context)) {
        printNoGameError();
        return false;
    }

    context.pendingStep = std::nullopt;
    std::optional<NodeState> cancelled = context.core->getAutomaton().cancelLast();
    if (!cancelled) {
        std::cout << "Nothing to cancel.\n";
        return true;
    }

    std::cout << "Cancelled " << getActionTokenName(cancelled->step.token) << ".\n";
    return true;
}

bool handleSay(MaoContext& context, const std::string& argument) {
    if (!isGameStarted(context)) {
        printNoGameError();
        return false;
    }

    return reportActionResult(context.core->sayPhrase(context.actingPlayer, argument));
}
} // namespace

bool registerAllCommands(CliDispatcher& dispatcher, MaoContext& context) {
    bool allSuccess = true;

    allSuccess &= dispatcher.registerCommand(
        "load",
        "file",
        "Loads game settings from a .yml file and the rules of its rules directory.",
        [&context](const std::string& argument) { return handleLoad(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "new-game",
        "Deals a new game with the loaded settings.",
        [&context]() { return handleNewGame(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "state",
        "Prints the players, the hand of the acting player, the stacks and the available interactions.",
        [&context]() { return handleState(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "save",
        "file",
        "Writes the game state to a .json file.",
        [&context](const std::string& argument) { return handleSave(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "rules",
        "Lists the available rules.",
        [&context]() { return handleRules(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "effects",
        "Lists the card effects in play.",
        [&context]() { return handleEffects(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "activate",
        "index",
        "Activates a rule.",
        [&context](const std::string& argument) { return handleSetRuleActivation(context, argument, true); }
    );

    allSuccess &= dispatcher.registerCommand(
        "deactivate",
        "index",
        "Deactivates a rule.",
        [&context](const std::string& argument) { return handleSetRuleActivation(context, argument, false); }
    );

    allSuccess &= dispatcher.registerCommand(
        "player",
        "index",
        "Sets the player performing the next interactions.",
        [&context](const std::string& argument) { return handleSetPlayer(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "card",
        "index",
        "Selects a card in the hand of the acting player.",
        [&context](const std::string& argument) { return feedIndexedStep(context, ActionToken::SelectCard, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "target",
        "index",
        "Selects a player.",
        [&context](const std::string& argument) { return feedIndexedStep(context, ActionToken::SelectPlayer, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "playable",
        "index|new",
        "Selects a playable stack, or a new one.",
        [&context](const std::string& argument) { return handlePlayable(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "drawable",
        "index",
        "Selects a drawable stack.",
        [&context](const std::string& argument) { return feedIndexedStep(context, ActionToken::SelectDrawableStack, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "discardable",
        "index",
        "Selects a discardable stack.",
        [&context](const std::string& argument) { return feedIndexedStep(context, ActionToken::SelectDiscardableStack, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "rule",
        "index",
        "Selects a rule.",
        [&context](const std::string& argument) { return feedIndexedStep(context, ActionToken::SelectRule, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "do",
        "name",
        "Performs a named action.",
        [&context](const std::string& argument) { return feedStep(context, makeStep(ActionToken::DoAction, argument)); }
    );

    allSuccess &= dispatcher.registerCommand(
        "choose",
        "index",
        "Picks one of several matching interactions.",
        [&context](const std::string& argument) { return handleChoose(context, argument); }
    );

    allSuccess &= dispatcher.registerCommand(
        "cancel",
        "Cancels the last selection.",
        [&context]() { return handleCancel(context); }
    );

    allSuccess &= dispatcher.registerCommand(
        "say",
        "phrase",
        "Says a phrase out loud.",
        [&context](const std::string& argument) { return handleSay(context, argument); }
    );

    return allSuccess;
}

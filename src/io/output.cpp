#include "io/output.hpp"

#include "event/occurrence.hpp"
#include "game/card.hpp"
#include "game/game_core.hpp"
#include "game/player.hpp"
#include "game/stack.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::ordered_json;

namespace {
json buildJSONCards(const std::vector<Card>& cards) {
    json j = json::array();
    for (const Card& card : cards) {
        j.push_back(getCardName(card));
    }
    return j;
}

json buildJSONStack(const Stack& stack) {
    json j;

    j["Types"] = json::array();
    for (StackType type : stack.getTypes()) {
        j["Types"].push_back(getStackTypeName(type));
    }

    j["Visible"] = stack.isVisible();
    j["Card Count"] = stack.size();
    if (stack.isVisible()) {
        j["Cards"] = buildJSONCards(stack.getCards());
    }
    return j;
}

json buildJSONEvent(const Occurrence& event) {
    json j;
    j["Type"] = getOccurrenceTypeName(event.getType());

    std::optional<std::size_t> playerIndex = event.getPlayerIndex();
    if (playerIndex) {
        j["Player"] = *playerIndex;
    }

    switch (event.getType()) {
        case OccurrenceType::CardPlayed:
        case OccurrenceType::CardDrawn:
        case OccurrenceType::CardDiscarded:
            j["Card"] = getCardName(event.getCardEvent().card);
            break;
        case OccurrenceType::PlayerSaid:
        case OccurrenceType::PhysicalAction:
            j["Text"] = event.getText();
            break;
        default:
            break;
    }
    return j;
}
} // namespace

json buildSnapshotJSON(const GameCore& core) {
    json j;
    j["Player Turn"] = core.getPlayerTurn();
    j["Direction"] = core.getDirection();

    auto& players = j["Players"];
    players = json::array();
    for (const Player& player : core.getPlayers()) {
        players.push_back(json{
            { "Pseudo", player.getPseudo() },
            { "Hand", buildJSONCards(player.getHand()) }
        });
    }

    auto& stacks = j["Stacks"];
    stacks = json::array();
    for (const Stack& stack : core.getStacks()) {
        stacks.push_back(buildJSONStack(stack));
    }

    auto& rules = j["Rules"];
    rules = json::array();
    for (std::size_t i = 0; i < core.getNumberOfRules(); ++i) {
        rules.push_back(json{
            { "Name", core.getRuleData(i).name },
            { "Activated", core.isRuleActivated(i) }
        });
    }

    auto& events = j["Turn Events"];
    events = json::array();
    for (const Occurrence& event : core.getPlayerEvents()) {
        events.push_back(buildJSONEvent(event));
    }

    return j;
}

bool outputSnapshotToJSON(const GameCore& core, const std::filesystem::path& filePath) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        return false;
    }

    file << buildSnapshotJSON(core).dump(4) << std::endl;
    return file.good();
}

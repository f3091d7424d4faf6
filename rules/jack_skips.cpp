#include "event/occurrence.hpp"
#include "event/verdict.hpp"
#include "event/violation.hpp"
#include "game/card.hpp"
#include "game/card_effects.hpp"
#include "game/game_core.hpp"
#include "rule/rule_module.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace {
const std::string RuleName = "Jack Skips";
constexpr int JackNumber = 11;

// A legally played jack skips the next player
class JackSkips : public IRuleModule {
public:
    Verdict onEvent(const Occurrence& occurrence, GameCore& core) override {
        if (occurrence.getType() != OccurrenceType::CardPlayed) {
            return Verdict::ignored();
        }

        const CardEvent& cardEvent = occurrence.getCardEvent();
        if (cardEvent.card.value != makeNumberValue(JackNumber)) {
            return Verdict::ignored();
        }

        // Illegal plays keep the default handling
        if (core.canPlay(cardEvent.playerIndex, cardEvent.card, cardEvent.stackIndex) != LegalityResult::CanPlay) {
            return Verdict::ignored();
        }

        return Verdict::executeAfterTurnChange(RuleName, [](GameCore& game, std::size_t /*playerIndex*/) -> Result<void> {
            nlohmann::ordered_json& storage = game.getRuleStorage(RuleName);
            int skips = storage.contains("skips") ? storage["skips"].get<int>() : 0;
            storage["skips"] = skips + 1;

            game.updateTurn(makeTurnUpdate(TurnUpdaterKind::Step, 1));
            return {};
        });
    }

    std::string getVersion() const override {
        return std::string{ MaoVersion };
    }

    RuleData getRuleData() const override {
        return RuleData{
            .name = RuleName,
            .author = std::nullopt,
            .description = "Playing a jack skips the next player.",
            .automatonPaths = {},
            .cardEffects = {}
        };
    }
};
} // namespace

extern "C" IRuleModule* mao_create_rule_module() {
    return new JackSkips();
}

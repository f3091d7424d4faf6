#ifndef RULE_MODULE_HPP
#define RULE_MODULE_HPP

#include "automaton/automaton.hpp"
#include "event/occurrence.hpp"
#include "event/verdict.hpp"
#include "game/card_effects.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

class GameCore;

// Modules reporting another version are rejected at load time
constexpr std::string_view MaoVersion = "1.0.0";

struct RuleData {
    std::string name;
    std::optional<std::string> author;
    std::optional<std::string> description;
    std::vector<ActionPath> automatonPaths;
    CardEffectsTable cardEffects;
};

class IRuleModule {
public:
    virtual ~IRuleModule() = default;

    virtual Verdict onEvent(const Occurrence& occurrence, GameCore& core) = 0;
    virtual std::string getVersion() const = 0;
    virtual RuleData getRuleData() const = 0;

    // Undo hook run on deactivation, after the declared card effects are removed
    virtual Result<void> removeCardEffects(GameCore& /*core*/) {
        return {};
    }
};

// Shared objects export this symbol with C linkage
using CreateRuleModuleFunction = IRuleModule* (*)();
constexpr const char* CreateRuleModuleSymbol = "mao_create_rule_module";

#endif // RULE_MODULE_HPP

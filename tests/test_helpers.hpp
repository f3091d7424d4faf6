#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "event/occurrence.hpp"
#include "event/verdict.hpp"
#include "game/card.hpp"
#include "game/game_core.hpp"
#include "game/game_settings.hpp"
#include "game/player.hpp"
#include "game/stack.hpp"
#include "rule/rule_loader.hpp"
#include "rule/rule_module.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

// Rule module whose answers are provided by the test
class ScriptedRule : public IRuleModule {
public:
    using Handler = std::function<Verdict(const Occurrence& occurrence, GameCore& core)>;

    ScriptedRule(RuleData ruleData, Handler handler) : m_ruleData{ std::move(ruleData) }, m_handler{ std::move(handler) }, m_version{ MaoVersion } {}

    Verdict onEvent(const Occurrence& occurrence, GameCore& core) override {
        return m_handler ? m_handler(occurrence, core) : Verdict::ignored();
    }

    std::string getVersion() const override {
        return m_version;
    }

    RuleData getRuleData() const override {
        return m_ruleData;
    }

    void setVersion(const std::string& version) {
        m_version = version;
    }

private:
    RuleData m_ruleData;
    Handler m_handler;
    std::string m_version;
};

inline RuleData makeRuleData(const std::string& name) {
    return RuleData{ .name = name, .author = std::nullopt, .description = std::nullopt, .automatonPaths = {}, .cardEffects = {} };
}

inline LoadedRule makeScriptedRule(const std::string& name, ScriptedRule::Handler handler = {}) {
    return makeLoadedRule(std::make_unique<ScriptedRule>(makeRuleData(name), std::move(handler)));
}

inline LoadedRule makeScriptedRule(RuleData ruleData, ScriptedRule::Handler handler = {}) {
    return makeLoadedRule(std::make_unique<ScriptedRule>(std::move(ruleData), std::move(handler)));
}

inline std::unique_ptr<GameCore> makeGameCore(std::vector<LoadedRule> rules = {}, GameSettings settings = {}) {
    if (!settings.seed) {
        settings.seed = 42;
    }
    return std::make_unique<GameCore>(std::move(rules), std::move(settings));
}

// Stack 0 is the hidden draw pile, 1 the playable stack, 2 the discardable stack
inline void setUpTable(GameCore& core, const std::vector<std::vector<Card>>& hands, const std::vector<Card>& drawPile, const Card& topCard, std::size_t playerTurn = 0) {
    static const std::vector<std::string> Pseudos = { "alice", "bob", "carol", "dave" };

    std::vector<Player>& players = core.getPlayers();
    players.clear();
    for (std::size_t i = 0; i < hands.size(); ++i) {
        players.emplace_back(Pseudos[i % Pseudos.size()], hands[i]);
    }

    core.getStacks() = {
        Stack(drawPile, false, { StackType::Drawable }),
        Stack({ topCard }, true, { StackType::Playable }),
        Stack({}, true, { StackType::Discardable })
    };

    core.resetTurn(playerTurn);
}

inline std::size_t countOccurrences(const std::vector<OccurrenceType>& seen, OccurrenceType type) {
    std::size_t count = 0;
    for (OccurrenceType occurrenceType : seen) {
        if (occurrenceType == type) {
            ++count;
        }
    }
    return count;
}

// Rule that records every occurrence it sees and ignores all of them
inline LoadedRule makeRecordingRule(const std::string& name, std::vector<OccurrenceType>& seen) {
    return makeScriptedRule(name, [&seen](const Occurrence& occurrence, GameCore&) {
        seen.push_back(occurrence.getType());
        return Verdict::ignored();
    });
}

// Loader handing out scripted modules by file name, without touching any shared object
class FakeRuleLoader : public IRuleLoader {
public:
    using Factory = std::function<std::unique_ptr<IRuleModule>()>;

    void addModule(const std::string& fileName, Factory factory) {
        m_factories[fileName] = std::move(factory);
    }

    Result<LoadedRule> loadRule(const std::filesystem::path& path) override {
        m_loadedPaths.push_back(path);

        auto it = m_factories.find(path.filename().string());
        if (it == m_factories.end()) {
            return Error{ ErrorCode::RuleLoading, path.string() + " does not export " + CreateRuleModuleSymbol };
        }

        LoadedRule rule = makeLoadedRule(it->second());
        rule.path = path;
        return rule;
    }

    const std::vector<std::filesystem::path>& getLoadedPaths() const {
        return m_loadedPaths;
    }

private:
    std::map<std::string, Factory> m_factories;
    std::vector<std::filesystem::path> m_loadedPaths;
};

// Directory removed with everything it contains when the test ends
class TemporaryDirectory {
public:
    TemporaryDirectory() {
        std::random_device device;
        m_path = std::filesystem::temp_directory_path() / ("mao_tests_" + std::to_string(device()) + "_" + std::to_string(device()));
        std::filesystem::create_directories(m_path);
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    ~TemporaryDirectory() {
        std::error_code errorCode;
        std::filesystem::remove_all(m_path, errorCode);
    }

    const std::filesystem::path& getPath() const {
        return m_path;
    }

    std::filesystem::path writeFile(const std::string& name, const std::string& contents) const {
        std::filesystem::path filePath = m_path / name;
        std::ofstream file(filePath);
        file << contents;
        return filePath;
    }

private:
    std::filesystem::path m_path;
};

#endif // TEST_HELPERS_HPP

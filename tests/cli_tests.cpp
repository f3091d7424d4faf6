#include <gtest/gtest.h>

#include "automaton/automaton.hpp"
#include "automaton/interaction.hpp"
#include "cli/cli_dispatcher.hpp"
#include "cli/mao_commands.hpp"
#include "event/occurrence.hpp"
#include "event/violation.hpp"
#include "game/game_core.hpp"
#include "rule/rule_module.hpp"
#include "test_helpers.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {
std::size_t shownCards = 0;

Result<std::vector<Violation>> showCardInteraction(GameCore&, std::size_t, const std::vector<InteractionStep>&) {
    ++shownCards;
    return std::vector<Violation>{};
}

class CliTest : public ::testing::Test {
protected:
    CliTest() : m_dispatcher("Mao", Version{ 1, 0, 0 }) {}

    void SetUp() override {
        shownCards = 0;
        std::filesystem::create_directory(m_directory.getPath() / "rules");
        m_directory.writeFile("rules/show_card.so", "");
        m_settingsPath = m_directory.writeFile("settings.yml",
            "rules-directory: rules\n"
            "players: [alice, bob]\n"
            "cards-per-player: 3\n"
            "seed: 3\n"
            "card-effects:\n"
            "  value:\n"
            "    7:\n"
            "      - say: hello\n"
        );

        auto loader = std::make_unique<FakeRuleLoader>();
        loader->addModule("show_card.so", []() -> std::unique_ptr<IRuleModule> {
            RuleData ruleData = makeRuleData("Show Card");
            ruleData.description = "Shows a card to everyone.";
            ruleData.automatonPaths = { { makeLeaf(ActionToken::SelectCard, showCardInteraction) } };
            return std::make_unique<ScriptedRule>(ruleData, ScriptedRule::Handler{});
        });
        m_context.loader = std::move(loader);

        ASSERT_TRUE(registerAllCommands(m_dispatcher, m_context));
    }

    void loadAndStart() {
        ASSERT_TRUE(m_dispatcher.execute("load " + m_settingsPath.string()));
        ASSERT_TRUE(m_dispatcher.execute("new-game"));
    }

    std::string executeCapturingOutput(const std::string& line, bool expected = true) {
        ::testing::internal::CaptureStdout();
        bool result = m_dispatcher.execute(line);
        std::string output = ::testing::internal::GetCapturedStdout();
        EXPECT_EQ(result, expected) << line;
        return output;
    }

    TemporaryDirectory m_directory;
    std::filesystem::path m_settingsPath;
    CliDispatcher m_dispatcher;
    MaoContext m_context;
};
} // namespace

TEST_F(CliTest, CommandsNeedLoadedGame) {
    EXPECT_FALSE(m_dispatcher.execute("new-game"));
    EXPECT_FALSE(m_dispatcher.execute("rules"));
    EXPECT_FALSE(m_dispatcher.execute("state"));
    EXPECT_FALSE(m_dispatcher.execute("card 0"));
    EXPECT_FALSE(m_dispatcher.execute("say hello"));
}

TEST_F(CliTest, MalformedLinesAreRejected) {
    EXPECT_FALSE(m_dispatcher.execute(""));
    EXPECT_FALSE(m_dispatcher.execute("dance"));
    EXPECT_FALSE(m_dispatcher.execute("rules now"));
    EXPECT_FALSE(m_dispatcher.execute("card"));

    loadAndStart();
    EXPECT_FALSE(m_dispatcher.execute("card first"));
    EXPECT_FALSE(m_dispatcher.execute("player -1"));
    EXPECT_FALSE(m_dispatcher.execute("player 5"));
    EXPECT_FALSE(m_dispatcher.execute("choose 0"));
}

TEST_F(CliTest, LoadFailureKeepsPreviousState) {
    EXPECT_FALSE(m_dispatcher.execute("load " + (m_directory.getPath() / "missing.yml").string()));
    EXPECT_TRUE(m_context.core == nullptr);

    std::filesystem::path badRules = m_directory.writeFile("bad.yml", "rules-directory: nowhere\n");
    EXPECT_FALSE(m_dispatcher.execute("load " + badRules.string()));
    EXPECT_TRUE(m_context.core == nullptr);
}

TEST_F(CliTest, LoadsRulesAndStartsGame) {
    std::string loadOutput = executeCapturingOutput("load " + m_settingsPath.string());
    EXPECT_NE(loadOutput.find("Loaded 1 rule(s)"), std::string::npos);
    ASSERT_TRUE(m_context.core != nullptr);
    EXPECT_EQ(m_context.config->players, (std::vector<std::string>{ "alice", "bob" }));

    std::string rulesOutput = executeCapturingOutput("rules");
    EXPECT_NE(rulesOutput.find("0: Show Card"), std::string::npos);
    EXPECT_NE(rulesOutput.find("Shows a card to everyone."), std::string::npos);

    std::string effectsOutput = executeCapturingOutput("effects");
    EXPECT_NE(effectsOutput.find("7: say \"hello\""), std::string::npos);

    ASSERT_TRUE(m_dispatcher.execute("new-game"));
    EXPECT_EQ(m_context.core->getPlayers().size(), 2);
    EXPECT_EQ(m_context.actingPlayer, m_context.core->getPlayerTurn());

    std::string stateOutput = executeCapturingOutput("state");
    EXPECT_NE(stateOutput.find("Hand of bob"), std::string::npos);
    EXPECT_NE(stateOutput.find("3 card(s) (acting)"), std::string::npos);
}

TEST_F(CliTest, ActivationCommands) {
    ASSERT_TRUE(m_dispatcher.execute("load " + m_settingsPath.string()));

    EXPECT_TRUE(m_dispatcher.execute("activate 0"));
    EXPECT_TRUE(m_context.core->isRuleActivated(0));
    EXPECT_FALSE(m_dispatcher.execute("activate 0"));
    EXPECT_FALSE(m_dispatcher.execute("activate 4"));

    EXPECT_TRUE(m_dispatcher.execute("deactivate 0"));
    EXPECT_FALSE(m_context.core->isRuleActivated(0));
    EXPECT_FALSE(m_dispatcher.execute("deactivate 0"));
}

TEST_F(CliTest, DrawingThroughSelections) {
    loadAndStart();
    std::size_t drawer = m_context.actingPlayer;

    EXPECT_TRUE(m_dispatcher.execute("drawable 0"));
    EXPECT_EQ(m_context.core->getPlayers()[drawer].getHand().size(), 4);
    EXPECT_NE(m_context.core->getPlayerTurn(), drawer);
    EXPECT_TRUE(m_context.core->getAutomaton().isAtRoot());
}

TEST_F(CliTest, CancelUndoesSelection) {
    loadAndStart();

    EXPECT_TRUE(m_dispatcher.execute("card 0"));
    EXPECT_FALSE(m_context.core->getAutomaton().isAtRoot());

    std::string output = executeCapturingOutput("cancel");
    EXPECT_NE(output.find("Cancelled SelectCard"), std::string::npos);
    EXPECT_TRUE(m_context.core->getAutomaton().isAtRoot());

    std::string nothing = executeCapturingOutput("cancel");
    EXPECT_NE(nothing.find("Nothing to cancel"), std::string::npos);
}

TEST_F(CliTest, AmbiguousSelectionNeedsChoice) {
    loadAndStart();
    ASSERT_TRUE(m_dispatcher.execute("activate 0"));

    std::string output = executeCapturingOutput("card 1");
    EXPECT_NE(output.find("choose"), std::string::npos);
    ASSERT_TRUE(m_context.pendingStep.has_value());

    EXPECT_FALSE(m_dispatcher.execute("choose 9"));
    EXPECT_TRUE(m_dispatcher.execute("choose 0"));
    EXPECT_EQ(shownCards, 1);
    EXPECT_FALSE(m_context.pendingStep.has_value());

    // The branch leads on to the built-in play and discard leaves
    ASSERT_TRUE(m_dispatcher.execute("card 1"));
    EXPECT_TRUE(m_dispatcher.execute("choose 1"));
    EXPECT_FALSE(m_context.core->getAutomaton().isAtRoot());
    EXPECT_TRUE(m_dispatcher.execute("discardable 2"));
    EXPECT_EQ(m_context.core->getPlayers()[m_context.actingPlayer].getHand().size(), 2);
    EXPECT_EQ(m_context.core->getStacks()[2].size(), 1);
}

TEST_F(CliTest, SayAndPhysicalActionsAreLogged) {
    loadAndStart();

    EXPECT_TRUE(m_dispatcher.execute("say   have a nice day  "));
    EXPECT_TRUE(m_dispatcher.execute("target 0"));
    EXPECT_TRUE(m_dispatcher.execute("do knock"));

    const std::vector<Occurrence>& events = m_context.core->getPlayerEvents();
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].getType(), OccurrenceType::PlayerSaid);
    EXPECT_EQ(events[0].getText(), "have a nice day");
    EXPECT_EQ(events[0].getPlayerIndex(), m_context.actingPlayer);
    EXPECT_EQ(events[1].getType(), OccurrenceType::PhysicalAction);
    EXPECT_EQ(events[1].getText(), "knock");
}

TEST_F(CliTest, PlayerSwitchResetsSelection) {
    loadAndStart();

    ASSERT_TRUE(m_dispatcher.execute("card 0"));
    EXPECT_TRUE(m_dispatcher.execute("player 0"));
    EXPECT_EQ(m_context.actingPlayer, 0);
    EXPECT_TRUE(m_context.core->getAutomaton().isAtRoot());
}

TEST_F(CliTest, SavesSnapshot) {
    loadAndStart();
    std::filesystem::path snapshotPath = m_directory.getPath() / "state.json";

    ASSERT_TRUE(m_dispatcher.execute("save " + snapshotPath.string()));

    std::ifstream file(snapshotPath);
    ASSERT_TRUE(file.is_open());
    nlohmann::json snapshot = nlohmann::json::parse(file);

    EXPECT_EQ(snapshot["Player Turn"], m_context.core->getPlayerTurn());
    ASSERT_EQ(snapshot["Players"].size(), 2);
    EXPECT_EQ(snapshot["Players"][0]["Pseudo"], "alice");
    EXPECT_EQ(snapshot["Players"][0]["Hand"].size(), 3);
    ASSERT_EQ(snapshot["Stacks"].size(), 3);
    EXPECT_FALSE(snapshot["Stacks"][0].contains("Cards"));
    EXPECT_EQ(snapshot["Stacks"][1]["Cards"].size(), 1);
    ASSERT_EQ(snapshot["Rules"].size(), 1);
    EXPECT_EQ(snapshot["Rules"][0]["Name"], "Show Card");
    EXPECT_EQ(snapshot["Rules"][0]["Activated"], false);
}

TEST(CliDispatcherTest, RunStopsOnExitOrEndOfInput) {
    CliDispatcher dispatcher("Mao", Version{ 1, 0, 0 });
    std::vector<std::string> received;
    ASSERT_TRUE(dispatcher.registerCommand("echo", "text", "Echoes its argument.", [&received](const std::string& argument) {
        received.push_back(argument);
        return true;
    }));
    EXPECT_FALSE(dispatcher.registerCommand("echo", "Duplicate.", []() { return true; }));
    EXPECT_FALSE(dispatcher.registerCommand("two words", "Invalid.", []() { return true; }));

    std::istringstream input("echo one\necho two words\nexit\necho three\n");
    ::testing::internal::CaptureStdout();
    dispatcher.run(input);
    ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(received, (std::vector<std::string>{ "one", "two words" }));
    EXPECT_FALSE(dispatcher.isRunning());

    std::istringstream shortInput("echo four");
    ::testing::internal::CaptureStdout();
    dispatcher.run(shortInput);
    ::testing::internal::GetCapturedStdout();
    EXPECT_EQ(received.back(), "four");
    EXPECT_FALSE(dispatcher.isRunning());
}

#ifndef AUTOMATON_HPP
#define AUTOMATON_HPP

#include "automaton/interaction.hpp"
#include "event/violation.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

class GameCore;

using InteractionHandler = Result<std::vector<Violation>> (*)(GameCore& core, std::size_t playerIndex, const std::vector<InteractionStep>& steps);

// Template of an automaton node. Nodes with a handler are leaves, the others are branches.
struct NodeState {
    InteractionStep step;
    std::optional<std::string> rule;
    InteractionHandler handler = nullptr;

    bool isLeaf() const {
        return handler != nullptr;
    }
};

using ActionPath = std::vector<NodeState>;

NodeState makeBranch(ActionToken token);
NodeState makeLeaf(ActionToken token, InteractionHandler handler, const std::optional<std::string>& rule = std::nullopt);

enum class InteractionResultType : std::uint8_t {
    NoInteractionFound,
    AdvancedNextState,
    Candidates,
    Leaf
};

struct InteractionResult {
    InteractionResultType type;

    // Candidates: leaves first, branches last
    std::vector<NodeState> candidates;

    // Leaf: the full step sequence from the root, and what to execute
    std::vector<InteractionStep> steps;
    InteractionHandler handler = nullptr;
    std::optional<std::string> rule;
};

class Automaton {
public:
    Automaton();
    explicit Automaton(const std::vector<ActionPath>& paths);

    void insert(ActionPath path);
    void extend(const std::vector<ActionPath>& paths);
    void removePaths(const std::vector<ActionPath>& paths);

    InteractionResult onAction(const InteractionStep& step);
    Result<InteractionResult> onActionIndexed(const InteractionStep& step, std::size_t index);
    std::optional<NodeState> cancelLast();
    bool pathExists(const std::vector<ActionToken>& path) const;
    void reset();

    bool isAtRoot() const;
    std::vector<InteractionStep> getExecutedSteps() const;
    std::vector<NodeState> getAvailableActions() const;
    std::size_t getNumberOfLiveNodes() const;

    bool operator==(const Automaton& other) const;

private:
    struct AutomatonNode {
        NodeState state;
        std::size_t parent;
        std::vector<std::size_t> children;
        bool removed;
    };

    static constexpr std::size_t RootIndex = 0;

    std::size_t createNode(const NodeState& state, std::size_t parentIndex);
    void removeNode(std::size_t nodeIndex);
    std::vector<std::size_t> findMatchingChildren(std::size_t nodeIndex, ActionToken token) const;
    std::optional<std::size_t> findBranchChild(std::size_t nodeIndex, ActionToken token) const;
    std::optional<std::size_t> findLeafChild(std::size_t nodeIndex, const NodeState& leaf) const;
    InteractionResult resolveNode(std::size_t nodeIndex, const InteractionStep& step);
    bool areSubtreesEqual(std::size_t nodeIndex, const Automaton& other, std::size_t otherNodeIndex) const;

    std::vector<AutomatonNode> m_nodes;
    std::size_t m_currentState;
};

#endif // AUTOMATON_HPP

#include "automaton/automaton.hpp"

#include "automaton/interaction.hpp"
#include "util/result.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace {
void validatePath(const ActionPath& path) {
    if (path.empty()) {
        throw std::invalid_argument("Automaton path must not be empty");
    }

    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        if (path[i].isLeaf()) {
            throw std::invalid_argument("Only the last step of an automaton path can have a handler");
        }
    }

    if (!path.back().isLeaf()) {
        throw std::invalid_argument("The last step of an automaton path must have a handler");
    }
}

// Rule tags are only meaningful on leaves
void clearRuleTags(ActionPath& path) {
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        path[i].rule = std::nullopt;
    }
}

std::string describeLeaf(const NodeState& leaf) {
    return getActionTokenName(leaf.step.token) + " (rule: " + leaf.rule.value_or("none") + ")";
}
} // namespace

NodeState makeBranch(ActionToken token) {
    return NodeState{ .step = makeStep(token), .rule = std::nullopt, .handler = nullptr };
}

NodeState makeLeaf(ActionToken token, InteractionHandler handler, const std::optional<std::string>& rule) {
    return NodeState{ .step = makeStep(token), .rule = rule, .handler = handler };
}

Automaton::Automaton() : m_currentState{ RootIndex } {
    // The root is synthetic, its token is never matched
    m_nodes.push_back(AutomatonNode{
        .state = makeBranch(ActionToken::SelectCard),
        .parent = RootIndex,
        .children = {},
        .removed = false
    });
}

Automaton::Automaton(const std::vector<ActionPath>& paths) : Automaton() {
    extend(paths);
}

std::size_t Automaton::createNode(const NodeState& state, std::size_t parentIndex) {
    assert(parentIndex < m_nodes.size());

    AutomatonNode node{
        .state = state,
        .parent = parentIndex,
        .children = {},
        .removed = false
    };
    node.state.step.payload = std::nullopt;

    std::size_t nodeIndex = m_nodes.size();
    m_nodes.push_back(std::move(node));
    m_nodes[parentIndex].children.push_back(nodeIndex);
    return nodeIndex;
}

void Automaton::removeNode(std::size_t nodeIndex) {
    assert(nodeIndex != RootIndex);
    assert(m_nodes[nodeIndex].children.empty());

    AutomatonNode& node = m_nodes[nodeIndex];
    std::vector<std::size_t>& siblings = m_nodes[node.parent].children;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), nodeIndex), siblings.end());
    node.removed = true;

    if (m_currentState == nodeIndex) {
        reset();
    }
}

void Automaton::insert(ActionPath path) {
    validatePath(path);
    clearRuleTags(path);

    std::size_t parentIndex = RootIndex;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        std::optional<std::size_t> branchIndex = findBranchChild(parentIndex, path[i].step.token);
        parentIndex = branchIndex ? *branchIndex : createNode(path[i], parentIndex);
    }

    const NodeState& leaf = path.back();
    if (findLeafChild(parentIndex, leaf)) {
        throw std::logic_error("Automaton already contains the leaf " + describeLeaf(leaf));
    }
    createNode(leaf, parentIndex);
}

void Automaton::extend(const std::vector<ActionPath>& paths) {
    for (const ActionPath& path : paths) {
        insert(path);
    }
}

void Automaton::removePaths(const std::vector<ActionPath>& paths) {
    for (ActionPath path : paths) {
        if (path.empty() || !path.back().isLeaf()) {
            continue;
        }
        clearRuleTags(path);

        // Resolve the whole chain before deleting anything
        std::optional<std::size_t> nodeIndex = RootIndex;
        for (std::size_t i = 0; i + 1 < path.size() && nodeIndex; ++i) {
            nodeIndex = findBranchChild(*nodeIndex, path[i].step.token);
        }
        if (!nodeIndex) {
            continue;
        }
        nodeIndex = findLeafChild(*nodeIndex, path.back());
        if (!nodeIndex) {
            continue;
        }

        // Shared branches still used by other paths keep their children
        std::size_t currentIndex = *nodeIndex;
        while (currentIndex != RootIndex && m_nodes[currentIndex].children.empty()) {
            std::size_t parentIndex = m_nodes[currentIndex].parent;
            removeNode(currentIndex);
            currentIndex = parentIndex;
        }
    }
}

std::vector<std::size_t> Automaton::findMatchingChildren(std::size_t nodeIndex, ActionToken token) const {
    std::vector<std::size_t> matches;
    for (std::size_t childIndex : m_nodes[nodeIndex].children) {
        if (m_nodes[childIndex].state.step.token == token) {
            matches.push_back(childIndex);
        }
    }
    return matches;
}

std::optional<std::size_t> Automaton::findBranchChild(std::size_t nodeIndex, ActionToken token) const {
    for (std::size_t childIndex : m_nodes[nodeIndex].children) {
        const NodeState& child = m_nodes[childIndex].state;
        if (!child.isLeaf() && child.step.token == token) {
            return childIndex;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> Automaton::findLeafChild(std::size_t nodeIndex, const NodeState& leaf) const {
    for (std::size_t childIndex : m_nodes[nodeIndex].children) {
        const NodeState& child = m_nodes[childIndex].state;
        if (child.isLeaf() && child.step.token == leaf.step.token && child.rule == leaf.rule) {
            return childIndex;
        }
    }
    return std::nullopt;
}

InteractionResult Automaton::resolveNode(std::size_t nodeIndex, const InteractionStep& step) {
    AutomatonNode& node = m_nodes[nodeIndex];

    if (node.state.isLeaf()) {
        std::vector<InteractionStep> steps = getExecutedSteps();
        steps.push_back(step);

        InteractionResult result{
            .type = InteractionResultType::Leaf,
            .candidates = {},
            .steps = std::move(steps),
            .handler = node.state.handler,
            .rule = node.state.rule
        };
        reset();
        return result;
    }

    node.state.step.payload = step.payload;
    m_currentState = nodeIndex;
    return InteractionResult{ .type = InteractionResultType::AdvancedNextState };
}

InteractionResult Automaton::onAction(const InteractionStep& step) {
    std::vector<std::size_t> matches = findMatchingChildren(m_currentState, step.token);

    if (matches.empty()) {
        return InteractionResult{ .type = InteractionResultType::NoInteractionFound };
    }

    if (matches.size() == 1) {
        return resolveNode(matches[0], step);
    }

    // Leaves can be executed right away, so they are listed before branches
    std::stable_partition(matches.begin(), matches.end(), [this](std::size_t index) {
        return m_nodes[index].state.isLeaf();
    });

    InteractionResult result{ .type = InteractionResultType::Candidates };
    for (std::size_t index : matches) {
        result.candidates.push_back(m_nodes[index].state);
    }
    return result;
}

Result<InteractionResult> Automaton::onActionIndexed(const InteractionStep& step, std::size_t index) {
    std::vector<std::size_t> matches = findMatchingChildren(m_currentState, step.token);
    if (matches.size() <= 1) {
        return Error{ ErrorCode::InvalidDisambiguationIndex, "Index " + std::to_string(index) + " was given but the step does not lead to multiple nodes" };
    }

    std::stable_partition(matches.begin(), matches.end(), [this](std::size_t nodeIndex) {
        return m_nodes[nodeIndex].state.isLeaf();
    });

    if (index >= matches.size()) {
        return Error{
            ErrorCode::InvalidDisambiguationIndex,
            "Index " + std::to_string(index) + " is out of range, only " + std::to_string(matches.size()) + " candidates are available"
        };
    }

    return resolveNode(matches[index], step);
}

std::optional<NodeState> Automaton::cancelLast() {
    if (m_currentState == RootIndex) {
        return std::nullopt;
    }

    AutomatonNode& node = m_nodes[m_currentState];
    node.state.step.payload = std::nullopt;
    m_currentState = node.parent;
    return node.state;
}

bool Automaton::pathExists(const std::vector<ActionToken>& path) const {
    std::size_t nodeIndex = m_currentState;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        std::optional<std::size_t> childIndex = findBranchChild(nodeIndex, path[i]);
        if (!childIndex) {
            return false;
        }
        nodeIndex = *childIndex;
    }
    return true;
}

void Automaton::reset() {
    m_currentState = RootIndex;
}

bool Automaton::isAtRoot() const {
    return m_currentState == RootIndex;
}

std::vector<InteractionStep> Automaton::getExecutedSteps() const {
    std::vector<InteractionStep> steps;
    for (std::size_t index = m_currentState; index != RootIndex; index = m_nodes[index].parent) {
        steps.push_back(m_nodes[index].state.step);
    }
    std::reverse(steps.begin(), steps.end());
    return steps;
}

std::vector<NodeState> Automaton::getAvailableActions() const {
    std::vector<NodeState> actions;
    for (std::size_t childIndex : m_nodes[m_currentState].children) {
        actions.push_back(m_nodes[childIndex].state);
    }
    return actions;
}

std::size_t Automaton::getNumberOfLiveNodes() const {
    return static_cast<std::size_t>(std::count_if(m_nodes.begin(), m_nodes.end(), [](const AutomatonNode& node) {
        return !node.removed;
    }));
}

bool Automaton::areSubtreesEqual(std::size_t nodeIndex, const Automaton& other, std::size_t otherNodeIndex) const {
    std::vector<std::size_t> children = m_nodes[nodeIndex].children;
    std::vector<std::size_t> otherChildren = other.m_nodes[otherNodeIndex].children;
    if (children.size() != otherChildren.size()) {
        return false;
    }

    // Branches are unique per token and leaves per (token, rule), so this order is total
    auto sortChildren = [](std::vector<std::size_t>& indices, const std::vector<AutomatonNode>& nodes) {
        std::sort(indices.begin(), indices.end(), [&nodes](std::size_t a, std::size_t b) {
            const NodeState& left = nodes[a].state;
            const NodeState& right = nodes[b].state;
            return std::make_tuple(left.isLeaf(), left.step.token, left.rule) < std::make_tuple(right.isLeaf(), right.step.token, right.rule);
        });
    };
    sortChildren(children, m_nodes);
    sortChildren(otherChildren, other.m_nodes);

    for (std::size_t i = 0; i < children.size(); ++i) {
        const NodeState& state = m_nodes[children[i]].state;
        const NodeState& otherState = other.m_nodes[otherChildren[i]].state;

        if (state.isLeaf() != otherState.isLeaf() || state.step.token != otherState.step.token) {
            return false;
        }

        if (state.isLeaf()) {
            if (state.rule != otherState.rule || state.handler != otherState.handler) {
                return false;
            }
        }
        else if (!areSubtreesEqual(children[i], other, otherChildren[i])) {
            return false;
        }
    }

    return true;
}

bool Automaton::operator==(const Automaton& other) const {
    return areSubtreesEqual(RootIndex, other, RootIndex);
}

#include "game/stack.hpp"

#include "game/card.hpp"

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

std::string getStackTypeName(StackType type) {
    switch (type) {
        case StackType::Drawable:
            return "drawable";
        case StackType::Playable:
            return "playable";
        case StackType::Discardable:
            return "discardable";
        default:
            assert(false);
            return "unknown";
    }
}

Stack::Stack(std::vector<Card> cards, bool visible, std::vector<StackType> types) : m_cards{ std::move(cards) }, m_visible{ visible }, m_types{ std::move(types) } {}

const std::vector<Card>& Stack::getCards() const {
    return m_cards;
}

std::vector<Card>& Stack::getCards() {
    return m_cards;
}

const std::vector<StackType>& Stack::getTypes() const {
    return m_types;
}

bool Stack::hasType(StackType type) const {
    return std::find(m_types.begin(), m_types.end(), type) != m_types.end();
}

bool Stack::isVisible() const {
    return m_visible;
}

bool Stack::isEmpty() const {
    return m_cards.empty();
}

std::size_t Stack::size() const {
    return m_cards.size();
}

const Card* Stack::getTopCard() const {
    return m_cards.empty() ? nullptr : &m_cards.back();
}

void Stack::pushCard(const Card& card) {
    m_cards.push_back(card);
}

std::optional<Card> Stack::drawCard() {
    if (m_cards.empty()) {
        return std::nullopt;
    }

    Card card = m_cards.back();
    m_cards.pop_back();
    return card;
}

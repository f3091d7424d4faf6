#ifndef STACK_HPP
#define STACK_HPP

#include "game/card.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class StackType : std::uint8_t {
    Drawable,
    Playable,
    Discardable
};

std::string getStackTypeName(StackType type);

// The top card is the last one
class Stack {
public:
    Stack(std::vector<Card> cards, bool visible, std::vector<StackType> types);

    const std::vector<Card>& getCards() const;
    std::vector<Card>& getCards();
    const std::vector<StackType>& getTypes() const;
    bool hasType(StackType type) const;
    bool isVisible() const;
    bool isEmpty() const;
    std::size_t size() const;

    const Card* getTopCard() const;
    void pushCard(const Card& card);
    std::optional<Card> drawCard();

private:
    std::vector<Card> m_cards;
    bool m_visible;
    std::vector<StackType> m_types;
};

#endif // STACK_HPP

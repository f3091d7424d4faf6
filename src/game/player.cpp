#include "game/player.hpp"

#include "game/card.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

Player::Player(std::string pseudo, std::vector<Card> hand) : m_pseudo{ std::move(pseudo) }, m_hand{ std::move(hand) } {}

const std::string& Player::getPseudo() const {
    return m_pseudo;
}

const std::vector<Card>& Player::getHand() const {
    return m_hand;
}

std::vector<Card>& Player::getHand() {
    return m_hand;
}

bool Player::hasCard(std::size_t cardIndex) const {
    return cardIndex < m_hand.size();
}

void Player::addCard(const Card& card) {
    m_hand.push_back(card);
}

void Player::addCards(const std::vector<Card>& cards) {
    m_hand.insert(m_hand.end(), cards.begin(), cards.end());
}

Result<Card> Player::removeCard(std::size_t cardIndex) {
    if (!hasCard(cardIndex)) {
        return Error{
            ErrorCode::InvalidCardIndex,
            "Card index " + std::to_string(cardIndex) + " is out of range for " + m_pseudo + " (" + std::to_string(m_hand.size()) + " cards)"
        };
    }

    Card card = m_hand[cardIndex];
    m_hand.erase(m_hand.begin() + static_cast<std::ptrdiff_t>(cardIndex));
    return card;
}

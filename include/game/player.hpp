#ifndef PLAYER_HPP
#define PLAYER_HPP

#include "game/card.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <string>
#include <vector>

class Player {
public:
    explicit Player(std::string pseudo, std::vector<Card> hand = {});

    const std::string& getPseudo() const;
    const std::vector<Card>& getHand() const;
    std::vector<Card>& getHand();
    bool hasCard(std::size_t cardIndex) const;

    void addCard(const Card& card);
    void addCards(const std::vector<Card>& cards);
    Result<Card> removeCard(std::size_t cardIndex);

private:
    std::string m_pseudo;
    std::vector<Card> m_hand;
};

#endif // PLAYER_HPP

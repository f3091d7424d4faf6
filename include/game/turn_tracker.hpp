#ifndef TURN_TRACKER_HPP
#define TURN_TRACKER_HPP

#include "game/card_effects.hpp"

#include <cstddef>

class TurnTracker {
public:
    TurnTracker();
    TurnTracker(std::size_t playerTurn, int direction);

    std::size_t getPlayerTurn() const;
    int getDirection() const;

    void update(const PlayerTurnChange& change, std::size_t playerCount);
    void reset(std::size_t playerTurn);

private:
    std::size_t m_playerTurn;
    int m_direction;
};

#endif // TURN_TRACKER_HPP

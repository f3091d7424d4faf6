#include "game/turn_tracker.hpp"

#include "game/card_effects.hpp"

#include <cassert>
#include <cstddef>

namespace {
std::size_t euclideanModulo(long long value, std::size_t modulus) {
    long long signedModulus = static_cast<long long>(modulus);
    long long remainder = value % signedModulus;
    if (remainder < 0) {
        remainder += signedModulus;
    }
    return static_cast<std::size_t>(remainder);
}
} // namespace

TurnTracker::TurnTracker() : m_playerTurn{ 0 }, m_direction{ 1 } {}

TurnTracker::TurnTracker(std::size_t playerTurn, int direction) : m_playerTurn{ playerTurn }, m_direction{ direction } {
    assert(direction == 1 || direction == -1);
}

std::size_t TurnTracker::getPlayerTurn() const {
    return m_playerTurn;
}

int TurnTracker::getDirection() const {
    return m_direction;
}

void TurnTracker::update(const PlayerTurnChange& change, std::size_t playerCount) {
    if (playerCount == 0) {
        return;
    }

    // The direction flips before a step is applied
    if (change.scope == TurnChangeScope::Rotate) {
        m_direction = -m_direction;
    }

    switch (change.updater) {
        case TurnUpdaterKind::Set:
            m_playerTurn = euclideanModulo(change.value, playerCount);
            break;
        case TurnUpdaterKind::Step:
            m_playerTurn = euclideanModulo(static_cast<long long>(m_playerTurn) + static_cast<long long>(m_direction) * change.value, playerCount);
            break;
        default:
            assert(false);
            break;
    }
}

void TurnTracker::reset(std::size_t playerTurn) {
    m_playerTurn = playerTurn;
    m_direction = 1;
}

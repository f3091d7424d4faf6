#include "event/occurrence.hpp"

#include <cassert>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

std::string getOccurrenceTypeName(OccurrenceType type) {
    switch (type) {
        case OccurrenceType::CardPlayed:
            return "CardPlayed";
        case OccurrenceType::CardDrawn:
            return "CardDrawn";
        case OccurrenceType::CardDiscarded:
            return "CardDiscarded";
        case OccurrenceType::PlayerSaid:
            return "PlayerSaid";
        case OccurrenceType::PhysicalAction:
            return "PhysicalAction";
        case OccurrenceType::StackRunsOut:
            return "StackRunsOut";
        case OccurrenceType::EndPlayerTurn:
            return "EndPlayerTurn";
        case OccurrenceType::PlayerPenalty:
            return "PlayerPenalty";
        case OccurrenceType::GameStart:
            return "GameStart";
        case OccurrenceType::VerifyRule:
            return "VerifyRule";
        default:
            assert(false);
            return "Unknown";
    }
}

Occurrence::Occurrence(OccurrenceType type) : m_type{ type } {}

Occurrence Occurrence::cardPlayed(const CardEvent& cardEvent) {
    Occurrence occurrence(OccurrenceType::CardPlayed);
    occurrence.m_cardEvent = cardEvent;
    occurrence.m_playerIndex = cardEvent.playerIndex;
    occurrence.m_stackIndex = cardEvent.stackIndex;
    return occurrence;
}

Occurrence Occurrence::cardDrawn(const CardEvent& cardEvent) {
    Occurrence occurrence = cardPlayed(cardEvent);
    occurrence.m_type = OccurrenceType::CardDrawn;
    return occurrence;
}

Occurrence Occurrence::cardDiscarded(const CardEvent& cardEvent) {
    Occurrence occurrence = cardPlayed(cardEvent);
    occurrence.m_type = OccurrenceType::CardDiscarded;
    return occurrence;
}

Occurrence Occurrence::playerSaid(std::size_t playerIndex, const std::string& message) {
    Occurrence occurrence(OccurrenceType::PlayerSaid);
    occurrence.m_playerIndex = playerIndex;
    occurrence.m_text = message;
    return occurrence;
}

Occurrence Occurrence::physicalAction(std::size_t playerIndex, const std::string& actionName) {
    Occurrence occurrence(OccurrenceType::PhysicalAction);
    occurrence.m_playerIndex = playerIndex;
    occurrence.m_text = actionName;
    return occurrence;
}

Occurrence Occurrence::stackRunsOut(std::size_t stackIndex) {
    Occurrence occurrence(OccurrenceType::StackRunsOut);
    occurrence.m_stackIndex = stackIndex;
    return occurrence;
}

Occurrence Occurrence::endPlayerTurn(std::vector<Occurrence> events) {
    Occurrence occurrence(OccurrenceType::EndPlayerTurn);
    occurrence.m_events = std::move(events);
    return occurrence;
}

Occurrence Occurrence::playerPenalty(std::size_t playerIndex) {
    Occurrence occurrence(OccurrenceType::PlayerPenalty);
    occurrence.m_playerIndex = playerIndex;
    return occurrence;
}

Occurrence Occurrence::gameStart() {
    return Occurrence(OccurrenceType::GameStart);
}

Occurrence Occurrence::verifyRule() {
    return Occurrence(OccurrenceType::VerifyRule);
}

OccurrenceType Occurrence::getType() const {
    return m_type;
}

bool Occurrence::isRecordable() const {
    switch (m_type) {
        case OccurrenceType::CardPlayed:
        case OccurrenceType::CardDrawn:
        case OccurrenceType::CardDiscarded:
        case OccurrenceType::PlayerSaid:
        case OccurrenceType::PhysicalAction:
            return true;
        default:
            return false;
    }
}

bool Occurrence::isTurnChanging() const {
    return m_type == OccurrenceType::CardPlayed || m_type == OccurrenceType::CardDrawn;
}

std::optional<std::size_t> Occurrence::getPlayerIndex() const {
    return m_playerIndex;
}

const CardEvent& Occurrence::getCardEvent() const {
    assert(m_cardEvent.has_value());
    return *m_cardEvent;
}

const std::string& Occurrence::getText() const {
    return m_text;
}

std::optional<std::size_t> Occurrence::getStackIndex() const {
    return m_stackIndex;
}

const std::vector<Occurrence>& Occurrence::getEvents() const {
    return m_events;
}

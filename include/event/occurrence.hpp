#ifndef OCCURRENCE_HPP
#define OCCURRENCE_HPP

#include "game/card.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum class OccurrenceType : std::uint8_t {
    CardPlayed,
    CardDrawn,
    CardDiscarded,
    PlayerSaid,
    PhysicalAction,
    StackRunsOut,
    EndPlayerTurn,
    PlayerPenalty,
    GameStart,
    VerifyRule
};

std::string getOccurrenceTypeName(OccurrenceType type);

struct CardEvent {
    Card card;
    std::size_t cardIndex;
    std::size_t playerIndex;
    std::optional<std::size_t> stackIndex;
};

class Occurrence {
public:
    static Occurrence cardPlayed(const CardEvent& cardEvent);
    static Occurrence cardDrawn(const CardEvent& cardEvent);
    static Occurrence cardDiscarded(const CardEvent& cardEvent);
    static Occurrence playerSaid(std::size_t playerIndex, const std::string& message);
    static Occurrence physicalAction(std::size_t playerIndex, const std::string& actionName);
    static Occurrence stackRunsOut(std::size_t stackIndex);
    static Occurrence endPlayerTurn(std::vector<Occurrence> events);
    static Occurrence playerPenalty(std::size_t playerIndex);
    static Occurrence gameStart();
    static Occurrence verifyRule();

    OccurrenceType getType() const;

    // Only card, say and physical occurrences go into the turn log
    bool isRecordable() const;
    bool isTurnChanging() const;
    std::optional<std::size_t> getPlayerIndex() const;

    const CardEvent& getCardEvent() const;
    const std::string& getText() const;
    std::optional<std::size_t> getStackIndex() const;
    const std::vector<Occurrence>& getEvents() const;

private:
    explicit Occurrence(OccurrenceType type);

    OccurrenceType m_type;
    std::optional<CardEvent> m_cardEvent;
    std::optional<std::size_t> m_playerIndex;
    std::optional<std::size_t> m_stackIndex;
    std::string m_text;
    std::vector<Occurrence> m_events;
};

#endif // OCCURRENCE_HPP

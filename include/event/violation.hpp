#ifndef VIOLATION_HPP
#define VIOLATION_HPP

#include <cstdint>
#include <optional>
#include <string>

enum class ViolationType : std::uint8_t {
    Disallow,
    ForgotSomething
};

// Outcome of the default legality check for a played card
enum class LegalityResult : std::uint8_t {
    CanPlay,
    WrongTurn,
    CannotPlaceThisCard,
    Other
};

// Rule name reported for violations of the default play legality
inline const std::string BasicRulesName = "Basic Rules";

struct Violation {
    ViolationType type;
    std::string rule;
    std::string message;
    std::optional<LegalityResult> legality;
};

std::string getLegalityResultName(LegalityResult legality);
std::string formatViolation(const Violation& violation);

#endif // VIOLATION_HPP

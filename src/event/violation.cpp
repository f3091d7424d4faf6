#include "event/violation.hpp"

#include <cassert>
#include <string>

std::string getLegalityResultName(LegalityResult legality) {
    switch (legality) {
        case LegalityResult::CanPlay:
            return "CanPlay";
        case LegalityResult::WrongTurn:
            return "WrongTurn";
        case LegalityResult::CannotPlaceThisCard:
            return "CannotPlaceThisCard";
        case LegalityResult::Other:
            return "Other";
        default:
            assert(false);
            return "Unknown";
    }
}

std::string formatViolation(const Violation& violation) {
    std::string kind = (violation.type == ViolationType::Disallow) ? "Disallowed" : "Forgot something";
    return kind + " (" + violation.rule + "): " + violation.message;
}

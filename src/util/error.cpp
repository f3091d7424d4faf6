#include "util/error.hpp"

#include <cassert>
#include <string>

std::string getErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig:
            return "InvalidConfig";
        case ErrorCode::InvalidRulesDirectory:
            return "InvalidRulesDirectory";
        case ErrorCode::RuleLoading:
            return "RuleLoading";
        case ErrorCode::RuleNotValid:
            return "RuleNotValid";
        case ErrorCode::RuleNotFound:
            return "RuleNotFound";
        case ErrorCode::RuleAlreadyActivated:
            return "RuleAlreadyActivated";
        case ErrorCode::RuleNotActivated:
            return "RuleNotActivated";
        case ErrorCode::InvalidRuleIndex:
            return "InvalidRuleIndex";
        case ErrorCode::InvalidPlayerIndex:
            return "InvalidPlayerIndex";
        case ErrorCode::InvalidCardIndex:
            return "InvalidCardIndex";
        case ErrorCode::InvalidStackIndex:
            return "InvalidStackIndex";
        case ErrorCode::NoStackAvailable:
            return "NoStackAvailable";
        case ErrorCode::NotEnoughCards:
            return "NotEnoughCards";
        case ErrorCode::InvalidInteraction:
            return "InvalidInteraction";
        case ErrorCode::InvalidDisambiguationIndex:
            return "InvalidDisambiguationIndex";
        case ErrorCode::RuleCallback:
            return "RuleCallback";
        default:
            assert(false);
            return "Unknown";
    }
}

std::string formatError(const Error& error) {
    return getErrorCodeName(error.code) + ": " + error.message;
}

#ifndef ERROR_HPP
#define ERROR_HPP

#include <cstdint>
#include <string>

enum class ErrorCode : std::uint8_t {
    InvalidConfig,
    InvalidRulesDirectory,
    RuleLoading,
    RuleNotValid,
    RuleNotFound,
    RuleAlreadyActivated,
    RuleNotActivated,
    InvalidRuleIndex,
    InvalidPlayerIndex,
    InvalidCardIndex,
    InvalidStackIndex,
    NoStackAvailable,
    NotEnoughCards,
    InvalidInteraction,
    InvalidDisambiguationIndex,
    RuleCallback
};

struct Error {
    ErrorCode code;
    std::string message;

    bool operator==(const Error&) const = default;
};

std::string getErrorCodeName(ErrorCode code);
std::string formatError(const Error& error);

#endif // ERROR_HPP

#ifndef VERDICT_HPP
#define VERDICT_HPP

#include "event/occurrence.hpp"
#include "event/violation.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

class GameCore;
struct Verdict;

// Replaces the default penalty of a violation
using PenaltyHook = std::function<Result<void>(GameCore& core, std::size_t playerIndex)>;

// Runs around, or instead of, the default turn advance
using TurnHook = std::function<Result<void>(GameCore& core, std::size_t playerIndex)>;

// Second pass, called once every first-pass verdict of the occurrence is known.
// The returned verdict, if any, is added to the deferred ones.
using CrossRuleCallback = std::function<std::optional<Verdict>(GameCore& core, const Occurrence& occurrence, const std::vector<const Verdict*>& deferred)>;

enum class VerdictType : std::uint8_t {
    Ignored,
    Disallow,
    ForgetSomething,
    OverrideBasicRule,
    ExecuteBeforeTurnChange,
    ExecuteAfterTurnChange
};

std::string getVerdictTypeName(VerdictType type);

struct Verdict {
    VerdictType type = VerdictType::Ignored;
    std::string rule;
    std::string message;
    PenaltyHook penalty;
    TurnHook hook;
    CrossRuleCallback crossRuleCallback;

    bool isIgnored() const;
    bool isViolation() const;
    bool isDeferred() const;
    Violation toViolation() const;

    static Verdict ignored();
    static Verdict disallow(const std::string& rule, const std::string& message, PenaltyHook penalty = {});
    static Verdict forgetSomething(const std::string& rule, const std::string& message, PenaltyHook penalty = {});
    static Verdict overrideBasicRule(const std::string& rule, TurnHook hook);
    static Verdict executeBeforeTurnChange(const std::string& rule, TurnHook hook);
    static Verdict executeAfterTurnChange(const std::string& rule, TurnHook hook);
};

bool areAllIgnored(const std::vector<Verdict>& verdicts);

#endif // VERDICT_HPP

#include "event/verdict.hpp"

#include "event/violation.hpp"

#include <algorithm>
#include <cassert>
#include <string>
#include <utility>
#include <vector>

namespace {
Verdict makeVerdict(VerdictType type, const std::string& rule, const std::string& message) {
    Verdict verdict;
    verdict.type = type;
    verdict.rule = rule;
    verdict.message = message;
    return verdict;
}
} // namespace

std::string getVerdictTypeName(VerdictType type) {
    switch (type) {
        case VerdictType::Ignored:
            return "Ignored";
        case VerdictType::Disallow:
            return "Disallow";
        case VerdictType::ForgetSomething:
            return "ForgetSomething";
        case VerdictType::OverrideBasicRule:
            return "OverrideBasicRule";
        case VerdictType::ExecuteBeforeTurnChange:
            return "ExecuteBeforeTurnChange";
        case VerdictType::ExecuteAfterTurnChange:
            return "ExecuteAfterTurnChange";
        default:
            assert(false);
            return "Unknown";
    }
}

bool Verdict::isIgnored() const {
    return type == VerdictType::Ignored;
}

bool Verdict::isViolation() const {
    return type == VerdictType::Disallow || type == VerdictType::ForgetSomething;
}

bool Verdict::isDeferred() const {
    return !isIgnored() && !isViolation();
}

Violation Verdict::toViolation() const {
    assert(isViolation());
    return Violation{
        .type = (type == VerdictType::Disallow) ? ViolationType::Disallow : ViolationType::ForgotSomething,
        .rule = rule,
        .message = message,
        .legality = std::nullopt
    };
}

Verdict Verdict::ignored() {
    return Verdict{};
}

Verdict Verdict::disallow(const std::string& rule, const std::string& message, PenaltyHook penalty) {
    Verdict verdict = makeVerdict(VerdictType::Disallow, rule, message);
    verdict.penalty = std::move(penalty);
    return verdict;
}

Verdict Verdict::forgetSomething(const std::string& rule, const std::string& message, PenaltyHook penalty) {
    Verdict verdict = makeVerdict(VerdictType::ForgetSomething, rule, message);
    verdict.penalty = std::move(penalty);
    return verdict;
}

Verdict Verdict::overrideBasicRule(const std::string& rule, TurnHook hook) {
    Verdict verdict = makeVerdict(VerdictType::OverrideBasicRule, rule, "");
    verdict.hook = std::move(hook);
    return verdict;
}

Verdict Verdict::executeBeforeTurnChange(const std::string& rule, TurnHook hook) {
    Verdict verdict = makeVerdict(VerdictType::ExecuteBeforeTurnChange, rule, "");
    verdict.hook = std::move(hook);
    return verdict;
}

Verdict Verdict::executeAfterTurnChange(const std::string& rule, TurnHook hook) {
    Verdict verdict = makeVerdict(VerdictType::ExecuteAfterTurnChange, rule, "");
    verdict.hook = std::move(hook);
    return verdict;
}

bool areAllIgnored(const std::vector<Verdict>& verdicts) {
    return std::all_of(verdicts.begin(), verdicts.end(), [](const Verdict& verdict) {
        return verdict.isIgnored();
    });
}

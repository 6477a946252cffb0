#pragma once

#include <cstddef>

namespace podengine {
namespace core {

enum class AttemptResult { Success, Retryable, Fatal };

/// Runs `attempt` until it succeeds, fails fatally, or the budget of
/// attempts is used up. A budget of 0 still makes one attempt. Returns the
/// result of the last attempt.
template <typename Attempt>
AttemptResult retryWithBudget(std::size_t budget, Attempt&& attempt) {
    std::size_t remaining = budget == 0 ? 1 : budget;
    AttemptResult result = AttemptResult::Retryable;
    while (remaining > 0) {
        result = attempt();
        if (result != AttemptResult::Retryable) {
            return result;
        }
        --remaining;
    }
    return result;
}

} // namespace core
} // namespace podengine

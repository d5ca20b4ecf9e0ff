#pragma once

#include <atomic>

#include "core/Errors.hpp"

namespace core {

// Shared cancellation flag. Workers only look at it at stage boundaries.
class CancelToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool cancelled() const { return m_cancelled.load(); }

    // throws Cancelled naming the stage that was about to start
    void check(const char* stage) const {
        if (cancelled()) throw Cancelled(stage);
    }

private:
    std::atomic<bool> m_cancelled{false};
};

inline void check_cancel(const CancelToken* token, const char* stage) {
    if (token) token->check(stage);
}

}  // namespace core
